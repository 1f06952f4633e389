/*
 * Copyright (c) 2022, Shiv Nadar University, Delhi NCR, India. All Rights
 * Reserved. Permission to use, copy, modify and distribute this software for
 * educational, research, and not-for-profit purposes, without fee and without a
 * signed license agreement, is hereby granted, provided that this paragraph and
 * the following two paragraphs appear in all copies, modifications, and
 * distributions.
 *
 * IN NO EVENT SHALL SHIV NADAR UNIVERSITY BE LIABLE TO ANY PARTY FOR DIRECT,
 * INDIRECT, SPECIAL, INCIDENTAL, OR CONSEQUENTIAL DAMAGES, INCLUDING LOST
 * PROFITS, ARISING OUT OF THE USE OF THIS SOFTWARE.
 *
 * SHIV NADAR UNIVERSITY SPECIFICALLY DISCLAIMS ANY WARRANTIES, INCLUDING, BUT
 * NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE. THE SOFTWARE PROVIDED HEREUNDER IS PROVIDED "AS IS". SHIV
 * NADAR UNIVERSITY HAS NO OBLIGATION TO PROVIDE MAINTENANCE, SUPPORT, UPDATES,
 * ENHANCEMENTS, OR MODIFICATIONS.
 */

/**
 * @file CircuitErrors.hpp
 * @brief Typed errors and warnings raised by the circuit model and solver.
 *
 * Every failure the core can produce is reported with one of the exception
 * types declared here. All of them derive from `CircuitError` (itself a
 * `std::runtime_error`) so callers that only want a message can catch the base
 * class. `InvalidComponentWarning` is not an exception: it is collected in the
 * assembled system and in the solution, and the solve continues without the
 * offending branch.
 */

#pragma once

#include <stdexcept>
#include <string>

/**
 * @class CircuitError
 * @brief Base class for all errors raised by the circuit core.
 */
class CircuitError : public std::runtime_error
{
   public:
    explicit CircuitError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

/**
 * @class DuplicateIdError
 * @brief A node or branch with the same identifier already exists.
 */
class DuplicateIdError : public CircuitError
{
   public:
    explicit DuplicateIdError(const std::string &id)
        : CircuitError("Duplicate id '" + id + "'"), id(id)
    {
    }

    /** @brief Identifier that was already present. */
    const std::string &getId() const { return id; }

   private:
    std::string id;
};

/**
 * @class DanglingReferenceError
 * @brief An operation referenced a node or branch that does not exist.
 */
class DanglingReferenceError : public CircuitError
{
   public:
    explicit DanglingReferenceError(const std::string &id)
        : CircuitError("Reference to unknown id '" + id + "'"), id(id)
    {
    }

    /** @brief Identifier that could not be resolved. */
    const std::string &getId() const { return id; }

   private:
    std::string id;
};

/**
 * @class SingularMatrixError
 * @brief The linear system has no unique solution.
 *
 * Raised by the Gaussian elimination routine when no usable pivot exists or a
 * non-finite value appears. For an MNA system this means the circuit is
 * under-constrained or contradictory: a floating subnetwork, voltage sources
 * shorted together, or a loop made only of current sources.
 */
class SingularMatrixError : public CircuitError
{
   public:
    explicit SingularMatrixError(const std::string &message)
        : CircuitError(message)
    {
    }
};

/**
 * @class UnsupportedTopologyError
 * @brief Mesh decomposition was requested on a circuit it cannot describe.
 *
 * Raised when the circuit contains an independent current source, or when
 * the graph has no fundamental cycles at all.
 */
class UnsupportedTopologyError : public CircuitError
{
   public:
    explicit UnsupportedTopologyError(const std::string &message)
        : CircuitError(message)
    {
    }
};

/**
 * @struct InvalidComponentWarning
 * @brief Non-fatal report of a branch skipped during MNA assembly.
 */
struct InvalidComponentWarning
{
    std::string branchId; /**< Id of the skipped branch */
    std::string reason;   /**< Human-readable reason */
};

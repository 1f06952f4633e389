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
 * @file Node.hpp
 * @brief Node record and handle types used by the circuit graph arena.
 *
 * Nodes and branches are stored in flat vectors inside `CircuitGraph` and are
 * addressed by integer handles. A handle is the slot position in the owning
 * vector; slots are never reused, so a handle stays valid until the entity it
 * names is removed.
 */

#pragma once

#include <cstddef>
#include <string>

/** @brief Handle of a node slot inside `CircuitGraph`. */
using NodeHandle = std::size_t;

/** @brief Handle of a branch slot inside `CircuitGraph`. */
using BranchHandle = std::size_t;

/** @brief Sentinel returned by lookups that found nothing. */
constexpr std::size_t INVALID_HANDLE = static_cast<std::size_t>(-1);

/**
 * @class Node
 * @brief Electrical node of the circuit.
 *
 * The node voltage is not stored here; it is produced by the solver and
 * reported in `CircuitSolution`.
 */
class Node
{
   public:
    /** @brief Node name (unique identifier, e.g. \"0\" or \"GND\"). */
    std::string name;

    /** @brief Tombstone flag; true once the node has been removed. */
    bool removed = false;
};

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

#pragma once

#include <cctype>
#include <cmath>
#include <stdexcept>
#include <string>

#include "LinearSolver.hpp"

/*
 * SolverOptions.hpp
 *
 * Lightweight configuration container for runtime solver options.
 *
 * This header declares `SolverOptions`, a simple POD-style struct that carries
 * solver configuration knobs from the command-line driver (or tests) into the
 * solver implementation: the analysis method, the pivot threshold of the
 * Gaussian elimination and diagnostic output.
 */

/**
 * @enum AnalysisMethod
 * @brief Which results a solve produces.
 */
enum class AnalysisMethod
{
    NODAL, /**< Node voltages and branch currents only */
    MESH   /**< Nodal results plus mesh currents over the cycle basis */
};

/**
 * @brief Parse "nodal" / "mesh" (any case).
 * @throws std::invalid_argument for any other text.
 */
inline AnalysisMethod parseAnalysisMethod(const std::string &text)
{
    std::string lower;
    for (char c : text) lower.push_back((char)std::tolower((unsigned char)c));
    if (lower == "nodal") return AnalysisMethod::NODAL;
    if (lower == "mesh") return AnalysisMethod::MESH;
    throw std::invalid_argument("unknown analysis method '" + text + "'");
}

/**
 * @struct SolverOptions
 * @brief Runtime options controlling the analysis method and diagnostics.
 *
 * Fields in this struct are intentionally public to allow easy construction and
 * modification at the call-site (e.g., parsing CLI flags). Callers should
 * invoke `validate()` after setting options to ensure values are sensible.
 */
struct SolverOptions
{
    /**
     * @brief Analysis method used by `solveCircuit`.
     *
     * MESH additionally computes fundamental cycles and mesh currents; it
     * falls back to nodal results when the circuit contains current sources.
     */
    AnalysisMethod method = AnalysisMethod::NODAL;

    /**
     * @brief When true, `method` wins over a `.OP` / `.MESH` directive found
     * in the netlist. Set by the `--method` command-line flag.
     */
    bool forceMethod = false;

    /**
     * @brief Absolute pivot magnitude below which the system is singular.
     */
    double pivotTolerance = PIVOT_TOLERANCE;

    /** @brief Dump the assembled MNA matrix and RHS before solving. */
    bool printMatrix = false;

    /**
     * @brief Validate option values.
     *
     * Throws:
     *   - std::invalid_argument if `pivotTolerance` is not a positive finite
     *     number.
     */
    void validate() const
    {
        if (!std::isfinite(pivotTolerance) || pivotTolerance <= 0.0)
            throw std::invalid_argument("pivotTolerance must be > 0");
    }
};

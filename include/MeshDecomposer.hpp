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
 * @file MeshDecomposer.hpp
 * @brief Mesh (loop) currents recovered from solved branch currents.
 *
 * Mesh currents are obtained as the least-squares fit
 *
 *     (C^T C) m = C^T i
 *
 * where `C` is the branch-by-cycle incidence matrix and `i` the branch
 * currents of the MNA solution. For circuits made only of resistors and
 * voltage sources the branch currents lie in the cycle space and the fit is
 * exact (`i = C m`).
 */

#pragma once

#include <Eigen/Dense>
#include <vector>

#include "CircuitGraph.hpp"
#include "CycleBasis.hpp"
#include "LinearSolver.hpp"

/**
 * @struct MeshDecomposition
 * @brief Incidence matrix and mesh currents, aligned with the cycle list.
 */
struct MeshDecomposition
{
    /** @brief C: one row per branch, one column per cycle. */
    Eigen::MatrixXd incidence;

    /** @brief m: one mesh current per cycle. */
    Eigen::VectorXd meshCurrents;
};

/**
 * @brief Build the branch-by-cycle incidence matrix.
 *
 * Entry (r, k) is +1 / -1 when cycle `k` walks `branches[r]` forward /
 * backward, and 0 when the branch is not part of the cycle.
 */
Eigen::MatrixXd buildCycleIncidence(
    const std::vector<BranchHandle> &branches,
    const std::vector<FundamentalCycle> &cycles);

/**
 * @brief Fit one mesh current per cycle to the given branch currents.
 *
 * @param graph Circuit graph the handles refer to.
 * @param branches Branches taking part, aligned with `branchCurrents`.
 * @param branchCurrents Solved branch currents (from -> to).
 * @param cycles Fundamental cycles over `branches`.
 * @param pivotTolerance Pivot threshold for the normal-equations solve.
 * @throws UnsupportedTopologyError if a current source is among `branches`
 *         or `cycles` is empty.
 * @throws SingularMatrixError if the normal equations cannot be solved.
 */
MeshDecomposition decomposeMeshCurrents(
    const CircuitGraph &graph, const std::vector<BranchHandle> &branches,
    const std::vector<double> &branchCurrents,
    const std::vector<FundamentalCycle> &cycles,
    double pivotTolerance = PIVOT_TOLERANCE);

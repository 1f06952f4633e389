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
 * @file MeshDecomposer.cpp
 * @brief Least-squares mesh currents over the fundamental cycle basis.
 */

#include "MeshDecomposer.hpp"

#include <stdexcept>
#include <unordered_map>
#include <vector>

#include "CircuitErrors.hpp"

Eigen::MatrixXd buildCycleIncidence(
    const std::vector<BranchHandle> &branches,
    const std::vector<FundamentalCycle> &cycles)
{
    std::unordered_map<BranchHandle, Eigen::Index> rowOf;
    for (std::size_t r = 0; r < branches.size(); ++r)
        rowOf[branches[r]] = static_cast<Eigen::Index>(r);

    Eigen::MatrixXd C = Eigen::MatrixXd::Zero(branches.size(), cycles.size());
    for (std::size_t k = 0; k < cycles.size(); ++k) {
        for (const CycleBranch &step : cycles[k].branches) {
            auto it = rowOf.find(step.branch);
            if (it == rowOf.end())
                throw std::invalid_argument(
                    "buildCycleIncidence: cycle uses a branch outside the "
                    "branch list");
            C(it->second, static_cast<Eigen::Index>(k)) = step.orientation;
        }
    }
    return C;
}

MeshDecomposition decomposeMeshCurrents(
    const CircuitGraph &graph, const std::vector<BranchHandle> &branches,
    const std::vector<double> &branchCurrents,
    const std::vector<FundamentalCycle> &cycles, double pivotTolerance)
{
    if (branchCurrents.size() != branches.size())
        throw std::invalid_argument(
            "decomposeMeshCurrents: one current per branch is required");

    for (BranchHandle h : branches) {
        const CircuitElement &element = graph.branch(h);
        if (element.getType() == ElementType::I) {
            throw UnsupportedTopologyError(
                "mesh currents are undefined with independent current "
                "source " +
                element.getName());
        }
    }
    if (cycles.empty())
        throw UnsupportedTopologyError(
            "circuit has no loops; mesh currents are undefined");

    MeshDecomposition result;
    result.incidence = buildCycleIncidence(branches, cycles);

    Eigen::VectorXd i = Eigen::Map<const Eigen::VectorXd>(
        branchCurrents.data(), static_cast<Eigen::Index>(branchCurrents.size()));

    // Normal equations (C^T C) m = C^T i
    Eigen::MatrixXd CtC = result.incidence.transpose() * result.incidence;
    Eigen::VectorXd Cti = result.incidence.transpose() * i;
    result.meshCurrents = solveLinearSystem(CtC, Cti, pivotTolerance);
    return result;
}

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
 * @file MnaBuilder.hpp
 * @brief Assembly of the Modified Nodal Analysis system.
 *
 * The assembled system has the block form
 *
 *     | G   B | | v |   | i |
 *     | B^T 0 | | j | = | e |
 *
 * where `G` is the N x N conductance matrix of the non-reference nodes, `B`
 * the N x M incidence of the M voltage sources, `i` the current injected by
 * current sources, `e` the source voltages, `v` the node voltages and `j` the
 * voltage-source currents.
 */

#pragma once

#include <Eigen/Dense>
#include <map>
#include <ostream>
#include <vector>

#include "CircuitErrors.hpp"
#include "CircuitGraph.hpp"

/**
 * @struct MnaSystem
 * @brief Assembled MNA matrix, RHS and the index maps used to build them.
 */
struct MnaSystem
{
    /** @brief Square system matrix of order `size()`. */
    Eigen::MatrixXd A;

    /** @brief Right-hand side vector. */
    Eigen::VectorXd b;

    /** @brief Reference node (0 V). INVALID_HANDLE for an empty graph. */
    NodeHandle reference = INVALID_HANDLE;

    /**
     * @brief Row of each node, indexed by node handle.
     *
     * -1 for the reference node, for removed slots and for isolated nodes
     * (no incident stamped branch), all of which sit at 0 V.
     */
    std::vector<int> nodeIndex;

    /** @brief Row of each group-2 branch (N + k for the k-th source). */
    std::map<BranchHandle, int> auxIndex;

    /** @brief Branches that passed validation and were stamped. */
    std::vector<BranchHandle> stampedBranches;

    /** @brief Branches skipped during assembly. */
    std::vector<InvalidComponentWarning> warnings;

    /** @brief N: number of node unknowns. */
    int nodeCount = 0;

    /** @brief M: number of auxiliary (voltage-source current) unknowns. */
    int auxCount = 0;

    int size() const { return nodeCount + auxCount; }

    /** @brief Row of a node, or -1 if the node has no unknown. */
    int nodeRow(NodeHandle node) const;

    /** @brief Row of a group-2 branch, or -1 if it has none. */
    int auxRow(BranchHandle branch) const;
};

/**
 * @brief Build the MNA system for the current state of the graph.
 *
 *  1. Index non-reference nodes 0..N-1 in insertion order, skipping nodes
 *     without any incident stamped branch.
 *  2. Index voltage sources 0..M-1 in branch order.
 *  3. Let every valid element stamp itself.
 *
 * Invalid elements (see `CircuitElement::validate`) are skipped and reported
 * in `MnaSystem::warnings` and on stderr.
 *
 * @param graph Circuit to assemble.
 * @return The assembled system; `size()` is 0 when there is nothing to solve.
 */
MnaSystem buildMnaSystem(const CircuitGraph &graph);

/**
 * @brief Print the MNA matrix and RHS vector (debug helper).
 *
 * One line per row: the matrix entries, the name of the unknown of that row
 * (`V(node)` or `I(branch)`) and the RHS entry.
 */
void printMnaSystem(std::ostream &os, const CircuitGraph &graph,
                    const MnaSystem &system);

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
 * @file CycleBasis.hpp
 * @brief Fundamental cycle basis of the circuit graph.
 *
 * A spanning forest is grown over the undirected circuit graph. Every branch
 * left out of the forest (a chord) closes exactly one cycle with the tree
 * paths between its endpoints. Those fundamental cycles form a basis of the
 * cycle space, whose dimension is `branches - nodes + components`.
 */

#pragma once

#include <vector>

#include "CircuitGraph.hpp"

/**
 * @struct CycleBranch
 * @brief One branch traversed by a cycle walk.
 */
struct CycleBranch
{
    BranchHandle branch = INVALID_HANDLE;

    /** @brief +1 when walked from nodeA to nodeB, -1 when walked backward. */
    int orientation = 0;
};

/**
 * @struct FundamentalCycle
 * @brief Closed walk created by one chord of the spanning forest.
 *
 * `nodes` lists the walk starting at the chord's nodeA, going through the
 * lowest common ancestor to the chord's nodeB; the chord closes the walk back
 * to the first node. `branches` lists the traversed branches in walk order,
 * the chord last.
 */
struct FundamentalCycle
{
    std::vector<NodeHandle> nodes;
    BranchHandle closingBranch = INVALID_HANDLE;
    std::vector<CycleBranch> branches;
};

/**
 * @struct CycleBasis
 * @brief Result of `findFundamentalCycles`.
 */
struct CycleBasis
{
    /** @brief One cycle per chord, in branch order. */
    std::vector<FundamentalCycle> cycles;

    /** @brief Branches of the spanning forest. */
    std::vector<BranchHandle> treeBranches;

    /** @brief Number of connected components (isolated nodes included). */
    int componentCount = 0;
};

/**
 * @brief Compute the fundamental cycles of a subset of the graph branches.
 *
 * Depth-first search is started from every unvisited node in insertion
 * order, so a disconnected graph yields a spanning forest; disconnection is
 * reported on stderr but is not an error.
 *
 * @param graph Circuit graph (all live nodes take part).
 * @param branches Branches to consider, in the order chords are emitted.
 * @return The cycle basis.
 */
CycleBasis findFundamentalCycles(const CircuitGraph &graph,
                                 const std::vector<BranchHandle> &branches);

/**
 * @brief Compute the fundamental cycles over every branch of the graph.
 */
CycleBasis findFundamentalCycles(const CircuitGraph &graph);

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
#include <gtest/gtest.h>

#include <set>
#include <string>
#include <vector>

#include "CycleBasis.hpp"

/*
 * cycle_basis_test.cpp
 *
 * Tests for findFundamentalCycles(...): cycle count, walk orientation,
 * parallel branches, self-loops and disconnected graphs.
 */

namespace
{
CircuitGraph makeGraph(const std::vector<std::string> &nodes)
{
    CircuitGraph graph;
    for (const std::string &id : nodes) graph.addNode(id);
    return graph;
}

// Every cycle must be a closed walk: consecutive branches share a node and
// the walk ends where it started.
void expectClosedWalk(const CircuitGraph &graph, const FundamentalCycle &cycle)
{
    ASSERT_FALSE(cycle.branches.empty());
    ASSERT_FALSE(cycle.nodes.empty());
    NodeHandle at = cycle.nodes.front();
    for (const CycleBranch &step : cycle.branches) {
        const CircuitElement &element = graph.branch(step.branch);
        if (step.orientation > 0) {
            ASSERT_EQ(element.getNodeA(), at);
            at = element.getNodeB();
        } else {
            ASSERT_EQ(element.getNodeB(), at);
            at = element.getNodeA();
        }
    }
    EXPECT_EQ(at, cycle.nodes.front());
}
}  // namespace

TEST(CycleBasis, SingleLoopOrientation)
{
    CircuitGraph graph = makeGraph({"0", "1", "2"});
    BranchHandle r1 = graph.addBranch("R1", "1", "0", ElementType::R, 100);
    BranchHandle r2 = graph.addBranch("R2", "2", "0", ElementType::R, 200);
    BranchHandle v1 = graph.addBranch("V1", "1", "2", ElementType::V, 10);

    CycleBasis basis = findFundamentalCycles(graph);

    EXPECT_EQ(basis.componentCount, 1);
    EXPECT_EQ(basis.treeBranches.size(), 2u);
    ASSERT_EQ(basis.cycles.size(), 1u);

    const FundamentalCycle &cycle = basis.cycles[0];
    EXPECT_EQ(cycle.closingBranch, v1);
    ASSERT_EQ(cycle.nodes.size(), 3u);
    EXPECT_EQ(graph.nodeName(cycle.nodes[0]), "1");
    EXPECT_EQ(graph.nodeName(cycle.nodes[1]), "0");
    EXPECT_EQ(graph.nodeName(cycle.nodes[2]), "2");

    ASSERT_EQ(cycle.branches.size(), 3u);
    EXPECT_EQ(cycle.branches[0].branch, r1);
    EXPECT_EQ(cycle.branches[0].orientation, 1);
    EXPECT_EQ(cycle.branches[1].branch, r2);
    EXPECT_EQ(cycle.branches[1].orientation, -1);
    EXPECT_EQ(cycle.branches[2].branch, v1);
    EXPECT_EQ(cycle.branches[2].orientation, -1);
    expectClosedWalk(graph, cycle);
}

TEST(CycleBasis, TreeHasNoCycles)
{
    CircuitGraph graph = makeGraph({"0", "1", "2", "3"});
    graph.addBranch("R1", "0", "1", ElementType::R, 1);
    graph.addBranch("R2", "1", "2", ElementType::R, 1);
    graph.addBranch("R3", "1", "3", ElementType::R, 1);

    CycleBasis basis = findFundamentalCycles(graph);
    EXPECT_TRUE(basis.cycles.empty());
    EXPECT_EQ(basis.treeBranches.size(), 3u);
}

TEST(CycleBasis, ParallelBranchesKeepTheirIdentity)
{
    CircuitGraph graph = makeGraph({"A", "B"});
    BranchHandle r1 = graph.addBranch("R1", "A", "B", ElementType::R, 1);
    BranchHandle r2 = graph.addBranch("R2", "A", "B", ElementType::R, 2);
    BranchHandle r3 = graph.addBranch("R3", "B", "A", ElementType::R, 3);

    CycleBasis basis = findFundamentalCycles(graph);
    ASSERT_EQ(basis.cycles.size(), 2u);

    // Each cycle is the tree branch plus its own chord, never the tree
    // branch twice.
    EXPECT_EQ(basis.cycles[0].closingBranch, r2);
    EXPECT_EQ(basis.cycles[1].closingBranch, r3);
    for (const FundamentalCycle &cycle : basis.cycles) {
        ASSERT_EQ(cycle.branches.size(), 2u);
        EXPECT_EQ(cycle.branches[0].branch, r1);
        EXPECT_NE(cycle.branches[1].branch, r1);
        expectClosedWalk(graph, cycle);
    }

    // R1 and R2 point the same way, so the loop runs against one of them
    EXPECT_EQ(basis.cycles[0].branches[0].orientation,
              -basis.cycles[0].branches[1].orientation);
    // R1 and R3 point opposite ways, so the loop runs along both
    EXPECT_EQ(basis.cycles[1].branches[0].orientation,
              basis.cycles[1].branches[1].orientation);
}

TEST(CycleBasis, SelfLoopIsOwnCycle)
{
    CircuitGraph graph = makeGraph({"0", "1"});
    graph.addBranch("R1", "1", "0", ElementType::R, 1);
    BranchHandle loop = graph.addBranch("R2", "1", "1", ElementType::R, 1);

    CycleBasis basis = findFundamentalCycles(graph);
    ASSERT_EQ(basis.cycles.size(), 1u);

    const FundamentalCycle &cycle = basis.cycles[0];
    ASSERT_EQ(cycle.nodes.size(), 1u);
    EXPECT_EQ(graph.nodeName(cycle.nodes[0]), "1");
    ASSERT_EQ(cycle.branches.size(), 1u);
    EXPECT_EQ(cycle.branches[0].branch, loop);
    EXPECT_EQ(cycle.branches[0].orientation, 1);
}

TEST(CycleBasis, DisconnectedGraphUsesForest)
{
    CircuitGraph graph = makeGraph({"0", "1", "2", "A", "B", "C", "LONE"});
    graph.addBranch("R1", "0", "1", ElementType::R, 1);
    graph.addBranch("R2", "1", "2", ElementType::R, 1);
    graph.addBranch("R3", "2", "0", ElementType::R, 1);
    graph.addBranch("R4", "A", "B", ElementType::R, 1);
    graph.addBranch("R5", "B", "C", ElementType::R, 1);
    graph.addBranch("R6", "C", "A", ElementType::R, 1);

    testing::internal::CaptureStderr();
    CycleBasis basis = findFundamentalCycles(graph);
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(basis.componentCount, 3);
    EXPECT_EQ(basis.cycles.size(), 2u);
    EXPECT_EQ(basis.treeBranches.size(), 4u);
    EXPECT_NE(err.find("Warning:"), std::string::npos);
    EXPECT_NE(err.find("3 connected components"), std::string::npos);
    for (const FundamentalCycle &cycle : basis.cycles)
        expectClosedWalk(graph, cycle);
}

TEST(CycleBasis, CountMatchesCycleSpaceDimension)
{
    // Wheatstone bridge plus a parallel pair and a dangling resistor
    CircuitGraph graph = makeGraph({"0", "1", "2", "3", "4"});
    graph.addBranch("V1", "1", "0", ElementType::V, 10);
    graph.addBranch("R1", "1", "2", ElementType::R, 1);
    graph.addBranch("R2", "1", "3", ElementType::R, 1);
    graph.addBranch("R3", "2", "0", ElementType::R, 1);
    graph.addBranch("R4", "3", "0", ElementType::R, 1);
    graph.addBranch("R5", "2", "3", ElementType::R, 1);
    graph.addBranch("R6", "2", "3", ElementType::R, 1);
    graph.addBranch("R7", "3", "4", ElementType::R, 1);

    CycleBasis basis = findFundamentalCycles(graph);

    int expected = static_cast<int>(graph.branchCount()) -
                   static_cast<int>(graph.nodeCount()) + basis.componentCount;
    EXPECT_EQ(static_cast<int>(basis.cycles.size()), expected);
    EXPECT_EQ(expected, 4);

    // Every chord closes exactly one cycle and is the last step of it
    std::set<BranchHandle> chords;
    for (const FundamentalCycle &cycle : basis.cycles) {
        EXPECT_EQ(cycle.branches.back().branch, cycle.closingBranch);
        chords.insert(cycle.closingBranch);
        expectClosedWalk(graph, cycle);
    }
    EXPECT_EQ(chords.size(), basis.cycles.size());
}

TEST(CycleBasis, BranchSubsetOnly)
{
    CircuitGraph graph = makeGraph({"0", "1"});
    BranchHandle r1 = graph.addBranch("R1", "1", "0", ElementType::R, 1);
    graph.addBranch("R2", "1", "0", ElementType::R, 1);

    CycleBasis basis = findFundamentalCycles(graph, {r1});
    EXPECT_TRUE(basis.cycles.empty());
    ASSERT_EQ(basis.treeBranches.size(), 1u);
    EXPECT_EQ(basis.treeBranches[0], r1);
}

TEST(CycleBasis, EmptyGraph)
{
    CircuitGraph graph;
    CycleBasis basis = findFundamentalCycles(graph);
    EXPECT_EQ(basis.componentCount, 0);
    EXPECT_TRUE(basis.cycles.empty());
}

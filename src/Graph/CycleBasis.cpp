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
 * @file CycleBasis.cpp
 * @brief Spanning forest by depth-first search and fundamental cycles.
 *
 * The DFS uses an explicit stack and marks nodes visited when they are
 * pushed, recording for each node the parent it was reached from and the
 * tree branch used. For a chord (u, v) both root paths are walked, their
 * common tail above the lowest common ancestor is dropped and the remainder
 * is spliced into u -> LCA -> v, closed by the chord.
 */

#include "CycleBasis.hpp"

#include <iostream>
#include <vector>

#include "Edge.hpp"

CycleBasis findFundamentalCycles(const CircuitGraph &graph,
                                 const std::vector<BranchHandle> &branches)
{
    CycleBasis basis;
    const std::size_t slots = graph.nodeSlotCount();

    // Undirected adjacency list
    std::vector<std::vector<Edge>> adjacency(slots);
    for (BranchHandle h : branches) {
        const CircuitElement &element = graph.branch(h);
        Edge forward;
        forward.target = element.getNodeB();
        forward.branch = h;
        adjacency[element.getNodeA()].push_back(forward);

        Edge backward;
        backward.target = element.getNodeA();
        backward.branch = h;
        adjacency[element.getNodeB()].push_back(backward);
    }

    std::vector<bool> visited(slots, false);
    std::vector<NodeHandle> parent(slots, INVALID_HANDLE);
    std::vector<BranchHandle> parentBranch(slots, INVALID_HANDLE);
    std::vector<bool> isTreeBranch(graph.branchSlotCount(), false);

    for (NodeHandle root : graph.nodes()) {
        if (visited[root]) continue;
        ++basis.componentCount;

        std::vector<NodeHandle> stack{root};
        visited[root] = true;
        while (!stack.empty()) {
            NodeHandle current = stack.back();
            stack.pop_back();
            for (const Edge &edge : adjacency[current]) {
                if (visited[edge.target]) continue;
                visited[edge.target] = true;
                parent[edge.target] = current;
                parentBranch[edge.target] = edge.branch;
                isTreeBranch[edge.branch] = true;
                basis.treeBranches.push_back(edge.branch);
                stack.push_back(edge.target);
            }
        }
    }

    if (basis.componentCount > 1) {
        std::cerr << "Warning: Circuit graph has " << basis.componentCount
                  << " connected components; using a spanning forest"
                  << std::endl;
    }

    auto pathToRoot = [&parent](NodeHandle start) {
        std::vector<NodeHandle> path;
        for (NodeHandle cur = start; cur != INVALID_HANDLE; cur = parent[cur])
            path.push_back(cur);
        return path;
    };

    for (BranchHandle h : branches) {
        if (isTreeBranch[h]) continue;

        const CircuitElement &chord = graph.branch(h);
        NodeHandle u = chord.getNodeA();
        NodeHandle v = chord.getNodeB();
        std::vector<NodeHandle> pathU = pathToRoot(u);
        std::vector<NodeHandle> pathV = pathToRoot(v);

        // Drop the shared tail; afterwards pathU[i] == pathV[j] is the LCA.
        std::size_t i = pathU.size();
        std::size_t j = pathV.size();
        while (i > 0 && j > 0 && pathU[i - 1] == pathV[j - 1]) {
            --i;
            --j;
        }
        NodeHandle lca = pathU[i];

        FundamentalCycle cycle;
        cycle.closingBranch = h;

        // u up to the LCA
        for (std::size_t k = 0; k < i; ++k) {
            NodeHandle node = pathU[k];
            BranchHandle tree = parentBranch[node];
            cycle.nodes.push_back(node);
            cycle.branches.push_back(
                {tree, graph.branch(tree).getNodeA() == node ? 1 : -1});
        }
        cycle.nodes.push_back(lca);

        // LCA down to v
        for (std::size_t k = j; k > 0; --k) {
            NodeHandle node = pathV[k - 1];
            BranchHandle tree = parentBranch[node];
            cycle.nodes.push_back(node);
            cycle.branches.push_back(
                {tree, graph.branch(tree).getNodeA() == parent[node] ? 1 : -1});
        }

        // The chord closes the walk from v back to u. A self-loop (u == v)
        // leaves a single-node, single-branch cycle.
        cycle.branches.push_back({h, chord.getNodeA() == v ? 1 : -1});
        basis.cycles.push_back(cycle);
    }
    return basis;
}

CycleBasis findFundamentalCycles(const CircuitGraph &graph)
{
    return findFundamentalCycles(graph, graph.branches());
}

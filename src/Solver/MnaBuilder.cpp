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
 * @file MnaBuilder.cpp
 * @brief Index assignment and element stamping for the MNA system.
 */

#include "MnaBuilder.hpp"

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

int MnaSystem::nodeRow(NodeHandle node) const
{
    if (node >= nodeIndex.size()) return -1;
    return nodeIndex[node];
}

int MnaSystem::auxRow(BranchHandle branch) const
{
    auto it = auxIndex.find(branch);
    return it == auxIndex.end() ? -1 : it->second;
}

MnaSystem buildMnaSystem(const CircuitGraph &graph)
{
    MnaSystem system;
    system.reference = graph.referenceNode();
    system.nodeIndex.assign(graph.nodeSlotCount(), -1);

    // Validate branches. A node is connected when a stamped branch joins it
    // to a different node; self-loops do not constrain its voltage.
    std::vector<bool> connected(graph.nodeSlotCount(), false);
    for (BranchHandle h : graph.branches()) {
        const CircuitElement &element = graph.branch(h);
        std::string reason;
        if (!element.validate(reason)) {
            std::cerr << "Warning: Skipping branch " << element.getName()
                      << " (" << element.getType() << "): " << reason
                      << std::endl;
            system.warnings.push_back({element.getName(), reason});
            continue;
        }
        system.stampedBranches.push_back(h);
        if (element.getNodeA() != element.getNodeB()) {
            connected[element.getNodeA()] = true;
            connected[element.getNodeB()] = true;
        }
    }

    // Node unknowns 0..N-1 in insertion order
    int n = 0;
    for (NodeHandle h : graph.nodes()) {
        if (h == system.reference || !connected[h]) continue;
        system.nodeIndex[h] = n++;
    }
    system.nodeCount = n;

    // Voltage-source currents N..N+M-1 in branch order
    int m = 0;
    for (BranchHandle h : system.stampedBranches) {
        if (graph.branch(h).getGroup() == Group::G2) system.auxIndex[h] = n + m++;
    }
    system.auxCount = m;

    system.A = Eigen::MatrixXd::Zero(system.size(), system.size());
    system.b = Eigen::VectorXd::Zero(system.size());

    for (BranchHandle h : system.stampedBranches) {
        graph.branch(h).stamp(system, h);
    }
    return system;
}

void printMnaSystem(std::ostream &os, const CircuitGraph &graph,
                    const MnaSystem &system)
{
    std::vector<std::string> labels(system.size());
    for (NodeHandle h : graph.nodes()) {
        int row = system.nodeRow(h);
        if (row >= 0) labels[row] = "V(" + graph.nodeName(h) + ")";
    }
    for (const auto &entry : system.auxIndex) {
        labels[entry.second] = "I(" + graph.branch(entry.first).getName() + ")";
    }

    std::ios_base::fmtflags flags = os.flags();
    std::streamsize precision = os.precision();
    os << std::fixed << std::setprecision(5);
    for (int i = 0; i < system.size(); i++) {
        for (int j = 0; j < system.size(); j++) {
            os << system.A(i, j) << "\t\t";
        }
        os << "\t\t" << labels[i] << "\t\t" << system.b(i) << std::endl;
    }
    os.flags(flags);
    os.precision(precision);
}

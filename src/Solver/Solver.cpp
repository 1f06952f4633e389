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
 * @file Solver.cpp
 * @brief Implementation of the high-level solver workflow.
 *
 * `solveCircuit` chains the MNA builder, the Gaussian elimination routine and
 * (for the mesh method) the cycle basis finder and the mesh decomposer.
 * `runSolver` wraps it with netlist parsing and result printing for the
 * command-line driver.
 */

#include "Solver.hpp"

#include <iomanip>
#include <iostream>

#include "LinearSolver.hpp"
#include "MeshDecomposer.hpp"
#include "MnaBuilder.hpp"
#include "Parser.hpp"

CircuitSolution solveCircuit(const CircuitGraph &graph,
                             const SolverOptions &options)
{
    CircuitSolution solution;
    if (graph.empty()) return solution;

    MnaSystem system = buildMnaSystem(graph);
    solution.warnings = system.warnings;
    solution.referenceNode = graph.nodeName(system.reference);

    if (options.printMatrix) printMnaSystem(std::cout, graph, system);

    // A system without unknowns (only the reference, isolated nodes or
    // skipped branches) has nothing to eliminate.
    Eigen::VectorXd x;
    if (system.size() > 0)
        x = solveLinearSystem(system.A, system.b, options.pivotTolerance);

    std::vector<double> voltages(graph.nodeSlotCount(), 0.0);
    for (NodeHandle n : graph.nodes()) {
        int row = system.nodeRow(n);
        if (row >= 0) voltages[n] = x(row);
        solution.nodeVoltages[graph.nodeName(n)] = voltages[n];
    }

    std::vector<double> currents;
    currents.reserve(system.stampedBranches.size());
    for (BranchHandle h : system.stampedBranches) {
        const CircuitElement &element = graph.branch(h);
        double current = element.current(system, h, x, voltages);
        currents.push_back(current);
        solution.branchCurrents[element.getName()] = current;
        if (element.getGroup() == Group::G2)
            solution.voltageSourceCurrents[element.getName()] = current;
    }

    if (options.method != AnalysisMethod::MESH) return solution;

    CycleBasis basis = findFundamentalCycles(graph, system.stampedBranches);
    solution.cycles = basis.cycles;
    try {
        MeshDecomposition mesh =
            decomposeMeshCurrents(graph, system.stampedBranches, currents,
                                  basis.cycles, options.pivotTolerance);
        solution.meshCurrents.assign(
            mesh.meshCurrents.data(),
            mesh.meshCurrents.data() + mesh.meshCurrents.size());
        solution.hasMeshCurrents = true;
    } catch (const UnsupportedTopologyError &e) {
        solution.meshFailure = e.what();
    } catch (const SingularMatrixError &e) {
        solution.meshFailure = e.what();
    }

    if (!solution.hasMeshCurrents) {
        std::cerr << "Warning: Mesh currents not computed ("
                  << solution.meshFailure << "); reporting nodal results only"
                  << std::endl;
    }
    return solution;
}

void printSolution(std::ostream &os, const CircuitGraph &graph,
                   const CircuitSolution &solution)
{
    std::ios_base::fmtflags flags = os.flags();
    std::streamsize precision = os.precision();
    os << std::fixed << std::setprecision(5);

    os << "Reference node: " << solution.referenceNode << std::endl;

    os << "\nNode Voltages:" << std::endl;
    for (NodeHandle n : graph.nodes()) {
        auto it = solution.nodeVoltages.find(graph.nodeName(n));
        if (it == solution.nodeVoltages.end()) continue;
        os << "V(" << it->first << ")\t\t" << it->second << std::endl;
    }

    os << "\nBranch Currents:" << std::endl;
    for (BranchHandle h : graph.branches()) {
        auto it = solution.branchCurrents.find(graph.branch(h).getName());
        if (it == solution.branchCurrents.end()) continue;
        os << "I(" << it->first << ")\t\t" << it->second << std::endl;
    }

    if (solution.hasMeshCurrents) {
        os << "\nMesh Currents:" << std::endl;
        for (std::size_t k = 0; k < solution.cycles.size(); ++k) {
            os << "M" << (k + 1) << " [";
            const std::vector<CycleBranch> &steps = solution.cycles[k].branches;
            for (std::size_t s = 0; s < steps.size(); ++s) {
                if (s > 0) os << " ";
                os << (steps[s].orientation > 0 ? "+" : "-")
                   << graph.branch(steps[s].branch).getName();
            }
            os << "]\t\t" << solution.meshCurrents[k] << std::endl;
        }
    } else if (!solution.meshFailure.empty()) {
        os << "\nMesh currents unavailable: " << solution.meshFailure
           << std::endl;
    }

    os.flags(flags);
    os.precision(precision);
}

int runSolver(const std::string &filename, const SolverOptions &options)
{
    // Parse the netlist
    Parser parser;
    SolverDirectiveType directive = SolverDirectiveType::NONE;
    if (parser.parse(filename, directive) != 0) {
        std::cerr << "Error: Failed to parse file: " << filename << std::endl;
        return 1;
    }

    SolverOptions effective = options;
    if (!options.forceMethod) {
        if (directive == SolverDirectiveType::MESH)
            effective.method = AnalysisMethod::MESH;
        else if (directive == SolverDirectiveType::NODAL)
            effective.method = AnalysisMethod::NODAL;
    }

    CircuitSolution solution;
    try {
        solution = solveCircuit(parser.graph, effective);
    } catch (const SingularMatrixError &e) {
        std::cerr << "Error: circuit has no solution, check grounding/sources"
                  << " (" << e.what() << ")" << std::endl;
        return 1;
    }

    std::cout << (effective.method == AnalysisMethod::MESH
                      ? "DC Mesh Analysis Results:"
                      : "DC Operating Point Analysis Results:")
              << std::endl;
    printSolution(std::cout, parser.graph, solution);
    return 0;
}

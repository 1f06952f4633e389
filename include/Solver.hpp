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
 * @file Solver.hpp
 * @brief High-level solver API: one static DC solve of a circuit graph.
 *
 * This header exposes the entrypoints used by the command-line driver and by
 * tests to:
 *  - Solve a `CircuitGraph` (MNA build, Gaussian elimination, branch
 *    currents, optional mesh decomposition),
 *  - Print the results, and
 *  - Run the full netlist-file workflow.
 *
 * Every call is a pure function of the graph: matrices are allocated fresh
 * and nothing is kept between calls, so repeated solves are idempotent.
 */
#pragma once

#include <map>
#include <ostream>
#include <string>
#include <vector>

#include "CircuitErrors.hpp"
#include "CircuitGraph.hpp"
#include "CycleBasis.hpp"
#include "SolverOptions.hpp"

/**
 * @enum SolverDirectiveType
 * @brief Describes the analysis requested in a parsed netlist.
 *
 * Parser::parse inspects the netlist for directives (`.OP`, `.MESH`) and
 * sets the directive accordingly.
 */
enum class SolverDirectiveType
{
    NONE,  /**< No directive found in the netlist. */
    NODAL, /**< Nodal analysis (.OP). */
    MESH   /**< Nodal analysis plus mesh currents (.MESH). */
};

/**
 * @struct CircuitSolution
 * @brief Results of one solve.
 */
struct CircuitSolution
{
    /** @brief Node id -> voltage in volts; the reference is 0. */
    std::map<std::string, double> nodeVoltages;

    /** @brief Branch id -> current in amps, positive from -> to. */
    std::map<std::string, double> branchCurrents;

    /** @brief Voltage-source id -> current through the source. */
    std::map<std::string, double> voltageSourceCurrents;

    /** @brief Id of the reference node (empty for an empty graph). */
    std::string referenceNode;

    /** @brief Fundamental cycles (mesh method only). */
    std::vector<FundamentalCycle> cycles;

    /** @brief One mesh current per entry of `cycles`. */
    std::vector<double> meshCurrents;

    /** @brief True when `meshCurrents` holds a decomposition. */
    bool hasMeshCurrents = false;

    /**
     * @brief Why mesh currents are missing although the mesh method was
     * requested (empty otherwise).
     */
    std::string meshFailure;

    /** @brief Branches skipped while assembling the system. */
    std::vector<InvalidComponentWarning> warnings;
};

/**
 * @brief Solve the circuit once.
 *
 * Steps:
 *  - Assemble the MNA system; an empty system yields `{reference: 0}`
 *    without calling the linear solver.
 *  - Solve with Gaussian elimination.
 *  - Derive node voltages and branch currents.
 *  - For `AnalysisMethod::MESH`, compute the fundamental cycles over the
 *    stamped branches and the mesh currents. When the topology does not allow
 *    it (current sources, no cycles) the nodal results are still returned and
 *    `meshFailure` says why.
 *
 * @throws SingularMatrixError when the circuit has no unique solution.
 */
CircuitSolution solveCircuit(const CircuitGraph &graph,
                             const SolverOptions &options = SolverOptions());

/**
 * @brief Print voltages, currents and (when present) mesh currents.
 *
 * Entries are printed in graph insertion order.
 */
void printSolution(std::ostream &os, const CircuitGraph &graph,
                   const CircuitSolution &solution);

/**
 * @brief Run the top-level solver workflow for a netlist file.
 *
 *  - Parse the netlist and inspect the directive (.OP / .MESH).
 *  - Pick the analysis method (directive, unless `options.forceMethod`).
 *  - Solve and print the results to stdout.
 *
 * @param filename Netlist path.
 * @param options Solver options (already validated by the caller).
 * @return 0 on success, 1 on parse failure or when the circuit has no
 * solution.
 */
int runSolver(const std::string &filename,
              const SolverOptions &options = SolverOptions());

/* End of Solver.hpp */

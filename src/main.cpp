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
 * @file main.cpp
 *
 * @brief Command-line entry point: option parsing and dispatch to runSolver.
 */

#include <getopt.h>

#include <iostream>
#include <stdexcept>

#include "Solver.hpp"
#include "SolverOptions.hpp"

static void printHelp(const char *prog)
{
    std::cout << "Usage: " << prog << " [options] [netlist-file]\n";
    std::cout << "Options:\n";
    std::cout << "  --method <nodal|mesh>     Analysis method (overrides the "
                 ".OP/.MESH directive)\n";
    std::cout << "  --pivot-tol <double>      Pivot magnitude treated as zero "
                 "(default 1e-12)\n";
    std::cout << "  --print-matrix            Print the assembled MNA system\n";
    std::cout << "  --help                    Show this help message\n";
}

int main(int argc, char *argv[])
{
    SolverOptions options;

    static struct option long_options[] = {
        {"method", required_argument, 0, 0},
        {"pivot-tol", required_argument, 0, 0},
        {"print-matrix", no_argument, 0, 0},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}};

    int option_index = 0;
    int c;
    // Use getopt_long to iterate over options
    while ((c = getopt_long(argc, argv, "h", long_options, &option_index)) !=
           -1) {
        if (c == 'h') {
            printHelp(argv[0]);
            return 0;
        } else if (c == '?') {
            printHelp(argv[0]);
            return 1;
        } else if (c == 0) {
            std::string name = long_options[option_index].name;
            try {
                if (name == "method") {
                    options.method = parseAnalysisMethod(optarg);
                    options.forceMethod = true;
                } else if (name == "pivot-tol") {
                    options.pivotTolerance = std::stod(optarg);
                } else if (name == "print-matrix") {
                    options.printMatrix = true;
                }
            } catch (const std::invalid_argument &ex) {
                std::cerr << "Invalid solver option --" << name << ": "
                          << ex.what() << std::endl;
                return 1;
            } catch (const std::out_of_range &ex) {
                std::cerr << "Invalid solver option --" << name << ": "
                          << ex.what() << std::endl;
                return 1;
            }
        }
    }

    // Remaining non-option args: [netlist-file]
    std::string filename = "circuit.cir";
    if (optind < argc) {
        filename = argv[optind];
    }

    // Validate options (throws on bad input)
    try {
        options.validate();
    } catch (const std::exception &ex) {
        std::cerr << "Invalid solver option: " << ex.what() << std::endl;
        return 1;
    }

    return runSolver(filename, options);
}

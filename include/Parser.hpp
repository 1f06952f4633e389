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
 * @file Parser.hpp
 * @brief Netlist reader that populates a `CircuitGraph`.
 *
 * The accepted format is a small SPICE-like subset, read case-insensitively
 * (every line is uppercased):
 *
 *     * comment            ; comment
 *     .NODE <id> [<id>...]
 *     R<name> <from> <to> <value>
 *     V<name> <from> <to> <value>
 *     I<name> <from> <to> <value>
 *     .OP | .MESH
 *     .END
 *
 * Branch endpoints are created on first reference; `.NODE` declares nodes
 * up-front, which fixes their insertion order and allows isolated nodes.
 * Problems are reported on stderr as `Line N: ...` and counted.
 */

#pragma once

#include <istream>
#include <string>
#include <vector>

#include "CircuitElement.hpp"
#include "CircuitGraph.hpp"

// Forward Declaration
enum class SolverDirectiveType;

/**
 * @struct ElementCounts
 * @brief Number of parsed elements per kind.
 */
struct ElementCounts
{
    int resistorCount = 0; /**< Number of resistors parsed */
    int voltageSourceCount =
        0; /**< Number of independent voltage sources parsed */
    int currentSourceCount =
        0; /**< Number of independent current sources parsed */
};

/**
 * @class Parser
 * @brief Reads a netlist and builds the circuit graph.
 */
class Parser
{
   public:
    /**
     * @brief Circuit built by the last call to `parse()`.
     */
    CircuitGraph graph;

    /**
     * @brief Parses a netlist file and populates `graph`.
     *
     * @param file Path to the netlist file to parse.
     * @param directive Reference updated to reflect an encountered analysis
     *                  directive (`.OP` or `.MESH`). If no directive is
     *                  present, the value remains `SolverDirectiveType::NONE`.
     * @return Number of errors encountered while parsing. Zero indicates a
     *         clean parse.
     */
    int parse(const std::string& file, SolverDirectiveType& directive);

    /**
     * @brief Same as `parse()`, reading from an already opened stream.
     */
    int parseStream(std::istream& input, SolverDirectiveType& directive);

    /**
     * @brief Validate the number of tokens in a line.
     *
     * @param tokens Tokenized line.
     * @param expectedSize Expected token count.
     * @param lineNumber Associated line number (for error messages).
     * @return True if token count matches `expectedSize`, false otherwise.
     */
    bool validateTokens(const std::vector<std::string>& tokens,
                        int expectedSize, int lineNumber);

    /**
     * @brief Parse a numeric value string into a double.
     *
     * Accepts optional suffix multipliers (T, G, MEG, K, M, U, N, P, F). The
     * mantissa must be a well-formed numeric literal (std::stod must consume
     * the entire mantissa). The parser is strict and will set `valid` to false
     * for malformed inputs.
     *
     * @param valueStr Value token (e.g., \"10K\", \"3.3U\").
     * @param lineNumber Line number in the netlist (used for diagnostics).
     * @param valid Output parameter set to true when parsing succeeds.
     * @return Parsed numeric value (0.0 if `valid` is false).
     */
    double parseValue(const std::string& valueStr, int lineNumber, bool& valid);

    /**
     * @brief Print a summary of element counts collected during parsing.
     */
    void printElementCounts() const;

    /** @brief Element counts of the last parse. */
    const ElementCounts& getElementCounts() const { return elementCounts; }

   private:
    ElementCounts elementCounts;

    /**
     * @brief Parse an `R`, `V` or `I` line and add the branch to `graph`.
     * @return Number of errors reported for the line (0 or 1).
     */
    int parseBranch(const std::vector<std::string>& tokens, ElementType type,
                    int lineNumber);

    /**
     * @brief Parse a `.NODE` directive.
     * @return Number of errors reported for the line.
     */
    int parseNodeDirective(const std::vector<std::string>& tokens,
                           int lineNumber);

    /** @brief Return the node handle for `id`, creating the node if needed. */
    NodeHandle ensureNode(const std::string& id);
};

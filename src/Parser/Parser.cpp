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
 * @file Parser.cpp
 * @brief Implementation of the Parser declared in Parser.hpp.
 *
 * Implementation notes (concise):
 *  - Every line is uppercased before tokenization, so element letters,
 *    directives and value suffixes are recognized in any case.
 *  - A `*` or `;` starts a comment, whether at the start of a line or after
 *    the tokens.
 *  - Numeric parsing follows strict SPICE-like rules: common suffixes
 *    (T, G, MEG, K, M, U, N, P, F) are supported and the mantissa must be
 *    a well-formed floating literal (std::stod must consume the entire
 *    mantissa).
 *  - Graph errors (duplicate ids) are reported with the line number and
 *    counted like any other parse error.
 */

#include "Parser.hpp"

#include <cctype>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

#include "CircuitErrors.hpp"
#include "Solver.hpp"

int Parser::parse(const std::string& fileName, SolverDirectiveType& directive)
{
    std::ifstream fileStream(fileName);
    if (!fileStream) {
        std::cerr << "Error: Netlist '" << fileName << "' could not be opened"
                  << std::endl;
        return 1;
    }
    return parseStream(fileStream, directive);
}

int Parser::parseStream(std::istream& input, SolverDirectiveType& directive)
{
    std::string line;
    int lineNumber = 0;
    int errorCount = 0;

    // Clear previous data
    graph.clear();
    elementCounts = ElementCounts();

    auto tokenizeLine = [](const std::string& ln) {
        std::vector<std::string> tokens;
        std::string cur;
        for (char c : ln) {
            if (c == '*' || c == ';') break;
            if (std::isspace((unsigned char)c)) {
                if (!cur.empty()) {
                    tokens.push_back(cur);
                    cur.clear();
                }
                continue;
            }
            cur.push_back(c);
        }
        if (!cur.empty()) tokens.push_back(cur);
        return tokens;
    };

    auto setDirective = [&](SolverDirectiveType requested) {
        if (directive != SolverDirectiveType::NONE) {
            std::cerr << "Warning: Multiple directives found. Using the "
                         "first one."
                      << std::endl;
            return;
        }
        directive = requested;
    };

    while (std::getline(input, line)) {
        lineNumber++;

        // Convert line to uppercase for uniformity
        std::string up = line;
        for (auto& c : up) c = (char)std::toupper((unsigned char)c);

        std::vector<std::string> tokens = tokenizeLine(up);
        if (tokens.empty()) continue;  // blank or comment line

        const std::string& head = tokens[0];
        if (head == ".END") break;

        if (head == ".OP") {
            setDirective(SolverDirectiveType::NODAL);
            continue;
        }
        if (head == ".MESH") {
            setDirective(SolverDirectiveType::MESH);
            continue;
        }
        if (head == ".NODE") {
            errorCount += parseNodeDirective(tokens, lineNumber);
            continue;
        }
        if (head[0] == '.') {
            std::cerr << "Line " << lineNumber << ": Unknown directive '"
                      << head << "'" << std::endl;
            ++errorCount;
            continue;
        }

        switch (head[0]) {
            case 'R':
                ++elementCounts.resistorCount;
                errorCount += parseBranch(tokens, ElementType::R, lineNumber);
                break;
            case 'V':
                ++elementCounts.voltageSourceCount;
                errorCount += parseBranch(tokens, ElementType::V, lineNumber);
                break;
            case 'I':
                ++elementCounts.currentSourceCount;
                errorCount += parseBranch(tokens, ElementType::I, lineNumber);
                break;
            default:
                std::cerr << "Line " << lineNumber << ": Unknown element '"
                          << head << "'" << std::endl;
                ++errorCount;
                break;
        }
    }

    std::cout << "\nTotal elements in the circuit: " << graph.branchCount()
              << std::endl;
    printElementCounts();
    return errorCount;
}

int Parser::parseBranch(const std::vector<std::string>& tokens,
                        ElementType type, int lineNumber)
{
    if (!validateTokens(tokens, 4, lineNumber)) return 1;

    bool validValue = false;
    double value = parseValue(tokens[3], lineNumber, validValue);
    if (!validValue) return 1;

    try {
        ensureNode(tokens[1]);
        ensureNode(tokens[2]);
        graph.addBranch(tokens[0], tokens[1], tokens[2], type, value);
    } catch (const CircuitError& e) {
        std::cerr << "Line " << lineNumber << ": " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

int Parser::parseNodeDirective(const std::vector<std::string>& tokens,
                               int lineNumber)
{
    if (tokens.size() < 2) {
        std::cerr << "Line " << lineNumber
                  << ": .NODE requires at least one node id" << std::endl;
        return 1;
    }

    int errors = 0;
    for (std::size_t i = 1; i < tokens.size(); ++i) {
        try {
            graph.addNode(tokens[i]);
        } catch (const DuplicateIdError& e) {
            std::cerr << "Line " << lineNumber << ": " << e.what()
                      << std::endl;
            ++errors;
        }
    }
    return errors;
}

NodeHandle Parser::ensureNode(const std::string& id)
{
    NodeHandle handle = graph.findNode(id);
    if (handle != INVALID_HANDLE) return handle;
    return graph.addNode(id);
}

bool Parser::validateTokens(const std::vector<std::string>& tokens,
                            int expectedSize, int lineNumber)
{
    if (tokens.size() != static_cast<std::size_t>(expectedSize)) {
        std::cerr << "Line " << lineNumber << ": Expected " << expectedSize
                  << " tokens, got " << tokens.size() << std::endl;
        return false;
    }
    return true;
}

double Parser::parseValue(const std::string& valueStr, int lineNumber,
                          bool& valid)
{
    // Strict SPICE-style parsing:
    // - Recognize common suffixes (T, G, MEG, K, M, U, N, P, F).
    // - Require a non-empty mantissa fully consumed by std::stod, so
    //   malformed numbers such as "1.2.3" are rejected.

    if (valueStr.empty()) {
        std::cerr << "Line " << lineNumber << ": Invalid value '" << valueStr
                  << "'" << std::endl;
        valid = false;
        return 0.0;
    }

    // Map of recognized suffixes (uppercase) -> multiplier
    static const std::unordered_map<std::string, double> suffixMap = {
        {"T", 1e12}, {"G", 1e9},  {"MEG", 1e6}, {"K", 1e3},  {"M", 1e-3},
        {"U", 1e-6}, {"N", 1e-9}, {"P", 1e-12}, {"F", 1e-15}};

    // Separate the trailing alphabetic suffix (if any)
    size_t pos = valueStr.size();
    while (pos > 0 && std::isalpha((unsigned char)valueStr[pos - 1])) --pos;

    std::string mantissa = valueStr.substr(0, pos);
    std::string suffix = valueStr.substr(pos);

    // Mantissa must not be empty (e.g., "K" is invalid)
    if (mantissa.empty()) {
        std::cerr << "Line " << lineNumber << ": Invalid value '" << valueStr
                  << "'" << std::endl;
        valid = false;
        return 0.0;
    }

    for (auto& c : suffix) c = (char)std::toupper((unsigned char)c);

    auto parseMantissaStrict = [](const std::string& m, double& out) -> bool {
        try {
            size_t idx = 0;
            out = std::stod(m, &idx);
            return idx == m.size();
        } catch (const std::invalid_argument&) {
            return false;
        } catch (const std::out_of_range&) {
            return false;
        }
    };

    if (suffix.empty()) {
        double value = 0.0;
        if (!parseMantissaStrict(mantissa, value)) {
            std::cerr << "Line " << lineNumber << ": Invalid value '"
                      << valueStr << "'" << std::endl;
            valid = false;
            return 0.0;
        }
        valid = true;
        return value;
    }

    // Suffix present: must be recognized
    auto it = suffixMap.find(suffix);
    if (it == suffixMap.end()) {
        std::cerr << "Line " << lineNumber << ": Unknown suffix '" << suffix
                  << "' in value '" << valueStr << "'" << std::endl;
        valid = false;
        return 0.0;
    }

    double base = 0.0;
    if (!parseMantissaStrict(mantissa, base)) {
        std::cerr << "Line " << lineNumber << ": Invalid numeric part '"
                  << mantissa << "' in '" << valueStr << "'" << std::endl;
        valid = false;
        return 0.0;
    }

    valid = true;
    return base * it->second;
}

void Parser::printElementCounts() const
{
    std::cout << "Total Resistors: " << elementCounts.resistorCount
              << std::endl;
    std::cout << "Total Voltage Sources: " << elementCounts.voltageSourceCount
              << std::endl;
    std::cout << "Total Current Sources: " << elementCounts.currentSourceCount
              << std::endl;
}

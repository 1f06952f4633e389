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
#pragma once

/**
 * @file Resistor.hpp
 * @brief Declaration of the linear Resistor element.
 *
 * A resistor is a group-1 element: it contributes the conductance `1/R` to
 * the nodal block of the MNA matrix and has no auxiliary unknown. Its current
 * is recovered from the node voltages after the solve.
 */

#include <string>

#include "CircuitElement.hpp"

/**
 * @class Resistor
 * @brief Linear resistor between `nodeA` and `nodeB`.
 */
class Resistor : public CircuitElement
{
   public:
    /**
     * @brief Construct a resistor element.
     *
     * @param name Unique element name (e.g., "R1").
     * @param nodeA Positive terminal node handle.
     * @param nodeB Negative terminal node handle.
     * @param value Resistance value in ohms.
     */
    Resistor(const std::string& name, NodeHandle nodeA, NodeHandle nodeB,
             double value)
        : CircuitElement(name, nodeA, nodeB, value, ElementType::R)
    {
        group = Group::G1;
    }

    /**
     * @brief A resistance must be finite and strictly positive.
     */
    bool validate(std::string& reason) const override;

    /**
     * @brief Stamp the conductance of the resistor into the nodal block.
     *
     * Adds `g = 1/R` to the diagonal entries of both terminals and `-g` to
     * the two cross terms. A terminal without a node row (the reference or an
     * unindexed node) is skipped, leaving a single diagonal entry.
     */
    void stamp(MnaSystem& system, BranchHandle self) const override;

    /**
     * @brief Ohm's law: `(V(nodeA) - V(nodeB)) / R`.
     */
    double current(const MnaSystem& system, BranchHandle self,
                   const Eigen::VectorXd& x,
                   const std::vector<double>& voltages) const override;
};

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

#include <string>

#include "CircuitElement.hpp"

/**
 * @file VoltageSource.hpp
 * @brief Declaration of the independent DC voltage source.
 */

/**
 * @class VoltageSource
 * @brief Ideal voltage source enforcing `V(nodeA) - V(nodeB) = value`.
 *
 * Voltage sources are always group-2 elements: each one owns an auxiliary
 * unknown holding the current that flows through the source from `nodeA` to
 * `nodeB`.
 */
class VoltageSource : public CircuitElement
{
   public:
    /**
     * @brief Construct an independent voltage source.
     *
     * @param name Unique element name (e.g., "V1").
     * @param nodeA Positive terminal node handle.
     * @param nodeB Negative terminal node handle.
     * @param value Voltage value in volts.
     */
    VoltageSource(const std::string &name, NodeHandle nodeA, NodeHandle nodeB,
                  double value)
        : CircuitElement(name, nodeA, nodeB, value, ElementType::V)
    {
        group = Group::G2;
    }

    /**
     * @brief Stamp the voltage source into the MNA matrix and RHS.
     *
     * The stamp inserts the incidence couplings (`B` and `B^T` blocks) and the
     * element equation row:
     *
     *   - KCL at nodeA/nodeB includes +/-I_source contributions.
     *   - The element equation row is: V(nodeA) - V(nodeB) = value.
     *
     * A terminal without a node row only drops its coupling entries.
     *
     * @param system System being assembled; must hold an auxiliary row for
     *               `self`.
     * @param self Handle of this element.
     */
    void stamp(MnaSystem &system, BranchHandle self) const override;

    /**
     * @brief Reads the source current from the auxiliary unknown.
     */
    double current(const MnaSystem &system, BranchHandle self,
                   const Eigen::VectorXd &x,
                   const std::vector<double> &voltages) const override;
};

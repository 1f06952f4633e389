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
 * @file Resistor.cpp
 * @brief Conductance stamp and Ohm's-law current of the resistor.
 */

#include "Resistor.hpp"

#include <cmath>
#include <string>
#include <vector>

#include "MnaBuilder.hpp"

bool Resistor::validate(std::string& reason) const
{
    if (!std::isfinite(value)) {
        reason = "resistance is not a finite number";
        return false;
    }
    if (value <= 0.0) {
        reason = "resistance must be > 0";
        return false;
    }
    return true;
}

void Resistor::stamp(MnaSystem& system, BranchHandle /*self*/) const
{
    int vplus = system.nodeRow(nodeA);
    int vminus = system.nodeRow(nodeB);
    double conductance = 1.0 / value;

    // Rows without an unknown (reference node) drop out of the stamp,
    // leaving a single diagonal entry when one terminal is grounded.
    if (vplus >= 0) system.A(vplus, vplus) += conductance;
    if (vminus >= 0) system.A(vminus, vminus) += conductance;
    if (vplus >= 0 && vminus >= 0) {
        system.A(vplus, vminus) -= conductance;
        system.A(vminus, vplus) -= conductance;
    }
}

double Resistor::current(const MnaSystem& /*system*/, BranchHandle /*self*/,
                         const Eigen::VectorXd& /*x*/,
                         const std::vector<double>& voltages) const
{
    return (voltages[nodeA] - voltages[nodeB]) / value;
}

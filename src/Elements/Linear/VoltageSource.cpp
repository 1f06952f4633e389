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
 * @file VoltageSource.cpp
 * @brief Implementation of the independent voltage source stamp.
 *
 * The source owns the auxiliary row `k = auxRow(self)`. Its current unknown
 * appears with +1 in the KCL row of nodeA and -1 in the KCL row of nodeB
 * (the B block); the element row mirrors those entries (the B^T block) and
 * carries the source voltage on the RHS.
 */

#include "VoltageSource.hpp"

#include <string>
#include <stdexcept>
#include <vector>

#include "MnaBuilder.hpp"

void VoltageSource::stamp(MnaSystem& system, BranchHandle self) const
{
    int i = system.auxRow(self);  // element current unknown index
    if (i < 0) {
        throw std::logic_error("voltage source " + name +
                               " has no auxiliary row");
    }

    int vplus = system.nodeRow(nodeA);
    int vminus = system.nodeRow(nodeB);

    // KCL: nodeA receives +I_e, nodeB receives -I_e
    if (vplus >= 0) {
        system.A(vplus, i) += 1.0;
        system.A(i, vplus) += 1.0;
    }
    if (vminus >= 0) {
        system.A(vminus, i) -= 1.0;
        system.A(i, vminus) -= 1.0;
    }
    // Element equation: V(nodeA) - V(nodeB) = value
    system.b(i) += value;
}

double VoltageSource::current(const MnaSystem& system, BranchHandle self,
                              const Eigen::VectorXd& x,
                              const std::vector<double>& /*voltages*/) const
{
    int i = system.auxRow(self);
    if (i < 0) {
        throw std::logic_error("voltage source " + name +
                               " has no auxiliary row");
    }
    return x(i);
}

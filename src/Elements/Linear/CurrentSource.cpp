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
 * @file CurrentSource.cpp
 * @brief Implementation of the `CurrentSource` class declared in
 * CurrentSource.hpp.
 *
 * For DC Modified Nodal Analysis (MNA) an ideal current source contributes
 * only to the RHS current injection vector.
 */

#include "CurrentSource.hpp"

#include <vector>

#include "MnaBuilder.hpp"

void CurrentSource::stamp(MnaSystem& system, BranchHandle /*self*/) const
{
    // The current leaves nodeA and enters nodeB.
    int vplus = system.nodeRow(nodeA);
    int vminus = system.nodeRow(nodeB);
    if (vplus >= 0) system.b(vplus) -= value;
    if (vminus >= 0) system.b(vminus) += value;
}

double CurrentSource::current(const MnaSystem& /*system*/,
                              BranchHandle /*self*/,
                              const Eigen::VectorXd& /*x*/,
                              const std::vector<double>& /*voltages*/) const
{
    return value;
}

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
 * @file CurrentSource.hpp
 * @brief Declaration of the independent DC current source.
 *
 * An ideal current source only contributes to the RHS current injection
 * vector of the MNA system: it removes `value` from the KCL row of `nodeA` and
 * adds it to the KCL row of `nodeB`.
 */

#pragma once

#include <string>

#include "CircuitElement.hpp"

class CurrentSource : public CircuitElement
{
   public:
    CurrentSource(const std::string &name, NodeHandle nodeA, NodeHandle nodeB,
                  double value)
        : CircuitElement(name, nodeA, nodeB, value, ElementType::I)
    {
        group = Group::G1;
    }

    void stamp(MnaSystem &system, BranchHandle self) const override;

    /**
     * @brief The branch current of an ideal current source is its value.
     */
    double current(const MnaSystem &system, BranchHandle self,
                   const Eigen::VectorXd &x,
                   const std::vector<double> &voltages) const override;
};

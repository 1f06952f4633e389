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
 * @file CircuitElement.cpp
 * @brief Shared element behaviour: value validation and the kind factory.
 *
 * Keep implementation comments concise; the public API and behavior are
 * documented in the header (`CircuitElement.hpp`).
 */

#include "CircuitElement.hpp"

#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>

#include "CurrentSource.hpp"
#include "Resistor.hpp"
#include "VoltageSource.hpp"

bool CircuitElement::validate(std::string &reason) const
{
    if (!std::isfinite(value)) {
        reason = "value is not a finite number";
        return false;
    }
    return true;
}

std::shared_ptr<CircuitElement> CircuitElement::create(ElementType type,
                                                       const std::string &name,
                                                       NodeHandle nodeA,
                                                       NodeHandle nodeB,
                                                       double value)
{
    switch (type) {
        case ElementType::R:
            return std::make_shared<Resistor>(name, nodeA, nodeB, value);
        case ElementType::V:
            return std::make_shared<VoltageSource>(name, nodeA, nodeB, value);
        case ElementType::I:
            return std::make_shared<CurrentSource>(name, nodeA, nodeB, value);
    }
    throw std::invalid_argument("unknown element type for " + name);
}

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
 * @file CircuitElement.hpp
 * @brief Defines the CircuitElement base class and related enums
 *
 * This file contains the definition of the CircuitElement base class, which
 * represents a two-terminal branch of a linear DC circuit (resistor,
 * independent voltage source or independent current source). Concrete
 * elements know how to stamp themselves into the MNA system and how to
 * recover their branch current from a solved system.
 */

#pragma once

#include <Eigen/Dense>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "Node.hpp"

// Forward Declaration
struct MnaSystem;

/**
 * @enum ElementType
 * @brief Enumerates supported branch kinds.
 */
enum class ElementType
{
    R, /**< Resistor (value in ohms) */
    V, /**< Independent voltage source (value in volts) */
    I  /**< Independent current source (value in amps) */
};

inline std::ostream& operator<<(std::ostream& os, ElementType et)
{
    switch (et) {
        case ElementType::R:
            os << "R";
            break;
        case ElementType::V:
            os << "V";
            break;
        case ElementType::I:
            os << "I";
            break;
        default:
            os << "UnknownElementType";
            break;
    }
    return os;
}

/**
 * @enum Group
 * @brief Classification used during Modified Nodal Analysis (MNA) assembly.
 *
 *  - G1: the branch current is eliminated from the system; the element only
 *        contributes conductances or current injections (R, I).
 *  - G2: the branch current is an explicit auxiliary unknown with its own
 *        row and column (V).
 */
enum class Group
{
    G1, /**< Group 1: branch current eliminated during assembly */
    G2  /**< Group 2: auxiliary unknown (explicit branch current variable) */
};

inline std::ostream& operator<<(std::ostream& os, Group group)
{
    switch (group) {
        case Group::G1:
            os << "G1";
            break;
        case Group::G2:
            os << "G2";
            break;
        default:
            os << "UnknownGroup";
            break;
    }
    return os;
}

/**
 * @class CircuitElement
 * @brief Base class representing a branch of the circuit.
 *
 * The element direction is `nodeA -> nodeB`: a positive current flows from
 * `nodeA` to `nodeB`, and a voltage source enforces `V(nodeA) - V(nodeB) =
 * value`.
 */
class CircuitElement
{
   protected:
    /**
     * @brief Name of the element (unique identifier)
     */
    std::string name;
    /**
     * @brief Handle of the starting node
     */
    NodeHandle nodeA;
    /**
     * @brief Handle of the ending node
     */
    NodeHandle nodeB;
    /**
     * @brief Value of the element (ohms, volts or amps)
     */
    double value;
    /**
     * @brief Kind of the element
     */
    ElementType type;
    /**
     * @brief Group classification for the element (G1 or G2)
     */
    Group group = Group::G1;

   public:
    /**
     * @brief Construct a CircuitElement
     * @param name Name of the element
     * @param nodeA Starting node handle
     * @param nodeB Ending node handle
     * @param value Value of the element
     * @param type Kind of the element
     */
    CircuitElement(const std::string& name, NodeHandle nodeA, NodeHandle nodeB,
                   double value, ElementType type)
        : name(name), nodeA(nodeA), nodeB(nodeB), value(value), type(type)
    {
    }

    /**
     * @brief Virtual destructor
     */
    virtual ~CircuitElement() = default;

    /**
     * @brief Check whether the element can take part in a solve.
     *
     * The graph model accepts any value so that a half-edited circuit can be
     * stored; the MNA builder calls this method and skips the branch with an
     * `InvalidComponentWarning` when it returns false.
     *
     * @param[out] reason Filled with a short explanation on failure.
     * @return true if the element value is usable.
     */
    virtual bool validate(std::string& reason) const;

    /**
     * @brief Stamps the element's contribution into the MNA matrix and RHS
     * vector
     * @param system System being assembled; its index maps are already
     * populated.
     * @param self Handle of this element inside the graph (used to look up the
     * auxiliary row of G2 elements).
     */
    virtual void stamp(MnaSystem& system, BranchHandle self) const = 0;

    /**
     * @brief Branch current (from nodeA to nodeB) for a solved system.
     * @param system The assembled system.
     * @param self Handle of this element inside the graph.
     * @param x Solution vector of `system`.
     * @param voltages Node voltages indexed by node handle.
     * @return Signed branch current in amps.
     */
    virtual double current(const MnaSystem& system, BranchHandle self,
                           const Eigen::VectorXd& x,
                           const std::vector<double>& voltages) const = 0;

    /**
     * @brief Create a concrete element of the requested kind.
     * @return Shared pointer owning a `Resistor`, `VoltageSource` or
     * `CurrentSource`.
     */
    static std::shared_ptr<CircuitElement> create(ElementType type,
                                                  const std::string& name,
                                                  NodeHandle nodeA,
                                                  NodeHandle nodeB,
                                                  double value);

    std::string getName() const { return name; }

    NodeHandle getNodeA() const { return nodeA; }
    NodeHandle getNodeB() const { return nodeB; }

    double getValue() const { return value; }

    ElementType getType() const { return type; }

    /**
     * @brief Gets the group classification
     * @return Group enum value
     */
    Group getGroup() const { return group; }
};

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
 * @file CircuitGraph.cpp
 * @brief Arena storage, id lookup and mutators of the circuit graph.
 */

#include "CircuitGraph.hpp"

#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

NodeHandle CircuitGraph::addNode(const std::string &id)
{
    if (nodeIds.find(id) != nodeIds.end()) throw DuplicateIdError(id);

    NodeHandle handle = nodeSlots.size();
    Node node;
    node.name = id;
    nodeSlots.push_back(node);
    nodeIds[id] = handle;
    return handle;
}

NodeHandle CircuitGraph::addNode()
{
    int next = 0;
    while (nodeIds.find(std::to_string(next)) != nodeIds.end()) ++next;
    return addNode(std::to_string(next));
}

std::vector<std::string> CircuitGraph::removeNode(const std::string &id)
{
    NodeHandle handle = requireNode(id);

    // Cascade: every branch touching the node goes with it.
    std::vector<std::string> removedBranches;
    for (auto &slot : branchSlots) {
        if (!slot) continue;
        if (slot->getNodeA() == handle || slot->getNodeB() == handle) {
            removedBranches.push_back(slot->getName());
            branchIds.erase(slot->getName());
            slot.reset();
        }
    }

    nodeSlots[handle].removed = true;
    nodeIds.erase(id);
    return removedBranches;
}

BranchHandle CircuitGraph::addBranch(const std::string &id,
                                     const std::string &from,
                                     const std::string &to, ElementType type,
                                     double value)
{
    if (branchIds.find(id) != branchIds.end()) throw DuplicateIdError(id);
    NodeHandle nodeA = requireNode(from);
    NodeHandle nodeB = requireNode(to);

    BranchHandle handle = branchSlots.size();
    branchSlots.push_back(
        CircuitElement::create(type, id, nodeA, nodeB, value));
    branchIds[id] = handle;
    return handle;
}

void CircuitGraph::removeBranch(const std::string &id)
{
    auto it = branchIds.find(id);
    if (it == branchIds.end()) throw DanglingReferenceError(id);
    branchSlots[it->second].reset();
    branchIds.erase(it);
}

void CircuitGraph::updateBranch(const std::string &id,
                                const BranchPatch &patch)
{
    auto it = branchIds.find(id);
    if (it == branchIds.end()) throw DanglingReferenceError(id);
    std::shared_ptr<CircuitElement> &slot = branchSlots[it->second];

    // Resolve everything before touching the slot so a failed update
    // leaves the branch unchanged.
    NodeHandle nodeA = patch.from ? requireNode(*patch.from) : slot->getNodeA();
    NodeHandle nodeB = patch.to ? requireNode(*patch.to) : slot->getNodeB();
    double value = patch.value ? *patch.value : slot->getValue();
    ElementType type = patch.type ? *patch.type : slot->getType();

    // Elements are never mutated: copies of the graph share them.
    slot = CircuitElement::create(type, id, nodeA, nodeB, value);
}

std::vector<NodeHandle> CircuitGraph::nodes() const
{
    std::vector<NodeHandle> live;
    live.reserve(nodeIds.size());
    for (NodeHandle h = 0; h < nodeSlots.size(); ++h) {
        if (!nodeSlots[h].removed) live.push_back(h);
    }
    return live;
}

std::vector<BranchHandle> CircuitGraph::branches() const
{
    std::vector<BranchHandle> live;
    live.reserve(branchIds.size());
    for (BranchHandle h = 0; h < branchSlots.size(); ++h) {
        if (branchSlots[h]) live.push_back(h);
    }
    return live;
}

NodeHandle CircuitGraph::findNode(const std::string &id) const
{
    auto it = nodeIds.find(id);
    return it == nodeIds.end() ? INVALID_HANDLE : it->second;
}

BranchHandle CircuitGraph::findBranch(const std::string &id) const
{
    auto it = branchIds.find(id);
    return it == branchIds.end() ? INVALID_HANDLE : it->second;
}

const std::string &CircuitGraph::nodeName(NodeHandle handle) const
{
    if (handle >= nodeSlots.size() || nodeSlots[handle].removed)
        throw std::out_of_range("invalid node handle");
    return nodeSlots[handle].name;
}

const CircuitElement &CircuitGraph::branch(BranchHandle handle) const
{
    if (handle >= branchSlots.size() || !branchSlots[handle])
        throw std::out_of_range("invalid branch handle");
    return *branchSlots[handle];
}

NodeHandle CircuitGraph::referenceNode() const
{
    NodeHandle first = INVALID_HANDLE;
    for (NodeHandle h = 0; h < nodeSlots.size(); ++h) {
        if (nodeSlots[h].removed) continue;
        if (first == INVALID_HANDLE) first = h;

        std::string upper = nodeSlots[h].name;
        for (auto &c : upper) c = (char)std::toupper((unsigned char)c);
        if (upper == "0" || upper == "GND") return h;
    }
    return first;
}

void CircuitGraph::clear()
{
    nodeSlots.clear();
    branchSlots.clear();
    nodeIds.clear();
    branchIds.clear();
}

NodeHandle CircuitGraph::requireNode(const std::string &id) const
{
    auto it = nodeIds.find(id);
    if (it == nodeIds.end()) throw DanglingReferenceError(id);
    return it->second;
}

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
 * @file CircuitGraph.hpp
 * @brief In-memory circuit topology: nodes and branches in a handle arena.
 *
 * `CircuitGraph` owns every node and branch of a circuit. Entities live in
 * flat vectors and are referred to by integer handles; the string ids used by
 * netlists and callers are translated to handles only at this boundary,
 * through two hash maps.
 *
 * Removing an entity tombstones its slot. Handles are never reused, so a
 * handle obtained earlier stays valid (and keeps naming the same entity) for
 * as long as that entity exists. `nodes()` and `branches()` return the live
 * handles in insertion order.
 *
 * Mutators validate their arguments and throw `DuplicateIdError` or
 * `DanglingReferenceError` instead of dropping data. Element values are not
 * validated here; the MNA builder reports unusable values as warnings.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "CircuitElement.hpp"
#include "CircuitErrors.hpp"
#include "Node.hpp"

/**
 * @struct BranchPatch
 * @brief Partial update applied by `CircuitGraph::updateBranch`.
 *
 * Unset fields keep their current value.
 */
struct BranchPatch
{
    std::optional<std::string> from;  /**< New starting node id */
    std::optional<std::string> to;    /**< New ending node id */
    std::optional<ElementType> type;  /**< New element kind */
    std::optional<double> value;      /**< New element value */
};

/**
 * @class CircuitGraph
 * @brief Arena-of-indices representation of a circuit.
 */
class CircuitGraph
{
   public:
    /**
     * @brief Add a node with the given id.
     * @throws DuplicateIdError if a node with this id exists.
     * @return Handle of the new node.
     */
    NodeHandle addNode(const std::string &id);

    /**
     * @brief Add a node named after the smallest unused non-negative integer.
     *
     * With nodes "0", "1" and "3" present the new node is named "2".
     * @return Handle of the new node.
     */
    NodeHandle addNode();

    /**
     * @brief Remove a node and, as a side effect, every incident branch.
     *
     * Callers holding branch handles must expect the branches returned here
     * to be gone after the call.
     *
     * @throws DanglingReferenceError if the node does not exist.
     * @return Ids of the branches removed together with the node, in
     * insertion order.
     */
    std::vector<std::string> removeNode(const std::string &id);

    /**
     * @brief Add a branch from `from` to `to`.
     * @throws DuplicateIdError if a branch with this id exists.
     * @throws DanglingReferenceError if either endpoint is unknown.
     * @return Handle of the new branch.
     */
    BranchHandle addBranch(const std::string &id, const std::string &from,
                           const std::string &to, ElementType type,
                           double value);

    /**
     * @brief Remove a branch.
     * @throws DanglingReferenceError if the branch does not exist.
     */
    void removeBranch(const std::string &id);

    /**
     * @brief Apply a partial update to an existing branch.
     *
     * The slot receives a new element object, so copies of the graph taken
     * earlier keep the old branch. The branch keeps its handle and its
     * position in `branches()`.
     *
     * @throws DanglingReferenceError if the branch or a new endpoint is
     * unknown.
     */
    void updateBranch(const std::string &id, const BranchPatch &patch);

    /** @brief Live node handles in insertion order. */
    std::vector<NodeHandle> nodes() const;

    /** @brief Live branch handles in insertion order. */
    std::vector<BranchHandle> branches() const;

    /** @brief Handle of the node with this id, or INVALID_HANDLE. */
    NodeHandle findNode(const std::string &id) const;

    /** @brief Handle of the branch with this id, or INVALID_HANDLE. */
    BranchHandle findBranch(const std::string &id) const;

    /** @brief Name of a live node. */
    const std::string &nodeName(NodeHandle handle) const;

    /** @brief Element stored at a live branch handle. */
    const CircuitElement &branch(BranchHandle handle) const;

    /**
     * @brief Resolve the 0 V reference node.
     *
     * The first node (in insertion order) named "0" or "GND" (any case) is
     * the reference; without one, the first node is used.
     *
     * @return Reference handle, or INVALID_HANDLE when the graph has no
     * nodes.
     */
    NodeHandle referenceNode() const;

    /**
     * @brief Number of node slots, removed ones included.
     *
     * Arrays indexed by `NodeHandle` must be sized with this value.
     */
    std::size_t nodeSlotCount() const { return nodeSlots.size(); }

    /** @brief Number of branch slots, removed ones included. */
    std::size_t branchSlotCount() const { return branchSlots.size(); }

    /** @brief Number of live nodes. */
    std::size_t nodeCount() const { return nodeIds.size(); }

    /** @brief Number of live branches. */
    std::size_t branchCount() const { return branchIds.size(); }

    /** @brief True when the graph holds no node. */
    bool empty() const { return nodeIds.empty(); }

    /** @brief Remove every node and branch and reset the arena. */
    void clear();

   private:
    NodeHandle requireNode(const std::string &id) const;

    std::vector<Node> nodeSlots;
    std::vector<std::shared_ptr<CircuitElement>> branchSlots;

    std::unordered_map<std::string, NodeHandle> nodeIds;
    std::unordered_map<std::string, BranchHandle> branchIds;
};

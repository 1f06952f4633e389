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
 * @file Edge.hpp
 * @brief Adjacency entry of the undirected circuit graph.
 *
 * The cycle basis finder turns the branch list into an undirected adjacency
 * list. Each branch contributes two `Edge` entries, one stored at each
 * endpoint, both naming the branch that realises the connection.
 */

#pragma once

#include "Node.hpp"

/**
 * @class Edge
 * @brief Connection from the owning node to `target` through `branch`.
 */
class Edge
{
   public:
    /** @brief Node reached by following this edge. */
    NodeHandle target = INVALID_HANDLE;

    /** @brief Branch realising the connection. */
    BranchHandle branch = INVALID_HANDLE;
};

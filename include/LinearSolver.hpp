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
 * @file LinearSolver.hpp
 * @brief Dense Gaussian elimination with partial pivoting.
 *
 * This is the single linear-solve primitive of the project. The MNA solve
 * and the normal equations of the mesh decomposition both go through it.
 */

#pragma once

#include <Eigen/Dense>

/**
 * @brief Default absolute pivot threshold below which a matrix is singular.
 */
constexpr double PIVOT_TOLERANCE = 1e-12;

/**
 * @brief Solve `A x = b` by Gaussian elimination with partial pivoting.
 *
 * For each column `k` the row `r >= k` with the largest `|A(r,k)|` is chosen
 * as pivot. If that magnitude is below `pivotTolerance` the system has no
 * unique solution. The routine has exactly two outcomes: a fully computed,
 * finite solution vector, or an exception. It never returns a partially
 * computed vector.
 *
 * @param A Square coefficient matrix (copied; the argument is not modified).
 * @param b Right-hand side, same length as `A`.
 * @param pivotTolerance Absolute pivot threshold.
 * @return Solution vector `x`. An empty system yields an empty vector.
 * @throws SingularMatrixError if a pivot is too small or any value becomes
 *         non-finite (including non-finite input).
 * @throws std::invalid_argument if `A` is not square or `b` has the wrong
 *         length.
 */
Eigen::VectorXd solveLinearSystem(const Eigen::MatrixXd &A,
                                  const Eigen::VectorXd &b,
                                  double pivotTolerance = PIVOT_TOLERANCE);

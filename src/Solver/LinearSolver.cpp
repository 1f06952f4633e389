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
 * @file LinearSolver.cpp
 * @brief Gaussian elimination with partial pivoting on an augmented matrix.
 *
 * The elimination works on a private copy `[A | b]`. Every failure path
 * throws before anything is returned, so callers either get a complete
 * finite vector or a `SingularMatrixError`.
 */

#include "LinearSolver.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

#include "CircuitErrors.hpp"

Eigen::VectorXd solveLinearSystem(const Eigen::MatrixXd &A,
                                  const Eigen::VectorXd &b,
                                  double pivotTolerance)
{
    if (A.rows() != A.cols())
        throw std::invalid_argument("solveLinearSystem: matrix must be square");
    if (b.size() != A.rows())
        throw std::invalid_argument(
            "solveLinearSystem: right-hand side length does not match matrix");

    const Eigen::Index n = A.rows();
    if (n == 0) return Eigen::VectorXd(0);

    if (!A.allFinite() || !b.allFinite())
        throw SingularMatrixError("system contains non-finite values");

    // Augmented matrix [A | b]
    Eigen::MatrixXd M(n, n + 1);
    M.leftCols(n) = A;
    M.col(n) = b;

    for (Eigen::Index k = 0; k < n; ++k) {
        // Partial pivot: largest magnitude in column k at or below row k
        Eigen::Index pivotRow = k;
        double pivot = std::abs(M(k, k));
        for (Eigen::Index r = k + 1; r < n; ++r) {
            double candidate = std::abs(M(r, k));
            if (candidate > pivot) {
                pivot = candidate;
                pivotRow = r;
            }
        }
        if (pivot < pivotTolerance) {
            throw SingularMatrixError("matrix is singular: no pivot above " +
                                      std::to_string(pivotTolerance) +
                                      " in column " + std::to_string(k));
        }
        if (pivotRow != k) M.row(k).swap(M.row(pivotRow));

        // Eliminate below the pivot
        for (Eigen::Index i = k + 1; i < n; ++i) {
            double factor = M(i, k) / M(k, k);
            M(i, k) = 0.0;
            for (Eigen::Index j = k + 1; j <= n; ++j) {
                M(i, j) -= factor * M(k, j);
            }
        }

        if (!M.bottomRows(n - k).allFinite())
            throw SingularMatrixError(
                "non-finite value during elimination of column " +
                std::to_string(k));
    }

    // Back substitution
    Eigen::VectorXd x(n);
    for (Eigen::Index i = n - 1; i >= 0; --i) {
        double sum = M(i, n);
        for (Eigen::Index j = i + 1; j < n; ++j) sum -= M(i, j) * x(j);
        x(i) = sum / M(i, i);
        if (!std::isfinite(x(i)))
            throw SingularMatrixError(
                "non-finite value during back substitution of row " +
                std::to_string(i));
    }
    return x;
}

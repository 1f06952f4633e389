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
#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>

#include "CircuitErrors.hpp"
#include "LinearSolver.hpp"

/*
 * linear_solver_test.cpp
 *
 * Tests for solveLinearSystem(...): Gaussian elimination with partial
 * pivoting and its singularity checks.
 */

TEST(LinearSolver, SolvesDenseSystem)
{
    Eigen::MatrixXd A(3, 3);
    A << 2, 1, -1,
        -3, -1, 2,
        -2, 1, 2;
    Eigen::VectorXd b(3);
    b << 8, -11, -3;

    Eigen::VectorXd x = solveLinearSystem(A, b);

    ASSERT_EQ(x.size(), 3);
    EXPECT_NEAR(x(0), 2.0, 1e-12);
    EXPECT_NEAR(x(1), 3.0, 1e-12);
    EXPECT_NEAR(x(2), -1.0, 1e-12);
}

TEST(LinearSolver, PivotsPastZeroDiagonal)
{
    // Typical MNA shape: zero block on the diagonal of the source row
    Eigen::MatrixXd A(2, 2);
    A << 0, 1,
         1, 0;
    Eigen::VectorXd b(2);
    b << 4, 7;

    Eigen::VectorXd x = solveLinearSystem(A, b);
    EXPECT_DOUBLE_EQ(x(0), 7.0);
    EXPECT_DOUBLE_EQ(x(1), 4.0);
}

TEST(LinearSolver, InputsAreNotModified)
{
    Eigen::MatrixXd A(2, 2);
    A << 0, 2,
         3, 1;
    Eigen::VectorXd b(2);
    b << 2, 4;
    Eigen::MatrixXd A0 = A;
    Eigen::VectorXd b0 = b;

    solveLinearSystem(A, b);
    EXPECT_TRUE(A == A0);
    EXPECT_TRUE(b == b0);
}

TEST(LinearSolver, SingularMatrixThrows)
{
    Eigen::MatrixXd A(2, 2);
    A << 1, 2,
         2, 4;
    Eigen::VectorXd b(2);
    b << 1, 3;

    EXPECT_THROW(solveLinearSystem(A, b), SingularMatrixError);
}

TEST(LinearSolver, ZeroMatrixThrows)
{
    Eigen::MatrixXd A = Eigen::MatrixXd::Zero(3, 3);
    Eigen::VectorXd b = Eigen::VectorXd::Ones(3);
    EXPECT_THROW(solveLinearSystem(A, b), SingularMatrixError);
}

TEST(LinearSolver, ToleranceIsConfigurable)
{
    Eigen::MatrixXd A(1, 1);
    A << 1e-13;
    Eigen::VectorXd b(1);
    b << 1e-13;

    EXPECT_THROW(solveLinearSystem(A, b), SingularMatrixError);

    Eigen::VectorXd x = solveLinearSystem(A, b, 1e-15);
    EXPECT_DOUBLE_EQ(x(0), 1.0);
}

TEST(LinearSolver, NonFiniteInputThrows)
{
    Eigen::MatrixXd A = Eigen::MatrixXd::Identity(2, 2);
    Eigen::VectorXd b(2);
    b << 1, std::numeric_limits<double>::quiet_NaN();

    EXPECT_THROW(solveLinearSystem(A, b), SingularMatrixError);
}

TEST(LinearSolver, EmptySystem)
{
    Eigen::VectorXd x = solveLinearSystem(Eigen::MatrixXd(0, 0),
                                          Eigen::VectorXd(0));
    EXPECT_EQ(x.size(), 0);
}

TEST(LinearSolver, ShapeMismatchRejected)
{
    EXPECT_THROW(solveLinearSystem(Eigen::MatrixXd::Identity(2, 3),
                                   Eigen::VectorXd::Zero(2)),
                 std::invalid_argument);
    EXPECT_THROW(solveLinearSystem(Eigen::MatrixXd::Identity(2, 2),
                                   Eigen::VectorXd::Zero(3)),
                 std::invalid_argument);
}

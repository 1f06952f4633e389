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

#include "MnaBuilder.hpp"
#include "VoltageSource.hpp"

#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

/*
 * voltage_test.cpp
 *
 * Unit tests for the independent voltage source:
 *  - value validation (zero allowed, non-finite rejected)
 *  - B / B^T stamping and RHS entry for a source to the reference
 *  - stamping between two non-reference nodes
 *  - negative source values
 *  - branch current read back from the auxiliary unknown
 */

TEST(VoltageValidate, ZeroValueIsValid)
{
  VoltageSource v("V0", 0, 1, 0.0);
  std::string reason;
  EXPECT_TRUE(v.validate(reason));
  EXPECT_EQ(v.getGroup(), Group::G2);
}

TEST(VoltageValidate, NaNRejected)
{
  VoltageSource v("VX", 0, 1, std::numeric_limits<double>::quiet_NaN());
  std::string reason;
  EXPECT_FALSE(v.validate(reason));
  EXPECT_FALSE(reason.empty());
}

TEST(VoltageStamp, ToReference)
{
  VoltageSource v("V1", 0, 1, 5.0);
  MnaSystem system;
  system.nodeIndex = {0, -1};
  system.auxIndex[3] = 1;  // branch handle 3 owns row 1
  system.A = Eigen::MatrixXd::Zero(2, 2);
  system.b = Eigen::VectorXd::Zero(2);

  v.stamp(system, 3);

  EXPECT_DOUBLE_EQ(system.A(0, 1), 1.0);
  EXPECT_DOUBLE_EQ(system.A(1, 0), 1.0);
  EXPECT_DOUBLE_EQ(system.A(1, 1), 0.0);
  EXPECT_DOUBLE_EQ(system.b(1), 5.0);
  EXPECT_DOUBLE_EQ(system.b(0), 0.0);
}

TEST(VoltageStamp, BetweenNodesNegativeValue)
{
  VoltageSource v("V2", 0, 1, -2.5);
  MnaSystem system;
  system.nodeIndex = {0, 1};
  system.auxIndex[0] = 2;
  system.A = Eigen::MatrixXd::Zero(3, 3);
  system.b = Eigen::VectorXd::Zero(3);

  v.stamp(system, 0);

  EXPECT_DOUBLE_EQ(system.A(0, 2), 1.0);
  EXPECT_DOUBLE_EQ(system.A(1, 2), -1.0);
  EXPECT_DOUBLE_EQ(system.A(2, 0), 1.0);
  EXPECT_DOUBLE_EQ(system.A(2, 1), -1.0);
  EXPECT_DOUBLE_EQ(system.b(2), -2.5);
}

TEST(VoltageStamp, MissingAuxiliaryRowThrows)
{
  VoltageSource v("V1", 0, 1, 1.0);
  MnaSystem system;
  system.nodeIndex = {0, -1};
  system.A = Eigen::MatrixXd::Zero(1, 1);
  system.b = Eigen::VectorXd::Zero(1);

  EXPECT_THROW(v.stamp(system, 0), std::logic_error);
}

TEST(VoltageCurrent, ReadsAuxiliaryUnknown)
{
  VoltageSource v("V1", 0, 1, 1.0);
  MnaSystem system;
  system.nodeIndex = {0, -1};
  system.auxIndex[0] = 1;
  Eigen::VectorXd x(2);
  x << 1.0, -0.25;

  EXPECT_DOUBLE_EQ(v.current(system, 0, x, {1.0, 0.0}), -0.25);
}

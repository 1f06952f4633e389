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

#include "Parser.hpp"

#include <string>
#include <vector>

// Tests for Parser::validateTokens: every element line of a netlist carries
// exactly four tokens (name, from, to, value). A mismatch is reported on
// stderr with the line number and the counts; a match prints nothing.

TEST(ValidateTokens, ElementLineAccepted) {
  Parser parser;
  std::vector<std::string> tokens = {"R1", "1", "0", "1K"};
  testing::internal::CaptureStderr();
  bool ok = parser.validateTokens(tokens, 4, 3);
  std::string err = testing::internal::GetCapturedStderr();

  EXPECT_TRUE(ok);
  EXPECT_TRUE(err.empty());
}

TEST(ValidateTokens, MissingValueReported) {
  Parser parser;
  std::vector<std::string> tokens = {"V1", "1", "0"};
  testing::internal::CaptureStderr();
  bool ok = parser.validateTokens(tokens, 4, 12);
  std::string err = testing::internal::GetCapturedStderr();

  EXPECT_FALSE(ok);
  EXPECT_NE(err.find("Line 12:"), std::string::npos);
  EXPECT_NE(err.find("Expected 4 tokens, got 3"), std::string::npos);
}

TEST(ValidateTokens, TrailingTokenReported) {
  Parser parser;
  std::vector<std::string> tokens = {"I1", "0", "1", "2M", "EXTRA"};
  testing::internal::CaptureStderr();
  bool ok = parser.validateTokens(tokens, 4, 5);
  std::string err = testing::internal::GetCapturedStderr();

  EXPECT_FALSE(ok);
  EXPECT_NE(err.find("Expected 4 tokens, got 5"), std::string::npos);
}

TEST(ValidateTokens, InputLeftUntouched) {
  Parser parser;
  std::vector<std::string> tokens = {"R9", "A", "B"};
  std::vector<std::string> before = tokens;

  testing::internal::CaptureStderr();
  parser.validateTokens(tokens, 4, 1);
  testing::internal::GetCapturedStderr();

  EXPECT_EQ(tokens, before);
}

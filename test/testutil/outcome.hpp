/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gtest/gtest.h>

#include "common/outcome.hpp"

// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _EXPECT_OUTCOME_TRUE(var, val, expr)                         \
  auto &&var = expr;                                                 \
  ASSERT_TRUE(var.has_value()) << "Line " << __LINE__ << ": "        \
                               << var.error().message();             \
  auto &&val = var.value();

/**
 * Declares val bound to value of successful result, fails test otherwise
 */
#define EXPECT_OUTCOME_TRUE(val, expr) \
  _EXPECT_OUTCOME_TRUE(BOOST_OUTCOME_TRY_UNIQUE_NAME, val, expr)

#define EXPECT_OUTCOME_TRUE_1(expr)                                    \
  {                                                                    \
    auto &&_result = expr;                                             \
    EXPECT_TRUE(_result.has_value()) << "Line " << __LINE__ << ": "    \
                                     << _result.error().message();     \
  }

#define EXPECT_OUTCOME_EQ(expr, expected)                              \
  {                                                                    \
    auto &&_result = expr;                                             \
    if (_result.has_value()) {                                         \
      EXPECT_EQ(_result.value(), expected);                            \
    } else {                                                           \
      ADD_FAILURE() << "Line " << __LINE__ << ": "                     \
                    << _result.error().message();                      \
    }                                                                  \
  }

#define EXPECT_OUTCOME_ERROR(_error, expr)                             \
  {                                                                    \
    auto &&_result = expr;                                             \
    if (_result.has_error()) {                                         \
      EXPECT_EQ(_result.error(), std::error_code{_error})              \
          << _result.error().message();                                \
    } else {                                                           \
      ADD_FAILURE() << "Line " << __LINE__ << ": expected error";      \
    }                                                                  \
  }

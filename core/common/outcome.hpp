/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <system_error>

#include <boost/outcome/std_result.hpp>
#include <boost/outcome/try.hpp>

#include "common/outcome_register.hpp"

#define OUTCOME_TRY BOOST_OUTCOME_TRY

// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _OUTCOME_TRYA(var, val, ...) \
  OUTCOME_TRY(var, __VA_ARGS__);     \
  val = std::move(var);
/**
 * OUTCOME_TRYA(val, expr) assigns value of expr to existing val or returns
 * error
 */
#define OUTCOME_TRYA(val, ...) \
  _OUTCOME_TRYA(BOOST_OUTCOME_TRY_UNIQUE_NAME, val, __VA_ARGS__)

namespace tc::outcome {
  using BOOST_OUTCOME_V2_NAMESPACE::failure;
  using BOOST_OUTCOME_V2_NAMESPACE::success;

  template <typename T>
  using result = BOOST_OUTCOME_V2_NAMESPACE::std_result<T>;
}  // namespace tc::outcome

/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

using tc::Bytes;
using tc::common::hex_lower;
using tc::common::hex_upper;
using tc::common::unhex;
using tc::common::UnhexError;

/**
 * @given Bytes
 * @when Convert to hex
 * @then Upper and lower case hex as expected
 */
TEST(Hexutil, Hex) {
  Bytes bytes{0x00, 0x1f, 0xca, 0xfe};
  EXPECT_EQ(hex_upper(bytes), "001FCAFE");
  EXPECT_EQ(hex_lower(bytes), "001fcafe");
  EXPECT_EQ(hex_lower(Bytes{}), "");
}

/**
 * @given Hex string of any case
 * @when Unhex
 * @then Bytes as expected
 */
TEST(Hexutil, Unhex) {
  EXPECT_OUTCOME_EQ(unhex("001FcaFE"), (Bytes{0x00, 0x1f, 0xca, 0xfe}));
  EXPECT_OUTCOME_EQ(unhex(""), Bytes{});
}

/**
 * @given Odd length or non-hex string
 * @when Unhex
 * @then Error
 */
TEST(Hexutil, UnhexErrors) {
  EXPECT_OUTCOME_ERROR(UnhexError::kNotEnoughInput, unhex("abc"));
  EXPECT_OUTCOME_ERROR(UnhexError::kNonHexInput, unhex("zz"));
}

/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TAGCBOR_TEST_TESTUTIL_LITERALS_HPP
#define TAGCBOR_TEST_TESTUTIL_LITERALS_HPP

#include "common/hexutil.hpp"

inline std::vector<uint8_t> operator""_unhex(const char *c, size_t s) {
  return tc::common::unhex(std::string_view(c, s)).value();
}

#endif  // TAGCBOR_TEST_TESTUTIL_LITERALS_HPP

/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <iterator>

#include <boost/algorithm/hex.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(tc::common, UnhexError, e) {
  using tc::common::UnhexError;
  switch (e) {
    case UnhexError::kNotEnoughInput:
      return "Input contains odd number of characters";
    case UnhexError::kNonHexInput:
      return "Input contains non-hex characters";
    default:
      return "Unknown error";
  }
}

namespace tc::common {
  std::string hex_upper(BytesIn bytes) {
    std::string res;
    res.reserve(bytes.size() * 2);
    boost::algorithm::hex(bytes.begin(), bytes.end(), std::back_inserter(res));
    return res;
  }

  std::string hex_lower(BytesIn bytes) {
    std::string res;
    res.reserve(bytes.size() * 2);
    boost::algorithm::hex_lower(
        bytes.begin(), bytes.end(), std::back_inserter(res));
    return res;
  }

  outcome::result<Bytes> unhex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
      return UnhexError::kNotEnoughInput;
    }
    Bytes bytes;
    bytes.reserve(hex.size() / 2);
    try {
      boost::algorithm::unhex(hex.begin(), hex.end(), std::back_inserter(bytes));
    } catch (const boost::algorithm::hex_decode_error &) {
      return UnhexError::kNonHexInput;
    }
    return bytes;
  }
}  // namespace tc::common

/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace tc::common {
  enum class UnhexError { kNotEnoughInput = 1, kNonHexInput };

  /**
   * @brief Converts bytes to uppercase hex representation
   * @param bytes bytes to convert
   * @return hex string
   */
  std::string hex_upper(BytesIn bytes);

  /**
   * @brief Converts bytes to lowercase hex representation
   * @param bytes bytes to convert
   * @return hex string
   */
  std::string hex_lower(BytesIn bytes);

  /**
   * @brief Converts hex representation (any case) to bytes
   * @param hex string of even length
   * @return bytes or UnhexError
   */
  outcome::result<Bytes> unhex(std::string_view hex);
}  // namespace tc::common

OUTCOME_HPP_DECLARE_ERROR(tc::common, UnhexError);

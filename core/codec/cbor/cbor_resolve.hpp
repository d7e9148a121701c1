/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include "codec/cbor/cbor_value.hpp"

namespace tc::codec::cbor {
  enum class CborResolveError {
    kIntKeyExpected = 1,
    kKeyNotFound,
    kContainerExpected,
    kIntKeyTooBig
  };

  using Path = gsl::span<const std::string>;

  outcome::result<uint64_t> parseIndex(const std::string &str);

  /**
   * Resolves one path part in CBOR value.
   * Part is index for array, key for map. Tags are looked through.
   * Map with integer keys is tried with parsed part if text key is missing.
   */
  outcome::result<const Value *> resolve(const Value &value,
                                         const std::string &part);

  /** Resolves path in CBOR value to CBOR subvalue */
  outcome::result<const Value *> resolve(const Value &value, Path path);
}  // namespace tc::codec::cbor

OUTCOME_HPP_DECLARE_ERROR(tc::codec::cbor, CborResolveError);

/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace tc::codec::cbor {
  enum class CborEncodeError { kUnrepresentable = 1, kExpectedMapValueSingle };

  enum class CborDecodeError {
    kUnexpectedEof = 1,
    kInvalidUtf8,
    kInvalidCbor,
    kInvalidChunk,
    kWrongType,
    kWrongSize,
    kIntOverflow,
    kKeyNotFound,
    kUnknownVariant,
    kWrongTag,
    kTrailingData,
    kEmptyInput,
    kDepthLimit,
  };
}  // namespace tc::codec::cbor

OUTCOME_HPP_DECLARE_ERROR(tc::codec::cbor, CborEncodeError);
OUTCOME_HPP_DECLARE_ERROR(tc::codec::cbor, CborDecodeError);

/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_errors.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(tc::codec::cbor, CborEncodeError, e) {
  using tc::codec::cbor::CborEncodeError;
  switch (e) {
    case CborEncodeError::kUnrepresentable:
      return "Value has no CBOR representation";
    case CborEncodeError::kExpectedMapValueSingle:
      return "Expected map value single";
    default:
      return "Unknown error";
  }
}

OUTCOME_CPP_DEFINE_CATEGORY(tc::codec::cbor, CborDecodeError, e) {
  using tc::codec::cbor::CborDecodeError;
  switch (e) {
    case CborDecodeError::kUnexpectedEof:
      return "Unexpected end of input";
    case CborDecodeError::kInvalidUtf8:
      return "Text string is not valid UTF-8";
    case CborDecodeError::kInvalidCbor:
      return "Invalid CBOR";
    case CborDecodeError::kInvalidChunk:
      return "Invalid chunk of indefinite length string";
    case CborDecodeError::kWrongType:
      return "Wrong type";
    case CborDecodeError::kWrongSize:
      return "Wrong size";
    case CborDecodeError::kIntOverflow:
      return "Int overflow";
    case CborDecodeError::kKeyNotFound:
      return "Key not found";
    case CborDecodeError::kUnknownVariant:
      return "Unknown variant";
    case CborDecodeError::kWrongTag:
      return "Wrong tag";
    case CborDecodeError::kTrailingData:
      return "Trailing data after item";
    case CborDecodeError::kEmptyInput:
      return "Empty input";
    case CborDecodeError::kDepthLimit:
      return "Nesting depth limit exceeded";
    default:
      return "Unknown error";
  }
}

/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_visitor.hpp"

#include "codec/cbor/cbor_decoder.hpp"
#include "codec/cbor/cbor_errors.hpp"

namespace tc::codec::cbor {
  CborSeqAccess::CborSeqAccess(CborDecoder &decoder,
                               boost::optional<uint64_t> count)
      : decoder_{decoder}, count_{count} {}

  boost::optional<uint64_t> CborSeqAccess::count() const {
    return count_;
  }

  outcome::result<bool> CborSeqAccess::next() {
    if (end_) {
      return false;
    }
    if (count_) {
      if (consumed_ == *count_) {
        end_ = true;
        return false;
      }
      ++consumed_;
      return true;
    }
    OUTCOME_TRY(is_break, decoder_.isBreak());
    if (is_break) {
      OUTCOME_TRY(decoder_.readBreak());
      end_ = true;
      return false;
    }
    ++consumed_;
    return true;
  }

  bool CborSeqAccess::done() const {
    return end_ || (count_ && consumed_ == *count_);
  }

  CborDecoder &CborSeqAccess::decoder() const {
    return decoder_;
  }

  outcome::result<void> CborVisitor::visitNull() {
    return CborDecodeError::kWrongType;
  }

  outcome::result<void> CborVisitor::visitBool(bool) {
    return CborDecodeError::kWrongType;
  }

  outcome::result<void> CborVisitor::visitUint(uint64_t) {
    return CborDecodeError::kWrongType;
  }

  outcome::result<void> CborVisitor::visitInt(int64_t) {
    return CborDecodeError::kWrongType;
  }

  outcome::result<void> CborVisitor::visitFloat(double) {
    return CborDecodeError::kWrongType;
  }

  outcome::result<void> CborVisitor::visitBytes(Bytes) {
    return CborDecodeError::kWrongType;
  }

  outcome::result<void> CborVisitor::visitStr(std::string) {
    return CborDecodeError::kWrongType;
  }

  outcome::result<void> CborVisitor::visitList(CborSeqAccess &) {
    return CborDecodeError::kWrongType;
  }

  outcome::result<void> CborVisitor::visitMap(CborSeqAccess &) {
    return CborDecodeError::kWrongType;
  }

  outcome::result<void> CborVisitor::visitTag(uint64_t, CborDecoder &decoder) {
    return decoder.decodeAny(*this);
  }
}  // namespace tc::codec::cbor

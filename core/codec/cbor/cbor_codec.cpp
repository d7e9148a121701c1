/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_codec.hpp"

#include "common/logger.hpp"

namespace tc::codec::cbor {
  namespace {
    auto log() {
      static common::Logger logger{common::createLogger("cbor")};
      return logger;
    }
  }  // namespace

  outcome::result<void> expectInput(BytesIn input) {
    if (input.empty()) {
      log()->debug("rejected empty input");
      return CborDecodeError::kEmptyInput;
    }
    return outcome::success();
  }

  outcome::result<void> expectEnd(CborDecoder &decoder) {
    OUTCOME_TRY(end, decoder.atEnd());
    if (!end) {
      log()->debug("rejected trailing data after top-level item");
      return CborDecodeError::kTrailingData;
    }
    return outcome::success();
  }
}  // namespace tc::codec::cbor

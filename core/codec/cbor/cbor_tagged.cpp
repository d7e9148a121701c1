/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_tagged.hpp"

namespace tc::codec::cbor {
  namespace {
    outcome::result<CborTagRecord> readTagRecord(CborDecoder &decoder) {
      CborTagRecord record;
      bool has_tag{false};
      bool has_value{false};
      auto read_entries{[&](CborSeqAccess &map) -> outcome::result<void> {
        while (true) {
          OUTCOME_TRY(more, map.next());
          if (!more) {
            return outcome::success();
          }
          std::string key;
          OUTCOME_TRY(decoder.decode(key));
          if (key == "tag") {
            if (has_tag) {
              return CborDecodeError::kWrongType;
            }
            has_tag = true;
            OUTCOME_TRY(decoder.decode(record.tag));
          } else if (key == "value") {
            if (has_value) {
              return CborDecodeError::kWrongType;
            }
            has_value = true;
            OUTCOME_TRYA(record.value, decoder.readItem());
          } else {
            OUTCOME_TRY(decoder.skip());
          }
        }
      }};
      OUTCOME_TRY(decoder.readMap(read_entries));
      if (!has_value) {
        return CborDecodeError::kKeyNotFound;
      }
      return record;
    }
  }  // namespace

  boost::optional<CborTagRecord> asTagRecord(BytesIn item,
                                             const CborDecoderConfig &config) {
    BytesSource source{item};
    CborDecoder decoder{source, config};
    auto record{readTagRecord(decoder)};
    if (!record) {
      return boost::none;
    }
    return std::move(record.value());
  }
}  // namespace tc::codec::cbor

/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_encode_buffer.hpp"

#include <algorithm>

#include "common/span.hpp"

namespace tc::codec::cbor {
  CborEncodeBuffer::CborEncodeBuffer(Kind kind, CborEncoderConfig config)
      : kind_{kind}, config_{config} {}

  CborEncodeBuffer CborEncodeBuffer::sequence(CborEncoderConfig config) {
    return {Kind::kSequence, config};
  }

  CborEncodeBuffer CborEncodeBuffer::list(CborEncoderConfig config) {
    return {Kind::kList, config};
  }

  CborEncodeBuffer CborEncodeBuffer::map(CborEncoderConfig config) {
    return {Kind::kMap, config};
  }

  outcome::result<void> CborEncodeBuffer::add(const CborEncodeBuffer &other) {
    if (kind_ == Kind::kMap) {
      return CborEncodeError::kUnrepresentable;
    }
    BytesSink sink{data_};
    CborEncoder encoder{sink, config_};
    OUTCOME_TRY(other.flush(encoder));
    count_ += other.kind_ == Kind::kSequence ? other.count_ : 1;
    return outcome::success();
  }

  CborEncodeBuffer &CborEncodeBuffer::operator[](std::string_view key) {
    Bytes key_bytes;
    append(key_bytes, CborTokenEncoder{CborToken::STR, key.size()});
    append(key_bytes, common::span::cbytes(key));
    // remove old value if present and push new one
    entries_.erase(std::remove_if(entries_.begin(),
                                  entries_.end(),
                                  [&](const auto &p) {
                                    return tc::equal(p.first, key_bytes);
                                  }),
                   entries_.end());
    entries_.emplace_back(std::move(key_bytes), sequence(config_));
    return entries_.back().second;
  }

  CborEncodeBuffer::Kind CborEncodeBuffer::kind() const {
    return kind_;
  }

  size_t CborEncodeBuffer::count() const {
    return kind_ == Kind::kMap ? entries_.size() : count_;
  }

  outcome::result<void> CborEncodeBuffer::flush(CborEncoder &encoder) const {
    if (kind_ != Kind::kMap && !entries_.empty()) {
      return CborEncodeError::kUnrepresentable;
    }
    switch (kind_) {
      case Kind::kSequence:
        return encoder.writeRaw(data_);
      case Kind::kList: {
        OUTCOME_TRY(encoder.writeList(count_));
        return encoder.writeRaw(data_);
      }
      case Kind::kMap:
        break;
    }
    std::vector<const std::pair<Bytes, CborEncodeBuffer> *> sorted;
    sorted.reserve(entries_.size());
    for (const auto &entry : entries_) {
      if (entry.second.count_ != 1) {
        return CborEncodeError::kExpectedMapValueSingle;
      }
      sorted.push_back(&entry);
    }
    if (config_.sort_map_keys || encoder.config().sort_map_keys) {
      std::stable_sort(sorted.begin(), sorted.end(), [](auto l, auto r) {
        return tc::less(l->first, r->first);
      });
    }
    OUTCOME_TRY(encoder.writeMap(sorted.size()));
    for (const auto *entry : sorted) {
      OUTCOME_TRY(encoder.writeRaw(entry->first));
      OUTCOME_TRY(encoder.writeRaw(entry->second.data_));
    }
    return outcome::success();
  }

  outcome::result<void> cborEncode(CborEncoder &encoder,
                                   const CborEncodeBuffer &buffer) {
    return buffer.flush(encoder);
  }

  CborMapEncoder::CborMapEncoder(CborEncoder &encoder) : encoder_{encoder} {}

  outcome::result<void> CborMapEncoder::begin(size_t count) {
    if (encoder_.config().sort_map_keys) {
      buffer_ = CborEncodeBuffer::map(encoder_.config());
      return outcome::success();
    }
    return encoder_.writeMap(count);
  }

  outcome::result<void> CborMapEncoder::end() {
    if (buffer_) {
      return buffer_->flush(encoder_);
    }
    return outcome::success();
  }
}  // namespace tc::codec::cbor

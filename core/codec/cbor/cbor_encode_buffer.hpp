/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>
#include <utility>
#include <vector>

#include <boost/optional.hpp>

#include "codec/cbor/cbor_encoder.hpp"
#include "codec/cbor/cbor_errors.hpp"

namespace tc::codec::cbor {
  /**
   * Encodes items into memory, so list and map headers can be written after
   * item count is known.
   */
  class CborEncodeBuffer {
   public:
    enum class Kind { kSequence, kList, kMap };

    /** Items without header */
    static CborEncodeBuffer sequence(CborEncoderConfig config = {});
    /** Items of list */
    static CborEncodeBuffer list(CborEncoderConfig config = {});
    /** Key-value pairs of map, keys are written in insertion order */
    static CborEncodeBuffer map(CborEncoderConfig config = {});

    /** Encodes item, map buffer must use entry or operator[] */
    template <typename T>
    outcome::result<void> add(const T &value) {
      if (kind_ == Kind::kMap) {
        return CborEncodeError::kUnrepresentable;
      }
      BytesSink sink{data_};
      CborEncoder encoder{sink, config_};
      OUTCOME_TRY(encoder.encode(value));
      ++count_;
      return outcome::success();
    }

    /** Appends sequence items or nested list or map */
    outcome::result<void> add(const CborEncodeBuffer &other);

    /**
     * Replaces entry with text key, map buffer only.
     * @return sequence buffer for value, must contain single item on flush
     */
    CborEncodeBuffer &operator[](std::string_view key);

    /** Adds entry with any key, keys are not checked for duplicates */
    template <typename K, typename V>
    outcome::result<void> entry(const K &key, const V &value) {
      if (kind_ != Kind::kMap) {
        return CborEncodeError::kUnrepresentable;
      }
      Bytes key_bytes;
      BytesSink sink{key_bytes};
      CborEncoder encoder{sink, config_};
      OUTCOME_TRY(encoder.encode(key));
      auto value_buffer{sequence(config_)};
      OUTCOME_TRY(value_buffer.add(value));
      entries_.emplace_back(std::move(key_bytes), std::move(value_buffer));
      return outcome::success();
    }

    Kind kind() const;
    /** Number of items, or entries for map */
    size_t count() const;

    /**
     * Writes header and buffered items.
     * Map entries are sorted by encoded key if either buffer or encoder
     * config has sort_map_keys set.
     * @return CborEncodeError::kExpectedMapValueSingle if map value does not
     * hold exactly one item, CborEncodeError::kUnrepresentable if list or
     * sequence has entries
     */
    outcome::result<void> flush(CborEncoder &encoder) const;

   private:
    CborEncodeBuffer(Kind kind, CborEncoderConfig config);

    Kind kind_;
    CborEncoderConfig config_;
    Bytes data_;
    size_t count_{};
    std::vector<std::pair<Bytes, CborEncodeBuffer>> entries_;
  };

  outcome::result<void> cborEncode(CborEncoder &encoder,
                                   const CborEncodeBuffer &buffer);

  /**
   * Writes map with known entry count.
   * Entries go straight to encoder, or to buffer first when encoder config
   * requires sorted keys.
   */
  class CborMapEncoder {
   public:
    explicit CborMapEncoder(CborEncoder &encoder);

    outcome::result<void> begin(size_t count);

    template <typename K, typename V>
    outcome::result<void> entry(const K &key, const V &value) {
      if (buffer_) {
        return buffer_->entry(key, value);
      }
      OUTCOME_TRY(encoder_.encode(key));
      return encoder_.encode(value);
    }

    outcome::result<void> end();

   private:
    CborEncoder &encoder_;
    boost::optional<CborEncodeBuffer> buffer_;
  };
}  // namespace tc::codec::cbor

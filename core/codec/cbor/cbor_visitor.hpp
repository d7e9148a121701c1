/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include <boost/optional.hpp>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace tc::codec::cbor {
  class CborDecoder;

  /**
   * Elements of list or key-value pairs of map being decoded.
   * Call next() before each element (pair) until it returns false.
   */
  class CborSeqAccess {
   public:
    CborSeqAccess(CborDecoder &decoder, boost::optional<uint64_t> count);

    /// Declared count, none for indefinite length
    boost::optional<uint64_t> count() const;

    /**
     * Advances to next element.
     * Consumes break of indefinite length item.
     * @return false if no elements left
     */
    outcome::result<bool> next();

    /// Whether all elements were consumed
    bool done() const;

    CborDecoder &decoder() const;

   private:
    CborDecoder &decoder_;
    boost::optional<uint64_t> count_;
    uint64_t consumed_{};
    bool end_{};
  };

  /**
   * Receives one decoded item.
   * Each method defaults to CborDecodeError::kWrongType, except visitTag
   * which decodes tagged item into same visitor ignoring tag.
   */
  class CborVisitor {
   public:
    virtual ~CborVisitor() = default;

    /// null or undefined
    virtual outcome::result<void> visitNull();
    virtual outcome::result<void> visitBool(bool value);
    /// major type 0
    virtual outcome::result<void> visitUint(uint64_t value);
    /// major type 1, always negative
    virtual outcome::result<void> visitInt(int64_t value);
    /// half, single or double precision
    virtual outcome::result<void> visitFloat(double value);
    virtual outcome::result<void> visitBytes(Bytes value);
    /// valid UTF-8
    virtual outcome::result<void> visitStr(std::string value);
    virtual outcome::result<void> visitList(CborSeqAccess &list);
    /// map, each pair is decoded as key then value
    virtual outcome::result<void> visitMap(CborSeqAccess &map);
    virtual outcome::result<void> visitTag(uint64_t tag, CborDecoder &decoder);
  };
}  // namespace tc::codec::cbor

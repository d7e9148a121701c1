/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>

#include "codec/cbor/cbor_common.hpp"
#include "common/bytes.hpp"

namespace tc::codec::cbor {
  /**
   * Initial byte of CBOR item: major type and additional information.
   * Argument bytes following the initial byte are not part of token.
   */
  struct CborToken {
    enum Type : uint8_t {
      UINT,
      INT,
      BYTES,
      STR,
      LIST,
      MAP,
      TAG,
      SPECIAL,
    };

    Type type{Type::UINT};
    uint8_t info{};

    static constexpr CborToken fromByte(uint8_t byte) {
      return {static_cast<Type>(byte >> 5), static_cast<uint8_t>(byte & 0x1F)};
    }

    constexpr uint8_t byte() const {
      return _first(type, info);
    }

    constexpr bool isIndefinite() const {
      return info == kExtraIndefinite;
    }
    constexpr bool isBreak() const {
      return type == Type::SPECIAL && info == kExtraIndefinite;
    }
    constexpr bool isNull() const {
      return type == Type::SPECIAL
             && (info == kExtraNull || info == kExtraUndefined);
    }

    /**
     * Number of argument bytes following initial byte.
     * @return none for reserved and indefinite additional information
     */
    static boost::optional<size_t> argumentSize(uint8_t info) {
      if (info < kExtraUint8) {
        return 0;
      }
      switch (info) {
        case kExtraUint8:
          return sizeof(uint8_t);
        case kExtraUint16:
          return sizeof(uint16_t);
        case kExtraUint32:
          return sizeof(uint32_t);
        case kExtraUint64:
          return sizeof(uint64_t);
        default:
          return boost::none;
      }
    }

    static constexpr uint8_t _first(Type type, uint8_t first) {
      return (type << 5) | first;
    }
    static constexpr size_t _more(uint64_t extra) {
      if (extra < kExtraUint8) {
        return 0;
      } else if (!(extra & 0xFFFFFFFFFFFFFF00)) {
        return sizeof(uint8_t);
      } else if (!(extra & 0xFFFFFFFFFFFF0000)) {
        return sizeof(uint16_t);
      } else if (!(extra & 0xFFFFFFFF00000000)) {
        return sizeof(uint32_t);
      } else {
        return sizeof(uint64_t);
      }
    }
  };

  /// Initial byte and argument in shortest form
  struct CborTokenEncoder {
    BytesN<9> _bytes{};
    size_t length{};

    constexpr CborTokenEncoder(CborToken::Type type, uint64_t extra) {
      auto more{CborToken::_more(extra)};
      length = 1 + more;
      if (!more) {
        _bytes[0] = CborToken::_first(type, extra);
      } else if (more == sizeof(uint8_t)) {
        _bytes[0] = CborToken::_first(type, kExtraUint8);
        _bytes[1] = extra;
      } else if (more == sizeof(uint16_t)) {
        _bytes[0] = CborToken::_first(type, kExtraUint16);
        _bytes[1] = extra >> 8;
        _bytes[2] = extra;
      } else if (more == sizeof(uint32_t)) {
        _bytes[0] = CborToken::_first(type, kExtraUint32);
        _bytes[1] = extra >> 24;
        _bytes[2] = extra >> 16;
        _bytes[3] = extra >> 8;
        _bytes[4] = extra;
      } else {
        _bytes[0] = CborToken::_first(type, kExtraUint64);
        _bytes[1] = extra >> 56;
        _bytes[2] = extra >> 48;
        _bytes[3] = extra >> 40;
        _bytes[4] = extra >> 32;
        _bytes[5] = extra >> 24;
        _bytes[6] = extra >> 16;
        _bytes[7] = extra >> 8;
        _bytes[8] = extra;
      }
    }
    operator BytesIn() const {
      return BytesIn{_bytes.data(), length};
    }
  };

  constexpr uint8_t kNull{CborToken::_first(CborToken::SPECIAL, kExtraNull)};
  constexpr uint8_t kFalse{CborToken::_first(CborToken::SPECIAL, kExtraFalse)};
  constexpr uint8_t kTrue{CborToken::_first(CborToken::SPECIAL, kExtraTrue)};
}  // namespace tc::codec::cbor

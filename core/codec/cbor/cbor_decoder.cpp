/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_decoder.hpp"

#include <cmath>
#include <limits>

#include <utf8/core.h>

#include "codec/cbor/cbor_errors.hpp"
#include "common/endian.hpp"
#include "common/span.hpp"

namespace tc::codec::cbor {
  using common::Endian;

  namespace {
    constexpr auto kMaxInt64{
        static_cast<uint64_t>(std::numeric_limits<int64_t>::max())};

    /// RFC 8949 Appendix D
    double halfToDouble(uint16_t half) {
      const int exponent{(half >> 10) & 0x1F};
      const int mantissa{half & 0x3FF};
      double value{};
      if (exponent == 0) {
        value = std::ldexp(mantissa, -24);
      } else if (exponent != 31) {
        value = std::ldexp(mantissa + 1024, exponent - 25);
      } else {
        value = mantissa == 0 ? std::numeric_limits<double>::infinity()
                              : std::numeric_limits<double>::quiet_NaN();
      }
      return half & 0x8000 ? -value : value;
    }

    template <typename T>
    outcome::result<T> readNumber(CborDecoder &decoder) {
      BytesN<sizeof(T)> bytes;
      for (auto &byte : bytes) {
        OUTCOME_TRYA(byte, decoder.readByte());
      }
      return common::getNumber<T>(bytes.data(), Endian::kBig);
    }

    struct NullVisitor : CborVisitor {
      outcome::result<void> visitNull() override {
        return outcome::success();
      }
    };

    struct BoolVisitor : CborVisitor {
      bool value{};
      outcome::result<void> visitBool(bool v) override {
        value = v;
        return outcome::success();
      }
    };

    struct UintVisitor : CborVisitor {
      uint64_t value{};
      outcome::result<void> visitUint(uint64_t v) override {
        value = v;
        return outcome::success();
      }
    };

    struct IntVisitor : CborVisitor {
      int64_t value{};
      outcome::result<void> visitUint(uint64_t v) override {
        if (v > kMaxInt64) {
          return CborDecodeError::kIntOverflow;
        }
        value = static_cast<int64_t>(v);
        return outcome::success();
      }
      outcome::result<void> visitInt(int64_t v) override {
        value = v;
        return outcome::success();
      }
    };

    struct FloatVisitor : CborVisitor {
      double value{};
      outcome::result<void> visitFloat(double v) override {
        value = v;
        return outcome::success();
      }
    };

    struct BytesVisitor : CborVisitor {
      Bytes value;
      outcome::result<void> visitBytes(Bytes v) override {
        value = std::move(v);
        return outcome::success();
      }
    };

    struct StrVisitor : CborVisitor {
      std::string value;
      outcome::result<void> visitStr(std::string v) override {
        value = std::move(v);
        return outcome::success();
      }
    };

    struct SkipVisitor : CborVisitor {
      outcome::result<void> visitNull() override {
        return outcome::success();
      }
      outcome::result<void> visitBool(bool) override {
        return outcome::success();
      }
      outcome::result<void> visitUint(uint64_t) override {
        return outcome::success();
      }
      outcome::result<void> visitInt(int64_t) override {
        return outcome::success();
      }
      outcome::result<void> visitFloat(double) override {
        return outcome::success();
      }
      outcome::result<void> visitBytes(Bytes) override {
        return outcome::success();
      }
      outcome::result<void> visitStr(std::string) override {
        return outcome::success();
      }
      outcome::result<void> visitList(CborSeqAccess &list) override {
        while (true) {
          OUTCOME_TRY(more, list.next());
          if (!more) {
            return outcome::success();
          }
          OUTCOME_TRY(list.decoder().decodeAny(*this));
        }
      }
      outcome::result<void> visitMap(CborSeqAccess &map) override {
        while (true) {
          OUTCOME_TRY(more, map.next());
          if (!more) {
            return outcome::success();
          }
          OUTCOME_TRY(map.decoder().decodeAny(*this));
          OUTCOME_TRY(map.decoder().decodeAny(*this));
        }
      }
    };
  }  // namespace

  CborDecoder::CborDecoder(CborSource &source, CborDecoderConfig config)
      : source_{source}, config_{config} {}

  const CborDecoderConfig &CborDecoder::config() const {
    return config_;
  }

  outcome::result<void> CborDecoder::readRaw(BytesOut out) {
    if (out.empty()) {
      return outcome::success();
    }
    if (pending_) {
      out[0] = *pending_;
      pending_.reset();
      out = out.subspan(1);
    }
    OUTCOME_TRY(source_.read(out));
    if (record_) {
      append(*record_, out);
    }
    return outcome::success();
  }

  outcome::result<uint8_t> CborDecoder::peek() {
    if (!pending_) {
      uint8_t byte{};
      OUTCOME_TRY(source_.read(BytesOut{&byte, 1}));
      if (record_) {
        record_->push_back(byte);
      }
      pending_ = byte;
    }
    return *pending_;
  }

  outcome::result<uint8_t> CborDecoder::readByte() {
    OUTCOME_TRY(byte, peek());
    pending_.reset();
    return byte;
  }

  outcome::result<CborToken> CborDecoder::peekHeader() {
    OUTCOME_TRY(byte, peek());
    return CborToken::fromByte(byte);
  }

  outcome::result<CborToken> CborDecoder::readHeader() {
    OUTCOME_TRY(byte, readByte());
    return CborToken::fromByte(byte);
  }

  outcome::result<boost::optional<uint64_t>> CborDecoder::readLength(
      uint8_t info) {
    if (info == kExtraIndefinite) {
      return boost::optional<uint64_t>{};
    }
    auto size{CborToken::argumentSize(info)};
    if (!size) {
      return CborDecodeError::kInvalidCbor;
    }
    if (*size == 0) {
      return boost::make_optional<uint64_t>(info);
    }
    uint64_t value{};
    for (size_t i{0}; i < *size; ++i) {
      OUTCOME_TRY(byte, readByte());
      value = (value << 8) | byte;
    }
    return boost::make_optional(value);
  }

  outcome::result<uint64_t> CborDecoder::readArgument(const CborToken &token) {
    OUTCOME_TRY(length, readLength(token.info));
    if (!length) {
      return CborDecodeError::kInvalidCbor;
    }
    return *length;
  }

  outcome::result<bool> CborDecoder::isBreak() {
    OUTCOME_TRY(byte, peek());
    return byte == kBreak;
  }

  outcome::result<void> CborDecoder::readBreak() {
    OUTCOME_TRY(byte, readByte());
    if (byte != kBreak) {
      return CborDecodeError::kInvalidCbor;
    }
    return outcome::success();
  }

  outcome::result<bool> CborDecoder::isNull() {
    OUTCOME_TRY(token, peekHeader());
    return token.isNull();
  }

  outcome::result<uint64_t> CborDecoder::readTag() {
    OUTCOME_TRY(token, readHeader());
    if (token.type != CborToken::TAG) {
      return CborDecodeError::kWrongType;
    }
    return readArgument(token);
  }

  outcome::result<void> CborDecoder::skipTags() {
    while (true) {
      OUTCOME_TRY(token, peekHeader());
      if (token.type != CborToken::TAG) {
        return outcome::success();
      }
      OUTCOME_TRY(readTag());
    }
  }

  outcome::result<bool> CborDecoder::atEnd() {
    if (pending_) {
      return false;
    }
    return source_.atEnd();
  }

  template <typename Out>
  outcome::result<void> CborDecoder::readAppend(uint64_t size, Out &out) {
    // whole string at once when source knows it has enough bytes
    auto step{config_.read_chunk ? config_.read_chunk : kDefaultReadChunk};
    if (auto remaining{source_.remaining()}) {
      const auto available{*remaining + (pending_ ? 1 : 0)};
      if (size > available) {
        return CborDecodeError::kUnexpectedEof;
      }
      step = available;
    }
    while (size != 0) {
      const auto n{static_cast<size_t>(std::min<uint64_t>(size, step))};
      const auto offset{out.size()};
      out.resize(offset + n);
      OUTCOME_TRY(readRaw(
          BytesOut{common::span::cast<uint8_t>(out.data() + offset), n}));
      size -= n;
    }
    return outcome::success();
  }

  template <typename Out>
  outcome::result<void> CborDecoder::readString(const CborToken &token,
                                                Out &out) {
    if (!token.isIndefinite()) {
      OUTCOME_TRY(size, readArgument(token));
      return readAppend(size, out);
    }
    if (!config_.allow_indefinite) {
      return CborDecodeError::kInvalidCbor;
    }
    while (true) {
      OUTCOME_TRY(chunk, readHeader());
      if (chunk.isBreak()) {
        return outcome::success();
      }
      if (chunk.type != token.type || chunk.isIndefinite()) {
        return CborDecodeError::kInvalidChunk;
      }
      OUTCOME_TRY(size, readArgument(chunk));
      OUTCOME_TRY(readAppend(size, out));
    }
  }

  outcome::result<void> CborDecoder::decodeNested(const CborToken &token,
                                                  CborVisitor &visitor) {
    if (depth_ >= config_.max_depth) {
      return CborDecodeError::kDepthLimit;
    }
    if (token.type == CborToken::TAG) {
      OUTCOME_TRY(tag, readArgument(token));
      ++depth_;
      auto result{visitor.visitTag(tag, *this)};
      --depth_;
      return result;
    }
    OUTCOME_TRY(count, readLength(token.info));
    if (!count && !config_.allow_indefinite) {
      return CborDecodeError::kInvalidCbor;
    }
    CborSeqAccess access{*this, count};
    ++depth_;
    auto result{token.type == CborToken::LIST ? visitor.visitList(access)
                                              : visitor.visitMap(access)};
    --depth_;
    if (!result) {
      return result;
    }
    if (!access.done()) {
      return CborDecodeError::kWrongSize;
    }
    return outcome::success();
  }

  outcome::result<void> CborDecoder::decodeAny(CborVisitor &visitor) {
    OUTCOME_TRY(token, readHeader());
    return decodeAny(token, visitor);
  }

  outcome::result<void> CborDecoder::decodeAny(const CborToken &token,
                                               CborVisitor &visitor) {
    switch (token.type) {
      case CborToken::UINT: {
        OUTCOME_TRY(value, readArgument(token));
        return visitor.visitUint(value);
      }
      case CborToken::INT: {
        OUTCOME_TRY(value, readArgument(token));
        if (value > kMaxInt64) {
          return CborDecodeError::kIntOverflow;
        }
        return visitor.visitInt(~static_cast<int64_t>(value));
      }
      case CborToken::BYTES: {
        Bytes bytes;
        OUTCOME_TRY(readString(token, bytes));
        return visitor.visitBytes(std::move(bytes));
      }
      case CborToken::STR: {
        std::string str;
        OUTCOME_TRY(readString(token, str));
        if (!utf8::is_valid(str.begin(), str.end())) {
          return CborDecodeError::kInvalidUtf8;
        }
        return visitor.visitStr(std::move(str));
      }
      case CborToken::LIST:
      case CborToken::MAP:
      case CborToken::TAG:
        return decodeNested(token, visitor);
      case CborToken::SPECIAL:
        break;
    }
    switch (token.info) {
      case kExtraFalse:
        return visitor.visitBool(false);
      case kExtraTrue:
        return visitor.visitBool(true);
      case kExtraNull:
      case kExtraUndefined:
        return visitor.visitNull();
      case kExtraFloat16: {
        OUTCOME_TRY(half, readNumber<uint16_t>(*this));
        return visitor.visitFloat(halfToDouble(half));
      }
      case kExtraFloat32: {
        OUTCOME_TRY(value, readNumber<float>(*this));
        return visitor.visitFloat(value);
      }
      case kExtraFloat64: {
        OUTCOME_TRY(value, readNumber<double>(*this));
        return visitor.visitFloat(value);
      }
      default:
        // unassigned simple values, reserved values and unexpected break
        return CborDecodeError::kInvalidCbor;
    }
  }

  outcome::result<void> CborDecoder::skip() {
    SkipVisitor visitor;
    return decodeAny(visitor);
  }

  outcome::result<Bytes> CborDecoder::readItem() {
    Bytes raw;
    // initial byte may be already peeked
    const size_t peeked{pending_ ? 1u : 0u};
    if (pending_) {
      raw.push_back(*pending_);
    }
    auto *outer{record_};
    record_ = &raw;
    auto skipped{skip()};
    record_ = outer;
    if (outer) {
      append(*outer, BytesIn{raw}.subspan(peeked));
    }
    OUTCOME_TRY(skipped);
    // byte peeked after item belongs to next item
    if (pending_) {
      raw.pop_back();
    }
    return raw;
  }

  outcome::result<void> CborDecoder::readNull() {
    NullVisitor visitor;
    return decodeAny(visitor);
  }

  outcome::result<bool> CborDecoder::readBool() {
    BoolVisitor visitor;
    OUTCOME_TRY(decodeAny(visitor));
    return visitor.value;
  }

  outcome::result<uint64_t> CborDecoder::readUint() {
    UintVisitor visitor;
    OUTCOME_TRY(decodeAny(visitor));
    return visitor.value;
  }

  outcome::result<int64_t> CborDecoder::readInt() {
    IntVisitor visitor;
    OUTCOME_TRY(decodeAny(visitor));
    return visitor.value;
  }

  outcome::result<double> CborDecoder::readFloat() {
    FloatVisitor visitor;
    OUTCOME_TRY(decodeAny(visitor));
    return visitor.value;
  }

  outcome::result<Bytes> CborDecoder::readBytes() {
    BytesVisitor visitor;
    OUTCOME_TRY(decodeAny(visitor));
    return std::move(visitor.value);
  }

  outcome::result<std::string> CborDecoder::readStr() {
    StrVisitor visitor;
    OUTCOME_TRY(decodeAny(visitor));
    return std::move(visitor.value);
  }
}  // namespace tc::codec::cbor

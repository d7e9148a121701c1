/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_dump.hpp"

#include <cmath>

#include <fmt/format.h>

#include "codec/cbor/cbor_codec.hpp"
#include "common/hexutil.hpp"

namespace tc {
  using codec::cbor::CborDecoder;
  using codec::cbor::CborSeqAccess;
  using codec::cbor::CborVisitor;

  std::string dumpBytes(BytesIn bytes) {
    return common::hex_lower(bytes);
  }

  namespace {
    void dumpString(std::string &o, const std::string &str) {
      o += '"';
      for (auto c : str) {
        switch (c) {
          case '"':
            o += "\\\"";
            break;
          case '\\':
            o += "\\\\";
            break;
          case '\n':
            o += "\\n";
            break;
          case '\r':
            o += "\\r";
            break;
          case '\t':
            o += "\\t";
            break;
          default:
            if (static_cast<uint8_t>(c) < 0x20) {
              o += fmt::format("\\u{:04x}", static_cast<int>(c));
            } else {
              o += c;
            }
        }
      }
      o += '"';
    }

    void dumpFloat(std::string &o, double value) {
      if (std::isnan(value)) {
        o += "NaN";
      } else if (std::isinf(value)) {
        o += value < 0 ? "-Infinity" : "Infinity";
      } else {
        auto str{fmt::format("{}", value)};
        if (str.find_first_of(".e") == std::string::npos) {
          str += ".0";
        }
        o += str;
      }
    }

    class DumpVisitor : public CborVisitor {
     public:
      explicit DumpVisitor(std::string &o) : o{o} {}

      outcome::result<void> visitNull() override {
        o += "null";
        return outcome::success();
      }

      outcome::result<void> visitBool(bool value) override {
        o += value ? "true" : "false";
        return outcome::success();
      }

      outcome::result<void> visitUint(uint64_t value) override {
        o += std::to_string(value);
        return outcome::success();
      }

      outcome::result<void> visitInt(int64_t value) override {
        o += std::to_string(value);
        return outcome::success();
      }

      outcome::result<void> visitFloat(double value) override {
        dumpFloat(o, value);
        return outcome::success();
      }

      outcome::result<void> visitBytes(Bytes value) override {
        o += "h'" + dumpBytes(value) + "'";
        return outcome::success();
      }

      outcome::result<void> visitStr(std::string value) override {
        dumpString(o, value);
        return outcome::success();
      }

      outcome::result<void> visitList(CborSeqAccess &list) override {
        o += list.count() ? "[" : "[_ ";
        auto first{true};
        while (true) {
          OUTCOME_TRY(more, list.next());
          if (!more) {
            break;
          }
          if (!first) {
            o += ", ";
          }
          first = false;
          OUTCOME_TRY(list.decoder().decodeAny(*this));
        }
        o += "]";
        return outcome::success();
      }

      outcome::result<void> visitMap(CborSeqAccess &map) override {
        o += map.count() ? "{" : "{_ ";
        auto first{true};
        while (true) {
          OUTCOME_TRY(more, map.next());
          if (!more) {
            break;
          }
          if (!first) {
            o += ", ";
          }
          first = false;
          OUTCOME_TRY(map.decoder().decodeAny(*this));
          o += ": ";
          OUTCOME_TRY(map.decoder().decodeAny(*this));
        }
        o += "}";
        return outcome::success();
      }

      outcome::result<void> visitTag(uint64_t tag,
                                     CborDecoder &decoder) override {
        o += std::to_string(tag) + "(";
        OUTCOME_TRY(decoder.decodeAny(*this));
        o += ")";
        return outcome::success();
      }

     private:
      std::string &o;
    };
  }  // namespace

  outcome::result<void> dumpCbor(std::string &o, CborDecoder &decoder) {
    DumpVisitor visitor{o};
    return decoder.decodeAny(visitor);
  }

  std::string dumpCbor(BytesIn bytes) {
    if (bytes.empty()) {
      return "(empty)";
    }
    std::string o;
    codec::cbor::BytesSource source{bytes};
    CborDecoder decoder{source};
    auto dumped{dumpCbor(o, decoder)};
    if (!dumped || !codec::cbor::expectEnd(decoder)) {
      return "(error:" + dumpBytes(bytes) + ")";
    }
    return o;
  }
}  // namespace tc

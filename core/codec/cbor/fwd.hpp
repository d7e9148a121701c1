/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace tc::codec::cbor {
  class CborEncoder;
  class CborDecoder;
  class CborSink;
  class CborSource;
  class Value;
  struct CborEncoderConfig;
  struct CborDecoderConfig;

  template <typename T>
  struct Tagged;
}  // namespace tc::codec::cbor

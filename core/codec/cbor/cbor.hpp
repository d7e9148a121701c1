/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TAGCBOR_CORE_CODEC_CBOR_CBOR_HPP
#define TAGCBOR_CORE_CODEC_CBOR_CBOR_HPP

#include "codec/cbor/cbor_codec.hpp"
#include "codec/cbor/cbor_dump.hpp"
#include "codec/cbor/cbor_resolve.hpp"
#include "codec/cbor/cbor_tagged.hpp"
#include "codec/cbor/cbor_tags.hpp"
#include "codec/cbor/cbor_value.hpp"
#include "codec/cbor/streams_annotation.hpp"

#endif  // TAGCBOR_CORE_CODEC_CBOR_CBOR_HPP

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <initializer_list>
#include <string_view>

#include <qtils/byte_view.hpp>

#include "crypto/hash_types.hpp"

namespace keel::crypto {

  /**
   * Take a SHA-256 hash from string
   * @param input to be hashed
   * @return hashed bytes
   */
  Hash256 sha256(std::string_view input);

  /**
   * Take a SHA-256 hash from bytes
   * @param input to be hashed
   * @return hashed bytes
   */
  Hash256 sha256(qtils::ByteView input);

  /**
   * Take a SHA-256 hash of concatenation of chunks
   * @param chunks to be hashed in order
   * @return hashed bytes
   */
  Hash256 sha256Concat(std::initializer_list<qtils::ByteView> chunks);

}  // namespace keel::crypto

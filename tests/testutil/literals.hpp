/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <string_view>

#include <qtils/byte_vec.hpp>

/// File content made of the characters of the literal, without terminator
inline qtils::ByteVec operator""_content(const char *c, size_t s) {
  qtils::ByteVec content;
  content.resize(s);
  std::copy_n(c, s, content.begin());
  return content;
}

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Convenience typedefs for name-addressed file storage.
 *
 * Keys are file names (std::string), values are whole file contents
 * (qtils::ByteVec).
 */

#pragma once

#include <string>
#include <string_view>

#include <qtils/byte_vec.hpp>

#include "storage/face/generic_storage.hpp"

namespace filetx::storage::face {

  /**
   * @brief ViewTrait for file names.
   *
   * Resolves to std::string_view.
   */
  template <>
  struct ViewTrait<std::string> {
    using type = std::string_view;
  };

}  // namespace filetx::storage::face

namespace filetx::storage {

  using FileName = std::string;
  using FileContent = qtils::ByteVec;

  /**
   * @brief Storage of whole files addressed by name.
   */
  using FileStorage = face::GenericStorage<FileName, FileContent>;

}  // namespace filetx::storage

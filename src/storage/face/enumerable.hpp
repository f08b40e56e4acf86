/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <qtils/outcome.hpp>

namespace filetx::storage::face {

  /**
   * @brief A mixin for maps which can list their keys.
   * @tparam K key type
   */
  template <typename K>
  struct Enumerable {
    virtual ~Enumerable() = default;

    /**
     * @return all keys currently stored, in ascending order
     */
    [[nodiscard]] virtual outcome::result<std::vector<K>> keys() const = 0;
  };

}  // namespace filetx::storage::face

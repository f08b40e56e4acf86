/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <qtils/outcome.hpp>

#include "storage/face/view.hpp"

namespace filetx::storage::face {

  /**
   * Read side of a storage: lookup of whole values by key.
   * Absence of a key is a regular answer here, never an error, except
   * for get() which is meant for keys known to exist.
   */
  template <typename K, typename V>
  struct Readable {
    virtual ~Readable() = default;

    /// @return whether `key` is bound to a value
    [[nodiscard]] virtual outcome::result<bool> contains(
        const View<K> &key) const = 0;

    /// @return value bound to `key`, or StorageError::NOT_FOUND
    [[nodiscard]] virtual outcome::result<V> get(const View<K> &key) const = 0;

    /// @return value bound to `key`, or std::nullopt when there is none
    [[nodiscard]] virtual outcome::result<std::optional<V>> tryGet(
        const View<K> &key) const = 0;
  };

}  // namespace filetx::storage::face

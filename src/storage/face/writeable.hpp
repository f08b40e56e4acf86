/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/outcome.hpp>

#include "storage/face/view.hpp"

namespace filetx::storage::face {

  /**
   * Write side of a storage.
   * Every call takes effect on its own; there is no batching at this level.
   */
  template <typename K, typename V>
  struct Writeable {
    virtual ~Writeable() = default;

    /**
     * Binds `value` to `key`, replacing the previous value if any.
     * A reader never observes a partially written value.
     */
    virtual outcome::result<void> put(const View<K> &key, V &&value) = 0;

    /**
     * Unbinds `key`.
     * @return StorageError::NOT_FOUND if `key` was not bound
     */
    virtual outcome::result<void> remove(const View<K> &key) = 0;
  };

}  // namespace filetx::storage::face

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Composite interface for generic key-value storage.
 *
 * Combines readable, writable and enumerable support into a single
 * storage abstraction.
 */

#pragma once

#include "storage/face/enumerable.hpp"
#include "storage/face/readable.hpp"
#include "storage/face/writeable.hpp"

namespace filetx::storage::face {

  /**
   * @brief Abstraction over a key-value storage supporting read, write and
   * listing of whole values.
   * @tparam K Key type.
   * @tparam V Value type.
   *
   * Implementations make no transactional promises. Atomicity over several
   * operations is layered on top (see uow::UnitOfWork).
   */
  template <typename K, typename V>
  struct GenericStorage : Readable<K, V>, Writeable<K, V>, Enumerable<K> {};

}  // namespace filetx::storage::face

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/in_memory/in_memory_storage.hpp"

#include <boost/assert.hpp>

#include "storage/storage_error.hpp"

namespace filetx::storage {

  outcome::result<bool> InMemoryStorage::contains(
      const std::string_view &name) const {
    return storage_.find(name) != storage_.end();
  }

  outcome::result<FileContent> InMemoryStorage::get(
      const std::string_view &name) const {
    if (auto it = storage_.find(name); it != storage_.end()) {
      return it->second;
    }

    return StorageError::NOT_FOUND;
  }

  outcome::result<std::optional<FileContent>> InMemoryStorage::tryGet(
      const std::string_view &name) const {
    if (auto it = storage_.find(name); it != storage_.end()) {
      return std::make_optional(it->second);
    }

    return std::nullopt;
  }

  outcome::result<void> InMemoryStorage::put(const std::string_view &name,
                                             FileContent &&content) {
    auto it = storage_.find(name);
    if (it != storage_.end()) {
      BOOST_ASSERT(size_ >= it->second.size());
      size_ -= it->second.size();
      size_ += content.size();
      it->second = std::move(content);
      return outcome::success();
    }
    size_ += content.size();
    storage_.emplace(FileName{name}, std::move(content));
    return outcome::success();
  }

  outcome::result<void> InMemoryStorage::remove(const std::string_view &name) {
    auto it = storage_.find(name);
    if (it == storage_.end()) {
      return StorageError::NOT_FOUND;
    }
    size_ -= it->second.size();
    storage_.erase(it);
    return outcome::success();
  }

  outcome::result<std::vector<FileName>> InMemoryStorage::keys() const {
    std::vector<FileName> names;
    names.reserve(storage_.size());
    for (const auto &[name, _] : storage_) {
      names.emplace_back(name);
    }
    return names;
  }

}  // namespace filetx::storage

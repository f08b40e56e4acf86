/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>

#include <qtils/outcome.hpp>

#include "storage/file_map_types.hpp"

namespace filetx::storage {

  /**
   * Simple storage that conforms FileStorage interface.
   * Keeps everything in process memory; mostly needed by tests and by the
   * demo when no durable backend is configured.
   */
  class InMemoryStorage : public FileStorage {
   public:
    ~InMemoryStorage() override = default;

    [[nodiscard]] outcome::result<bool> contains(
        const std::string_view &name) const override;

    [[nodiscard]] outcome::result<FileContent> get(
        const std::string_view &name) const override;

    [[nodiscard]] outcome::result<std::optional<FileContent>> tryGet(
        const std::string_view &name) const override;

    outcome::result<void> put(const std::string_view &name,
                              FileContent &&content) override;

    outcome::result<void> remove(const std::string_view &name) override;

    [[nodiscard]] outcome::result<std::vector<FileName>> keys() const override;

    /// Total size of stored contents in bytes
    [[nodiscard]] size_t byteSize() const {
      return size_;
    }

   private:
    std::map<FileName, FileContent, std::less<>> storage_;
    size_t size_ = 0;
  };

}  // namespace filetx::storage

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @file filesystem_storage.hpp
 * @brief FileStorage kept in a local directory, one regular file per name.
 */

#pragma once

#include <filesystem>

#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "storage/file_map_types.hpp"
#include "utils/ctor_limiters.hpp"

namespace filetx::storage {

  /**
   * @class FilesystemStorage
   * @brief Stores every entry as a regular file directly under a root
   * directory.
   *
   * Names must be plain file names: non-empty, not `.` or `..`, without
   * path separators or NUL, and not starting with kTempPrefix. Other names
   * are refused with StorageError::INVALID_ARGUMENT.
   *
   * put() writes into a temporary file beside the destination and renames
   * it into place, so readers see either the old or the new content.
   */
  class FilesystemStorage : public FileStorage, NonCopyable, NonMovable {
   public:
    static constexpr std::string_view kTempPrefix = ".filetx-tmp-";

    /**
     * Creates @param root (with parents) if it does not exist.
     * Raises the filesystem error if the directory can not be created or
     * is not a directory.
     */
    FilesystemStorage(qtils::SharedRef<log::LoggingSystem> logsys,
                      std::filesystem::path root);

    ~FilesystemStorage() override = default;

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

    const std::filesystem::path &root() const {
      return root_;
    }

    static bool isWellFormedName(std::string_view name);

   private:
    outcome::result<std::filesystem::path> pathOf(std::string_view name) const;

    outcome::result<void> writeFile(const std::filesystem::path &path,
                                    const FileContent &content) const;

    log::Logger logger_;
    std::filesystem::path root_;
  };

}  // namespace filetx::storage

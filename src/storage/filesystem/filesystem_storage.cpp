/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/filesystem/filesystem_storage.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>

#include <fmt/format.h>
#include <qtils/error_throw.hpp>
#include <unistd.h>

#include "storage/storage_error.hpp"

namespace filetx::storage {
  namespace fs = std::filesystem;

  namespace {
    // distinguishes temporary files of concurrent writers in one process
    std::atomic_uint64_t temp_counter{0};
  }  // namespace

  FilesystemStorage::FilesystemStorage(
      qtils::SharedRef<log::LoggingSystem> logsys, fs::path root)
      : logger_(logsys->getLogger("FilesystemStorage", "storage")),
        root_(std::move(root)) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
      SL_CRITICAL(logger_,
                  "Can't create storage directory {}: {}",
                  root_.native(),
                  ec.message());
      qtils::raise(ec);
    }
    if (not fs::is_directory(root_, ec)) {
      SL_CRITICAL(logger_,
                  "Can't use {} for storage: is not a directory",
                  root_.native());
      qtils::raise(ec ? ec : make_error_code(std::errc::not_a_directory));
    }
    SL_VERBOSE(logger_, "Storage directory is {}", root_.native());
  }

  bool FilesystemStorage::isWellFormedName(std::string_view name) {
    if (name.empty() or name == "." or name == "..") {
      return false;
    }
    if (name.starts_with(kTempPrefix)) {
      return false;
    }
    return std::ranges::none_of(name, [](char c) {
      return c == '/' or c == '\\' or c == '\0';
    });
  }

  outcome::result<fs::path> FilesystemStorage::pathOf(
      std::string_view name) const {
    if (not isWellFormedName(name)) {
      SL_DEBUG(logger_, "Refused ill-formed name '{}'", name);
      return StorageError::INVALID_ARGUMENT;
    }
    return root_ / fs::path(name);
  }

  outcome::result<bool> FilesystemStorage::contains(
      const std::string_view &name) const {
    OUTCOME_TRY(path, pathOf(name));
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec and ec != std::errc::no_such_file_or_directory) {
      SL_ERROR(logger_, "Can't stat {}: {}", path.native(), ec.message());
      return StorageError::IO_ERROR;
    }
    return fs::is_regular_file(status);
  }

  outcome::result<FileContent> FilesystemStorage::get(
      const std::string_view &name) const {
    OUTCOME_TRY(content_opt, tryGet(name));
    if (not content_opt.has_value()) {
      return StorageError::NOT_FOUND;
    }
    return std::move(content_opt.value());
  }

  outcome::result<std::optional<FileContent>> FilesystemStorage::tryGet(
      const std::string_view &name) const {
    OUTCOME_TRY(present, contains(name));
    if (not present) {
      return std::nullopt;
    }
    OUTCOME_TRY(path, pathOf(name));

    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
      if (ec == std::errc::no_such_file_or_directory) {
        // removed by someone else meanwhile
        return std::nullopt;
      }
      SL_ERROR(logger_, "Can't get size of {}: {}", path.native(), ec.message());
      return StorageError::IO_ERROR;
    }

    std::ifstream file(path, std::ios::binary);
    if (not file.is_open()) {
      SL_ERROR(logger_, "Can't open {} for reading", path.native());
      return StorageError::IO_ERROR;
    }

    FileContent content;
    content.resize(size);
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    file.read(reinterpret_cast<char *>(content.data()),
              static_cast<std::streamsize>(size));
    if (file.gcount() != static_cast<std::streamsize>(size)) {
      SL_ERROR(logger_,
               "Short read of {}: {} of {} bytes",
               path.native(),
               file.gcount(),
               size);
      return StorageError::IO_ERROR;
    }
    return std::make_optional(std::move(content));
  }

  outcome::result<void> FilesystemStorage::writeFile(
      const fs::path &path, const FileContent &content) const {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (not file.is_open()) {
      SL_ERROR(logger_, "Can't open {} for writing", path.native());
      return StorageError::IO_ERROR;
    }
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    file.write(reinterpret_cast<const char *>(content.data()),
               static_cast<std::streamsize>(content.size()));
    file.close();
    if (file.fail()) {
      SL_ERROR(logger_, "Can't write {}", path.native());
      return StorageError::IO_ERROR;
    }
    return outcome::success();
  }

  outcome::result<void> FilesystemStorage::put(const std::string_view &name,
                                               FileContent &&content) {
    OUTCOME_TRY(path, pathOf(name));

    auto temp_path =
        root_
        / fmt::format(
            "{}{}.{}.{}", kTempPrefix, name, ::getpid(), temp_counter++);

    if (auto res = writeFile(temp_path, content); res.has_error()) {
      std::error_code ignored;
      fs::remove(temp_path, ignored);
      return res.error();
    }

    std::error_code ec;
    fs::rename(temp_path, path, ec);
    if (ec) {
      SL_ERROR(logger_,
               "Can't move {} into place: {}",
               path.native(),
               ec.message());
      std::error_code ignored;
      fs::remove(temp_path, ignored);
      return StorageError::IO_ERROR;
    }

    SL_TRACE(logger_, "Written {} bytes to {}", content.size(), path.native());
    return outcome::success();
  }

  outcome::result<void> FilesystemStorage::remove(
      const std::string_view &name) {
    OUTCOME_TRY(path, pathOf(name));
    // Only regular files are entries, same as for contains()
    OUTCOME_TRY(exists, contains(name));
    if (not exists) {
      return StorageError::NOT_FOUND;
    }
    std::error_code ec;
    if (fs::remove(path, ec)) {
      SL_TRACE(logger_, "Removed {}", path.native());
      return outcome::success();
    }
    if (ec) {
      SL_ERROR(logger_, "Can't remove {}: {}", path.native(), ec.message());
      return StorageError::IO_ERROR;
    }
    return StorageError::NOT_FOUND;
  }

  outcome::result<std::vector<FileName>> FilesystemStorage::keys() const {
    std::vector<FileName> names;
    std::error_code ec;
    for (fs::directory_iterator it(root_, ec), end; not ec and it != end;
         it.increment(ec)) {
      std::error_code entry_ec;
      if (not it->is_regular_file(entry_ec)) {
        continue;
      }
      auto name = it->path().filename().string();
      if (isWellFormedName(name)) {
        names.emplace_back(std::move(name));
      }
    }
    if (ec) {
      SL_ERROR(logger_, "Can't list {}: {}", root_.native(), ec.message());
      return StorageError::IO_ERROR;
    }
    std::ranges::sort(names);
    return names;
  }

}  // namespace filetx::storage

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <string>
#include <string_view>

#include <rocksdb/slice.h>
#include <rocksdb/status.h>

#include "log/logger.hpp"
#include "storage/file_map_types.hpp"
#include "storage/storage_error.hpp"

namespace filetx::storage {
  inline StorageError status_as_error(const rocksdb::Status &s,
                                      const log::Logger &log) {
    if (s.IsNotFound()) {
      return StorageError::NOT_FOUND;
    }

    if (s.IsIOError()) {
      SL_ERROR(log, "RocksDB IO error: {}", s.ToString());
      return StorageError::IO_ERROR;
    }

    if (s.IsInvalidArgument()) {
      return StorageError::INVALID_ARGUMENT;
    }

    if (s.IsCorruption()) {
      SL_ERROR(log, "RocksDB corruption: {}", s.ToString());
      return StorageError::CORRUPTION;
    }

    if (s.IsNotSupported()) {
      return StorageError::NOT_SUPPORTED;
    }

    SL_ERROR(log, "RocksDB failure: {}", s.ToString());
    return StorageError::UNKNOWN;
  }

  inline rocksdb::Slice make_slice(std::string_view name) {
    return rocksdb::Slice{name.data(), name.size()};
  }

  inline rocksdb::Slice make_slice(const FileContent &content) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    const auto *ptr = reinterpret_cast<const char *>(content.data());
    return rocksdb::Slice{ptr, content.size()};
  }

  inline FileContent make_content(const std::string &value) {
    FileContent content;
    content.resize(value.size());
    std::ranges::copy(value, content.begin());
    return content;
  }
}  // namespace filetx::storage

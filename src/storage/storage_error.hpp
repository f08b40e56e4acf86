/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <qtils/enum_error_code.hpp>

namespace filetx::storage {

  /**
   * Errors shared by every file storage backend.
   * A backend maps its native failures (errno, rocksdb::Status) onto these,
   * so callers may compare against them regardless of the backend in use.
   */
  enum class StorageError : uint8_t {
    NOT_FOUND = 1,     ///< no file with such name
    INVALID_ARGUMENT,  ///< name can't be used as a file name
    IO_ERROR,          ///< read or write of the medium failed
    CORRUPTION,        ///< stored data is damaged
    NOT_SUPPORTED,     ///< backend can't do that
    PATH_NOT_CREATED,  ///< storage directory is missing and can't be made
    UNKNOWN,
  };

}  // namespace filetx::storage

OUTCOME_HPP_DECLARE_ERROR(filetx::storage, StorageError);

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/storage_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(filetx::storage, StorageError, e) {
  using E = filetx::storage::StorageError;
  switch (e) {
    case E::NOT_FOUND:
      return "entry not found in storage";
    case E::INVALID_ARGUMENT:
      return "name is not a valid file name";
    case E::IO_ERROR:
      return "IO error in storage";
    case E::CORRUPTION:
      return "data corruption in storage";
    case E::NOT_SUPPORTED:
      return "backend does not support the operation";
    case E::PATH_NOT_CREATED:
      return "storage directory could not be created";
    case E::UNKNOWN:
      break;
  }
  return "unknown storage error";
}

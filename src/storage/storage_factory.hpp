/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "storage/file_map_types.hpp"

namespace filetx::app {
  class Configuration;
}

namespace filetx::storage {

  /**
   * Builds the backend selected by app::Configuration::storage().backend.
   * Errors thrown by backend constructors are returned as error codes.
   */
  outcome::result<std::shared_ptr<FileStorage>> makeStorage(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<app::Configuration> app_config);

}  // namespace filetx::storage

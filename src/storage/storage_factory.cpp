/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/storage_factory.hpp"

#include <system_error>

#include "app/configuration.hpp"
#include "storage/filesystem/filesystem_storage.hpp"
#include "storage/in_memory/in_memory_storage.hpp"
#include "storage/rocksdb/rocksdb.hpp"
#include "storage/storage_error.hpp"

namespace filetx::storage {

  outcome::result<std::shared_ptr<FileStorage>> makeStorage(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<app::Configuration> app_config) {
    auto logger = logsys->getLogger("StorageFactory", "storage");
    const auto &config = app_config->storage();

    SL_INFO(logger,
            "Using '{}' storage backend{}",
            app::backendName(config.backend),
            config.backend == app::Configuration::Backend::Memory
                ? std::string{}
                : " at " + config.directory.native());

    try {
      switch (config.backend) {
        case app::Configuration::Backend::Memory:
          return std::make_shared<InMemoryStorage>();
        case app::Configuration::Backend::Filesystem:
          return std::make_shared<FilesystemStorage>(logsys, config.directory);
        case app::Configuration::Backend::RocksDb:
          return std::make_shared<RocksDb>(logsys, app_config);
      }
    } catch (const std::system_error &e) {
      SL_ERROR(logger, "Can't open storage: {}", e.what());
      return e.code();
    }

    return StorageError::NOT_SUPPORTED;
  }

}  // namespace filetx::storage

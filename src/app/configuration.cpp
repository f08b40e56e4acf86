/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configuration.hpp"

namespace filetx::app {

  Configuration::Configuration()
      : version_("undefined"),
        storage_{
            .backend = Backend::Memory,
            .directory = "storage",
            .cache_size = 64 << 20,
        } {}

  const std::string &Configuration::version() const {
    return version_;
  }

  const std::filesystem::path &Configuration::basePath() const {
    return base_path_;
  }

  const Configuration::StorageConfig &Configuration::storage() const {
    return storage_;
  }

  std::optional<Configuration::Backend> backendFromString(
      std::string_view str) {
    if (str == "memory" or str == "in-memory") {
      return Configuration::Backend::Memory;
    }
    if (str == "filesystem" or str == "fs") {
      return Configuration::Backend::Filesystem;
    }
    if (str == "rocksdb") {
      return Configuration::Backend::RocksDb;
    }
    return std::nullopt;
  }

  std::string_view backendName(Configuration::Backend backend) {
    switch (backend) {
      case Configuration::Backend::Memory:
        return "memory";
      case Configuration::Backend::Filesystem:
        return "filesystem";
      case Configuration::Backend::RocksDb:
        return "rocksdb";
    }
    return "unknown";
  }

}  // namespace filetx::app

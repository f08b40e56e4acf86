/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <utils/ctor_limiters.hpp>

namespace filetx::app {
  class Configuration : Singleton<Configuration> {
   public:
    enum class Backend : uint8_t {
      Memory,
      Filesystem,
      RocksDb,
    };

    struct StorageConfig {
      Backend backend = Backend::Memory;
      /// Root directory of filesystem backend or RocksDB database
      std::filesystem::path directory = "storage";
      size_t cache_size = 64 << 20;  // 64MiB
    };

    Configuration();
    virtual ~Configuration() = default;

    [[nodiscard]] virtual const std::string &version() const;
    [[nodiscard]] virtual const std::filesystem::path &basePath() const;
    [[nodiscard]] virtual const StorageConfig &storage() const;

   private:
    friend class Configurator;  // for external configure

    std::string version_;
    std::filesystem::path base_path_;

    StorageConfig storage_;
  };

  std::optional<Configuration::Backend> backendFromString(
      std::string_view str);

  std::string_view backendName(Configuration::Backend backend);

}  // namespace filetx::app

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>

#include <qtils/shared_ref.hpp>
#include <rocksdb/db.h>
#include <rocksdb/table.h>

#include "log/logger.hpp"
#include "storage/file_map_types.hpp"
#include "utils/ctor_limiters.hpp"

namespace filetx::app {
  class Configuration;
}

namespace filetx::storage {

  /**
   * FileStorage backed by a RocksDB database.
   * Names are stored as keys of the default column family, contents as
   * values. Database location and cache size come from
   * app::Configuration::storage().
   */
  class RocksDb : public FileStorage, NonCopyable, NonMovable {
   public:
    /**
     * Opens (creating if missing) the database.
     * Raises the error if the directory or the database can not be opened.
     */
    RocksDb(qtils::SharedRef<log::LoggingSystem> logsys,
            qtils::SharedRef<app::Configuration> app_config);

    ~RocksDb() override;

    static constexpr uint32_t kDefaultLruCacheSizeMiB = 64;
    static constexpr uint32_t kDefaultBlockSizeKiB = 16;

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

    /**
     * Prepare configuration structure
     * @param lru_cache_size_mib - LRU rocksdb cache in MiB
     * @param block_size_kib - internal rocksdb block size in KiB
     * @return options structure
     */
    static rocksdb::BlockBasedTableOptions tableOptionsConfiguration(
        uint32_t lru_cache_size_mib = kDefaultLruCacheSizeMiB,
        uint32_t block_size_kib = kDefaultBlockSizeKiB);

   private:
    static outcome::result<void> createDirectory(
        const std::filesystem::path &absolute_path, log::Logger &log);

    log::Logger logger_;
    rocksdb::DB *db_{};
    rocksdb::ReadOptions ro_;
    rocksdb::WriteOptions wo_;
  };

}  // namespace filetx::storage

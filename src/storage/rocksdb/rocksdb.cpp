/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb.hpp"

#include <memory>

#include <app/configuration.hpp>
#include <qtils/error_throw.hpp>
#include <rocksdb/cache.h>
#include <rocksdb/filter_policy.h>
#include <rocksdb/table.h>
#include <soralog/macro.hpp>

#include "storage/rocksdb/rocksdb_util.hpp"
#include "storage/storage_error.hpp"

namespace filetx::storage {
  namespace fs = std::filesystem;

  RocksDb::RocksDb(qtils::SharedRef<log::LoggingSystem> logsys,
                   qtils::SharedRef<app::Configuration> app_config)
      : logger_(logsys->getLogger("RocksDB", "storage")) {
    ro_.fill_cache = false;

    const auto &path = app_config->storage().directory;

    std::error_code ec;
    create_directories(path, ec);
    if (ec) {
      SL_CRITICAL(logger_, "Can't create DB directory: {}", ec.message());
      qtils::raise(ec);
    }

    if (auto res = createDirectory(path, logger_); res.has_error()) {
      SL_CRITICAL(logger_,
                  "Can't create DB directory ({}): {}",
                  path.native(),
                  res.error().message());
      qtils::raise(res.error());
    }

    const auto memory_budget = app_config->storage().cache_size;

    auto options = rocksdb::Options{};
    options.create_if_missing = true;
    options.optimize_filters_for_hits = true;
    options.OptimizeLevelStyleCompaction(memory_budget);
    options.table_factory.reset(
        rocksdb::NewBlockBasedTableFactory(tableOptionsConfiguration()));

    auto status = rocksdb::DB::Open(options, path.native(), &db_);
    if (not status.ok()) {
      SL_CRITICAL(logger_,
                  "Can't open database in {}: {}",
                  path.native(),
                  status.ToString());
      qtils::raise(status_as_error(status, logger_));
    }

    SL_VERBOSE(logger_, "Database opened in {}", path.native());
  }

  RocksDb::~RocksDb() {
    if (db_ == nullptr) {
      return;
    }
    auto status = db_->Close();
    if (not status.ok()) {
      SL_ERROR(logger_, "Can't close database: {}", status.ToString());
    }
    delete db_;
  }

  outcome::result<void> RocksDb::createDirectory(
      const std::filesystem::path &absolute_path, log::Logger &log) {
    std::error_code ec;
    if (not fs::create_directory(absolute_path.native(), ec) and ec.value()) {
      SL_ERROR(log,
               "Can't create directory {} for database: {}",
               absolute_path.native(),
               ec.message());
      return StorageError::PATH_NOT_CREATED;
    }
    if (not fs::is_directory(absolute_path.native())) {
      SL_ERROR(log,
               "Can't open {} for database: is not a directory",
               absolute_path.native());
      return StorageError::PATH_NOT_CREATED;
    }
    return outcome::success();
  }

  rocksdb::BlockBasedTableOptions RocksDb::tableOptionsConfiguration(
      uint32_t lru_cache_size_mib, uint32_t block_size_kib) {
    rocksdb::BlockBasedTableOptions table_options;
    table_options.format_version = 5;
    table_options.block_cache = rocksdb::NewLRUCache(
        static_cast<uint64_t>(lru_cache_size_mib) * 1024 * 1024);
    table_options.block_size = static_cast<size_t>(block_size_kib) * 1024;
    table_options.cache_index_and_filter_blocks = true;
    table_options.filter_policy.reset(rocksdb::NewBloomFilterPolicy(10, false));
    return table_options;
  }

  outcome::result<bool> RocksDb::contains(const std::string_view &name) const {
    std::string value;
    auto status = db_->Get(ro_, make_slice(name), &value);
    if (status.ok()) {
      return true;
    }

    if (status.IsNotFound()) {
      return false;
    }

    return status_as_error(status, logger_);
  }

  outcome::result<FileContent> RocksDb::get(
      const std::string_view &name) const {
    std::string value;
    auto status = db_->Get(ro_, make_slice(name), &value);
    if (status.ok()) {
      return make_content(value);
    }
    return status_as_error(status, logger_);
  }

  outcome::result<std::optional<FileContent>> RocksDb::tryGet(
      const std::string_view &name) const {
    std::string value;
    auto status = db_->Get(ro_, make_slice(name), &value);
    if (status.ok()) {
      return std::make_optional(make_content(value));
    }

    if (status.IsNotFound()) {
      return std::nullopt;
    }

    return status_as_error(status, logger_);
  }

  outcome::result<void> RocksDb::put(const std::string_view &name,
                                     FileContent &&content) {
    auto status = db_->Put(wo_, make_slice(name), make_slice(content));
    if (status.ok()) {
      return outcome::success();
    }

    return status_as_error(status, logger_);
  }

  outcome::result<void> RocksDb::remove(const std::string_view &name) {
    // RocksDB deletes absent keys silently
    OUTCOME_TRY(present, contains(name));
    if (not present) {
      return StorageError::NOT_FOUND;
    }

    auto status = db_->Delete(wo_, make_slice(name));
    if (status.ok()) {
      return outcome::success();
    }

    return status_as_error(status, logger_);
  }

  outcome::result<std::vector<FileName>> RocksDb::keys() const {
    std::vector<FileName> names;
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(ro_));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
      names.emplace_back(it->key().ToString());
    }
    if (not it->status().ok()) {
      return status_as_error(it->status(), logger_);
    }
    return names;
  }

}  // namespace filetx::storage

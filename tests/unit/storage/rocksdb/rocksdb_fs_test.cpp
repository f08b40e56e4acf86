/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <mock/app/configuration_mock.hpp>
#include <qtils/test/outcome.hpp>

#include "app/configuration.hpp"
#include "storage/rocksdb/rocksdb.hpp"
#include "storage/storage_error.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/storage/base_fs_test.hpp"

using filetx::app::ConfigurationMock;
using filetx::log::LoggingSystem;
using filetx::storage::RocksDb;
using StorageConfig = filetx::app::Configuration::StorageConfig;
using Backend = filetx::app::Configuration::Backend;
using namespace testing;

struct RocksDb_Open : public test::BaseFS_Test {
  RocksDb_Open() : test::BaseFS_Test("/tmp/filetx-test-rocksdb-open") {}

  void SetUp() override {
    BaseFS_Test::SetUp();

    logsys = testutil::prepareLoggers();
    app_config = std::make_shared<ConfigurationMock>();

    storage_config = StorageConfig{
        .backend = Backend::RocksDb,
        .directory = getPathString() + "/db",
        .cache_size = 8 << 20,  // 8Mb
    };
    EXPECT_CALL(*app_config, storage())
        .WillRepeatedly(ReturnRef(storage_config));
  };

  void TearDown() override {
    app_config.reset();
    BaseFS_Test::TearDown();
  }

  std::shared_ptr<LoggingSystem> logsys;
  std::shared_ptr<ConfigurationMock> app_config;
  StorageConfig storage_config;
};

/**
 * @given directory path going through a character device
 * @when open database
 * @then database can not be opened
 */
TEST_F(RocksDb_Open, OpenNonExistingDB) {
  storage_config.directory = "/dev/zero/impossible/path";

  ASSERT_THROW_OUTCOME(RocksDb(logsys, app_config), std::errc::not_a_directory);
}

/**
 * @given writable directory
 * @when open database
 * @then database is opened
 */
TEST_F(RocksDb_Open, OpenExistingDB) {
  ASSERT_NO_THROW(RocksDb(logsys, app_config));
}

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <fstream>

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "app/configuration.hpp"
#include "app/configurator.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/storage/base_fs_test.hpp"

using filetx::app::Configuration;
using filetx::app::Configurator;
using Backend = filetx::app::Configuration::Backend;

struct ConfiguratorTest : public test::BaseFS_Test {
  ConfiguratorTest() : test::BaseFS_Test("/tmp/filetx-test-configurator") {}

  void SetUp() override {
    BaseFS_Test::SetUp();
    logger = testutil::prepareLoggers()->getLogger("ConfiguratorTest",
                                                   "testing");
  }

  void TearDown() override {
    configurator.reset();
    BaseFS_Test::TearDown();
  }

  /// Runs both parsing steps and builds configuration of the given args
  outcome::result<std::shared_ptr<Configuration>> configure(
      std::vector<std::string> args) {
    configurator.reset();

    args_ = std::move(args);
    args_.insert(args_.begin(), "filetx_demo");
    argv_.clear();
    for (const auto &arg : args_) {
      argv_.push_back(arg.c_str());
    }
    argv_.push_back(nullptr);

    configurator = std::make_unique<Configurator>(
        static_cast<int>(args_.size()), argv_.data(), env_);
    OUTCOME_TRY(done, configurator->step1());
    EXPECT_FALSE(done);
    OUTCOME_TRY(configurator->step2());
    return configurator->calculateConfig(logger);
  }

  void writeConfigFile(const std::string &yaml) {
    std::ofstream(base_path / "config.yaml") << yaml;
  }

  std::shared_ptr<soralog::Logger> logger;
  std::vector<std::string> args_;
  std::vector<const char *> argv_;
  const char *env_[1] = {nullptr};
  std::unique_ptr<Configurator> configurator;
};

/**
 * @given no options but base path
 * @when configuration is calculated
 * @then in-memory backend and default storage path are used
 */
TEST_F(ConfiguratorTest, Defaults) {
  ASSERT_OUTCOME_SUCCESS(config, configure({"--base-path", getPathString()}));

  EXPECT_EQ(config->basePath(), base_path);
  EXPECT_EQ(config->storage().backend, Backend::Memory);
  EXPECT_EQ(config->storage().directory, base_path / "storage");
  EXPECT_EQ(config->storage().cache_size, 64u << 20);
}

TEST_F(ConfiguratorTest, CliOverrides) {
  ASSERT_OUTCOME_SUCCESS(config,
                         configure({"--base-path",
                                    getPathString(),
                                    "--backend",
                                    "fs",
                                    "--storage-path",
                                    "files",
                                    "--cache-size",
                                    "16MiB",
                                    "-luow=trace"}));

  EXPECT_EQ(config->storage().backend, Backend::Filesystem);
  EXPECT_EQ(config->storage().directory, base_path / "files");
  EXPECT_EQ(config->storage().cache_size, 16u << 20);
  EXPECT_EQ(configurator->getLoggingCliArgs(),
            std::vector<std::string>{"uow=trace"});
}

/**
 * @given config file with storage section, and CLI option for backend
 * @when configuration is calculated
 * @then file values are used where CLI is silent
 */
TEST_F(ConfiguratorTest, ConfigFileIsOverriddenByCli) {
  writeConfigFile(R"(
general:
  base-path: )" + getPathString() + R"(
storage:
  backend: filesystem
  path: /tmp/filetx-test-configurator/data
  cache_size: 1G
)");

  ASSERT_OUTCOME_SUCCESS(
      config,
      configure({"-c", (base_path / "config.yaml").native(), "--backend",
                 "rocksdb"}));

  EXPECT_EQ(config->basePath(), base_path);
  EXPECT_EQ(config->storage().backend, Backend::RocksDb);
  EXPECT_EQ(config->storage().directory, base_path / "data");
  EXPECT_EQ(config->storage().cache_size, uint64_t{1} << 30);
}

TEST_F(ConfiguratorTest, BadBackendInFile) {
  writeConfigFile("storage:\n  backend: tape\n");

  auto res = configure({"--base-path",
                        getPathString(),
                        "-c",
                        (base_path / "config.yaml").native()});
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(), Configurator::Error::ConfigFileParseFailed);
}

TEST_F(ConfiguratorTest, BadCliValues) {
  auto backend = configure({"--base-path", getPathString(), "--backend", "x"});
  ASSERT_TRUE(backend.has_error());
  EXPECT_EQ(backend.error(), Configurator::Error::CliArgsParseFailed);

  auto size =
      configure({"--base-path", getPathString(), "--cache-size", "lots"});
  ASSERT_TRUE(size.has_error());
  EXPECT_EQ(size.error(), Configurator::Error::CliArgsParseFailed);
}

/**
 * @given storage path occupied by a regular file
 * @when filesystem backend is configured
 * @then configuration is rejected
 */
TEST_F(ConfiguratorTest, StoragePathMustBeDirectory) {
  std::ofstream(base_path / "occupied") << "x";

  auto res = configure({"--base-path",
                        getPathString(),
                        "--backend",
                        "filesystem",
                        "--storage-path",
                        "occupied"});
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(), Configurator::Error::InvalidValue);
}

TEST_F(ConfiguratorTest, BasePathMustExist) {
  auto res = configure({"--base-path", getPathString() + "/absent"});
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(), Configurator::Error::InvalidValue);
}

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "app/configuration.hpp"

namespace filetx::app {

  class ConfigurationMock : public Configuration {
   public:
    // clang-format off
    MOCK_METHOD(const std::string&, version, (), (const, override));
    MOCK_METHOD(const std::filesystem::path&, basePath, (), (const, override));

    MOCK_METHOD(const StorageConfig &, storage, (), (const, override));
    // clang-format on
  };

}  // namespace filetx::app

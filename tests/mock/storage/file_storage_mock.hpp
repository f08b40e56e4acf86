/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "storage/file_map_types.hpp"

namespace filetx::storage {

  class FileStorageMock : public FileStorage {
   public:
    MOCK_METHOD(outcome::result<bool>,
                contains,
                (const std::string_view &),
                (const, override));

    MOCK_METHOD(outcome::result<FileContent>,
                get,
                (const std::string_view &),
                (const, override));

    MOCK_METHOD(outcome::result<std::optional<FileContent>>,
                tryGet,
                (const std::string_view &),
                (const, override));

    // content is passed as rvalue, so it's matched through a proxy
    outcome::result<void> put(const std::string_view &name,
                              FileContent &&content) override {
      return putMock(name, content);
    }
    MOCK_METHOD(outcome::result<void>,
                putMock,
                (std::string_view, const FileContent &));

    MOCK_METHOD(outcome::result<void>,
                remove,
                (const std::string_view &),
                (override));

    MOCK_METHOD(outcome::result<std::vector<FileName>>,
                keys,
                (),
                (const, override));
  };

}  // namespace filetx::storage

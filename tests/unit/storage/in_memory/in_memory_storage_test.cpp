/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "storage/in_memory/in_memory_storage.hpp"
#include "storage/storage_error.hpp"
#include "testutil/literals.hpp"

using filetx::storage::InMemoryStorage;
using filetx::storage::StorageError;
using testing::ElementsAre;

TEST(InMemoryStorageTest, PutGetRemove) {
  InMemoryStorage storage;

  ASSERT_OUTCOME_SUCCESS(absent, storage.tryGet("a"));
  EXPECT_FALSE(absent.has_value());

  ASSERT_OUTCOME_SUCCESS(storage.put("a", "first"_content));
  ASSERT_OUTCOME_SUCCESS(storage.put("a", "second!"_content));
  ASSERT_OUTCOME_SUCCESS(content, storage.get("a"));
  EXPECT_EQ(content, "second!"_content);
  EXPECT_EQ(storage.byteSize(), 7u);

  ASSERT_OUTCOME_SUCCESS(storage.remove("a"));
  ASSERT_OUTCOME_SUCCESS(has, storage.contains("a"));
  EXPECT_FALSE(has);
  EXPECT_EQ(storage.byteSize(), 0u);
}

/**
 * @given empty storage
 * @when an absent name is read with get() or removed
 * @then NOT_FOUND is returned
 */
TEST(InMemoryStorageTest, AbsentNameIsNotFound) {
  InMemoryStorage storage;

  auto got = storage.get("nope");
  ASSERT_TRUE(got.has_error());
  EXPECT_EQ(got.error(), StorageError::NOT_FOUND);

  auto removed = storage.remove("nope");
  ASSERT_TRUE(removed.has_error());
  EXPECT_EQ(removed.error(), StorageError::NOT_FOUND);
}

TEST(InMemoryStorageTest, KeysAreSorted) {
  InMemoryStorage storage;
  ASSERT_OUTCOME_SUCCESS(storage.put("b", {}));
  ASSERT_OUTCOME_SUCCESS(storage.put("c", {}));
  ASSERT_OUTCOME_SUCCESS(storage.put("a", {}));

  ASSERT_OUTCOME_SUCCESS(names, storage.keys());
  EXPECT_THAT(names, ElementsAre("a", "b", "c"));
}

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <fmt/format.h>

#include "storage/storage_error.hpp"
#include "uow/commit_failure.hpp"
#include "uow/unit_of_work.hpp"

using filetx::storage::StorageError;
using filetx::uow::CommitFailure;
using filetx::uow::CommitPhase;
using filetx::uow::CompensationAction;
using filetx::uow::CompensationFailure;
using filetx::uow::UnitOfWork;

TEST(CommitFailureTest, SummaryOfCompensatedFailure) {
  CommitFailure failure{
      .phase = CommitPhase::ApplyCreates,
      .name = "report.txt",
      .error = make_error_code(StorageError::IO_ERROR),
      .compensation_failures = {},
  };

  EXPECT_TRUE(failure.fullyCompensated());
  EXPECT_EQ(failure.summary(),
            "commit failed at apply-creates on 'report.txt': "
            "IO error in storage; rolled back");
  EXPECT_EQ(fmt::format("{}", failure), failure.summary());
}

/**
 * @given failure with two compensations which could not be applied
 * @when summary is built
 * @then it names every unresolved file with its action and error
 */
TEST(CommitFailureTest, SummaryListsUnresolvedFiles) {
  CommitFailure failure{
      .phase = CommitPhase::ApplyDeletes,
      .name = "b",
      .error = make_error_code(StorageError::NOT_FOUND),
      .compensation_failures =
          {
              CompensationFailure{
                  .name = "x",
                  .action = CompensationAction::RemoveCreated,
                  .error = make_error_code(StorageError::IO_ERROR),
              },
              CompensationFailure{
                  .name = "a",
                  .action = CompensationAction::RestoreDeleted,
                  .error = make_error_code(StorageError::CORRUPTION),
              },
          },
  };

  EXPECT_FALSE(failure.fullyCompensated());
  auto summary = failure.summary();
  EXPECT_TRUE(summary.starts_with(
      "commit failed at apply-deletes on 'b': entry not found in storage; "))
      << summary;
  EXPECT_NE(summary.find("(2 unresolved:"), std::string::npos) << summary;
  EXPECT_NE(summary.find("remove-created 'x': IO error in storage;"),
            std::string::npos)
      << summary;
  EXPECT_TRUE(summary.ends_with(
      "restore-deleted 'a': data corruption in storage)"))
      << summary;
}

TEST(CommitFailureTest, EnumNames) {
  EXPECT_EQ(fmt::format("{}", CommitPhase::ApplyDeletes), "apply-deletes");
  EXPECT_EQ(fmt::format("{}", CompensationAction::RestoreDeleted),
            "restore-deleted");
  EXPECT_EQ(fmt::format("{}", UnitOfWork::State::RolledBack), "rolled-back");
}

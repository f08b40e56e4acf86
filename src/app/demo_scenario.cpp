/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/demo_scenario.hpp"

#include <algorithm>
#include <array>
#include <span>
#include <string_view>

#include "storage/storage_error.hpp"
#include "uow/impl/unit_of_work_impl.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(filetx::app, DemoScenario::Error, e) {
  using E = filetx::app::DemoScenario::Error;
  switch (e) {
    case E::UNEXPECTED_SUCCESS:
      return "Step succeeded but was expected to fail";
    case E::UNEXPECTED_FAILURE:
      return "Step failed with unexpected error";
    case E::UNEXPECTED_STATE:
      return "Storage is not in expected state";
  }
  return "Unknown DemoScenario::Error";
}

namespace filetx::app {

  namespace {
    constexpr std::array<std::string_view, 5> kFiles{
        "file1", "file2", "file3", "file4", "file5"};

    constexpr std::string_view kContent = "content";

    storage::FileContent content() {
      storage::FileContent bytes;
      bytes.resize(kContent.size());
      std::ranges::copy(kContent, bytes.begin());
      return bytes;
    }
  }  // namespace

  DemoScenario::DemoScenario(qtils::SharedRef<log::LoggingSystem> logsys,
                             qtils::SharedRef<storage::FileStorage> storage)
      : logsys_(std::move(logsys)),
        logger_(logsys_->getLogger("Demo", "application")),
        storage_(std::move(storage)) {}

  outcome::result<void> DemoScenario::run() {
    OUTCOME_TRY(cleanup());
    OUTCOME_TRY(firstBatch());
    OUTCOME_TRY(secondBatch());

    OUTCOME_TRY(expectFile("file1", true));
    OUTCOME_TRY(expectFile("file2", true));
    OUTCOME_TRY(expectFile("file3", false));
    OUTCOME_TRY(expectFile("file4", false));
    OUTCOME_TRY(expectFile("file5", false));

    report();
    SL_INFO(logger_, "Scenario finished as expected");
    return outcome::success();
  }

  outcome::result<void> DemoScenario::cleanup() {
    for (auto name : kFiles) {
      OUTCOME_TRY(present, storage_->contains(name));
      if (present) {
        SL_DEBUG(logger_, "Removing leftover '{}'", name);
        OUTCOME_TRY(storage_->remove(name));
      }
    }
    return outcome::success();
  }

  outcome::result<void> DemoScenario::firstBatch() {
    SL_INFO(logger_, "Batch 1: create file1, file2, file3");
    uow::UnitOfWorkImpl batch(logsys_, storage_);

    for (auto name : std::span(kFiles).first<3>()) {
      OUTCOME_TRY(batch.stageCreate(name, content()));
    }

    if (auto res = batch.commit(); res.has_error()) {
      SL_ERROR(logger_, "Batch 1 commit failed: {}", res.error().message());
      return res.error();
    }
    SL_INFO(logger_, "Batch 1 committed");

    for (auto name : std::span(kFiles).first<3>()) {
      OUTCOME_TRY(expectFile(name, true));
    }
    return outcome::success();
  }

  outcome::result<void> DemoScenario::secondBatch() {
    SL_INFO(logger_,
            "Batch 2: create file4, file5 and delete file1, file2, file3");
    uow::UnitOfWorkImpl batch(logsys_, storage_);

    OUTCOME_TRY(batch.stageCreate("file4", content()));
    OUTCOME_TRY(batch.stageCreate("file5", content()));
    OUTCOME_TRY(batch.stageDelete("file1"));
    OUTCOME_TRY(batch.stageDelete("file2"));
    OUTCOME_TRY(batch.stageDelete("file3"));

    SL_INFO(logger_, "Removing file3 outside of the unit of work");
    OUTCOME_TRY(storage_->remove("file3"));

    auto res = batch.commit();
    if (res.has_value()) {
      SL_ERROR(logger_, "Batch 2 committed, but it had to fail");
      return Error::UNEXPECTED_SUCCESS;
    }
    if (res.error() != storage::StorageError::NOT_FOUND) {
      SL_ERROR(logger_,
               "Batch 2 failed with unexpected error: {}",
               res.error().message());
      return Error::UNEXPECTED_FAILURE;
    }

    const auto &failure = batch.lastFailure();
    if (not failure.has_value()
        or failure->phase != uow::CommitPhase::ApplyDeletes
        or failure->name != "file3" or not failure->fullyCompensated()) {
      SL_ERROR(logger_, "Batch 2 failure is not reported as expected");
      return Error::UNEXPECTED_STATE;
    }
    SL_INFO(logger_, "Batch 2 failed as expected: {}", *failure);
    return outcome::success();
  }

  outcome::result<void> DemoScenario::expectFile(std::string_view name,
                                                 bool present) {
    OUTCOME_TRY(stored, storage_->tryGet(name));
    if (stored.has_value() != present) {
      SL_ERROR(logger_,
               "'{}' is expected to be {}",
               name,
               present ? "present" : "absent");
      return Error::UNEXPECTED_STATE;
    }
    if (present and stored.value() != content()) {
      SL_ERROR(logger_, "'{}' has unexpected content", name);
      return Error::UNEXPECTED_STATE;
    }
    return outcome::success();
  }

  void DemoScenario::report() {
    auto names = storage_->keys();
    if (names.has_error()) {
      SL_WARN(logger_, "Can't list storage: {}", names.error().message());
      return;
    }
    SL_INFO(logger_, "Storage holds {} files:", names.value().size());
    for (const auto &name : names.value()) {
      SL_INFO(logger_, "  {}", name);
    }
  }

}  // namespace filetx::app

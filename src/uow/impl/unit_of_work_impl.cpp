/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "uow/impl/unit_of_work_impl.hpp"

#include "uow/unit_of_work_error.hpp"

namespace filetx::uow {

  std::string_view toString(UnitOfWork::State state) {
    switch (state) {
      case UnitOfWork::State::Empty:
        return "empty";
      case UnitOfWork::State::Staged:
        return "staged";
      case UnitOfWork::State::Committing:
        return "committing";
      case UnitOfWork::State::RolledBack:
        return "rolled-back";
    }
    return "unknown";
  }

  UnitOfWorkImpl::UnitOfWorkImpl(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<storage::FileStorage> storage)
      : logger_(logsys->getLogger("UnitOfWork", "uow")),
        storage_(std::move(storage)) {}

  UnitOfWorkImpl::~UnitOfWorkImpl() {
    if (not creates_.empty() or not deletes_.empty()) {
      SL_DEBUG(logger_,
               "Destroyed with {} pending creates and {} pending deletes; "
               "they are dropped",
               creates_.size(),
               deletes_.size());
    }
  }

  outcome::result<void> UnitOfWorkImpl::stageCreate(
      std::string_view name, storage::FileContent content) {
    if (state_ == State::Committing) {
      return UnitOfWorkError::COMMIT_IN_PROGRESS;
    }

    // Name stays taken until its pending delete is committed
    if (deletes_.contains(name)) {
      SL_DEBUG(logger_, "Can't stage create of '{}': delete is pending", name);
      return UnitOfWorkError::ALREADY_EXISTS;
    }

    OUTCOME_TRY(exists, storage_->contains(name));
    if (exists) {
      SL_DEBUG(logger_, "Can't stage create of '{}': already exists", name);
      return UnitOfWorkError::ALREADY_EXISTS;
    }

    auto size = content.size();
    if (creates_.put(name, std::move(content))) {
      SL_TRACE(logger_, "Staged create of '{}' ({} bytes)", name, size);
    } else {
      SL_TRACE(logger_, "Restaged create of '{}' ({} bytes)", name, size);
    }
    state_ = State::Staged;
    return outcome::success();
  }

  outcome::result<void> UnitOfWorkImpl::stageDelete(std::string_view name) {
    if (state_ == State::Committing) {
      return UnitOfWorkError::COMMIT_IN_PROGRESS;
    }

    if (creates_.erase(name)) {
      SL_TRACE(logger_, "Staged delete of '{}' cancels its creation", name);
      state_ = creates_.empty() and deletes_.empty() ? State::Empty
                                                     : State::Staged;
      return outcome::success();
    }

    OUTCOME_TRY(content, storage_->tryGet(name));
    if (not content.has_value()) {
      SL_DEBUG(logger_, "Can't stage delete of '{}': not found", name);
      return UnitOfWorkError::NOT_FOUND;
    }

    SL_TRACE(logger_,
             "Staged delete of '{}' ({} bytes captured)",
             name,
             content->size());
    deletes_.put(name, std::move(content.value()));
    state_ = State::Staged;
    return outcome::success();
  }

  outcome::result<void> UnitOfWorkImpl::commit() {
    if (state_ == State::Committing) {
      return UnitOfWorkError::COMMIT_IN_PROGRESS;
    }

    if (creates_.empty() and deletes_.empty()) {
      SL_TRACE(logger_, "Nothing to commit");
      last_failure_.reset();
      state_ = State::Empty;
      return outcome::success();
    }

    state_ = State::Committing;
    SL_DEBUG(logger_,
             "Committing {} creates and {} deletes",
             creates_.size(),
             deletes_.size());

    CommitPhase phase{};
    storage::FileName failed_name;
    auto res = apply(phase, failed_name);

    if (res.has_value()) {
      SL_VERBOSE(logger_,
                 "Committed {} creates and {} deletes",
                 creates_.size(),
                 deletes_.size());
      reset();
      last_failure_.reset();
      state_ = State::Empty;
      return outcome::success();
    }

    SL_ERROR(logger_,
             "Commit failed at {} on '{}': {}; rolling back",
             phase,
             failed_name,
             res.error().message());

    last_failure_ = CommitFailure{
        .phase = phase,
        .name = std::move(failed_name),
        .error = res.error(),
        .compensation_failures = rollback(),
    };

    if (last_failure_->fullyCompensated()) {
      SL_INFO(logger_, "Rolled back: {}", *last_failure_);
    } else {
      SL_CRITICAL(logger_, "Rollback incomplete: {}", *last_failure_);
    }

    reset();
    state_ = State::RolledBack;
    return res.error();
  }

  void UnitOfWorkImpl::discard() {
    if (state_ == State::Committing) {
      SL_WARN(logger_, "Discard requested while committing; ignored");
      return;
    }
    SL_DEBUG(logger_,
             "Discarding {} creates and {} deletes",
             creates_.size(),
             deletes_.size());
    reset();
    last_failure_.reset();
    state_ = State::Empty;
  }

  outcome::result<void> UnitOfWorkImpl::apply(CommitPhase &phase,
                                              storage::FileName &failed_name) {
    applied_deletes_ = 0;
    phase = CommitPhase::ApplyCreates;
    OUTCOME_TRY(creates_.tryForEach(
        [&](const storage::FileName &name,
            const storage::FileContent &content) -> outcome::result<void> {
          failed_name = name;
          auto copy = content;
          OUTCOME_TRY(storage_->put(name, std::move(copy)));
          SL_TRACE(logger_, "Created '{}'", name);
          return outcome::success();
        }));

    phase = CommitPhase::ApplyDeletes;
    OUTCOME_TRY(deletes_.tryForEach(
        [&](const storage::FileName &name,
            const storage::FileContent &) -> outcome::result<void> {
          failed_name = name;
          OUTCOME_TRY(storage_->remove(name));
          ++applied_deletes_;
          SL_TRACE(logger_, "Deleted '{}'", name);
          return outcome::success();
        }));

    failed_name.clear();
    return outcome::success();
  }

  std::vector<CompensationFailure> UnitOfWorkImpl::rollback() {
    std::vector<CompensationFailure> failures;

    auto failed = [&](const storage::FileName &name,
                      CompensationAction action,
                      std::error_code ec) {
      SL_CRITICAL(logger_,
                  "Can't {} '{}' during rollback: {}",
                  action,
                  name,
                  ec.message());
      failures.emplace_back(CompensationFailure{
          .name = name,
          .action = action,
          .error = ec,
      });
    };

    // Every pending create, applied or not, is removed if present
    creates_.forEach([&](const storage::FileName &name,
                         const storage::FileContent &) {
      constexpr auto action = CompensationAction::RemoveCreated;
      auto exists = storage_->contains(name);
      if (exists.has_error()) {
        failed(name, action, exists.error());
        return;
      }
      if (not exists.value()) {
        return;
      }
      if (auto res = storage_->remove(name); res.has_error()) {
        failed(name, action, res.error());
        return;
      }
      SL_DEBUG(logger_, "Rollback removed created '{}'", name);
    });

    // Deletes applied by this commit are restored if absent. The rest were
    // not touched; one which vanished meanwhile stays absent
    size_t to_restore = applied_deletes_;
    deletes_.forEach([&](const storage::FileName &name,
                         const storage::FileContent &content) {
      if (to_restore == 0) {
        return;
      }
      --to_restore;
      constexpr auto action = CompensationAction::RestoreDeleted;
      auto exists = storage_->contains(name);
      if (exists.has_error()) {
        failed(name, action, exists.error());
        return;
      }
      if (exists.value()) {
        return;
      }
      auto copy = content;
      if (auto res = storage_->put(name, std::move(copy)); res.has_error()) {
        failed(name, action, res.error());
        return;
      }
      SL_DEBUG(logger_, "Rollback restored deleted '{}'", name);
    });

    return failures;
  }

  void UnitOfWorkImpl::reset() {
    creates_.reset();
    deletes_.reset();
  }

}  // namespace filetx::uow

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "uow/pending_buffer.hpp"
#include "uow/unit_of_work.hpp"

namespace filetx::uow {

  class UnitOfWorkImpl : public UnitOfWork {
   public:
    UnitOfWorkImpl(qtils::SharedRef<log::LoggingSystem> logsys,
                   qtils::SharedRef<storage::FileStorage> storage);

    ~UnitOfWorkImpl() override;

    outcome::result<void> stageCreate(std::string_view name,
                                      storage::FileContent content) override;

    outcome::result<void> stageDelete(std::string_view name) override;

    outcome::result<void> commit() override;

    void discard() override;

    State state() const override {
      return state_;
    }

    std::vector<storage::FileName> pendingCreates() const override {
      return creates_.names();
    }

    std::vector<storage::FileName> pendingDeletes() const override {
      return deletes_.names();
    }

    const std::optional<CommitFailure> &lastFailure() const override {
      return last_failure_;
    }

   private:
    outcome::result<void> apply(CommitPhase &phase,
                                storage::FileName &failed_name);

    /// Best effort; returns compensations which could not be done
    std::vector<CompensationFailure> rollback();

    void reset();

    log::Logger logger_;
    qtils::SharedRef<storage::FileStorage> storage_;

    PendingBuffer creates_;
    PendingBuffer deletes_;

    // number of leading pending deletes applied by the current commit
    size_t applied_deletes_ = 0;

    State state_ = State::Empty;
    std::optional<CommitFailure> last_failure_;
  };

}  // namespace filetx::uow

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "uow/commit_failure.hpp"

#include <iterator>

#include "uow/unit_of_work_error.hpp"

namespace filetx::uow {

  std::string_view toString(CommitPhase phase) {
    switch (phase) {
      case CommitPhase::ApplyCreates:
        return "apply-creates";
      case CommitPhase::ApplyDeletes:
        return "apply-deletes";
    }
    return "unknown";
  }

  std::string_view toString(CompensationAction action) {
    switch (action) {
      case CompensationAction::RemoveCreated:
        return "remove-created";
      case CompensationAction::RestoreDeleted:
        return "restore-deleted";
    }
    return "unknown";
  }

  std::string CommitFailure::summary() const {
    std::string out;
    auto it = std::back_inserter(out);
    fmt::format_to(it,
                   "commit failed at {} on '{}': {}",
                   phase,
                   name,
                   error.message());
    if (fullyCompensated()) {
      fmt::format_to(it, "; rolled back");
      return out;
    }
    fmt::format_to(it,
                   "; {} ({} unresolved:",
                   make_error_code(UnitOfWorkError::COMPENSATION_FAILED)
                       .message(),
                   compensation_failures.size());
    for (const auto &failure : compensation_failures) {
      fmt::format_to(it,
                     " {} '{}': {};",
                     failure.action,
                     failure.name,
                     failure.error.message());
    }
    out.back() = ')';
    return out;
  }

}  // namespace filetx::uow

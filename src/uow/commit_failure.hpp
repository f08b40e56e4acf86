/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fmt/format.h>

#include "storage/file_map_types.hpp"

namespace filetx::uow {

  enum class CommitPhase : uint8_t {
    ApplyCreates,
    ApplyDeletes,
  };

  enum class CompensationAction : uint8_t {
    RemoveCreated,
    RestoreDeleted,
  };

  std::string_view toString(CommitPhase phase);
  std::string_view toString(CompensationAction action);

  /// Compensation which could not be applied during rollback
  struct CompensationFailure {
    storage::FileName name;
    CompensationAction action;
    std::error_code error;
  };

  /**
   * Diagnostic record of a failed commit.
   * `error` is the backend error returned to the caller of commit().
   * Non-empty `compensation_failures` means the storage was left
   * inconsistent for the listed names.
   */
  struct CommitFailure {
    CommitPhase phase;
    storage::FileName name;
    std::error_code error;
    std::vector<CompensationFailure> compensation_failures;

    [[nodiscard]] bool fullyCompensated() const {
      return compensation_failures.empty();
    }

    /// One line human-readable description
    [[nodiscard]] std::string summary() const;
  };

}  // namespace filetx::uow

template <>
struct fmt::formatter<filetx::uow::CommitPhase>
    : fmt::formatter<std::string_view> {
  auto format(filetx::uow::CommitPhase phase, format_context &ctx) const {
    return fmt::formatter<std::string_view>::format(
        filetx::uow::toString(phase), ctx);
  }
};

template <>
struct fmt::formatter<filetx::uow::CompensationAction>
    : fmt::formatter<std::string_view> {
  auto format(filetx::uow::CompensationAction action,
              format_context &ctx) const {
    return fmt::formatter<std::string_view>::format(
        filetx::uow::toString(action), ctx);
  }
};

template <>
struct fmt::formatter<filetx::uow::CommitFailure>
    : fmt::formatter<std::string_view> {
  auto format(const filetx::uow::CommitFailure &failure,
              format_context &ctx) const {
    return fmt::formatter<std::string_view>::format(failure.summary(), ctx);
  }
};

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include <qtils/outcome.hpp>

#include "storage/file_map_types.hpp"
#include "uow/commit_failure.hpp"

namespace filetx::uow {

  /**
   * Collects file creations and deletions and applies them to a storage
   * together at commit().
   *
   * Staging never mutates the storage. If any mutation fails during commit,
   * already applied mutations are compensated before the error is returned,
   * so the storage ends up as it was before the commit. A name is never
   * staged for creation and deletion at the same time.
   *
   * Not thread-safe. Calls on one instance must be serialized by the caller.
   */
  class UnitOfWork {
   public:
    enum class State : uint8_t {
      Empty,       ///< nothing staged
      Staged,      ///< has pending operations
      Committing,  ///< commit() is applying or compensating
      RolledBack,  ///< last commit failed and was rolled back
    };

    virtual ~UnitOfWork() = default;

    /**
     * Stages creation of file @param name with @param content.
     * Staging the same name again replaces the pending content.
     * @return UnitOfWorkError::ALREADY_EXISTS if the file is in storage
     */
    virtual outcome::result<void> stageCreate(
        std::string_view name, storage::FileContent content) = 0;

    /**
     * Stages deletion of file @param name.
     * A pending creation of the same name is cancelled instead, without
     * touching the storage. Otherwise the current content is captured for
     * rollback.
     * @return UnitOfWorkError::NOT_FOUND if the file is neither in storage
     * nor staged for creation
     */
    virtual outcome::result<void> stageDelete(std::string_view name) = 0;

    /**
     * Applies all pending creations, then all pending deletions, each in
     * staging order.
     * On failure rolls back and returns the storage error that stopped the
     * commit; details are available through lastFailure().
     */
    virtual outcome::result<void> commit() = 0;

    /// Drops everything staged, without storage access
    virtual void discard() = 0;

    [[nodiscard]] virtual State state() const = 0;

    [[nodiscard]] virtual std::vector<storage::FileName> pendingCreates()
        const = 0;

    [[nodiscard]] virtual std::vector<storage::FileName> pendingDeletes()
        const = 0;

    /// Failure of the most recent commit, until next success or discard()
    [[nodiscard]] virtual const std::optional<CommitFailure> &lastFailure()
        const = 0;
  };

  std::string_view toString(UnitOfWork::State state);

}  // namespace filetx::uow

template <>
struct fmt::formatter<filetx::uow::UnitOfWork::State>
    : fmt::formatter<std::string_view> {
  auto format(filetx::uow::UnitOfWork::State state,
              format_context &ctx) const {
    return fmt::formatter<std::string_view>::format(
        filetx::uow::toString(state), ctx);
  }
};

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <limits>
#include <memory>

#include "storage/file_map_types.hpp"
#include "storage/storage_error.hpp"

namespace testutil {

  using filetx::storage::FileContent;
  using filetx::storage::FileName;
  using filetx::storage::FileStorage;
  using filetx::storage::StorageError;

  /**
   * Decorator which makes a chosen mutation (put or remove) of the wrapped
   * storage fail with StorageError::IO_ERROR.
   * Mutations are counted from 1. Reads are passed through, unless
   * failReadsAfterFault() is set.
   */
  class FaultyStorage : public FileStorage {
   public:
    static constexpr size_t kNever = std::numeric_limits<size_t>::max();

    explicit FaultyStorage(std::shared_ptr<FileStorage> inner)
        : inner_(std::move(inner)) {}

    /// Mutation number @param k fails
    void failMutation(size_t k) {
      fail_at_ = k;
    }

    /// Every mutation after the failed one fails too
    void failMutationsAfterFault(bool enable = true) {
      sticky_ = enable;
    }

    /// contains() and tryGet() fail once a mutation has failed
    void failReadsAfterFault(bool enable = true) {
      fail_reads_ = enable;
    }

    size_t mutations() const {
      return mutations_;
    }

    bool faulted() const {
      return faulted_;
    }

    outcome::result<bool> contains(
        const std::string_view &name) const override {
      if (faulted_ and fail_reads_) {
        return StorageError::IO_ERROR;
      }
      return inner_->contains(name);
    }

    outcome::result<FileContent> get(
        const std::string_view &name) const override {
      return inner_->get(name);
    }

    outcome::result<std::optional<FileContent>> tryGet(
        const std::string_view &name) const override {
      if (faulted_ and fail_reads_) {
        return StorageError::IO_ERROR;
      }
      return inner_->tryGet(name);
    }

    outcome::result<void> put(const std::string_view &name,
                              FileContent &&content) override {
      if (nextMutationFails()) {
        return StorageError::IO_ERROR;
      }
      return inner_->put(name, std::move(content));
    }

    outcome::result<void> remove(const std::string_view &name) override {
      if (nextMutationFails()) {
        return StorageError::IO_ERROR;
      }
      return inner_->remove(name);
    }

    outcome::result<std::vector<FileName>> keys() const override {
      return inner_->keys();
    }

   private:
    bool nextMutationFails() {
      ++mutations_;
      if (mutations_ == fail_at_ or (faulted_ and sticky_)) {
        faulted_ = true;
        return true;
      }
      return false;
    }

    std::shared_ptr<FileStorage> inner_;
    size_t fail_at_ = kNever;
    size_t mutations_ = 0;
    bool faulted_ = false;
    bool sticky_ = false;
    bool fail_reads_ = false;
  };

}  // namespace testutil

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <qtils/outcome.hpp>

#include "storage/file_map_types.hpp"

namespace filetx::uow {

  /**
   * Name to content map which remembers the order of first insertion.
   * Overwriting an entry keeps its original position.
   * Erasing leaves a hole which is skipped by iteration. Once holes
   * outnumber live entries the storage is compacted, keeping the order.
   */
  class PendingBuffer {
   public:
    using Entry = std::pair<storage::FileName, storage::FileContent>;

    /// @return true if a new entry was inserted, false if overwritten
    bool put(std::string_view name, storage::FileContent content) {
      if (auto it = index_.find(std::string{name}); it != index_.end()) {
        entries_[it->second]->second = std::move(content);
        return false;
      }
      index_.emplace(std::string{name}, entries_.size());
      entries_.emplace_back(std::in_place, std::string{name}, std::move(content));
      ++size_;
      return true;
    }

    /// @return true if the entry was present
    bool erase(std::string_view name) {
      auto it = index_.find(std::string{name});
      if (it == index_.end()) {
        return false;
      }
      entries_[it->second].reset();
      index_.erase(it);
      --size_;
      if (entries_.size() - size_ > size_) {
        compact();
      }
      return true;
    }

    [[nodiscard]] bool contains(std::string_view name) const {
      return index_.contains(std::string{name});
    }

    [[nodiscard]] bool empty() const {
      return size_ == 0;
    }

    [[nodiscard]] size_t size() const {
      return size_;
    }

    /// Number of slots held, live entries and holes together
    [[nodiscard]] size_t capacity() const {
      return entries_.size();
    }

    /// Calls @param f for every live entry in insertion order
    template <typename F>
    void forEach(F &&f) const {
      for (const auto &entry : entries_) {
        if (entry.has_value()) {
          f(entry->first, entry->second);
        }
      }
    }

    /// Like forEach(), but stops at the first failure of @param f
    template <typename F>
    outcome::result<void> tryForEach(F &&f) const {
      for (const auto &entry : entries_) {
        if (entry.has_value()) {
          OUTCOME_TRY(f(entry->first, entry->second));
        }
      }
      return outcome::success();
    }

    [[nodiscard]] std::vector<storage::FileName> names() const {
      std::vector<storage::FileName> result;
      result.reserve(size_);
      forEach([&](const storage::FileName &name, const auto &) {
        result.emplace_back(name);
      });
      return result;
    }

    void reset() {
      *this = PendingBuffer{};
    }

   private:
    void compact() {
      std::erase_if(entries_, [](const auto &entry) {
        return not entry.has_value();
      });
      for (size_t pos = 0; pos < entries_.size(); ++pos) {
        index_[entries_[pos]->first] = pos;
      }
    }

    std::vector<std::optional<Entry>> entries_;
    std::unordered_map<storage::FileName, size_t> index_;
    size_t size_ = 0;
  };

}  // namespace filetx::uow

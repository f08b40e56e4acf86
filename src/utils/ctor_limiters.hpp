/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <concepts>
#include <stdexcept>
#include <type_traits>
#include <typeinfo>

#include <fmt/format.h>

namespace filetx {

  class NonCopyable {
   public:
    NonCopyable() = default;
    ~NonCopyable() = default;
    NonCopyable(const NonCopyable &) = delete;
    NonCopyable &operator=(const NonCopyable &) = delete;
    NonCopyable(NonCopyable &&) = default;
    NonCopyable &operator=(NonCopyable &&) = default;
  };

  class NonMovable {
   public:
    NonMovable() = default;
    ~NonMovable() = default;
    NonMovable(NonMovable &&) = delete;
    NonMovable &operator=(NonMovable &&) = delete;
    NonMovable(const NonMovable &) = default;
    NonMovable &operator=(const NonMovable &) = default;
  };

  /**
   * Allows at most one live instance of `T`.
   * A second construction throws std::logic_error.
   */
  template <typename T>
    requires std::same_as<T, std::decay_t<T>>
  class Singleton : NonCopyable, NonMovable {
   public:
    Singleton() {
      if (alive.test_and_set(std::memory_order_acquire)) {
        throw std::logic_error(
            fmt::format("Second instance of singleton '{}' is not allowed",
                        typeid(T).name()));
      }
    }
    ~Singleton() {
      alive.clear(std::memory_order_release);
    }

   private:
    inline static std::atomic_flag alive;
  };

}  // namespace filetx

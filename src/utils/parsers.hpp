/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace filetx::util {

  /**
   * Parses byte size like "4096", "512Mb", "64 MiB" or "1G".
   *
   * Suffixes are case-insensitive. KB/MB/GB/TB are decimal, KiB/MiB/GiB/TiB
   * and bare K/M/G/T are binary.
   *
   * @return size in bytes, std::nullopt on malformed input or overflow
   */
  inline std::optional<uint64_t> parseByteQuantity(std::string_view input) {
    auto is_space = [](char c) {
      return std::isspace(static_cast<unsigned char>(c)) != 0;
    };
    while (not input.empty() and is_space(input.front())) {
      input.remove_prefix(1);
    }
    while (not input.empty() and is_space(input.back())) {
      input.remove_suffix(1);
    }

    uint64_t number = 0;
    auto [ptr, ec] =
        std::from_chars(input.data(), input.data() + input.size(), number);
    if (ec != std::errc() or ptr == input.data()) {
      return std::nullopt;
    }
    input.remove_prefix(ptr - input.data());
    while (not input.empty() and is_space(input.front())) {
      input.remove_prefix(1);
    }

    std::string suffix(input);
    std::ranges::transform(suffix, suffix.begin(), [](char c) {
      return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });

    uint64_t multiplier = 0;
    if (suffix.empty() or suffix == "b") {
      multiplier = 1;
    } else if (suffix.size() <= 3) {
      constexpr std::string_view prefixes = "kmgt";
      auto pos = prefixes.find(suffix.front());
      if (pos == std::string_view::npos) {
        return std::nullopt;
      }
      auto rest = std::string_view(suffix).substr(1);
      const auto power = pos + 1;
      if (rest.empty() or rest == "ib") {
        multiplier = uint64_t{1} << (10 * power);
      } else if (rest == "b") {
        multiplier = 1;
        for (size_t i = 0; i < power; ++i) {
          multiplier *= 1000;
        }
      } else {
        return std::nullopt;
      }
    } else {
      return std::nullopt;
    }

    if (number > std::numeric_limits<uint64_t>::max() / multiplier) {
      return std::nullopt;
    }
    return number * multiplier;
  }

}  // namespace filetx::util

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/build_version.hpp"

#ifndef FILETX_VERSION
#define FILETX_VERSION "unknown"
#endif

namespace filetx::app {
  const std::string &buildVersion() {
    static const std::string version(FILETX_VERSION);
    return version;
  }
}  // namespace filetx::app

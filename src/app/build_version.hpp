/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

namespace filetx::app {
  /**
   * @returns String indicating current build version
   * @note Value is passed by cmake as FILETX_VERSION
   */
  const std::string &buildVersion();
}  // namespace filetx::app

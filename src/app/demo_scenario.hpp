/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "storage/file_map_types.hpp"

namespace filetx::app {

  /**
   * Two batches over file1..file5.
   * First creates file1, file2 and file3. Second creates file4 and file5 and
   * deletes file1..file3, but file3 is removed behind its back before
   * commit, so the commit fails and is rolled back. Afterwards only file1
   * and file2 exist.
   */
  class DemoScenario {
   public:
    enum class Error : uint8_t {
      UNEXPECTED_SUCCESS = 1,
      UNEXPECTED_FAILURE,
      UNEXPECTED_STATE,
    };

    DemoScenario(qtils::SharedRef<log::LoggingSystem> logsys,
                 qtils::SharedRef<storage::FileStorage> storage);

    /// @return success when every step behaved as expected
    outcome::result<void> run();

   private:
    outcome::result<void> cleanup();
    outcome::result<void> firstBatch();
    outcome::result<void> secondBatch();
    outcome::result<void> expectFile(std::string_view name, bool present);
    void report();

    qtils::SharedRef<log::LoggingSystem> logsys_;
    log::Logger logger_;
    qtils::SharedRef<storage::FileStorage> storage_;
  };

}  // namespace filetx::app

OUTCOME_HPP_DECLARE_ERROR(filetx::app, DemoScenario::Error);

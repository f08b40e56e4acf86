/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <qtils/enum_error_code.hpp>

namespace filetx::uow {

  enum class UnitOfWorkError : uint8_t {
    ALREADY_EXISTS = 1,
    NOT_FOUND,
    COMPENSATION_FAILED,
    COMMIT_IN_PROGRESS,
  };

}

OUTCOME_HPP_DECLARE_ERROR(filetx::uow, UnitOfWorkError);

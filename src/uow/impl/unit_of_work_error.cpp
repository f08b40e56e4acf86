/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "uow/unit_of_work_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(filetx::uow, UnitOfWorkError, e) {
  using E = UnitOfWorkError;
  switch (e) {
    case E::ALREADY_EXISTS:
      return "File already exists in storage";
    case E::NOT_FOUND:
      return "File not found in storage and not staged for creation";
    case E::COMPENSATION_FAILED:
      return "Rollback could not restore some files; manual repair needed";
    case E::COMMIT_IN_PROGRESS:
      return "Unit of work is committing";
  }
  return "Unknown error";
}

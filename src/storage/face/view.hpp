/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

namespace filetx::storage::face {

  /**
   * Maps an owning key type onto the type used to pass it into storage
   * calls, e.g. std::string onto std::string_view. Specialized next to
   * the concrete storage typedefs.
   */
  template <typename T>
  struct ViewTrait;

  template <typename T>
  using View = typename ViewTrait<T>::type;

}  // namespace filetx::storage::face

//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <string_view>

#include <fmt/format.h>

namespace vigil::scene::detail {

//! Returns \p base if \p is_taken rejects it, otherwise the first of
//! `base.001`, `base.002`, ... that is free.
template <typename Pred>
auto MakeUniqueName(std::string_view base, Pred&& is_taken) -> std::string
{
  std::string candidate { base };
  for (int suffix = 1; is_taken(std::string_view { candidate }); ++suffix) {
    candidate = fmt::format("{}.{:03}", base, suffix);
  }
  return candidate;
}

} // namespace vigil::scene::detail

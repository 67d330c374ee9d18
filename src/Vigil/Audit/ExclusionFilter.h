//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <Vigil/Audit/api_export.h>

namespace vigil::audit {

//! Name-prefix filter deciding which objects scans and fixes leave alone.
/*!
 Built from a comma separated list. Each pattern is trimmed of surrounding
 whitespace and empty patterns are dropped. An object is excluded when its
 name starts with any pattern; the match is case sensitive.
*/
class ExclusionFilter {
public:
  ExclusionFilter() = default;
  VGL_AUD_API explicit ExclusionFilter(std::string_view patterns);

  VGL_AUD_NDAPI auto IsExcluded(std::string_view object_name) const -> bool;

  [[nodiscard]] auto Patterns() const noexcept
    -> const std::vector<std::string>&
  {
    return patterns_;
  }

private:
  std::vector<std::string> patterns_;
};

} // namespace vigil::audit

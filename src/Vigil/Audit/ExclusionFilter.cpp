//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <ranges>

#include <Vigil/Audit/ExclusionFilter.h>

using vigil::audit::ExclusionFilter;

namespace {

auto Trim(std::string_view text) -> std::string_view
{
  constexpr std::string_view kBlanks = " \t\r\n";
  const auto first = text.find_first_not_of(kBlanks);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(kBlanks);
  return text.substr(first, last - first + 1);
}

} // namespace

ExclusionFilter::ExclusionFilter(std::string_view patterns)
{
  for (const auto part : std::views::split(patterns, ',')) {
    const auto pattern = Trim(std::string_view(part.begin(), part.end()));
    if (!pattern.empty()) {
      patterns_.emplace_back(pattern);
    }
  }
}

auto ExclusionFilter::IsExcluded(std::string_view object_name) const -> bool
{
  return std::ranges::any_of(patterns_, [object_name](const auto& pattern) {
    return object_name.starts_with(pattern);
  });
}

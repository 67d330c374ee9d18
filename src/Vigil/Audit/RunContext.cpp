//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Vigil/Audit/RunContext.h>
#include <Vigil/Base/Logging.h>

using vigil::audit::GroupCounters;
using vigil::audit::RunContext;

auto GroupCounters::From(const FixCounts& counts) -> GroupCounters
{
  const auto at = [&counts](const FixCategory category) {
    const auto it = counts.find(category);
    return it == counts.end() ? 0 : it->second;
  };
  return {
    .materials = at(FixCategory::kMaterialsRebuilt)
      + at(FixCategory::kEmptySlotsFixed),
    .drivers
    = at(FixCategory::kDriversFixed) + at(FixCategory::kDriverChainsFixed),
    .modifiers = at(FixCategory::kModifiersFixed),
    .transforms
    = at(FixCategory::kScalesApplied) + at(FixCategory::kRotationsApplied),
    .geometry = at(FixCategory::kUvsGenerated),
    .rigging = at(FixCategory::kVertexGroupsCleaned)
      + at(FixCategory::kWeightsNormalized),
  };
}

auto RunContext::Reset() -> void
{
  percentage_ = 0;
  message_.clear();
  counters_ = {};
  errors_.clear();
  summary_.clear();
  outcome_.clear();
}

auto RunContext::SetProgress(const int percentage, std::string message) -> void
{
  DCHECK_F(percentage >= 0 && percentage <= 100);
  percentage_ = percentage;
  message_ = std::move(message);
  DLOG_F(1, "progress {}%: {}", percentage_, message_);
  if (callback_) {
    callback_(*this);
  }
}

auto RunContext::RecordError(std::string error) -> void
{
  errors_.push_back(std::move(error));
}

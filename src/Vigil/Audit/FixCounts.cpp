//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Vigil/Audit/FixCounts.h>

auto vigil::audit::to_string(const FixCategory value) -> const char*
{
  switch (value) {
  case FixCategory::kMaterialsRebuilt:
    return "materials_rebuilt";
  case FixCategory::kDisconnectedFixed:
    return "disconnected_fixed";
  case FixCategory::kDeprecatedReplaced:
    return "deprecated_replaced";
  case FixCategory::kDriversFixed:
    return "drivers_fixed";
  case FixCategory::kDriverChainsFixed:
    return "driver_chains_fixed";
  case FixCategory::kModifiersFixed:
    return "modifiers_fixed";
  case FixCategory::kEmptySlotsFixed:
    return "empty_slots_fixed";
  case FixCategory::kScalesApplied:
    return "scales_applied";
  case FixCategory::kRotationsApplied:
    return "rotations_applied";
  case FixCategory::kTexturesPacked:
    return "textures_packed";
  case FixCategory::kUvsGenerated:
    return "uvs_generated";
  case FixCategory::kVertexGroupsCleaned:
    return "vertex_groups_cleaned";
  case FixCategory::kWeightsNormalized:
    return "weights_normalized";
  case FixCategory::kParentLoopsFixed:
    return "parent_loops_fixed";
  }

  return "__NotSupported__";
}

auto vigil::audit::MakeFixCounts() -> FixCounts
{
  FixCounts counts;
  for (auto i = static_cast<uint8_t>(FixCategory::kMaterialsRebuilt);
    i <= static_cast<uint8_t>(FixCategory::kParentLoopsFixed); ++i) {
    counts.emplace(static_cast<FixCategory>(i), 0);
  }
  return counts;
}

auto vigil::audit::TotalFixes(const FixCounts& counts) -> int
{
  int total = 0;
  for (const auto& [category, count] : counts) {
    total += count;
  }
  return total;
}

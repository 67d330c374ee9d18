//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <map>

#include <Vigil/Audit/api_export.h>

namespace vigil::audit {

//! Kinds of repair counted by an auto-fix run.
enum class FixCategory : uint8_t {
  kMaterialsRebuilt,
  kDisconnectedFixed,
  kDeprecatedReplaced,
  kDriversFixed,
  kDriverChainsFixed,
  kModifiersFixed,
  kEmptySlotsFixed,
  kScalesApplied,
  kRotationsApplied,
  kTexturesPacked,
  kUvsGenerated,
  kVertexGroupsCleaned,
  kWeightsNormalized,
  kParentLoopsFixed,
};

//! Snake case key of \p value, as used in reports (`materials_rebuilt`).
VGL_AUD_API auto to_string(FixCategory value) -> const char*;

using FixCounts = std::map<FixCategory, int>;

//! A FixCounts with every category present, at zero.
VGL_AUD_NDAPI auto MakeFixCounts() -> FixCounts;

VGL_AUD_NDAPI auto TotalFixes(const FixCounts& counts) -> int;

} // namespace vigil::audit

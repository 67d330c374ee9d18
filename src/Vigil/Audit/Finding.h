//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <Vigil/Audit/api_export.h>

namespace vigil::audit {

//! Closed set of issue categories reported by the audit rules.
enum class Category : uint8_t {
  kBrokenShader,
  kTexture,
  kShaderCompat,
  kEmptySlot,
  kTransform,
  kData,
  kInvalidDriver,
  kCircularDriver,
  kMissingDriverTarget,
  kDriverChain,
  kBrokenModifier,
  kUnboundModifier,
  kUnstableModifier,
  kGeometry,
  kRigging,
  kCircularDependency,
};
VGL_AUD_API auto to_string(Category value) -> const char*;

enum class Severity : uint8_t {
  kError,
  kWarning,
};
VGL_AUD_API auto to_string(Severity value) -> const char*;

//! A defect reported by a rule for one entity, before it is attributed to an
//! object and material.
struct Issue {
  Category category;
  std::string message;
  Severity severity;

  auto operator==(const Issue&) const -> bool = default;
};

//! Material column of findings not related to a material.
inline constexpr const char* kNoMaterial = "N/A";
//! Material column of findings about an empty material slot.
inline constexpr const char* kEmptySlotMaterial = "None";

//! One entry of a scan report.
struct Finding {
  std::string object_name;
  std::string material_name { kNoMaterial };
  Category category { Category::kData };
  std::string message;
  Severity severity { Severity::kWarning };

  auto operator==(const Finding&) const -> bool = default;
};

VGL_AUD_NDAPI auto CountErrors(const std::vector<Finding>& findings)
  -> std::size_t;
VGL_AUD_NDAPI auto CountWarnings(const std::vector<Finding>& findings)
  -> std::size_t;

} // namespace vigil::audit

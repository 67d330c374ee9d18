//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <Vigil/Audit/AuditConfig.h>
#include <Vigil/Audit/Finding.h>
#include <Vigil/Audit/api_export.h>
#include <Vigil/Scene/SceneStore.h>

namespace vigil::audit::rules {

//! Mesh objects only: missing data, loose vertices, missing UV maps and high
//! polygon counts.
VGL_AUD_NDAPI auto ValidateGeometry(const scene::SceneStore& store,
  const scene::SceneObject& object, const AuditConfig& config)
  -> std::vector<Issue>;

//! Adds a "UVMap" layer to a mesh with faces and no UV layer, and unwraps it.
/*!
 Requires the object to be in the view layer and switchable to object, then
 edit, mode. Host errors raised by the unwrap propagate, after the previous
 mode and selection are restored.
*/
VGL_AUD_API auto FixMissingUvs(scene::SceneStore& store,
  std::string_view object_name, const AuditConfig& config) -> bool;

//! Thousands separated rendering of \p value, as in `120,000`.
VGL_AUD_NDAPI auto FormatCount(std::size_t value) -> std::string;

} // namespace vigil::audit::rules

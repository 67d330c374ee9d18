//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <glm/vec3.hpp>

#include <Vigil/Audit/AuditConfig.h>
#include <Vigil/Audit/Finding.h>
#include <Vigil/Audit/api_export.h>
#include <Vigil/Scene/SceneStore.h>

namespace vigil::audit::rules {

//! Names of the data blocks already handled by FixUnappliedScale() during
//! one repair run.
using ProcessedData = std::set<std::string, std::less<>>;

//! True when any axis of \p scale deviates from 1 by more than \p tolerance.
VGL_AUD_NDAPI auto HasUnappliedScale(const glm::vec3& scale, float tolerance)
  -> bool;

//! True when any Euler angle of \p rotation exceeds \p tolerance radians.
VGL_AUD_NDAPI auto HasUnappliedRotation(
  const glm::vec3& rotation, float tolerance) -> bool;

//! Reports unapplied and non-uniform scale, and unapplied rotation of meshes.
VGL_AUD_NDAPI auto ValidateTransforms(const scene::SceneObject& object,
  const AuditConfig& config) -> std::vector<Issue>;

//! Bakes the scale of \p name, and of every instance sharing its data, into
//! the data.
/*!
 Only geometry objects are handled. Instances are the objects of the same
 type referencing the same data block and themselves carrying an unapplied
 scale. Objects matching `AuditConfig::exclusion_patterns` are never baked:
 an excluded \p name is left alone, and excluded objects sharing the data
 keep the original block while the other instances get their own copy. Each instance is baked on its own exclusive copy of the data, since
 baking shared data would scale it once per user. When more than one
 instance was baked, all of them are re-linked to the first one's data and
 the blocks left without users are removed, so the instances share one block
 again.

 Instances that vanished, are outside the view layer, cannot be switched to
 object mode, or whose bake fails are skipped with a log message.

 When \p processed is given, an object whose data block is already in the set
 is left alone, and the blocks touched by this call are added to it.

 \return the number of instances baked.
*/
VGL_AUD_API auto FixUnappliedScale(scene::SceneStore& store,
  std::string_view name, const AuditConfig& config,
  ProcessedData* processed = nullptr) -> int;

//! Bakes the rotation of the mesh object \p name into its data, after making
//! the data exclusive to it. Excluded objects are left alone.
VGL_AUD_API auto FixUnappliedRotation(scene::SceneStore& store,
  std::string_view name, const AuditConfig& config) -> bool;

} // namespace vigil::audit::rules

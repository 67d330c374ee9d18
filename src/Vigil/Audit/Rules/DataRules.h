//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <vector>

#include <Vigil/Audit/Finding.h>
#include <Vigil/Audit/api_export.h>
#include <Vigil/Scene/SceneStore.h>

namespace vigil::audit::rules {

//! Mesh objects only: mesh data shared with other objects (a warning, since
//! instancing may be intended) and shape keys restricted to a vertex group
//! the object does not have.
VGL_AUD_NDAPI auto ValidateObjectData(const scene::SceneStore& store,
  const scene::SceneObject& object) -> std::vector<Issue>;

} // namespace vigil::audit::rules

//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>
#include <vector>

#include <Vigil/Audit/Finding.h>
#include <Vigil/Audit/api_export.h>
#include <Vigil/Scene/SceneStore.h>

namespace vigil::audit::rules {

//! Reports the parent loop reached from \p object, and every constraint of
//! \p object whose target constrains \p object back.
VGL_AUD_NDAPI auto ValidateDependencies(const scene::SceneStore& store,
  const scene::SceneObject& object) -> std::vector<Issue>;

//! Clears the parent of \p object_name when a parent loop is reached from it.
VGL_AUD_API auto FixParentLoop(
  scene::SceneStore& store, std::string_view object_name) -> bool;

} // namespace vigil::audit::rules

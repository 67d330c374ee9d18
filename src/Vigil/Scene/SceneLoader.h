//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <filesystem>
#include <memory>
#include <ostream>

#include <nlohmann/json_fwd.hpp>

#include <Vigil/Scene/MemorySceneStore.h>
#include <Vigil/Scene/api_export.h>

namespace vigil::scene {

//! Builds a MemorySceneStore from a JSON scene description.
/*!
 The document is an object with optional `meshes`, `materials`, `images` and
 `objects` arrays. Enum valued fields use the text of the matching
 `to_string()` (`"MESH"`, `"BSDF_PRINCIPLED"`, `"SURFACE_DEFORM"`, ...).
 Objects may list the `collections` they are linked to, and set
 `"in_view_layer": false` to be left out of the working set.

 \code{.json}
 {
   "meshes": [{ "name": "Cube", "vertices": [[1, 1, 1]], "edges": 12,
                "polygons": 6, "uv_layers": ["UVMap"] }],
   "objects": [{ "name": "Crate", "type": "MESH", "data": "Cube",
                 "scale": [2, 2, 2], "material_slots": ["Wood", null] }]
 }
 \endcode

 Problems are reported to \p errors, one `ERROR:` line each.

 \return the populated store, or nullptr if the document is invalid.
*/
VGL_SCN_NDAPI auto LoadScene(const nlohmann::json& document,
  std::ostream& errors, std::filesystem::path base_dir = {})
  -> std::unique_ptr<MemorySceneStore>;

//! Reads and loads a scene description file. Relative image paths resolve
//! against the file's directory.
VGL_SCN_NDAPI auto LoadSceneFile(
  const std::filesystem::path& path, std::ostream& errors)
  -> std::unique_ptr<MemorySceneStore>;

} // namespace vigil::scene

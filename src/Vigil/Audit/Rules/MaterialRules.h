//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include <Vigil/Audit/AuditConfig.h>
#include <Vigil/Audit/Finding.h>
#include <Vigil/Audit/api_export.h>
#include <Vigil/Scene/SceneStore.h>

namespace vigil::audit::rules {

//=== Inspection ===----------------------------------------------------------//

//! Checks that \p material produces a surface.
/*!
 A null \p material stands for a slot referencing a deleted material. The
 material is broken, with an ERROR, when it does not use nodes, has no node
 graph or no material output node; it is broken with a WARNING when the
 output's surface input is not linked.

 \return the BROKEN_SHADER issue, or std::nullopt for a usable material.
*/
VGL_AUD_NDAPI auto IsMaterialBroken(const scene::Material* material)
  -> std::optional<Issue>;

//! Checks the image and environment texture nodes of \p material.
VGL_AUD_NDAPI auto ValidateTextures(const scene::SceneStore& store,
  const scene::Material& material, const AuditConfig& config)
  -> std::vector<Issue>;

//! Reports nodes only the path-tracing renderer supports, and deprecated
//! shader nodes.
VGL_AUD_NDAPI auto CheckShaderCompatibility(const scene::Material& material)
  -> std::vector<Issue>;

//=== Repair ===--------------------------------------------------------------//

//! Resets \p material to a material output fed by a principled shader.
/*! Every existing node and link is discarded. */
VGL_AUD_API auto RebuildMaterial(scene::Material& material) -> void;

//! Returns the shared marker material, creating it on first use.
/*!
 The marker is looked up by `config.marker_material_name`. When missing, it is
 created as a red emission shader of strength 2, visible in any viewport.
*/
VGL_AUD_API auto GetOrCreateMarkerMaterial(
  scene::SceneStore& store, const AuditConfig& config) -> scene::Material&;

//! Points slot \p slot_index of \p object_name at the marker material.
/*! \return false if the object vanished or has no such slot. */
VGL_AUD_API auto MarkBrokenMaterial(scene::SceneStore& store,
  std::string_view object_name, std::size_t slot_index,
  const AuditConfig& config) -> bool;

//! Drops the empty slots of \p object_name, keeping the order of the others.
/*! Slots naming a deleted material are kept, they are broken slots rather
    than empty ones. \return the number of slots dropped. */
VGL_AUD_API auto FixEmptySlots(
  scene::SceneStore& store, std::string_view object_name) -> int;

//! Links a principled shader, the first existing one or a new one, to the
//! unlinked surface input of the material output.
VGL_AUD_API auto FixDisconnectedOutput(scene::Material& material) -> bool;

//! Replaces diffuse, glossy and emission nodes by principled shaders wired
//! to the same destinations.
/*! \return the number of nodes replaced. */
VGL_AUD_API auto ReplaceDeprecatedNodes(scene::Material& material) -> int;

//! Embeds the unpacked file images of the texture nodes of \p material whose
//! file exists.
/*! \return the number of images packed. */
VGL_AUD_API auto PackExternalTextures(
  scene::SceneStore& store, const scene::Material& material) -> int;

} // namespace vigil::audit::rules

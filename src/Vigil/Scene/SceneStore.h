//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <Vigil/Base/Macros.h>
#include <Vigil/Scene/SceneData.h>

namespace vigil::scene {

//! Host side of the scene graph, as seen by the audit engine.
/*!
 The store owns every object and data-block. The engine holds names only and
 re-resolves them through Find*() immediately before each use: an entity may
 vanish between two calls, and a null result is the normal way to learn about
 it. Pointers returned by Find*() are valid until the next call that adds or
 removes an entity of the same kind.

 Query methods never throw. The bulk operations (ApplyTransform(),
 UnwrapUvs(), NormalizeVertexGroups()) mirror host operators and throw
 `std::runtime_error` when their context preconditions do not hold:

 - ApplyTransform() requires the object to be the active object, the only
   selected object, in InteractionMode::kObject, and its data-block to have a
   single user.
 - UnwrapUvs() requires the object to be active and in InteractionMode::kEdit.
 - NormalizeVertexGroups() requires the object to be active and in
   InteractionMode::kWeightPaint.
*/
class SceneStore {
public:
  SceneStore() = default;
  virtual ~SceneStore() = default;

  VIGIL_MAKE_NON_COPYABLE(SceneStore)
  VIGIL_MAKE_NON_MOVABLE(SceneStore)

  //=== Enumeration ===-------------------------------------------------------//

  //! Names of all the objects in the scene, in creation order.
  [[nodiscard]] virtual auto GetObjectNames() const
    -> std::vector<std::string> = 0;

  //! Names of the objects linked to \p collection, or std::nullopt if there is
  //! no such collection.
  [[nodiscard]] virtual auto GetCollectionObjectNames(
    std::string_view collection) const
    -> std::optional<std::vector<std::string>> = 0;

  //=== Lookup ===------------------------------------------------------------//

  [[nodiscard]] virtual auto FindObject(std::string_view name)
    -> SceneObject* = 0;
  [[nodiscard]] virtual auto FindObject(std::string_view name) const
    -> const SceneObject* = 0;
  [[nodiscard]] virtual auto FindMesh(std::string_view name) -> MeshData* = 0;
  [[nodiscard]] virtual auto FindMesh(std::string_view name) const
    -> const MeshData* = 0;
  [[nodiscard]] virtual auto FindMaterial(std::string_view name)
    -> Material* = 0;
  [[nodiscard]] virtual auto FindMaterial(std::string_view name) const
    -> const Material* = 0;
  [[nodiscard]] virtual auto FindImage(std::string_view name) -> Image* = 0;
  [[nodiscard]] virtual auto FindImage(std::string_view name) const
    -> const Image* = 0;

  //=== Data blocks ===-------------------------------------------------------//

  //! Number of objects whose `data` names the mesh \p name.
  [[nodiscard]] virtual auto GetMeshUsers(std::string_view name) const
    -> std::size_t
    = 0;

  //! Duplicates the mesh \p name under a fresh unique name.
  /*! \return the new name, or std::nullopt if \p name does not exist. */
  [[nodiscard]] virtual auto CopyMesh(std::string_view name)
    -> std::optional<std::string> = 0;

  //! Removes the mesh \p name. Fails if it does not exist or still has users.
  virtual auto RemoveMesh(std::string_view name) -> bool = 0;

  //! Creates an empty node-based material. The store picks a unique name
  //! derived from \p name when it is already taken.
  virtual auto CreateMaterial(std::string_view name) -> Material& = 0;

  //=== Context ===-----------------------------------------------------------//

  [[nodiscard]] virtual auto GetActiveObject() const
    -> std::optional<std::string> = 0;

  //! Makes \p name the active object. Fails if it does not exist.
  virtual auto SetActiveObject(std::string_view name) -> bool = 0;
  virtual auto ClearActiveObject() -> void = 0;

  [[nodiscard]] virtual auto GetSelection() const
    -> std::vector<std::string> = 0;
  virtual auto SetSelected(std::string_view name, bool selected) -> bool = 0;
  virtual auto DeselectAll() -> void = 0;

  //! Whether the object is part of the active working set (view layer). Bulk
  //! operations only apply to such objects.
  [[nodiscard]] virtual auto IsInViewLayer(std::string_view name) const
    -> bool
    = 0;

  //! Switches the interaction mode of the object \p name.
  /*! \return false if the object does not exist or the host refuses the
      switch. */
  virtual auto SetMode(std::string_view name, InteractionMode mode) -> bool
    = 0;

  //=== Bulk operations ===---------------------------------------------------//

  //! Bakes the selected transform components into the object's data.
  virtual auto ApplyTransform(std::string_view name, bool rotation, bool scale)
    -> void
    = 0;

  //! Unwraps the active UV layer of the object's mesh.
  virtual auto UnwrapUvs(
    std::string_view name, float angle_limit, float island_margin) -> void
    = 0;

  //! Normalizes, per vertex, the weights of all the object's vertex groups.
  virtual auto NormalizeVertexGroups(std::string_view name) -> void = 0;

  //=== Images ===------------------------------------------------------------//

  //! Whether the file backing \p image exists.
  [[nodiscard]] virtual auto ImageFileExists(const Image& image) const
    -> bool
    = 0;

  //! Embeds the file backing the image \p name into the store.
  /*! \return false if the image does not exist or its file is missing. */
  virtual auto PackImage(std::string_view name) -> bool = 0;

  //=== Consistency ===-------------------------------------------------------//

  //! Flushes pending host-side evaluation and reclaims released resources.
  virtual auto Update() -> void = 0;
};

} // namespace vigil::scene

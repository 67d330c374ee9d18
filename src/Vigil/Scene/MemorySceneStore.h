//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <Vigil/Scene/SceneStore.h>
#include <Vigil/Scene/api_export.h>

namespace vigil::scene {

//! In-memory SceneStore.
/*!
 Hosts a complete scene graph in memory, for embedding applications without a
 host runtime of their own and for tests. It enforces the same context
 preconditions a real host does on its bulk operations, see SceneStore.

 Entities added with a name that is already taken are renamed with a numeric
 suffix (`Cube.001`), the way hosts usually resolve name clashes.

 Two hooks make failure paths reachable from tests:
 - an operation hook, called at the start of every bulk operation and of
   PackImage(), which may mutate the store (for example remove the object) or
   throw to simulate a host error;
 - a per-object mode lock, which makes SetMode() refuse to switch.
*/
class MemorySceneStore : public SceneStore {
public:
  //! Called with the operation name ("apply_transform", "unwrap_uvs",
  //! "normalize_vertex_groups", "pack_image") and the entity name.
  using OperationHook
    = std::function<void(std::string_view operation, std::string_view name)>;

  //! Creates an empty store. \p base_dir resolves `//` relative image paths.
  VGL_SCN_API explicit MemorySceneStore(std::filesystem::path base_dir = {});

  VGL_SCN_API ~MemorySceneStore() override;

  //=== Population ===--------------------------------------------------------//

  VGL_SCN_API auto AddObject(SceneObject object) -> SceneObject&;
  VGL_SCN_API auto AddMesh(MeshData mesh) -> MeshData&;
  VGL_SCN_API auto AddMaterial(Material material) -> Material&;
  VGL_SCN_API auto AddImage(Image image) -> Image&;

  //! Removes the object, its selection state and its collection links. Other
  //! entities referencing it are left dangling.
  VGL_SCN_API auto RemoveObject(std::string_view name) -> bool;
  VGL_SCN_API auto RemoveMaterial(std::string_view name) -> bool;

  VGL_SCN_API auto LinkToCollection(
    std::string_view collection, std::string_view object) -> bool;

  VGL_SCN_API auto SetInViewLayer(std::string_view name, bool in_view_layer)
    -> void;

  //! Registers a file path as existing, without touching the file system.
  VGL_SCN_API auto AddFile(const std::filesystem::path& path) -> void;

  VGL_SCN_API auto LockMode(std::string_view name, bool locked) -> void;
  VGL_SCN_API auto SetOperationHook(OperationHook hook) -> void;

  //=== Inspection ===--------------------------------------------------------//

  VGL_SCN_NDAPI auto GetMeshNames() const -> std::vector<std::string>;
  VGL_SCN_NDAPI auto GetMaterialNames() const -> std::vector<std::string>;

  //! Log of the bulk operations that completed, as `operation:name`.
  [[nodiscard]] auto Operations() const noexcept
    -> const std::vector<std::string>&
  {
    return operations_;
  }

  [[nodiscard]] auto UpdateCount() const noexcept -> std::size_t
  {
    return update_count_;
  }

  [[nodiscard]] auto BaseDirectory() const noexcept
    -> const std::filesystem::path&
  {
    return base_dir_;
  }

  //=== SceneStore ===--------------------------------------------------------//

  VGL_SCN_NDAPI auto GetObjectNames() const
    -> std::vector<std::string> override;
  VGL_SCN_NDAPI auto GetCollectionObjectNames(std::string_view collection) const
    -> std::optional<std::vector<std::string>> override;

  VGL_SCN_NDAPI auto FindObject(std::string_view name)
    -> SceneObject* override;
  VGL_SCN_NDAPI auto FindObject(std::string_view name) const
    -> const SceneObject* override;
  VGL_SCN_NDAPI auto FindMesh(std::string_view name) -> MeshData* override;
  VGL_SCN_NDAPI auto FindMesh(std::string_view name) const
    -> const MeshData* override;
  VGL_SCN_NDAPI auto FindMaterial(std::string_view name) -> Material* override;
  VGL_SCN_NDAPI auto FindMaterial(std::string_view name) const
    -> const Material* override;
  VGL_SCN_NDAPI auto FindImage(std::string_view name) -> Image* override;
  VGL_SCN_NDAPI auto FindImage(std::string_view name) const
    -> const Image* override;

  VGL_SCN_NDAPI auto GetMeshUsers(std::string_view name) const
    -> std::size_t override;
  VGL_SCN_NDAPI auto CopyMesh(std::string_view name)
    -> std::optional<std::string> override;
  VGL_SCN_API auto RemoveMesh(std::string_view name) -> bool override;
  VGL_SCN_API auto CreateMaterial(std::string_view name) -> Material& override;

  VGL_SCN_NDAPI auto GetActiveObject() const
    -> std::optional<std::string> override;
  VGL_SCN_API auto SetActiveObject(std::string_view name) -> bool override;
  VGL_SCN_API auto ClearActiveObject() -> void override;
  VGL_SCN_NDAPI auto GetSelection() const -> std::vector<std::string> override;
  VGL_SCN_API auto SetSelected(std::string_view name, bool selected)
    -> bool override;
  VGL_SCN_API auto DeselectAll() -> void override;
  VGL_SCN_NDAPI auto IsInViewLayer(std::string_view name) const
    -> bool override;
  VGL_SCN_API auto SetMode(std::string_view name, InteractionMode mode)
    -> bool override;

  VGL_SCN_API auto ApplyTransform(
    std::string_view name, bool rotation, bool scale) -> void override;
  VGL_SCN_API auto UnwrapUvs(std::string_view name, float angle_limit,
    float island_margin) -> void override;
  VGL_SCN_API auto NormalizeVertexGroups(std::string_view name)
    -> void override;

  VGL_SCN_NDAPI auto ImageFileExists(const Image& image) const
    -> bool override;
  VGL_SCN_API auto PackImage(std::string_view name) -> bool override;

  VGL_SCN_API auto Update() -> void override;

private:
  auto RunHook(std::string_view operation, std::string_view name) -> void;
  auto RequireActive(std::string_view name, InteractionMode mode,
    std::string_view operation) -> SceneObject&;
  [[nodiscard]] auto ResolvePath(const std::string& filepath) const
    -> std::filesystem::path;

  std::filesystem::path base_dir_;

  std::vector<std::unique_ptr<SceneObject>> objects_;
  std::map<std::string, MeshData, std::less<>> meshes_;
  std::map<std::string, Material, std::less<>> materials_;
  std::map<std::string, Image, std::less<>> images_;
  std::map<std::string, std::vector<std::string>, std::less<>> collections_;

  std::optional<std::string> active_;
  std::vector<std::string> selection_;
  std::set<std::string, std::less<>> hidden_;
  std::set<std::string, std::less<>> mode_locked_;
  std::set<std::filesystem::path> files_;

  OperationHook hook_;
  std::vector<std::string> operations_;
  std::size_t update_count_ { 0 };
};

} // namespace vigil::scene

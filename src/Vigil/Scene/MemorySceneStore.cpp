//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <ranges>
#include <stdexcept>
#include <system_error>

#include <glm/gtc/matrix_transform.hpp>
#include <glm/mat4x4.hpp>
#include <glm/vec4.hpp>

#include <Vigil/Base/Logging.h>
#include <Vigil/Scene/Detail/UniqueName.h>
#include <Vigil/Scene/MemorySceneStore.h>

using vigil::scene::Image;
using vigil::scene::Material;
using vigil::scene::MemorySceneStore;
using vigil::scene::MeshData;
using vigil::scene::SceneObject;

namespace {

auto RotationMatrix(const glm::vec3& euler) -> glm::mat4
{
  // XYZ Euler order: X is applied first.
  glm::mat4 m { 1.0F };
  m = glm::rotate(m, euler.z, glm::vec3 { 0.0F, 0.0F, 1.0F });
  m = glm::rotate(m, euler.y, glm::vec3 { 0.0F, 1.0F, 0.0F });
  m = glm::rotate(m, euler.x, glm::vec3 { 1.0F, 0.0F, 0.0F });
  return m;
}

template <typename Map, typename T>
auto InsertUnique(Map& map, T value) -> T&
{
  value.name = vigil::scene::detail::MakeUniqueName(value.name,
    [&map](std::string_view n) { return map.find(n) != map.end(); });
  auto key = value.name;
  auto [it, inserted] = map.emplace(std::move(key), std::move(value));
  return it->second;
}

template <typename Map> auto KeysOf(const Map& map) -> std::vector<std::string>
{
  std::vector<std::string> keys;
  keys.reserve(map.size());
  for (const auto& [key, _] : map) {
    keys.push_back(key);
  }
  return keys;
}

} // namespace

MemorySceneStore::MemorySceneStore(std::filesystem::path base_dir)
  : base_dir_(std::move(base_dir))
{
}

MemorySceneStore::~MemorySceneStore() = default;

//=== Population ===----------------------------------------------------------//

auto MemorySceneStore::AddObject(SceneObject object) -> SceneObject&
{
  object.name = detail::MakeUniqueName(object.name,
    [this](std::string_view n) { return FindObject(n) != nullptr; });
  objects_.push_back(std::make_unique<SceneObject>(std::move(object)));
  return *objects_.back();
}

auto MemorySceneStore::AddMesh(MeshData mesh) -> MeshData&
{
  return InsertUnique(meshes_, std::move(mesh));
}

auto MemorySceneStore::AddMaterial(Material material) -> Material&
{
  return InsertUnique(materials_, std::move(material));
}

auto MemorySceneStore::AddImage(Image image) -> Image&
{
  return InsertUnique(images_, std::move(image));
}

auto MemorySceneStore::RemoveObject(std::string_view name) -> bool
{
  const auto it = std::ranges::find_if(
    objects_, [name](const auto& object) { return object->name == name; });
  if (it == objects_.end()) {
    return false;
  }

  std::erase(selection_, name);
  if (active_ && *active_ == name) {
    active_.reset();
  }
  for (auto& [_, members] : collections_) {
    std::erase(members, name);
  }
  if (const auto hidden = hidden_.find(name); hidden != hidden_.end()) {
    hidden_.erase(hidden);
  }
  DLOG_F(1, "object '{}' removed", name);
  objects_.erase(it);
  return true;
}

auto MemorySceneStore::RemoveMaterial(std::string_view name) -> bool
{
  const auto it = materials_.find(name);
  if (it == materials_.end()) {
    return false;
  }
  materials_.erase(it);
  return true;
}

auto MemorySceneStore::LinkToCollection(
  std::string_view collection, std::string_view object) -> bool
{
  if (FindObject(object) == nullptr) {
    return false;
  }
  auto it = collections_.find(collection);
  if (it == collections_.end()) {
    it = collections_.emplace(std::string(collection), std::vector<std::string> {})
           .first;
  }
  if (std::ranges::find(it->second, object) == it->second.end()) {
    it->second.emplace_back(object);
  }
  return true;
}

auto MemorySceneStore::SetInViewLayer(
  std::string_view name, const bool in_view_layer) -> void
{
  if (in_view_layer) {
    if (const auto it = hidden_.find(name); it != hidden_.end()) {
      hidden_.erase(it);
    }
  } else {
    hidden_.emplace(name);
  }
}

auto MemorySceneStore::AddFile(const std::filesystem::path& path) -> void
{
  files_.insert(path.lexically_normal());
}

auto MemorySceneStore::LockMode(std::string_view name, const bool locked)
  -> void
{
  if (locked) {
    mode_locked_.emplace(name);
  } else if (const auto it = mode_locked_.find(name);
    it != mode_locked_.end()) {
    mode_locked_.erase(it);
  }
}

auto MemorySceneStore::SetOperationHook(OperationHook hook) -> void
{
  hook_ = std::move(hook);
}

auto MemorySceneStore::GetMeshNames() const -> std::vector<std::string>
{
  return KeysOf(meshes_);
}

auto MemorySceneStore::GetMaterialNames() const -> std::vector<std::string>
{
  return KeysOf(materials_);
}

//=== Enumeration and lookup ===----------------------------------------------//

auto MemorySceneStore::GetObjectNames() const -> std::vector<std::string>
{
  std::vector<std::string> names;
  names.reserve(objects_.size());
  for (const auto& object : objects_) {
    names.push_back(object->name);
  }
  return names;
}

auto MemorySceneStore::GetCollectionObjectNames(
  std::string_view collection) const -> std::optional<std::vector<std::string>>
{
  const auto it = collections_.find(collection);
  if (it == collections_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto MemorySceneStore::FindObject(std::string_view name) -> SceneObject*
{
  const auto it = std::ranges::find_if(
    objects_, [name](const auto& object) { return object->name == name; });
  return it == objects_.end() ? nullptr : it->get();
}

auto MemorySceneStore::FindObject(std::string_view name) const
  -> const SceneObject*
{
  const auto it = std::ranges::find_if(
    objects_, [name](const auto& object) { return object->name == name; });
  return it == objects_.end() ? nullptr : it->get();
}

auto MemorySceneStore::FindMesh(std::string_view name) -> MeshData*
{
  const auto it = meshes_.find(name);
  return it == meshes_.end() ? nullptr : &it->second;
}

auto MemorySceneStore::FindMesh(std::string_view name) const -> const MeshData*
{
  const auto it = meshes_.find(name);
  return it == meshes_.end() ? nullptr : &it->second;
}

auto MemorySceneStore::FindMaterial(std::string_view name) -> Material*
{
  const auto it = materials_.find(name);
  return it == materials_.end() ? nullptr : &it->second;
}

auto MemorySceneStore::FindMaterial(std::string_view name) const
  -> const Material*
{
  const auto it = materials_.find(name);
  return it == materials_.end() ? nullptr : &it->second;
}

auto MemorySceneStore::FindImage(std::string_view name) -> Image*
{
  const auto it = images_.find(name);
  return it == images_.end() ? nullptr : &it->second;
}

auto MemorySceneStore::FindImage(std::string_view name) const -> const Image*
{
  const auto it = images_.find(name);
  return it == images_.end() ? nullptr : &it->second;
}

//=== Data blocks ===---------------------------------------------------------//

auto MemorySceneStore::GetMeshUsers(std::string_view name) const -> std::size_t
{
  return static_cast<std::size_t>(std::ranges::count_if(
    objects_, [name](const auto& object) { return object->data == name; }));
}

auto MemorySceneStore::CopyMesh(std::string_view name)
  -> std::optional<std::string>
{
  const auto* source = FindMesh(name);
  if (source == nullptr) {
    return std::nullopt;
  }
  auto copy = *source;
  const auto& added = InsertUnique(meshes_, std::move(copy));
  DLOG_F(2, "mesh '{}' copied as '{}'", name, added.name);
  return added.name;
}

auto MemorySceneStore::RemoveMesh(std::string_view name) -> bool
{
  const auto it = meshes_.find(name);
  if (it == meshes_.end() || GetMeshUsers(name) > 0) {
    return false;
  }
  meshes_.erase(it);
  return true;
}

auto MemorySceneStore::CreateMaterial(std::string_view name) -> Material&
{
  return InsertUnique(materials_,
    Material {
      .name = std::string(name),
      .use_nodes = true,
      .node_tree = NodeGraph {},
    });
}

//=== Context ===-------------------------------------------------------------//

auto MemorySceneStore::GetActiveObject() const -> std::optional<std::string>
{
  return active_;
}

auto MemorySceneStore::SetActiveObject(std::string_view name) -> bool
{
  if (FindObject(name) == nullptr) {
    return false;
  }
  active_ = std::string(name);
  return true;
}

auto MemorySceneStore::ClearActiveObject() -> void { active_.reset(); }

auto MemorySceneStore::GetSelection() const -> std::vector<std::string>
{
  return selection_;
}

auto MemorySceneStore::SetSelected(std::string_view name, const bool selected)
  -> bool
{
  if (FindObject(name) == nullptr) {
    return false;
  }
  const auto it = std::ranges::find(selection_, name);
  if (selected && it == selection_.end()) {
    selection_.emplace_back(name);
  } else if (!selected && it != selection_.end()) {
    selection_.erase(it);
  }
  return true;
}

auto MemorySceneStore::DeselectAll() -> void { selection_.clear(); }

auto MemorySceneStore::IsInViewLayer(std::string_view name) const -> bool
{
  return FindObject(name) != nullptr && !hidden_.contains(name);
}

auto MemorySceneStore::SetMode(
  std::string_view name, const InteractionMode mode) -> bool
{
  auto* object = FindObject(name);
  if (object == nullptr) {
    return false;
  }
  if (object->mode == mode) {
    return true;
  }
  if (mode_locked_.contains(name)) {
    DLOG_F(1, "mode switch of '{}' to {} refused", name, to_string(mode));
    return false;
  }
  object->mode = mode;
  return true;
}

//=== Bulk operations ===-----------------------------------------------------//

auto MemorySceneStore::RunHook(
  std::string_view operation, std::string_view name) -> void
{
  if (hook_) {
    hook_(operation, name);
  }
}

auto MemorySceneStore::RequireActive(std::string_view name,
  const InteractionMode mode, std::string_view operation) -> SceneObject&
{
  auto* object = FindObject(name);
  if (object == nullptr) {
    throw std::runtime_error(
      fmt::format("{}: object '{}' does not exist", operation, name));
  }
  if (!active_ || *active_ != name) {
    throw std::runtime_error(
      fmt::format("{}: '{}' is not the active object", operation, name));
  }
  if (object->mode != mode) {
    throw std::runtime_error(fmt::format("{}: '{}' must be in {} mode",
      operation, name, to_string(mode)));
  }
  return *object;
}

auto MemorySceneStore::ApplyTransform(
  std::string_view name, const bool rotation, const bool scale) -> void
{
  RunHook("apply_transform", name);
  auto& object
    = RequireActive(name, InteractionMode::kObject, "apply_transform");
  if (selection_.size() != 1 || selection_.front() != name) {
    throw std::runtime_error(fmt::format(
      "apply_transform: '{}' must be the only selected object", name));
  }

  if (auto* mesh = FindMesh(object.data); mesh != nullptr) {
    if (GetMeshUsers(mesh->name) > 1) {
      throw std::runtime_error(
        fmt::format("Cannot apply to a multi user: Object \"{}\", Mesh "
                    "\"{}\", aborting",
          name, mesh->name));
    }
    glm::mat4 basis { 1.0F };
    if (rotation) {
      basis = RotationMatrix(object.transform.rotation);
    }
    if (scale) {
      basis = glm::scale(basis, object.transform.scale);
    }
    for (auto& vertex : mesh->vertices) {
      vertex = glm::vec3(basis * glm::vec4(vertex, 1.0F));
    }
  }

  if (rotation) {
    object.transform.rotation = glm::vec3 { 0.0F };
  }
  if (scale) {
    object.transform.scale = glm::vec3 { 1.0F };
  }
  operations_.push_back(fmt::format("apply_transform:{}", name));
}

auto MemorySceneStore::UnwrapUvs(std::string_view name,
  const float angle_limit, const float island_margin) -> void
{
  RunHook("unwrap_uvs", name);
  const auto& object = RequireActive(name, InteractionMode::kEdit, "unwrap_uvs");
  const auto* mesh = FindMesh(object.data);
  if (mesh == nullptr || mesh->uv_layers.empty()) {
    throw std::runtime_error(
      fmt::format("unwrap_uvs: '{}' has no active UV layer", name));
  }
  DLOG_F(2, "unwrap '{}' angle_limit={} island_margin={}", name, angle_limit,
    island_margin);
  operations_.push_back(fmt::format("unwrap_uvs:{}", name));
}

auto MemorySceneStore::NormalizeVertexGroups(std::string_view name) -> void
{
  RunHook("normalize_vertex_groups", name);
  auto& object = RequireActive(
    name, InteractionMode::kWeightPaint, "normalize_vertex_groups");

  std::map<uint32_t, float> totals;
  for (const auto& group : object.vertex_groups) {
    for (const auto& [vertex, weight] : group.weights) {
      totals[vertex] += weight;
    }
  }
  for (auto& group : object.vertex_groups) {
    for (auto& [vertex, weight] : group.weights) {
      if (const auto total = totals[vertex]; total > 0.0F) {
        weight /= total;
      }
    }
  }
  operations_.push_back(fmt::format("normalize_vertex_groups:{}", name));
}

//=== Images ===--------------------------------------------------------------//

auto MemorySceneStore::ResolvePath(const std::string& filepath) const
  -> std::filesystem::path
{
  if (filepath.starts_with("//")) {
    return (base_dir_ / filepath.substr(2)).lexically_normal();
  }
  return std::filesystem::path(filepath).lexically_normal();
}

auto MemorySceneStore::ImageFileExists(const Image& image) const -> bool
{
  if (image.filepath.empty()) {
    return false;
  }
  const auto path = ResolvePath(image.filepath);
  if (files_.contains(path)) {
    return true;
  }
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

auto MemorySceneStore::PackImage(std::string_view name) -> bool
{
  RunHook("pack_image", name);
  auto* image = FindImage(name);
  if (image == nullptr || image->packed || !ImageFileExists(*image)) {
    return false;
  }
  image->packed = true;
  operations_.push_back(fmt::format("pack_image:{}", name));
  return true;
}

auto MemorySceneStore::Update() -> void { ++update_count_; }

//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <exception>
#include <optional>
#include <set>
#include <string>
#include <variant>

#include <fmt/format.h>

#include <Vigil/Audit/Rules/RiggingRules.h>
#include <Vigil/Audit/ScopedObjectAccess.h>
#include <Vigil/Base/Logging.h>

using vigil::audit::Category;
using vigil::audit::Issue;
using vigil::audit::Severity;
using vigil::audit::rules::VertexGroupFixes;
using vigil::scene::ArmatureModifier;
using vigil::scene::InteractionMode;
using vigil::scene::MeshData;
using vigil::scene::ObjectType;
using vigil::scene::SceneObject;
using vigil::scene::SceneStore;
using vigil::scene::VertexGroup;

namespace {

struct GroupStats {
  std::size_t vertex_count { 0 };
  float total_weight { 0.0F };

  [[nodiscard]] auto IsEmptyOrWeightless() const -> bool
  {
    return vertex_count == 0 || total_weight == 0.0F;
  }
};

auto ComputeStats(const VertexGroup& group, const MeshData& mesh) -> GroupStats
{
  GroupStats stats;
  for (const auto& [index, weight] : group.weights) {
    if (index < mesh.vertices.size()) {
      ++stats.vertex_count;
      stats.total_weight += weight;
    }
  }
  return stats;
}

//! Bones of the armature deforming \p object, or std::nullopt when its first
//! armature modifier with an object does not resolve to an armature.
auto DeformingBones(const SceneStore& store, const SceneObject& object)
  -> std::optional<std::set<std::string>>
{
  for (const auto& modifier : object.modifiers) {
    const auto* armature = std::get_if<ArmatureModifier>(&modifier.settings);
    if (armature == nullptr || armature->object.empty()) {
      continue;
    }
    const auto* rig = store.FindObject(armature->object);
    if (rig == nullptr || rig->type != ObjectType::kArmature) {
      return std::nullopt;
    }
    return std::set<std::string> { rig->bones.begin(), rig->bones.end() };
  }
  return std::nullopt;
}

auto Warning(std::string message) -> Issue
{
  return {
    .category = Category::kRigging,
    .message = std::move(message),
    .severity = Severity::kWarning,
  };
}

auto Normalize(SceneStore& store, std::string_view name) -> bool
{
  if (!store.IsInViewLayer(name)) {
    DLOG_F(1, "skipping normalization of '{}': not in view layer", name);
    return false;
  }
  if (!vigil::audit::EnsureObjectMode(store, name)) {
    return false;
  }
  try {
    const vigil::audit::ScopedObjectAccess access { store, name };
    if (!access.IsAcquired()) {
      return false;
    }
    const vigil::audit::ScopedInteractionMode weight_paint { store, name,
      InteractionMode::kWeightPaint };
    if (!weight_paint.IsActive()) {
      return false;
    }
    store.NormalizeVertexGroups(name);
    return true;
  } catch (const std::exception& ex) {
    LOG_F(WARNING, "failed to normalize weights of '{}': {}", name, ex.what());
    return false;
  }
}

} // namespace

auto vigil::audit::rules::ValidateVertexGroups(
  const SceneStore& store, const SceneObject& object) -> std::vector<Issue>
{
  std::vector<Issue> issues;
  if (object.type != ObjectType::kMesh || object.vertex_groups.empty()) {
    return issues;
  }
  const auto* mesh = store.FindMesh(object.data);
  if (object.data.empty() || mesh == nullptr) {
    return issues;
  }

  for (const auto& group : object.vertex_groups) {
    const auto stats = ComputeStats(group, *mesh);
    if (stats.vertex_count == 0) {
      issues.push_back(Warning(fmt::format(
        "Vertex group '{}' is empty (no vertices assigned)", group.name)));
    } else if (stats.total_weight == 0.0F) {
      issues.push_back(Warning(
        fmt::format("Vertex group '{}' has zero total weight", group.name)));
    }
  }

  if (const auto bones = DeformingBones(store, object)) {
    for (const auto& group : object.vertex_groups) {
      if (!bones->contains(group.name)) {
        issues.push_back(Warning(fmt::format(
          "Orphaned vertex group '{}' (no matching bone in armature)",
          group.name)));
      }
    }
  }
  return issues;
}

auto vigil::audit::rules::FixVertexGroups(
  SceneStore& store, std::string_view object_name) -> VertexGroupFixes
{
  VertexGroupFixes fixes;
  auto* object = store.FindObject(object_name);
  if (object == nullptr || object->type != ObjectType::kMesh
    || object->vertex_groups.empty()) {
    return fixes;
  }
  const auto* mesh = store.FindMesh(object->data);
  if (object->data.empty() || mesh == nullptr) {
    return fixes;
  }

  const auto bones
    = DeformingBones(store, *object).value_or(std::set<std::string> {});
  std::erase_if(object->vertex_groups, [&](const VertexGroup& group) {
    if (ComputeStats(group, *mesh).IsEmptyOrWeightless()) {
      ++fixes.empty_removed;
      DLOG_F(1, "'{}': empty vertex group '{}' removed", object_name,
        group.name);
      return true;
    }
    if (!bones.empty() && !bones.contains(group.name)) {
      ++fixes.orphaned_removed;
      DLOG_F(1, "'{}': orphaned vertex group '{}' removed", object_name,
        group.name);
      return true;
    }
    return false;
  });

  if (!object->vertex_groups.empty() && Normalize(store, object_name)) {
    fixes.normalized = 1;
  }
  return fixes;
}

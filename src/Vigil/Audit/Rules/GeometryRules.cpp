//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <cstddef>
#include <string>

#include <fmt/format.h>

#include <Vigil/Audit/Rules/GeometryRules.h>
#include <Vigil/Audit/ScopedObjectAccess.h>
#include <Vigil/Base/Logging.h>

using vigil::audit::AuditConfig;
using vigil::audit::Category;
using vigil::audit::Issue;
using vigil::audit::Severity;
using vigil::scene::InteractionMode;
using vigil::scene::ObjectType;
using vigil::scene::SceneObject;
using vigil::scene::SceneStore;

namespace {

constexpr const char* kDefaultUvLayer = "UVMap";

auto GeometryIssue(std::string message, const Severity severity) -> Issue
{
  return {
    .category = Category::kGeometry,
    .message = std::move(message),
    .severity = severity,
  };
}

} // namespace

auto vigil::audit::rules::FormatCount(const std::size_t value) -> std::string
{
  auto digits = std::to_string(value);
  for (auto pos = static_cast<std::ptrdiff_t>(digits.size()) - 3; pos > 0;
    pos -= 3) {
    digits.insert(static_cast<std::size_t>(pos), 1, ',');
  }
  return digits;
}

auto vigil::audit::rules::ValidateGeometry(const SceneStore& store,
  const SceneObject& object, const AuditConfig& config) -> std::vector<Issue>
{
  std::vector<Issue> issues;
  if (object.type != ObjectType::kMesh) {
    return issues;
  }
  const auto* mesh = store.FindMesh(object.data);
  if (object.data.empty() || mesh == nullptr) {
    issues.push_back(
      GeometryIssue("Mesh object has no data.", Severity::kError));
    return issues;
  }

  const auto vertices = mesh->vertices.size();
  const auto polygons = mesh->polygon_count;
  if (polygons == 0 && vertices > 0) {
    issues.push_back(GeometryIssue(
      fmt::format("Mesh has {} vertices but no faces", vertices),
      Severity::kWarning));
  }
  if (mesh->edge_count == 0 && vertices > 0) {
    issues.push_back(GeometryIssue(
      fmt::format("Mesh has {} loose vertices (no edges)", vertices),
      Severity::kWarning));
  }
  if (mesh->uv_layers.empty() && polygons > 0) {
    issues.push_back(GeometryIssue("Mesh has no UV maps", Severity::kError));
  }

  if (polygons > config.very_high_poly_threshold) {
    issues.push_back(GeometryIssue(
      fmt::format("Very high poly count: {} faces (may cause performance "
                  "issues)",
        FormatCount(polygons)),
      Severity::kWarning));
  } else if (polygons > config.high_poly_threshold) {
    issues.push_back(GeometryIssue(
      fmt::format("High poly count: {} faces", FormatCount(polygons)),
      Severity::kWarning));
  }
  return issues;
}

auto vigil::audit::rules::FixMissingUvs(SceneStore& store,
  std::string_view object_name, const AuditConfig& config) -> bool
{
  const auto* object = store.FindObject(object_name);
  if (object == nullptr || object->type != ObjectType::kMesh) {
    return false;
  }
  const auto* mesh = store.FindMesh(object->data);
  if (object->data.empty() || mesh == nullptr || !mesh->uv_layers.empty()
    || mesh->polygon_count == 0) {
    return false;
  }
  const auto mesh_name = mesh->name;
  if (!store.IsInViewLayer(object_name)) {
    DLOG_F(1, "skipping '{}': not in view layer", object_name);
    return false;
  }
  if (!EnsureObjectMode(store, object_name)) {
    return false;
  }

  ScopedObjectAccess access { store, object_name };
  if (!access.IsAcquired()) {
    return false;
  }
  auto* target = store.FindMesh(mesh_name);
  if (target == nullptr) {
    return false;
  }
  target->uv_layers.emplace_back(kDefaultUvLayer);

  const ScopedInteractionMode edit_mode { store, object_name,
    InteractionMode::kEdit };
  if (!edit_mode.IsActive()) {
    return false;
  }
  store.UnwrapUvs(object_name, config.uv_angle_limit, config.uv_island_margin);
  DLOG_F(1, "'{}': UV layer '{}' generated", object_name, kDefaultUvLayer);
  return true;
}

//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>

#include <fmt/format.h>

#include <Vigil/Audit/Rules/DataRules.h>

using vigil::audit::Category;
using vigil::audit::Issue;
using vigil::audit::Severity;
using vigil::scene::ObjectType;
using vigil::scene::SceneObject;
using vigil::scene::SceneStore;

auto vigil::audit::rules::ValidateObjectData(
  const SceneStore& store, const SceneObject& object) -> std::vector<Issue>
{
  std::vector<Issue> issues;
  if (object.type != ObjectType::kMesh || object.data.empty()) {
    return issues;
  }
  const auto* mesh = store.FindMesh(object.data);
  if (mesh == nullptr) {
    return issues;
  }

  if (const auto users = store.GetMeshUsers(mesh->name); users > 1) {
    issues.push_back({
      .category = Category::kData,
      .message = fmt::format(
        "Mesh data '{}' has {} users (linked duplicates)", mesh->name, users),
      .severity = Severity::kWarning,
    });
  }

  for (const auto& key : mesh->shape_keys) {
    if (key.vertex_group.empty()) {
      continue;
    }
    const auto found = std::ranges::any_of(object.vertex_groups,
      [&key](const auto& group) { return group.name == key.vertex_group; });
    if (!found) {
      issues.push_back({
        .category = Category::kData,
        .message
        = fmt::format("Shape key '{}' references missing vertex group '{}'",
          key.name, key.vertex_group),
        .severity = Severity::kError,
      });
    }
  }
  return issues;
}

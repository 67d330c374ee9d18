//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>

#include <fmt/format.h>

#include <Vigil/Audit/CycleDetector.h>
#include <Vigil/Audit/Rules/DependencyRules.h>
#include <Vigil/Base/Logging.h>

using vigil::audit::Category;
using vigil::audit::Issue;
using vigil::audit::Severity;
using vigil::scene::SceneObject;
using vigil::scene::SceneStore;

auto vigil::audit::rules::ValidateDependencies(
  const SceneStore& store, const SceneObject& object) -> std::vector<Issue>
{
  std::vector<Issue> issues;

  if (const auto loop = DetectParentChain(store, object.name)) {
    issues.push_back({
      .category = Category::kCircularDependency,
      .message = fmt::format("Parent loop detected: {}", FormatChain(*loop)),
      .severity = Severity::kError,
    });
  }

  for (const auto& constraint : object.constraints) {
    if (constraint.target.empty()) {
      continue;
    }
    const auto* target = store.FindObject(constraint.target);
    if (target == nullptr) {
      continue;
    }
    const auto reciprocal = std::ranges::any_of(target->constraints,
      [&object](const auto& back) { return back.target == object.name; });
    if (reciprocal) {
      issues.push_back({
        .category = Category::kCircularDependency,
        .message = fmt::format(
          "Constraint loop: '{}' ↔ '{}'", object.name, target->name),
        .severity = Severity::kError,
      });
    }
  }
  return issues;
}

auto vigil::audit::rules::FixParentLoop(
  SceneStore& store, std::string_view object_name) -> bool
{
  auto* object = store.FindObject(object_name);
  if (object == nullptr || !DetectParentChain(store, object_name)) {
    return false;
  }
  LOG_F(INFO, "parent loop broken at '{}' (parent '{}' cleared)", object_name,
    object->parent);
  object->parent.clear();
  return true;
}

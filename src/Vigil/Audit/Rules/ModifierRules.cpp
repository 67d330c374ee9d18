//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <string>
#include <variant>

#include <fmt/format.h>

#include <Vigil/Audit/Rules/ModifierRules.h>
#include <Vigil/Base/Logging.h>
#include <Vigil/Base/VariantHelpers.h>

using vigil::Overloads;
using vigil::audit::Category;
using vigil::audit::Issue;
using vigil::audit::Severity;
using vigil::scene::ArmatureModifier;
using vigil::scene::ArrayModifier;
using vigil::scene::BooleanModifier;
using vigil::scene::DataTransferModifier;
using vigil::scene::GenericModifier;
using vigil::scene::InteractionMode;
using vigil::scene::Modifier;
using vigil::scene::SceneObject;
using vigil::scene::SceneStore;
using vigil::scene::ShrinkwrapModifier;
using vigil::scene::SurfaceDeformModifier;

namespace {

auto Resolves(const SceneStore& store, const std::string& name) -> bool
{
  return !name.empty() && store.FindObject(name) != nullptr;
}

auto Error(const Category category, std::string message) -> Issue
{
  return {
    .category = category,
    .message = std::move(message),
    .severity = Severity::kError,
  };
}

auto Check(const SceneStore& store, const Modifier& modifier,
  std::vector<Issue>& issues) -> void
{
  const auto& name = modifier.name;
  std::visit(
    Overloads {
      [&](const ArrayModifier& array) {
        if (array.use_object_offset && !Resolves(store, array.offset_object)) {
          issues.push_back({
            .category = Category::kBrokenModifier,
            .message = fmt::format("Array modifier '{}' has Object Offset "
                                   "enabled but no object set",
              name),
            .severity = Severity::kWarning,
          });
        }
      },
      [&](const BooleanModifier& boolean) {
        if (boolean.object.empty()) {
          issues.push_back(Error(Category::kBrokenModifier,
            fmt::format("Boolean modifier '{}' has no target object", name)));
        } else if (!Resolves(store, boolean.object)) {
          issues.push_back(Error(Category::kBrokenModifier,
            fmt::format(
              "Boolean modifier '{}' target object is missing", name)));
        }
      },
      [&](const ShrinkwrapModifier& shrinkwrap) {
        if (!Resolves(store, shrinkwrap.target)) {
          issues.push_back(Error(Category::kBrokenModifier,
            fmt::format("Shrinkwrap modifier '{}' has no target", name)));
        }
      },
      [&](const ArmatureModifier& armature) {
        if (!Resolves(store, armature.object)) {
          issues.push_back(Error(Category::kBrokenModifier,
            fmt::format(
              "Armature modifier '{}' has no armature object", name)));
        }
      },
      [&](const SurfaceDeformModifier& deform) {
        if (!deform.is_bound) {
          issues.push_back(Error(Category::kUnboundModifier,
            fmt::format("Surface Deform modifier '{}' is not bound - bind it "
                        "or remove it to prevent crashes",
              name)));
          return;
        }
        const auto* target = store.FindObject(deform.target);
        if (!deform.target.empty() && target != nullptr
          && target->mode != InteractionMode::kObject) {
          issues.push_back(Error(Category::kUnstableModifier,
            fmt::format("Surface Deform target '{}' is in {} mode - this is "
                        "unstable",
              target->name, scene::to_string(target->mode))));
        }
      },
      [&](const DataTransferModifier& transfer) {
        if (!Resolves(store, transfer.object)) {
          issues.push_back(Error(Category::kBrokenModifier,
            fmt::format(
              "Data Transfer modifier '{}' has no source object", name)));
        }
      },
      [](const GenericModifier&) {},
    },
    modifier.settings);
}

//! Repairs \p modifier in place when possible.
/*! \return true if the modifier must be removed instead. */
auto RepairOrFlagForRemoval(
  const SceneStore& store, Modifier& modifier, int& repaired) -> bool
{
  return std::visit(
    Overloads {
      [&](ArrayModifier& array) {
        if (array.use_object_offset && !Resolves(store, array.offset_object)) {
          array.use_object_offset = false;
          ++repaired;
        }
        return false;
      },
      [&](const BooleanModifier& boolean) {
        return !Resolves(store, boolean.object);
      },
      [&](const ShrinkwrapModifier& shrinkwrap) {
        return !Resolves(store, shrinkwrap.target);
      },
      [&](const ArmatureModifier& armature) {
        return !Resolves(store, armature.object);
      },
      [](const SurfaceDeformModifier& deform) { return !deform.is_bound; },
      [&](const DataTransferModifier& transfer) {
        return !Resolves(store, transfer.object);
      },
      [](const GenericModifier&) { return false; },
    },
    modifier.settings);
}

} // namespace

auto vigil::audit::rules::ValidateModifiers(
  const SceneStore& store, const SceneObject& object) -> std::vector<Issue>
{
  std::vector<Issue> issues;
  for (const auto& modifier : object.modifiers) {
    Check(store, modifier, issues);
  }
  return issues;
}

auto vigil::audit::rules::FixBrokenModifiers(
  SceneStore& store, std::string_view object_name) -> int
{
  auto* object = store.FindObject(object_name);
  if (object == nullptr) {
    return 0;
  }

  int fixed = 0;
  std::vector<std::string> doomed;
  for (auto& modifier : object->modifiers) {
    if (RepairOrFlagForRemoval(store, modifier, fixed)) {
      doomed.push_back(modifier.name);
    }
  }
  for (const auto& name : doomed) {
    std::erase_if(object->modifiers,
      [&name](const Modifier& m) { return m.name == name; });
    DLOG_F(1, "modifier '{}' removed from '{}'", name, object_name);
  }
  return fixed + static_cast<int>(doomed.size());
}

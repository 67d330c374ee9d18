//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <cmath>
#include <exception>

#include <fmt/format.h>

#include <Vigil/Audit/ExclusionFilter.h>
#include <Vigil/Audit/Rules/TransformRules.h>
#include <Vigil/Audit/ScopedObjectAccess.h>
#include <Vigil/Base/Logging.h>

using vigil::audit::AuditConfig;
using vigil::audit::Category;
using vigil::audit::Issue;
using vigil::audit::Severity;
using vigil::scene::ObjectType;
using vigil::scene::SceneObject;
using vigil::scene::SceneStore;

namespace {

//! Makes the data of \p name exclusive to it, copying a mesh shared with
//! other objects.
auto MakeDataExclusive(SceneStore& store, std::string_view name) -> void
{
  auto* object = store.FindObject(name);
  if (object == nullptr || object->data.empty()
    || store.FindMesh(object->data) == nullptr
    || store.GetMeshUsers(object->data) <= 1) {
    return;
  }
  const auto copy = store.CopyMesh(object->data);
  if (!copy) {
    return;
  }
  DLOG_F(2, "'{}' now uses its own copy '{}' of '{}'", name, *copy,
    object->data);
  object->data = *copy;
}

//! Excluded objects are never part of the group, even when they share the
//! data block.
auto CollectInstances(const SceneStore& store, const SceneObject& object,
  const float tolerance, const vigil::audit::ExclusionFilter& filter)
  -> std::vector<std::string>
{
  if (object.data.empty()) {
    return { object.name };
  }
  std::vector<std::string> instances;
  for (const auto& candidate_name : store.GetObjectNames()) {
    if (filter.IsExcluded(candidate_name)) {
      continue;
    }
    const auto* candidate = store.FindObject(candidate_name);
    if (candidate != nullptr && candidate->type == object.type
      && candidate->data == object.data
      && vigil::audit::rules::HasUnappliedScale(
        candidate->transform.scale, tolerance)) {
      instances.push_back(candidate_name);
    }
  }
  return instances;
}

auto BakeScale(SceneStore& store, const std::string& instance) -> bool
{
  if (store.FindObject(instance) == nullptr) {
    DLOG_F(1, "'{}' vanished before scale bake", instance);
    return false;
  }
  if (!store.IsInViewLayer(instance)) {
    DLOG_F(1, "skipping '{}': not in view layer", instance);
    return false;
  }
  if (!vigil::audit::EnsureObjectMode(store, instance)) {
    return false;
  }
  try {
    vigil::audit::ScopedObjectAccess access { store, instance };
    if (!access.IsAcquired()) {
      return false;
    }
    MakeDataExclusive(store, instance);
    store.ApplyTransform(instance, false, true);
    return true;
  } catch (const std::exception& ex) {
    LOG_F(WARNING, "failed to apply scale to '{}': {}", instance, ex.what());
    return false;
  }
}

//! Re-links every baked instance to the data of the first one.
auto RestoreInstancing(SceneStore& store, const std::vector<std::string>& fixed)
  -> void
{
  const auto* master_object = store.FindObject(fixed.front());
  if (master_object == nullptr) {
    return;
  }
  const auto master = master_object->data;
  for (auto it = fixed.begin() + 1; it != fixed.end(); ++it) {
    auto* instance = store.FindObject(*it);
    if (instance == nullptr || instance->data == master) {
      continue;
    }
    const auto old_data = instance->data;
    instance->data = master;
    if (!old_data.empty() && store.FindMesh(old_data) != nullptr
      && store.GetMeshUsers(old_data) == 0 && !store.RemoveMesh(old_data)) {
      LOG_F(WARNING, "failed to remove orphaned mesh '{}'", old_data);
    }
  }
}

} // namespace

auto vigil::audit::rules::HasUnappliedScale(
  const glm::vec3& scale, const float tolerance) -> bool
{
  return std::abs(scale.x - 1.0F) > tolerance
    || std::abs(scale.y - 1.0F) > tolerance
    || std::abs(scale.z - 1.0F) > tolerance;
}

auto vigil::audit::rules::HasUnappliedRotation(
  const glm::vec3& rotation, const float tolerance) -> bool
{
  return std::abs(rotation.x) > tolerance || std::abs(rotation.y) > tolerance
    || std::abs(rotation.z) > tolerance;
}

auto vigil::audit::rules::ValidateTransforms(
  const SceneObject& object, const AuditConfig& config) -> std::vector<Issue>
{
  std::vector<Issue> issues;
  const auto& scale = object.transform.scale;
  const auto tolerance = config.transform_tolerance;

  if (HasUnappliedScale(scale, tolerance)) {
    issues.push_back({
      .category = Category::kTransform,
      .message = fmt::format(
        "Unapplied scale: ({:.3f}, {:.3f}, {:.3f})", scale.x, scale.y, scale.z),
      .severity = Severity::kWarning,
    });
  }
  if (std::abs(scale.x - scale.y) > tolerance
    || std::abs(scale.x - scale.z) > tolerance) {
    issues.push_back({
      .category = Category::kTransform,
      .message = fmt::format("Non-uniform scale: ({:.3f}, {:.3f}, {:.3f})",
        scale.x, scale.y, scale.z),
      .severity = Severity::kWarning,
    });
  }
  if (object.type == ObjectType::kMesh
    && HasUnappliedRotation(object.transform.rotation, tolerance)) {
    issues.push_back({
      .category = Category::kTransform,
      .message = "Unapplied rotation detected",
      .severity = Severity::kWarning,
    });
  }
  return issues;
}

auto vigil::audit::rules::FixUnappliedScale(SceneStore& store,
  std::string_view name, const AuditConfig& config, ProcessedData* processed)
  -> int
{
  const auto* object = store.FindObject(name);
  if (object == nullptr
    || !HasUnappliedScale(object->transform.scale, config.transform_tolerance)
    || !scene::HasGeometry(object->type)) {
    return 0;
  }
  const ExclusionFilter filter { config.exclusion_patterns };
  if (filter.IsExcluded(name)) {
    DLOG_F(1, "skipping '{}': excluded", name);
    return 0;
  }
  const auto original_data = object->data;
  if (processed != nullptr && !original_data.empty()
    && processed->contains(original_data)) {
    DLOG_F(2, "data '{}' of '{}' already processed", original_data, name);
    return 0;
  }

  const auto instances
    = CollectInstances(store, *object, config.transform_tolerance, filter);
  std::vector<std::string> fixed;
  for (const auto& instance : instances) {
    if (BakeScale(store, instance)) {
      fixed.push_back(instance);
    }
  }
  if (fixed.size() > 1) {
    RestoreInstancing(store, fixed);
  }

  if (processed != nullptr && !original_data.empty()) {
    processed->insert(original_data);
    if (!fixed.empty()) {
      if (const auto* master = store.FindObject(fixed.front());
        master != nullptr && !master->data.empty()) {
        processed->insert(master->data);
      }
    }
  }

  if (!fixed.empty()) {
    DLOG_F(1, "applied scale to {} of {} instance(s) of '{}'", fixed.size(),
      instances.size(), name);
  }
  return static_cast<int>(fixed.size());
}

auto vigil::audit::rules::FixUnappliedRotation(SceneStore& store,
  std::string_view name, const AuditConfig& config) -> bool
{
  const auto* object = store.FindObject(name);
  if (object == nullptr || object->type != ObjectType::kMesh
    || !HasUnappliedRotation(
      object->transform.rotation, config.transform_tolerance)
    || ExclusionFilter { config.exclusion_patterns }.IsExcluded(name)) {
    return false;
  }
  if (!store.IsInViewLayer(name)) {
    DLOG_F(1, "skipping '{}': not in view layer", name);
    return false;
  }
  if (!EnsureObjectMode(store, name)) {
    return false;
  }
  try {
    ScopedObjectAccess access { store, name };
    if (!access.IsAcquired()) {
      return false;
    }
    MakeDataExclusive(store, name);
    store.ApplyTransform(name, true, false);
    DLOG_F(1, "applied rotation to '{}'", name);
    return true;
  } catch (const std::exception& ex) {
    LOG_F(WARNING, "failed to apply rotation to '{}': {}", name, ex.what());
    return false;
  }
}

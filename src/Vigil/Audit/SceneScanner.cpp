//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Vigil/Audit/Rules/DataRules.h>
#include <Vigil/Audit/Rules/DependencyRules.h>
#include <Vigil/Audit/Rules/DriverRules.h>
#include <Vigil/Audit/Rules/GeometryRules.h>
#include <Vigil/Audit/Rules/MaterialRules.h>
#include <Vigil/Audit/Rules/ModifierRules.h>
#include <Vigil/Audit/Rules/RiggingRules.h>
#include <Vigil/Audit/Rules/TransformRules.h>
#include <Vigil/Audit/SceneScanner.h>
#include <Vigil/Base/Logging.h>

using vigil::audit::SceneScanner;
using vigil::scene::SceneObject;

SceneScanner::SceneScanner(
  const scene::SceneStore& store, AuditConfig config)
  : store_(store)
  , config_(std::move(config))
  , filter_(config_.exclusion_patterns)
{
}

auto SceneScanner::Scan(const std::vector<std::string>& object_names)
  -> const std::vector<Finding>&
{
  findings_.clear();
  for (const auto& name : object_names) {
    if (filter_.IsExcluded(name)) {
      DLOG_F(2, "'{}' excluded from scan", name);
      continue;
    }
    const auto* object = store_.FindObject(name);
    if (object == nullptr) {
      DLOG_F(1, "'{}' vanished, not scanned", name);
      continue;
    }
    ScanObject(*object);
  }
  DLOG_F(1, "scan of {} object(s): {} error(s), {} warning(s)",
    object_names.size(), CountErrors(findings_), CountWarnings(findings_));
  return findings_;
}

auto SceneScanner::ScanObject(const SceneObject& object) -> void
{
  const auto& name = object.name;
  Attribute(name, kNoMaterial, rules::ValidateTransforms(object, config_));
  Attribute(name, kNoMaterial, rules::ValidateObjectData(store_, object));
  Attribute(name, kNoMaterial, rules::ValidateDrivers(store_, object));
  Attribute(name, kNoMaterial, rules::ValidateModifiers(store_, object));
  Attribute(
    name, kNoMaterial, rules::ValidateGeometry(store_, object, config_));
  Attribute(name, kNoMaterial, rules::ValidateVertexGroups(store_, object));
  Attribute(name, kNoMaterial, rules::ValidateDependencies(store_, object));

  if (scene::HasGeometry(object.type)) {
    ScanMaterialSlots(object);
  }
}

auto SceneScanner::ScanMaterialSlots(const SceneObject& object) -> void
{
  for (const auto& slot : object.material_slots) {
    if (slot.empty()) {
      findings_.push_back({
        .object_name = object.name,
        .material_name = kEmptySlotMaterial,
        .category = Category::kEmptySlot,
        .message = "Empty material slot found.",
        .severity = Severity::kWarning,
      });
      continue;
    }

    const auto* material = store_.FindMaterial(slot);
    if (auto broken = rules::IsMaterialBroken(material)) {
      Attribute(object.name, slot, { std::move(*broken) });
    }
    if (material == nullptr) {
      continue;
    }
    Attribute(object.name, slot,
      rules::ValidateTextures(store_, *material, config_));
    Attribute(object.name, slot, rules::CheckShaderCompatibility(*material));
  }
}

auto SceneScanner::Attribute(const std::string& object_name,
  const std::string& material_name, std::vector<Issue> issues) -> void
{
  for (auto& issue : issues) {
    findings_.push_back({
      .object_name = object_name,
      .material_name = material_name,
      .category = issue.category,
      .message = std::move(issue.message),
      .severity = issue.severity,
    });
  }
}

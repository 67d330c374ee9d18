//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <vector>

#include <Vigil/Audit/AuditConfig.h>
#include <Vigil/Audit/ExclusionFilter.h>
#include <Vigil/Audit/Finding.h>
#include <Vigil/Audit/api_export.h>
#include <Vigil/Scene/SceneStore.h>

namespace vigil::audit {

//! Runs every audit rule over a set of objects and keeps the findings.
/*!
 For each object, in the given order, the rules run in a fixed order:
 transform, data, driver, modifier, geometry, rigging and dependency. Then,
 for geometry objects, the material slots are inspected in slot order: an
 empty slot is an EMPTY_SLOT finding, a populated one is checked for a broken
 shader graph, texture problems and shader compatibility.

 Objects excluded by the filter built from `AuditConfig::exclusion_patterns`
 produce no finding, and names that do not resolve are skipped. Scanning the
 same unchanged scene twice produces identical lists.
*/
class SceneScanner {
public:
  VGL_AUD_API SceneScanner(const scene::SceneStore& store, AuditConfig config);

  //! Replaces the current findings by those of \p object_names.
  VGL_AUD_API auto Scan(const std::vector<std::string>& object_names)
    -> const std::vector<Finding>&;

  //! Findings of the last Scan().
  [[nodiscard]] auto Findings() const noexcept -> const std::vector<Finding>&
  {
    return findings_;
  }

  auto Clear() noexcept -> void { findings_.clear(); }

  [[nodiscard]] auto Filter() const noexcept -> const ExclusionFilter&
  {
    return filter_;
  }

private:
  auto ScanObject(const scene::SceneObject& object) -> void;
  auto ScanMaterialSlots(const scene::SceneObject& object) -> void;
  auto Attribute(const std::string& object_name,
    const std::string& material_name, std::vector<Issue> issues) -> void;

  const scene::SceneStore& store_;
  AuditConfig config_;
  ExclusionFilter filter_;
  std::vector<Finding> findings_;
};

} // namespace vigil::audit

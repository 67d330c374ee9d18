//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <Vigil/Audit/AuditConfig.h>
#include <Vigil/Audit/ExclusionFilter.h>
#include <Vigil/Audit/FixCounts.h>
#include <Vigil/Audit/RunContext.h>
#include <Vigil/Audit/api_export.h>
#include <Vigil/Scene/SceneStore.h>

namespace vigil::audit {

//! Sequences the automatic repairs over a set of objects.
/*!
 ### Transform phase

 Scale and rotation are baked first, for every object, before any other
 repair runs, since the later repairs assume baked transforms. The objects
 that exist and are not excluded are processed in batches of
 `AuditConfig::batch_size`. The store is updated before and after each batch,
 and the orchestrator pauses for `AuditConfig::batch_pause` after each one.
 Instances sharing a data block are baked together, once per block.

 ### Object phase

 Each surviving, non-excluded object then goes through, in order: empty slot
 removal, invalid driver removal, driver chain breaking, modifier repair, UV
 generation, parent loop breaking and vertex group cleanup. The material
 slots of geometry objects come last: a material broken with an ERROR is
 replaced in its slot by the marker material, as is a slot naming a deleted
 material, one broken with a WARNING is reconnected, and deprecated nodes are replaced and external textures packed
 in all cases. Each material is handled once per run, and the marker material
 is never touched.

 ### Fault isolation

 Every step runs on its own: an exception escaping a step is logged, recorded
 in the RunContext when there is one, counts as zero, and the next step runs.
*/
class RepairOrchestrator {
public:
  VGL_AUD_API RepairOrchestrator(scene::SceneStore& store, AuditConfig config,
    RunContext* context = nullptr);

  //! Runs both phases over \p object_names.
  /*! \return the per-category counts, with every category present. */
  VGL_AUD_API auto AutoFixAll(const std::vector<std::string>& object_names)
    -> FixCounts;

  //! Rebuilds every distinct broken material used by the geometry objects
  //! among \p object_names.
  /*! \return the number of materials rebuilt. */
  VGL_AUD_API auto FixBrokenShaders(
    const std::vector<std::string>& object_names) -> int;

private:
  auto RunTransformPhase(
    const std::vector<std::string>& object_names, FixCounts& counts) -> void;
  auto RunObjectPhase(
    const std::vector<std::string>& object_names, FixCounts& counts) -> void;
  auto FixMaterials(std::string_view object_name, FixCounts& counts,
    std::set<std::string, std::less<>>& processed) -> void;

  auto Guarded(std::string_view step, std::string_view entity,
    const std::function<void()>& action) -> void;

  scene::SceneStore& store_;
  AuditConfig config_;
  ExclusionFilter filter_;
  RunContext* context_;
};

} // namespace vigil::audit

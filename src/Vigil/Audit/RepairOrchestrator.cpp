//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <exception>
#include <iterator>
#include <thread>

#include <fmt/format.h>

#include <Vigil/Audit/RepairOrchestrator.h>
#include <Vigil/Audit/Rules/DependencyRules.h>
#include <Vigil/Audit/Rules/DriverRules.h>
#include <Vigil/Audit/Rules/GeometryRules.h>
#include <Vigil/Audit/Rules/MaterialRules.h>
#include <Vigil/Audit/Rules/ModifierRules.h>
#include <Vigil/Audit/Rules/RiggingRules.h>
#include <Vigil/Audit/Rules/TransformRules.h>
#include <Vigil/Base/Logging.h>

using vigil::audit::FixCategory;
using vigil::audit::FixCounts;
using vigil::audit::RepairOrchestrator;
using vigil::audit::Severity;

RepairOrchestrator::RepairOrchestrator(
  scene::SceneStore& store, AuditConfig config, RunContext* context)
  : store_(store)
  , config_(std::move(config))
  , filter_(config_.exclusion_patterns)
  , context_(context)
{
  CHECK_F(config_.batch_size > 0, "batch size must be positive");
}

auto RepairOrchestrator::AutoFixAll(
  const std::vector<std::string>& object_names) -> FixCounts
{
  auto counts = MakeFixCounts();
  RunTransformPhase(object_names, counts);
  RunObjectPhase(object_names, counts);

  LOG_F(INFO,
    "auto-fix complete: {} materials, {} scales, {} vertex groups, {} driver "
    "chains",
    counts[FixCategory::kMaterialsRebuilt], counts[FixCategory::kScalesApplied],
    counts[FixCategory::kVertexGroupsCleaned],
    counts[FixCategory::kDriverChainsFixed]);
  return counts;
}

auto RepairOrchestrator::RunTransformPhase(
  const std::vector<std::string>& object_names, FixCounts& counts) -> void
{
  LOG_SCOPE_F(INFO, "Transform fixes");

  std::vector<std::string> eligible;
  std::ranges::copy_if(object_names, std::back_inserter(eligible),
    [this](const std::string& name) {
      return store_.FindObject(name) != nullptr && !filter_.IsExcluded(name);
    });
  LOG_F(INFO, "{} object(s) to process", eligible.size());
  if (eligible.size() > config_.large_run_warning) {
    LOG_F(WARNING,
      "processing {} objects may take several minutes and use significant "
      "memory, consider smaller scopes",
      eligible.size());
  }

  rules::ProcessedData processed;
  auto& scales = counts[FixCategory::kScalesApplied];
  auto& rotations = counts[FixCategory::kRotationsApplied];
  const auto batch_size = config_.batch_size;
  const auto total_batches = (eligible.size() + batch_size - 1) / batch_size;

  for (std::size_t start = 0; start < eligible.size(); start += batch_size) {
    const auto end = std::min(start + batch_size, eligible.size());
    const auto batch_number = start / batch_size + 1;
    DLOG_F(1, "transform batch {}/{} ({} objects)", batch_number,
      total_batches, end - start);

    store_.Update();
    for (auto i = start; i < end; ++i) {
      const auto& name = eligible[i];
      if (store_.FindObject(name) == nullptr) {
        DLOG_F(1, "'{}' vanished, skipped", name);
        continue;
      }
      Guarded("scale", name, [&] {
        scales += rules::FixUnappliedScale(store_, name, config_, &processed);
      });
      if (store_.FindObject(name) == nullptr) {
        continue;
      }
      Guarded("rotation", name, [&] {
        if (rules::FixUnappliedRotation(store_, name, config_)) {
          ++rotations;
        }
      });
    }
    store_.Update();
    if (config_.batch_pause.count() > 0) {
      std::this_thread::sleep_for(config_.batch_pause);
    }
    DLOG_F(1, "batch {}/{} complete, scales={} rotations={}", batch_number,
      total_batches, scales, rotations);
  }

  LOG_F(INFO, "{} scale(s), {} rotation(s) applied", scales, rotations);
}

auto RepairOrchestrator::RunObjectPhase(
  const std::vector<std::string>& object_names, FixCounts& counts) -> void
{
  LOG_SCOPE_F(INFO, "Object fixes");

  std::set<std::string, std::less<>> processed_materials;
  for (const auto& name : object_names) {
    if (filter_.IsExcluded(name)) {
      continue;
    }
    if (store_.FindObject(name) == nullptr) {
      DLOG_F(1, "'{}' vanished, skipped", name);
      continue;
    }

    Guarded("empty slots", name, [&] {
      counts[FixCategory::kEmptySlotsFixed]
        += rules::FixEmptySlots(store_, name);
    });
    Guarded("drivers", name, [&] {
      counts[FixCategory::kDriversFixed]
        += rules::FixInvalidDrivers(store_, name);
    });
    Guarded("driver chains", name, [&] {
      if (rules::FixDriverChains(store_, name)) {
        ++counts[FixCategory::kDriverChainsFixed];
      }
    });
    Guarded("modifiers", name, [&] {
      counts[FixCategory::kModifiersFixed]
        += rules::FixBrokenModifiers(store_, name);
    });
    Guarded("uvs", name, [&] {
      if (rules::FixMissingUvs(store_, name, config_)) {
        ++counts[FixCategory::kUvsGenerated];
      }
    });
    Guarded("parent loop", name, [&] {
      if (rules::FixParentLoop(store_, name)) {
        ++counts[FixCategory::kParentLoopsFixed];
      }
    });
    Guarded("vertex groups", name, [&] {
      const auto fixes = rules::FixVertexGroups(store_, name);
      counts[FixCategory::kVertexGroupsCleaned]
        += fixes.empty_removed + fixes.orphaned_removed;
      if (fixes.normalized > 0) {
        ++counts[FixCategory::kWeightsNormalized];
      }
    });

    FixMaterials(name, counts, processed_materials);
  }
}

auto RepairOrchestrator::FixMaterials(std::string_view object_name,
  FixCounts& counts, std::set<std::string, std::less<>>& processed) -> void
{
  const auto* object = store_.FindObject(object_name);
  if (object == nullptr || !scene::HasGeometry(object->type)) {
    return;
  }

  // Repairs re-assign slots, iterate over a copy.
  const auto slots = object->material_slots;
  for (std::size_t index = 0; index < slots.size(); ++index) {
    const auto& material_name = slots[index];
    if (material_name.empty()
      || material_name == config_.marker_material_name) {
      continue;
    }
    // A slot naming a deleted material is broken in that slot only.
    if (store_.FindMaterial(material_name) == nullptr) {
      Guarded("material", material_name, [&] {
        if (rules::MarkBrokenMaterial(store_, object_name, index, config_)) {
          ++counts[FixCategory::kMaterialsRebuilt];
        }
      });
      continue;
    }
    if (!processed.insert(material_name).second) {
      continue;
    }

    Guarded("material", material_name, [&] {
      const auto broken
        = rules::IsMaterialBroken(store_.FindMaterial(material_name));
      if (broken && broken->severity == Severity::kError) {
        if (rules::MarkBrokenMaterial(store_, object_name, index, config_)) {
          ++counts[FixCategory::kMaterialsRebuilt];
        }
      } else if (broken) {
        if (rules::FixDisconnectedOutput(
              *store_.FindMaterial(material_name))) {
          ++counts[FixCategory::kDisconnectedFixed];
        }
      }

      auto* material = store_.FindMaterial(material_name);
      if (material == nullptr) {
        return;
      }
      counts[FixCategory::kDeprecatedReplaced]
        += rules::ReplaceDeprecatedNodes(*material);
      counts[FixCategory::kTexturesPacked]
        += rules::PackExternalTextures(store_, *material);
    });
  }
}

auto RepairOrchestrator::FixBrokenShaders(
  const std::vector<std::string>& object_names) -> int
{
  std::vector<std::string> broken;
  for (const auto& name : object_names) {
    const auto* object = store_.FindObject(name);
    if (object == nullptr || filter_.IsExcluded(name)
      || !scene::HasGeometry(object->type)) {
      continue;
    }
    for (const auto& slot : object->material_slots) {
      const auto* material = store_.FindMaterial(slot);
      if (slot.empty() || material == nullptr
        || std::ranges::find(broken, slot) != broken.end()) {
        continue;
      }
      if (rules::IsMaterialBroken(material)) {
        broken.push_back(slot);
      }
    }
  }

  int rebuilt = 0;
  for (const auto& name : broken) {
    Guarded("rebuild", name, [&] {
      if (auto* material = store_.FindMaterial(name); material != nullptr) {
        rules::RebuildMaterial(*material);
        ++rebuilt;
      }
    });
  }
  LOG_F(INFO, "{} material(s) rebuilt", rebuilt);
  return rebuilt;
}

auto RepairOrchestrator::Guarded(std::string_view step,
  std::string_view entity, const std::function<void()>& action) -> void
{
  try {
    action();
  } catch (const std::exception& ex) {
    LOG_F(ERROR, "{} fix failed for '{}': {}", step, entity, ex.what());
    if (context_ != nullptr) {
      context_->RecordError(
        fmt::format("{} fix failed for '{}': {}", step, entity, ex.what()));
    }
  }
}

//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <array>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <Vigil/Audit/RepairOrchestrator.h>
#include <Vigil/Audit/ScopedObjectAccess.h>
#include <Vigil/Audit/Validator.h>
#include <Vigil/Base/Logging.h>

using vigil::audit::FixCategory;
using vigil::audit::FixCounts;
using vigil::audit::Scope;
using vigil::audit::Validator;

namespace {

//! Summary order and wording of the fix categories.
constexpr std::array<std::pair<FixCategory, const char*>, 14> kSummaryOrder {
  { { FixCategory::kScalesApplied, "scales" },
    { FixCategory::kRotationsApplied, "rotations" },
    { FixCategory::kVertexGroupsCleaned, "vertex groups" },
    { FixCategory::kWeightsNormalized, "weights normalized" },
    { FixCategory::kParentLoopsFixed, "parent loops" },
    { FixCategory::kDriverChainsFixed, "driver chains" },
    { FixCategory::kMaterialsRebuilt, "materials" },
    { FixCategory::kEmptySlotsFixed, "empty slots" },
    { FixCategory::kTexturesPacked, "textures packed" },
    { FixCategory::kUvsGenerated, "UV maps" },
    { FixCategory::kDriversFixed, "drivers" },
    { FixCategory::kModifiersFixed, "modifiers" },
    { FixCategory::kDeprecatedReplaced, "deprecated nodes" },
    { FixCategory::kDisconnectedFixed, "disconnected outputs" } }
};

} // namespace

auto Scope::DisplayName() const -> std::string
{
  return IsScene() ? std::string { "Scene" }
                   : fmt::format("Collection '{}'", collection);
}

auto vigil::audit::FormatFixSummary(
  const FixCounts& counts, std::string_view scope) -> std::string
{
  if (TotalFixes(counts) == 0) {
    return fmt::format("No fixable issues found in {}.", scope);
  }
  std::vector<std::string> parts;
  for (const auto& [category, label] : kSummaryOrder) {
    const auto it = counts.find(category);
    if (it != counts.end() && it->second > 0) {
      parts.push_back(fmt::format("{} {}", it->second, label));
    }
  }
  return fmt::format("Fixed: {}", fmt::join(parts, ", "));
}

Validator::Validator(scene::SceneStore& store, AuditConfig config)
  : store_(store)
  , config_(std::move(config))
  , scanner_(store_, config_)
{
}

auto Validator::ResolveScope(const Scope& scope) const
  -> std::optional<std::vector<std::string>>
{
  if (scope.IsScene()) {
    return store_.GetObjectNames();
  }
  return store_.GetCollectionObjectNames(scope.collection);
}

auto Validator::Report(const bool is_problem, std::string message) -> void
{
  if (is_problem) {
    LOG_F(WARNING, "{}", message);
  } else {
    LOG_F(INFO, "{}", message);
  }
  messages_.push_back(std::move(message));
}

auto Validator::Validate(const Scope& scope) -> const std::vector<Finding>&
{
  messages_.clear();
  const auto scope_name = scope.DisplayName();
  const auto names = ResolveScope(scope);
  if (!names) {
    scanner_.Clear();
    Report(true, fmt::format("{} not found.", scope_name));
    return scanner_.Findings();
  }

  const auto& findings = scanner_.Scan(*names);
  if (findings.empty()) {
    Report(false, fmt::format("{} is clean.", scope_name));
  } else {
    Report(true,
      fmt::format("Found {} errors, {} warnings in {}.", CountErrors(findings),
        CountWarnings(findings), scope_name));
  }
  return findings;
}

auto Validator::FixShaders(const Scope& scope) -> int
{
  messages_.clear();
  const auto scope_name = scope.DisplayName();
  const auto names = ResolveScope(scope);
  if (!names) {
    scanner_.Clear();
    Report(true, fmt::format("{} not found.", scope_name));
    return 0;
  }

  RepairOrchestrator orchestrator { store_, config_ };
  const auto rebuilt = orchestrator.FixBrokenShaders(*names);
  Report(false, fmt::format("Fixed {} materials.", rebuilt));

  const auto& findings = scanner_.Scan(*names);
  if (findings.empty()) {
    Report(false, fmt::format("{} is now clean!", scope_name));
  } else {
    Report(false,
      fmt::format("Remaining: {} errors, {} warnings", CountErrors(findings),
        CountWarnings(findings)));
  }
  return rebuilt;
}

auto Validator::AutoFix(const Scope& scope, RunContext& context) -> FixCounts
{
  LOG_SCOPE_F(INFO, "Auto-fix");
  messages_.clear();
  const RunContext::ProcessingScope processing { context };
  context.Reset();
  context.SetProgress(0, "Initializing...");

  if (const auto active = store_.GetActiveObject();
    active && !EnsureObjectMode(store_, *active)) {
    const auto error = fmt::format(
      "Cannot switch '{}' to OBJECT mode. Please switch manually.", *active);
    context.RecordError(error);
    Report(true, error);
    return MakeFixCounts();
  }

  context.SetProgress(5, "Scanning objects...");
  const auto scope_name = scope.DisplayName();
  const auto names = ResolveScope(scope);
  if (!names) {
    const auto error = fmt::format("{} not found.", scope_name);
    context.RecordError(error);
    Report(true, error);
    return MakeFixCounts();
  }
  LOG_F(INFO, "running on {} ({} objects)", scope_name, names->size());

  context.SetProgress(10, "Running auto-fixes...");
  RepairOrchestrator orchestrator { store_, config_, &context };
  auto counts = orchestrator.AutoFixAll(*names);
  context.SetCounters(GroupCounters::From(counts));

  context.SetProgress(80, "Re-scanning for remaining issues...");
  auto summary = FormatFixSummary(counts, scope_name);
  context.SetSummary(summary);
  Report(false, std::move(summary));

  context.SetProgress(90, "Updating results...");
  const auto& findings = scanner_.Scan(*names);
  const auto errors = CountErrors(findings);
  const auto warnings = CountWarnings(findings);
  std::string outcome;
  if (findings.empty()) {
    outcome = fmt::format("{} is now clean!", scope_name);
  } else if (errors > 0) {
    outcome = fmt::format(
      "Remaining: {} errors, {} warnings (may need manual fixing)", errors,
      warnings);
  } else {
    outcome = fmt::format("Remaining: {} warnings (non-critical)", warnings);
  }
  context.SetOutcome(outcome);
  Report(errors > 0, std::move(outcome));

  context.SetProgress(100, "Complete!");
  return counts;
}

auto Validator::ClearResults() -> void
{
  scanner_.Clear();
  messages_.clear();
  DLOG_F(1, "results cleared");
}

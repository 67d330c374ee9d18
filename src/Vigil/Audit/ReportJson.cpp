//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <string>

#include <Vigil/Audit/ReportJson.h>

namespace vigil::audit {

namespace {

  auto MakeFindingItem(const Finding& finding) -> ordered_json
  {
    return ordered_json {
      { "object", finding.object_name },
      { "material", finding.material_name },
      { "category", to_string(finding.category) },
      { "message", finding.message },
      { "severity", to_string(finding.severity) },
    };
  }

  auto MakeCounters(const GroupCounters& counters) -> ordered_json
  {
    return ordered_json {
      { "materials", counters.materials },
      { "drivers", counters.drivers },
      { "modifiers", counters.modifiers },
      { "transforms", counters.transforms },
      { "geometry", counters.geometry },
      { "rigging", counters.rigging },
    };
  }

} // namespace

auto BuildFindingsJson(const std::vector<Finding>& findings) -> ordered_json
{
  auto items = ordered_json::array();
  for (const auto& finding : findings) {
    items.push_back(MakeFindingItem(finding));
  }
  return ordered_json {
    { "errors", CountErrors(findings) },
    { "warnings", CountWarnings(findings) },
    { "items", std::move(items) },
  };
}

auto BuildFixCountsJson(const FixCounts& counts) -> ordered_json
{
  auto out = ordered_json::object();
  for (const auto& [category, count] : counts) {
    out[to_string(category)] = count;
  }
  out["total"] = TotalFixes(counts);
  return out;
}

auto BuildRunReportJson(const std::string_view scope,
  const std::vector<Finding>& before, const FixCounts& counts,
  const std::vector<Finding>& after, const RunContext& context) -> ordered_json
{
  return ordered_json {
    { "version", std::string(kReportVersion) },
    { "scope", std::string(scope) },
    { "before", BuildFindingsJson(before) },
    { "fixes", BuildFixCountsJson(counts) },
    { "after", BuildFindingsJson(after) },
    { "progress",
      ordered_json {
        { "percentage", context.Percentage() },
        { "message", context.Message() },
        { "counters", MakeCounters(context.Counters()) },
        { "errors", context.Errors() },
        { "summary", context.Summary() },
        { "outcome", context.Outcome() },
      } },
  };
}

} // namespace vigil::audit

//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include <Vigil/Audit/Finding.h>
#include <Vigil/Audit/FixCounts.h>
#include <Vigil/Audit/RunContext.h>
#include <Vigil/Audit/api_export.h>

namespace vigil::audit {

using nlohmann::ordered_json;

inline constexpr std::string_view kReportVersion = "1";

//! `{ "errors": n, "warnings": m, "items": [ {object, material, category,
//! message, severity}, ... ] }`, items in scan order.
VGL_AUD_NDAPI auto BuildFindingsJson(const std::vector<Finding>& findings)
  -> ordered_json;

//! One key per fix category, in category order, plus `"total"`.
VGL_AUD_NDAPI auto BuildFixCountsJson(const FixCounts& counts)
  -> ordered_json;

//! Complete report of an auto-fix run.
/*!
 \code{.json}
 {
   "version": "1",
   "scope": "Scene",
   "before": { ...findings... },
   "fixes": { ...fix counts... },
   "after": { ...findings... },
   "progress": { "percentage": 100, "message": "Complete!",
                 "counters": {...}, "errors": [...],
                 "summary": "...", "outcome": "..." }
 }
 \endcode
*/
VGL_AUD_NDAPI auto BuildRunReportJson(std::string_view scope,
  const std::vector<Finding>& before, const FixCounts& counts,
  const std::vector<Finding>& after, const RunContext& context)
  -> ordered_json;

} // namespace vigil::audit

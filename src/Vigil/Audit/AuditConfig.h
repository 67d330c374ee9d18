//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include <Vigil/Audit/api_export.h>

namespace vigil::audit {

//! Tunables of the audit rules and of the repair pipeline.
struct AuditConfig {
  //! Comma separated object name prefixes left out of scans and fixes.
  std::string exclusion_patterns { "WGT-" };

  //! Objects per transform-fix batch.
  std::size_t batch_size { 15 };
  //! Pause after each transform-fix batch, letting the host settle.
  std::chrono::milliseconds batch_pause { 50 };
  //! Object count above which an auto-fix run logs a warning up front.
  std::size_t large_run_warning { 500 };

  //! Name of the shared placeholder material substituted for broken ones.
  std::string marker_material_name { "_BROKEN TO FIX" };

  //! Deviation from identity beyond which scale and rotation are unapplied.
  float transform_tolerance { 0.001F };

  std::size_t high_poly_threshold { 50'000 };
  std::size_t very_high_poly_threshold { 100'000 };
  uint32_t max_texture_size { 8192 };

  //! Automatic unwrap parameters, angle in degrees.
  float uv_angle_limit { 66.0F };
  float uv_island_margin { 0.02F };
};

//! Checks the values of \p config for consistency, reporting to \p errors.
VGL_AUD_NDAPI auto ValidateAuditConfig(
  const AuditConfig& config, std::ostream& errors) -> bool;

//! Reads an AuditConfig from a JSON object.
/*!
 Keys match the field names, with `batch_pause_ms` for the pause. Missing keys
 keep their default value. Unknown keys and values of the wrong type are
 errors. `exclusion_patterns` is either a comma separated string or an array
 of strings.

 \return the configuration, or std::nullopt after reporting to \p errors.
*/
VGL_AUD_NDAPI auto ParseAuditConfig(const nlohmann::json& document,
  std::ostream& errors) -> std::optional<AuditConfig>;

VGL_AUD_NDAPI auto LoadAuditConfig(const std::filesystem::path& path,
  std::ostream& errors) -> std::optional<AuditConfig>;

} // namespace vigil::audit

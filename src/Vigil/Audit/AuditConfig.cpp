//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <array>
#include <string_view>

#include <nlohmann/json.hpp>

#include <Vigil/Audit/AuditConfig.h>
#include <Vigil/Scene/Detail/JsonFields.h>

using nlohmann::json;

namespace vigil::audit {

namespace {

  constexpr std::array<std::string_view, 11> kKnownKeys {
    "exclusion_patterns",
    "batch_size",
    "batch_pause_ms",
    "large_run_warning",
    "marker_material_name",
    "transform_tolerance",
    "high_poly_threshold",
    "very_high_poly_threshold",
    "max_texture_size",
    "uv_angle_limit",
    "uv_island_margin",
  };

  auto ReadPatterns(const json& obj, std::string& target, std::ostream& errors)
    -> bool
  {
    if (!obj.contains("exclusion_patterns")) {
      return true;
    }
    const auto& value = obj["exclusion_patterns"];
    if (value.is_string()) {
      target = value.get<std::string>();
      return true;
    }
    if (!value.is_array()) {
      errors << "ERROR: 'exclusion_patterns' must be a string or an array of "
                "strings\n";
      return false;
    }
    std::string joined;
    for (const auto& item : value) {
      if (!item.is_string()) {
        errors << "ERROR: 'exclusion_patterns' entries must be strings\n";
        return false;
      }
      if (!joined.empty()) {
        joined += ',';
      }
      joined += item.get<std::string>();
    }
    target = std::move(joined);
    return true;
  }

} // namespace

auto ValidateAuditConfig(const AuditConfig& config, std::ostream& errors)
  -> bool
{
  bool ok = true;
  if (config.batch_size == 0) {
    errors << "ERROR: 'batch_size' must be > 0\n";
    ok = false;
  }
  if (config.batch_pause.count() < 0) {
    errors << "ERROR: 'batch_pause_ms' must be >= 0\n";
    ok = false;
  }
  if (config.marker_material_name.empty()) {
    errors << "ERROR: 'marker_material_name' must not be empty\n";
    ok = false;
  }
  if (config.transform_tolerance < 0.0F) {
    errors << "ERROR: 'transform_tolerance' must be >= 0\n";
    ok = false;
  }
  if (config.high_poly_threshold > config.very_high_poly_threshold) {
    errors << "ERROR: 'high_poly_threshold' must not exceed "
              "'very_high_poly_threshold'\n";
    ok = false;
  }
  if (config.uv_angle_limit <= 0.0F || config.uv_angle_limit > 89.0F) {
    errors << "ERROR: 'uv_angle_limit' must be in (0, 89]\n";
    ok = false;
  }
  if (config.uv_island_margin < 0.0F || config.uv_island_margin > 1.0F) {
    errors << "ERROR: 'uv_island_margin' must be in [0, 1]\n";
    ok = false;
  }
  return ok;
}

auto ParseAuditConfig(const json& document, std::ostream& errors)
  -> std::optional<AuditConfig>
{
  using scene::detail::ReadFloatField;
  using scene::detail::ReadStringField;
  using scene::detail::ReadUIntField;

  if (!document.is_object()) {
    errors << "ERROR: configuration must be a JSON object\n";
    return std::nullopt;
  }

  bool ok = true;
  for (const auto& item : document.items()) {
    const auto& key = item.key();
    if (std::ranges::find(kKnownKeys, std::string_view { key })
      == kKnownKeys.end()) {
      errors << "ERROR: unknown configuration key '" << key << "'\n";
      ok = false;
    }
  }

  AuditConfig config;
  int64_t pause_ms = config.batch_pause.count();
  ok = ok && ReadPatterns(document, config.exclusion_patterns, errors)
    && ReadUIntField(document, "batch_size", config.batch_size, errors)
    && ReadUIntField(document, "batch_pause_ms", pause_ms, errors)
    && ReadUIntField(
      document, "large_run_warning", config.large_run_warning, errors)
    && ReadStringField(
      document, "marker_material_name", config.marker_material_name, errors)
    && ReadFloatField(
      document, "transform_tolerance", config.transform_tolerance, errors)
    && ReadUIntField(
      document, "high_poly_threshold", config.high_poly_threshold, errors)
    && ReadUIntField(document, "very_high_poly_threshold",
      config.very_high_poly_threshold, errors)
    && ReadUIntField(
      document, "max_texture_size", config.max_texture_size, errors)
    && ReadFloatField(document, "uv_angle_limit", config.uv_angle_limit, errors)
    && ReadFloatField(
      document, "uv_island_margin", config.uv_island_margin, errors);
  if (!ok) {
    return std::nullopt;
  }
  config.batch_pause = std::chrono::milliseconds { pause_ms };

  if (!ValidateAuditConfig(config, errors)) {
    return std::nullopt;
  }
  return config;
}

auto LoadAuditConfig(const std::filesystem::path& path, std::ostream& errors)
  -> std::optional<AuditConfig>
{
  const auto document = scene::detail::ReadJsonFile(path, errors);
  if (!document) {
    return std::nullopt;
  }
  return ParseAuditConfig(*document, errors);
}

} // namespace vigil::audit

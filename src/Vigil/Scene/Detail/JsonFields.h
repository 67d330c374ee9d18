//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <glm/vec3.hpp>
#include <nlohmann/json.hpp>

//! Field readers shared by the JSON loaders.
/*!
 Every reader leaves \p target untouched and succeeds when the field is
 absent, so defaults set before the call survive. A present field of the
 wrong type writes one `ERROR:` line to \p errors and fails.
*/
namespace vigil::scene::detail {

inline auto ReadJsonFile(const std::filesystem::path& path,
  std::ostream& errors) -> std::optional<nlohmann::json>
{
  std::ifstream input(path);
  if (!input) {
    errors << "ERROR: failed to open: " << path.string() << "\n";
    return std::nullopt;
  }

  try {
    nlohmann::json parsed;
    input >> parsed;
    return parsed;
  } catch (const std::exception& e) {
    errors << "ERROR: invalid JSON in " << path.string() << ": " << e.what()
           << "\n";
    return std::nullopt;
  }
}

inline auto ReadStringField(const nlohmann::json& obj, const char* name,
  std::string& target, std::ostream& errors) -> bool
{
  if (!obj.contains(name) || obj[name].is_null()) {
    return true;
  }
  if (!obj[name].is_string()) {
    errors << "ERROR: '" << name << "' must be a string\n";
    return false;
  }
  target = obj[name].get<std::string>();
  return true;
}

inline auto ReadBoolField(const nlohmann::json& obj, const char* name,
  bool& target, std::ostream& errors) -> bool
{
  if (!obj.contains(name)) {
    return true;
  }
  if (!obj[name].is_boolean()) {
    errors << "ERROR: '" << name << "' must be a boolean\n";
    return false;
  }
  target = obj[name].get<bool>();
  return true;
}

template <typename UInt>
auto ReadUIntField(const nlohmann::json& obj, const char* name, UInt& target,
  std::ostream& errors) -> bool
{
  if (!obj.contains(name)) {
    return true;
  }
  if (!obj[name].is_number_unsigned() && !obj[name].is_number_integer()) {
    errors << "ERROR: '" << name << "' must be an integer\n";
    return false;
  }
  const auto value = obj[name].get<int64_t>();
  if (value < 0) {
    errors << "ERROR: '" << name << "' must be >= 0\n";
    return false;
  }
  target = static_cast<UInt>(value);
  return true;
}

inline auto ReadFloatField(const nlohmann::json& obj, const char* name,
  float& target, std::ostream& errors) -> bool
{
  if (!obj.contains(name)) {
    return true;
  }
  if (!obj[name].is_number()) {
    errors << "ERROR: '" << name << "' must be a number\n";
    return false;
  }
  target = obj[name].get<float>();
  return true;
}

inline auto ReadVec3(const nlohmann::json& value, glm::vec3& target) -> bool
{
  if (!value.is_array() || value.size() != 3) {
    return false;
  }
  for (glm::length_t i = 0; i < 3; ++i) {
    if (!value[i].is_number()) {
      return false;
    }
    target[i] = value[i].get<float>();
  }
  return true;
}

inline auto ReadVec3Field(const nlohmann::json& obj, const char* name,
  glm::vec3& target, std::ostream& errors) -> bool
{
  if (!obj.contains(name)) {
    return true;
  }
  if (!ReadVec3(obj[name], target)) {
    errors << "ERROR: '" << name << "' must be an array of 3 numbers\n";
    return false;
  }
  return true;
}

//! Parses an enum from the text its `to_string` overload produces.
template <typename Enum>
auto ParseEnum(std::string_view text, Enum last) -> std::optional<Enum>
{
  for (int i = 0; i <= static_cast<int>(last); ++i) {
    const auto value = static_cast<Enum>(i);
    if (text == to_string(value)) {
      return value;
    }
  }
  return std::nullopt;
}

template <typename Enum>
auto ReadEnumField(const nlohmann::json& obj, const char* name, Enum& target,
  Enum last, std::ostream& errors) -> bool
{
  std::string text;
  if (!ReadStringField(obj, name, text, errors)) {
    return false;
  }
  if (text.empty()) {
    return true;
  }
  const auto value = ParseEnum(text, last);
  if (!value) {
    errors << "ERROR: '" << name << "' has unknown value '" << text << "'\n";
    return false;
  }
  target = *value;
  return true;
}

} // namespace vigil::scene::detail

//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <string>

#include <fmt/format.h>

#include <Vigil/Audit/CycleDetector.h>
#include <Vigil/Audit/Rules/DriverRules.h>
#include <Vigil/Base/Logging.h>

using vigil::audit::Category;
using vigil::audit::Issue;
using vigil::audit::Severity;
using vigil::scene::Driver;
using vigil::scene::DriverTarget;
using vigil::scene::DriverType;
using vigil::scene::FCurve;
using vigil::scene::IdType;
using vigil::scene::SceneObject;
using vigil::scene::SceneStore;

namespace {

auto IsBlank(std::string_view text) -> bool
{
  return text.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

auto HasBlankExpression(const Driver& driver) -> bool
{
  return driver.type == DriverType::kScripted && IsBlank(driver.expression);
}

auto IsSelfReference(const DriverTarget& target, std::string_view owner) -> bool
{
  return target.id_type == IdType::kObject && target.id == owner;
}

//! An unset target, or an object target that no longer resolves.
auto IsMissing(const SceneStore& store, const DriverTarget& target) -> bool
{
  return target.id.empty()
    || (target.id_type == IdType::kObject
      && store.FindObject(target.id) == nullptr);
}

auto AnyTarget(const Driver& driver, auto&& predicate) -> bool
{
  return std::ranges::any_of(driver.variables, [&](const auto& variable) {
    return std::ranges::any_of(variable.targets, predicate);
  });
}

auto RemoveCurves(SceneObject& object, auto&& predicate) -> int
{
  if (!object.animation_data) {
    return 0;
  }
  auto& curves = object.animation_data->drivers;
  const auto removed = std::erase_if(curves, [&](const FCurve& curve) {
    if (!predicate(curve)) {
      return false;
    }
    DLOG_F(1, "removing driver on '{}.{}'", object.name, curve.data_path);
    return true;
  });
  return static_cast<int>(removed);
}

} // namespace

auto vigil::audit::rules::ValidateDrivers(
  const SceneStore& store, const SceneObject& object) -> std::vector<Issue>
{
  std::vector<Issue> issues;
  if (!object.animation_data) {
    return issues;
  }

  if (const auto chain = DetectDriverChain(store, object.name)) {
    issues.push_back({
      .category = Category::kDriverChain,
      .message = fmt::format(
        "Driver chain loop detected: {}", FormatChain(*chain)),
      .severity = Severity::kError,
    });
  }

  for (const auto& curve : object.animation_data->drivers) {
    const auto& driver = curve.driver;
    if (!driver.is_valid) {
      issues.push_back({
        .category = Category::kInvalidDriver,
        .message
        = fmt::format("Invalid driver on property '{}'", curve.data_path),
        .severity = Severity::kError,
      });
      continue;
    }

    for (const auto& variable : driver.variables) {
      for (const auto& target : variable.targets) {
        if (IsSelfReference(target, object.name)) {
          issues.push_back({
            .category = Category::kCircularDriver,
            .message = fmt::format(
              "Circular dependency: Driver on '{}' references itself",
              curve.data_path),
            .severity = Severity::kError,
          });
        } else if (IsMissing(store, target)) {
          issues.push_back({
            .category = Category::kMissingDriverTarget,
            .message = fmt::format(
              "Driver on '{}' has missing target in variable '{}'",
              curve.data_path, variable.name),
            .severity = Severity::kError,
          });
        }
      }
    }

    if (HasBlankExpression(driver)) {
      issues.push_back({
        .category = Category::kInvalidDriver,
        .message
        = fmt::format("Empty scripted expression on '{}'", curve.data_path),
        .severity = Severity::kError,
      });
    }
  }
  return issues;
}

auto vigil::audit::rules::FixInvalidDrivers(
  SceneStore& store, std::string_view object_name) -> int
{
  auto* object = store.FindObject(object_name);
  if (object == nullptr) {
    return 0;
  }
  const auto& owner = object->name;
  return RemoveCurves(*object, [&](const FCurve& curve) {
    const auto& driver = curve.driver;
    return !driver.is_valid || HasBlankExpression(driver)
      || AnyTarget(driver, [&](const DriverTarget& target) {
           return IsSelfReference(target, owner) || IsMissing(store, target);
         });
  });
}

auto vigil::audit::rules::FixDriverChains(
  SceneStore& store, std::string_view object_name) -> bool
{
  auto* object = store.FindObject(object_name);
  if (object == nullptr || !object->animation_data) {
    return false;
  }
  const auto chain = DetectDriverChain(store, object_name);
  if (!chain) {
    return false;
  }
  const auto removed = RemoveCurves(*object, [&](const FCurve& curve) {
    return AnyTarget(curve.driver, [&](const DriverTarget& target) {
      return target.id_type == IdType::kObject
        && std::ranges::find(*chain, target.id) != chain->end();
    });
  });
  if (removed > 0) {
    LOG_F(INFO, "driver chain {} broken at '{}' ({} driver(s) removed)",
      FormatChain(*chain), object_name, removed);
  }
  return removed > 0;
}

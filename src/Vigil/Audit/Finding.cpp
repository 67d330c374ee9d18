//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>

#include <Vigil/Audit/Finding.h>

auto vigil::audit::to_string(const Category value) -> const char*
{
  switch (value) {
  case Category::kBrokenShader:
    return "BROKEN_SHADER";
  case Category::kTexture:
    return "TEXTURE";
  case Category::kShaderCompat:
    return "SHADER_COMPAT";
  case Category::kEmptySlot:
    return "EMPTY_SLOT";
  case Category::kTransform:
    return "TRANSFORM";
  case Category::kData:
    return "DATA";
  case Category::kInvalidDriver:
    return "INVALID_DRIVER";
  case Category::kCircularDriver:
    return "CIRCULAR_DRIVER";
  case Category::kMissingDriverTarget:
    return "MISSING_DRIVER_TARGET";
  case Category::kDriverChain:
    return "DRIVER_CHAIN";
  case Category::kBrokenModifier:
    return "BROKEN_MODIFIER";
  case Category::kUnboundModifier:
    return "UNBOUND_MODIFIER";
  case Category::kUnstableModifier:
    return "UNSTABLE_MODIFIER";
  case Category::kGeometry:
    return "GEOMETRY";
  case Category::kRigging:
    return "RIGGING";
  case Category::kCircularDependency:
    return "CIRCULAR_DEPENDENCY";
  }

  return "__NotSupported__";
}

auto vigil::audit::to_string(const Severity value) -> const char*
{
  switch (value) {
  case Severity::kError:
    return "ERROR";
  case Severity::kWarning:
    return "WARNING";
  }

  return "__NotSupported__";
}

auto vigil::audit::CountErrors(const std::vector<Finding>& findings)
  -> std::size_t
{
  return static_cast<std::size_t>(
    std::ranges::count(findings, Severity::kError, &Finding::severity));
}

auto vigil::audit::CountWarnings(const std::vector<Finding>& findings)
  -> std::size_t
{
  return static_cast<std::size_t>(
    std::ranges::count(findings, Severity::kWarning, &Finding::severity));
}

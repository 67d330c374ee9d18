//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <Vigil/Audit/AuditConfig.h>
#include <Vigil/Audit/Finding.h>
#include <Vigil/Audit/FixCounts.h>
#include <Vigil/Audit/RunContext.h>
#include <Vigil/Audit/SceneScanner.h>
#include <Vigil/Audit/api_export.h>
#include <Vigil/Base/Macros.h>
#include <Vigil/Scene/SceneStore.h>

namespace vigil::audit {

//! Set of objects an operation works on: the whole scene, or the objects of
//! one collection.
struct Scope {
  //! Empty for the whole scene.
  std::string collection;

  [[nodiscard]] static auto Scene() -> Scope { return {}; }
  [[nodiscard]] static auto Collection(std::string name) -> Scope
  {
    return { .collection = std::move(name) };
  }

  [[nodiscard]] auto IsScene() const noexcept -> bool
  {
    return collection.empty();
  }

  //! "Scene", or "Collection 'name'".
  VGL_AUD_NDAPI auto DisplayName() const -> std::string;
};

//! "Fixed: 2 scales, 1 materials", listing the non-zero counts in a fixed
//! order, or "No fixable issues found in <scope>." when nothing was fixed.
VGL_AUD_NDAPI auto FormatFixSummary(
  const FixCounts& counts, std::string_view scope) -> std::string;

//! Front-end entry points over one store: validation, shader repair and the
//! complete automatic repair, on a Scope.
/*!
 Keeps the findings of the last operation. Each operation also produces a
 short list of human readable report lines, available from Messages() and
 logged, such as "Found 3 errors, 1 warnings in Scene.".
*/
class Validator {
public:
  VGL_AUD_API explicit Validator(
    scene::SceneStore& store, AuditConfig config = {});

  VIGIL_MAKE_NON_COPYABLE(Validator)
  VIGIL_MAKE_NON_MOVABLE(Validator)

  ~Validator() = default;

  //! Scans \p scope, replacing the current results.
  VGL_AUD_API auto Validate(const Scope& scope) -> const std::vector<Finding>&;

  //! Rebuilds the broken materials used in \p scope, then rescans it.
  /*! \return the number of materials rebuilt. */
  VGL_AUD_API auto FixShaders(const Scope& scope) -> int;

  //! Runs the complete automatic repair on \p scope, then rescans it.
  /*!
   Progress goes through the milestones 0, 5, 10, 80, 90 and 100 of \p context,
   whose processing flag is raised for the duration of the call. The run is
   abandoned, with an error recorded in \p context, when the active object
   cannot be switched to object mode or the collection does not exist.
  */
  VGL_AUD_API auto AutoFix(const Scope& scope, RunContext& context)
    -> FixCounts;

  VGL_AUD_API auto ClearResults() -> void;

  [[nodiscard]] auto GetResults() const noexcept
    -> const std::vector<Finding>&
  {
    return scanner_.Findings();
  }

  [[nodiscard]] auto ErrorCount() const -> std::size_t
  {
    return CountErrors(GetResults());
  }

  [[nodiscard]] auto WarningCount() const -> std::size_t
  {
    return CountWarnings(GetResults());
  }

  //! Report lines of the last operation.
  [[nodiscard]] auto Messages() const noexcept
    -> const std::vector<std::string>&
  {
    return messages_;
  }

  [[nodiscard]] auto Config() const noexcept -> const AuditConfig&
  {
    return config_;
  }

private:
  [[nodiscard]] auto ResolveScope(const Scope& scope) const
    -> std::optional<std::vector<std::string>>;
  auto Report(bool is_problem, std::string message) -> void;

  scene::SceneStore& store_;
  AuditConfig config_;
  SceneScanner scanner_;
  std::vector<std::string> messages_;
};

} // namespace vigil::audit

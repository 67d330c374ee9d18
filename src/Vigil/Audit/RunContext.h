//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <functional>
#include <string>
#include <vector>

#include <Vigil/Audit/FixCounts.h>
#include <Vigil/Audit/api_export.h>
#include <Vigil/Base/Macros.h>

namespace vigil::audit {

//! Fix counters grouped the way a front-end displays them.
struct GroupCounters {
  int materials { 0 }; //!< Materials rebuilt and empty slots removed
  int drivers { 0 }; //!< Invalid drivers and driver chains
  int modifiers { 0 };
  int transforms { 0 }; //!< Scales and rotations applied
  int geometry { 0 }; //!< UV maps generated
  int rigging { 0 }; //!< Vertex groups cleaned and weights normalized

  auto operator==(const GroupCounters&) const -> bool = default;

  //! Groups the per-category counts of an auto-fix run.
  VGL_AUD_NDAPI static auto From(const FixCounts& counts) -> GroupCounters;
};

//! State of one scan or repair run, observed by the caller.
/*!
 Carries the progress of the run (a percentage and a status line), the
 grouped fix counters, and the errors recorded by steps that failed without
 aborting the run. An optional callback is invoked after every progress
 update.

 The `processing` flag is owned by ProcessingScope, which raises it for its
 lifetime and lowers it on every exit path.
*/
class RunContext {
public:
  using ProgressCallback = std::function<void(const RunContext&)>;

  //! Raises the processing flag of a RunContext until destroyed.
  class ProcessingScope {
  public:
    explicit ProcessingScope(RunContext& context) noexcept
      : context_(context)
    {
      context_.processing_ = true;
    }

    ~ProcessingScope() noexcept { context_.processing_ = false; }

    VIGIL_MAKE_NON_COPYABLE(ProcessingScope)
    VIGIL_MAKE_NON_MOVABLE(ProcessingScope)

  private:
    RunContext& context_;
  };

  RunContext() = default;
  explicit RunContext(ProgressCallback callback)
    : callback_(std::move(callback))
  {
  }

  //! Back to the initial state, the callback excepted.
  VGL_AUD_API auto Reset() -> void;

  VGL_AUD_API auto SetProgress(int percentage, std::string message) -> void;

  VGL_AUD_API auto RecordError(std::string error) -> void;

  auto SetCounters(const GroupCounters& counters) noexcept -> void
  {
    counters_ = counters;
  }

  auto SetSummary(std::string summary) -> void { summary_ = std::move(summary); }
  auto SetOutcome(std::string outcome) -> void { outcome_ = std::move(outcome); }

  [[nodiscard]] auto Percentage() const noexcept -> int { return percentage_; }
  [[nodiscard]] auto Message() const noexcept -> const std::string&
  {
    return message_;
  }
  [[nodiscard]] auto IsProcessing() const noexcept -> bool
  {
    return processing_;
  }
  [[nodiscard]] auto Counters() const noexcept -> const GroupCounters&
  {
    return counters_;
  }
  [[nodiscard]] auto Errors() const noexcept -> const std::vector<std::string>&
  {
    return errors_;
  }
  //! What was fixed, e.g. "Fixed: 2 scales, 1 materials".
  [[nodiscard]] auto Summary() const noexcept -> const std::string&
  {
    return summary_;
  }
  //! What remains after the run, e.g. "Scene is now clean!".
  [[nodiscard]] auto Outcome() const noexcept -> const std::string&
  {
    return outcome_;
  }

private:
  ProgressCallback callback_;
  int percentage_ { 0 };
  std::string message_;
  bool processing_ { false };
  GroupCounters counters_;
  std::vector<std::string> errors_;
  std::string summary_;
  std::string outcome_;
};

} // namespace vigil::audit

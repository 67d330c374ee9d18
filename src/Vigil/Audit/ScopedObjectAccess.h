//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <Vigil/Audit/api_export.h>
#include <Vigil/Base/Macros.h>
#include <Vigil/Scene/SceneStore.h>

namespace vigil::audit {

//! Exclusive operating rights on one object, for the duration of a scope.
/*!
 Host bulk operations act on "the active object" and "the selection". This
 guard snapshots both, makes the target the only selected object and the
 active one, and restores the snapshot when it goes out of scope, whether the
 scope is left normally or by an exception. Objects of the snapshot that were
 removed in the meantime are simply not restored.

 Acquisition fails when the target does not exist; check IsAcquired() before
 invoking the bulk operation.

 \code
   ScopedObjectAccess access { store, name };
   if (access.IsAcquired()) {
     store.ApplyTransform(name, false, true);
   }
 \endcode
*/
class ScopedObjectAccess {
public:
  VGL_AUD_API ScopedObjectAccess(scene::SceneStore& store, std::string_view name);
  VGL_AUD_API ~ScopedObjectAccess() noexcept;

  VIGIL_MAKE_NON_COPYABLE(ScopedObjectAccess)
  VIGIL_MAKE_NON_MOVABLE(ScopedObjectAccess)

  [[nodiscard]] auto IsAcquired() const noexcept -> bool { return acquired_; }

private:
  scene::SceneStore& store_;
  std::string name_;
  std::optional<std::string> previous_active_;
  std::vector<std::string> previous_selection_;
  bool acquired_ { false };
};

//! Switches an object into an interaction mode, and back on scope exit.
/*!
 The switch may be refused by the host, in which case IsActive() is false and
 nothing is restored. The previous mode is only restored if the object still
 exists.
*/
class ScopedInteractionMode {
public:
  VGL_AUD_API ScopedInteractionMode(scene::SceneStore& store,
    std::string_view name, scene::InteractionMode mode);
  VGL_AUD_API ~ScopedInteractionMode() noexcept;

  VIGIL_MAKE_NON_COPYABLE(ScopedInteractionMode)
  VIGIL_MAKE_NON_MOVABLE(ScopedInteractionMode)

  [[nodiscard]] auto IsActive() const noexcept -> bool { return active_; }

private:
  scene::SceneStore& store_;
  std::string name_;
  scene::InteractionMode mode_;
  scene::InteractionMode previous_ { scene::InteractionMode::kObject };
  bool active_ { false };
};

//! Best-effort switch to InteractionMode::kObject of the active object and of
//! \p name, which bulk operations rewriting data require.
/*!
 \return false if \p name does not exist or either switch was refused.
*/
VGL_AUD_NDAPI auto EnsureObjectMode(
  scene::SceneStore& store, std::string_view name) -> bool;

} // namespace vigil::audit

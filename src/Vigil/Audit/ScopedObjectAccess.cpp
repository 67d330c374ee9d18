//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <exception>

#include <Vigil/Audit/ScopedObjectAccess.h>
#include <Vigil/Base/Logging.h>

using vigil::audit::ScopedInteractionMode;
using vigil::audit::ScopedObjectAccess;
using vigil::scene::InteractionMode;
using vigil::scene::SceneStore;

namespace {

auto SwitchToObjectMode(SceneStore& store, std::string_view name) -> bool
{
  const auto* object = store.FindObject(name);
  if (object == nullptr) {
    return false;
  }
  if (object->mode == InteractionMode::kObject) {
    return true;
  }
  return store.SetMode(name, InteractionMode::kObject);
}

} // namespace

ScopedObjectAccess::ScopedObjectAccess(
  SceneStore& store, std::string_view name)
  : store_(store)
  , name_(name)
  , previous_active_(store.GetActiveObject())
  , previous_selection_(store.GetSelection())
{
  store_.DeselectAll();
  acquired_ = store_.SetSelected(name_, true) && store_.SetActiveObject(name_);
  if (!acquired_) {
    DLOG_F(1, "could not acquire '{}'", name_);
  }
}

ScopedObjectAccess::~ScopedObjectAccess() noexcept
{
  try {
    store_.DeselectAll();
    for (const auto& selected : previous_selection_) {
      if (!store_.SetSelected(selected, true)) {
        DLOG_F(1, "'{}' vanished, not re-selected", selected);
      }
    }
    if (!previous_active_ || !store_.SetActiveObject(*previous_active_)) {
      store_.ClearActiveObject();
    }
  } catch (const std::exception& ex) {
    LOG_F(ERROR, "failed to restore selection after access to '{}': {}",
      name_, ex.what());
  }
}

ScopedInteractionMode::ScopedInteractionMode(
  SceneStore& store, std::string_view name, const InteractionMode mode)
  : store_(store)
  , name_(name)
  , mode_(mode)
{
  const auto* object = store_.FindObject(name_);
  if (object == nullptr) {
    return;
  }
  previous_ = object->mode;
  active_ = store_.SetMode(name_, mode_);
  if (!active_) {
    LOG_F(WARNING, "cannot switch '{}' to {} mode", name_,
      scene::to_string(mode_));
  }
}

ScopedInteractionMode::~ScopedInteractionMode() noexcept
{
  if (!active_ || previous_ == mode_) {
    return;
  }
  try {
    if (store_.FindObject(name_) != nullptr
      && !store_.SetMode(name_, previous_)) {
      LOG_F(WARNING, "cannot restore '{}' to {} mode", name_,
        scene::to_string(previous_));
    }
  } catch (const std::exception& ex) {
    LOG_F(ERROR, "failed to restore mode of '{}': {}", name_, ex.what());
  }
}

auto vigil::audit::EnsureObjectMode(SceneStore& store, std::string_view name)
  -> bool
{
  if (const auto active = store.GetActiveObject();
    active && *active != name && !SwitchToObjectMode(store, *active)) {
    LOG_F(WARNING, "cannot switch active object '{}' to OBJECT mode", *active);
    return false;
  }
  if (!SwitchToObjectMode(store, name)) {
    LOG_F(WARNING, "cannot switch '{}' to OBJECT mode", name);
    return false;
  }
  return true;
}

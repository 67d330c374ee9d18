//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <set>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <Vigil/Audit/CycleDetector.h>

using vigil::audit::Chain;
using vigil::scene::IdType;
using vigil::scene::SceneStore;

namespace {

auto CloseCycle(const Chain& path, const std::string& repeated)
  -> std::optional<Chain>
{
  const auto it = std::ranges::find(path, repeated);
  if (it == path.end()) {
    return std::nullopt;
  }
  Chain cycle(it, path.end());
  cycle.push_back(repeated);
  return cycle;
}

class DriverChainWalker {
public:
  explicit DriverChainWalker(const SceneStore& store)
    : store_(store)
  {
  }

  auto Walk(const std::string& name, std::set<std::string> visited,
    Chain path) -> std::optional<Chain>
  {
    const auto* object = store_.FindObject(name);
    if (object == nullptr || acyclic_.contains(name)) {
      return std::nullopt;
    }
    if (visited.contains(name)) {
      return CloseCycle(path, name);
    }
    visited.insert(name);
    path.push_back(name);

    if (object->animation_data) {
      for (const auto& curve : object->animation_data->drivers) {
        for (const auto& variable : curve.driver.variables) {
          for (const auto& target : variable.targets) {
            if (target.id_type != IdType::kObject || target.id.empty()
              || target.id == name) {
              continue;
            }
            if (auto cycle = Walk(target.id, visited, path)) {
              return cycle;
            }
          }
        }
      }
    }

    // Nothing reachable from here loops or leads back into any path, so no
    // later branch can find a cycle through this object either.
    acyclic_.insert(name);
    return std::nullopt;
  }

private:
  const SceneStore& store_;
  std::set<std::string> acyclic_;
};

} // namespace

auto vigil::audit::DetectParentChain(
  const SceneStore& store, std::string_view start) -> std::optional<Chain>
{
  Chain path;
  std::string current { start };
  while (true) {
    const auto* object = store.FindObject(current);
    if (object == nullptr) {
      return std::nullopt;
    }
    if (std::ranges::find(path, current) != path.end()) {
      return CloseCycle(path, current);
    }
    path.push_back(current);
    if (object->parent.empty()) {
      return std::nullopt;
    }
    current = object->parent;
  }
}

auto vigil::audit::DetectDriverChain(
  const SceneStore& store, std::string_view start) -> std::optional<Chain>
{
  DriverChainWalker walker { store };
  return walker.Walk(std::string { start }, {}, {});
}

auto vigil::audit::FormatChain(const Chain& chain) -> std::string
{
  return fmt::format("{}", fmt::join(chain, " → "));
}

//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <glm/vec3.hpp>

#include <Vigil/Audit/AuditConfig.h>
#include <Vigil/Audit/Finding.h>
#include <Vigil/Scene/MemorySceneStore.h>
#include <Vigil/Testing/GTest.h>
#include <Vigil/Testing/ScopedLogCapture.h>

namespace vigil::audit::testing {

//! Base fixture owning an in-memory scene and helpers to populate it.
class AuditTestScene : public ::testing::Test {
protected:
  //! Default configuration, without the pause between transform batches.
  [[nodiscard]] static auto MakeConfig() -> AuditConfig
  {
    AuditConfig config;
    config.batch_pause = std::chrono::milliseconds { 0 };
    return config;
  }

  //! Adds a unit cube mesh, with a UV layer unless \p with_uvs is false.
  auto AddCubeMesh(const std::string& name, const bool with_uvs = true)
    -> scene::MeshData&
  {
    scene::MeshData mesh {
      .name = name,
      .vertices = {
        { -1.0F, -1.0F, -1.0F }, { 1.0F, -1.0F, -1.0F },
        { 1.0F, 1.0F, -1.0F }, { -1.0F, 1.0F, -1.0F },
        { -1.0F, -1.0F, 1.0F }, { 1.0F, -1.0F, 1.0F },
        { 1.0F, 1.0F, 1.0F }, { -1.0F, 1.0F, 1.0F } },
      .edge_count = 12,
      .polygon_count = 6,
    };
    if (with_uvs) {
      mesh.uv_layers.emplace_back("UVMap");
    }
    return store_.AddMesh(std::move(mesh));
  }

  //! Adds a mesh object using the mesh \p data, creating the mesh if needed.
  auto AddMeshObject(const std::string& name, const std::string& data)
    -> scene::SceneObject&
  {
    if (store_.FindMesh(data) == nullptr) {
      AddCubeMesh(data);
    }
    return store_.AddObject(scene::SceneObject {
      .name = name,
      .type = scene::ObjectType::kMesh,
      .data = data,
    });
  }

  auto AddEmpty(const std::string& name) -> scene::SceneObject&
  {
    return store_.AddObject(scene::SceneObject {
      .name = name,
      .type = scene::ObjectType::kEmpty,
    });
  }

  //! Adds a material whose principled shader feeds the output surface.
  auto AddPrincipledMaterial(const std::string& name) -> scene::Material&
  {
    auto& material = store_.CreateMaterial(name);
    auto& graph = *material.node_tree;
    graph.AddNode(scene::ShaderNodeType::kOutputMaterial);
    graph.AddNode(scene::ShaderNodeType::kBsdfPrincipled);
    EXPECT_TRUE(
      graph.Link("Principled BSDF", "BSDF", "Material Output", "Surface"));
    return material;
  }

  //! Adds a material with an output node whose surface input is unlinked.
  auto AddDisconnectedMaterial(const std::string& name) -> scene::Material&
  {
    auto& material = store_.CreateMaterial(name);
    material.node_tree->AddNode(scene::ShaderNodeType::kOutputMaterial);
    return material;
  }

  //! Adds a material without a node graph.
  auto AddLegacyMaterial(const std::string& name) -> scene::Material&
  {
    return store_.AddMaterial(scene::Material {
      .name = name,
      .use_nodes = false,
      .node_tree = std::nullopt,
    });
  }

  [[nodiscard]] static auto CountCategory(
    const std::vector<Finding>& findings, const Category category) -> int
  {
    int n = 0;
    for (const auto& finding : findings) {
      if (finding.category == category) {
        ++n;
      }
    }
    return n;
  }

  scene::MemorySceneStore store_ { "/project" };
};

} // namespace vigil::audit::testing

//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <glm/vec3.hpp>

#include <Vigil/Scene/NodeGraph.h>
#include <Vigil/Scene/Types.h>

//! Plain data records of the scene graph.
/*!
 Every cross-entity reference in these records is a name, resolved through the
 SceneStore when it is used. An empty name is a null reference. A name that no
 longer resolves is a dangling reference, which the audit rules treat exactly
 like a deleted entity.
*/
namespace vigil::scene {

//=== Geometry ===------------------------------------------------------------//

//! Local transform of an object. Rotation is an XYZ Euler triple in radians.
struct Transform {
  glm::vec3 location { 0.0F };
  glm::vec3 rotation { 0.0F };
  glm::vec3 scale { 1.0F };
};

struct ShapeKey {
  std::string name;
  //! Vertex group restricting the key's influence. Empty when unrestricted.
  std::string vertex_group;
};

//! Geometry data block, shared by every object whose `data` names it.
struct MeshData {
  std::string name;
  std::vector<glm::vec3> vertices;
  std::size_t edge_count { 0 };
  std::size_t polygon_count { 0 };
  std::vector<std::string> uv_layers;
  std::vector<ShapeKey> shape_keys;
};

//=== Shading ===-------------------------------------------------------------//

struct Image {
  std::string name;
  ImageSource source { ImageSource::kFile };
  //! Path of the backing file. A leading `//` makes it relative to the store's
  //! base directory.
  std::string filepath;
  bool packed { false };
  bool has_data { true };
  uint32_t width { 0 };
  uint32_t height { 0 };
};

struct Material {
  std::string name;
  bool use_nodes { true };
  std::optional<NodeGraph> node_tree;
};

//=== Modifiers ===-----------------------------------------------------------//

struct ArrayModifier {
  bool use_object_offset { false };
  std::string offset_object;
};

struct BooleanModifier {
  std::string object;
};

struct ShrinkwrapModifier {
  std::string target;
};

struct ArmatureModifier {
  std::string object;
};

struct SurfaceDeformModifier {
  std::string target;
  bool is_bound { false };
};

struct DataTransferModifier {
  std::string object;
};

//! Any modifier type without required references.
struct GenericModifier {
  std::string type_name;
};

using ModifierSettings
  = std::variant<ArrayModifier, BooleanModifier, ShrinkwrapModifier,
    ArmatureModifier, SurfaceDeformModifier, DataTransferModifier,
    GenericModifier>;

struct Modifier {
  std::string name;
  ModifierSettings settings;
};

//=== Animation ===-----------------------------------------------------------//

struct DriverTarget {
  IdType id_type { IdType::kObject };
  //! Referenced data-block. Empty when the target is unset.
  std::string id;
};

struct DriverVariable {
  std::string name;
  std::vector<DriverTarget> targets;
};

struct Driver {
  DriverType type { DriverType::kScripted };
  std::string expression;
  //! Validity flag maintained by the host's driver evaluator.
  bool is_valid { true };
  std::vector<DriverVariable> variables;
};

//! Animation curve bound to a property and computed by a driver.
struct FCurve {
  std::string data_path;
  int array_index { 0 };
  Driver driver;
};

struct AnimationData {
  std::vector<FCurve> drivers;
};

//=== Rigging ===-------------------------------------------------------------//

//! Vertex group, mapping vertex indices to weights.
struct VertexGroup {
  std::string name;
  std::map<uint32_t, float> weights;
};

struct Constraint {
  std::string name;
  std::string type_name;
  //! Target object. Empty for constraints without a target.
  std::string target;
};

//=== Objects ===-------------------------------------------------------------//

struct SceneObject {
  std::string name;
  ObjectType type { ObjectType::kMesh };
  Transform transform;
  //! Parent object. Empty for root objects.
  std::string parent;
  //! Geometry data block. Empty when the object has none.
  std::string data;
  std::vector<Modifier> modifiers;
  //! Ordered material slots. An empty name is an empty slot.
  std::vector<std::string> material_slots;
  std::optional<AnimationData> animation_data;
  std::vector<VertexGroup> vertex_groups;
  std::vector<Constraint> constraints;
  //! Bone names, armature objects only.
  std::vector<std::string> bones;
  InteractionMode mode { InteractionMode::kObject };
};

} // namespace vigil::scene

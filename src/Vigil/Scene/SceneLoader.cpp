//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <string>

#include <nlohmann/json.hpp>

#include <Vigil/Base/Logging.h>
#include <Vigil/Scene/Detail/JsonFields.h>
#include <Vigil/Scene/SceneLoader.h>

using nlohmann::json;

using vigil::scene::detail::ReadBoolField;
using vigil::scene::detail::ReadEnumField;
using vigil::scene::detail::ReadStringField;
using vigil::scene::detail::ReadUIntField;
using vigil::scene::detail::ReadVec3;
using vigil::scene::detail::ReadVec3Field;

namespace vigil::scene {

namespace {

  auto ReadStringList(const json& obj, const char* name,
    std::vector<std::string>& target, std::ostream& errors) -> bool
  {
    if (!obj.contains(name)) {
      return true;
    }
    if (!obj[name].is_array()) {
      errors << "ERROR: '" << name << "' must be an array\n";
      return false;
    }
    for (const auto& item : obj[name]) {
      if (item.is_null()) {
        target.emplace_back();
      } else if (item.is_string()) {
        target.push_back(item.get<std::string>());
      } else {
        errors << "ERROR: '" << name << "' entries must be strings or null\n";
        return false;
      }
    }
    return true;
  }

  //! Iterates the array \p name of \p obj, calling \p read on each element.
  template <typename Fn>
  auto ForEachEntry(const json& obj, const char* name, std::ostream& errors,
    Fn&& read) -> bool
  {
    if (!obj.contains(name)) {
      return true;
    }
    if (!obj[name].is_array()) {
      errors << "ERROR: '" << name << "' must be an array\n";
      return false;
    }
    for (const auto& item : obj[name]) {
      if (!item.is_object()) {
        errors << "ERROR: '" << name << "' entries must be objects\n";
        return false;
      }
      if (!read(item)) {
        return false;
      }
    }
    return true;
  }

  auto RequireName(const json& obj, std::string& name, std::ostream& errors)
    -> bool
  {
    if (!ReadStringField(obj, "name", name, errors)) {
      return false;
    }
    if (name.empty()) {
      errors << "ERROR: entry without a 'name'\n";
      return false;
    }
    return true;
  }

  //=== Meshes and images ===-------------------------------------------------//

  auto ReadMesh(const json& obj, std::ostream& errors) -> std::optional<MeshData>
  {
    MeshData mesh;
    if (!RequireName(obj, mesh.name, errors)
      || !ReadUIntField(obj, "edges", mesh.edge_count, errors)
      || !ReadUIntField(obj, "polygons", mesh.polygon_count, errors)
      || !ReadStringList(obj, "uv_layers", mesh.uv_layers, errors)) {
      return std::nullopt;
    }

    if (obj.contains("vertices")) {
      if (!obj["vertices"].is_array()) {
        errors << "ERROR: 'vertices' must be an array\n";
        return std::nullopt;
      }
      for (const auto& item : obj["vertices"]) {
        glm::vec3 vertex { 0.0F };
        if (!ReadVec3(item, vertex)) {
          errors << "ERROR: mesh '" << mesh.name
                 << "' vertices must be arrays of 3 numbers\n";
          return std::nullopt;
        }
        mesh.vertices.push_back(vertex);
      }
    }

    const auto ok = ForEachEntry(obj, "shape_keys", errors, [&](const json& k) {
      ShapeKey key;
      if (!RequireName(k, key.name, errors)
        || !ReadStringField(k, "vertex_group", key.vertex_group, errors)) {
        return false;
      }
      mesh.shape_keys.push_back(std::move(key));
      return true;
    });
    if (!ok) {
      return std::nullopt;
    }
    return mesh;
  }

  auto ReadImage(const json& obj, std::ostream& errors) -> std::optional<Image>
  {
    Image image;
    if (!RequireName(obj, image.name, errors)
      || !ReadEnumField(
        obj, "source", image.source, ImageSource::kViewer, errors)
      || !ReadStringField(obj, "filepath", image.filepath, errors)
      || !ReadBoolField(obj, "packed", image.packed, errors)
      || !ReadBoolField(obj, "has_data", image.has_data, errors)
      || !ReadUIntField(obj, "width", image.width, errors)
      || !ReadUIntField(obj, "height", image.height, errors)) {
      return std::nullopt;
    }
    return image;
  }

  //=== Materials ===---------------------------------------------------------//

  auto ReadNodeGraph(const json& obj, NodeGraph& graph, std::ostream& errors)
    -> bool
  {
    const auto nodes_ok = ForEachEntry(obj, "nodes", errors, [&](const json& n) {
      auto type = ShaderNodeType::kOther;
      std::string name;
      std::string image;
      if (!ReadEnumField(n, "type", type, ShaderNodeType::kOther, errors)
        || !ReadStringField(n, "name", name, errors)
        || !ReadStringField(n, "image", image, errors)) {
        return false;
      }
      auto& node = graph.AddNode(type, name);
      node.image = std::move(image);
      if (n.contains("defaults") && n["defaults"].is_object()) {
        for (const auto& entry : n["defaults"].items()) {
          const auto& socket = entry.key();
          const auto& value = entry.value();
          if (value.is_number()) {
            node.defaults[socket] = value.get<float>();
          } else if (value.is_array() && value.size() == 4) {
            node.defaults[socket] = glm::vec4 { value[0].get<float>(),
              value[1].get<float>(), value[2].get<float>(),
              value[3].get<float>() };
          }
        }
      }
      return true;
    });
    if (!nodes_ok) {
      return false;
    }

    return ForEachEntry(obj, "links", errors, [&](const json& l) {
      std::string from;
      std::string from_socket;
      std::string to;
      std::string to_socket;
      if (!ReadStringField(l, "from", from, errors)
        || !ReadStringField(l, "from_socket", from_socket, errors)
        || !ReadStringField(l, "to", to, errors)
        || !ReadStringField(l, "to_socket", to_socket, errors)) {
        return false;
      }
      if (!graph.Link(from, from_socket, to, to_socket)) {
        errors << "ERROR: cannot link '" << from << "." << from_socket
               << "' to '" << to << "." << to_socket << "'\n";
        return false;
      }
      return true;
    });
  }

  auto ReadMaterial(const json& obj, std::ostream& errors)
    -> std::optional<Material>
  {
    Material material;
    if (!RequireName(obj, material.name, errors)
      || !ReadBoolField(obj, "use_nodes", material.use_nodes, errors)) {
      return std::nullopt;
    }
    if (obj.contains("node_tree") && !obj["node_tree"].is_null()) {
      if (!obj["node_tree"].is_object()) {
        errors << "ERROR: 'node_tree' must be an object or null\n";
        return std::nullopt;
      }
      material.node_tree.emplace();
      if (!ReadNodeGraph(obj["node_tree"], *material.node_tree, errors)) {
        return std::nullopt;
      }
    }
    return material;
  }

  //=== Objects ===-----------------------------------------------------------//

  auto ReadModifier(const json& obj, std::ostream& errors)
    -> std::optional<Modifier>
  {
    Modifier modifier;
    std::string type;
    if (!RequireName(obj, modifier.name, errors)
      || !ReadStringField(obj, "type", type, errors)) {
      return std::nullopt;
    }

    auto read_ref = [&](const char* field, std::string& target) {
      return ReadStringField(obj, field, target, errors);
    };
    bool ok = true;
    if (type == "ARRAY") {
      ArrayModifier settings;
      ok = ReadBoolField(
             obj, "use_object_offset", settings.use_object_offset, errors)
        && read_ref("offset_object", settings.offset_object);
      modifier.settings = settings;
    } else if (type == "BOOLEAN") {
      BooleanModifier settings;
      ok = read_ref("object", settings.object);
      modifier.settings = settings;
    } else if (type == "SHRINKWRAP") {
      ShrinkwrapModifier settings;
      ok = read_ref("target", settings.target);
      modifier.settings = settings;
    } else if (type == "ARMATURE") {
      ArmatureModifier settings;
      ok = read_ref("object", settings.object);
      modifier.settings = settings;
    } else if (type == "SURFACE_DEFORM") {
      SurfaceDeformModifier settings;
      ok = read_ref("target", settings.target)
        && ReadBoolField(obj, "is_bound", settings.is_bound, errors);
      modifier.settings = settings;
    } else if (type == "DATA_TRANSFER") {
      DataTransferModifier settings;
      ok = read_ref("object", settings.object);
      modifier.settings = settings;
    } else {
      modifier.settings = GenericModifier { .type_name = type };
    }
    if (!ok) {
      return std::nullopt;
    }
    return modifier;
  }

  auto ReadDriver(const json& obj, std::ostream& errors) -> std::optional<FCurve>
  {
    FCurve curve;
    if (!ReadStringField(obj, "data_path", curve.data_path, errors)
      || !ReadUIntField(obj, "array_index", curve.array_index, errors)
      || !ReadEnumField(
        obj, "type", curve.driver.type, DriverType::kMax, errors)
      || !ReadStringField(obj, "expression", curve.driver.expression, errors)
      || !ReadBoolField(obj, "is_valid", curve.driver.is_valid, errors)) {
      return std::nullopt;
    }

    const auto ok = ForEachEntry(obj, "variables", errors, [&](const json& v) {
      DriverVariable variable;
      if (!ReadStringField(v, "name", variable.name, errors)) {
        return false;
      }
      const auto targets_ok
        = ForEachEntry(v, "targets", errors, [&](const json& t) {
            DriverTarget target;
            if (!ReadEnumField(
                  t, "id_type", target.id_type, IdType::kText, errors)
              || !ReadStringField(t, "id", target.id, errors)) {
              return false;
            }
            variable.targets.push_back(std::move(target));
            return true;
          });
      curve.driver.variables.push_back(std::move(variable));
      return targets_ok;
    });
    if (!ok) {
      return std::nullopt;
    }
    return curve;
  }

  auto ReadVertexGroup(const json& obj, std::ostream& errors)
    -> std::optional<VertexGroup>
  {
    VertexGroup group;
    if (!RequireName(obj, group.name, errors)) {
      return std::nullopt;
    }
    if (obj.contains("weights")) {
      // [[vertex_index, weight], ...]
      if (!obj["weights"].is_array()) {
        errors << "ERROR: 'weights' must be an array\n";
        return std::nullopt;
      }
      for (const auto& entry : obj["weights"]) {
        if (!entry.is_array() || entry.size() != 2
          || !entry[0].is_number_integer() || !entry[1].is_number()
          || entry[0].get<int64_t>() < 0) {
          errors << "ERROR: vertex group '" << group.name
                 << "' weights must be [index, weight] pairs\n";
          return std::nullopt;
        }
        group.weights[entry[0].get<uint32_t>()] = entry[1].get<float>();
      }
    }
    return group;
  }

  auto ReadObject(const json& obj, MemorySceneStore& store,
    std::ostream& errors) -> bool
  {
    SceneObject object;
    bool in_view_layer = true;
    std::vector<std::string> collections;
    if (!RequireName(obj, object.name, errors)
      || !ReadEnumField(obj, "type", object.type, ObjectType::kOther, errors)
      || !ReadEnumField(
        obj, "mode", object.mode, InteractionMode::kSculpt, errors)
      || !ReadStringField(obj, "parent", object.parent, errors)
      || !ReadStringField(obj, "data", object.data, errors)
      || !ReadVec3Field(obj, "location", object.transform.location, errors)
      || !ReadVec3Field(obj, "rotation", object.transform.rotation, errors)
      || !ReadVec3Field(obj, "scale", object.transform.scale, errors)
      || !ReadStringList(obj, "material_slots", object.material_slots, errors)
      || !ReadStringList(obj, "bones", object.bones, errors)
      || !ReadStringList(obj, "collections", collections, errors)
      || !ReadBoolField(obj, "in_view_layer", in_view_layer, errors)) {
      return false;
    }

    const auto ok = ForEachEntry(obj, "modifiers", errors,
                      [&](const json& m) {
                        auto modifier = ReadModifier(m, errors);
                        if (modifier) {
                          object.modifiers.push_back(std::move(*modifier));
                        }
                        return modifier.has_value();
                      })
      && ForEachEntry(obj, "drivers", errors,
        [&](const json& d) {
          auto curve = ReadDriver(d, errors);
          if (curve) {
            if (!object.animation_data) {
              object.animation_data.emplace();
            }
            object.animation_data->drivers.push_back(std::move(*curve));
          }
          return curve.has_value();
        })
      && ForEachEntry(obj, "vertex_groups", errors,
        [&](const json& g) {
          auto group = ReadVertexGroup(g, errors);
          if (group) {
            object.vertex_groups.push_back(std::move(*group));
          }
          return group.has_value();
        })
      && ForEachEntry(obj, "constraints", errors, [&](const json& c) {
           Constraint constraint;
           if (!ReadStringField(c, "name", constraint.name, errors)
             || !ReadStringField(c, "type", constraint.type_name, errors)
             || !ReadStringField(c, "target", constraint.target, errors)) {
             return false;
           }
           object.constraints.push_back(std::move(constraint));
           return true;
         });
    if (!ok) {
      return false;
    }

    const auto& added = store.AddObject(std::move(object));
    if (!in_view_layer) {
      store.SetInViewLayer(added.name, false);
    }
    for (const auto& collection : collections) {
      store.LinkToCollection(collection, added.name);
    }
    return true;
  }

} // namespace

auto LoadScene(const json& document, std::ostream& errors,
  std::filesystem::path base_dir) -> std::unique_ptr<MemorySceneStore>
{
  if (!document.is_object()) {
    errors << "ERROR: scene description must be a JSON object\n";
    return nullptr;
  }

  auto store = std::make_unique<MemorySceneStore>(std::move(base_dir));

  const auto ok = ForEachEntry(document, "meshes", errors,
                    [&](const json& m) {
                      auto mesh = ReadMesh(m, errors);
                      if (mesh) {
                        store->AddMesh(std::move(*mesh));
                      }
                      return mesh.has_value();
                    })
    && ForEachEntry(document, "images", errors,
      [&](const json& i) {
        auto image = ReadImage(i, errors);
        if (image) {
          store->AddImage(std::move(*image));
        }
        return image.has_value();
      })
    && ForEachEntry(document, "materials", errors,
      [&](const json& m) {
        auto material = ReadMaterial(m, errors);
        if (material) {
          store->AddMaterial(std::move(*material));
        }
        return material.has_value();
      })
    && ForEachEntry(document, "objects", errors,
      [&](const json& o) { return ReadObject(o, *store, errors); });
  if (!ok) {
    return nullptr;
  }

  LOG_F(1, "scene loaded: {} objects, {} meshes, {} materials",
    store->GetObjectNames().size(), store->GetMeshNames().size(),
    store->GetMaterialNames().size());
  return store;
}

auto LoadSceneFile(const std::filesystem::path& path, std::ostream& errors)
  -> std::unique_ptr<MemorySceneStore>
{
  const auto document = detail::ReadJsonFile(path, errors);
  if (!document) {
    return nullptr;
  }
  return LoadScene(*document, errors, path.parent_path());
}

} // namespace vigil::scene

//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <array>
#include <bit>
#include <exception>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <glm/vec4.hpp>

#include <Vigil/Audit/Rules/MaterialRules.h>
#include <Vigil/Base/Logging.h>

using vigil::audit::AuditConfig;
using vigil::audit::Category;
using vigil::audit::Issue;
using vigil::audit::Severity;
using vigil::scene::Image;
using vigil::scene::ImageSource;
using vigil::scene::Material;
using vigil::scene::NodeGraph;
using vigil::scene::SceneStore;
using vigil::scene::ShaderNode;
using vigil::scene::ShaderNodeType;

namespace {

constexpr const char* kSurfaceSocket = "Surface";

constexpr std::array kDeprecatedTypes {
  ShaderNodeType::kBsdfDiffuse,
  ShaderNodeType::kBsdfGlossy,
  ShaderNodeType::kEmission,
};

constexpr std::array kPathTracingOnlyTypes {
  ShaderNodeType::kBsdfHair,
  ShaderNodeType::kBsdfHairPrincipled,
  ShaderNodeType::kSubsurfaceScattering,
  ShaderNodeType::kBsdfAnisotropic,
  ShaderNodeType::kBsdfSheen,
  ShaderNodeType::kBsdfToon,
};

auto IsDeprecated(const ShaderNodeType type) -> bool
{
  return std::ranges::find(kDeprecatedTypes, type) != kDeprecatedTypes.end();
}

auto Broken(std::string message, const Severity severity) -> Issue
{
  return {
    .category = Category::kBrokenShader,
    .message = std::move(message),
    .severity = severity,
  };
}

auto TextureIssue(std::string message, const Severity severity) -> Issue
{
  return {
    .category = Category::kTexture,
    .message = std::move(message),
    .severity = severity,
  };
}

auto IsPackable(const SceneStore& store, const Image& image) -> bool
{
  return image.source == ImageSource::kFile && !image.packed
    && !image.filepath.empty() && store.ImageFileExists(image);
}

auto CheckImageTexture(const SceneStore& store, const ShaderNode& node,
  const AuditConfig& config, std::vector<Issue>& issues) -> void
{
  const auto* image = store.FindImage(node.image);
  if (node.image.empty() || image == nullptr) {
    issues.push_back(TextureIssue(
      "Image Texture node has no image assigned.", Severity::kWarning));
    return;
  }
  if (image->source != ImageSource::kFile || image->packed) {
    return;
  }
  if (image->filepath.empty()) {
    issues.push_back(TextureIssue(
      fmt::format("Image '{}' has no filepath.", image->name),
      Severity::kError));
    return;
  }
  if (!store.ImageFileExists(*image)) {
    issues.push_back(TextureIssue(fmt::format("Missing texture file: {} ({})",
                                    image->name, image->filepath),
      Severity::kError));
    return;
  }
  if (!image->has_data) {
    issues.push_back(TextureIssue(
      fmt::format("Image '{}' failed to load.", image->name),
      Severity::kError));
    return;
  }

  const auto width = image->width;
  const auto height = image->height;
  if (width == 0 || height == 0) {
    return;
  }
  if (width > config.max_texture_size || height > config.max_texture_size) {
    issues.push_back(TextureIssue(fmt::format("Very large texture: {} ({}x{})",
                                    image->name, width, height),
      Severity::kWarning));
  }
  if (!std::has_single_bit(width) || !std::has_single_bit(height)) {
    issues.push_back(
      TextureIssue(fmt::format("Non-power-of-2 texture: {} ({}x{})",
                     image->name, width, height),
        Severity::kWarning));
  }
}

auto CheckEnvironmentTexture(const SceneStore& store, const ShaderNode& node,
  std::vector<Issue>& issues) -> void
{
  const auto* image = store.FindImage(node.image);
  if (node.image.empty() || image == nullptr) {
    issues.push_back(TextureIssue(
      "Environment Texture node has no image assigned.", Severity::kWarning));
    return;
  }
  if (image->source == ImageSource::kFile && !image->packed
    && !image->filepath.empty() && !store.ImageFileExists(*image)) {
    issues.push_back(TextureIssue(
      fmt::format("Missing environment texture: {}", image->name),
      Severity::kError));
  }
}

} // namespace

//=== Inspection ===----------------------------------------------------------//

auto vigil::audit::rules::IsMaterialBroken(const Material* material)
  -> std::optional<Issue>
{
  if (material == nullptr) {
    return Broken("Material has been deleted.", Severity::kError);
  }
  if (!material->use_nodes) {
    return Broken("Material does not use Nodes (Legacy).", Severity::kError);
  }
  if (!material->node_tree) {
    return Broken("Node tree is None or invalid.", Severity::kError);
  }
  const auto* output
    = material->node_tree->FindFirst(ShaderNodeType::kOutputMaterial);
  if (output == nullptr) {
    return Broken("Missing Material Output node.", Severity::kError);
  }
  if (!material->node_tree->IsLinked(output->name, kSurfaceSocket)) {
    return Broken(
      "Material Output surface is disconnected.", Severity::kWarning);
  }
  return std::nullopt;
}

auto vigil::audit::rules::ValidateTextures(const SceneStore& store,
  const Material& material, const AuditConfig& config) -> std::vector<Issue>
{
  std::vector<Issue> issues;
  if (!material.use_nodes || !material.node_tree) {
    return issues;
  }
  for (const auto& node : material.node_tree->Nodes()) {
    if (node.type == ShaderNodeType::kTexImage) {
      CheckImageTexture(store, node, config, issues);
    } else if (node.type == ShaderNodeType::kTexEnvironment) {
      CheckEnvironmentTexture(store, node, issues);
    }
  }
  return issues;
}

auto vigil::audit::rules::CheckShaderCompatibility(const Material& material)
  -> std::vector<Issue>
{
  std::vector<Issue> issues;
  if (!material.use_nodes || !material.node_tree) {
    return issues;
  }
  for (const auto& node : material.node_tree->Nodes()) {
    if (std::ranges::find(kPathTracingOnlyTypes, node.type)
      != kPathTracingOnlyTypes.end()) {
      issues.push_back({
        .category = Category::kShaderCompat,
        .message = fmt::format(
          "Node '{}' ({}) is only supported by the path-tracing renderer.",
          node.name, scene::to_string(node.type)),
        .severity = Severity::kWarning,
      });
    }
    if (IsDeprecated(node.type)) {
      const auto* advice = node.type == ShaderNodeType::kEmission
        ? "Use Principled BSDF emission"
        : "Use Principled BSDF instead";
      issues.push_back({
        .category = Category::kShaderCompat,
        .message = fmt::format("Deprecated node '{}' ({}). {}", node.name,
          scene::to_string(node.type), advice),
        .severity = Severity::kWarning,
      });
    }
  }
  return issues;
}

//=== Repair ===--------------------------------------------------------------//

auto vigil::audit::rules::RebuildMaterial(Material& material) -> void
{
  material.use_nodes = true;
  auto& graph = material.node_tree ? *material.node_tree
                                   : material.node_tree.emplace();
  graph.Clear();

  const auto output = graph.AddNode(ShaderNodeType::kOutputMaterial).name;
  const auto shader = graph.AddNode(ShaderNodeType::kBsdfPrincipled).name;
  CHECK_F(graph.Link(shader, "BSDF", output, kSurfaceSocket),
    "principled shader must link to the material output");
  DLOG_F(1, "material '{}' rebuilt", material.name);
}

auto vigil::audit::rules::GetOrCreateMarkerMaterial(
  SceneStore& store, const AuditConfig& config) -> Material&
{
  if (auto* existing = store.FindMaterial(config.marker_material_name);
    existing != nullptr) {
    return *existing;
  }

  auto& marker = store.CreateMaterial(config.marker_material_name);
  marker.use_nodes = true;
  auto& graph = marker.node_tree ? *marker.node_tree
                                 : marker.node_tree.emplace();
  graph.Clear();

  const auto output = graph.AddNode(ShaderNodeType::kOutputMaterial).name;
  auto& emission = graph.AddNode(ShaderNodeType::kEmission);
  emission.defaults["Color"] = glm::vec4 { 1.0F, 0.0F, 0.0F, 1.0F };
  emission.defaults["Strength"] = 2.0F;
  const auto emission_name = emission.name;
  CHECK_F(graph.Link(emission_name, "Emission", output, kSurfaceSocket),
    "emission must link to the material output");

  LOG_F(INFO, "marker material '{}' created", marker.name);
  return marker;
}

auto vigil::audit::rules::MarkBrokenMaterial(SceneStore& store,
  std::string_view object_name, const std::size_t slot_index,
  const AuditConfig& config) -> bool
{
  const auto* object = store.FindObject(object_name);
  if (object == nullptr || slot_index >= object->material_slots.size()) {
    return false;
  }
  const auto marker_name = GetOrCreateMarkerMaterial(store, config).name;

  // Re-resolve, creating the marker may have invalidated the lookup.
  auto* target = store.FindObject(object_name);
  if (target == nullptr) {
    return false;
  }
  DLOG_F(1, "'{}' slot {}: '{}' replaced by '{}'", object_name, slot_index,
    target->material_slots[slot_index], marker_name);
  target->material_slots[slot_index] = marker_name;
  return true;
}

auto vigil::audit::rules::FixEmptySlots(
  SceneStore& store, std::string_view object_name) -> int
{
  auto* object = store.FindObject(object_name);
  if (object == nullptr || object->material_slots.empty()
    || object->data.empty()) {
    return 0;
  }
  const auto empty_count = std::ranges::count_if(object->material_slots,
    [](const std::string& slot) { return slot.empty(); });
  if (empty_count == 0) {
    return 0;
  }

  std::erase_if(object->material_slots,
    [](const std::string& slot) { return slot.empty(); });
  DLOG_F(1, "'{}': {} empty slot(s) removed", object_name, empty_count);
  return static_cast<int>(empty_count);
}

auto vigil::audit::rules::FixDisconnectedOutput(Material& material) -> bool
{
  if (!material.use_nodes || !material.node_tree) {
    return false;
  }
  auto& graph = *material.node_tree;
  const auto* output = graph.FindFirst(ShaderNodeType::kOutputMaterial);
  if (output == nullptr || graph.IsLinked(output->name, kSurfaceSocket)) {
    return false;
  }
  const auto output_name = output->name;

  std::string shader;
  if (const auto* principled = graph.FindFirst(ShaderNodeType::kBsdfPrincipled);
    principled != nullptr) {
    shader = principled->name;
  } else {
    shader = graph.AddNode(ShaderNodeType::kBsdfPrincipled).name;
  }
  if (!graph.Link(shader, "BSDF", output_name, kSurfaceSocket)) {
    LOG_F(WARNING, "material '{}': cannot link '{}' to the output",
      material.name, shader);
    return false;
  }
  DLOG_F(1, "material '{}': output reconnected to '{}'", material.name, shader);
  return true;
}

auto vigil::audit::rules::ReplaceDeprecatedNodes(Material& material) -> int
{
  if (!material.use_nodes || !material.node_tree) {
    return 0;
  }
  auto& graph = *material.node_tree;

  // Removing nodes invalidates the node list, work on a snapshot of names.
  std::vector<std::string> deprecated;
  for (const auto& node : graph.Nodes()) {
    if (IsDeprecated(node.type)) {
      deprecated.push_back(node.name);
    }
  }

  int replaced = 0;
  for (const auto& name : deprecated) {
    const auto* node = graph.FindNode(name);
    if (node == nullptr) {
      continue;
    }
    const auto outgoing = node->outputs.empty()
      ? std::vector<scene::NodeLink> {}
      : graph.LinksFrom(name, node->outputs.front());

    const auto replacement = graph.AddNode(ShaderNodeType::kBsdfPrincipled).name;
    for (const auto& link : outgoing) {
      if (!graph.Link(replacement, "BSDF", link.to_node, link.to_socket)) {
        LOG_F(WARNING, "material '{}': cannot rewire '{}' to '{}.{}'",
          material.name, replacement, link.to_node, link.to_socket);
      }
    }
    CHECK_F(graph.RemoveNode(name), "node '{}' must still exist", name);
    DLOG_F(1, "material '{}': '{}' replaced by '{}'", material.name, name,
      replacement);
    ++replaced;
  }
  return replaced;
}

auto vigil::audit::rules::PackExternalTextures(
  SceneStore& store, const Material& material) -> int
{
  if (!material.use_nodes || !material.node_tree) {
    return 0;
  }

  // Collect first, packing may change the image table.
  std::vector<std::string> candidates;
  for (const auto& node : material.node_tree->Nodes()) {
    if (node.type != ShaderNodeType::kTexImage
      && node.type != ShaderNodeType::kTexEnvironment) {
      continue;
    }
    const auto* image = store.FindImage(node.image);
    if (!node.image.empty() && image != nullptr && IsPackable(store, *image)
      && std::ranges::find(candidates, node.image) == candidates.end()) {
      candidates.push_back(node.image);
    }
  }

  int packed = 0;
  for (const auto& image : candidates) {
    try {
      if (store.PackImage(image)) {
        DLOG_F(1, "image '{}' packed", image);
        ++packed;
      }
    } catch (const std::exception& ex) {
      LOG_F(WARNING, "failed to pack texture '{}': {}", image, ex.what());
    }
  }
  return packed;
}

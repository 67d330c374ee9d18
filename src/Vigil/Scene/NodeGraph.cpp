//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <iterator>
#include <ranges>

#include <Vigil/Scene/Detail/UniqueName.h>
#include <Vigil/Scene/NodeGraph.h>

using vigil::scene::NodeGraph;
using vigil::scene::NodeLink;
using vigil::scene::ShaderNode;
using vigil::scene::ShaderNodeType;

namespace {

struct SocketLayout {
  std::vector<std::string> inputs;
  std::vector<std::string> outputs;
};

auto LayoutFor(const ShaderNodeType type) -> SocketLayout
{
  switch (type) {
  case ShaderNodeType::kOutputMaterial:
    return { { "Surface", "Volume", "Displacement" }, {} };
  case ShaderNodeType::kBsdfPrincipled:
    return { { "Base Color", "Metallic", "Roughness", "Normal",
               "Emission Color", "Emission Strength" },
      { "BSDF" } };
  case ShaderNodeType::kEmission:
    return { { "Color", "Strength" }, { "Emission" } };
  case ShaderNodeType::kMixShader:
    return { { "Fac", "Shader", "Shader_001" }, { "Shader" } };
  case ShaderNodeType::kTexImage:
    return { { "Vector" }, { "Color", "Alpha" } };
  case ShaderNodeType::kTexEnvironment:
    return { { "Vector" }, { "Color" } };
  case ShaderNodeType::kSubsurfaceScattering:
    return { { "Color", "Scale", "Radius" }, { "BSSRDF" } };
  case ShaderNodeType::kBsdfDiffuse:
  case ShaderNodeType::kBsdfGlossy:
  case ShaderNodeType::kBsdfHair:
  case ShaderNodeType::kBsdfHairPrincipled:
  case ShaderNodeType::kBsdfAnisotropic:
  case ShaderNodeType::kBsdfSheen:
  case ShaderNodeType::kBsdfToon:
    return { { "Color", "Roughness", "Normal" }, { "BSDF" } };
  case ShaderNodeType::kOther:
    break;
  }
  return { { "Input" }, { "Output" } };
}

auto Contains(const std::vector<std::string>& sockets, std::string_view name)
  -> bool
{
  return std::ranges::find(sockets, name) != sockets.end();
}

} // namespace

auto ShaderNode::HasInput(std::string_view socket) const -> bool
{
  return Contains(inputs, socket);
}

auto ShaderNode::HasOutput(std::string_view socket) const -> bool
{
  return Contains(outputs, socket);
}

auto vigil::scene::DefaultNodeName(const ShaderNodeType type) -> const char*
{
  switch (type) {
  case ShaderNodeType::kOutputMaterial:
    return "Material Output";
  case ShaderNodeType::kBsdfPrincipled:
    return "Principled BSDF";
  case ShaderNodeType::kBsdfDiffuse:
    return "Diffuse BSDF";
  case ShaderNodeType::kBsdfGlossy:
    return "Glossy BSDF";
  case ShaderNodeType::kEmission:
    return "Emission";
  case ShaderNodeType::kMixShader:
    return "Mix Shader";
  case ShaderNodeType::kTexImage:
    return "Image Texture";
  case ShaderNodeType::kTexEnvironment:
    return "Environment Texture";
  case ShaderNodeType::kBsdfHair:
    return "Hair BSDF";
  case ShaderNodeType::kBsdfHairPrincipled:
    return "Principled Hair BSDF";
  case ShaderNodeType::kSubsurfaceScattering:
    return "Subsurface Scattering";
  case ShaderNodeType::kBsdfAnisotropic:
    return "Anisotropic BSDF";
  case ShaderNodeType::kBsdfSheen:
    return "Sheen BSDF";
  case ShaderNodeType::kBsdfToon:
    return "Toon BSDF";
  case ShaderNodeType::kOther:
    return "Node";
  }

  return "__NotSupported__";
}

auto NodeGraph::AddNode(const ShaderNodeType type, std::string_view name)
  -> ShaderNode&
{
  const std::string_view base = name.empty() ? DefaultNodeName(type) : name;
  auto unique = detail::MakeUniqueName(
    base, [this](std::string_view n) { return FindNode(n) != nullptr; });

  auto [inputs, outputs] = LayoutFor(type);
  nodes_.push_back(ShaderNode {
    .name = std::move(unique),
    .type = type,
    .inputs = std::move(inputs),
    .outputs = std::move(outputs),
    .defaults = {},
    .image = {},
  });
  return nodes_.back();
}

auto NodeGraph::RemoveNode(std::string_view name) -> bool
{
  const auto it = std::ranges::find(nodes_, name, &ShaderNode::name);
  if (it == nodes_.end()) {
    return false;
  }
  std::erase_if(links_, [name](const NodeLink& link) {
    return link.from_node == name || link.to_node == name;
  });
  nodes_.erase(it);
  return true;
}

auto NodeGraph::FindNode(std::string_view name) -> ShaderNode*
{
  const auto it = std::ranges::find(nodes_, name, &ShaderNode::name);
  return it == nodes_.end() ? nullptr : &*it;
}

auto NodeGraph::FindNode(std::string_view name) const -> const ShaderNode*
{
  const auto it = std::ranges::find(nodes_, name, &ShaderNode::name);
  return it == nodes_.end() ? nullptr : &*it;
}

auto NodeGraph::FindFirst(const ShaderNodeType type) -> ShaderNode*
{
  const auto it = std::ranges::find(nodes_, type, &ShaderNode::type);
  return it == nodes_.end() ? nullptr : &*it;
}

auto NodeGraph::FindFirst(const ShaderNodeType type) const -> const ShaderNode*
{
  const auto it = std::ranges::find(nodes_, type, &ShaderNode::type);
  return it == nodes_.end() ? nullptr : &*it;
}

auto NodeGraph::Link(std::string_view from_node, std::string_view from_socket,
  std::string_view to_node, std::string_view to_socket) -> bool
{
  const auto* from = FindNode(from_node);
  const auto* to = FindNode(to_node);
  if (from == nullptr || to == nullptr || !from->HasOutput(from_socket)
    || !to->HasInput(to_socket)) {
    return false;
  }

  std::erase_if(links_, [to_node, to_socket](const NodeLink& link) {
    return link.to_node == to_node && link.to_socket == to_socket;
  });
  links_.push_back(NodeLink {
    .from_node = std::string(from_node),
    .from_socket = std::string(from_socket),
    .to_node = std::string(to_node),
    .to_socket = std::string(to_socket),
  });
  return true;
}

auto NodeGraph::IsLinked(
  std::string_view node, std::string_view input_socket) const -> bool
{
  return std::ranges::any_of(links_, [&](const NodeLink& link) {
    return link.to_node == node && link.to_socket == input_socket;
  });
}

auto NodeGraph::LinksFrom(std::string_view node,
  std::string_view output_socket) const -> std::vector<NodeLink>
{
  std::vector<NodeLink> result;
  std::ranges::copy_if(links_, std::back_inserter(result),
    [&](const NodeLink& link) {
      return link.from_node == node && link.from_socket == output_socket;
    });
  return result;
}

auto NodeGraph::Clear() noexcept -> void
{
  links_.clear();
  nodes_.clear();
}

//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <glm/vec4.hpp>

#include <Vigil/Scene/Types.h>
#include <Vigil/Scene/api_export.h>

namespace vigil::scene {

//! Value held by an unlinked input socket.
using SocketValue = std::variant<float, glm::vec4>;

//! A node of a material shading graph.
/*!
 Sockets are identified by name. The first output socket is the node's
 primary output; it is the one re-wired when a node is replaced.
*/
struct ShaderNode {
  std::string name;
  ShaderNodeType type { ShaderNodeType::kOther };
  std::vector<std::string> inputs;
  std::vector<std::string> outputs;
  std::map<std::string, SocketValue, std::less<>> defaults;
  //! Name of the referenced image, texture nodes only. Empty when unassigned.
  std::string image;

  VGL_SCN_NDAPI auto HasInput(std::string_view socket) const -> bool;
  VGL_SCN_NDAPI auto HasOutput(std::string_view socket) const -> bool;
};

//! Directed connection from an output socket to an input socket.
struct NodeLink {
  std::string from_node;
  std::string from_socket;
  std::string to_node;
  std::string to_socket;

  auto operator==(const NodeLink&) const -> bool = default;
};

//! Shading node graph of a material.
/*!
 Owns its nodes and links. Node names are unique within a graph; AddNode()
 picks a unique name when the requested one is taken. An input socket accepts
 at most one incoming link, so linking into an already linked input replaces
 the previous link.

 References returned by AddNode(), FindNode() and FindFirst() stay valid until
 the next structural change (node added or removed, or Clear()).
*/
class NodeGraph {
public:
  //! Adds a node of the given \p type, with the sockets that type exposes.
  /*!
   When \p name is empty, the type's default display name is used ("Principled
   BSDF", "Material Output", ...).
  */
  VGL_SCN_API auto AddNode(ShaderNodeType type, std::string_view name = {})
    -> ShaderNode&;

  //! Removes the node and every link touching it.
  /*! \return false if no node with that name exists. */
  VGL_SCN_API auto RemoveNode(std::string_view name) -> bool;

  VGL_SCN_NDAPI auto FindNode(std::string_view name) -> ShaderNode*;
  VGL_SCN_NDAPI auto FindNode(std::string_view name) const
    -> const ShaderNode*;

  //! First node of the given \p type, in insertion order.
  VGL_SCN_NDAPI auto FindFirst(ShaderNodeType type) -> ShaderNode*;
  VGL_SCN_NDAPI auto FindFirst(ShaderNodeType type) const -> const ShaderNode*;

  //! Connects `from_node.from_socket` to `to_node.to_socket`.
  /*!
   \return false, leaving the graph unchanged, if either node or socket does
   not exist.
  */
  VGL_SCN_API auto Link(std::string_view from_node,
    std::string_view from_socket, std::string_view to_node,
    std::string_view to_socket) -> bool;

  VGL_SCN_NDAPI auto IsLinked(
    std::string_view node, std::string_view input_socket) const -> bool;

  //! Snapshot of the links leaving \p node through \p output_socket.
  VGL_SCN_NDAPI auto LinksFrom(
    std::string_view node, std::string_view output_socket) const
    -> std::vector<NodeLink>;

  VGL_SCN_API auto Clear() noexcept -> void;

  [[nodiscard]] auto Nodes() const noexcept -> const std::vector<ShaderNode>&
  {
    return nodes_;
  }

  [[nodiscard]] auto Links() const noexcept -> const std::vector<NodeLink>&
  {
    return links_;
  }

private:
  std::vector<ShaderNode> nodes_;
  std::vector<NodeLink> links_;
};

//! Default display name of a node type, used when adding unnamed nodes.
VGL_SCN_NDAPI auto DefaultNodeName(ShaderNodeType type) -> const char*;

} // namespace vigil::scene

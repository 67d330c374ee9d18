//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <variant>

#include <glm/vec4.hpp>

#include <Vigil/Audit/Rules/MaterialRules.h>

#include "./AuditTestScene.h"

using vigil::audit::Category;
using vigil::audit::Severity;
using vigil::audit::rules::CheckShaderCompatibility;
using vigil::audit::rules::FixDisconnectedOutput;
using vigil::audit::rules::FixEmptySlots;
using vigil::audit::rules::GetOrCreateMarkerMaterial;
using vigil::audit::rules::IsMaterialBroken;
using vigil::audit::rules::MarkBrokenMaterial;
using vigil::audit::rules::PackExternalTextures;
using vigil::audit::rules::RebuildMaterial;
using vigil::audit::rules::ReplaceDeprecatedNodes;
using vigil::audit::rules::ValidateTextures;
using vigil::audit::testing::AuditTestScene;
using vigil::scene::Image;
using vigil::scene::ImageSource;
using vigil::scene::Material;
using vigil::scene::ShaderNodeType;

using ::testing::ElementsAre;
using ::testing::IsEmpty;

namespace {

class MaterialRulesTest : public AuditTestScene {
protected:
  //! Adds a valid material whose graph also samples \p image.
  auto AddTexturedMaterial(const std::string& name, const std::string& image)
    -> Material&
  {
    auto& material = AddPrincipledMaterial(name);
    auto& node = material.node_tree->AddNode(ShaderNodeType::kTexImage);
    node.image = image;
    return material;
  }

  const vigil::audit::AuditConfig config_ { MakeConfig() };
};

//------------------------------------------------------------------------------
// Broken shader detection
//------------------------------------------------------------------------------

NOLINT_TEST_F(MaterialRulesTest, IsMaterialBroken_ClassifiesDefects)
{
  const auto deleted = IsMaterialBroken(nullptr);
  ASSERT_TRUE(deleted.has_value());
  EXPECT_EQ(deleted->message, "Material has been deleted.");
  EXPECT_EQ(deleted->category, Category::kBrokenShader);

  const auto& legacy = AddLegacyMaterial("Legacy");
  EXPECT_EQ(IsMaterialBroken(&legacy)->message,
    "Material does not use Nodes (Legacy).");

  auto& no_output = store_.CreateMaterial("NoOutput");
  no_output.node_tree->AddNode(ShaderNodeType::kBsdfPrincipled);
  EXPECT_EQ(
    IsMaterialBroken(&no_output)->message, "Missing Material Output node.");

  const auto& disconnected = AddDisconnectedMaterial("Loose");
  const auto loose = IsMaterialBroken(&disconnected);
  EXPECT_EQ(loose->message, "Material Output surface is disconnected.");
  EXPECT_EQ(loose->severity, Severity::kWarning);

  EXPECT_FALSE(IsMaterialBroken(&AddPrincipledMaterial("Good")).has_value());
}

NOLINT_TEST_F(MaterialRulesTest, IsMaterialBroken_MissingNodeTree)
{
  const auto& material = store_.AddMaterial(Material {
    .name = "Hollow",
    .use_nodes = true,
    .node_tree = std::nullopt,
  });

  EXPECT_EQ(IsMaterialBroken(&material)->message, "Node tree is None or invalid.");
}

//------------------------------------------------------------------------------
// Textures
//------------------------------------------------------------------------------

NOLINT_TEST_F(MaterialRulesTest, ValidateTextures_ReportsMissingFile)
{
  store_.AddImage(Image { .name = "Wood", .filepath = "//wood.png" });
  const auto& material = AddTexturedMaterial("Crate", "Wood");

  const auto issues = ValidateTextures(store_, material, config_);

  ASSERT_EQ(issues.size(), 1U);
  EXPECT_EQ(issues[0].category, Category::kTexture);
  EXPECT_EQ(issues[0].message, "Missing texture file: Wood (//wood.png)");
  EXPECT_EQ(issues[0].severity, Severity::kError);
}

NOLINT_TEST_F(MaterialRulesTest, ValidateTextures_ReportsSizeProblems)
{
  store_.AddFile("/project/huge.png");
  store_.AddImage(Image {
    .name = "Huge",
    .filepath = "//huge.png",
    .width = 10000,
    .height = 4096,
  });
  const auto& material = AddTexturedMaterial("Terrain", "Huge");

  const auto issues = ValidateTextures(store_, material, config_);

  ASSERT_EQ(issues.size(), 2U);
  EXPECT_EQ(issues[0].message, "Very large texture: Huge (10000x4096)");
  EXPECT_EQ(issues[1].message, "Non-power-of-2 texture: Huge (10000x4096)");
}

NOLINT_TEST_F(MaterialRulesTest, ValidateTextures_UnassignedAndGenerated)
{
  store_.AddImage(Image { .name = "Noise", .source = ImageSource::kGenerated });
  auto& material = AddTexturedMaterial("Mixed", "Noise");
  material.node_tree->AddNode(ShaderNodeType::kTexImage, "Empty Texture");

  const auto issues = ValidateTextures(store_, material, config_);

  ASSERT_EQ(issues.size(), 1U);
  EXPECT_EQ(issues[0].message, "Image Texture node has no image assigned.");
  EXPECT_EQ(issues[0].severity, Severity::kWarning);
}

NOLINT_TEST_F(MaterialRulesTest, ValidateTextures_EnvironmentWithoutPath)
{
  store_.AddImage(Image { .name = "Sky" });
  auto& material = AddPrincipledMaterial("World");
  material.node_tree->AddNode(ShaderNodeType::kTexEnvironment).image = "Sky";

  EXPECT_THAT(ValidateTextures(store_, material, config_), IsEmpty());
}

//------------------------------------------------------------------------------
// Compatibility
//------------------------------------------------------------------------------

NOLINT_TEST_F(MaterialRulesTest, Compatibility_FlagsRendererAndDeprecatedNodes)
{
  auto& material = AddPrincipledMaterial("Fur");
  material.node_tree->AddNode(ShaderNodeType::kBsdfHair);
  material.node_tree->AddNode(ShaderNodeType::kEmission);
  material.node_tree->AddNode(ShaderNodeType::kBsdfDiffuse);

  const auto issues = CheckShaderCompatibility(material);

  ASSERT_EQ(issues.size(), 3U);
  EXPECT_EQ(issues[0].message,
    "Node 'Hair BSDF' (BSDF_HAIR) is only supported by the path-tracing "
    "renderer.");
  EXPECT_EQ(issues[1].message,
    "Deprecated node 'Emission' (EMISSION). Use Principled BSDF emission");
  EXPECT_EQ(issues[2].message,
    "Deprecated node 'Diffuse BSDF' (BSDF_DIFFUSE). Use Principled BSDF "
    "instead");
  EXPECT_EQ(issues[2].category, Category::kShaderCompat);
}

//------------------------------------------------------------------------------
// Repairs
//------------------------------------------------------------------------------

NOLINT_TEST_F(MaterialRulesTest, Rebuild_ProducesUsableMaterial)
{
  auto& legacy = AddLegacyMaterial("Legacy");

  RebuildMaterial(legacy);

  EXPECT_TRUE(legacy.use_nodes);
  ASSERT_TRUE(legacy.node_tree.has_value());
  EXPECT_EQ(legacy.node_tree->Nodes().size(), 2U);
  EXPECT_FALSE(IsMaterialBroken(&legacy).has_value());
}

NOLINT_TEST_F(MaterialRulesTest, Marker_IsRedEmissionAndReused)
{
  auto& first = GetOrCreateMarkerMaterial(store_, config_);
  const auto* emission = first.node_tree->FindFirst(ShaderNodeType::kEmission);

  ASSERT_NE(emission, nullptr);
  EXPECT_EQ(std::get<glm::vec4>(emission->defaults.at("Color")),
    (glm::vec4 { 1.0F, 0.0F, 0.0F, 1.0F }));
  EXPECT_EQ(std::get<float>(emission->defaults.at("Strength")), 2.0F);
  EXPECT_FALSE(IsMaterialBroken(&first).has_value());

  const auto& second = GetOrCreateMarkerMaterial(store_, config_);
  EXPECT_EQ(&first, &second);
  EXPECT_THAT(store_.GetMaterialNames(), ElementsAre("_BROKEN TO FIX"));
}

NOLINT_TEST_F(MaterialRulesTest, MarkBroken_ReplacesSlot)
{
  AddLegacyMaterial("Legacy");
  auto& object = AddMeshObject("Crate", "CrateMesh");
  object.material_slots = { "Legacy" };

  EXPECT_TRUE(MarkBrokenMaterial(store_, "Crate", 0, config_));
  EXPECT_FALSE(MarkBrokenMaterial(store_, "Crate", 3, config_));

  EXPECT_THAT(store_.FindObject("Crate")->material_slots,
    ElementsAre("_BROKEN TO FIX"));
}

//! Slots naming a deleted material are broken, not empty, and stay in place.
NOLINT_TEST_F(MaterialRulesTest, FixEmptySlots_RemovesOnlyEmptySlots)
{
  AddPrincipledMaterial("Paint");
  auto& object = AddMeshObject("Crate", "CrateMesh");
  object.material_slots = { "", "Paint", "", "Deleted" };

  EXPECT_EQ(FixEmptySlots(store_, "Crate"), 2);

  EXPECT_THAT(store_.FindObject("Crate")->material_slots,
    ElementsAre("Paint", "Deleted"));
  EXPECT_EQ(FixEmptySlots(store_, "Crate"), 0);
}

NOLINT_TEST_F(MaterialRulesTest, FixDisconnected_ReusesPrincipled)
{
  auto& material = AddDisconnectedMaterial("Loose");
  material.node_tree->AddNode(ShaderNodeType::kBsdfPrincipled, "Shader");

  EXPECT_TRUE(FixDisconnectedOutput(material));

  EXPECT_EQ(material.node_tree->Nodes().size(), 2U);
  EXPECT_TRUE(material.node_tree->IsLinked("Material Output", "Surface"));
  EXPECT_FALSE(FixDisconnectedOutput(material)) << "already connected";
}

NOLINT_TEST_F(MaterialRulesTest, ReplaceDeprecated_RewiresOutgoingLinks)
{
  auto& material = store_.CreateMaterial("Old");
  auto& graph = *material.node_tree;
  graph.AddNode(ShaderNodeType::kOutputMaterial);
  graph.AddNode(ShaderNodeType::kBsdfGlossy);
  ASSERT_TRUE(graph.Link("Glossy BSDF", "BSDF", "Material Output", "Surface"));

  EXPECT_EQ(ReplaceDeprecatedNodes(material), 1);

  EXPECT_EQ(graph.FindNode("Glossy BSDF"), nullptr);
  ASSERT_EQ(graph.Links().size(), 1U);
  EXPECT_EQ(graph.Links().front().from_node, "Principled BSDF");
  EXPECT_THAT(CheckShaderCompatibility(material), IsEmpty());
}

NOLINT_TEST_F(MaterialRulesTest, PackTextures_PacksEachImageOnce)
{
  store_.AddFile("/project/wood.png");
  store_.AddImage(Image { .name = "Wood", .filepath = "//wood.png" });
  auto& material = AddTexturedMaterial("Crate", "Wood");
  material.node_tree->AddNode(ShaderNodeType::kTexImage).image = "Wood";

  EXPECT_EQ(PackExternalTextures(store_, material), 1);

  EXPECT_TRUE(store_.FindImage("Wood")->packed);
  EXPECT_THAT(store_.Operations(), ElementsAre("pack_image:Wood"));
}

} // namespace

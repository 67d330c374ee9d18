//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <stdexcept>

#include <Vigil/Audit/Rules/GeometryRules.h>

#include "./AuditTestScene.h"

using vigil::audit::Category;
using vigil::audit::Severity;
using vigil::audit::rules::FixMissingUvs;
using vigil::audit::rules::FormatCount;
using vigil::audit::rules::ValidateGeometry;
using vigil::audit::testing::AuditTestScene;
using vigil::scene::InteractionMode;
using vigil::scene::MeshData;

using ::testing::ElementsAre;
using ::testing::IsEmpty;

namespace {

class GeometryRulesTest : public AuditTestScene {
protected:
  const vigil::audit::AuditConfig config_ { MakeConfig() };
};

NOLINT_TEST(FormatCountTest, InsertsThousandsSeparators)
{
  EXPECT_EQ(FormatCount(0), "0");
  EXPECT_EQ(FormatCount(999), "999");
  EXPECT_EQ(FormatCount(1000), "1,000");
  EXPECT_EQ(FormatCount(1234567), "1,234,567");
}

NOLINT_TEST_F(GeometryRulesTest, Validate_CleanCube)
{
  const auto& object = AddMeshObject("Crate", "CrateMesh");

  EXPECT_THAT(ValidateGeometry(store_, object, config_), IsEmpty());
}

NOLINT_TEST_F(GeometryRulesTest, Validate_MissingData)
{
  const auto& object = store_.AddObject(vigil::scene::SceneObject {
    .name = "Ghost",
    .data = "Deleted",
  });

  const auto issues = ValidateGeometry(store_, object, config_);

  ASSERT_EQ(issues.size(), 1U);
  EXPECT_EQ(issues[0].message, "Mesh object has no data.");
  EXPECT_EQ(issues[0].severity, Severity::kError);
}

NOLINT_TEST_F(GeometryRulesTest, Validate_PointCloud)
{
  store_.AddMesh(MeshData {
    .name = "Points",
    .vertices = { { 0.0F, 0.0F, 0.0F }, { 1.0F, 0.0F, 0.0F } },
  });
  const auto& object = AddMeshObject("Cloud", "Points");

  const auto issues = ValidateGeometry(store_, object, config_);

  ASSERT_EQ(issues.size(), 2U);
  EXPECT_EQ(issues[0].message, "Mesh has 2 vertices but no faces");
  EXPECT_EQ(issues[1].message, "Mesh has 2 loose vertices (no edges)");
}

NOLINT_TEST_F(GeometryRulesTest, Validate_NoUvsAndHighPoly)
{
  auto& mesh = AddCubeMesh("Dense", false);
  mesh.polygon_count = 150'000;
  const auto& object = AddMeshObject("Statue", "Dense");

  const auto issues = ValidateGeometry(store_, object, config_);

  ASSERT_EQ(issues.size(), 2U);
  EXPECT_EQ(issues[0].category, Category::kGeometry);
  EXPECT_EQ(issues[0].message, "Mesh has no UV maps");
  EXPECT_EQ(issues[0].severity, Severity::kError);
  EXPECT_EQ(issues[1].message,
    "Very high poly count: 150,000 faces (may cause performance issues)");
}

NOLINT_TEST_F(GeometryRulesTest, Validate_HighPoly)
{
  AddCubeMesh("Detailed").polygon_count = 60'000;
  const auto& object = AddMeshObject("Statue", "Detailed");

  const auto issues = ValidateGeometry(store_, object, config_);

  ASSERT_EQ(issues.size(), 1U);
  EXPECT_EQ(issues[0].message, "High poly count: 60,000 faces");
}

NOLINT_TEST_F(GeometryRulesTest, FixUvs_AddsLayerAndUnwraps)
{
  AddCubeMesh("Bare", false);
  AddMeshObject("Crate", "Bare");

  EXPECT_TRUE(FixMissingUvs(store_, "Crate", config_));

  EXPECT_THAT(store_.FindMesh("Bare")->uv_layers, ElementsAre("UVMap"));
  EXPECT_THAT(store_.Operations(), ElementsAre("unwrap_uvs:Crate"));
  EXPECT_EQ(store_.FindObject("Crate")->mode, InteractionMode::kObject)
    << "previous mode restored";
}

NOLINT_TEST_F(GeometryRulesTest, FixUvs_SkipsMeshWithUvs)
{
  AddMeshObject("Crate", "CrateMesh");

  EXPECT_FALSE(FixMissingUvs(store_, "Crate", config_));
  EXPECT_THAT(store_.Operations(), IsEmpty());
}

NOLINT_TEST_F(GeometryRulesTest, FixUvs_HostErrorPropagates)
{
  AddCubeMesh("Bare", false);
  AddMeshObject("Crate", "Bare");
  store_.SetOperationHook([](std::string_view operation, std::string_view) {
    if (operation == "unwrap_uvs") {
      throw std::runtime_error("unwrap failed");
    }
  });

  NOLINT_EXPECT_THROW(
    (void)FixMissingUvs(store_, "Crate", config_), std::runtime_error);
  EXPECT_EQ(store_.FindObject("Crate")->mode, InteractionMode::kObject);
  EXPECT_FALSE(store_.GetActiveObject().has_value());
}

} // namespace

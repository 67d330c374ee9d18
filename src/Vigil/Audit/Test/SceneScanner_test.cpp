//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Vigil/Audit/SceneScanner.h>

#include "./AuditTestScene.h"

using vigil::audit::Category;
using vigil::audit::Finding;
using vigil::audit::kEmptySlotMaterial;
using vigil::audit::kNoMaterial;
using vigil::audit::SceneScanner;
using vigil::audit::Severity;
using vigil::audit::testing::AuditTestScene;

using ::testing::IsEmpty;

namespace {

class SceneScannerTest : public AuditTestScene {
protected:
  auto Scan() -> const std::vector<Finding>&
  {
    return scanner_.Scan(store_.GetObjectNames());
  }

  SceneScanner scanner_ { store_, MakeConfig() };
};

NOLINT_TEST_F(SceneScannerTest, CleanScene_NoFindings)
{
  AddPrincipledMaterial("Paint");
  AddMeshObject("Crate", "CrateMesh").material_slots = { "Paint" };
  AddEmpty("Pivot");

  EXPECT_THAT(Scan(), IsEmpty());
}

NOLINT_TEST_F(SceneScannerTest, EmptySlot_SingleWarning)
{
  AddMeshObject("Crate", "CrateMesh").material_slots = { "" };

  const auto& findings = Scan();

  ASSERT_EQ(findings.size(), 1U);
  EXPECT_EQ(findings[0],
    (Finding {
      .object_name = "Crate",
      .material_name = kEmptySlotMaterial,
      .category = Category::kEmptySlot,
      .message = "Empty material slot found.",
      .severity = Severity::kWarning,
    }));
}

NOLINT_TEST_F(SceneScannerTest, BrokenMaterial_AttributedToSlot)
{
  AddLegacyMaterial("Legacy");
  AddMeshObject("Crate", "CrateMesh").material_slots = { "Legacy", "Gone" };

  const auto& findings = Scan();

  ASSERT_EQ(findings.size(), 2U);
  EXPECT_EQ(findings[0].material_name, "Legacy");
  EXPECT_EQ(findings[0].message, "Material does not use Nodes (Legacy).");
  EXPECT_EQ(findings[1].material_name, "Gone");
  EXPECT_EQ(findings[1].message, "Material has been deleted.");
}

NOLINT_TEST_F(SceneScannerTest, ExcludedObjects_ProduceNothing)
{
  AddMeshObject("WGT-ctrl", "WidgetMesh").transform.scale = glm::vec3 { 5.0F };
  AddMeshObject("Body", "BodyMesh");

  EXPECT_THAT(Scan(), IsEmpty());
  EXPECT_TRUE(scanner_.Filter().IsExcluded("WGT-ctrl"));
}

NOLINT_TEST_F(SceneScannerTest, RuleOrderIsStable)
{
  auto& object = AddMeshObject("Crate", "CrateMesh");
  object.transform.scale = glm::vec3 { 2.0F };
  object.parent = "Crate.001";
  AddEmpty("Crate.001").parent = "Crate";
  object.material_slots = { "" };

  const auto& findings = Scan();

  ASSERT_GE(findings.size(), 3U);
  EXPECT_EQ(findings[0].category, Category::kTransform);
  EXPECT_EQ(findings[1].category, Category::kCircularDependency);
  EXPECT_EQ(findings[1].material_name, kNoMaterial);
  EXPECT_EQ(findings[2].category, Category::kEmptySlot);
}

//! Scanning the same unchanged scene twice gives identical results.
NOLINT_TEST_F(SceneScannerTest, Scan_IsIdempotent)
{
  AddLegacyMaterial("Legacy");
  auto& object = AddMeshObject("Crate", "CrateMesh");
  object.material_slots = { "Legacy", "" };
  object.transform.rotation = glm::vec3 { 1.0F };

  const auto first = Scan();
  const auto second = Scan();

  EXPECT_FALSE(first.empty());
  EXPECT_EQ(first, second);
}

NOLINT_TEST_F(SceneScannerTest, UnknownNames_AreSkipped)
{
  EXPECT_THAT(scanner_.Scan({ "Nobody" }), IsEmpty());
}

NOLINT_TEST_F(SceneScannerTest, Clear_DropsFindings)
{
  AddMeshObject("Crate", "CrateMesh").material_slots = { "" };
  ASSERT_FALSE(Scan().empty());

  scanner_.Clear();

  EXPECT_THAT(scanner_.Findings(), IsEmpty());
}

} // namespace

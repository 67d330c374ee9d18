//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

#include <Vigil/Audit/RepairOrchestrator.h>
#include <Vigil/Audit/Rules/MaterialRules.h>
#include <Vigil/Audit/RunContext.h>
#include <Vigil/Audit/SceneScanner.h>

#include "./AuditTestScene.h"

using vigil::audit::Category;
using vigil::audit::CountErrors;
using vigil::audit::FixCategory;
using vigil::audit::RepairOrchestrator;
using vigil::audit::RunContext;
using vigil::audit::rules::IsMaterialBroken;
using vigil::audit::SceneScanner;
using vigil::audit::testing::AuditTestScene;
using vigil::scene::AnimationData;
using vigil::scene::Driver;
using vigil::scene::FCurve;
using vigil::scene::InteractionMode;
using vigil::scene::MemorySceneStore;
using vigil::scene::SceneObject;

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

namespace {

class RepairOrchestratorTest : public AuditTestScene {
protected:
  auto AutoFix() -> vigil::audit::FixCounts
  {
    RepairOrchestrator orchestrator { store_, config_, &context_ };
    return orchestrator.AutoFixAll(store_.GetObjectNames());
  }

  auto AddInvalidDriver(const std::string& owner) -> void
  {
    store_.FindObject(owner)->animation_data = AnimationData {
      .drivers = { FCurve {
        .data_path = "location",
        .array_index = 0,
        .driver = Driver { .is_valid = false },
      } },
    };
  }

  vigil::audit::AuditConfig config_ { MakeConfig() };
  RunContext context_;
};

//------------------------------------------------------------------------------
// Transform phase
//------------------------------------------------------------------------------

NOLINT_TEST_F(RepairOrchestratorTest, SharedMesh_BakedOncePerInstance)
{
  AddMeshObject("Left", "Shared").transform.scale = glm::vec3 { 2.0F };
  AddMeshObject("Right", "Shared").transform.scale = glm::vec3 { 2.0F };

  const auto counts = AutoFix();

  EXPECT_EQ(counts.at(FixCategory::kScalesApplied), 2);
  const auto* left = store_.FindObject("Left");
  const auto* right = store_.FindObject("Right");
  EXPECT_EQ(left->data, right->data);
  EXPECT_EQ(store_.FindMesh(left->data)->vertices.back(),
    (glm::vec3 { -2.0F, 2.0F, 2.0F }));
}

NOLINT_TEST_F(RepairOrchestratorTest, ExcludedObjects_AreUntouched)
{
  AddMeshObject("WGT-ctrl", "WidgetMesh").transform.scale = glm::vec3 { 4.0F };

  const auto counts = AutoFix();

  EXPECT_EQ(counts.at(FixCategory::kScalesApplied), 0);
  EXPECT_EQ(
    store_.FindObject("WGT-ctrl")->transform.scale, glm::vec3 { 4.0F });
}

/*! An excluded object sharing its mesh with a scaled instance keeps both its
    transform and the original mesh.
    Scenario: a body and its control widget share one mesh, both scaled. */
NOLINT_TEST_F(RepairOrchestratorTest, ExcludedInstance_KeepsSharedMesh)
{
  AddMeshObject("Body", "Shared").transform.scale = glm::vec3 { 2.0F };
  AddMeshObject("WGT-ctrl", "Shared").transform.scale = glm::vec3 { 2.0F };

  const auto counts = AutoFix();

  EXPECT_EQ(counts.at(FixCategory::kScalesApplied), 1);
  const auto* widget = store_.FindObject("WGT-ctrl");
  EXPECT_EQ(widget->transform.scale, glm::vec3 { 2.0F });
  EXPECT_EQ(widget->data, "Shared");
  EXPECT_EQ(store_.FindMesh("Shared")->vertices.back(),
    (glm::vec3 { -1.0F, 1.0F, 1.0F }));
  EXPECT_EQ(store_.GetMeshUsers("Shared"), 1U);

  const auto* body = store_.FindObject("Body");
  EXPECT_EQ(body->transform.scale, glm::vec3 { 1.0F });
  EXPECT_NE(body->data, "Shared");
  EXPECT_EQ(store_.FindMesh(body->data)->vertices.back(),
    (glm::vec3 { -2.0F, 2.0F, 2.0F }));
}

NOLINT_TEST_F(RepairOrchestratorTest, ObjectRemovedMidBatch_IsSkipped)
{
  AddMeshObject("First", "FirstMesh").transform.scale = glm::vec3 { 2.0F };
  AddMeshObject("Second", "SecondMesh").transform.scale = glm::vec3 { 2.0F };
  store_.SetOperationHook(
    [this](std::string_view operation, std::string_view name) {
      if (operation == "apply_transform" && name == "First") {
        (void)store_.RemoveObject("Second");
      }
    });

  const auto counts = AutoFix();

  EXPECT_EQ(counts.at(FixCategory::kScalesApplied), 1);
  EXPECT_EQ(store_.FindObject("Second"), nullptr);
  EXPECT_THAT(context_.Errors(), IsEmpty());
}

NOLINT_TEST_F(RepairOrchestratorTest, LockedMode_LeavesObjectAlone)
{
  auto& object = AddMeshObject("Sculpt", "SculptMesh");
  object.transform.scale = glm::vec3 { 2.0F };
  object.mode = InteractionMode::kSculpt;
  store_.LockMode("Sculpt", true);

  const auto counts = AutoFix();

  EXPECT_EQ(counts.at(FixCategory::kScalesApplied), 0);
  EXPECT_EQ(store_.FindObject("Sculpt")->transform.scale, glm::vec3 { 2.0F });
  EXPECT_THAT(context_.Errors(), IsEmpty());
}

//------------------------------------------------------------------------------
// Object phase
//------------------------------------------------------------------------------

//! Every broken slot, on every object, points to the same marker material.
NOLINT_TEST_F(RepairOrchestratorTest, BrokenMaterials_ShareOneMarker)
{
  AddLegacyMaterial("Legacy");
  AddLegacyMaterial("Legacy.Old");
  AddMeshObject("Crate", "CrateMesh").material_slots = { "Legacy" };
  AddMeshObject("Barrel", "BarrelMesh").material_slots = { "Legacy.Old" };

  const auto counts = AutoFix();

  EXPECT_EQ(counts.at(FixCategory::kMaterialsRebuilt), 2);
  EXPECT_THAT(
    store_.FindObject("Crate")->material_slots, ElementsAre("_BROKEN TO FIX"));
  EXPECT_THAT(store_.FindObject("Barrel")->material_slots,
    ElementsAre("_BROKEN TO FIX"));
  EXPECT_EQ(store_.GetMaterialNames().size(), 3U);

  // The marker itself is never repaired.
  EXPECT_EQ(AutoFix().at(FixCategory::kMaterialsRebuilt), 0);
}

/*! A slot naming a deleted material gets the marker, so the error found by
    the scan is gone after the repair.
    Scenario: the deleted material is used by two objects. */
NOLINT_TEST_F(RepairOrchestratorTest, DeletedMaterialSlot_GetsMarker)
{
  AddPrincipledMaterial("Paint");
  AddMeshObject("Crate", "CrateMesh").material_slots = { "Gone", "Paint" };
  AddMeshObject("Barrel", "BarrelMesh").material_slots = { "Gone" };
  SceneScanner scanner { store_, config_ };
  ASSERT_EQ(
    CountCategory(scanner.Scan(store_.GetObjectNames()), Category::kBrokenShader),
    2);

  const auto counts = AutoFix();

  EXPECT_EQ(counts.at(FixCategory::kMaterialsRebuilt), 2);
  EXPECT_EQ(counts.at(FixCategory::kEmptySlotsFixed), 0);
  EXPECT_THAT(store_.FindObject("Crate")->material_slots,
    ElementsAre("_BROKEN TO FIX", "Paint"));
  EXPECT_THAT(store_.FindObject("Barrel")->material_slots,
    ElementsAre("_BROKEN TO FIX"));
  const auto& after = scanner.Scan(store_.GetObjectNames());
  EXPECT_EQ(CountCategory(after, Category::kBrokenShader), 0);
  EXPECT_EQ(CountErrors(after), 0U);
}

NOLINT_TEST_F(RepairOrchestratorTest, DisconnectedMaterial_Reconnected)
{
  AddDisconnectedMaterial("Loose");
  AddMeshObject("Crate", "CrateMesh").material_slots = { "Loose" };

  const auto counts = AutoFix();

  EXPECT_EQ(counts.at(FixCategory::kDisconnectedFixed), 1);
  EXPECT_THAT(store_.FindObject("Crate")->material_slots, ElementsAre("Loose"));
}

NOLINT_TEST_F(RepairOrchestratorTest, SharedMaterial_HandledOnce)
{
  AddDisconnectedMaterial("Loose");
  AddMeshObject("Left", "LeftMesh").material_slots = { "Loose" };
  AddMeshObject("Right", "RightMesh").material_slots = { "Loose" };

  EXPECT_EQ(AutoFix().at(FixCategory::kDisconnectedFixed), 1);
}

NOLINT_TEST_F(RepairOrchestratorTest, DriverChain_BrokenOnce)
{
  AddEmpty("A");
  AddEmpty("B");
  for (const auto& [owner, target] :
    { std::pair { "A", "B" }, std::pair { "B", "A" } }) {
    store_.FindObject(owner)->animation_data = AnimationData {
      .drivers = { FCurve {
        .data_path = "location",
        .array_index = 0,
        .driver = Driver {
          .type = vigil::scene::DriverType::kAverage,
          .variables = { { .name = "var",
            .targets = { { .id_type = vigil::scene::IdType::kObject,
              .id = target } } } },
        },
      } },
    };
  }

  const auto counts = AutoFix();

  EXPECT_EQ(counts.at(FixCategory::kDriverChainsFixed), 1);
  EXPECT_EQ(counts.at(FixCategory::kDriversFixed), 0);
}

/*! A step failing on one object does not stop the following steps.
    Scenario: the host fails to unwrap; the parent loop is still broken. */
NOLINT_TEST_F(RepairOrchestratorTest, FailingStep_IsIsolated)
{
  AddCubeMesh("Bare", false);
  AddMeshObject("Panel", "Bare").parent = "Frame";
  AddEmpty("Frame").parent = "Panel";
  store_.SetOperationHook([](std::string_view operation, std::string_view) {
    if (operation == "unwrap_uvs") {
      throw std::runtime_error("unwrap failed");
    }
  });
  vigil::testing::ScopedLogCapture capture { "IsolationCapture",
    loguru::Verbosity_ERROR };

  const auto counts = AutoFix();

  EXPECT_EQ(counts.at(FixCategory::kUvsGenerated), 0);
  EXPECT_EQ(counts.at(FixCategory::kParentLoopsFixed), 1);
  ASSERT_EQ(context_.Errors().size(), 1U);
  EXPECT_THAT(context_.Errors().front(),
    HasSubstr("uvs fix failed for 'Panel': unwrap failed"));
  EXPECT_EQ(capture.CountAtOrAbove(loguru::Verbosity_ERROR), 1);
}

//! Repairs never add errors: a rescan reports at most as many as before.
NOLINT_TEST_F(RepairOrchestratorTest, Rescan_HasNoMoreErrors)
{
  AddLegacyMaterial("Legacy");
  auto& crate = AddMeshObject("Crate", "CrateMesh");
  crate.transform.scale = glm::vec3 { 2.0F };
  crate.material_slots = { "", "Legacy" };
  AddEmpty("Rig");
  AddInvalidDriver("Rig");
  AddCubeMesh("Bare", false);
  AddMeshObject("Panel", "Bare");
  AddEmpty("A").parent = "B";
  AddEmpty("B").parent = "A";

  SceneScanner scanner { store_, config_ };
  const auto before = scanner.Scan(store_.GetObjectNames());
  const auto counts = AutoFix();
  const auto& after = scanner.Scan(store_.GetObjectNames());

  EXPECT_EQ(CountErrors(before), 5U);
  EXPECT_EQ(CountErrors(after), 0U);
  EXPECT_EQ(CountCategory(after, Category::kTransform), 0);
  EXPECT_EQ(CountCategory(after, Category::kEmptySlot), 0);
  EXPECT_EQ(counts.at(FixCategory::kEmptySlotsFixed), 1);
  EXPECT_EQ(counts.at(FixCategory::kMaterialsRebuilt), 1);
  EXPECT_EQ(counts.at(FixCategory::kDriversFixed), 1);
  EXPECT_EQ(counts.at(FixCategory::kUvsGenerated), 1);
  EXPECT_EQ(counts.at(FixCategory::kParentLoopsFixed), 1);
}

NOLINT_TEST_F(RepairOrchestratorTest, FixBrokenShaders_RebuildsUniqueMaterials)
{
  AddLegacyMaterial("Legacy");
  AddDisconnectedMaterial("Loose");
  AddPrincipledMaterial("Good");
  AddMeshObject("Left", "LeftMesh").material_slots = { "Legacy", "Good" };
  AddMeshObject("Right", "RightMesh").material_slots = { "Legacy", "Loose" };

  RepairOrchestrator orchestrator { store_, config_ };
  EXPECT_EQ(orchestrator.FixBrokenShaders(store_.GetObjectNames()), 2);

  EXPECT_TRUE(store_.FindMaterial("Legacy")->use_nodes);
  EXPECT_FALSE(IsMaterialBroken(store_.FindMaterial("Loose")));
  EXPECT_EQ(orchestrator.FixBrokenShaders(store_.GetObjectNames()), 0);
}

//------------------------------------------------------------------------------
// Batching
//------------------------------------------------------------------------------

class MockSceneStore : public MemorySceneStore {
public:
  MOCK_METHOD(void, Update, (), (override));
};

NOLINT_TEST(RepairOrchestratorBatchTest, UpdatesBeforeAndAfterEachBatch)
{
  ::testing::StrictMock<MockSceneStore> store;
  for (const auto* name : { "A", "B", "C" }) {
    store.AddObject(SceneObject { .name = name });
  }
  auto config = vigil::audit::AuditConfig {};
  config.batch_size = 2;
  config.batch_pause = std::chrono::milliseconds { 0 };

  // Three objects in batches of two.
  EXPECT_CALL(store, Update()).Times(4);

  RepairOrchestrator orchestrator { store, config };
  const auto counts = orchestrator.AutoFixAll(store.GetObjectNames());
  EXPECT_EQ(vigil::audit::TotalFixes(counts), 0);
}

} // namespace

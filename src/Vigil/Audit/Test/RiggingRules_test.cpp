//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Vigil/Audit/Rules/RiggingRules.h>

#include "./AuditTestScene.h"

using vigil::audit::Category;
using vigil::audit::rules::FixVertexGroups;
using vigil::audit::rules::ValidateVertexGroups;
using vigil::audit::testing::AuditTestScene;
using vigil::scene::ArmatureModifier;
using vigil::scene::Modifier;
using vigil::scene::ObjectType;
using vigil::scene::SceneObject;
using vigil::scene::VertexGroup;

using ::testing::ElementsAre;
using ::testing::IsEmpty;

namespace {

class RiggingRulesTest : public AuditTestScene {
protected:
  auto AddArmature(const std::string& name, std::vector<std::string> bones)
    -> void
  {
    store_.AddObject(SceneObject {
      .name = name,
      .type = ObjectType::kArmature,
      .bones = std::move(bones),
    });
  }

  //! Adds a skinned cube with the given vertex groups.
  auto AddSkinnedBody(std::vector<VertexGroup> groups) -> SceneObject&
  {
    auto& body = AddMeshObject("Body", "BodyMesh");
    body.modifiers = { Modifier { "Armature",
      ArmatureModifier { .object = "Rig" } } };
    body.vertex_groups = std::move(groups);
    return body;
  }
};

NOLINT_TEST_F(RiggingRulesTest, Validate_EmptyAndWeightlessGroups)
{
  auto& body = AddMeshObject("Body", "BodyMesh");
  body.vertex_groups = {
    VertexGroup { .name = "Unused" },
    VertexGroup { .name = "OutOfRange", .weights = { { 100, 1.0F } } },
    VertexGroup { .name = "Zero", .weights = { { 0, 0.0F } } },
    VertexGroup { .name = "Good", .weights = { { 1, 1.0F } } },
  };

  const auto issues = ValidateVertexGroups(store_, body);

  ASSERT_EQ(issues.size(), 3U);
  EXPECT_EQ(issues[0].category, Category::kRigging);
  EXPECT_EQ(
    issues[0].message, "Vertex group 'Unused' is empty (no vertices assigned)");
  EXPECT_EQ(issues[1].message,
    "Vertex group 'OutOfRange' is empty (no vertices assigned)");
  EXPECT_EQ(issues[2].message, "Vertex group 'Zero' has zero total weight");
}

NOLINT_TEST_F(RiggingRulesTest, Validate_OrphanedGroups)
{
  AddArmature("Rig", { "Spine", "Head" });
  const auto& body = AddSkinnedBody({
    VertexGroup { .name = "Spine", .weights = { { 0, 1.0F } } },
    VertexGroup { .name = "Tail", .weights = { { 1, 1.0F } } },
  });

  const auto issues = ValidateVertexGroups(store_, body);

  ASSERT_EQ(issues.size(), 1U);
  EXPECT_EQ(issues[0].message,
    "Orphaned vertex group 'Tail' (no matching bone in armature)");
}

NOLINT_TEST_F(RiggingRulesTest, Validate_ArmatureNotFoundSkipsOrphans)
{
  const auto& body = AddSkinnedBody({
    VertexGroup { .name = "Tail", .weights = { { 1, 1.0F } } },
  });

  EXPECT_THAT(ValidateVertexGroups(store_, body), IsEmpty());
}

NOLINT_TEST_F(RiggingRulesTest, Fix_RemovesAndNormalizes)
{
  AddArmature("Rig", { "Spine", "Head" });
  AddSkinnedBody({
    VertexGroup { .name = "Spine", .weights = { { 0, 0.5F } } },
    VertexGroup { .name = "Head", .weights = { { 0, 1.5F } } },
    VertexGroup { .name = "Tail", .weights = { { 1, 1.0F } } },
    VertexGroup { .name = "Unused" },
  });

  const auto fixes = FixVertexGroups(store_, "Body");

  EXPECT_EQ(fixes.empty_removed, 1);
  EXPECT_EQ(fixes.orphaned_removed, 1);
  EXPECT_EQ(fixes.normalized, 1);
  const auto& groups = store_.FindObject("Body")->vertex_groups;
  ASSERT_EQ(groups.size(), 2U);
  EXPECT_FLOAT_EQ(groups[0].weights.at(0), 0.25F);
  EXPECT_FLOAT_EQ(groups[1].weights.at(0), 0.75F);
  EXPECT_THAT(store_.Operations(), ElementsAre("normalize_vertex_groups:Body"));
}

NOLINT_TEST_F(RiggingRulesTest, Fix_NormalizationSkippedOutsideViewLayer)
{
  auto& body = AddMeshObject("Body", "BodyMesh");
  body.vertex_groups = { VertexGroup { .name = "A", .weights = { { 0, 2.0F } } } };
  store_.SetInViewLayer("Body", false);

  const auto fixes = FixVertexGroups(store_, "Body");

  EXPECT_EQ(fixes.normalized, 0);
  EXPECT_THAT(store_.Operations(), IsEmpty());
}

} // namespace

//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Vigil/Audit/Rules/DataRules.h>
#include <Vigil/Audit/Rules/DependencyRules.h>

#include "./AuditTestScene.h"

using vigil::audit::Category;
using vigil::audit::Severity;
using vigil::audit::rules::FixParentLoop;
using vigil::audit::rules::ValidateDependencies;
using vigil::audit::rules::ValidateObjectData;
using vigil::audit::testing::AuditTestScene;
using vigil::scene::Constraint;
using vigil::scene::ShapeKey;
using vigil::scene::VertexGroup;

using ::testing::IsEmpty;

namespace {

//------------------------------------------------------------------------------
// Object data
//------------------------------------------------------------------------------

class DataRulesTest : public AuditTestScene { };

NOLINT_TEST_F(DataRulesTest, LinkedDuplicates_Warned)
{
  const auto& first = AddMeshObject("Tree", "Foliage");
  AddMeshObject("Tree", "Foliage");

  const auto issues = ValidateObjectData(store_, first);

  ASSERT_EQ(issues.size(), 1U);
  EXPECT_EQ(issues[0].category, Category::kData);
  EXPECT_EQ(issues[0].message,
    "Mesh data 'Foliage' has 2 users (linked duplicates)");
  EXPECT_EQ(issues[0].severity, Severity::kWarning);
}

NOLINT_TEST_F(DataRulesTest, ShapeKeyWithMissingGroup_IsError)
{
  AddCubeMesh("Face").shape_keys = {
    ShapeKey { .name = "Basis" },
    ShapeKey { .name = "Smile", .vertex_group = "Mouth" },
    ShapeKey { .name = "Blink", .vertex_group = "Eyes" },
  };
  auto& head = AddMeshObject("Head", "Face");
  head.vertex_groups = { VertexGroup { .name = "Eyes" } };

  const auto issues = ValidateObjectData(store_, head);

  ASSERT_EQ(issues.size(), 1U);
  EXPECT_EQ(issues[0].message,
    "Shape key 'Smile' references missing vertex group 'Mouth'");
  EXPECT_EQ(issues[0].severity, Severity::kError);
}

//------------------------------------------------------------------------------
// Dependencies
//------------------------------------------------------------------------------

class DependencyRulesTest : public AuditTestScene { };

NOLINT_TEST_F(DependencyRulesTest, ParentLoop_ReportedAndBroken)
{
  AddEmpty("A").parent = "B";
  AddEmpty("B").parent = "A";

  const auto issues = ValidateDependencies(store_, *store_.FindObject("A"));

  ASSERT_EQ(issues.size(), 1U);
  EXPECT_EQ(issues[0].category, Category::kCircularDependency);
  EXPECT_EQ(issues[0].message, "Parent loop detected: A → B → A");

  EXPECT_TRUE(FixParentLoop(store_, "A"));
  EXPECT_TRUE(store_.FindObject("A")->parent.empty());
  EXPECT_FALSE(FixParentLoop(store_, "B")) << "loop already broken";
  EXPECT_THAT(ValidateDependencies(store_, *store_.FindObject("B")), IsEmpty());
}

NOLINT_TEST_F(DependencyRulesTest, ReciprocalConstraints_Reported)
{
  AddEmpty("Hand").constraints
    = { Constraint { .name = "Copy", .type_name = "COPY_LOCATION", .target = "Cup" } };
  AddEmpty("Cup").constraints
    = { Constraint { .name = "Child", .type_name = "CHILD_OF", .target = "Hand" } };
  AddEmpty("Table").constraints
    = { Constraint { .name = "Track", .type_name = "TRACK_TO", .target = "Hand" } };

  const auto hand = ValidateDependencies(store_, *store_.FindObject("Hand"));
  const auto table = ValidateDependencies(store_, *store_.FindObject("Table"));

  ASSERT_EQ(hand.size(), 1U);
  EXPECT_EQ(hand[0].message, "Constraint loop: 'Hand' ↔ 'Cup'");
  EXPECT_THAT(table, IsEmpty());
}

} // namespace

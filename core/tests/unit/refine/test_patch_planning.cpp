// test_patch_planning.cpp - Diff, derive and prune patch planning plus consolidation
//
#include <gtest/gtest.h>

#include "refiner/refine/consolidate.hpp"
#include "refiner/refine/derive_patches.hpp"
#include "refiner/refine/error.hpp"
#include "refiner/refine/patch_guards.hpp"
#include "refiner/refine/patch_planner.hpp"
#include "refiner/refine/prune_patches.hpp"

namespace refiner
{

namespace
{

const PreservedKeySet k_children = {"children"};

std::string key_of(const PropertyPatch & patch) { return stringify_property_path(patch.path); }

}  // namespace

// ============================================================================
// Diff phase
// ============================================================================

TEST(CalculatePatches, EmitsSetForCoercedLeaves)
{
  const Value extracted = Value::object_of(
    {{"count", Value::make_string("3")}, {"label", Value::make_string("x")}});
  const Value validated = Value::object_of(
    {{"count", Value::make_number(3)}, {"label", Value::make_string("x")}});

  const auto patches = calculate_patches(extracted, validated, k_children);
  ASSERT_EQ(patches.size(), 1u);
  EXPECT_EQ(patches[0].operation, PatchOperation::Set);
  EXPECT_EQ(key_of(patches[0]), R"(["count"])");
  EXPECT_EQ(patches[0].value.as_number(), 3);
}

TEST(CalculatePatches, DroppedAndAddedKeysProduceNothing)
{
  const Value extracted =
    Value::object_of({{"label", Value::make_string("x")}, {"extra", Value::make_string("y")}});
  const Value validated =
    Value::object_of({{"label", Value::make_string("x")}, {"size", Value::make_string("md")}});

  EXPECT_TRUE(calculate_patches(extracted, validated, k_children).empty());
}

TEST(CalculatePatches, ReplacedArrayIsOneAtomicPatch)
{
  const Value extracted = Value::object_of(
    {{"tags", Value::array_of({Value::make_string("a"), Value::make_string("b")})}});
  const Value validated =
    Value::object_of({{"tags", Value::array_of({Value::make_string("a")})}});

  const auto patches = calculate_patches(extracted, validated, k_children);
  ASSERT_EQ(patches.size(), 1u);
  EXPECT_EQ(key_of(patches[0]), R"(["tags"])");
  EXPECT_TRUE(patches[0].value.is_array());
}

TEST(CalculatePatches, NestedCoercionTargetsLeafPath)
{
  const Value extracted = Value::object_of(
    {{"size", Value::object_of({{"w", Value::make_string("10")}})}});
  const Value validated = Value::object_of(
    {{"size", Value::object_of({{"w", Value::make_number(10)}})}});

  const auto patches = calculate_patches(extracted, validated, k_children);
  ASSERT_EQ(patches.size(), 1u);
  EXPECT_EQ(key_of(patches[0]), R"(["size","w"])");
}

TEST(CalculatePatches, NonObjectsYieldNoPatches)
{
  EXPECT_TRUE(calculate_patches(Value::make_null(), Value::object_of({}), k_children).empty());
  EXPECT_TRUE(calculate_patches(Value::object_of({}), Value::make_string("x"), k_children).empty());
}

// ============================================================================
// Derive phase
// ============================================================================

TEST(DerivePatches, RecordAndSingleKeySetsInCallOrder)
{
  const DeriveFn derive = [](const Value & input, DerivedPatchBuilder & builder) {
    builder.set(Value::object_of({{"a", Value::make_number(1)}, {"b", Value::make_number(2)}}));
    builder.set("label", input.object()->find("name") ? *input.object()->find("name") : Value{});
  };

  const auto patches =
    collect_derive_patches(derive, Value::object_of({{"name", Value::make_string("n")}}));
  ASSERT_EQ(patches.size(), 3u);
  EXPECT_EQ(key_of(patches[0]), R"(["a"])");
  EXPECT_EQ(key_of(patches[1]), R"(["b"])");
  EXPECT_EQ(key_of(patches[2]), R"(["label"])");
  EXPECT_EQ(patches[2].value.as_string(), "n");
}

TEST(DerivePatches, MissingHookYieldsNothing)
{
  EXPECT_TRUE(collect_derive_patches(DeriveFn{}, Value::object_of({})).empty());
}

TEST(DerivePatches, RecordMustBeAnObject)
{
  DerivedPatchBuilder builder;
  try {
    builder.set(Value::make_number(3));
    FAIL() << "expected ConfigurationError";
  } catch (const ConfigurationError & e) {
    EXPECT_STREQ(e.what(), "Derived props must be an object, got number.");
  }
}

TEST(DerivePatches, BuilderIsSingleUse)
{
  DerivedPatchBuilder builder;
  builder.set("a", Value::make_number(1));
  EXPECT_EQ(builder.build().size(), 1u);
  EXPECT_THROW(builder.set("b", Value::make_number(2)), ConfigurationError);
  EXPECT_THROW((void)builder.build(), ConfigurationError);
}

TEST(DerivePatches, LateSetFromCapturedBuilderThrows)
{
  DerivedPatchBuilder * leaked = nullptr;
  const DeriveFn derive = [&leaked](const Value &, DerivedPatchBuilder & builder) {
    leaked = &builder;
  };
  DerivedPatchBuilder builder;
  derive(Value::object_of({}), builder);
  (void)builder.build();
  ASSERT_NE(leaked, nullptr);
  EXPECT_THROW(leaked->set("late", Value::make_bool(true)), ConfigurationError);
}

// ============================================================================
// Prune phase
// ============================================================================

TEST(PrunePatches, DeletesOwnKeysOnceSkippingPreserved)
{
  const Value extracted = Value::object_of(
    {{"a", Value::make_number(1)}, {"b", Value::make_number(2)},
     {"children", Value::make_expression_ref({key_segment("children")})}});

  const auto patches =
    plan_prune_patches(extracted, {"b", "missing", "b", "children", "a"}, k_children);
  ASSERT_EQ(patches.size(), 2u);
  EXPECT_EQ(patches[0].operation, PatchOperation::Delete);
  EXPECT_EQ(key_of(patches[0]), R"(["b"])");
  EXPECT_EQ(key_of(patches[1]), R"(["a"])");
}

TEST(PrunePatches, EmptyKeysOrNonObjectYieldNothing)
{
  EXPECT_TRUE(plan_prune_patches(Value::object_of({{"a", Value::make_null()}}), {}, k_children)
                .empty());
  EXPECT_TRUE(plan_prune_patches(Value::make_null(), {"a"}, k_children).empty());
}

// ============================================================================
// Consolidation
// ============================================================================

TEST(ConsolidatePatches, LaterGroupReplacesInPlace)
{
  std::vector<PatchGroup> groups;
  groups.push_back({PatchPhase::Diff,
                    {PropertyPatch::set({key_segment("a")}, Value::make_number(1)),
                     PropertyPatch::set({key_segment("b")}, Value::make_number(2))}});
  groups.push_back({PatchPhase::Derive,
                    {PropertyPatch::set({key_segment("c")}, Value::make_number(3)),
                     PropertyPatch::set({key_segment("a")}, Value::make_number(10))}});
  groups.push_back({PatchPhase::Prune, {PropertyPatch::remove({key_segment("b")})}});

  const auto result = consolidate_patches(groups);
  ASSERT_EQ(result.patches.size(), 3u);
  EXPECT_EQ(key_of(result.patches[0]), R"(["a"])");
  EXPECT_EQ(result.patches[0].value.as_number(), 10);
  EXPECT_EQ(key_of(result.patches[1]), R"(["b"])");
  EXPECT_EQ(result.patches[1].operation, PatchOperation::Delete);
  EXPECT_EQ(key_of(result.patches[2]), R"(["c"])");

  EXPECT_EQ(result.phase_of(R"(["a"])"), PatchPhase::Derive);
  EXPECT_EQ(result.phase_of(R"(["b"])"), PatchPhase::Prune);
  EXPECT_EQ(result.phase_of(R"(["c"])"), PatchPhase::Derive);
  EXPECT_FALSE(result.phase_of(R"(["zzz"])").has_value());
}

TEST(ConsolidatePatches, EquivalentNumericSegmentsCollapse)
{
  std::vector<PatchGroup> groups;
  groups.push_back({PatchPhase::Diff,
                    {PropertyPatch::set({key_segment("xs"), PathSegment(0.0)},
                                        Value::make_number(1)),
                     PropertyPatch::set({key_segment("xs"), PathSegment(-0.0)},
                                        Value::make_number(2))}});

  const auto result = consolidate_patches(groups);
  ASSERT_EQ(result.patches.size(), 1u);
  EXPECT_EQ(result.patches[0].value.as_number(), 2);
}

// ============================================================================
// Guards
// ============================================================================

TEST(PatchGuards, RootOnlyRejectsPreservedRootKey)
{
  const std::vector<PropertyPatch> patches = {
    PropertyPatch::set({key_segment("children")}, Value::make_string("x"))};
  try {
    assert_patches_respect_preservation(patches, k_children, "Card");
    FAIL() << "expected ConfigurationError";
  } catch (const ConfigurationError & e) {
    EXPECT_STREQ(
      e.what(),
      "Patch targets preserved key \"children\" for Card. Preserved keys must not be patched as "
      "they represent runtime-owned subtrees.");
  }
}

TEST(PatchGuards, RootOnlyIgnoresNestedOccurrences)
{
  const std::vector<PropertyPatch> patches = {
    PropertyPatch::set({key_segment("slot"), key_segment("children")}, Value::make_null())};
  EXPECT_NO_THROW(assert_patches_respect_preservation(patches, k_children, "Card"));
}

TEST(PatchGuards, AnywhereReportsPath)
{
  const std::vector<PropertyPatch> patches = {
    PropertyPatch::set({key_segment("slot"), key_segment("render")}, Value::make_null())};
  PreservationCheckOptions options;
  options.scope = GuardScope::Anywhere;
  options.key_type_label = "reserved";
  try {
    assert_patches_respect_preservation(patches, {"render"}, "List", options);
    FAIL() << "expected ConfigurationError";
  } catch (const ConfigurationError & e) {
    EXPECT_STREQ(
      e.what(),
      "Patch targets reserved key \"render\" at [\"slot\",\"render\"] for List. Reserved keys "
      "must not be patched as they represent runtime-owned subtrees.");
  }
}

}  // namespace refiner

#include "BomError.h"
#include "BomMath.h"
#include "CostEngine.h"
#include "RecipeFixtures.h"

#include <doctest/doctest.h>

TEST_CASE("CostEngine sums component costs and divides by yield") {
  BomError err;
  const RecipeCost cost = CostEngine::computeRecipeCost(makeVersion(cakeVersion().components(), 4),
                                                        cakeMaterials(), &err);
  REQUIRE(!err.isValid());
  // 0.5 * 1.2 + 0.2 * 2.5
  CHECK(cost.totalMaterialCost == doctest::Approx(1.1));
  CHECK(cost.costPerYieldUnit == doctest::Approx(0.275));
  CHECK(!cost.incomplete);
  REQUIRE(cost.breakdown.size() == 2);
  CHECK(cost.breakdown[0].materialName == QString("Flour"));
  CHECK(cost.breakdown[0].lineCost == doctest::Approx(0.6));
  CHECK(cost.breakdown[0].share + cost.breakdown[1].share == doctest::Approx(1.0));
}

TEST_CASE("CostEngine keeps full precision") {
  const MaterialMap materials = toMap({makeMaterial(1, "Vanilla", "g", 0.333, 100)});
  const RecipeCost cost = CostEngine::computeRecipeCost(
      makeVersion({RecipeComponent(1, 3, "g")}), materials);
  CHECK(cost.totalMaterialCost == doctest::Approx(0.999));
  CHECK(roundMoney(cost.totalMaterialCost) == doctest::Approx(1.0));
}

TEST_CASE("CostEngine marks a recipe without components incomplete") {
  BomError err;
  const RecipeCost cost = CostEngine::computeRecipeCost(makeVersion({}), MaterialMap(), &err);
  CHECK(!err.isValid());
  CHECK(cost.incomplete);
  CHECK(cost.totalMaterialCost == 0);
  CHECK(cost.costPerYieldUnit == 0);
}

TEST_CASE("CostEngine reports unusable components") {
  BomError err;

  SUBCASE("missing material") {
    CostEngine::computeRecipeCost(makeVersion({RecipeComponent(99, 1, "kg")}), cakeMaterials(), &err);
    CHECK(err.type() == BomError::NotFoundError);
  }
  SUBCASE("unit mismatch") {
    CostEngine::computeRecipeCost(makeVersion({RecipeComponent(kFlour, 500, "g")}), cakeMaterials(), &err);
    CHECK(err.type() == BomError::ConfigurationError);
  }
  SUBCASE("zero quantity") {
    CostEngine::computeRecipeCost(makeVersion({RecipeComponent(kFlour, 0, "kg")}), cakeMaterials(), &err);
    CHECK(err.type() == BomError::ConfigurationError);
  }
  SUBCASE("zero yield") {
    CostEngine::computeRecipeCost(makeVersion(cakeVersion().components(), 0), cakeMaterials(), &err);
    CHECK(err.type() == BomError::ConfigurationError);
  }
  SUBCASE("material of another tenant") {
    MaterialMap materials = cakeMaterials();
    materials[kSugar].setTenantId("cafe");
    CostEngine::computeRecipeCost(cakeVersion(), materials, &err);
    CHECK(err.type() == BomError::TenantMismatchError);
  }
}

TEST_CASE("CostEngine grades the impact of a component change") {
  MaterialMap materials = cakeMaterials();
  materials.insert(3, makeMaterial(3, "Cocoa", "kg", 10, 5));
  BomError err;

  // flour 0.5 -> 0.6 kg adds 0.12 on 1.10
  CostImpact impact = CostEngine::analyzeChangeImpact(cakeVersion(),
      {RecipeComponent(kFlour, 0.6, "kg")}, materials, &err);
  REQUIRE(!err.isValid());
  CHECK(impact.currentCost == doctest::Approx(1.1));
  CHECK(impact.projectedCost == doctest::Approx(1.22));
  CHECK(impact.percentageChange == doctest::Approx(10.909).epsilon(0.001));
  CHECK(impact.level == CostImpact::Moderate);

  // adding cocoa doubles the cost
  impact = CostEngine::analyzeChangeImpact(cakeVersion(), {RecipeComponent(3, 0.1, "kg")}, materials, &err);
  CHECK(impact.level == CostImpact::High);

  impact = CostEngine::analyzeChangeImpact(cakeVersion(), {RecipeComponent(3, 0.1, "g")}, materials, &err);
  CHECK(err.type() == BomError::ConfigurationError);

  CHECK(CostEngine::impactLevel(-6) == CostImpact::Low);
  CHECK(CostEngine::impactLevel(5) == CostImpact::Minimal);
  CHECK(CostEngine::impactLevel(20.5) == CostImpact::High);
}

#include "AvailabilityCalculator.h"
#include "BatchPlanner.h"
#include "BomError.h"
#include "RecipeFixtures.h"

#include <doctest/doctest.h>

TEST_CASE("BatchPlanner prices the shortfall of a batch") {
  BomError err;
  const BatchPlan plan = BatchPlanner::planBatch(cakeVersion(), cakeMaterials(), 20, &err);
  REQUIRE(!err.isValid());
  REQUIRE(plan.requirements.size() == 2);

  const MaterialRequirement &flour = plan.requirements[0];
  CHECK(flour.requiredQuantity == doctest::Approx(10));
  CHECK(flour.shortfall == 0);
  CHECK(flour.isSufficient());

  const MaterialRequirement &sugar = plan.requirements[1];
  CHECK(sugar.requiredQuantity == doctest::Approx(4));
  CHECK(sugar.shortfall == doctest::Approx(1));
  CHECK(sugar.shortfallCost == doctest::Approx(2.5));

  CHECK(plan.shortfallCost == doctest::Approx(2.5));
  CHECK(plan.totalMaterialCost == doctest::Approx(10 * 1.2 + 4 * 2.5));
  CHECK(!plan.canProduce);
}

TEST_CASE("BatchPlanner has no shortfall at the available quantity") {
  const MaterialMap materials = toMap({makeMaterial(1, "Salt", "kg", 1, 0.3),
                                       makeMaterial(2, "Oil", "l", 3, 7.7)});
  const RecipeVersion version = makeVersion({RecipeComponent(1, 0.1, "kg"), RecipeComponent(2, 0.7, "l")});
  const Availability a = AvailabilityCalculator::computeAvailableQuantity(version, materials);
  REQUIRE(a.availableUnits == 3);

  const BatchPlan plan = BatchPlanner::planBatch(version, materials, double(a.availableUnits));
  CHECK(plan.canProduce);
  CHECK(plan.shortfallCost == 0);
  for (const MaterialRequirement &r : plan.requirements) {
    CHECK(r.shortfall == 0);
  }
}

TEST_CASE("BatchPlanner rejects a non-positive target") {
  BomError err;
  BatchPlanner::planBatch(cakeVersion(), cakeMaterials(), 0, &err);
  CHECK(err.type() == BomError::ConfigurationError);
  BatchPlanner::planBatch(cakeVersion(), cakeMaterials(), -3, &err);
  CHECK(err.type() == BomError::ConfigurationError);
}

TEST_CASE("BatchPlanner sums shared materials over several recipes") {
  MaterialMap materials = cakeMaterials();
  materials.insert(3, makeMaterial(3, "Butter", "kg", 8, 1));
  const RecipeVersion cookies = makeVersion({RecipeComponent(3, 0.1, "kg"), RecipeComponent(kSugar, 0.1, "kg")});

  ProductionTarget cake;
  cake.version = cakeVersion();
  cake.quantity = 10;
  ProductionTarget cookie;
  cookie.version = cookies;
  cookie.quantity = 20;

  BomError err;
  const BatchPlan plan = BatchPlanner::planMultiple({cake, cookie}, materials, &err);
  REQUIRE(!err.isValid());
  REQUIRE(plan.requirements.size() == 3);
  CHECK(plan.requirements[0].materialId == kFlour);
  CHECK(plan.requirements[1].materialId == kSugar);
  CHECK(plan.requirements[1].requiredQuantity == doctest::Approx(4));
  CHECK(plan.requirements[1].shortfall == doctest::Approx(1));
  CHECK(plan.requirements[2].materialId == 3);
  CHECK(plan.requirements[2].shortfall == doctest::Approx(1));
  CHECK(plan.shortfallCost == doctest::Approx(2.5 + 8));
}

TEST_CASE("BatchPlanner suggests batch sizes the stock can cover") {
  BomError err;
  const BatchSizeAdvice advice = BatchPlanner::suggestBatchSizes(cakeVersion(), cakeMaterials(), &err);
  REQUIRE(!err.isValid());
  CHECK(advice.maximumProducible == 15);
  CHECK(advice.limitingMaterialId == kSugar);

  // standard size 10, then the maximum of 15
  REQUIRE(advice.suggestions.size() == 2);
  CHECK(advice.suggestions[0].batchSize == 10);
  CHECK(advice.suggestions[0].totalMaterialCost == doctest::Approx(11.0));
  CHECK(advice.suggestions[0].costPerUnit == doctest::Approx(1.1));
  CHECK(advice.suggestions[0].utilisation == doctest::Approx(10.0 / 15));
  CHECK(advice.suggestions[1].batchSize == 15);
  CHECK(advice.suggestions[1].totalMaterialCost == doctest::Approx(16.5));
  CHECK(advice.suggestions[1].utilisation == doctest::Approx(1.0));

  SUBCASE("a maximum on a standard size is listed once") {
    const MaterialMap materials = toMap({makeMaterial(kFlour, "Flour", "kg", 1.2, 50, 4),
                                         makeMaterial(kSugar, "Sugar", "kg", 2.5, 20, 2)});
    const BatchSizeAdvice hundred = BatchPlanner::suggestBatchSizes(cakeVersion(), materials, &err);
    REQUIRE(!err.isValid());
    CHECK(hundred.maximumProducible == 100);
    REQUIRE(hundred.suggestions.size() == 4);
    CHECK(hundred.suggestions.last().batchSize == 100);
  }

  SUBCASE("nothing to suggest without stock") {
    const MaterialMap materials = toMap({makeMaterial(kFlour, "Flour", "kg", 1.2, 0, 4),
                                         makeMaterial(kSugar, "Sugar", "kg", 2.5, 3, 2)});
    const BatchSizeAdvice none = BatchPlanner::suggestBatchSizes(cakeVersion(), materials, &err);
    REQUIRE(!err.isValid());
    CHECK(none.maximumProducible == 0);
    CHECK(none.suggestions.isEmpty());
  }

  SUBCASE("a unit mismatch is reported") {
    BatchPlanner::suggestBatchSizes(makeVersion({RecipeComponent(kFlour, 1, "g")}), cakeMaterials(), &err);
    CHECK(err.type() == BomError::ConfigurationError);
  }
}

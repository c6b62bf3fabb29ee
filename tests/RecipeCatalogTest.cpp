#include "RecipeCatalog.h"
#include "TestDatabase.h"

#include <doctest/doctest.h>

TEST_CASE_FIXTURE(TestDatabase, "RecipeCatalog edits a draft in place") {
  const qint64 flour = addMaterial("bakery", "Flour", "kg", 1, 10, 4);
  const qint64 sugar = addMaterial("bakery", "Sugar", "kg", 2, 3, 2);
  RecipeCatalog catalog;
  BomError err;

  const RecipeVersion v1 = catalog.createRecipe("bakery", "cake", "Cake", 1, "pcs", &err);
  REQUIRE(!err.isValid());
  CHECK(v1.versionNumber() == 1);
  CHECK(v1.state() == RecipeVersion::Draft);
  CHECK(v1.components().isEmpty());

  const RecipeVersion edited = catalog.setComponents("bakery", v1.recipeId(),
      {RecipeComponent(flour, 0.5, "kg"), RecipeComponent(sugar, 0.2, "kg")}, &err);
  REQUIRE(!err.isValid());
  CHECK(edited.id() == v1.id());
  REQUIRE(edited.components().size() == 2);
  CHECK(edited.components()[0].materialId() == flour);
  CHECK(edited.components()[1].materialId() == sugar);

  // no active version yet
  catalog.version("bakery", v1.recipeId(), 0, &err);
  CHECK(err.type() == BomError::NotFoundError);
}

TEST_CASE_FIXTURE(TestDatabase, "RecipeCatalog copies an active version on write") {
  const qint64 flour = addMaterial("bakery", "Flour", "kg", 1, 10, 4);
  const qint64 sugar = addMaterial("bakery", "Sugar", "kg", 2, 3, 2);
  const RecipeVersion v1 = addRecipe("bakery", "Cake", {RecipeComponent(flour, 0.5, "kg")});
  CHECK(v1.state() == RecipeVersion::Active);

  RecipeCatalog catalog;
  BomError err;
  const RecipeVersion v2 = catalog.setComponents("bakery", v1.recipeId(),
      {RecipeComponent(flour, 0.4, "kg"), RecipeComponent(sugar, 0.2, "kg")}, &err);
  REQUIRE(!err.isValid());
  CHECK(v2.versionNumber() == 2);
  CHECK(v2.state() == RecipeVersion::Draft);

  // the active version is untouched until the draft is activated
  RecipeVersion active = catalog.version("bakery", v1.recipeId(), 0, &err);
  CHECK(active.id() == v1.id());
  REQUIRE(active.components().size() == 1);
  CHECK(active.components()[0].quantityPerUnit() == doctest::Approx(0.5));

  catalog.activate("bakery", v2.id(), &err);
  REQUIRE(!err.isValid());
  active = catalog.version("bakery", v1.recipeId(), 0, &err);
  CHECK(active.id() == v2.id());
  CHECK(catalog.versionById("bakery", v1.id()).state() == RecipeVersion::Archived);

  const QVector<RecipeVersion> all = catalog.versions("bakery", v1.recipeId(), &err);
  REQUIRE(all.size() == 2);
  CHECK(all[0].versionNumber() == 1);
  CHECK(all[1].versionNumber() == 2);

  const RecipeVersionDiff diff = RecipeCatalog::diffVersions(all[0], all[1]);
  CHECK(diff.addedMaterials == QVector<qint64>{sugar});
  CHECK(diff.changedMaterials == QVector<qint64>{flour});
  CHECK(diff.removedMaterials.isEmpty());
  CHECK(!diff.yieldChanged);
}

TEST_CASE_FIXTURE(TestDatabase, "RecipeCatalog versions yield changes too") {
  const qint64 flour = addMaterial("bakery", "Flour", "kg", 1, 10, 4);
  const RecipeVersion v1 = addRecipe("bakery", "Bread", {RecipeComponent(flour, 0.5, "kg")});
  RecipeCatalog catalog;
  BomError err;

  const RecipeVersion v2 = catalog.updateYield("bakery", v1.recipeId(), 4, "loaves", &err);
  REQUIRE(!err.isValid());
  CHECK(v2.versionNumber() == 2);
  CHECK(v2.yieldQuantity() == doctest::Approx(4));
  CHECK(v2.components().size() == 1);
  CHECK(catalog.versionById("bakery", v1.id()).yieldQuantity() == doctest::Approx(1));
  CHECK(RecipeCatalog::diffVersions(v1, v2).yieldChanged);

  catalog.updateYield("bakery", v1.recipeId(), 0, "loaves", &err);
  CHECK(err.type() == BomError::ConfigurationError);
}

TEST_CASE_FIXTURE(TestDatabase, "RecipeCatalog only activates drafts") {
  const qint64 flour = addMaterial("bakery", "Flour", "kg", 1, 10, 4);
  const RecipeVersion v1 = addRecipe("bakery", "Cake", {RecipeComponent(flour, 0.5, "kg")});
  RecipeCatalog catalog;
  BomError err;

  catalog.activate("bakery", v1.id(), &err);
  CHECK(err.type() == BomError::InvalidStateTransitionError);

  CHECK(catalog.archiveRecipe("bakery", v1.recipeId(), &err));
  CHECK(catalog.versionById("bakery", v1.id()).state() == RecipeVersion::Archived);
  catalog.version("bakery", v1.recipeId(), 0, &err);
  CHECK(err.type() == BomError::NotFoundError);

  CHECK(!catalog.archiveRecipe("bakery", v1.recipeId(), &err));
  CHECK(err.type() == BomError::InvalidStateTransitionError);

  // older versions stay readable by number
  CHECK(catalog.version("bakery", v1.recipeId(), 1, &err).id() == v1.id());
}

TEST_CASE_FIXTURE(TestDatabase, "RecipeCatalog rejects invalid components") {
  const qint64 flour = addMaterial("bakery", "Flour", "kg", 1, 10, 4);
  const qint64 foreign = addMaterial("cafe", "Milk", "l", 1, 10, 4);
  RecipeCatalog catalog;
  BomError err;
  const RecipeVersion v1 = catalog.createRecipe("bakery", "cake", "Cake", 1, "pcs", &err);

  SUBCASE("unit mismatch") {
    catalog.setComponents("bakery", v1.recipeId(), {RecipeComponent(flour, 500, "g")}, &err);
    CHECK(err.type() == BomError::ConfigurationError);
  }
  SUBCASE("non-positive quantity") {
    catalog.setComponents("bakery", v1.recipeId(), {RecipeComponent(flour, 0, "kg")}, &err);
    CHECK(err.type() == BomError::ConfigurationError);
  }
  SUBCASE("duplicate material") {
    catalog.setComponents("bakery", v1.recipeId(),
        {RecipeComponent(flour, 1, "kg"), RecipeComponent(flour, 2, "kg")}, &err);
    CHECK(err.type() == BomError::ConfigurationError);
  }
  SUBCASE("material of another tenant") {
    catalog.setComponents("bakery", v1.recipeId(), {RecipeComponent(foreign, 1, "l")}, &err);
    CHECK(err.type() == BomError::TenantMismatchError);
  }
  SUBCASE("recipe of another tenant") {
    catalog.setComponents("cafe", v1.recipeId(), {RecipeComponent(foreign, 1, "l")}, &err);
    CHECK(err.type() == BomError::TenantMismatchError);
  }

  CHECK(catalog.versionById("bakery", v1.id()).components().isEmpty());
}

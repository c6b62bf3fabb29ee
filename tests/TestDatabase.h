#ifndef TESTDATABASE_H
#define TESTDATABASE_H

#include "BomError.h"
#include "DatabaseManager.h"
#include "Material.h"
#include "MaterialStockStore.h"
#include "RecipeCatalog.h"

#include <doctest/doctest.h>

// Fresh in-memory database for every test case
struct TestDatabase {
  TestDatabase() { REQUIRE(DatabaseManager::instance().open(":memory:")); }
  ~TestDatabase() { DatabaseManager::instance().close(); }

  qint64 addMaterial(const QString &tenant, const QString &name, const QString &unit,
                     double unitCost, double stock, double reorderPoint,
                     double reorderQuantity = 0) {
    MaterialStockStore store;
    BomError err;
    const qint64 id = store.createMaterial(
        Material(tenant, name, unit, unitCost, stock, reorderPoint, reorderQuantity), &err);
    REQUIRE_MESSAGE(!err.isValid(), qPrintable(err.text()));
    return id;
  }

  // recipe with the given components, activated
  RecipeVersion addRecipe(const QString &tenant, const QString &name,
                          const RecipeComponentList &components, double yield = 1) {
    RecipeCatalog catalog;
    BomError err;
    RecipeVersion draft = catalog.createRecipe(tenant, name.toLower(), name, yield, "pcs", &err);
    REQUIRE_MESSAGE(!err.isValid(), qPrintable(err.text()));
    if (!components.isEmpty()) {
      draft = catalog.setComponents(tenant, draft.recipeId(), components, &err);
      REQUIRE_MESSAGE(!err.isValid(), qPrintable(err.text()));
    }
    RecipeVersion active = catalog.activate(tenant, draft.id(), &err);
    REQUIRE_MESSAGE(!err.isValid(), qPrintable(err.text()));
    return active;
  }

  MaterialMap materialsOf(const RecipeVersion &version) {
    MaterialStockStore store;
    QVector<qint64> ids;
    for (const RecipeComponent &c : version.components()) ids.append(c.materialId());
    BomError err;
    MaterialMap map = store.materialsByIds(version.tenantId(), ids, &err);
    REQUIRE(!err.isValid());
    return map;
  }
};

#endif // TESTDATABASE_H

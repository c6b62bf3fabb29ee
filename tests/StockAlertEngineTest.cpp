#include "MaterialStockStore.h"
#include "RecipeFixtures.h"
#include "StockAlertEngine.h"
#include "TestDatabase.h"

#include <QDateTime>
#include <QSqlQuery>
#include <doctest/doctest.h>

TEST_CASE("StockAlertEngine classifies stock against the reorder point") {
  auto severity = [](double stock, double reorderPoint) {
    return StockAlertEngine::classify(Material("bakery", "X", "kg", 1, stock, reorderPoint), 0.5);
  };
  CHECK(severity(0, 10) == StockAlert::OutOfStock);
  CHECK(severity(1, 10) == StockAlert::Critical);
  CHECK(severity(5, 10) == StockAlert::Critical);
  CHECK(severity(5.5, 10) == StockAlert::Low);
  CHECK(severity(10, 10) == StockAlert::Low);
  CHECK(severity(10.5, 10) == StockAlert::Healthy);
  CHECK(severity(3, 0) == StockAlert::Healthy);
  CHECK(severity(0, 0) == StockAlert::OutOfStock);

  CHECK(StockAlertEngine::classify(Material("bakery", "X", "kg", 1, 5, 10), 0.25) == StockAlert::Low);
}

TEST_CASE_FIXTURE(TestDatabase, "StockAlertEngine walks an alert through its lifecycle") {
  const qint64 butter = addMaterial("bakery", "Butter", "kg", 8, 0, 5);
  MaterialStockStore store;
  StockAlertEngine engine;
  BomError err;

  // out of stock opens a pending alert
  DetectionResult result = engine.detect(store.material("bakery", butter), false, &err);
  REQUIRE(!err.isValid());
  CHECK(result.outcome == DetectionResult::Created);
  CHECK(result.severity == StockAlert::OutOfStock);
  CHECK(result.alert.status() == StockAlert::Pending);
  const qint64 alertId = result.alert.id();
  REQUIRE(alertId > 0);

  StockAlert alert = engine.acknowledge("bakery", alertId, "restocking", &err);
  REQUIRE(!err.isValid());
  CHECK(alert.status() == StockAlert::Acknowledged);
  CHECK(alert.acknowledgedNotes() == QString("restocking"));

  // a stock change refreshes the snapshot but not the status
  store.adjustStock("bakery", butter, StockAdjustment::RestockType, 1, StockAdjustment::Purchase);
  result = engine.detect(store.material("bakery", butter), false, &err);
  CHECK(result.outcome == DetectionResult::Updated);
  alert = engine.alert("bakery", alertId, &err);
  CHECK(alert.status() == StockAlert::Acknowledged);
  CHECK(alert.currentStock() == doctest::Approx(1));
  CHECK(alert.severity() == StockAlert::Critical);

  result = engine.detect(store.material("bakery", butter), false, &err);
  CHECK(result.outcome == DetectionResult::Skipped);

  store.adjustStock("bakery", butter, StockAdjustment::RestockType, 19, StockAdjustment::Purchase);
  alert = engine.resolve("bakery", alertId, "delivered", &err);
  REQUIRE(!err.isValid());
  CHECK(alert.status() == StockAlert::Resolved);
  CHECK(alert.resolvedAt().isValid());

  // healthy stock is a no-op
  result = engine.detect(store.material("bakery", butter), false, &err);
  CHECK(result.outcome == DetectionResult::Skipped);
  CHECK(engine.openAlert("bakery", butter).id() == 0);
  CHECK(engine.alerts("bakery").size() == 1);

  // a new shortage opens a new alert instead of reviving the old one
  store.adjustStock("bakery", butter, StockAdjustment::DeductionType, 18, StockAdjustment::Production);
  result = engine.detect(store.material("bakery", butter), false, &err);
  CHECK(result.outcome == DetectionResult::Created);
  CHECK(result.alert.id() != alertId);
  CHECK(engine.alert("bakery", alertId).status() == StockAlert::Resolved);
}

TEST_CASE_FIXTURE(TestDatabase, "StockAlertEngine leaves healthy stock with an open alert alone") {
  const qint64 milk = addMaterial("bakery", "Milk", "l", 1, 2, 5);
  MaterialStockStore store;
  StockAlertEngine engine;

  const DetectionResult opened = engine.detect(store.material("bakery", milk));
  REQUIRE(opened.outcome == DetectionResult::Created);

  store.adjustStock("bakery", milk, StockAdjustment::RestockType, 20, StockAdjustment::Purchase);
  const DetectionResult later = engine.detect(store.material("bakery", milk));
  CHECK(later.outcome == DetectionResult::Skipped);
  CHECK(later.severity == StockAlert::Healthy);
  CHECK(engine.openAlert("bakery", milk).id() == opened.alert.id());
}

TEST_CASE_FIXTURE(TestDatabase, "StockAlertEngine refuses transitions out of final states") {
  const qint64 eggs = addMaterial("bakery", "Eggs", "pcs", 0.2, 0, 12);
  MaterialStockStore store;
  StockAlertEngine engine;
  BomError err;

  const qint64 first = engine.detect(store.material("bakery", eggs)).alert.id();
  engine.acknowledge("bakery", first, QString(), &err);
  REQUIRE(!err.isValid());
  engine.acknowledge("bakery", first, QString(), &err);
  CHECK(err.type() == BomError::InvalidStateTransitionError);

  engine.dismiss("bakery", first, "supplier discontinued", &err);
  REQUIRE(!err.isValid());
  CHECK(engine.alert("bakery", first).dismissedNotes() == QString("supplier discontinued"));

  engine.acknowledge("bakery", first, QString(), &err);
  CHECK(err.type() == BomError::InvalidStateTransitionError);
  engine.resolve("bakery", first, QString(), &err);
  CHECK(err.type() == BomError::InvalidStateTransitionError);
  engine.dismiss("bakery", first, QString(), &err);
  CHECK(err.type() == BomError::InvalidStateTransitionError);

  const qint64 second = engine.detect(store.material("bakery", eggs)).alert.id();
  engine.resolve("bakery", second, QString(), &err);
  CHECK(!err.isValid());

  engine.acknowledge("bakery", 4242, QString(), &err);
  CHECK(err.type() == BomError::NotFoundError);
}

TEST_CASE_FIXTURE(TestDatabase, "StockAlertEngine scopes alerts to their tenant") {
  const qint64 flour = addMaterial("bakery", "Flour", "kg", 1, 0, 4);
  MaterialStockStore store;
  StockAlertEngine engine;
  BomError err;

  const qint64 alertId = engine.detect(store.material("bakery", flour)).alert.id();
  engine.alert("cafe", alertId, &err);
  CHECK(err.type() == BomError::TenantMismatchError);
  engine.acknowledge("cafe", alertId, QString(), &err);
  CHECK(err.type() == BomError::TenantMismatchError);
  CHECK(engine.alert("bakery", alertId).status() == StockAlert::Pending);
  CHECK(engine.alerts("cafe").isEmpty());

  engine.alerts("", {}, &err);
  CHECK(err.type() == BomError::ConfigurationError);
}

TEST_CASE_FIXTURE(TestDatabase, "StockAlertEngine dry run writes nothing") {
  const qint64 flour = addMaterial("bakery", "Flour", "kg", 1, 1, 4);
  MaterialStockStore store;
  StockAlertEngine engine;

  const DetectionResult result = engine.detect(store.material("bakery", flour), true);
  CHECK(result.outcome == DetectionResult::Created);
  CHECK(result.severity == StockAlert::Critical);
  CHECK(engine.alerts("bakery").isEmpty());
}

TEST_CASE_FIXTURE(TestDatabase, "stock_alerts holds at most one open alert per material") {
  const qint64 flour = addMaterial("bakery", "Flour", "kg", 1, 1, 4);
  MaterialStockStore store;
  StockAlertEngine engine;
  REQUIRE(engine.detect(store.material("bakery", flour)).outcome == DetectionResult::Created);

  QSqlQuery query(DatabaseManager::instance().database());
  query.prepare("INSERT INTO stock_alerts(tenant_id, material_id, current_stock, reorder_point, "
                "severity, status, created_at, updated_at) "
                "VALUES('bakery', :material, 1, 4, 'critical', 'acknowledged', 'x', 'x')");
  query.bindValue(":material", flour);
  CHECK(!query.exec());

  const QVector<StockAlert::Status> open = {StockAlert::Pending, StockAlert::Acknowledged};
  CHECK(engine.alerts("bakery", open).size() == 1);
}

TEST_CASE_FIXTURE(TestDatabase, "StockAlertEngine merges into an alert another writer opened first") {
  const qint64 flour = addMaterial("bakery", "Flour", "kg", 1, 1.5, 4);
  MaterialStockStore store;
  StockAlertEngine engine;

  // a concurrent scan already stored an open alert with an older snapshot
  QSqlQuery query(DatabaseManager::instance().database());
  query.prepare("INSERT INTO stock_alerts(tenant_id, material_id, current_stock, reorder_point, "
                "severity, status, notified, created_at, updated_at) "
                "VALUES('bakery', :material, 3, 4, 'low', 'pending', 0, :now, :now)");
  query.bindValue(":material", flour);
  query.bindValue(":now", DatabaseManager::toStorage(QDateTime::currentDateTimeUtc()));
  REQUIRE(query.exec());
  const qint64 existingId = query.lastInsertId().toLongLong();

  StockAlert candidate;
  candidate.setTenantId("bakery");
  candidate.setMaterialId(flour);
  candidate.setCurrentStock(1.5);
  candidate.setReorderPoint(4);
  candidate.setSeverity(StockAlert::Critical);
  candidate.setStatus(StockAlert::Pending);

  BomError err;
  const DetectionResult result = engine.insertOrMerge(candidate, &err);
  CHECK(!err.isValid());
  CHECK(result.outcome == DetectionResult::Updated);
  CHECK(result.alert.id() == existingId);

  const QVector<StockAlert::Status> open = {StockAlert::Pending, StockAlert::Acknowledged};
  const StockAlertList stored = engine.alerts("bakery", open);
  REQUIRE(stored.size() == 1);
  CHECK(stored[0].id() == existingId);
  CHECK(stored[0].currentStock() == doctest::Approx(1.5));
  CHECK(stored[0].severity() == StockAlert::Critical);

  SUBCASE("the same snapshot again changes nothing") {
    CHECK(engine.insertOrMerge(candidate, &err).outcome == DetectionResult::Skipped);
    CHECK(!err.isValid());
    CHECK(engine.alerts("bakery").size() == 1);
  }
}

TEST_CASE_FIXTURE(TestDatabase, "StockAlertEngine marks alerts notified") {
  const qint64 flour = addMaterial("bakery", "Flour", "kg", 1, 1, 4);
  MaterialStockStore store;
  StockAlertEngine engine;
  const qint64 alertId = engine.detect(store.material("bakery", flour)).alert.id();
  CHECK(!engine.alert("bakery", alertId).isNotified());

  BomError err;
  CHECK(engine.markNotified("bakery", {alertId}, &err));
  CHECK(engine.alert("bakery", alertId).isNotified());
}

TEST_CASE("StockAlertEngine predicts stockouts from daily usage") {
  Material yeast = makeMaterial(6, "Yeast", "kg", 9, 0);
  yeast.setArchived(true);
  const QVector<Material> materials = {makeMaterial(1, "Flour", "kg", 1.2, 10),
                                       makeMaterial(2, "Sugar", "kg", 2.5, 3),
                                       makeMaterial(3, "Butter", "kg", 8, 3),
                                       makeMaterial(4, "Eggs", "pcs", 0.3, 0),
                                       makeMaterial(5, "Salt", "kg", 0.5, 1),
                                       yeast};
  QHash<qint64, double> usage;
  usage.insert(1, 1.0);
  usage.insert(2, 0.5);
  usage.insert(3, 1.0);
  usage.insert(4, 2.0);
  usage.insert(6, 1.0);

  BomError err;
  const PredictiveAlertList alerts = StockAlertEngine::predictiveAlerts("bakery", materials, usage, 7, &err);
  REQUIRE(!err.isValid());
  // flour lasts 10 days, salt has no usage, yeast is archived
  REQUIRE(alerts.size() == 3);

  CHECK(alerts[0].materialName == QString("Eggs"));
  CHECK(alerts[0].daysUntilStockout == doctest::Approx(0));
  CHECK(alerts[0].severity == PredictiveAlert::Critical);

  CHECK(alerts[1].materialName == QString("Butter"));
  CHECK(alerts[1].daysUntilStockout == doctest::Approx(3));
  CHECK(alerts[1].severity == PredictiveAlert::Critical);

  CHECK(alerts[2].materialName == QString("Sugar"));
  CHECK(alerts[2].daysUntilStockout == doctest::Approx(6));
  CHECK(alerts[2].severity == PredictiveAlert::Warning);
  CHECK(alerts[2].reorderQuantity == doctest::Approx(15));
  CHECK(PredictiveAlert::severityName(alerts[2].severity) == QString("warning"));

  SUBCASE("a wider window takes in slower materials") {
    CHECK(StockAlertEngine::predictiveAlerts("bakery", materials, usage, 10, &err).size() == 4);
  }

  SUBCASE("bad input is refused") {
    StockAlertEngine::predictiveAlerts("bakery", materials, usage, -1, &err);
    CHECK(err.type() == BomError::ConfigurationError);

    StockAlertEngine::predictiveAlerts("cafe", materials, usage, 7, &err);
    CHECK(err.type() == BomError::TenantMismatchError);
  }
}

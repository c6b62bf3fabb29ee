#include "LowStockNotifier.h"
#include "LowStockScanner.h"
#include "MaterialStockStore.h"
#include "StockAlertEngine.h"
#include "TestDatabase.h"

#include <QSqlQuery>
#include <doctest/doctest.h>

TEST_CASE_FIXTURE(TestDatabase, "LowStockScanner counts what detection did") {
  addMaterial("bakery", "Flour", "kg", 1, 10, 4);
  const qint64 sugar = addMaterial("bakery", "Sugar", "kg", 2, 1, 4);
  addMaterial("bakery", "Butter", "kg", 8, 0, 5);

  MaterialStockStore store;
  StockAlertEngine engine;
  LowStockScanner scanner(store, engine);

  ScanSummary first = scanner.scanTenant("bakery");
  CHECK(first.tenantsProcessed == 1);
  CHECK(first.materialsChecked == 3);
  CHECK(first.alertsCreated == 2);
  CHECK(first.alertsUpdated == 0);
  CHECK(first.alertsSkipped == 1);
  CHECK(!first.hasFailures());

  // nothing changed, nothing new
  ScanSummary second = scanner.scanTenant("bakery");
  CHECK(second.alertsCreated == 0);
  CHECK(second.alertsUpdated == 0);
  CHECK(second.alertsSkipped == 3);

  store.adjustStock("bakery", sugar, StockAdjustment::DeductionType, 0.5, StockAdjustment::Production);
  ScanSummary third = scanner.scanTenant("bakery");
  CHECK(third.alertsCreated == 0);
  CHECK(third.alertsUpdated == 1);
}

TEST_CASE_FIXTURE(TestDatabase, "LowStockScanner dry run leaves the database alone") {
  addMaterial("bakery", "Butter", "kg", 8, 0, 5);
  MaterialStockStore store;
  StockAlertEngine engine;
  LowStockScanner scanner(store, engine);

  ScanOptions options;
  options.dryRun = true;
  const ScanSummary summary = scanner.scanTenant("bakery", options);
  CHECK(summary.alertsCreated == 1);
  CHECK(engine.alerts("bakery").isEmpty());
}

TEST_CASE_FIXTURE(TestDatabase, "LowStockScanner covers every tenant separately") {
  addMaterial("bakery", "Butter", "kg", 8, 0, 5);
  addMaterial("cafe", "Milk", "l", 1, 1, 10);
  addMaterial("cafe", "Beans", "kg", 20, 30, 10);
  const qint64 archived = addMaterial("cafe", "Syrup", "l", 5, 0, 2);

  MaterialStockStore store;
  REQUIRE(store.archiveMaterial("cafe", archived));
  StockAlertEngine engine;
  LowStockScanner scanner(store, engine);

  const ScanSummary summary = scanner.scanAll();
  CHECK(summary.tenantsProcessed == 2);
  CHECK(summary.materialsChecked == 3);
  CHECK(summary.alertsCreated == 2);
  CHECK(engine.alerts("bakery").size() == 1);
  CHECK(engine.alerts("cafe").size() == 1);
  CHECK(engine.openAlert("cafe", archived).id() == 0);
}

TEST_CASE_FIXTURE(TestDatabase, "LowStockScanner reports a failing tenant and goes on") {
  addMaterial("bakery", "Butter", "kg", 8, 0, 5);
  MaterialStockStore store;
  StockAlertEngine engine;
  LowStockScanner scanner(store, engine);

  const ScanSummary failed = scanner.scanTenant("  ");
  CHECK(failed.tenantsFailed == 1);
  CHECK(failed.hasFailures());
  CHECK(failed.errors.size() == 1);

  ScanSummary total = failed;
  total.merge(scanner.scanTenant("bakery"));
  CHECK(total.tenantsProcessed == 1);
  CHECK(total.tenantsFailed == 1);
  CHECK(total.alertsCreated == 1);
}

TEST_CASE_FIXTURE(TestDatabase, "LowStockScanner notifies once per tenant and marks alerts") {
  addMaterial("bakery", "Flour", "kg", 1, 1, 4);
  addMaterial("bakery", "Sugar", "kg", 2, 3, 4);
  addMaterial("bakery", "Butter", "kg", 8, 0, 5);

  MaterialStockStore store;
  StockAlertEngine engine;
  LowStockNotifier notifier(2);
  LowStockScanner scanner(store, engine, &notifier);

  QVector<LowStockNotification> received;
  QObject::connect(&notifier, &LowStockNotifier::notificationReady,
                   [&received](const LowStockNotification &n) { received.append(n); });

  ScanOptions options;
  options.notify = true;
  const ScanSummary summary = scanner.scanTenant("bakery", options);
  CHECK(summary.notificationsSent == 1);
  REQUIRE(received.size() == 1);
  CHECK(received[0].tenantId == QString("bakery"));
  CHECK(received[0].totalCount == 3);
  REQUIRE(received[0].alerts.size() == 2);
  CHECK(received[0].isTruncated());
  CHECK(received[0].alerts[0].severity() == StockAlert::OutOfStock);

  int notified = 0;
  for (const StockAlert &a : engine.alerts("bakery")) {
    if (a.isNotified()) ++notified;
  }
  CHECK(notified == 2);

  // an unchanged scan has nothing to announce
  scanner.scanTenant("bakery", options);
  CHECK(received.size() == 1);
}

TEST_CASE_FIXTURE(TestDatabase, "LowStockScanner counts alerts it could not mark notified as failures") {
  addMaterial("bakery", "Flour", "kg", 1, 1, 4);

  MaterialStockStore store;
  StockAlertEngine engine;
  LowStockNotifier notifier;
  LowStockScanner scanner(store, engine, &notifier);

  // the alert table disappears between the announcement and the bookkeeping
  QObject::connect(&notifier, &LowStockNotifier::notificationReady, [](const LowStockNotification &) {
    QSqlQuery query(DatabaseManager::instance().database());
    CHECK(query.exec("DROP TABLE stock_alerts"));
  });

  ScanOptions options;
  options.notify = true;
  const ScanSummary summary = scanner.scanTenant("bakery", options);
  CHECK(summary.alertsCreated == 1);
  CHECK(summary.notificationsSent == 0);
  CHECK(summary.failures == 1);
  CHECK(summary.hasFailures());
  CHECK(summary.errors.size() == 1);
}

#ifndef LOWSTOCKSCANNER_H
#define LOWSTOCKSCANNER_H

#include <QString>
#include <QStringList>

class BomError;
class LowStockNotifier;
class MaterialStockStore;
class StockAlertEngine;

struct ScanOptions {
    bool dryRun = false;   // classify only, write nothing
    bool notify = false;   // emit one notification per tenant with new or changed alerts
};

// ─── Outcome of a scan over one or more tenants ──────────────────────────────
struct ScanSummary {
    int tenantsProcessed = 0;
    int tenantsFailed    = 0;
    int materialsChecked = 0;
    int alertsCreated    = 0;
    int alertsUpdated    = 0;
    int alertsSkipped    = 0;
    int failures         = 0;   // materials that could not be checked
    int notificationsSent = 0;
    QStringList errors;

    bool hasFailures() const { return failures > 0 || tenantsFailed > 0; }
    void merge(const ScanSummary &other);
};

// Runs alert detection over every non-archived material of a tenant.
// A failing material or tenant is logged and counted, the scan goes on.
class LowStockScanner {
public:
    LowStockScanner(MaterialStockStore &store, StockAlertEngine &engine,
                    LowStockNotifier *notifier = nullptr);

    ScanSummary scanTenant(const QString &tenantId, const ScanOptions &options = ScanOptions());
    ScanSummary scanAll(const ScanOptions &options = ScanOptions());

private:
    MaterialStockStore &m_store;
    StockAlertEngine &m_engine;
    LowStockNotifier *m_notifier;
};

#endif // LOWSTOCKSCANNER_H

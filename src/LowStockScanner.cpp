#include "LowStockScanner.h"
#include "BomError.h"
#include "LowStockNotifier.h"
#include "MaterialStockStore.h"
#include "StockAlertEngine.h"

#include <QDebug>

void ScanSummary::merge(const ScanSummary &other) {
    tenantsProcessed += other.tenantsProcessed;
    tenantsFailed += other.tenantsFailed;
    materialsChecked += other.materialsChecked;
    alertsCreated += other.alertsCreated;
    alertsUpdated += other.alertsUpdated;
    alertsSkipped += other.alertsSkipped;
    failures += other.failures;
    notificationsSent += other.notificationsSent;
    errors += other.errors;
}

LowStockScanner::LowStockScanner(MaterialStockStore &store, StockAlertEngine &engine,
                                 LowStockNotifier *notifier)
    : m_store(store), m_engine(engine), m_notifier(notifier) {}

ScanSummary LowStockScanner::scanTenant(const QString &tenantId, const ScanOptions &options) {
    ScanSummary summary;

    BomError err;
    const QVector<Material> materials = m_store.materials(tenantId, false, &err);
    if (err.isValid()) {
        qWarning() << "Low stock scan of tenant" << tenantId << "failed:" << err.text();
        summary.tenantsFailed = 1;
        summary.errors << QString("tenant %1: %2").arg(tenantId, err.text());
        return summary;
    }

    StockAlertList touched;
    for (const Material &m : materials) {
        ++summary.materialsChecked;
        const DetectionResult result = m_engine.detect(m, options.dryRun, &err);
        if (err.isValid()) {
            qWarning() << "Alert detection for material" << m.id() << "of tenant" << tenantId
                       << "failed:" << err.text();
            ++summary.failures;
            summary.errors << QString("tenant %1, material %2: %3").arg(tenantId).arg(m.id()).arg(err.text());
            continue;
        }
        switch (result.outcome) {
        case DetectionResult::Created:
            ++summary.alertsCreated;
            touched.append(result.alert);
            break;
        case DetectionResult::Updated:
            ++summary.alertsUpdated;
            touched.append(result.alert);
            break;
        case DetectionResult::Skipped:
            ++summary.alertsSkipped;
            break;
        }
    }
    summary.tenantsProcessed = 1;

    qInfo() << "Scanned tenant" << tenantId << (options.dryRun ? "(dry run):" : ":")
            << summary.materialsChecked << "materials," << summary.alertsCreated << "created,"
            << summary.alertsUpdated << "updated," << summary.alertsSkipped << "skipped";

    if (options.notify && !options.dryRun && m_notifier && !touched.isEmpty()) {
        const LowStockNotification notification = m_notifier->notify(tenantId, touched);
        QVector<qint64> ids;
        for (const StockAlert &a : notification.alerts) {
            ids.append(a.id());
        }
        if (!m_engine.markNotified(tenantId, ids, &err)) {
            qWarning() << "Could not mark alerts of tenant" << tenantId << "notified:" << err.text();
            ++summary.failures;
            summary.errors << QString("tenant %1: %2").arg(tenantId, err.text());
        } else {
            ++summary.notificationsSent;
        }
    }
    return summary;
}

ScanSummary LowStockScanner::scanAll(const ScanOptions &options) {
    ScanSummary summary;

    BomError err;
    const QStringList tenants = m_store.tenantIds(&err);
    if (err.isValid()) {
        qWarning() << "Cannot list tenants for low stock scan:" << err.text();
        summary.errors << err.text();
        ++summary.tenantsFailed;
        return summary;
    }

    for (const QString &tenantId : tenants) {
        summary.merge(scanTenant(tenantId, options));
    }
    qInfo() << "Low stock scan finished:" << summary.tenantsProcessed << "tenants,"
            << summary.tenantsFailed << "failed";
    return summary;
}

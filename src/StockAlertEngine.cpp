#include "StockAlertEngine.h"
#include "BomError.h"
#include "BomMath.h"
#include "MaterialStockStore.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QStringList>
#include <QVariant>
#include <QDebug>

#include <algorithm>

static const char *kAlertColumns =
    "id, tenant_id, material_id, current_stock, reorder_point, severity, status, "
    "notified_at, acknowledged_at, acknowledged_notes, resolved_at, resolved_notes, "
    "dismissed_at, dismissed_notes, created_at, updated_at";

QString DetectionResult::outcomeName(Outcome outcome) {
    switch (outcome) {
    case Created: return QStringLiteral("created");
    case Updated: return QStringLiteral("updated");
    case Skipped: return QStringLiteral("skipped");
    }
    return QString();
}

QString PredictiveAlert::severityName(Severity severity) {
    return severity == Critical ? QStringLiteral("critical") : QStringLiteral("warning");
}

StockAlertEngine::StockAlertEngine(const QSqlDatabase &db, double criticalRatio)
    : m_db(db), m_criticalRatio(criticalRatio) {}

StockAlert::Severity StockAlertEngine::classify(const Material &material, double criticalRatio) {
    const double stock = material.currentStock();
    const double reorderPoint = material.reorderPoint();
    if (stock <= kQuantityEpsilon) return StockAlert::OutOfStock;
    // without a reorder point only an empty shelf is worth an alert
    if (reorderPoint <= 0) return StockAlert::Healthy;
    if (stock <= reorderPoint * criticalRatio + kQuantityEpsilon) return StockAlert::Critical;
    if (stock <= reorderPoint + kQuantityEpsilon) return StockAlert::Low;
    return StockAlert::Healthy;
}

StockAlert::Severity StockAlertEngine::classify(const Material &material) const {
    return classify(material, m_criticalRatio);
}

StockAlert StockAlertEngine::alertFromQuery(const QSqlQuery &query) {
    StockAlert a;
    a.setId(query.value(0).toLongLong());
    a.setTenantId(query.value(1).toString());
    a.setMaterialId(query.value(2).toLongLong());
    a.setCurrentStock(query.value(3).toDouble());
    a.setReorderPoint(query.value(4).toDouble());
    a.setSeverity(StockAlert::severityFromName(query.value(5).toString()));
    a.setStatus(StockAlert::statusFromName(query.value(6).toString()));
    a.setNotifiedAt(DatabaseManager::fromStorage(query.value(7)));
    a.setAcknowledged(DatabaseManager::fromStorage(query.value(8)), query.value(9).toString());
    a.setResolved(DatabaseManager::fromStorage(query.value(10)), query.value(11).toString());
    a.setDismissed(DatabaseManager::fromStorage(query.value(12)), query.value(13).toString());
    a.setCreatedAt(DatabaseManager::fromStorage(query.value(14)));
    a.setUpdatedAt(DatabaseManager::fromStorage(query.value(15)));
    return a;
}

bool StockAlertEngine::isUniqueViolation(const QSqlQuery &query) {
    const QSqlError err = query.lastError();
    // SQLITE_CONSTRAINT (19) or its extended SQLITE_CONSTRAINT_UNIQUE (2067)
    const QString code = err.nativeErrorCode();
    return code == "19" || code == "2067"
        || err.databaseText().contains("UNIQUE constraint failed", Qt::CaseInsensitive);
}

DetectionResult StockAlertEngine::detect(const Material &material, bool dryRun, BomError *error) {
    DetectionResult result;
    if (!MaterialStockStore::validateTenant(material.tenantId(), error)) return result;
    if (material.id() <= 0) {
        BomError::report(error, BomError::NotFoundError,
                         QString("material '%1' is not stored").arg(material.name()));
        return result;
    }

    result.severity = classify(material);

    BomError err;
    StockAlert open = openAlert(material.tenantId(), material.id(), &err);
    if (err.isValid()) {
        if (error) *error = err;
        return result;
    }

    if (result.severity == StockAlert::Healthy) {
        // replenished stock does not close the alert; a person resolves it
        result.outcome = DetectionResult::Skipped;
        result.alert = open;
        BomError::clear(error);
        return result;
    }

    StockAlert candidate;
    candidate.setTenantId(material.tenantId());
    candidate.setMaterialId(material.id());
    candidate.setCurrentStock(material.currentStock());
    candidate.setReorderPoint(material.reorderPoint());
    candidate.setSeverity(result.severity);
    candidate.setStatus(StockAlert::Pending);

    if (open.id() != 0) return mergeInto(open, candidate, dryRun, error);

    if (dryRun) {
        result.outcome = DetectionResult::Created;
        result.alert = candidate;
        BomError::clear(error);
        return result;
    }
    return insertOrMerge(candidate, error);
}

DetectionResult StockAlertEngine::insertOrMerge(const StockAlert &candidate, BomError *error) {
    DetectionResult result;
    if (!MaterialStockStore::validateTenant(candidate.tenantId(), error)) return result;
    result.severity = candidate.severity();

    StockAlert alert = candidate;
    BomError err;
    bool duplicate = false;
    if (insertAlert(alert, &duplicate, &err)) {
        result.outcome = DetectionResult::Created;
        result.alert = alert;
        BomError::clear(error);
        return result;
    }
    if (!duplicate) {
        if (error) *error = err;
        return result;
    }

    // another scan inserted first; fold this detection into its alert
    qDebug() << "Open alert for material" << candidate.materialId() << "appeared concurrently, updating it";
    const StockAlert open = openAlert(candidate.tenantId(), candidate.materialId(), &err);
    if (err.isValid() || open.id() == 0) {
        BomError::report(error, BomError::StorageError,
                         QString("open alert of material %1 vanished after conflict").arg(candidate.materialId()));
        return result;
    }
    return mergeInto(open, candidate, false, error);
}

DetectionResult StockAlertEngine::mergeInto(StockAlert open, const StockAlert &candidate, bool dryRun,
                                            BomError *error) {
    DetectionResult result;
    result.severity = candidate.severity();

    const bool changed = qAbs(open.currentStock() - candidate.currentStock()) > kQuantityEpsilon
        || qAbs(open.reorderPoint() - candidate.reorderPoint()) > kQuantityEpsilon
        || open.severity() != candidate.severity();
    if (!changed) {
        result.outcome = DetectionResult::Skipped;
        result.alert = open;
        BomError::clear(error);
        return result;
    }

    open.setCurrentStock(candidate.currentStock());
    open.setReorderPoint(candidate.reorderPoint());
    open.setSeverity(candidate.severity());
    BomError err;
    if (!dryRun && !updateSnapshot(open, &err)) {
        if (error) *error = err;
        return result;
    }
    result.outcome = DetectionResult::Updated;
    result.alert = open;
    BomError::clear(error);
    return result;
}

bool StockAlertEngine::insertAlert(StockAlert &alert, bool *duplicate, BomError *error) {
    const QDateTime now = QDateTime::currentDateTimeUtc();
    QSqlQuery query(m_db);
    query.prepare("INSERT INTO stock_alerts(tenant_id, material_id, current_stock, reorder_point, "
                  "severity, status, notified, created_at, updated_at) "
                  "VALUES(:tenant,:material,:stock,:rp,:severity,:status,0,:now,:now)");
    query.bindValue(":tenant", alert.tenantId());
    query.bindValue(":material", alert.materialId());
    query.bindValue(":stock", alert.currentStock());
    query.bindValue(":rp", alert.reorderPoint());
    query.bindValue(":severity", StockAlert::severityName(alert.severity()));
    query.bindValue(":status", StockAlert::statusName(alert.status()));
    query.bindValue(":now", DatabaseManager::toStorage(now));
    if (!query.exec()) {
        if (isUniqueViolation(query)) {
            *duplicate = true;
            return BomError::report(error, BomError::ConcurrencyConflict,
                                    QString("material %1 already has an open alert").arg(alert.materialId()));
        }
        return DatabaseManager::reportQueryError(query, "insert stock alert", error);
    }
    alert.setId(query.lastInsertId().toLongLong());
    alert.setCreatedAt(now);
    alert.setUpdatedAt(now);
    qInfo() << "Opened" << StockAlert::severityName(alert.severity()) << "alert" << alert.id()
            << "for material" << alert.materialId() << "of tenant" << alert.tenantId();
    return true;
}

bool StockAlertEngine::updateSnapshot(StockAlert &alert, BomError *error) {
    const QDateTime now = QDateTime::currentDateTimeUtc();
    QSqlQuery query(m_db);
    query.prepare("UPDATE stock_alerts SET current_stock = :stock, reorder_point = :rp, "
                  "severity = :severity, updated_at = :now WHERE id = :id");
    query.bindValue(":stock", alert.currentStock());
    query.bindValue(":rp", alert.reorderPoint());
    query.bindValue(":severity", StockAlert::severityName(alert.severity()));
    query.bindValue(":now", DatabaseManager::toStorage(now));
    query.bindValue(":id", alert.id());
    if (!query.exec()) {
        return DatabaseManager::reportQueryError(query, "update stock alert", error);
    }
    alert.setUpdatedAt(now);
    return true;
}

StockAlert StockAlertEngine::acknowledge(const QString &tenantId, qint64 alertId, const QString &notes,
                                         BomError *error) {
    return transition(tenantId, alertId, StockAlert::Acknowledged, notes, error);
}

StockAlert StockAlertEngine::resolve(const QString &tenantId, qint64 alertId, const QString &notes,
                                     BomError *error) {
    return transition(tenantId, alertId, StockAlert::Resolved, notes, error);
}

StockAlert StockAlertEngine::dismiss(const QString &tenantId, qint64 alertId, const QString &notes,
                                     BomError *error) {
    return transition(tenantId, alertId, StockAlert::Dismissed, notes, error);
}

StockAlert StockAlertEngine::transition(const QString &tenantId, qint64 alertId, StockAlert::Status target,
                                        const QString &notes, BomError *error) {
    BomError err;
    StockAlert current = alert(tenantId, alertId, &err);
    if (err.isValid()) {
        if (error) *error = err;
        return StockAlert();
    }

    // acknowledge only leaves pending; resolve and dismiss leave any open state
    const bool allowed = target == StockAlert::Acknowledged
        ? current.status() == StockAlert::Pending
        : current.isOpen();
    if (!allowed) {
        BomError::report(error, BomError::InvalidStateTransitionError,
                         QString("alert %1 cannot go from %2 to %3")
                             .arg(alertId)
                             .arg(StockAlert::statusName(current.status()),
                                  StockAlert::statusName(target)));
        return StockAlert();
    }

    QString column;
    switch (target) {
    case StockAlert::Acknowledged: column = "acknowledged"; break;
    case StockAlert::Resolved:     column = "resolved"; break;
    case StockAlert::Dismissed:    column = "dismissed"; break;
    case StockAlert::Pending:      break;
    }

    const QDateTime now = QDateTime::currentDateTimeUtc();
    QSqlQuery query(m_db);
    query.prepare(QString("UPDATE stock_alerts SET status = :status, %1_at = :now, %1_notes = :notes, "
                          "updated_at = :now WHERE id = :id AND tenant_id = :tenant AND status = :from")
                      .arg(column));
    query.bindValue(":status", StockAlert::statusName(target));
    query.bindValue(":now", DatabaseManager::toStorage(now));
    query.bindValue(":notes", notes);
    query.bindValue(":id", alertId);
    query.bindValue(":tenant", tenantId);
    query.bindValue(":from", StockAlert::statusName(current.status()));
    if (!query.exec()) {
        DatabaseManager::reportQueryError(query, "update alert status", error);
        return StockAlert();
    }
    if (query.numRowsAffected() != 1) {
        BomError::report(error, BomError::InvalidStateTransitionError,
                         QString("alert %1 changed state concurrently").arg(alertId));
        return StockAlert();
    }

    qInfo() << "Alert" << alertId << StockAlert::statusName(current.status())
            << "->" << StockAlert::statusName(target);

    current.setStatus(target);
    current.setUpdatedAt(now);
    switch (target) {
    case StockAlert::Acknowledged: current.setAcknowledged(now, notes); break;
    case StockAlert::Resolved:     current.setResolved(now, notes); break;
    case StockAlert::Dismissed:    current.setDismissed(now, notes); break;
    case StockAlert::Pending:      break;
    }
    BomError::clear(error);
    return current;
}

StockAlertList StockAlertEngine::alerts(const QString &tenantId, const QVector<StockAlert::Status> &statuses,
                                        BomError *error) const {
    StockAlertList result;
    if (!MaterialStockStore::validateTenant(tenantId, error)) return result;

    QString sql = QString("SELECT %1 FROM stock_alerts WHERE tenant_id = :tenant").arg(kAlertColumns);
    if (!statuses.isEmpty()) {
        QStringList names;
        for (StockAlert::Status s : statuses) {
            names << QString("'%1'").arg(StockAlert::statusName(s));
        }
        sql += QString(" AND status IN (%1)").arg(names.join(", "));
    }
    sql += " ORDER BY id";

    QSqlQuery query(m_db);
    query.prepare(sql);
    query.bindValue(":tenant", tenantId);
    if (!query.exec()) {
        DatabaseManager::reportQueryError(query, "list stock alerts", error);
        return result;
    }
    while (query.next()) {
        result.append(alertFromQuery(query));
    }
    BomError::clear(error);
    return result;
}

StockAlert StockAlertEngine::alert(const QString &tenantId, qint64 alertId, BomError *error) const {
    if (!MaterialStockStore::validateTenant(tenantId, error)) return StockAlert();

    QSqlQuery query(m_db);
    query.prepare(QString("SELECT %1 FROM stock_alerts WHERE id = :id").arg(kAlertColumns));
    query.bindValue(":id", alertId);
    if (!query.exec()) {
        DatabaseManager::reportQueryError(query, "load stock alert", error);
        return StockAlert();
    }
    if (!query.next()) {
        BomError::report(error, BomError::NotFoundError, QString("alert %1 not found").arg(alertId));
        return StockAlert();
    }
    StockAlert a = alertFromQuery(query);
    if (a.tenantId() != tenantId) {
        BomError::report(error, BomError::TenantMismatchError,
                         QString("alert %1 belongs to another tenant").arg(alertId));
        return StockAlert();
    }
    BomError::clear(error);
    return a;
}

StockAlert StockAlertEngine::openAlert(const QString &tenantId, qint64 materialId, BomError *error) const {
    if (!MaterialStockStore::validateTenant(tenantId, error)) return StockAlert();

    QSqlQuery query(m_db);
    query.prepare(QString("SELECT %1 FROM stock_alerts WHERE tenant_id = :tenant AND material_id = :material "
                          "AND status IN ('pending', 'acknowledged')").arg(kAlertColumns));
    query.bindValue(":tenant", tenantId);
    query.bindValue(":material", materialId);
    if (!query.exec()) {
        DatabaseManager::reportQueryError(query, "load open alert", error);
        return StockAlert();
    }
    BomError::clear(error);
    if (!query.next()) return StockAlert();
    return alertFromQuery(query);
}

bool StockAlertEngine::markNotified(const QString &tenantId, const QVector<qint64> &alertIds,
                                    BomError *error) {
    if (!MaterialStockStore::validateTenant(tenantId, error)) return false;
    if (alertIds.isEmpty()) {
        BomError::clear(error);
        return true;
    }

    SqlTransaction tx(m_db);
    if (!tx.isActive()) {
        return BomError::report(error, BomError::StorageError, "cannot start transaction");
    }
    const QString now = DatabaseManager::toStorage(QDateTime::currentDateTimeUtc());
    QSqlQuery query(m_db);
    query.prepare("UPDATE stock_alerts SET notified = 1, notified_at = :now, updated_at = :now "
                  "WHERE id = :id AND tenant_id = :tenant");
    for (qint64 id : alertIds) {
        query.bindValue(":now", now);
        query.bindValue(":id", id);
        query.bindValue(":tenant", tenantId);
        if (!query.exec()) {
            return DatabaseManager::reportQueryError(query, "mark alert notified", error);
        }
    }
    if (!tx.commit()) {
        return BomError::report(error, BomError::StorageError, "cannot commit notified alerts");
    }
    BomError::clear(error);
    return true;
}

PredictiveAlertList StockAlertEngine::predictiveAlerts(const QString &tenantId, const QVector<Material> &materials,
                                                       const QHash<qint64, double> &dailyUsage, int forecastDays,
                                                       BomError *error) {
    PredictiveAlertList result;
    if (!MaterialStockStore::validateTenant(tenantId, error)) return result;
    if (forecastDays < 0) {
        BomError::report(error, BomError::ConfigurationError,
                         QString("forecast days must not be negative, got %1").arg(forecastDays));
        return result;
    }

    for (const Material &m : materials) {
        if (m.tenantId() != tenantId) {
            BomError::report(error, BomError::TenantMismatchError,
                             QString("material %1 belongs to another tenant").arg(m.id()));
            return PredictiveAlertList();
        }
        if (m.isArchived()) continue;

        const double usage = dailyUsage.value(m.id(), 0.0);
        if (usage <= kQuantityEpsilon) continue;

        const double days = qMax(0.0, m.currentStock()) / usage;
        if (days > forecastDays) continue;

        PredictiveAlert a;
        a.materialId = m.id();
        a.materialName = m.name();
        a.unit = m.unit();
        a.currentStock = m.currentStock();
        a.averageDailyUsage = usage;
        a.daysUntilStockout = days;
        a.reorderQuantity = usage * kPredictiveCoverDays;
        a.severity = days <= kPredictiveCriticalDays ? PredictiveAlert::Critical : PredictiveAlert::Warning;
        result.append(a);
    }

    std::sort(result.begin(), result.end(), [](const PredictiveAlert &a, const PredictiveAlert &b) {
        if (a.daysUntilStockout != b.daysUntilStockout) return a.daysUntilStockout < b.daysUntilStockout;
        return a.materialId < b.materialId;
    });
    BomError::clear(error);
    return result;
}

#ifndef STOCKALERTENGINE_H
#define STOCKALERTENGINE_H

#include "DatabaseManager.h"
#include "Material.h"
#include "StockAlert.h"

#include <QHash>
#include <QSqlDatabase>
#include <QVector>

class BomError;
class QSqlQuery;

// What detect() did (or would do, in dry-run mode) for one material
struct DetectionResult {
    enum Outcome { Created, Updated, Skipped };

    Outcome outcome = Skipped;
    StockAlert::Severity severity = StockAlert::Healthy;
    StockAlert alert;          // the open alert after detection, if any

    static QString outcomeName(Outcome outcome);
};

// ─── Material expected to run out within the forecast window ─────────────────
struct PredictiveAlert {
    enum Severity { Warning, Critical };

    qint64   materialId        = 0;
    QString  materialName;
    QString  unit;
    double   currentStock      = 0;
    double   averageDailyUsage = 0;
    double   daysUntilStockout = 0;
    double   reorderQuantity   = 0;   // kPredictiveCoverDays of usage
    Severity severity          = Warning;

    static QString severityName(Severity severity);
};
typedef QVector<PredictiveAlert> PredictiveAlertList;

// stockout at or within this many days is critical
constexpr double kPredictiveCriticalDays = 3;
constexpr double kPredictiveCoverDays = 30;

// Low stock alert lifecycle.
// pending -> acknowledged -> resolved | dismissed, with pending also allowed
// to go straight to resolved or dismissed. Terminal alerts are never
// revived; a new shortage opens a fresh alert.
class StockAlertEngine {
public:
    explicit StockAlertEngine(const QSqlDatabase &db = DatabaseManager::instance().database(),
                              double criticalRatio = 0.5);

    double criticalRatio() const { return m_criticalRatio; }

    static StockAlert::Severity classify(const Material &material, double criticalRatio);
    StockAlert::Severity classify(const Material &material) const;

    DetectionResult detect(const Material &material, bool dryRun = false, BomError *error = nullptr);

    // Inserts a new open alert. When the material already has one (a
    // concurrent scan won the unique index) the candidate's snapshot is
    // merged into it instead and the outcome is Updated or Skipped.
    DetectionResult insertOrMerge(const StockAlert &candidate, BomError *error = nullptr);

    StockAlert acknowledge(const QString &tenantId, qint64 alertId, const QString &notes = QString(),
                           BomError *error = nullptr);
    StockAlert resolve(const QString &tenantId, qint64 alertId, const QString &notes = QString(),
                       BomError *error = nullptr);
    StockAlert dismiss(const QString &tenantId, qint64 alertId, const QString &notes = QString(),
                       BomError *error = nullptr);

    // alerts of a tenant in the given statuses, all statuses when empty
    StockAlertList alerts(const QString &tenantId,
                          const QVector<StockAlert::Status> &statuses = QVector<StockAlert::Status>(),
                          BomError *error = nullptr) const;
    StockAlert alert(const QString &tenantId, qint64 alertId, BomError *error = nullptr) const;

    /// open alert of a material, id 0 when there is none
    StockAlert openAlert(const QString &tenantId, qint64 materialId, BomError *error = nullptr) const;

    // Materials whose stock lasts at most forecastDays at their average daily
    // usage, soonest stockout first. Materials without usage never qualify.
    static PredictiveAlertList predictiveAlerts(const QString &tenantId, const QVector<Material> &materials,
                                                const QHash<qint64, double> &dailyUsage, int forecastDays,
                                                BomError *error = nullptr);

    bool markNotified(const QString &tenantId, const QVector<qint64> &alertIds,
                      BomError *error = nullptr);

private:
    StockAlert transition(const QString &tenantId, qint64 alertId, StockAlert::Status target,
                          const QString &notes, BomError *error);
    DetectionResult mergeInto(StockAlert open, const StockAlert &candidate, bool dryRun, BomError *error);
    bool insertAlert(StockAlert &alert, bool *duplicate, BomError *error);
    bool updateSnapshot(StockAlert &alert, BomError *error);

    static StockAlert alertFromQuery(const QSqlQuery &query);
    static bool isUniqueViolation(const QSqlQuery &query);

    QSqlDatabase m_db;
    double m_criticalRatio;
};

#endif // STOCKALERTENGINE_H

#ifndef REORDERRECOMMENDATIONENGINE_H
#define REORDERRECOMMENDATIONENGINE_H

#include "Material.h"
#include "StockAlert.h"

#include <QHash>
#include <QVector>

class BomError;

// ─── One material worth buying ───────────────────────────────────────────────
struct ReorderRecommendation {
    enum Priority { Medium = 1, High = 2 };

    qint64   materialId        = 0;
    QString  materialName;
    QString  unit;
    double   currentStock      = 0;
    double   reorderPoint      = 0;
    double   stockRatio        = 0;
    StockAlert::Severity severity = StockAlert::Low;
    Priority priority          = Medium;
    double   suggestedQuantity = 0;
    double   unitCost          = 0;
    double   estimatedCost     = 0;
    // filled only when consumption history is known
    bool     hasUsage          = false;
    double   averageDailyUsage = 0;
    double   daysUntilStockout = -1;   // -1 when nothing is consumed

    static QString priorityName(Priority priority);
};

struct ReorderReport {
    QString tenantId;
    QVector<ReorderRecommendation> recommendations;   // most urgent first
    double totalEstimatedCost = 0;
};

class ReorderRecommendationEngine {
public:
    explicit ReorderRecommendationEngine(double criticalRatio = 0.5);

    // ranks the unhealthy, non-archived materials by urgency
    ReorderReport generateRecommendations(const QString &tenantId,
                                          const QVector<Material> &materials,
                                          const QHash<qint64, double> &dailyUsage = QHash<qint64, double>(),
                                          BomError *error = nullptr) const;

    static double suggestedQuantity(const Material &material);

private:
    double m_criticalRatio;
};

#endif // REORDERRECOMMENDATIONENGINE_H

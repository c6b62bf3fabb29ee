#include "ReorderRecommendationEngine.h"
#include "BomError.h"
#include "BomMath.h"
#include "MaterialStockStore.h"
#include "StockAlertEngine.h"

#include <algorithm>

QString ReorderRecommendation::priorityName(Priority priority) {
    return priority == High ? QStringLiteral("high") : QStringLiteral("medium");
}

ReorderRecommendationEngine::ReorderRecommendationEngine(double criticalRatio)
    : m_criticalRatio(criticalRatio) {}

double ReorderRecommendationEngine::suggestedQuantity(const Material &material) {
    if (material.reorderQuantity() > 0) return material.reorderQuantity();
    // bring stock back up to twice the reorder point
    return qMax(1.0, 2 * material.reorderPoint() - material.currentStock());
}

ReorderReport ReorderRecommendationEngine::generateRecommendations(const QString &tenantId,
                                                                   const QVector<Material> &materials,
                                                                   const QHash<qint64, double> &dailyUsage,
                                                                   BomError *error) const {
    ReorderReport report;
    report.tenantId = tenantId;
    if (!MaterialStockStore::validateTenant(tenantId, error)) return report;

    for (const Material &m : materials) {
        if (m.tenantId() != tenantId) {
            BomError::report(error, BomError::TenantMismatchError,
                             QString("material %1 belongs to another tenant").arg(m.id()));
            return ReorderReport();
        }
        if (m.isArchived()) continue;

        const StockAlert::Severity severity = StockAlertEngine::classify(m, m_criticalRatio);
        if (severity == StockAlert::Healthy) continue;

        ReorderRecommendation r;
        r.materialId = m.id();
        r.materialName = m.name();
        r.unit = m.unit();
        r.currentStock = m.currentStock();
        r.reorderPoint = m.reorderPoint();
        r.stockRatio = m.stockRatio();
        r.severity = severity;
        r.priority = severity == StockAlert::Low ? ReorderRecommendation::Medium
                                                 : ReorderRecommendation::High;
        r.suggestedQuantity = suggestedQuantity(m);
        r.unitCost = m.unitCost();
        r.estimatedCost = r.suggestedQuantity * r.unitCost;

        if (dailyUsage.contains(m.id())) {
            r.hasUsage = true;
            r.averageDailyUsage = dailyUsage.value(m.id());
            if (r.averageDailyUsage > kQuantityEpsilon) {
                r.daysUntilStockout = m.currentStock() / r.averageDailyUsage;
            }
        }

        report.recommendations.append(r);
        report.totalEstimatedCost += r.estimatedCost;
    }

    std::sort(report.recommendations.begin(), report.recommendations.end(),
              [](const ReorderRecommendation &a, const ReorderRecommendation &b) {
        if (a.priority != b.priority) return a.priority > b.priority;
        if (a.stockRatio != b.stockRatio) return a.stockRatio < b.stockRatio;
        return a.materialId < b.materialId;
    });

    BomError::clear(error);
    return report;
}

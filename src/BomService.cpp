#include "BomService.h"
#include "BomError.h"

#include <QDebug>

BomService::BomService(const BomSettings &settings, const QSqlDatabase &db)
    : m_settings(settings),
      m_store(db),
      m_catalog(db),
      m_alerts(db, settings.criticalRatio),
      m_notifier(settings.notificationLimit),
      m_scanner(m_store, m_alerts, &m_notifier),
      m_reorder(settings.criticalRatio) {}

bool BomService::loadRecipe(const QString &tenantId, qint64 recipeId, int versionNumber,
                            RecipeVersion *version, MaterialMap *materials, BomError *error) const {
    if (!MaterialStockStore::validateTenant(tenantId, error)) return false;

    BomError err;
    *version = m_catalog.version(tenantId, recipeId, versionNumber, &err);
    if (err.isValid()) {
        if (error) *error = err;
        return false;
    }

    QVector<qint64> ids;
    for (const RecipeComponent &c : version->components()) {
        ids.append(c.materialId());
    }
    *materials = m_store.materialsByIds(tenantId, ids, &err);
    if (err.isValid()) {
        if (error) *error = err;
        return false;
    }
    return true;
}

RecipeCost BomService::getRecipeCost(const QString &tenantId, qint64 recipeId, int versionNumber,
                                     BomError *error) const {
    RecipeVersion version;
    MaterialMap materials;
    if (!loadRecipe(tenantId, recipeId, versionNumber, &version, &materials, error)) return RecipeCost();
    return CostEngine::computeRecipeCost(version, materials, error);
}

CostImpact BomService::analyzeChangeImpact(const QString &tenantId, qint64 recipeId,
                                           const RecipeComponentList &proposed, BomError *error) const {
    RecipeVersion version;
    MaterialMap materials;
    if (!loadRecipe(tenantId, recipeId, 0, &version, &materials, error)) return CostImpact();

    // proposed components may bring in materials the recipe does not use yet
    QVector<qint64> extra;
    for (const RecipeComponent &c : proposed) {
        if (!materials.contains(c.materialId())) extra.append(c.materialId());
    }
    BomError err;
    const MaterialMap more = m_store.materialsByIds(tenantId, extra, &err);
    if (err.isValid()) {
        if (error) *error = err;
        return CostImpact();
    }
    for (auto it = more.cbegin(); it != more.cend(); ++it) {
        materials.insert(it.key(), it.value());
    }
    return CostEngine::analyzeChangeImpact(version, proposed, materials, error);
}

Availability BomService::getAvailableQuantity(const QString &tenantId, qint64 recipeId,
                                              BomError *error) const {
    RecipeVersion version;
    MaterialMap materials;
    if (!loadRecipe(tenantId, recipeId, 0, &version, &materials, error)) return Availability();
    return AvailabilityCalculator::computeAvailableQuantity(version, materials, error);
}

BatchPlan BomService::planBatch(const QString &tenantId, qint64 recipeId, double targetQuantity,
                                BomError *error) const {
    RecipeVersion version;
    MaterialMap materials;
    if (!loadRecipe(tenantId, recipeId, 0, &version, &materials, error)) return BatchPlan();
    return BatchPlanner::planBatch(version, materials, targetQuantity, error);
}

BatchPlan BomService::planMultiple(const QString &tenantId,
                                  const QVector<QPair<qint64, double>> &recipeQuantities,
                                  BomError *error) const {
    if (!MaterialStockStore::validateTenant(tenantId, error)) return BatchPlan();

    QVector<ProductionTarget> targets;
    MaterialMap materials;
    for (const QPair<qint64, double> &rq : recipeQuantities) {
        ProductionTarget target;
        MaterialMap used;
        if (!loadRecipe(tenantId, rq.first, 0, &target.version, &used, error)) return BatchPlan();
        target.quantity = rq.second;
        targets.append(target);
        for (auto it = used.cbegin(); it != used.cend(); ++it) {
            materials.insert(it.key(), it.value());
        }
    }
    return BatchPlanner::planMultiple(targets, materials, error);
}

BatchSizeAdvice BomService::suggestBatchSizes(const QString &tenantId, qint64 recipeId, BomError *error) const {
    RecipeVersion version;
    MaterialMap materials;
    if (!loadRecipe(tenantId, recipeId, 0, &version, &materials, error)) return BatchSizeAdvice();
    return BatchPlanner::suggestBatchSizes(version, materials, error);
}

CapacityForecast BomService::forecastCapacity(const QString &tenantId, qint64 recipeId, int horizonDays,
                                              BomError *error) const {
    if (!MaterialStockStore::validateTenant(tenantId, error)) return CapacityForecast();

    BomError err;
    const QHash<qint64, double> rates = m_store.averageDailyConsumption(tenantId, m_settings.historyDays,
                                                                         QDateTime(), &err);
    if (err.isValid()) {
        if (error) *error = err;
        return CapacityForecast();
    }
    return forecastCapacity(tenantId, recipeId, horizonDays, rates, error);
}

CapacityForecast BomService::forecastCapacity(const QString &tenantId, qint64 recipeId, int horizonDays,
                                              const QHash<qint64, double> &dailyConsumption,
                                              BomError *error) const {
    RecipeVersion version;
    MaterialMap materials;
    if (!loadRecipe(tenantId, recipeId, 0, &version, &materials, error)) return CapacityForecast();
    return CapacityForecaster::forecastCapacity(version, materials, horizonDays, dailyConsumption, error);
}

ScanSummary BomService::scanLowStock(const QString &tenantId, const ScanOptions &options) {
    if (tenantId.isEmpty()) return m_scanner.scanAll(options);
    return m_scanner.scanTenant(tenantId, options);
}

StockAlert BomService::acknowledgeAlert(const QString &tenantId, qint64 alertId, const QString &notes,
                                        BomError *error) {
    return m_alerts.acknowledge(tenantId, alertId, notes, error);
}

StockAlert BomService::resolveAlert(const QString &tenantId, qint64 alertId, const QString &notes,
                                    BomError *error) {
    return m_alerts.resolve(tenantId, alertId, notes, error);
}

StockAlert BomService::dismissAlert(const QString &tenantId, qint64 alertId, const QString &notes,
                                    BomError *error) {
    return m_alerts.dismiss(tenantId, alertId, notes, error);
}

bool BomService::loadUsage(const QString &tenantId, QVector<Material> *materials, QHash<qint64, double> *usage,
                           BomError *error) const {
    if (!MaterialStockStore::validateTenant(tenantId, error)) return false;

    BomError err;
    *materials = m_store.materials(tenantId, false, &err);
    if (err.isValid()) {
        if (error) *error = err;
        return false;
    }
    *usage = m_store.averageDailyConsumption(tenantId, m_settings.historyDays, QDateTime(), &err);
    if (err.isValid()) {
        if (error) *error = err;
        return false;
    }
    return true;
}

ReorderReport BomService::getReorderRecommendations(const QString &tenantId, BomError *error) const {
    QVector<Material> materials;
    QHash<qint64, double> usage;
    if (!loadUsage(tenantId, &materials, &usage, error)) return ReorderReport();
    return m_reorder.generateRecommendations(tenantId, materials, usage, error);
}

PredictiveAlertList BomService::predictiveAlerts(const QString &tenantId, int forecastDays,
                                                 BomError *error) const {
    QVector<Material> materials;
    QHash<qint64, double> usage;
    if (!loadUsage(tenantId, &materials, &usage, error)) return PredictiveAlertList();
    return StockAlertEngine::predictiveAlerts(tenantId, materials, usage, forecastDays, error);
}

#ifndef BOMSERVICE_H
#define BOMSERVICE_H

#include "AvailabilityCalculator.h"
#include "BatchPlanner.h"
#include "BomSettings.h"
#include "CapacityForecaster.h"
#include "CostEngine.h"
#include "DatabaseManager.h"
#include "LowStockNotifier.h"
#include "LowStockScanner.h"
#include "MaterialStockStore.h"
#include "RecipeCatalog.h"
#include "ReorderRecommendationEngine.h"
#include "StockAlertEngine.h"

#include <QHash>
#include <QPair>
#include <QSqlDatabase>

class BomError;

// Entry point for callers: every operation takes the tenant explicitly,
// validates it first and works on that tenant's data only.
class BomService {
public:
    explicit BomService(const BomSettings &settings = BomSettings(),
                        const QSqlDatabase &db = DatabaseManager::instance().database());

    const BomSettings &settings() const { return m_settings; }
    MaterialStockStore &store() { return m_store; }
    RecipeCatalog &catalog() { return m_catalog; }
    StockAlertEngine &alertEngine() { return m_alerts; }
    LowStockNotifier &notifier() { return m_notifier; }

    // versionNumber 0 costs the active version
    RecipeCost getRecipeCost(const QString &tenantId, qint64 recipeId, int versionNumber = 0,
                             BomError *error = nullptr) const;
    CostImpact analyzeChangeImpact(const QString &tenantId, qint64 recipeId,
                                   const RecipeComponentList &proposed,
                                   BomError *error = nullptr) const;

    Availability getAvailableQuantity(const QString &tenantId, qint64 recipeId,
                                      BomError *error = nullptr) const;

    BatchPlan planBatch(const QString &tenantId, qint64 recipeId, double targetQuantity,
                        BomError *error = nullptr) const;

    // (recipe id, quantity) pairs, each recipe at its active version
    BatchPlan planMultiple(const QString &tenantId, const QVector<QPair<qint64, double>> &recipeQuantities,
                           BomError *error = nullptr) const;
    BatchSizeAdvice suggestBatchSizes(const QString &tenantId, qint64 recipeId,
                                      BomError *error = nullptr) const;

    // consumption rates from the stock history of the last historyDays
    CapacityForecast forecastCapacity(const QString &tenantId, qint64 recipeId, int horizonDays,
                                      BomError *error = nullptr) const;
    CapacityForecast forecastCapacity(const QString &tenantId, qint64 recipeId, int horizonDays,
                                      const QHash<qint64, double> &dailyConsumption,
                                      BomError *error = nullptr) const;

    // an empty tenant id scans every tenant
    ScanSummary scanLowStock(const QString &tenantId = QString(),
                             const ScanOptions &options = ScanOptions());

    StockAlert acknowledgeAlert(const QString &tenantId, qint64 alertId, const QString &notes = QString(),
                                BomError *error = nullptr);
    StockAlert resolveAlert(const QString &tenantId, qint64 alertId, const QString &notes = QString(),
                            BomError *error = nullptr);
    StockAlert dismissAlert(const QString &tenantId, qint64 alertId, const QString &notes = QString(),
                            BomError *error = nullptr);

    ReorderReport getReorderRecommendations(const QString &tenantId, BomError *error = nullptr) const;
    PredictiveAlertList predictiveAlerts(const QString &tenantId, int forecastDays,
                                         BomError *error = nullptr) const;

private:
    BomService(const BomService &) = delete;
    BomService &operator=(const BomService &) = delete;

    // active materials and their usage over historyDays
    bool loadUsage(const QString &tenantId, QVector<Material> *materials, QHash<qint64, double> *usage,
                   BomError *error) const;

    // recipe version plus the materials its components use
    bool loadRecipe(const QString &tenantId, qint64 recipeId, int versionNumber,
                    RecipeVersion *version, MaterialMap *materials, BomError *error) const;

    BomSettings m_settings;
    MaterialStockStore m_store;
    RecipeCatalog m_catalog;
    StockAlertEngine m_alerts;
    LowStockNotifier m_notifier;
    LowStockScanner m_scanner;
    ReorderRecommendationEngine m_reorder;
};

#endif // BOMSERVICE_H

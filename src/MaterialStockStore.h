#ifndef MATERIALSTOCKSTORE_H
#define MATERIALSTOCKSTORE_H

#include "DatabaseManager.h"
#include "Material.h"
#include "RecipeVersion.h"
#include "StockAdjustment.h"

#include <QDateTime>
#include <QHash>
#include <QSqlDatabase>
#include <QStringList>
#include <QVector>

class BomError;
class QSqlQuery;

// Tenant-scoped access to raw materials and their stock.
// Every stock change is written together with its audit record in one
// transaction; stock never goes below zero.
class MaterialStockStore {
public:
    explicit MaterialStockStore(const QSqlDatabase &db = DatabaseManager::instance().database());

    /// insert a new material, returns its id or 0 on failure
    qint64 createMaterial(const Material &material, BomError *error = nullptr);

    Material material(const QString &tenantId, qint64 id, BomError *error = nullptr) const;
    QVector<Material> materials(const QString &tenantId, bool includeArchived = false,
                                BomError *error = nullptr) const;
    MaterialMap materialsByIds(const QString &tenantId, const QVector<qint64> &ids,
                               BomError *error = nullptr) const;

    bool updateReorderSettings(const QString &tenantId, qint64 id, double reorderPoint,
                               double reorderQuantity, BomError *error = nullptr);
    bool updateUnitCost(const QString &tenantId, qint64 id, double unitCost, BomError *error = nullptr);

    // materials are never deleted, only archived
    bool archiveMaterial(const QString &tenantId, qint64 id, BomError *error = nullptr);

    /// every tenant owning at least one material
    QStringList tenantIds(BomError *error = nullptr) const;

    StockAdjustment adjustStock(const QString &tenantId, qint64 id,
                                StockAdjustment::Type type, double quantity,
                                StockAdjustment::Reason reason,
                                const QString &notes = QString(),
                                const QString &reference = QString(),
                                BomError *error = nullptr);

    // deduct the materials for `quantity` yield units of `version`, all or nothing
    bool consumeForProduction(const QString &tenantId, const RecipeVersion &version,
                              double quantity, const QString &reference,
                              BomError *error = nullptr);

    /// audit trail of one material, newest first
    QVector<StockAdjustment> adjustments(const QString &tenantId, qint64 materialId,
                                         BomError *error = nullptr) const;

    // average daily consumption per material over the `windowDays` before `asOf`
    QHash<qint64, double> averageDailyConsumption(const QString &tenantId, int windowDays,
                                                  const QDateTime &asOf = QDateTime(),
                                                  BomError *error = nullptr) const;

    static bool validateTenant(const QString &tenantId, BomError *error);

private:
    bool applyAdjustment(const QString &tenantId, qint64 id, StockAdjustment::Type type,
                         double quantity, StockAdjustment::Reason reason,
                         const QString &notes, const QString &reference,
                         StockAdjustment *written, BomError *error);

    static Material materialFromQuery(const QSqlQuery &query);
    static StockAdjustment adjustmentFromQuery(const QSqlQuery &query);

    QSqlDatabase m_db;
};

#endif // MATERIALSTOCKSTORE_H

#include "MaterialStockStore.h"
#include "BomError.h"
#include "BomMath.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QVariant>
#include <QDebug>

#include <cmath>

static const char *kMaterialColumns =
    "id, tenant_id, name, unit, unit_cost, current_stock, reorder_point, "
    "reorder_quantity, category, archived";

static const char *kAdjustmentColumns =
    "id, tenant_id, material_id, type, reason, quantity_change, stock_before, "
    "stock_after, notes, reference, created_at";

MaterialStockStore::MaterialStockStore(const QSqlDatabase &db)
    : m_db(db) {}

bool MaterialStockStore::validateTenant(const QString &tenantId, BomError *error) {
    if (tenantId.trimmed().isEmpty()) {
        return BomError::report(error, BomError::ConfigurationError, "tenant id is required");
    }
    return true;
}

Material MaterialStockStore::materialFromQuery(const QSqlQuery &query) {
    Material m;
    m.setId(query.value(0).toLongLong());
    m.setTenantId(query.value(1).toString());
    m.setName(query.value(2).toString());
    m.setUnit(query.value(3).toString());
    m.setUnitCost(query.value(4).toDouble());
    m.setCurrentStock(query.value(5).toDouble());
    m.setReorderPoint(query.value(6).toDouble());
    m.setReorderQuantity(query.value(7).toDouble());
    m.setCategory(query.value(8).toString());
    m.setArchived(query.value(9).toBool());
    return m;
}

StockAdjustment MaterialStockStore::adjustmentFromQuery(const QSqlQuery &query) {
    StockAdjustment a;
    a.setId(query.value(0).toLongLong());
    a.setTenantId(query.value(1).toString());
    a.setMaterialId(query.value(2).toLongLong());
    a.setType(StockAdjustment::typeFromName(query.value(3).toString()));
    a.setReason(StockAdjustment::reasonFromName(query.value(4).toString()));
    a.setQuantityChange(query.value(5).toDouble());
    a.setStockBefore(query.value(6).toDouble());
    a.setStockAfter(query.value(7).toDouble());
    a.setNotes(query.value(8).toString());
    a.setReference(query.value(9).toString());
    a.setCreatedAt(DatabaseManager::fromStorage(query.value(10)));
    return a;
}

qint64 MaterialStockStore::createMaterial(const Material &material, BomError *error) {
    if (!validateTenant(material.tenantId(), error)) return 0;
    if (material.name().trimmed().isEmpty()) {
        BomError::report(error, BomError::ConfigurationError, "material name is required");
        return 0;
    }
    if (material.unit().trimmed().isEmpty()) {
        BomError::report(error, BomError::ConfigurationError,
                         QString("material '%1' has no unit").arg(material.name()));
        return 0;
    }
    if (material.currentStock() < 0 || material.reorderPoint() < 0
        || material.reorderQuantity() < 0 || material.unitCost() < 0) {
        BomError::report(error, BomError::ConfigurationError,
                         QString("material '%1' has negative stock, reorder or cost fields")
                             .arg(material.name()));
        return 0;
    }

    QSqlQuery dup(m_db);
    dup.prepare("SELECT id FROM materials WHERE tenant_id = :tenant AND name = :name");
    dup.bindValue(":tenant", material.tenantId());
    dup.bindValue(":name", material.name());
    if (!dup.exec()) {
        DatabaseManager::reportQueryError(dup, "check material name", error);
        return 0;
    }
    if (dup.next()) {
        BomError::report(error, BomError::ConfigurationError,
                         QString("material '%1' already exists").arg(material.name()));
        return 0;
    }

    const QString now = DatabaseManager::toStorage(QDateTime::currentDateTimeUtc());
    QSqlQuery query(m_db);
    query.prepare("INSERT INTO materials(tenant_id, name, unit, unit_cost, current_stock, "
                  "reorder_point, reorder_quantity, category, archived, created_at, updated_at) "
                  "VALUES(:tenant,:name,:unit,:cost,:stock,:rp,:rq,:cat,0,:now,:now)");
    query.bindValue(":tenant", material.tenantId());
    query.bindValue(":name", material.name());
    query.bindValue(":unit", material.unit());
    query.bindValue(":cost", material.unitCost());
    query.bindValue(":stock", material.currentStock());
    query.bindValue(":rp", material.reorderPoint());
    query.bindValue(":rq", material.reorderQuantity());
    query.bindValue(":cat", material.category());
    query.bindValue(":now", now);
    if (!query.exec()) {
        DatabaseManager::reportQueryError(query, "insert material", error);
        return 0;
    }
    BomError::clear(error);
    return query.lastInsertId().toLongLong();
}

Material MaterialStockStore::material(const QString &tenantId, qint64 id, BomError *error) const {
    if (!validateTenant(tenantId, error)) return Material();

    QSqlQuery query(m_db);
    query.prepare(QString("SELECT %1 FROM materials WHERE id = :id").arg(kMaterialColumns));
    query.bindValue(":id", id);
    if (!query.exec()) {
        DatabaseManager::reportQueryError(query, "load material", error);
        return Material();
    }
    if (!query.next()) {
        BomError::report(error, BomError::NotFoundError, QString("material %1 not found").arg(id));
        return Material();
    }
    Material m = materialFromQuery(query);
    if (m.tenantId() != tenantId) {
        BomError::report(error, BomError::TenantMismatchError,
                         QString("material %1 belongs to another tenant").arg(id));
        return Material();
    }
    BomError::clear(error);
    return m;
}

QVector<Material> MaterialStockStore::materials(const QString &tenantId, bool includeArchived,
                                                BomError *error) const {
    QVector<Material> result;
    if (!validateTenant(tenantId, error)) return result;

    QSqlQuery query(m_db);
    QString sql = QString("SELECT %1 FROM materials WHERE tenant_id = :tenant").arg(kMaterialColumns);
    if (!includeArchived) sql += " AND archived = 0";
    sql += " ORDER BY id";
    query.prepare(sql);
    query.bindValue(":tenant", tenantId);
    if (!query.exec()) {
        DatabaseManager::reportQueryError(query, "list materials", error);
        return result;
    }
    while (query.next()) {
        result.append(materialFromQuery(query));
    }
    BomError::clear(error);
    return result;
}

MaterialMap MaterialStockStore::materialsByIds(const QString &tenantId, const QVector<qint64> &ids,
                                               BomError *error) const {
    MaterialMap result;
    for (qint64 id : ids) {
        if (result.contains(id)) continue;
        BomError err;
        Material m = material(tenantId, id, &err);
        if (err.isValid()) {
            if (error) *error = err;
            return MaterialMap();
        }
        result.insert(id, m);
    }
    BomError::clear(error);
    return result;
}

bool MaterialStockStore::updateReorderSettings(const QString &tenantId, qint64 id, double reorderPoint,
                                               double reorderQuantity, BomError *error) {
    if (reorderPoint < 0 || reorderQuantity < 0) {
        return BomError::report(error, BomError::ConfigurationError,
                                "reorder point and quantity must not be negative");
    }
    BomError err;
    material(tenantId, id, &err);
    if (err.isValid()) {
        if (error) *error = err;
        return false;
    }

    QSqlQuery upd(m_db);
    upd.prepare("UPDATE materials SET reorder_point = :rp, reorder_quantity = :rq, "
                "updated_at = :now WHERE id = :id AND tenant_id = :tenant");
    upd.bindValue(":rp", reorderPoint);
    upd.bindValue(":rq", reorderQuantity);
    upd.bindValue(":now", DatabaseManager::toStorage(QDateTime::currentDateTimeUtc()));
    upd.bindValue(":id", id);
    upd.bindValue(":tenant", tenantId);
    if (!upd.exec()) {
        return DatabaseManager::reportQueryError(upd, "update reorder settings", error);
    }
    BomError::clear(error);
    return true;
}

bool MaterialStockStore::updateUnitCost(const QString &tenantId, qint64 id, double unitCost,
                                        BomError *error) {
    if (unitCost < 0) {
        return BomError::report(error, BomError::ConfigurationError, "unit cost must not be negative");
    }
    BomError err;
    material(tenantId, id, &err);
    if (err.isValid()) {
        if (error) *error = err;
        return false;
    }

    QSqlQuery upd(m_db);
    upd.prepare("UPDATE materials SET unit_cost = :cost, updated_at = :now "
                "WHERE id = :id AND tenant_id = :tenant");
    upd.bindValue(":cost", unitCost);
    upd.bindValue(":now", DatabaseManager::toStorage(QDateTime::currentDateTimeUtc()));
    upd.bindValue(":id", id);
    upd.bindValue(":tenant", tenantId);
    if (!upd.exec()) {
        return DatabaseManager::reportQueryError(upd, "update unit cost", error);
    }
    BomError::clear(error);
    return true;
}

bool MaterialStockStore::archiveMaterial(const QString &tenantId, qint64 id, BomError *error) {
    BomError err;
    material(tenantId, id, &err);
    if (err.isValid()) {
        if (error) *error = err;
        return false;
    }

    QSqlQuery upd(m_db);
    upd.prepare("UPDATE materials SET archived = 1, updated_at = :now "
                "WHERE id = :id AND tenant_id = :tenant");
    upd.bindValue(":now", DatabaseManager::toStorage(QDateTime::currentDateTimeUtc()));
    upd.bindValue(":id", id);
    upd.bindValue(":tenant", tenantId);
    if (!upd.exec()) {
        return DatabaseManager::reportQueryError(upd, "archive material", error);
    }
    BomError::clear(error);
    return true;
}

QStringList MaterialStockStore::tenantIds(BomError *error) const {
    QStringList result;
    QSqlQuery query(m_db);
    if (!query.exec("SELECT DISTINCT tenant_id FROM materials ORDER BY tenant_id")) {
        DatabaseManager::reportQueryError(query, "list tenants", error);
        return result;
    }
    while (query.next()) {
        result.append(query.value(0).toString());
    }
    BomError::clear(error);
    return result;
}

bool MaterialStockStore::applyAdjustment(const QString &tenantId, qint64 id, StockAdjustment::Type type,
                                         double quantity, StockAdjustment::Reason reason,
                                         const QString &notes, const QString &reference,
                                         StockAdjustment *written, BomError *error) {
    if (!std::isfinite(quantity) || qFuzzyIsNull(quantity)) {
        return BomError::report(error, BomError::ConfigurationError,
                                "adjustment quantity must be a non-zero number");
    }

    BomError err;
    Material m = material(tenantId, id, &err);
    if (err.isValid()) {
        if (error) *error = err;
        return false;
    }

    double change = 0;
    switch (type) {
    case StockAdjustment::RestockType: change = std::fabs(quantity); break;
    case StockAdjustment::DeductionType: change = -std::fabs(quantity); break;
    case StockAdjustment::AdjustmentType: change = quantity; break;
    }

    const double before = m.currentStock();
    double after = before + change;
    if (after < -kQuantityEpsilon) {
        return BomError::report(error, BomError::InsufficientStockError,
                                QString("insufficient stock of '%1': available %2, requested %3")
                                    .arg(m.name()).arg(before).arg(std::fabs(change)));
    }
    if (after < 0) after = 0;

    const QString now = DatabaseManager::toStorage(QDateTime::currentDateTimeUtc());

    // update material stock
    QSqlQuery upd(m_db);
    upd.prepare("UPDATE materials SET current_stock = :after, updated_at = :now "
                "WHERE id = :id AND tenant_id = :tenant");
    upd.bindValue(":after", after);
    upd.bindValue(":now", now);
    upd.bindValue(":id", id);
    upd.bindValue(":tenant", tenantId);
    if (!upd.exec()) {
        return DatabaseManager::reportQueryError(upd, QString("update stock of %1").arg(m.name()), error);
    }

    // record the adjustment; a missing audit record aborts the whole change
    QSqlQuery mov(m_db);
    mov.prepare("INSERT INTO stock_adjustments(tenant_id, material_id, type, reason, quantity_change, "
                "stock_before, stock_after, notes, reference, created_at) "
                "VALUES(:tenant,:mat,:type,:reason,:change,:before,:after,:notes,:ref,:now)");
    mov.bindValue(":tenant", tenantId);
    mov.bindValue(":mat", id);
    mov.bindValue(":type", StockAdjustment::typeName(type));
    mov.bindValue(":reason", StockAdjustment::reasonName(reason));
    mov.bindValue(":change", after - before);
    mov.bindValue(":before", before);
    mov.bindValue(":after", after);
    mov.bindValue(":notes", notes);
    mov.bindValue(":ref", reference);
    mov.bindValue(":now", now);
    if (!mov.exec()) {
        return DatabaseManager::reportQueryError(mov, QString("record adjustment of %1").arg(m.name()), error);
    }

    if (written) {
        written->setId(mov.lastInsertId().toLongLong());
        written->setTenantId(tenantId);
        written->setMaterialId(id);
        written->setType(type);
        written->setReason(reason);
        written->setQuantityChange(after - before);
        written->setStockBefore(before);
        written->setStockAfter(after);
        written->setNotes(notes);
        written->setReference(reference);
        written->setCreatedAt(DatabaseManager::fromStorage(now));
    }
    return true;
}

StockAdjustment MaterialStockStore::adjustStock(const QString &tenantId, qint64 id,
                                                StockAdjustment::Type type, double quantity,
                                                StockAdjustment::Reason reason,
                                                const QString &notes, const QString &reference,
                                                BomError *error) {
    StockAdjustment written;
    SqlTransaction tx(m_db);
    if (!tx.isActive()) {
        BomError::report(error, BomError::StorageError, "could not begin stock transaction");
        return StockAdjustment();
    }
    if (!applyAdjustment(tenantId, id, type, quantity, reason, notes, reference, &written, error)) {
        return StockAdjustment();
    }
    if (!tx.commit()) {
        BomError::report(error, BomError::StorageError, "could not commit stock adjustment");
        return StockAdjustment();
    }
    BomError::clear(error);
    return written;
}

bool MaterialStockStore::consumeForProduction(const QString &tenantId, const RecipeVersion &version,
                                              double quantity, const QString &reference,
                                              BomError *error) {
    if (!validateTenant(tenantId, error)) return false;
    if (version.tenantId() != tenantId) {
        return BomError::report(error, BomError::TenantMismatchError,
                                QString("recipe version %1 belongs to another tenant").arg(version.id()));
    }
    if (!(quantity > 0)) {
        return BomError::report(error, BomError::ConfigurationError,
                                "production quantity must be positive");
    }

    SqlTransaction tx(m_db);
    if (!tx.isActive()) {
        return BomError::report(error, BomError::StorageError, "could not begin production transaction");
    }

    const RecipeComponentList components = version.components();
    for (const RecipeComponent &c : components) {
        BomError err;
        Material m = material(tenantId, c.materialId(), &err);
        if (err.isValid()) {
            if (error) *error = err;
            return false;
        }
        if (m.unit() != c.unit()) {
            return BomError::report(error, BomError::ConfigurationError,
                                    QString("component unit '%1' does not match unit '%2' of material '%3'")
                                        .arg(c.unit(), m.unit(), m.name()));
        }
        // any failure leaves the transaction uncommitted and rolls back every deduction
        if (!applyAdjustment(tenantId, c.materialId(), StockAdjustment::DeductionType,
                             c.quantityPerUnit() * quantity, StockAdjustment::Production,
                             QString(), reference, nullptr, error)) {
            return false;
        }
    }

    if (!tx.commit()) {
        return BomError::report(error, BomError::StorageError, "could not commit production consumption");
    }
    qDebug() << "Consumed materials for" << quantity << "units of recipe" << version.recipeId()
             << "version" << version.versionNumber() << "ref" << reference;
    BomError::clear(error);
    return true;
}

QVector<StockAdjustment> MaterialStockStore::adjustments(const QString &tenantId, qint64 materialId,
                                                         BomError *error) const {
    QVector<StockAdjustment> result;
    BomError err;
    material(tenantId, materialId, &err);
    if (err.isValid()) {
        if (error) *error = err;
        return result;
    }

    QSqlQuery query(m_db);
    query.prepare(QString("SELECT %1 FROM stock_adjustments WHERE tenant_id = :tenant "
                          "AND material_id = :mat ORDER BY id DESC").arg(kAdjustmentColumns));
    query.bindValue(":tenant", tenantId);
    query.bindValue(":mat", materialId);
    if (!query.exec()) {
        DatabaseManager::reportQueryError(query, "list adjustments", error);
        return result;
    }
    while (query.next()) {
        result.append(adjustmentFromQuery(query));
    }
    BomError::clear(error);
    return result;
}

QHash<qint64, double> MaterialStockStore::averageDailyConsumption(const QString &tenantId, int windowDays,
                                                                  const QDateTime &asOf,
                                                                  BomError *error) const {
    QHash<qint64, double> result;
    if (!validateTenant(tenantId, error)) return result;
    if (windowDays < 1) {
        BomError::report(error, BomError::ConfigurationError, "consumption window must be at least one day");
        return result;
    }

    const QDateTime end = asOf.isValid() ? asOf.toUTC() : QDateTime::currentDateTimeUtc();
    const QDateTime start = end.addDays(-windowDays);

    QSqlQuery query(m_db);
    query.prepare("SELECT material_id, SUM(quantity_change) FROM stock_adjustments "
                  "WHERE tenant_id = :tenant AND quantity_change < 0 "
                  "AND created_at >= :from AND created_at <= :to "
                  "GROUP BY material_id");
    query.bindValue(":tenant", tenantId);
    query.bindValue(":from", DatabaseManager::toStorage(start));
    query.bindValue(":to", DatabaseManager::toStorage(end));
    if (!query.exec()) {
        DatabaseManager::reportQueryError(query, "aggregate consumption", error);
        return result;
    }
    while (query.next()) {
        const double used = -query.value(1).toDouble();
        result.insert(query.value(0).toLongLong(), used / windowDays);
    }
    BomError::clear(error);
    return result;
}

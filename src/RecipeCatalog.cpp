#include "RecipeCatalog.h"
#include "BomError.h"
#include "MaterialStockStore.h"
#include <QSet>
#include <QSqlQuery>
#include <QSqlError>
#include <QVariant>
#include <QDebug>

#include <cmath>

RecipeCatalog::RecipeCatalog(const QSqlDatabase &db)
    : m_db(db) {}

bool RecipeCatalog::checkRecipe(const QString &tenantId, qint64 recipeId, BomError *error) const {
    if (!MaterialStockStore::validateTenant(tenantId, error)) return false;

    QSqlQuery query(m_db);
    query.prepare("SELECT tenant_id FROM recipes WHERE id = :id");
    query.bindValue(":id", recipeId);
    if (!query.exec()) {
        return DatabaseManager::reportQueryError(query, "load recipe", error);
    }
    if (!query.next()) {
        return BomError::report(error, BomError::NotFoundError, QString("recipe %1 not found").arg(recipeId));
    }
    if (query.value(0).toString() != tenantId) {
        return BomError::report(error, BomError::TenantMismatchError,
                                QString("recipe %1 belongs to another tenant").arg(recipeId));
    }
    return true;
}

bool RecipeCatalog::validateComponents(const QString &tenantId, const RecipeComponentList &components,
                                       BomError *error) const {
    MaterialStockStore store(m_db);
    QSet<qint64> seen;
    for (const RecipeComponent &c : components) {
        if (!std::isfinite(c.quantityPerUnit()) || c.quantityPerUnit() <= 0) {
            return BomError::report(error, BomError::ConfigurationError,
                                    QString("component quantity for material %1 must be positive")
                                        .arg(c.materialId()));
        }
        if (seen.contains(c.materialId())) {
            return BomError::report(error, BomError::ConfigurationError,
                                    QString("material %1 is listed twice").arg(c.materialId()));
        }
        seen.insert(c.materialId());

        BomError err;
        Material m = store.material(tenantId, c.materialId(), &err);
        if (err.isValid()) {
            if (error) *error = err;
            return false;
        }
        if (m.unit() != c.unit()) {
            return BomError::report(error, BomError::ConfigurationError,
                                    QString("component unit '%1' does not match unit '%2' of material '%3'")
                                        .arg(c.unit(), m.unit(), m.name()));
        }
    }
    return true;
}

RecipeVersion RecipeCatalog::createRecipe(const QString &tenantId, const QString &productId,
                                          const QString &name, double yieldQuantity,
                                          const QString &yieldUnit, BomError *error) {
    if (!MaterialStockStore::validateTenant(tenantId, error)) return RecipeVersion();
    if (name.trimmed().isEmpty()) {
        BomError::report(error, BomError::ConfigurationError, "recipe name is required");
        return RecipeVersion();
    }
    if (!std::isfinite(yieldQuantity) || yieldQuantity <= 0) {
        BomError::report(error, BomError::ConfigurationError, "yield quantity must be positive");
        return RecipeVersion();
    }

    const QString now = DatabaseManager::toStorage(QDateTime::currentDateTimeUtc());
    SqlTransaction tx(m_db);
    if (!tx.isActive()) {
        BomError::report(error, BomError::StorageError, "could not begin recipe transaction");
        return RecipeVersion();
    }

    QSqlQuery rec(m_db);
    rec.prepare("INSERT INTO recipes(tenant_id, product_id, name, created_at) "
                "VALUES(:tenant,:product,:name,:now)");
    rec.bindValue(":tenant", tenantId);
    rec.bindValue(":product", productId);
    rec.bindValue(":name", name);
    rec.bindValue(":now", now);
    if (!rec.exec()) {
        DatabaseManager::reportQueryError(rec, "insert recipe", error);
        return RecipeVersion();
    }
    const qint64 recipeId = rec.lastInsertId().toLongLong();

    QSqlQuery ver(m_db);
    ver.prepare("INSERT INTO recipe_versions(recipe_id, tenant_id, version, state, yield_quantity, "
                "yield_unit, created_at) VALUES(:recipe,:tenant,1,'draft',:yield,:unit,:now)");
    ver.bindValue(":recipe", recipeId);
    ver.bindValue(":tenant", tenantId);
    ver.bindValue(":yield", yieldQuantity);
    ver.bindValue(":unit", yieldUnit);
    ver.bindValue(":now", now);
    if (!ver.exec()) {
        DatabaseManager::reportQueryError(ver, "insert recipe version", error);
        return RecipeVersion();
    }
    const qint64 versionId = ver.lastInsertId().toLongLong();

    if (!tx.commit()) {
        BomError::report(error, BomError::StorageError, "could not commit new recipe");
        return RecipeVersion();
    }
    return versionById(tenantId, versionId, error);
}

RecipeVersion RecipeCatalog::editableVersion(const QString &tenantId, qint64 recipeId, BomError *error) {
    QSqlQuery newest(m_db);
    newest.prepare("SELECT id, version, state, yield_quantity, yield_unit FROM recipe_versions "
                   "WHERE recipe_id = :recipe ORDER BY version DESC LIMIT 1");
    newest.bindValue(":recipe", recipeId);
    if (!newest.exec()) {
        DatabaseManager::reportQueryError(newest, "load newest version", error);
        return RecipeVersion();
    }
    if (!newest.next()) {
        BomError::report(error, BomError::NotFoundError, QString("recipe %1 has no versions").arg(recipeId));
        return RecipeVersion();
    }

    const qint64 newestId = newest.value(0).toLongLong();
    if (RecipeVersion::stateFromName(newest.value(2).toString()) == RecipeVersion::Draft) {
        return versionById(tenantId, newestId, error);
    }

    // copy-on-write: the newest version is frozen, start the next one from it
    RecipeVersion source = versionById(tenantId, newestId, error);
    if (source.id() == 0) return RecipeVersion();

    QSqlQuery ver(m_db);
    ver.prepare("INSERT INTO recipe_versions(recipe_id, tenant_id, version, state, yield_quantity, "
                "yield_unit, created_at) VALUES(:recipe,:tenant,:version,'draft',:yield,:unit,:now)");
    ver.bindValue(":recipe", recipeId);
    ver.bindValue(":tenant", tenantId);
    ver.bindValue(":version", source.versionNumber() + 1);
    ver.bindValue(":yield", source.yieldQuantity());
    ver.bindValue(":unit", source.yieldUnit());
    ver.bindValue(":now", DatabaseManager::toStorage(QDateTime::currentDateTimeUtc()));
    if (!ver.exec()) {
        DatabaseManager::reportQueryError(ver, "insert recipe version", error);
        return RecipeVersion();
    }
    const qint64 draftId = ver.lastInsertId().toLongLong();
    if (!writeComponents(draftId, source.components(), error)) return RecipeVersion();

    qDebug() << "Recipe" << recipeId << "version" << source.versionNumber()
             << "is" << RecipeVersion::stateName(source.state())
             << "- editing continues in version" << source.versionNumber() + 1;
    return versionById(tenantId, draftId, error);
}

bool RecipeCatalog::writeComponents(qint64 versionId, const RecipeComponentList &components,
                                    BomError *error) {
    QSqlQuery del(m_db);
    del.prepare("DELETE FROM recipe_components WHERE version_id = :version");
    del.bindValue(":version", versionId);
    if (!del.exec()) {
        return DatabaseManager::reportQueryError(del, "clear components", error);
    }

    int position = 0;
    for (const RecipeComponent &c : components) {
        QSqlQuery ins(m_db);
        ins.prepare("INSERT INTO recipe_components(version_id, position, material_id, "
                    "quantity_per_unit, unit) VALUES(:version,:pos,:mat,:qty,:unit)");
        ins.bindValue(":version", versionId);
        ins.bindValue(":pos", position++);
        ins.bindValue(":mat", c.materialId());
        ins.bindValue(":qty", c.quantityPerUnit());
        ins.bindValue(":unit", c.unit());
        if (!ins.exec()) {
            return DatabaseManager::reportQueryError(ins, "insert component", error);
        }
    }
    return true;
}

RecipeVersion RecipeCatalog::setComponents(const QString &tenantId, qint64 recipeId,
                                           const RecipeComponentList &components,
                                           BomError *error) {
    if (!checkRecipe(tenantId, recipeId, error)) return RecipeVersion();
    if (!validateComponents(tenantId, components, error)) return RecipeVersion();

    SqlTransaction tx(m_db);
    if (!tx.isActive()) {
        BomError::report(error, BomError::StorageError, "could not begin recipe transaction");
        return RecipeVersion();
    }
    RecipeVersion draft = editableVersion(tenantId, recipeId, error);
    if (draft.id() == 0) return RecipeVersion();
    if (!writeComponents(draft.id(), components, error)) return RecipeVersion();
    if (!tx.commit()) {
        BomError::report(error, BomError::StorageError, "could not commit recipe components");
        return RecipeVersion();
    }
    return versionById(tenantId, draft.id(), error);
}

RecipeVersion RecipeCatalog::updateYield(const QString &tenantId, qint64 recipeId, double yieldQuantity,
                                         const QString &yieldUnit, BomError *error) {
    if (!checkRecipe(tenantId, recipeId, error)) return RecipeVersion();
    if (!std::isfinite(yieldQuantity) || yieldQuantity <= 0) {
        BomError::report(error, BomError::ConfigurationError, "yield quantity must be positive");
        return RecipeVersion();
    }

    SqlTransaction tx(m_db);
    if (!tx.isActive()) {
        BomError::report(error, BomError::StorageError, "could not begin recipe transaction");
        return RecipeVersion();
    }
    RecipeVersion draft = editableVersion(tenantId, recipeId, error);
    if (draft.id() == 0) return RecipeVersion();

    QSqlQuery upd(m_db);
    upd.prepare("UPDATE recipe_versions SET yield_quantity = :yield, yield_unit = :unit "
                "WHERE id = :id AND state = 'draft'");
    upd.bindValue(":yield", yieldQuantity);
    upd.bindValue(":unit", yieldUnit);
    upd.bindValue(":id", draft.id());
    if (!upd.exec()) {
        DatabaseManager::reportQueryError(upd, "update yield", error);
        return RecipeVersion();
    }
    if (!tx.commit()) {
        BomError::report(error, BomError::StorageError, "could not commit recipe yield");
        return RecipeVersion();
    }
    return versionById(tenantId, draft.id(), error);
}

RecipeVersion RecipeCatalog::activate(const QString &tenantId, qint64 versionId, BomError *error) {
    RecipeVersion draft = versionById(tenantId, versionId, error);
    if (draft.id() == 0) return RecipeVersion();
    if (draft.state() != RecipeVersion::Draft) {
        BomError::report(error, BomError::InvalidStateTransitionError,
                         QString("version %1 of recipe %2 is %3, only drafts can be activated")
                             .arg(draft.versionNumber()).arg(draft.recipeId())
                             .arg(RecipeVersion::stateName(draft.state())));
        return RecipeVersion();
    }

    SqlTransaction tx(m_db);
    if (!tx.isActive()) {
        BomError::report(error, BomError::StorageError, "could not begin activation transaction");
        return RecipeVersion();
    }

    QSqlQuery retire(m_db);
    retire.prepare("UPDATE recipe_versions SET state = 'archived' "
                   "WHERE recipe_id = :recipe AND state = 'active'");
    retire.bindValue(":recipe", draft.recipeId());
    if (!retire.exec()) {
        DatabaseManager::reportQueryError(retire, "archive previous version", error);
        return RecipeVersion();
    }

    QSqlQuery promote(m_db);
    promote.prepare("UPDATE recipe_versions SET state = 'active' WHERE id = :id AND state = 'draft'");
    promote.bindValue(":id", versionId);
    if (!promote.exec()) {
        DatabaseManager::reportQueryError(promote, "activate version", error);
        return RecipeVersion();
    }

    QSqlQuery pointer(m_db);
    pointer.prepare("UPDATE recipes SET active_version_id = :version WHERE id = :recipe");
    pointer.bindValue(":version", versionId);
    pointer.bindValue(":recipe", draft.recipeId());
    if (!pointer.exec()) {
        DatabaseManager::reportQueryError(pointer, "move active version pointer", error);
        return RecipeVersion();
    }

    if (!tx.commit()) {
        BomError::report(error, BomError::StorageError, "could not commit activation");
        return RecipeVersion();
    }
    qInfo() << "Recipe" << draft.recipeId() << "now uses version" << draft.versionNumber();
    return versionById(tenantId, versionId, error);
}

bool RecipeCatalog::archiveRecipe(const QString &tenantId, qint64 recipeId, BomError *error) {
    if (!checkRecipe(tenantId, recipeId, error)) return false;

    SqlTransaction tx(m_db);
    if (!tx.isActive()) {
        return BomError::report(error, BomError::StorageError, "could not begin archive transaction");
    }

    QSqlQuery retire(m_db);
    retire.prepare("UPDATE recipe_versions SET state = 'archived' "
                   "WHERE recipe_id = :recipe AND state = 'active'");
    retire.bindValue(":recipe", recipeId);
    if (!retire.exec()) {
        return DatabaseManager::reportQueryError(retire, "archive recipe", error);
    }
    if (retire.numRowsAffected() == 0) {
        return BomError::report(error, BomError::InvalidStateTransitionError,
                                QString("recipe %1 has no active version").arg(recipeId));
    }

    QSqlQuery pointer(m_db);
    pointer.prepare("UPDATE recipes SET active_version_id = NULL WHERE id = :recipe");
    pointer.bindValue(":recipe", recipeId);
    if (!pointer.exec()) {
        return DatabaseManager::reportQueryError(pointer, "clear active version pointer", error);
    }

    if (!tx.commit()) {
        return BomError::report(error, BomError::StorageError, "could not commit recipe archive");
    }
    BomError::clear(error);
    return true;
}

RecipeVersion RecipeCatalog::loadVersion(const QString &condition, const QVariantMap &binds,
                                         BomError *error) const {
    QSqlQuery query(m_db);
    query.prepare("SELECT v.id, v.recipe_id, v.tenant_id, r.product_id, r.name, v.version, v.state, "
                  "v.yield_quantity, v.yield_unit, v.created_at "
                  "FROM recipe_versions v JOIN recipes r ON r.id = v.recipe_id WHERE " + condition);
    for (auto it = binds.cbegin(); it != binds.cend(); ++it) {
        query.bindValue(it.key(), it.value());
    }
    if (!query.exec()) {
        DatabaseManager::reportQueryError(query, "load recipe version", error);
        return RecipeVersion();
    }
    if (!query.next()) {
        BomError::report(error, BomError::NotFoundError, "recipe version not found");
        return RecipeVersion();
    }

    RecipeVersion v;
    v.setId(query.value(0).toLongLong());
    v.setRecipeId(query.value(1).toLongLong());
    v.setTenantId(query.value(2).toString());
    v.setProductId(query.value(3).toString());
    v.setName(query.value(4).toString());
    v.setVersionNumber(query.value(5).toInt());
    v.setState(RecipeVersion::stateFromName(query.value(6).toString()));
    v.setYieldQuantity(query.value(7).toDouble());
    v.setYieldUnit(query.value(8).toString());
    v.setCreatedAt(DatabaseManager::fromStorage(query.value(9)));
    if (!loadComponents(v, error)) return RecipeVersion();
    return v;
}

bool RecipeCatalog::loadComponents(RecipeVersion &version, BomError *error) const {
    QSqlQuery query(m_db);
    query.prepare("SELECT position, material_id, quantity_per_unit, unit FROM recipe_components "
                  "WHERE version_id = :version ORDER BY position");
    query.bindValue(":version", version.id());
    if (!query.exec()) {
        return DatabaseManager::reportQueryError(query, "load components", error);
    }
    RecipeComponentList components;
    while (query.next()) {
        RecipeComponent c(query.value(1).toLongLong(), query.value(2).toDouble(), query.value(3).toString());
        c.setVersionId(version.id());
        c.setPosition(query.value(0).toInt());
        components.append(c);
    }
    version.setComponents(components);
    return true;
}

RecipeVersion RecipeCatalog::versionById(const QString &tenantId, qint64 versionId, BomError *error) const {
    if (!MaterialStockStore::validateTenant(tenantId, error)) return RecipeVersion();

    QVariantMap binds;
    binds.insert(":id", versionId);
    BomError err;
    RecipeVersion v = loadVersion("v.id = :id", binds, &err);
    if (err.isValid()) {
        if (err.type() == BomError::NotFoundError) {
            err = BomError(BomError::NotFoundError, QString("recipe version %1 not found").arg(versionId));
        }
        if (error) *error = err;
        return RecipeVersion();
    }
    if (v.tenantId() != tenantId) {
        BomError::report(error, BomError::TenantMismatchError,
                         QString("recipe version %1 belongs to another tenant").arg(versionId));
        return RecipeVersion();
    }
    BomError::clear(error);
    return v;
}

RecipeVersion RecipeCatalog::version(const QString &tenantId, qint64 recipeId, int versionNumber,
                                     BomError *error) const {
    if (!checkRecipe(tenantId, recipeId, error)) return RecipeVersion();

    QVariantMap binds;
    binds.insert(":recipe", recipeId);
    QString condition;
    if (versionNumber > 0) {
        condition = "v.recipe_id = :recipe AND v.version = :version";
        binds.insert(":version", versionNumber);
    } else {
        condition = "v.id = r.active_version_id AND r.id = :recipe";
    }

    BomError err;
    RecipeVersion v = loadVersion(condition, binds, &err);
    if (err.isValid()) {
        if (err.type() == BomError::NotFoundError) {
            err = versionNumber > 0
                ? BomError(BomError::NotFoundError,
                           QString("recipe %1 has no version %2").arg(recipeId).arg(versionNumber))
                : BomError(BomError::NotFoundError,
                           QString("recipe %1 has no active version").arg(recipeId));
        }
        if (error) *error = err;
        return RecipeVersion();
    }
    BomError::clear(error);
    return v;
}

QVector<RecipeVersion> RecipeCatalog::versions(const QString &tenantId, qint64 recipeId,
                                               BomError *error) const {
    QVector<RecipeVersion> result;
    if (!checkRecipe(tenantId, recipeId, error)) return result;

    QSqlQuery query(m_db);
    query.prepare("SELECT id FROM recipe_versions WHERE recipe_id = :recipe ORDER BY version");
    query.bindValue(":recipe", recipeId);
    if (!query.exec()) {
        DatabaseManager::reportQueryError(query, "list recipe versions", error);
        return result;
    }
    QVector<qint64> ids;
    while (query.next()) {
        ids.append(query.value(0).toLongLong());
    }
    for (qint64 id : ids) {
        RecipeVersion v = versionById(tenantId, id, error);
        if (v.id() == 0) return QVector<RecipeVersion>();
        result.append(v);
    }
    BomError::clear(error);
    return result;
}

RecipeVersionDiff RecipeCatalog::diffVersions(const RecipeVersion &from, const RecipeVersion &to) {
    RecipeVersionDiff diff;
    QHash<qint64, RecipeComponent> before;
    for (const RecipeComponent &c : from.components()) {
        before.insert(c.materialId(), c);
    }

    QSet<qint64> kept;
    for (const RecipeComponent &c : to.components()) {
        auto it = before.constFind(c.materialId());
        if (it == before.constEnd()) {
            diff.addedMaterials.append(c.materialId());
        } else {
            kept.insert(c.materialId());
            if (*it != c) diff.changedMaterials.append(c.materialId());
        }
    }
    for (const RecipeComponent &c : from.components()) {
        if (!kept.contains(c.materialId())) diff.removedMaterials.append(c.materialId());
    }

    diff.yieldChanged = !qFuzzyCompare(from.yieldQuantity(), to.yieldQuantity())
        || from.yieldUnit() != to.yieldUnit();
    return diff;
}

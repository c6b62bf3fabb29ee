#ifndef RECIPECATALOG_H
#define RECIPECATALOG_H

#include "DatabaseManager.h"
#include "RecipeVersion.h"

#include <QSqlDatabase>
#include <QVariantMap>
#include <QVector>

class BomError;

// Versioned recipes of one tenant.
// A recipe is a lineage of versions. Only the newest version may be a Draft
// and only a Draft is ever modified; editing anything else writes a new
// Draft (copy-on-write). activate() promotes a Draft and archives the
// previously active version.
class RecipeCatalog {
public:
    explicit RecipeCatalog(const QSqlDatabase &db = DatabaseManager::instance().database());

    /// create the lineage together with Draft version 1
    RecipeVersion createRecipe(const QString &tenantId, const QString &productId,
                               const QString &name, double yieldQuantity,
                               const QString &yieldUnit, BomError *error = nullptr);

    /// replace the component list, returns the Draft version written
    RecipeVersion setComponents(const QString &tenantId, qint64 recipeId,
                                const RecipeComponentList &components,
                                BomError *error = nullptr);

    RecipeVersion updateYield(const QString &tenantId, qint64 recipeId, double yieldQuantity,
                              const QString &yieldUnit, BomError *error = nullptr);

    /// promote a Draft version to Active
    RecipeVersion activate(const QString &tenantId, qint64 versionId, BomError *error = nullptr);

    /// archive the active version; the recipe then has no active version
    bool archiveRecipe(const QString &tenantId, qint64 recipeId, BomError *error = nullptr);

    // versionNumber 0 selects the active version
    RecipeVersion version(const QString &tenantId, qint64 recipeId, int versionNumber = 0,
                          BomError *error = nullptr) const;
    RecipeVersion versionById(const QString &tenantId, qint64 versionId,
                              BomError *error = nullptr) const;
    QVector<RecipeVersion> versions(const QString &tenantId, qint64 recipeId,
                                    BomError *error = nullptr) const;

    static RecipeVersionDiff diffVersions(const RecipeVersion &from, const RecipeVersion &to);

private:
    bool checkRecipe(const QString &tenantId, qint64 recipeId, BomError *error) const;
    bool validateComponents(const QString &tenantId, const RecipeComponentList &components,
                            BomError *error) const;
    // newest version, made a Draft first when it is not one
    RecipeVersion editableVersion(const QString &tenantId, qint64 recipeId, BomError *error);
    bool writeComponents(qint64 versionId, const RecipeComponentList &components, BomError *error);
    bool loadComponents(RecipeVersion &version, BomError *error) const;
    RecipeVersion loadVersion(const QString &condition, const QVariantMap &binds,
                              BomError *error) const;

    QSqlDatabase m_db;
};

#endif // RECIPECATALOG_H

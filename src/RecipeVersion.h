#ifndef RECIPEVERSION_H
#define RECIPEVERSION_H

#include "RecipeComponent.h"

#include <QDateTime>
#include <QString>

// Immutable snapshot of a recipe once it leaves Draft
class RecipeVersion {
public:
    enum State { Draft, Active, Archived };

    RecipeVersion();

    qint64 id() const;
    void setId(qint64 id);

    qint64 recipeId() const;
    void setRecipeId(qint64 recipeId);

    QString tenantId() const;
    void setTenantId(const QString &tenantId);

    QString productId() const;
    void setProductId(const QString &productId);

    QString name() const;
    void setName(const QString &name);

    int versionNumber() const;
    void setVersionNumber(int number);

    State state() const;
    void setState(State state);

    double yieldQuantity() const;
    void setYieldQuantity(double quantity);

    QString yieldUnit() const;
    void setYieldUnit(const QString &unit);

    QDateTime createdAt() const;
    void setCreatedAt(const QDateTime &createdAt);

    /// components in stored order
    RecipeComponentList components() const;
    void setComponents(const RecipeComponentList &components);

    bool isMutable() const { return m_state == Draft; }

    static QString stateName(State state);
    static State stateFromName(const QString &name, bool *ok = nullptr);

private:
    qint64 m_id;
    qint64 m_recipeId;
    QString m_tenantId;
    QString m_productId;
    QString m_name;
    int m_versionNumber;
    State m_state;
    double m_yieldQuantity;
    QString m_yieldUnit;
    QDateTime m_createdAt;
    RecipeComponentList m_components;
};

// Difference between two versions of the same recipe
struct RecipeVersionDiff {
    QVector<qint64> addedMaterials;
    QVector<qint64> removedMaterials;
    QVector<qint64> changedMaterials;
    bool yieldChanged = false;

    bool isEmpty() const {
        return addedMaterials.isEmpty() && removedMaterials.isEmpty()
            && changedMaterials.isEmpty() && !yieldChanged;
    }
};

#endif // RECIPEVERSION_H

#ifndef RECIPECOMPONENT_H
#define RECIPECOMPONENT_H

#include <QString>
#include <QVector>
#include <QtGlobal>

// Consumption of one material per yield unit of a recipe version
class RecipeComponent {
public:
    RecipeComponent();
    RecipeComponent(qint64 materialId, double quantityPerUnit, const QString &unit);

    qint64 versionId() const;
    void setVersionId(qint64 versionId);

    int position() const;
    void setPosition(int position);

    qint64 materialId() const;
    void setMaterialId(qint64 materialId);

    double quantityPerUnit() const;
    void setQuantityPerUnit(double quantity);

    QString unit() const;
    void setUnit(const QString &unit);

    bool operator==(const RecipeComponent &other) const;
    bool operator!=(const RecipeComponent &other) const { return !(*this == other); }

private:
    qint64 m_versionId;
    int m_position;
    qint64 m_materialId;
    double m_quantityPerUnit;
    QString m_unit;
};

typedef QVector<RecipeComponent> RecipeComponentList;

#endif // RECIPECOMPONENT_H

#ifndef MATERIAL_H
#define MATERIAL_H

#include <QHash>
#include <QString>
#include <QtGlobal>

// Represents a single raw material owned by one tenant
class Material {
public:
    Material();
    Material(const QString &tenantId, const QString &name, const QString &unit,
             double unitCost, double currentStock, double reorderPoint,
             double reorderQuantity = 0, const QString &category = QString());

    qint64 id() const;
    void setId(qint64 id);

    QString tenantId() const;
    void setTenantId(const QString &tenantId);

    QString name() const;
    void setName(const QString &name);

    QString unit() const;
    void setUnit(const QString &unit);

    double unitCost() const;
    void setUnitCost(double unitCost);

    double currentStock() const;
    void setCurrentStock(double currentStock);

    double reorderPoint() const;
    void setReorderPoint(double reorderPoint);

    double reorderQuantity() const;
    void setReorderQuantity(double reorderQuantity);

    QString category() const;
    void setCategory(const QString &category);

    bool isArchived() const;
    void setArchived(bool archived);

    /// current stock divided by reorder point, 0 when no reorder point is set
    double stockRatio() const;

    /// total value of the stock on hand
    double stockValue() const;

private:
    qint64 m_id;
    QString m_tenantId;
    QString m_name;
    QString m_unit;
    double m_unitCost;
    double m_currentStock;
    double m_reorderPoint;
    double m_reorderQuantity;
    QString m_category;
    bool m_archived;
};

// materials keyed by id, the snapshot every calculator works on
typedef QHash<qint64, Material> MaterialMap;

#endif // MATERIAL_H

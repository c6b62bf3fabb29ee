#include "Material.h"

Material::Material()
    : m_id(0), m_unitCost(0), m_currentStock(0), m_reorderPoint(0),
      m_reorderQuantity(0), m_archived(false) {}

Material::Material(const QString &tenantId, const QString &name, const QString &unit,
                   double unitCost, double currentStock, double reorderPoint,
                   double reorderQuantity, const QString &category)
    : m_id(0), m_tenantId(tenantId), m_name(name), m_unit(unit), m_unitCost(unitCost),
      m_currentStock(currentStock), m_reorderPoint(reorderPoint),
      m_reorderQuantity(reorderQuantity), m_category(category), m_archived(false) {}

qint64 Material::id() const { return m_id; }
void Material::setId(qint64 id) { m_id = id; }

QString Material::tenantId() const { return m_tenantId; }
void Material::setTenantId(const QString &tenantId) { m_tenantId = tenantId; }

QString Material::name() const { return m_name; }
void Material::setName(const QString &name) { m_name = name; }

QString Material::unit() const { return m_unit; }
void Material::setUnit(const QString &unit) { m_unit = unit; }

double Material::unitCost() const { return m_unitCost; }
void Material::setUnitCost(double unitCost) { m_unitCost = unitCost; }

double Material::currentStock() const { return m_currentStock; }
void Material::setCurrentStock(double currentStock) { m_currentStock = currentStock; }

double Material::reorderPoint() const { return m_reorderPoint; }
void Material::setReorderPoint(double reorderPoint) { m_reorderPoint = reorderPoint; }

double Material::reorderQuantity() const { return m_reorderQuantity; }
void Material::setReorderQuantity(double reorderQuantity) { m_reorderQuantity = reorderQuantity; }

QString Material::category() const { return m_category; }
void Material::setCategory(const QString &category) { m_category = category; }

bool Material::isArchived() const { return m_archived; }
void Material::setArchived(bool archived) { m_archived = archived; }

double Material::stockRatio() const {
    if (m_reorderPoint <= 0) return 0;
    return m_currentStock / m_reorderPoint;
}

double Material::stockValue() const {
    return m_currentStock * m_unitCost;
}

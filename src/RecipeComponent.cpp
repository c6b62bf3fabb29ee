#include "RecipeComponent.h"

#include <QtMath>

RecipeComponent::RecipeComponent()
    : m_versionId(0), m_position(0), m_materialId(0), m_quantityPerUnit(0) {}

RecipeComponent::RecipeComponent(qint64 materialId, double quantityPerUnit, const QString &unit)
    : m_versionId(0), m_position(0), m_materialId(materialId),
      m_quantityPerUnit(quantityPerUnit), m_unit(unit) {}

qint64 RecipeComponent::versionId() const { return m_versionId; }
void RecipeComponent::setVersionId(qint64 versionId) { m_versionId = versionId; }

int RecipeComponent::position() const { return m_position; }
void RecipeComponent::setPosition(int position) { m_position = position; }

qint64 RecipeComponent::materialId() const { return m_materialId; }
void RecipeComponent::setMaterialId(qint64 materialId) { m_materialId = materialId; }

double RecipeComponent::quantityPerUnit() const { return m_quantityPerUnit; }
void RecipeComponent::setQuantityPerUnit(double quantity) { m_quantityPerUnit = quantity; }

QString RecipeComponent::unit() const { return m_unit; }
void RecipeComponent::setUnit(const QString &unit) { m_unit = unit; }

// version and position are storage details; two components are equal when
// they consume the same amount of the same material
bool RecipeComponent::operator==(const RecipeComponent &other) const {
    return m_materialId == other.m_materialId
        && qFuzzyCompare(1.0 + m_quantityPerUnit, 1.0 + other.m_quantityPerUnit)
        && m_unit == other.m_unit;
}

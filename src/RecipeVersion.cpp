#include "RecipeVersion.h"

RecipeVersion::RecipeVersion()
    : m_id(0), m_recipeId(0), m_versionNumber(0), m_state(Draft), m_yieldQuantity(1) {}

qint64 RecipeVersion::id() const { return m_id; }
void RecipeVersion::setId(qint64 id) { m_id = id; }

qint64 RecipeVersion::recipeId() const { return m_recipeId; }
void RecipeVersion::setRecipeId(qint64 recipeId) { m_recipeId = recipeId; }

QString RecipeVersion::tenantId() const { return m_tenantId; }
void RecipeVersion::setTenantId(const QString &tenantId) { m_tenantId = tenantId; }

QString RecipeVersion::productId() const { return m_productId; }
void RecipeVersion::setProductId(const QString &productId) { m_productId = productId; }

QString RecipeVersion::name() const { return m_name; }
void RecipeVersion::setName(const QString &name) { m_name = name; }

int RecipeVersion::versionNumber() const { return m_versionNumber; }
void RecipeVersion::setVersionNumber(int number) { m_versionNumber = number; }

RecipeVersion::State RecipeVersion::state() const { return m_state; }
void RecipeVersion::setState(State state) { m_state = state; }

double RecipeVersion::yieldQuantity() const { return m_yieldQuantity; }
void RecipeVersion::setYieldQuantity(double quantity) { m_yieldQuantity = quantity; }

QString RecipeVersion::yieldUnit() const { return m_yieldUnit; }
void RecipeVersion::setYieldUnit(const QString &unit) { m_yieldUnit = unit; }

QDateTime RecipeVersion::createdAt() const { return m_createdAt; }
void RecipeVersion::setCreatedAt(const QDateTime &createdAt) { m_createdAt = createdAt; }

RecipeComponentList RecipeVersion::components() const { return m_components; }
void RecipeVersion::setComponents(const RecipeComponentList &components) { m_components = components; }

QString RecipeVersion::stateName(State state) {
    switch (state) {
    case Draft: return QStringLiteral("draft");
    case Active: return QStringLiteral("active");
    case Archived: return QStringLiteral("archived");
    }
    return QString();
}

RecipeVersion::State RecipeVersion::stateFromName(const QString &name, bool *ok) {
    if (ok) *ok = true;
    if (name == QLatin1String("draft")) return Draft;
    if (name == QLatin1String("active")) return Active;
    if (name == QLatin1String("archived")) return Archived;
    if (ok) *ok = false;
    return Draft;
}

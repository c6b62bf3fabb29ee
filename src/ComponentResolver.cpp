#include "ComponentResolver.h"
#include "BomError.h"
#include "RecipeVersion.h"

#include <cmath>

bool ComponentResolver::resolve(const RecipeVersion &version, const RecipeComponent &component,
                                const MaterialMap &materials, Material *material, BomError *error) {
    auto it = materials.constFind(component.materialId());
    if (it == materials.constEnd()) {
        return BomError::report(error, BomError::NotFoundError,
                                QString("material %1 of recipe %2 not found")
                                    .arg(component.materialId()).arg(version.recipeId()));
    }
    if (it->tenantId() != version.tenantId()) {
        return BomError::report(error, BomError::TenantMismatchError,
                                QString("material %1 belongs to another tenant").arg(component.materialId()));
    }
    if (!std::isfinite(component.quantityPerUnit()) || component.quantityPerUnit() <= 0) {
        return BomError::report(error, BomError::ConfigurationError,
                                QString("quantity of '%1' per unit must be positive, got %2")
                                    .arg(it->name()).arg(component.quantityPerUnit()));
    }
    if (component.unit() != it->unit()) {
        return BomError::report(error, BomError::ConfigurationError,
                                QString("component unit '%1' does not match unit '%2' of material '%3'")
                                    .arg(component.unit(), it->unit(), it->name()));
    }
    if (material) *material = *it;
    return true;
}

bool ComponentResolver::resolveAll(const RecipeVersion &version, const MaterialMap &materials,
                                   QVector<Material> *resolved, BomError *error) {
    const RecipeComponentList components = version.components();
    QVector<Material> out;
    out.reserve(components.size());
    for (const RecipeComponent &c : components) {
        Material m;
        if (!resolve(version, c, materials, &m, error)) return false;
        out.append(m);
    }
    if (resolved) *resolved = out;
    return true;
}

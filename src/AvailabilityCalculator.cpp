#include "AvailabilityCalculator.h"
#include "BomError.h"
#include "BomMath.h"
#include "ComponentResolver.h"

Availability AvailabilityCalculator::computeAvailableQuantity(const RecipeVersion &version,
                                                              const MaterialMap &materials,
                                                              BomError *error) {
    Availability result;
    const RecipeComponentList components = version.components();
    if (components.isEmpty()) {
        result.noComponents = true;
        BomError::clear(error);
        return result;
    }

    bool first = true;
    for (const RecipeComponent &c : components) {
        Material m;
        if (!ComponentResolver::resolve(version, c, materials, &m, error)) return Availability();

        ComponentAvailability line;
        line.materialId = m.id();
        line.materialName = m.name();
        line.currentStock = m.currentStock();
        line.quantityPerUnit = c.quantityPerUnit();
        line.maxUnits = wholeUnits(m.currentStock(), c.quantityPerUnit());
        line.sufficientForOne = line.maxUnits >= 1;
        result.components.append(line);

        // strict comparison keeps the earliest component on ties
        if (first || line.maxUnits < result.availableUnits) {
            result.availableUnits = line.maxUnits;
            result.limitingMaterialId = line.materialId;
            first = false;
        }
    }
    BomError::clear(error);
    return result;
}

#ifndef COMPONENTRESOLVER_H
#define COMPONENTRESOLVER_H

#include "Material.h"
#include "RecipeComponent.h"

class BomError;
class RecipeVersion;

// Checks a component against its material before any arithmetic runs:
// the material must be known, belong to the recipe's tenant and use exactly
// the component's unit. No unit conversion is attempted.
class ComponentResolver {
public:
    static bool resolve(const RecipeVersion &version, const RecipeComponent &component,
                        const MaterialMap &materials, Material *material, BomError *error);

    // resolve every component of `version` in stored order
    static bool resolveAll(const RecipeVersion &version, const MaterialMap &materials,
                           QVector<Material> *resolved, BomError *error);
};

#endif // COMPONENTRESOLVER_H

#ifndef AVAILABILITYCALCULATOR_H
#define AVAILABILITYCALCULATOR_H

#include "Material.h"
#include "RecipeVersion.h"

#include <QVector>

class BomError;

// ─── How far one component's stock reaches ───────────────────────────────────
struct ComponentAvailability {
    qint64  materialId      = 0;
    QString materialName;
    double  currentStock    = 0;
    double  quantityPerUnit = 0;
    qint64  maxUnits        = 0;
    bool    sufficientForOne = false;
};

// ─── Producible quantity of a recipe ─────────────────────────────────────────
struct Availability {
    qint64 availableUnits     = 0;
    qint64 limitingMaterialId = 0;      // 0 when the recipe has no components
    bool   noComponents       = false;
    QVector<ComponentAvailability> components;

    bool hasLimitingMaterial() const { return limitingMaterialId != 0; }
    bool canProduce() const { return availableUnits > 0; }
};

class AvailabilityCalculator {
public:
    // min over components of floor(stock / quantity per unit); ties go to the
    // component stored first
    static Availability computeAvailableQuantity(const RecipeVersion &version,
                                                 const MaterialMap &materials,
                                                 BomError *error = nullptr);
};

#endif // AVAILABILITYCALCULATOR_H

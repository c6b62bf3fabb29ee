#ifndef COSTENGINE_H
#define COSTENGINE_H

#include "Material.h"
#include "RecipeVersion.h"

#include <QString>
#include <QVector>

class BomError;

// ─── Cost of one component line ──────────────────────────────────────────────
struct ComponentCost {
    qint64  materialId      = 0;
    QString materialName;
    double  quantityPerUnit = 0;
    double  unitCost        = 0;
    double  lineCost        = 0;   // quantityPerUnit * unitCost
    double  share           = 0;   // lineCost / totalMaterialCost, 0..1
};

// ─── Rolled up recipe cost ───────────────────────────────────────────────────
// Amounts keep full precision; use roundMoney() when presenting them.
struct RecipeCost {
    double totalMaterialCost = 0;
    double costPerYieldUnit  = 0;
    bool   incomplete        = false;   // recipe has no components
    QVector<ComponentCost> breakdown;
};

// ─── Cost impact of a proposed component change ──────────────────────────────
struct CostImpact {
    enum Level { Minimal, Low, Moderate, High };

    double currentCost      = 0;
    double projectedCost    = 0;
    double difference       = 0;
    double percentageChange = 0;
    Level  level            = Minimal;

    static QString levelName(Level level);
};

class CostEngine {
public:
    static RecipeCost computeRecipeCost(const RecipeVersion &version, const MaterialMap &materials,
                                        BomError *error = nullptr);

    // cost of `version` after replacing (same material) or adding the proposed components
    static CostImpact analyzeChangeImpact(const RecipeVersion &version,
                                          const RecipeComponentList &proposed,
                                          const MaterialMap &materials,
                                          BomError *error = nullptr);

    static CostImpact::Level impactLevel(double percentageChange);
};

#endif // COSTENGINE_H

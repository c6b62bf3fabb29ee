#ifndef BATCHPLANNER_H
#define BATCHPLANNER_H

#include "Material.h"
#include "RecipeVersion.h"

#include <QVector>

class BomError;

// ─── What one material must supply for a batch ───────────────────────────────
struct MaterialRequirement {
    qint64  materialId       = 0;
    QString materialName;
    QString unit;
    double  requiredQuantity = 0;
    double  currentStock     = 0;
    double  shortfall        = 0;   // max(0, required - stock)
    double  unitCost         = 0;
    double  requiredCost     = 0;   // requiredQuantity * unitCost
    double  shortfallCost    = 0;   // shortfall * unitCost

    bool isSufficient() const { return shortfall <= 0; }
};

// ─── Batch plan ──────────────────────────────────────────────────────────────
struct BatchPlan {
    double targetQuantity    = 0;
    double totalMaterialCost = 0;   // cost of everything the batch consumes
    double shortfallCost     = 0;   // cost of buying what is missing
    bool   canProduce        = true;
    QVector<MaterialRequirement> requirements;   // recipe component order
};

// ─── Batch size suggestions ──────────────────────────────────────────────────
struct BatchSizeSuggestion {
    qint64 batchSize         = 0;
    double totalMaterialCost = 0;
    double costPerUnit       = 0;
    double utilisation       = 0;   // share of the producible maximum, 0..1
};

struct BatchSizeAdvice {
    qint64 maximumProducible  = 0;
    qint64 limitingMaterialId = 0;
    QVector<BatchSizeSuggestion> suggestions;   // ascending batch size
};

struct ProductionTarget {
    RecipeVersion version;
    double quantity = 0;
};

class BatchPlanner {
public:
    // linear scaling, no lot sizing
    static BatchPlan planBatch(const RecipeVersion &version, const MaterialMap &materials,
                               double targetQuantity, BomError *error = nullptr);

    // requirements summed per material over several recipes, first use decides order
    static BatchPlan planMultiple(const QVector<ProductionTarget> &targets,
                                  const MaterialMap &materials, BomError *error = nullptr);

    // standard lot sizes that current stock can cover, plus the maximum itself
    static BatchSizeAdvice suggestBatchSizes(const RecipeVersion &version, const MaterialMap &materials,
                                             BomError *error = nullptr);

private:
    static void finish(BatchPlan &plan);
};

#endif // BATCHPLANNER_H

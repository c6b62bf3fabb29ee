#include "BatchPlanner.h"
#include "AvailabilityCalculator.h"
#include "BomError.h"
#include "BomMath.h"
#include "ComponentResolver.h"

#include <QHash>
#include <cmath>

static const qint64 kStandardBatchSizes[] = {10, 25, 50, 100, 200, 500};

static bool validTarget(double quantity) {
    return std::isfinite(quantity) && quantity > 0;
}

void BatchPlanner::finish(BatchPlan &plan) {
    plan.totalMaterialCost = 0;
    plan.shortfallCost = 0;
    plan.canProduce = true;
    for (MaterialRequirement &r : plan.requirements) {
        r.shortfall = shortfallOf(r.requiredQuantity, r.currentStock);
        r.requiredCost = r.requiredQuantity * r.unitCost;
        r.shortfallCost = r.shortfall * r.unitCost;
        plan.totalMaterialCost += r.requiredCost;
        if (r.shortfall > 0) {
            plan.shortfallCost += r.shortfallCost;
            plan.canProduce = false;
        }
    }
}

BatchPlan BatchPlanner::planBatch(const RecipeVersion &version, const MaterialMap &materials,
                                  double targetQuantity, BomError *error) {
    BatchPlan plan;
    if (!validTarget(targetQuantity)) {
        BomError::report(error, BomError::ConfigurationError,
                         QString("target quantity must be positive, got %1").arg(targetQuantity));
        return plan;
    }
    plan.targetQuantity = targetQuantity;

    for (const RecipeComponent &c : version.components()) {
        Material m;
        if (!ComponentResolver::resolve(version, c, materials, &m, error)) return BatchPlan();

        MaterialRequirement r;
        r.materialId = m.id();
        r.materialName = m.name();
        r.unit = m.unit();
        r.requiredQuantity = c.quantityPerUnit() * targetQuantity;
        r.currentStock = m.currentStock();
        r.unitCost = m.unitCost();
        plan.requirements.append(r);
    }
    finish(plan);
    BomError::clear(error);
    return plan;
}

BatchPlan BatchPlanner::planMultiple(const QVector<ProductionTarget> &targets,
                                     const MaterialMap &materials, BomError *error) {
    BatchPlan plan;
    QHash<qint64, int> index;
    for (const ProductionTarget &t : targets) {
        if (!validTarget(t.quantity)) {
            BomError::report(error, BomError::ConfigurationError,
                             QString("target quantity for recipe %1 must be positive")
                                 .arg(t.version.recipeId()));
            return BatchPlan();
        }
        plan.targetQuantity += t.quantity;

        for (const RecipeComponent &c : t.version.components()) {
            Material m;
            if (!ComponentResolver::resolve(t.version, c, materials, &m, error)) return BatchPlan();

            auto it = index.constFind(m.id());
            if (it == index.constEnd()) {
                MaterialRequirement r;
                r.materialId = m.id();
                r.materialName = m.name();
                r.unit = m.unit();
                r.currentStock = m.currentStock();
                r.unitCost = m.unitCost();
                index.insert(m.id(), plan.requirements.size());
                plan.requirements.append(r);
                it = index.constFind(m.id());
            }
            plan.requirements[*it].requiredQuantity += c.quantityPerUnit() * t.quantity;
        }
    }
    finish(plan);
    BomError::clear(error);
    return plan;
}

BatchSizeAdvice BatchPlanner::suggestBatchSizes(const RecipeVersion &version, const MaterialMap &materials,
                                                BomError *error) {
    BatchSizeAdvice advice;
    BomError err;
    const Availability availability = AvailabilityCalculator::computeAvailableQuantity(version, materials, &err);
    if (err.isValid()) {
        if (error) *error = err;
        return advice;
    }
    advice.maximumProducible = availability.availableUnits;
    advice.limitingMaterialId = availability.limitingMaterialId;

    QVector<qint64> sizes;
    for (qint64 size : kStandardBatchSizes) {
        if (size <= advice.maximumProducible) sizes.append(size);
    }
    if (advice.maximumProducible > 0 && !sizes.contains(advice.maximumProducible)) {
        sizes.append(advice.maximumProducible);
    }

    for (qint64 size : sizes) {
        const BatchPlan plan = planBatch(version, materials, static_cast<double>(size), &err);
        if (err.isValid()) {
            if (error) *error = err;
            return BatchSizeAdvice();
        }
        BatchSizeSuggestion suggestion;
        suggestion.batchSize = size;
        suggestion.totalMaterialCost = plan.totalMaterialCost;
        suggestion.costPerUnit = plan.totalMaterialCost / size;
        suggestion.utilisation = static_cast<double>(size) / advice.maximumProducible;
        advice.suggestions.append(suggestion);
    }
    BomError::clear(error);
    return advice;
}

#include "CostEngine.h"
#include "BomError.h"
#include "ComponentResolver.h"

#include <QHash>
#include <cmath>

QString CostImpact::levelName(Level level) {
    switch (level) {
    case Minimal: return QStringLiteral("Minimal");
    case Low: return QStringLiteral("Low");
    case Moderate: return QStringLiteral("Moderate");
    case High: return QStringLiteral("High");
    }
    return QString();
}

RecipeCost CostEngine::computeRecipeCost(const RecipeVersion &version, const MaterialMap &materials,
                                         BomError *error) {
    RecipeCost cost;
    if (!(version.yieldQuantity() > 0)) {
        BomError::report(error, BomError::ConfigurationError,
                         QString("recipe %1 has a non-positive yield").arg(version.recipeId()));
        return cost;
    }

    const RecipeComponentList components = version.components();
    if (components.isEmpty()) {
        cost.incomplete = true;
        BomError::clear(error);
        return cost;
    }

    for (const RecipeComponent &c : components) {
        Material m;
        if (!ComponentResolver::resolve(version, c, materials, &m, error)) return RecipeCost();

        ComponentCost line;
        line.materialId = m.id();
        line.materialName = m.name();
        line.quantityPerUnit = c.quantityPerUnit();
        line.unitCost = m.unitCost();
        line.lineCost = c.quantityPerUnit() * m.unitCost();
        cost.totalMaterialCost += line.lineCost;
        cost.breakdown.append(line);
    }

    for (ComponentCost &line : cost.breakdown) {
        line.share = cost.totalMaterialCost > 0 ? line.lineCost / cost.totalMaterialCost : 0;
    }
    cost.costPerYieldUnit = cost.totalMaterialCost / version.yieldQuantity();
    BomError::clear(error);
    return cost;
}

CostImpact::Level CostEngine::impactLevel(double percentageChange) {
    const double magnitude = std::fabs(percentageChange);
    if (magnitude > 20) return CostImpact::High;
    if (magnitude > 10) return CostImpact::Moderate;
    if (magnitude > 5) return CostImpact::Low;
    return CostImpact::Minimal;
}

CostImpact CostEngine::analyzeChangeImpact(const RecipeVersion &version,
                                           const RecipeComponentList &proposed,
                                           const MaterialMap &materials, BomError *error) {
    CostImpact impact;
    BomError err;
    RecipeCost current = computeRecipeCost(version, materials, &err);
    if (err.isValid()) {
        if (error) *error = err;
        return impact;
    }

    // apply proposals over the stored order, appending new materials at the end
    RecipeComponentList merged = version.components();
    QHash<qint64, int> index;
    for (int i = 0; i < merged.size(); ++i) index.insert(merged[i].materialId(), i);
    for (const RecipeComponent &c : proposed) {
        auto it = index.constFind(c.materialId());
        if (it != index.constEnd()) {
            merged[*it] = c;
        } else {
            index.insert(c.materialId(), merged.size());
            merged.append(c);
        }
    }

    RecipeVersion projected = version;
    projected.setComponents(merged);
    RecipeCost after = computeRecipeCost(projected, materials, &err);
    if (err.isValid()) {
        if (error) *error = err;
        return impact;
    }

    impact.currentCost = current.totalMaterialCost;
    impact.projectedCost = after.totalMaterialCost;
    impact.difference = after.totalMaterialCost - current.totalMaterialCost;
    impact.percentageChange = current.totalMaterialCost > 0
        ? impact.difference / current.totalMaterialCost * 100.0 : 0;
    impact.level = impactLevel(impact.percentageChange);
    BomError::clear(error);
    return impact;
}

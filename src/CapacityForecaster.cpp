#include "CapacityForecaster.h"
#include "AvailabilityCalculator.h"
#include "BomError.h"
#include "ComponentResolver.h"

#include <cmath>

CapacityForecast::CapacityForecast()
    : m_horizonDays(0), m_day(0), m_exhausted(true) {}

bool CapacityForecast::hasNext() const {
    return !m_exhausted && m_day <= m_horizonDays;
}

CapacitySnapshot CapacityForecast::next() {
    CapacitySnapshot snapshot;
    if (!hasNext()) return snapshot;

    // project only the materials the recipe consumes
    MaterialMap projected;
    for (const RecipeComponent &c : m_version.components()) {
        Material m = m_materials.value(c.materialId());
        const double used = m_dailyConsumption.value(c.materialId(), 0.0) * m_day;
        m.setCurrentStock(qMax(0.0, m.currentStock() - used));
        projected.insert(m.id(), m);
    }

    // components were validated when the forecast was built
    Availability availability = AvailabilityCalculator::computeAvailableQuantity(m_version, projected);
    snapshot.day = static_cast<int>(m_day);
    snapshot.availableUnits = availability.availableUnits;
    snapshot.limitingMaterialId = availability.limitingMaterialId;

    ++m_day;
    if (snapshot.availableUnits == 0) m_exhausted = true;
    return snapshot;
}

void CapacityForecast::reset() {
    m_day = 0;
    m_exhausted = false;
}

QVector<CapacitySnapshot> CapacityForecast::remaining() {
    QVector<CapacitySnapshot> result;
    while (hasNext()) {
        result.append(next());
    }
    return result;
}

CapacityForecast CapacityForecaster::forecastCapacity(const RecipeVersion &version,
                                                      const MaterialMap &materials,
                                                      int horizonDays,
                                                      const QHash<qint64, double> &dailyConsumption,
                                                      BomError *error) {
    if (horizonDays < 0) {
        BomError::report(error, BomError::ConfigurationError,
                         QString("forecast horizon must not be negative, got %1").arg(horizonDays));
        return CapacityForecast();
    }
    if (horizonDays > kMaxForecastHorizonDays) {
        BomError::report(error, BomError::ConfigurationError,
                         QString("forecast horizon of %1 days exceeds the limit of %2")
                             .arg(horizonDays).arg(kMaxForecastHorizonDays));
        return CapacityForecast();
    }
    for (auto it = dailyConsumption.cbegin(); it != dailyConsumption.cend(); ++it) {
        if (!std::isfinite(it.value()) || it.value() < 0) {
            BomError::report(error, BomError::ConfigurationError,
                             QString("daily consumption of material %1 must not be negative").arg(it.key()));
            return CapacityForecast();
        }
    }
    if (!ComponentResolver::resolveAll(version, materials, nullptr, error)) return CapacityForecast();

    CapacityForecast forecast;
    forecast.m_version = version;
    forecast.m_materials = materials;
    forecast.m_dailyConsumption = dailyConsumption;
    forecast.m_horizonDays = horizonDays;
    forecast.reset();
    BomError::clear(error);
    return forecast;
}

#ifndef CAPACITYFORECASTER_H
#define CAPACITYFORECASTER_H

#include "Material.h"
#include "RecipeVersion.h"

#include <QHash>
#include <QVector>

class BomError;

// longest forecast accepted, ten years of days
constexpr int kMaxForecastHorizonDays = 3650;

struct CapacitySnapshot {
    int    day                = -1;
    qint64 availableUnits     = 0;
    qint64 limitingMaterialId = 0;
};

// Lazy day-by-day capacity projection.
// Each call to next() computes one day from the starting stock; the sequence
// ends after the first day without capacity or after the horizon day.
// reset() restarts it from day 0.
class CapacityForecast {
public:
    CapacityForecast();

    bool hasNext() const;
    CapacitySnapshot next();
    void reset();

    int horizonDays() const { return m_horizonDays; }

    /// all remaining snapshots
    QVector<CapacitySnapshot> remaining();

private:
    friend class CapacityForecaster;

    RecipeVersion m_version;
    MaterialMap m_materials;
    QHash<qint64, double> m_dailyConsumption;
    int m_horizonDays;
    qint64 m_day;
    bool m_exhausted;
};

class CapacityForecaster {
public:
    static CapacityForecast forecastCapacity(const RecipeVersion &version,
                                             const MaterialMap &materials,
                                             int horizonDays,
                                             const QHash<qint64, double> &dailyConsumption,
                                             BomError *error = nullptr);
};

#endif // CAPACITYFORECASTER_H

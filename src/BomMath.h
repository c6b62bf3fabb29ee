#ifndef BOMMATH_H
#define BOMMATH_H

#include <QtGlobal>
#include <cmath>
#include <limits>

// Quantities are stored as doubles; anything closer than this is the same amount
constexpr double kQuantityEpsilon = 1e-9;

// whole yield units coverable by `stock` at `perUnit` each
inline qint64 wholeUnits(double stock, double perUnit) {
    if (perUnit <= 0 || stock <= 0) return 0;
    const double ratio = stock / perUnit;
    if (ratio >= double(std::numeric_limits<qint64>::max())) return std::numeric_limits<qint64>::max();
    return qint64(std::floor(ratio + kQuantityEpsilon));
}

// required minus available, never negative and free of rounding noise
inline double shortfallOf(double required, double available) {
    const double gap = required - available;
    return gap > kQuantityEpsilon ? gap : 0.0;
}

// presentation rounding, two decimals half away from zero
inline double roundMoney(double amount) {
    return std::round(amount * 100.0) / 100.0;
}

#endif // BOMMATH_H

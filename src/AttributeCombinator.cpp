#include "AttributeCombinator.h"

AttributeCombinator::AttributeCombinator(const QVector<ProductAttribute> &attributes,
                                         int maxCombinations)
    : m_attributes(attributes),
      m_indices(attributes.size(), 0),
      m_maxCombinations(qMax(0, maxCombinations)),
      m_total(0),
      m_produced(0) {
    if (m_attributes.isEmpty()) return;

    // saturating product of the value counts
    qint64 total = 1;
    for (const ProductAttribute &a : m_attributes) {
        total *= a.values.size();
        if (total == 0) break;
        if (total >= m_maxCombinations) {
            total = m_maxCombinations;
            break;
        }
    }
    m_total = int(qMin<qint64>(total, m_maxCombinations));
}

bool AttributeCombinator::hasNext() const {
    return m_produced < m_total;
}

AttributeCombination AttributeCombinator::next() {
    AttributeCombination combination;
    if (!hasNext()) return combination;

    for (int i = 0; i < m_attributes.size(); ++i) {
        combination.append(qMakePair(m_attributes[i].name, m_attributes[i].values.at(m_indices[i])));
    }
    ++m_produced;

    // advance the odometer
    for (int i = m_attributes.size() - 1; i >= 0; --i) {
        if (++m_indices[i] < m_attributes[i].values.size()) break;
        m_indices[i] = 0;
    }
    return combination;
}

void AttributeCombinator::reset() {
    m_indices.fill(0);
    m_produced = 0;
}

QVector<AttributeCombination> AttributeCombinator::all() {
    reset();
    QVector<AttributeCombination> result;
    while (hasNext()) {
        result.append(next());
    }
    return result;
}

#ifndef ATTRIBUTECOMBINATOR_H
#define ATTRIBUTECOMBINATOR_H

#include <QPair>
#include <QString>
#include <QStringList>
#include <QVector>

// A product attribute such as "size" with its ordered values
struct ProductAttribute {
    QString name;
    QStringList values;
};

// (attribute name, value) for every attribute, in attribute order
typedef QVector<QPair<QString, QString>> AttributeCombination;

// Odometer over attribute values: the last attribute varies fastest.
// Stops after maxCombinations results even if more exist.
class AttributeCombinator {
public:
    explicit AttributeCombinator(const QVector<ProductAttribute> &attributes,
                                 int maxCombinations = 1000);

    bool hasNext() const;
    AttributeCombination next();
    void reset();

    /// number of combinations iteration will yield, at most maxCombinations
    int total() const { return m_total; }
    int maxCombinations() const { return m_maxCombinations; }

    QVector<AttributeCombination> all();

private:
    QVector<ProductAttribute> m_attributes;
    QVector<int> m_indices;
    int m_maxCombinations;
    int m_total;
    int m_produced;
};

#endif // ATTRIBUTECOMBINATOR_H

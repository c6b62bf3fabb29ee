#include "StockAdjustment.h"

StockAdjustment::StockAdjustment()
    : m_id(0), m_materialId(0), m_type(AdjustmentType), m_reason(Other),
      m_quantityChange(0), m_stockBefore(0), m_stockAfter(0) {}

qint64 StockAdjustment::id() const { return m_id; }
void StockAdjustment::setId(qint64 id) { m_id = id; }

QString StockAdjustment::tenantId() const { return m_tenantId; }
void StockAdjustment::setTenantId(const QString &tenantId) { m_tenantId = tenantId; }

qint64 StockAdjustment::materialId() const { return m_materialId; }
void StockAdjustment::setMaterialId(qint64 materialId) { m_materialId = materialId; }

StockAdjustment::Type StockAdjustment::type() const { return m_type; }
void StockAdjustment::setType(Type type) { m_type = type; }

StockAdjustment::Reason StockAdjustment::reason() const { return m_reason; }
void StockAdjustment::setReason(Reason reason) { m_reason = reason; }

double StockAdjustment::quantityChange() const { return m_quantityChange; }
void StockAdjustment::setQuantityChange(double change) { m_quantityChange = change; }

double StockAdjustment::stockBefore() const { return m_stockBefore; }
void StockAdjustment::setStockBefore(double stock) { m_stockBefore = stock; }

double StockAdjustment::stockAfter() const { return m_stockAfter; }
void StockAdjustment::setStockAfter(double stock) { m_stockAfter = stock; }

QString StockAdjustment::notes() const { return m_notes; }
void StockAdjustment::setNotes(const QString &notes) { m_notes = notes; }

QString StockAdjustment::reference() const { return m_reference; }
void StockAdjustment::setReference(const QString &reference) { m_reference = reference; }

QDateTime StockAdjustment::createdAt() const { return m_createdAt; }
void StockAdjustment::setCreatedAt(const QDateTime &createdAt) { m_createdAt = createdAt; }

QString StockAdjustment::typeName(Type type) {
    switch (type) {
    case RestockType: return QStringLiteral("restock");
    case DeductionType: return QStringLiteral("deduction");
    case AdjustmentType: return QStringLiteral("adjustment");
    }
    return QString();
}

StockAdjustment::Type StockAdjustment::typeFromName(const QString &name, bool *ok) {
    if (ok) *ok = true;
    if (name == QLatin1String("restock")) return RestockType;
    if (name == QLatin1String("deduction")) return DeductionType;
    if (name == QLatin1String("adjustment")) return AdjustmentType;
    if (ok) *ok = false;
    return AdjustmentType;
}

QString StockAdjustment::reasonName(Reason reason) {
    switch (reason) {
    case Purchase: return QStringLiteral("purchase");
    case Waste: return QStringLiteral("waste");
    case Damage: return QStringLiteral("damage");
    case CountAdjustment: return QStringLiteral("count_adjustment");
    case Production: return QStringLiteral("production");
    case Sale: return QStringLiteral("sale");
    case Other: return QStringLiteral("other");
    }
    return QString();
}

StockAdjustment::Reason StockAdjustment::reasonFromName(const QString &name, bool *ok) {
    static const Reason all[] = { Purchase, Waste, Damage, CountAdjustment, Production, Sale, Other };
    if (ok) *ok = true;
    for (Reason r : all) {
        if (reasonName(r) == name) return r;
    }
    if (ok) *ok = false;
    return Other;
}

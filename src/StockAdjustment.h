#ifndef STOCKADJUSTMENT_H
#define STOCKADJUSTMENT_H

#include <QDateTime>
#include <QString>

// Audit record written together with every stock change
class StockAdjustment {
public:
    enum Type { RestockType, DeductionType, AdjustmentType };
    enum Reason { Purchase, Waste, Damage, CountAdjustment, Production, Sale, Other };

    StockAdjustment();

    qint64 id() const;
    void setId(qint64 id);

    QString tenantId() const;
    void setTenantId(const QString &tenantId);

    qint64 materialId() const;
    void setMaterialId(qint64 materialId);

    Type type() const;
    void setType(Type type);

    Reason reason() const;
    void setReason(Reason reason);

    /// signed change applied to the stock
    double quantityChange() const;
    void setQuantityChange(double change);

    double stockBefore() const;
    void setStockBefore(double stock);

    double stockAfter() const;
    void setStockAfter(double stock);

    QString notes() const;
    void setNotes(const QString &notes);

    QString reference() const;
    void setReference(const QString &reference);

    QDateTime createdAt() const;
    void setCreatedAt(const QDateTime &createdAt);

    static QString typeName(Type type);
    static Type typeFromName(const QString &name, bool *ok = nullptr);
    static QString reasonName(Reason reason);
    static Reason reasonFromName(const QString &name, bool *ok = nullptr);

private:
    qint64 m_id;
    QString m_tenantId;
    qint64 m_materialId;
    Type m_type;
    Reason m_reason;
    double m_quantityChange;
    double m_stockBefore;
    double m_stockAfter;
    QString m_notes;
    QString m_reference;
    QDateTime m_createdAt;
};

#endif // STOCKADJUSTMENT_H

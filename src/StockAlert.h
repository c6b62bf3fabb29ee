#ifndef STOCKALERT_H
#define STOCKALERT_H

#include <QDateTime>
#include <QMetaType>
#include <QString>
#include <QVector>

// Low stock alert for one material of one tenant
class StockAlert {
public:
    // Healthy is a classification only, never stored on an alert
    enum Severity { Healthy, Low, Critical, OutOfStock };
    enum Status { Pending, Acknowledged, Resolved, Dismissed };

    StockAlert();

    qint64 id() const;
    void setId(qint64 id);

    QString tenantId() const;
    void setTenantId(const QString &tenantId);

    qint64 materialId() const;
    void setMaterialId(qint64 materialId);

    double currentStock() const;
    void setCurrentStock(double stock);

    double reorderPoint() const;
    void setReorderPoint(double reorderPoint);

    Severity severity() const;
    void setSeverity(Severity severity);

    Status status() const;
    void setStatus(Status status);

    bool isNotified() const;
    QDateTime notifiedAt() const;
    void setNotifiedAt(const QDateTime &at);

    QString acknowledgedNotes() const;
    QDateTime acknowledgedAt() const;
    void setAcknowledged(const QDateTime &at, const QString &notes);

    QString resolvedNotes() const;
    QDateTime resolvedAt() const;
    void setResolved(const QDateTime &at, const QString &notes);

    QString dismissedNotes() const;
    QDateTime dismissedAt() const;
    void setDismissed(const QDateTime &at, const QString &notes);

    QDateTime createdAt() const;
    void setCreatedAt(const QDateTime &at);

    QDateTime updatedAt() const;
    void setUpdatedAt(const QDateTime &at);

    /// pending or acknowledged
    bool isOpen() const;
    static bool isOpen(Status status);

    static QString severityName(Severity severity);
    static Severity severityFromName(const QString &name, bool *ok = nullptr);
    static QString statusName(Status status);
    static Status statusFromName(const QString &name, bool *ok = nullptr);

private:
    qint64 m_id;
    QString m_tenantId;
    qint64 m_materialId;
    double m_currentStock;
    double m_reorderPoint;
    Severity m_severity;
    Status m_status;
    QDateTime m_notifiedAt;
    QString m_acknowledgedNotes;
    QDateTime m_acknowledgedAt;
    QString m_resolvedNotes;
    QDateTime m_resolvedAt;
    QString m_dismissedNotes;
    QDateTime m_dismissedAt;
    QDateTime m_createdAt;
    QDateTime m_updatedAt;
};

typedef QVector<StockAlert> StockAlertList;

Q_DECLARE_METATYPE(StockAlert)

#endif // STOCKALERT_H

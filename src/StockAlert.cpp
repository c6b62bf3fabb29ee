#include "StockAlert.h"

StockAlert::StockAlert()
    : m_id(0), m_materialId(0), m_currentStock(0), m_reorderPoint(0),
      m_severity(Low), m_status(Pending) {}

qint64 StockAlert::id() const { return m_id; }
void StockAlert::setId(qint64 id) { m_id = id; }

QString StockAlert::tenantId() const { return m_tenantId; }
void StockAlert::setTenantId(const QString &tenantId) { m_tenantId = tenantId; }

qint64 StockAlert::materialId() const { return m_materialId; }
void StockAlert::setMaterialId(qint64 materialId) { m_materialId = materialId; }

double StockAlert::currentStock() const { return m_currentStock; }
void StockAlert::setCurrentStock(double stock) { m_currentStock = stock; }

double StockAlert::reorderPoint() const { return m_reorderPoint; }
void StockAlert::setReorderPoint(double reorderPoint) { m_reorderPoint = reorderPoint; }

StockAlert::Severity StockAlert::severity() const { return m_severity; }
void StockAlert::setSeverity(Severity severity) { m_severity = severity; }

StockAlert::Status StockAlert::status() const { return m_status; }
void StockAlert::setStatus(Status status) { m_status = status; }

bool StockAlert::isNotified() const { return m_notifiedAt.isValid(); }
QDateTime StockAlert::notifiedAt() const { return m_notifiedAt; }
void StockAlert::setNotifiedAt(const QDateTime &at) { m_notifiedAt = at; }

QString StockAlert::acknowledgedNotes() const { return m_acknowledgedNotes; }
QDateTime StockAlert::acknowledgedAt() const { return m_acknowledgedAt; }
void StockAlert::setAcknowledged(const QDateTime &at, const QString &notes) {
    m_acknowledgedAt = at;
    m_acknowledgedNotes = notes;
}

QString StockAlert::resolvedNotes() const { return m_resolvedNotes; }
QDateTime StockAlert::resolvedAt() const { return m_resolvedAt; }
void StockAlert::setResolved(const QDateTime &at, const QString &notes) {
    m_resolvedAt = at;
    m_resolvedNotes = notes;
}

QString StockAlert::dismissedNotes() const { return m_dismissedNotes; }
QDateTime StockAlert::dismissedAt() const { return m_dismissedAt; }
void StockAlert::setDismissed(const QDateTime &at, const QString &notes) {
    m_dismissedAt = at;
    m_dismissedNotes = notes;
}

QDateTime StockAlert::createdAt() const { return m_createdAt; }
void StockAlert::setCreatedAt(const QDateTime &at) { m_createdAt = at; }

QDateTime StockAlert::updatedAt() const { return m_updatedAt; }
void StockAlert::setUpdatedAt(const QDateTime &at) { m_updatedAt = at; }

bool StockAlert::isOpen() const {
    return isOpen(m_status);
}

bool StockAlert::isOpen(Status status) {
    return status == Pending || status == Acknowledged;
}

QString StockAlert::severityName(Severity severity) {
    switch (severity) {
    case Healthy: return QStringLiteral("healthy");
    case Low: return QStringLiteral("low");
    case Critical: return QStringLiteral("critical");
    case OutOfStock: return QStringLiteral("out_of_stock");
    }
    return QString();
}

StockAlert::Severity StockAlert::severityFromName(const QString &name, bool *ok) {
    if (ok) *ok = true;
    if (name == QLatin1String("healthy")) return Healthy;
    if (name == QLatin1String("low")) return Low;
    if (name == QLatin1String("critical")) return Critical;
    if (name == QLatin1String("out_of_stock")) return OutOfStock;
    if (ok) *ok = false;
    return Low;
}

QString StockAlert::statusName(Status status) {
    switch (status) {
    case Pending: return QStringLiteral("pending");
    case Acknowledged: return QStringLiteral("acknowledged");
    case Resolved: return QStringLiteral("resolved");
    case Dismissed: return QStringLiteral("dismissed");
    }
    return QString();
}

StockAlert::Status StockAlert::statusFromName(const QString &name, bool *ok) {
    if (ok) *ok = true;
    if (name == QLatin1String("pending")) return Pending;
    if (name == QLatin1String("acknowledged")) return Acknowledged;
    if (name == QLatin1String("resolved")) return Resolved;
    if (name == QLatin1String("dismissed")) return Dismissed;
    if (ok) *ok = false;
    return Pending;
}

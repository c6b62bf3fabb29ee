#include "LowStockNotifier.h"

#include <QDebug>
#include <algorithm>

QString LowStockNotification::summary() const {
    QString text = QString("%1 low stock alert(s) for tenant %2").arg(totalCount).arg(tenantId);
    if (isTruncated()) {
        text += QString(", showing %1").arg(alerts.size());
    }
    return text;
}

LowStockNotifier::LowStockNotifier(int limit, QObject *parent)
    : QObject(parent), m_limit(1) {
    setLimit(limit);
}

void LowStockNotifier::setLimit(int limit) {
    m_limit = qMax(1, limit);
}

LowStockNotification LowStockNotifier::notify(const QString &tenantId, const StockAlertList &alerts) {
    LowStockNotification notification;
    notification.tenantId = tenantId;
    notification.totalCount = alerts.size();
    notification.createdAt = QDateTime::currentDateTimeUtc();
    if (alerts.isEmpty()) return notification;

    StockAlertList sorted = alerts;
    std::stable_sort(sorted.begin(), sorted.end(), [](const StockAlert &a, const StockAlert &b) {
        return a.severity() > b.severity();
    });
    notification.alerts = sorted.mid(0, m_limit);

    qInfo() << notification.summary();
    emit notificationReady(notification);
    return notification;
}

#ifndef LOWSTOCKNOTIFIER_H
#define LOWSTOCKNOTIFIER_H

#include "StockAlert.h"

#include <QDateTime>
#include <QMetaType>
#include <QObject>
#include <QString>

// One message per tenant and scan; delivery is up to whoever listens
struct LowStockNotification {
    QString        tenantId;
    StockAlertList alerts;          // most severe first, at most the notifier's limit
    int            totalCount = 0;  // alerts that triggered the notification
    QDateTime      createdAt;

    bool isTruncated() const { return totalCount > alerts.size(); }
    QString summary() const;
};

Q_DECLARE_METATYPE(LowStockNotification)

class LowStockNotifier : public QObject {
    Q_OBJECT
public:
    explicit LowStockNotifier(int limit = 10, QObject *parent = nullptr);

    int limit() const { return m_limit; }
    void setLimit(int limit);

    // build and emit the notification; returns it so the caller can
    // record which alerts went out
    LowStockNotification notify(const QString &tenantId, const StockAlertList &alerts);

signals:
    void notificationReady(const LowStockNotification &notification);

private:
    int m_limit;
};

#endif // LOWSTOCKNOTIFIER_H

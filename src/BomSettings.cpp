#include "BomSettings.h"
#include "CapacityForecaster.h"
#include <QSettings>
#include <QFileInfo>
#include <QDebug>

BomSettings BomSettings::load(const QString &fileName) {
    if (!QFileInfo::exists(fileName)) {
        qInfo() << "Settings file" << fileName << "not found, using defaults";
        return BomSettings();
    }
    QSettings settings(fileName, QSettings::IniFormat);
    return fromSettings(settings);
}

BomSettings BomSettings::fromSettings(QSettings &settings) {
    BomSettings s;
    s.databasePath = settings.value("database/path", s.databasePath).toString();
    s.criticalRatio = settings.value("alerts/criticalRatio", s.criticalRatio).toDouble();
    s.notificationLimit = settings.value("alerts/notificationLimit", s.notificationLimit).toInt();
    s.historyDays = settings.value("forecast/historyDays", s.historyDays).toInt();
    s.forecastHorizonDays = settings.value("forecast/horizonDays", s.forecastHorizonDays).toInt();

    if (s.criticalRatio < 0.0 || s.criticalRatio > 1.0) {
        qWarning() << "alerts/criticalRatio out of range:" << s.criticalRatio << "- clamped";
        s.criticalRatio = qBound(0.0, s.criticalRatio, 1.0);
    }
    if (s.notificationLimit < 1) {
        qWarning() << "alerts/notificationLimit must be positive, using 1";
        s.notificationLimit = 1;
    }
    if (s.historyDays < 1) {
        qWarning() << "forecast/historyDays must be positive, using 1";
        s.historyDays = 1;
    }
    if (s.forecastHorizonDays < 0) {
        qWarning() << "forecast/horizonDays must not be negative, using 0";
        s.forecastHorizonDays = 0;
    }
    if (s.forecastHorizonDays > kMaxForecastHorizonDays) {
        qWarning() << "forecast/horizonDays exceeds" << kMaxForecastHorizonDays << ", using the limit";
        s.forecastHorizonDays = kMaxForecastHorizonDays;
    }
    return s;
}

void BomSettings::save(QSettings &settings) const {
    settings.setValue("database/path", databasePath);
    settings.setValue("alerts/criticalRatio", criticalRatio);
    settings.setValue("alerts/notificationLimit", notificationLimit);
    settings.setValue("forecast/historyDays", historyDays);
    settings.setValue("forecast/horizonDays", forecastHorizonDays);
}

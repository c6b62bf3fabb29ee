#ifndef BOMSETTINGS_H
#define BOMSETTINGS_H

#include <QString>

class QSettings;

// Tunables of the engine, read from an INI file
struct BomSettings {
    QString databasePath        = QStringLiteral("bomengine.sqlite");
    double  criticalRatio       = 0.5;   // share of reorder point below which stock is critical
    int     notificationLimit   = 10;    // alerts carried in one notification payload
    int     historyDays         = 30;    // consumption window for velocity
    int     forecastHorizonDays = 14;

    static BomSettings load(const QString &fileName);
    static BomSettings fromSettings(QSettings &settings);
    void save(QSettings &settings) const;
};

#endif // BOMSETTINGS_H

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>

#include "AttributeCombinator.h"
#include "BomError.h"
#include "BomMath.h"
#include "BomService.h"
#include "BomSettings.h"
#include "DatabaseManager.h"

static QTextStream &out() {
    static QTextStream stream(stdout);
    return stream;
}

static int fail(const BomError &error) {
    QTextStream(stderr) << BomError::typeName(error.type()) << ": " << error.text() << Qt::endl;
    return 1;
}

static int usageError(const QString &message) {
    QTextStream(stderr) << message << Qt::endl;
    return 1;
}

static void printAlert(const StockAlert &a) {
    out() << "alert " << a.id() << "  material " << a.materialId()
          << "  " << StockAlert::severityName(a.severity())
          << "  " << StockAlert::statusName(a.status())
          << "  stock " << a.currentStock() << " / " << a.reorderPoint()
          << (a.isNotified() ? "  notified" : "") << Qt::endl;
}

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("bomctl");
    app.setApplicationVersion("1.0");

    qRegisterMetaType<StockAlert>("StockAlert");
    qRegisterMetaType<LowStockNotification>("LowStockNotification");

    QCommandLineParser parser;
    parser.setApplicationDescription("Recipe costing, production capacity and low stock alerts");
    parser.addHelpOption();
    parser.addPositionalArgument("command",
        "scan | cost | available | plan | batches | forecast | reorder | predict | materials"
        " | ack | resolve | dismiss | alerts | variants");

    QCommandLineOption configOpt("config", "INI settings file.", "file", "bomengine.ini");
    QCommandLineOption dbOpt("db", "SQLite database, overrides database/path.", "file");
    QCommandLineOption tenantOpt("tenant", "Tenant id.", "id");
    QCommandLineOption recipeOpt("recipe", "Recipe id, repeat with --quantity to plan several.", "id");
    QCommandLineOption versionOpt("version", "Recipe version, active when omitted.", "n", "0");
    QCommandLineOption quantityOpt("quantity", "Target yield quantity.", "qty");
    QCommandLineOption daysOpt("days", "Forecast horizon or stockout window in days.", "n");
    QCommandLineOption alertOpt("alert", "Alert id.", "id");
    QCommandLineOption notesOpt("notes", "Notes stored with an alert transition.", "text");
    QCommandLineOption dryRunOpt("dry-run", "Classify without writing.");
    QCommandLineOption notifyOpt("notify", "Emit a notification per tenant with new alerts.");
    QCommandLineOption attributeOpt("attribute", "Variant attribute as name=v1,v2,...; repeatable.", "spec");
    parser.addOptions({configOpt, dbOpt, tenantOpt, recipeOpt, versionOpt, quantityOpt, daysOpt,
                       alertOpt, notesOpt, dryRunOpt, notifyOpt, attributeOpt});

    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        parser.showHelp(1);
    }
    const QString command = args.first();

    if (command == "variants") {
        QVector<ProductAttribute> attributes;
        for (const QString &spec : parser.values(attributeOpt)) {
            const int eq = spec.indexOf('=');
            if (eq <= 0) return usageError(QString("--attribute '%1' must look like name=v1,v2").arg(spec));
            ProductAttribute attribute;
            attribute.name = spec.left(eq);
            attribute.values = spec.mid(eq + 1).split(',', Qt::SkipEmptyParts);
            attributes.append(attribute);
        }
        AttributeCombinator combinator(attributes);
        while (combinator.hasNext()) {
            QStringList parts;
            for (const QPair<QString, QString> &av : combinator.next()) {
                parts << av.first + "=" + av.second;
            }
            out() << parts.join("  ") << Qt::endl;
        }
        out() << combinator.total() << " variants" << Qt::endl;
        return 0;
    }

    BomSettings settings = BomSettings::load(parser.value(configOpt));
    if (parser.isSet(dbOpt)) settings.databasePath = parser.value(dbOpt);

    if (!DatabaseManager::instance().open(settings.databasePath)) {
        return usageError(QString("cannot open database %1").arg(settings.databasePath));
    }

    BomService service(settings);
    QObject::connect(&service.notifier(), &LowStockNotifier::notificationReady,
                     [](const LowStockNotification &n) {
        out() << "notify: " << n.summary() << Qt::endl;
        for (const StockAlert &a : n.alerts) {
            out() << "  ";
            printAlert(a);
        }
    });

    const QString tenant = parser.value(tenantOpt);
    const qint64 recipeId = parser.value(recipeOpt).toLongLong();
    BomError error;

    if (command == "scan") {
        ScanOptions options;
        options.dryRun = parser.isSet(dryRunOpt);
        options.notify = parser.isSet(notifyOpt);
        const ScanSummary s = service.scanLowStock(tenant, options);
        out() << "tenants " << s.tenantsProcessed << " (failed " << s.tenantsFailed << ")"
              << "  materials " << s.materialsChecked
              << "  created " << s.alertsCreated
              << "  updated " << s.alertsUpdated
              << "  skipped " << s.alertsSkipped
              << "  failures " << s.failures << Qt::endl;
        for (const QString &e : s.errors) {
            QTextStream(stderr) << e << Qt::endl;
        }
        return s.hasFailures() ? 2 : 0;
    }

    if (tenant.isEmpty()) return usageError("--tenant is required");

    if (command == "cost") {
        const RecipeCost cost = service.getRecipeCost(tenant, recipeId,
                                                      parser.value(versionOpt).toInt(), &error);
        if (error.isValid()) return fail(error);
        out() << "total material cost " << roundMoney(cost.totalMaterialCost)
              << "  per unit " << roundMoney(cost.costPerYieldUnit)
              << (cost.incomplete ? "  (no components)" : "") << Qt::endl;
        for (const ComponentCost &c : cost.breakdown) {
            out() << "  " << c.materialName << "  " << c.quantityPerUnit << " x " << c.unitCost
                  << " = " << roundMoney(c.lineCost)
                  << "  " << QString::number(c.share * 100, 'f', 1) << "%" << Qt::endl;
        }
        return 0;
    }

    if (command == "available") {
        const Availability a = service.getAvailableQuantity(tenant, recipeId, &error);
        if (error.isValid()) return fail(error);
        out() << "available units " << a.availableUnits;
        if (a.hasLimitingMaterial()) out() << "  limited by material " << a.limitingMaterialId;
        out() << Qt::endl;
        return 0;
    }

    if (command == "plan") {
        const QStringList recipes = parser.values(recipeOpt);
        const QStringList quantities = parser.values(quantityOpt);
        if (recipes.size() != quantities.size()) {
            return usageError("give one --quantity per --recipe");
        }
        QVector<QPair<qint64, double>> targets;
        for (int i = 0; i < recipes.size(); ++i) {
            bool ok = false;
            const double quantity = quantities.at(i).toDouble(&ok);
            if (!ok) return usageError("--quantity must be a number");
            targets.append(qMakePair(recipes.at(i).toLongLong(), quantity));
        }
        if (targets.isEmpty()) return usageError("--recipe and --quantity are required");
        const BatchPlan plan = targets.size() == 1
            ? service.planBatch(tenant, targets.first().first, targets.first().second, &error)
            : service.planMultiple(tenant, targets, &error);
        if (error.isValid()) return fail(error);
        out() << "batch of " << plan.targetQuantity
              << "  material cost " << roundMoney(plan.totalMaterialCost)
              << "  shortfall cost " << roundMoney(plan.shortfallCost)
              << (plan.canProduce ? "  producible" : "  short") << Qt::endl;
        for (const MaterialRequirement &r : plan.requirements) {
            out() << "  " << r.materialName << "  need " << r.requiredQuantity << " " << r.unit
                  << "  have " << r.currentStock << "  short " << r.shortfall << Qt::endl;
        }
        return 0;
    }

    if (command == "batches") {
        const BatchSizeAdvice advice = service.suggestBatchSizes(tenant, recipeId, &error);
        if (error.isValid()) return fail(error);
        out() << "at most " << advice.maximumProducible << " units";
        if (advice.limitingMaterialId) out() << "  limited by material " << advice.limitingMaterialId;
        out() << Qt::endl;
        for (const BatchSizeSuggestion &b : advice.suggestions) {
            out() << "  batch " << b.batchSize << "  cost " << roundMoney(b.totalMaterialCost)
                  << "  per unit " << roundMoney(b.costPerUnit)
                  << "  uses " << QString::number(b.utilisation * 100, 'f', 1) << "%" << Qt::endl;
        }
        return 0;
    }

    bool daysOk = true;
    const int days = parser.isSet(daysOpt) ? parser.value(daysOpt).toInt(&daysOk)
                                           : settings.forecastHorizonDays;
    if (!daysOk) return usageError("--days must be a whole number");

    if (command == "forecast") {
        CapacityForecast forecast = service.forecastCapacity(tenant, recipeId, days, &error);
        if (error.isValid()) return fail(error);
        while (forecast.hasNext()) {
            const CapacitySnapshot s = forecast.next();
            out() << "day " << s.day << "  units " << s.availableUnits;
            if (s.limitingMaterialId) out() << "  limited by material " << s.limitingMaterialId;
            out() << Qt::endl;
        }
        return 0;
    }

    if (command == "reorder") {
        const ReorderReport report = service.getReorderRecommendations(tenant, &error);
        if (error.isValid()) return fail(error);
        for (const ReorderRecommendation &r : report.recommendations) {
            out() << ReorderRecommendation::priorityName(r.priority) << "  " << r.materialName
                  << "  stock " << r.currentStock << " / " << r.reorderPoint
                  << "  order " << r.suggestedQuantity << " " << r.unit
                  << "  cost " << roundMoney(r.estimatedCost);
            if (r.hasUsage && r.daysUntilStockout >= 0) {
                out() << "  stockout in " << QString::number(r.daysUntilStockout, 'f', 1) << " days";
            }
            out() << Qt::endl;
        }
        out() << "total " << roundMoney(report.totalEstimatedCost) << Qt::endl;
        return 0;
    }

    if (command == "predict") {
        const PredictiveAlertList alerts = service.predictiveAlerts(tenant, days, &error);
        if (error.isValid()) return fail(error);
        for (const PredictiveAlert &a : alerts) {
            out() << PredictiveAlert::severityName(a.severity) << "  " << a.materialName
                  << "  stock " << a.currentStock << " " << a.unit
                  << "  uses " << QString::number(a.averageDailyUsage, 'f', 3) << "/day"
                  << "  out in " << QString::number(a.daysUntilStockout, 'f', 1) << " days"
                  << "  order " << QString::number(a.reorderQuantity, 'f', 2) << Qt::endl;
        }
        return 0;
    }

    if (command == "materials") {
        const QVector<Material> materials = service.store().materials(tenant, false, &error);
        if (error.isValid()) return fail(error);
        double total = 0;
        for (const Material &m : materials) {
            out() << m.id() << "  " << m.name() << "  " << m.currentStock() << " " << m.unit()
                  << " x " << m.unitCost() << " = " << roundMoney(m.stockValue())
                  << "  reorder at " << m.reorderPoint() << Qt::endl;
            total += m.stockValue();
        }
        out() << "stock value " << roundMoney(total) << Qt::endl;
        return 0;
    }

    if (command == "ack" || command == "resolve" || command == "dismiss") {
        bool ok = false;
        const qint64 alertId = parser.value(alertOpt).toLongLong(&ok);
        if (!ok) return usageError("--alert is required");
        const QString notes = parser.value(notesOpt);
        StockAlert alert;
        if (command == "ack") alert = service.acknowledgeAlert(tenant, alertId, notes, &error);
        else if (command == "resolve") alert = service.resolveAlert(tenant, alertId, notes, &error);
        else alert = service.dismissAlert(tenant, alertId, notes, &error);
        if (error.isValid()) return fail(error);
        printAlert(alert);
        return 0;
    }

    if (command == "alerts") {
        const StockAlertList list = service.alertEngine().alerts(tenant, {}, &error);
        if (error.isValid()) return fail(error);
        for (const StockAlert &a : list) {
            printAlert(a);
        }
        return 0;
    }

    return usageError(QString("unknown command '%1'").arg(command));
}

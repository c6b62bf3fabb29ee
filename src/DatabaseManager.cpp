#include "DatabaseManager.h"
#include "BomError.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QVariant>
#include <QDebug>

DatabaseManager::DatabaseManager() {
}

DatabaseManager::~DatabaseManager() {
    close();
}

DatabaseManager &DatabaseManager::instance() {
    static DatabaseManager mgr;
    return mgr;
}

bool DatabaseManager::open(const QString &fileName) {
    if (m_db.isOpen()) return true;
    m_db = QSqlDatabase::addDatabase("QSQLITE");
    m_db.setDatabaseName(fileName);
    // concurrent scans on the same file wait instead of failing with SQLITE_BUSY
    m_db.setConnectOptions("QSQLITE_BUSY_TIMEOUT=5000");
    if (!m_db.open()) {
        qWarning() << "Failed to open database:" << m_db.lastError().text();
        return false;
    }
    QSqlQuery pragma(m_db);
    if (!pragma.exec("PRAGMA foreign_keys = ON")) {
        qWarning() << "Failed to enable foreign keys:" << pragma.lastError().text();
    }
    // ensure tables exist
    return createSchema();
}

bool DatabaseManager::createSchema() {
    if (!m_db.isOpen()) return false;
    QSqlQuery query(m_db);
    const char *sql[] = {
        // Materials and their audit trail
        "CREATE TABLE IF NOT EXISTS materials("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "tenant_id TEXT NOT NULL,"
        "name TEXT NOT NULL,"
        "unit TEXT NOT NULL,"
        "unit_cost REAL NOT NULL DEFAULT 0,"
        "current_stock REAL NOT NULL DEFAULT 0 CHECK(current_stock >= 0),"
        "reorder_point REAL NOT NULL DEFAULT 0,"
        "reorder_quantity REAL NOT NULL DEFAULT 0,"
        "category TEXT,"
        "archived INTEGER NOT NULL DEFAULT 0,"
        "created_at TEXT,"
        "updated_at TEXT,"
        "UNIQUE(tenant_id, name))",

        "CREATE TABLE IF NOT EXISTS stock_adjustments("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "tenant_id TEXT NOT NULL,"
        "material_id INTEGER NOT NULL REFERENCES materials(id),"
        "type TEXT NOT NULL,"
        "reason TEXT NOT NULL,"
        "quantity_change REAL NOT NULL,"
        "stock_before REAL NOT NULL,"
        "stock_after REAL NOT NULL,"
        "notes TEXT,"
        "reference TEXT,"
        "created_at TEXT NOT NULL)",

        // Recipes: lineage, immutable versions, ordered components
        "CREATE TABLE IF NOT EXISTS recipes("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "tenant_id TEXT NOT NULL,"
        "product_id TEXT,"
        "name TEXT NOT NULL,"
        "active_version_id INTEGER,"
        "created_at TEXT)",

        "CREATE TABLE IF NOT EXISTS recipe_versions("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "recipe_id INTEGER NOT NULL REFERENCES recipes(id),"
        "tenant_id TEXT NOT NULL,"
        "version INTEGER NOT NULL,"
        "state TEXT NOT NULL,"
        "yield_quantity REAL NOT NULL CHECK(yield_quantity > 0),"
        "yield_unit TEXT,"
        "created_at TEXT,"
        "UNIQUE(recipe_id, version))",

        "CREATE TABLE IF NOT EXISTS recipe_components("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "version_id INTEGER NOT NULL REFERENCES recipe_versions(id) ON DELETE CASCADE,"
        "position INTEGER NOT NULL,"
        "material_id INTEGER NOT NULL REFERENCES materials(id),"
        "quantity_per_unit REAL NOT NULL CHECK(quantity_per_unit > 0),"
        "unit TEXT NOT NULL,"
        "UNIQUE(version_id, material_id))",

        // Stock alerts
        "CREATE TABLE IF NOT EXISTS stock_alerts("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "tenant_id TEXT NOT NULL,"
        "material_id INTEGER NOT NULL REFERENCES materials(id),"
        "current_stock REAL NOT NULL,"
        "reorder_point REAL NOT NULL,"
        "severity TEXT NOT NULL,"
        "status TEXT NOT NULL DEFAULT 'pending',"
        "notified INTEGER NOT NULL DEFAULT 0,"
        "notified_at TEXT,"
        "acknowledged_at TEXT,"
        "acknowledged_notes TEXT,"
        "resolved_at TEXT,"
        "resolved_notes TEXT,"
        "dismissed_at TEXT,"
        "dismissed_notes TEXT,"
        "created_at TEXT NOT NULL,"
        "updated_at TEXT NOT NULL)",

        "CREATE INDEX IF NOT EXISTS idx_materials_tenant ON materials(tenant_id, archived)",
        "CREATE INDEX IF NOT EXISTS idx_adjustments_material ON stock_adjustments(tenant_id, material_id, created_at)",
        "CREATE INDEX IF NOT EXISTS idx_components_version ON recipe_components(version_id, position)",
        // at most one active version per recipe
        "CREATE UNIQUE INDEX IF NOT EXISTS idx_versions_one_active ON recipe_versions(recipe_id) "
        "WHERE state = 'active'",
        "CREATE INDEX IF NOT EXISTS idx_alerts_tenant_status ON stock_alerts(tenant_id, status)",
        // at most one open alert per (tenant, material); detect() relies on it
        "CREATE UNIQUE INDEX IF NOT EXISTS idx_alerts_open_material ON stock_alerts(tenant_id, material_id) "
        "WHERE status IN ('pending', 'acknowledged')"
    };

    for (auto stmt : sql) {
        if (!query.exec(stmt)) {
            qWarning() << "Schema creation failed:" << query.lastError().text();
            return false;
        }
    }
    return true;
}

void DatabaseManager::close() {
    if (!m_db.isValid()) return;
    const QString name = m_db.connectionName();
    if (m_db.isOpen()) {
        m_db.close();
    }
    m_db = QSqlDatabase();
    QSqlDatabase::removeDatabase(name);
}

bool DatabaseManager::isOpen() const {
    return m_db.isOpen();
}

QSqlDatabase DatabaseManager::database() const {
    return m_db;
}

bool DatabaseManager::reportQueryError(const QSqlQuery &query, const QString &what, BomError *error) {
    const QString text = query.lastError().text();
    qWarning() << "Failed to" << what << ":" << text;
    return BomError::report(error, BomError::StorageError, QString("%1: %2").arg(what, text));
}

QString DatabaseManager::toStorage(const QDateTime &at) {
    if (!at.isValid()) return QString();
    return at.toUTC().toString(Qt::ISODateWithMs);
}

QDateTime DatabaseManager::fromStorage(const QVariant &value) {
    if (value.isNull()) return QDateTime();
    const QString text = value.toString();
    if (text.isEmpty()) return QDateTime();
    return QDateTime::fromString(text, Qt::ISODateWithMs).toUTC();
}

SqlTransaction::SqlTransaction(QSqlDatabase db)
    : m_db(db), m_active(false) {
    m_active = m_db.transaction();
    if (!m_active) {
        qWarning() << "Failed to begin transaction:" << m_db.lastError().text();
    }
}

SqlTransaction::~SqlTransaction() {
    rollback();
}

bool SqlTransaction::commit() {
    if (!m_active) return false;
    if (!m_db.commit()) {
        qWarning() << "Failed to commit transaction:" << m_db.lastError().text();
        rollback();
        return false;
    }
    m_active = false;
    return true;
}

void SqlTransaction::rollback() {
    if (!m_active) return;
    if (!m_db.rollback()) {
        qWarning() << "Failed to roll back transaction:" << m_db.lastError().text();
    }
    m_active = false;
}

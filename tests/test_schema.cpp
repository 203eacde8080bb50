#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <sqlite3.h>

#include "common/errors.hpp"
#include "store/credential_store.hpp"
#include "store/noura_database.hpp"
#include "store/schema_migrator.hpp"
#include "store/settings_store.hpp"
#include "store/sqlite_helpers.hpp"

namespace {

int64_t countRows(sqlite3 *db, const char *sql)
{
    noura::sqlite::Statement stmt(db, sql);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return -1;
    }
    return sqlite3_column_int64(stmt.get(), 0);
}

// Layout written by the first desktop release: no stock, discount,
// settings or admin tables and no recorded schema version.
void writeLegacyStore(const std::string &path)
{
    sqlite3 *db = nullptr;
    QCOMPARE(sqlite3_open(path.c_str(), &db), SQLITE_OK);
    noura::sqlite::execOrThrow(db,
        "CREATE TABLE customers (id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT NOT NULL,"
        " email TEXT, phone TEXT, address TEXT, tax_number TEXT, created_at DATETIME);"
        "CREATE TABLE products (id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT NOT NULL,"
        " description TEXT, unit_price REAL NOT NULL, unit TEXT, created_at DATETIME);"
        "CREATE TABLE invoices (id INTEGER PRIMARY KEY AUTOINCREMENT,"
        " invoice_number TEXT UNIQUE NOT NULL, customer_id INTEGER, invoice_date DATE,"
        " due_date DATE, total_amount REAL, status TEXT, created_at DATETIME);"
        "CREATE TABLE invoice_items (id INTEGER PRIMARY KEY AUTOINCREMENT, invoice_id INTEGER,"
        " product_id INTEGER, description TEXT, quantity REAL, unit_price REAL,"
        " line_total REAL);"
        "INSERT INTO products (name, unit_price, unit) VALUES ('Legacy Lamp', 12.5, 'pcs');");
    sqlite3_close(db);
}

} // namespace

class SchemaTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testFreshDatabaseAtLatestVersion();
    void testReopenIsIdempotent();
    void testLegacyStoreMigrates();
    void testNewerSchemaRejected();
    void testForeignKeysEnabled();

private:
    std::string dbPath(const char *name) const;

    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void SchemaTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void SchemaTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

std::string SchemaTests::dbPath(const char *name) const
{
    return (m_tempDir.path() + QLatin1Char('/') + QString::fromLatin1(name)).toStdString();
}

void SchemaTests::testFreshDatabaseAtLatestVersion()
{
    noura::NouraDatabase database(dbPath("fresh/noura.db"));
    QCOMPARE(database.schemaVersion(), noura::NouraDatabase::latestSchemaVersion());
    QCOMPARE(noura::NouraDatabase::latestSchemaVersion(), 7);

    sqlite3 *db = database.handle();
    QVERIFY(noura::sqlite::tableExists(db, "customers"));
    QVERIFY(noura::sqlite::tableExists(db, "products"));
    QVERIFY(noura::sqlite::tableExists(db, "invoices"));
    QVERIFY(noura::sqlite::tableExists(db, "invoice_items"));
    QVERIFY(noura::sqlite::tableExists(db, "settings"));
    QVERIFY(noura::sqlite::tableExists(db, "admin_users"));
    QVERIFY(noura::sqlite::columnExists(db, "products", "stock"));
    QVERIFY(noura::sqlite::columnExists(db, "products", "sale_price"));
    QVERIFY(noura::sqlite::columnExists(db, "invoice_items", "discount"));
    QVERIFY(noura::sqlite::columnExists(db, "settings", "max_discount"));
}

void SchemaTests::testReopenIsIdempotent()
{
    const std::string path = dbPath("reopen.db");
    std::string firstSchema;
    {
        noura::NouraDatabase database(path);
        noura::SettingsStore settings(database);
        noura::CredentialStore credentials(database);
        firstSchema = database.schemaSql();
    }

    noura::NouraDatabase database(path);
    QCOMPARE(noura::SchemaMigrator(database.handle()).migrate(), 0);

    noura::SettingsStore settings(database);
    noura::CredentialStore credentials(database);
    QVERIFY(!settings.ensureRow());
    QVERIFY(!credentials.ensureDefaultAdmin());

    QCOMPARE(QString::fromStdString(database.schemaSql()), QString::fromStdString(firstSchema));
    QCOMPARE(countRows(database.handle(), "SELECT COUNT(*) FROM settings;"), static_cast<int64_t>(1));
    QCOMPARE(countRows(database.handle(), "SELECT COUNT(*) FROM admin_users;"), static_cast<int64_t>(1));
}

void SchemaTests::testLegacyStoreMigrates()
{
    const std::string path = dbPath("legacy.db");
    writeLegacyStore(path);

    noura::NouraDatabase database(path);
    QCOMPARE(database.schemaVersion(), 7);

    noura::sqlite::Statement stmt(database.handle(),
                                  "SELECT name, unit_price, sale_price, stock FROM products;");
    QCOMPARE(sqlite3_step(stmt.get()), SQLITE_ROW);
    QCOMPARE(QString::fromStdString(noura::sqlite::columnText(stmt.get(), 0)),
             QStringLiteral("Legacy Lamp"));
    QCOMPARE(sqlite3_column_double(stmt.get(), 2), 12.5);
    QCOMPARE(sqlite3_column_int64(stmt.get(), 3), static_cast<sqlite3_int64>(0));
}

void SchemaTests::testNewerSchemaRejected()
{
    const std::string path = dbPath("future.db");
    {
        sqlite3 *db = nullptr;
        QCOMPARE(sqlite3_open(path.c_str(), &db), SQLITE_OK);
        noura::sqlite::execOrThrow(db, "PRAGMA user_version = 99;");
        sqlite3_close(db);
    }

    QVERIFY_EXCEPTION_THROWN(noura::NouraDatabase database(path), noura::StorageError);
}

void SchemaTests::testForeignKeysEnabled()
{
    noura::NouraDatabase database(dbPath("fk.db"));
    QCOMPARE(countRows(database.handle(), "PRAGMA foreign_keys;"), static_cast<int64_t>(1));
}

QTEST_MAIN(SchemaTests)
#include "test_schema.moc"

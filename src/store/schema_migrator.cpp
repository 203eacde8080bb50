#include "store/schema_migrator.hpp"

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "store/sqlite_helpers.hpp"

namespace noura {

namespace {

constexpr const char *kCreateCustomersTable =
    "CREATE TABLE IF NOT EXISTS customers ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    name TEXT NOT NULL,"
    "    email TEXT,"
    "    phone TEXT,"
    "    address TEXT,"
    "    tax_number TEXT,"
    "    created_at DATETIME"
    ");";

constexpr const char *kCreateProductsTable =
    "CREATE TABLE IF NOT EXISTS products ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    name TEXT NOT NULL,"
    "    description TEXT,"
    "    unit_price REAL NOT NULL,"
    "    unit TEXT,"
    "    created_at DATETIME"
    ");";

constexpr const char *kCreateInvoicesTable =
    "CREATE TABLE IF NOT EXISTS invoices ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    invoice_number TEXT UNIQUE NOT NULL,"
    "    customer_id INTEGER,"
    "    invoice_date DATE,"
    "    due_date DATE,"
    "    total_amount REAL,"
    "    status TEXT,"
    "    created_at DATETIME,"
    "    FOREIGN KEY(customer_id) REFERENCES customers(id)"
    ");";

constexpr const char *kCreateInvoiceItemsTable =
    "CREATE TABLE IF NOT EXISTS invoice_items ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    invoice_id INTEGER,"
    "    product_id INTEGER,"
    "    description TEXT,"
    "    quantity REAL,"
    "    unit_price REAL,"
    "    line_total REAL,"
    "    FOREIGN KEY(invoice_id) REFERENCES invoices(id) ON DELETE CASCADE,"
    "    FOREIGN KEY(product_id) REFERENCES products(id)"
    ");";

constexpr const char *kCreateSettingsTable =
    "CREATE TABLE IF NOT EXISTS settings ("
    "    id INTEGER PRIMARY KEY CHECK (id = 1),"
    "    company_name TEXT,"
    "    company_phone TEXT,"
    "    company_address TEXT,"
    "    default_currency TEXT,"
    "    theme TEXT,"
    "    language TEXT"
    ");";

constexpr const char *kCreateAdminUsersTable =
    "CREATE TABLE IF NOT EXISTS admin_users ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    username TEXT UNIQUE NOT NULL,"
    "    password_hash TEXT NOT NULL,"
    "    license_key TEXT NOT NULL,"
    "    active INTEGER NOT NULL DEFAULT 1,"
    "    created_at DATETIME"
    ");";

// Stores created by older releases may already carry a column without a
// recorded schema version, so every ALTER is guarded.
void addColumnIfMissing(sqlite3 *db,
                        const std::string &table,
                        const std::string &column,
                        const std::string &definition)
{
    if (sqlite::columnExists(db, table, column)) {
        return;
    }
    const std::string sql =
        "ALTER TABLE " + table + " ADD COLUMN " + column + " " + definition + ";";
    sqlite::execOrThrow(db, sql.c_str());
}

std::vector<MigrationStep> buildSteps()
{
    std::vector<MigrationStep> steps;

    steps.push_back({1, "base tables", [](sqlite3 *db) {
        sqlite::execOrThrow(db, kCreateCustomersTable);
        sqlite::execOrThrow(db, kCreateProductsTable);
        sqlite::execOrThrow(db, kCreateInvoicesTable);
        sqlite::execOrThrow(db, kCreateInvoiceItemsTable);
    }});

    steps.push_back({2, "product pricing and stock", [](sqlite3 *db) {
        addColumnIfMissing(db, "products", "cost_price", "REAL DEFAULT 0");
        addColumnIfMissing(db, "products", "sale_price", "REAL DEFAULT 0");
        addColumnIfMissing(db, "products", "stock", "INTEGER DEFAULT 0");
        sqlite::execOrThrow(db,
                            "UPDATE products SET sale_price = unit_price "
                            "WHERE (sale_price IS NULL OR sale_price = 0) "
                            "AND unit_price IS NOT NULL;");
        sqlite::execOrThrow(db, "UPDATE products SET stock = 0 WHERE stock IS NULL;");
    }});

    steps.push_back({3, "invoice item discount", [](sqlite3 *db) {
        addColumnIfMissing(db, "invoice_items", "discount", "REAL DEFAULT 0");
    }});

    steps.push_back({4, "settings table", [](sqlite3 *db) {
        sqlite::execOrThrow(db, kCreateSettingsTable);
        addColumnIfMissing(db, "settings", "company_phone", "TEXT");
        addColumnIfMissing(db, "settings", "company_address", "TEXT");
        addColumnIfMissing(db, "settings", "default_currency", "TEXT");
        addColumnIfMissing(db, "settings", "theme", "TEXT");
        addColumnIfMissing(db, "settings", "language", "TEXT");
    }});

    steps.push_back({5, "settings max discount", [](sqlite3 *db) {
        addColumnIfMissing(db, "settings", "max_discount", "REAL DEFAULT 0");
    }});

    steps.push_back({6, "admin users", [](sqlite3 *db) {
        sqlite::execOrThrow(db, kCreateAdminUsersTable);
        addColumnIfMissing(db, "admin_users", "active", "INTEGER NOT NULL DEFAULT 1");
        addColumnIfMissing(db, "admin_users", "created_at", "DATETIME");
    }});

    steps.push_back({7, "lookup indexes", [](sqlite3 *db) {
        sqlite::execOrThrow(db,
                            "CREATE INDEX IF NOT EXISTS idx_invoice_items_invoice "
                            "ON invoice_items(invoice_id);");
        sqlite::execOrThrow(db,
                            "CREATE INDEX IF NOT EXISTS idx_invoice_items_product "
                            "ON invoice_items(product_id);");
        sqlite::execOrThrow(db,
                            "CREATE INDEX IF NOT EXISTS idx_invoices_date "
                            "ON invoices(invoice_date);");
    }});

    return steps;
}

} // namespace

SchemaMigrator::SchemaMigrator(sqlite3 *db)
    : m_db(db)
{
}

const std::vector<MigrationStep> &SchemaMigrator::steps()
{
    static const std::vector<MigrationStep> kSteps = buildSteps();
    return kSteps;
}

int SchemaMigrator::latestVersion()
{
    return steps().back().version;
}

int SchemaMigrator::currentVersion() const
{
    sqlite::Statement stmt(m_db, "PRAGMA user_version;");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw StorageError("failed to read schema version: " + sqlite::lastError(m_db));
    }
    return sqlite3_column_int(stmt.get(), 0);
}

void SchemaMigrator::setVersion(int version)
{
    const std::string sql = "PRAGMA user_version = " + std::to_string(version) + ";";
    sqlite::execOrThrow(m_db, sql.c_str());
}

int SchemaMigrator::migrate()
{
    const int startVersion = currentVersion();
    if (startVersion > latestVersion()) {
        throw StorageError("database schema version " + std::to_string(startVersion)
                           + " is newer than supported version "
                           + std::to_string(latestVersion()));
    }

    int applied = 0;
    for (const auto &step : steps()) {
        if (step.version <= startVersion) {
            continue;
        }

        try {
            sqlite::TransactionScope scope(m_db);
            step.apply(m_db);
            setVersion(step.version);
            scope.commit();
        } catch (const StorageError &error) {
            NLOG_ERROR(QStringLiteral("SchemaMigrator"),
                       QStringLiteral("migrate"),
                       QStringLiteral("migration_failed"),
                       QStringLiteral("sqlite_error"),
                       QStringLiteral("schema_step"),
                       ::noura::logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"version", step.version},
                                       {"step", step.description},
                                       {"error", error.what()}}));
            throw StorageError("migration to version " + std::to_string(step.version)
                               + " (" + step.description + ") failed: " + error.what());
        }

        ++applied;
        NLOG_INFO(QStringLiteral("SchemaMigrator"),
                  QStringLiteral("migrate"),
                  QStringLiteral("migration_applied"),
                  QStringLiteral("schema_behind"),
                  QStringLiteral("schema_step"),
                  ::noura::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"version", step.version},
                                  {"step", step.description}}));
    }

    return applied;
}

} // namespace noura

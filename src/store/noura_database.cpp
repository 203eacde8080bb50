#include "store/noura_database.hpp"

#include <cstdlib>
#include <system_error>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "store/schema_migrator.hpp"
#include "store/sqlite_helpers.hpp"

namespace noura {

NouraDatabase::NouraDatabase(const std::filesystem::path &path)
    : m_path(path)
{
    if (m_path.has_parent_path()) {
        std::error_code error;
        std::filesystem::create_directories(m_path.parent_path(), error);
        if (error) {
            throw StorageError("failed to create database directory "
                               + m_path.parent_path().string() + ": " + error.message());
        }
    }

    if (sqlite3_open(m_path.string().c_str(), &m_db) != SQLITE_OK) {
        const std::string message = m_db ? sqlite::lastError(m_db) : "out of memory";
        sqlite3_close(m_db);
        m_db = nullptr;
        throw StorageError("failed to open noura database " + m_path.string() + ": " + message);
    }

    try {
        sqlite::execOrThrow(m_db, "PRAGMA foreign_keys = ON;");
        SchemaMigrator migrator(m_db);
        const int applied = migrator.migrate();
        NLOG_DEBUG(QStringLiteral("NouraDatabase"),
                   QStringLiteral("NouraDatabase"),
                   QStringLiteral("database_opened"),
                   QStringLiteral("startup"),
                   QStringLiteral("sqlite3_open"),
                   ::noura::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", m_path.string()},
                                   {"stepsApplied", applied},
                                   {"version", migrator.currentVersion()}}));
    } catch (...) {
        sqlite3_close(m_db);
        m_db = nullptr;
        throw;
    }
}

NouraDatabase::~NouraDatabase()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

int NouraDatabase::schemaVersion() const
{
    return SchemaMigrator(m_db).currentVersion();
}

int NouraDatabase::latestSchemaVersion()
{
    return SchemaMigrator::latestVersion();
}

std::string NouraDatabase::schemaSql() const
{
    sqlite::Statement stmt(m_db,
                           "SELECT sql FROM sqlite_master WHERE sql IS NOT NULL "
                           "AND type IN ('table','index','trigger') ORDER BY name;");
    std::string schema;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        const std::string sql = sqlite::columnText(stmt.get(), 0);
        if (!sql.empty()) {
            schema += sql;
            schema += "\n";
        }
    }
    return schema;
}

std::filesystem::path NouraDatabase::defaultPath()
{
    const char *overridePath = std::getenv("NOURA_DB_PATH");
    if (overridePath && *overridePath) {
        return overridePath;
    }

    const char *home = std::getenv("HOME");
    std::filesystem::path basePath = home ? home : ".";
    basePath /= ".local/share/noura";
    return basePath / "noura.db";
}

} // namespace noura

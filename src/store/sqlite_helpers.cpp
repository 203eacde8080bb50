#include "store/sqlite_helpers.hpp"

#include <chrono>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace noura::sqlite {

Statement::Statement(sqlite3 *db, const char *sql)
    : db(db)
{
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw StorageError("sqlite prepare failed: " + lastError(db));
    }
}

Statement::~Statement()
{
    if (stmt) {
        sqlite3_finalize(stmt);
    }
}

void Statement::run(const char *what)
{
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        throw StorageError(std::string(what) + ": " + lastError(db));
    }
}

TransactionScope::TransactionScope(sqlite3 *db)
    : m_db(db)
{
    execOrThrow(m_db, "BEGIN IMMEDIATE;");
    m_open = true;
}

TransactionScope::~TransactionScope()
{
    if (m_open) {
        abort();
    }
}

void TransactionScope::commit()
{
    if (!m_open) {
        throw StorageError("commit on a closed transaction");
    }
    execOrThrow(m_db, "COMMIT;");
    m_open = false;
}

void TransactionScope::abort()
{
    if (!m_open) {
        return;
    }
    m_open = false;
    char *error = nullptr;
    if (sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, &error) != SQLITE_OK) {
        NLOG_ERROR(QStringLiteral("TransactionScope"),
                   QStringLiteral("abort"),
                   QStringLiteral("rollback_failed"),
                   QStringLiteral("sqlite_error"),
                   QStringLiteral("sqlite3_exec"),
                   ::noura::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"error", error ? error : "unknown"}}));
    }
    sqlite3_free(error);
}

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw StorageError(message);
    }
}

bool tableExists(sqlite3 *db, const std::string &table)
{
    Statement stmt(db,
                   "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ? LIMIT 1;");
    bindText(stmt.get(), 1, table);
    return sqlite3_step(stmt.get()) == SQLITE_ROW;
}

bool columnExists(sqlite3 *db, const std::string &table, const std::string &column)
{
    const std::string sql = "PRAGMA table_info(" + table + ");";
    Statement stmt(db, sql.c_str());

    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        const char *name = reinterpret_cast<const char *>(sqlite3_column_text(stmt.get(), 1));
        if (name && column == name) {
            return true;
        }
    }
    return false;
}

std::string lastError(sqlite3 *db)
{
    const char *message = sqlite3_errmsg(db);
    return message ? message : "unknown sqlite error";
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bindOptionalText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    if (value.empty()) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    bindText(stmt, index, value);
}

void bindOptionalId(sqlite3_stmt *stmt, int index, const std::optional<int64_t> &value)
{
    if (!value.has_value()) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    sqlite3_bind_int64(stmt, index, *value);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

std::optional<int64_t> columnOptionalId(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    return sqlite3_column_int64(stmt, index);
}

std::string nowTimestamp()
{
    return toIso8601Utc(std::chrono::system_clock::now());
}

} // namespace noura::sqlite

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <sqlite3.h>

namespace noura::sqlite {

// Owns one prepared statement. Prepare failures throw StorageError.
class Statement {
public:
    Statement(sqlite3 *db, const char *sql);
    ~Statement();

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return stmt;
    }

    // Steps a statement that returns no rows and throws with `what` on failure.
    void run(const char *what);

private:
    sqlite3 *db = nullptr;
    sqlite3_stmt *stmt = nullptr;
};

// Begin/commit/abort scope. Destruction without commit() rolls back.
class TransactionScope {
public:
    explicit TransactionScope(sqlite3 *db);
    ~TransactionScope();

    TransactionScope(const TransactionScope &) = delete;
    TransactionScope &operator=(const TransactionScope &) = delete;

    void commit();
    void abort();

private:
    sqlite3 *m_db;
    bool m_open = false;
};

void execOrThrow(sqlite3 *db, const char *sql);
bool tableExists(sqlite3 *db, const std::string &table);
bool columnExists(sqlite3 *db, const std::string &table, const std::string &column);
std::string lastError(sqlite3 *db);

void bindText(sqlite3_stmt *stmt, int index, const std::string &value);
void bindOptionalText(sqlite3_stmt *stmt, int index, const std::string &value);
void bindOptionalId(sqlite3_stmt *stmt, int index, const std::optional<int64_t> &value);

std::string columnText(sqlite3_stmt *stmt, int index);
std::optional<int64_t> columnOptionalId(sqlite3_stmt *stmt, int index);

std::string nowTimestamp();

} // namespace noura::sqlite

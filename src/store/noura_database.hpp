#pragma once

#include <filesystem>
#include <string>

#include <sqlite3.h>

namespace noura {

// NouraDatabase owns the single SQLite connection of the process.
// Opening it enables foreign keys and migrates the schema; any failure is
// reported as StorageError and the object is not constructed.
// The handle is not synchronized: callers on worker threads must serialize.
class NouraDatabase {
public:
    explicit NouraDatabase(const std::filesystem::path &path);
    ~NouraDatabase();

    NouraDatabase(const NouraDatabase &) = delete;
    NouraDatabase &operator=(const NouraDatabase &) = delete;

    sqlite3 *handle() const
    {
        return m_db;
    }

    const std::filesystem::path &path() const
    {
        return m_path;
    }

    int schemaVersion() const;
    static int latestSchemaVersion();

    // Full CREATE statements, sorted by name. Used to compare layouts.
    std::string schemaSql() const;

    // $NOURA_DB_PATH, else $HOME/.local/share/noura/noura.db.
    static std::filesystem::path defaultPath();

private:
    std::filesystem::path m_path;
    sqlite3 *m_db = nullptr;
};

} // namespace noura

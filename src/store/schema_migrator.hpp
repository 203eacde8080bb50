#pragma once

#include <functional>
#include <string>
#include <vector>

#include <sqlite3.h>

namespace noura {

struct MigrationStep {
    int version = 0;
    std::string description;
    std::function<void(sqlite3 *)> apply;
};

// SchemaMigrator brings a database up to the latest layout.
// Steps run in version order, each in its own transaction together with the
// PRAGMA user_version bump, so a failed step leaves the previous version
// recorded. Steps only add tables, columns and indexes.
class SchemaMigrator {
public:
    explicit SchemaMigrator(sqlite3 *db);

    // Returns the number of steps applied. Throws StorageError on failure.
    int migrate();

    int currentVersion() const;
    static int latestVersion();
    static const std::vector<MigrationStep> &steps();

private:
    void setVersion(int version);

    sqlite3 *m_db;
};

} // namespace noura

#pragma once

#include "common/models.hpp"
#include "store/noura_database.hpp"

namespace noura {

// SettingsStore keeps the one configuration record.
// The row is loaded once at construction into an in-memory Settings object;
// components hold a reference to current() and observe every save().
class SettingsStore {
public:
    explicit SettingsStore(NouraDatabase &database);

    // Inserts the default row when the table is empty. Returns true if it did.
    bool ensureRow();

    // Reads the stored row. Falls back to defaults without writing.
    Settings load() const;

    const Settings &current() const
    {
        return m_current;
    }

    // Validates, upserts id = 1 and refreshes current().
    void save(const Settings &values);

    static void validate(const Settings &values);

private:
    void upsert(const Settings &values);

    NouraDatabase &m_database;
    Settings m_current;
};

} // namespace noura

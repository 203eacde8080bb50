#pragma once

#include <filesystem>
#include <memory>

#include "ledger/ledger_engine.hpp"
#include "report/reporting_views.hpp"
#include "store/catalog_store.hpp"
#include "store/credential_store.hpp"
#include "store/noura_database.hpp"
#include "store/settings_store.hpp"

namespace noura {

/**
 * NouraEngine is the single owner of the database handle and of every
 * component that uses it. Construction order is the initialization order:
 * - open and migrate the schema
 * - ensure the settings row and load it into memory
 * - seed the default administrator when none exists
 *
 * The ledger holds a reference to settings().current(), so a saved discount
 * cap applies to the next invoice without reloading.
 */
class NouraEngine {
public:
    explicit NouraEngine(const std::filesystem::path &databasePath);
    ~NouraEngine();

    NouraEngine(const NouraEngine &) = delete;
    NouraEngine &operator=(const NouraEngine &) = delete;

    NouraDatabase &database() { return *m_database; }
    SettingsStore &settings() { return *m_settings; }
    CredentialStore &credentials() { return *m_credentials; }
    CatalogStore &catalog() { return *m_catalog; }
    LedgerEngine &ledger() { return *m_ledger; }
    ReportingViews &reports() { return *m_reports; }

private:
    std::unique_ptr<NouraDatabase> m_database;
    std::unique_ptr<SettingsStore> m_settings;
    std::unique_ptr<CredentialStore> m_credentials;
    std::unique_ptr<CatalogStore> m_catalog;
    std::unique_ptr<LedgerEngine> m_ledger;
    std::unique_ptr<ReportingViews> m_reports;
};

} // namespace noura

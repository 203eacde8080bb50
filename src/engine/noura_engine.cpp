#include "engine/noura_engine.hpp"

#include "common/logging.hpp"

namespace noura {

NouraEngine::NouraEngine(const std::filesystem::path &databasePath)
    : m_database(std::make_unique<NouraDatabase>(databasePath))
    , m_settings(std::make_unique<SettingsStore>(*m_database))
    , m_credentials(std::make_unique<CredentialStore>(*m_database))
    , m_catalog(std::make_unique<CatalogStore>(*m_database))
    , m_ledger(std::make_unique<LedgerEngine>(*m_database, m_settings->current()))
    , m_reports(std::make_unique<ReportingViews>(*m_database))
{
    NLOG_INFO(QStringLiteral("NouraEngine"),
              QStringLiteral("NouraEngine"),
              QStringLiteral("engine_ready"),
              QStringLiteral("startup"),
              QStringLiteral("initialization"),
              ::noura::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"database", databasePath.string()},
                              {"schemaVersion", m_database->schemaVersion()}}));
}

NouraEngine::~NouraEngine() = default;

} // namespace noura

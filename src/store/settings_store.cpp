#include "store/settings_store.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <string>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "store/sqlite_helpers.hpp"

namespace noura {

namespace {

constexpr std::array<const char *, 2> kThemes = {"dark", "light"};
constexpr std::array<const char *, 4> kLanguages = {"en", "tr", "id", "ar"};

template <size_t N>
bool isOneOf(const std::string &value, const std::array<const char *, N> &allowed)
{
    return std::any_of(allowed.begin(), allowed.end(), [&value](const char *candidate) {
        return value == candidate;
    });
}

std::string textOr(sqlite3_stmt *stmt, int index, const std::string &fallback)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return fallback;
    }
    return sqlite::columnText(stmt, index);
}

} // namespace

SettingsStore::SettingsStore(NouraDatabase &database)
    : m_database(database)
{
    ensureRow();
    m_current = load();
}

bool SettingsStore::ensureRow()
{
    sqlite::Statement countStmt(m_database.handle(), "SELECT COUNT(*) FROM settings;");
    if (sqlite3_step(countStmt.get()) != SQLITE_ROW) {
        throw StorageError("failed to count settings rows: "
                           + sqlite::lastError(m_database.handle()));
    }
    if (sqlite3_column_int64(countStmt.get(), 0) > 0) {
        return false;
    }

    upsert(Settings{});
    NLOG_INFO(QStringLiteral("SettingsStore"),
              QStringLiteral("ensureRow"),
              QStringLiteral("settings_seeded"),
              QStringLiteral("first_run"),
              QStringLiteral("defaults"),
              ::noura::logging::defaultWho(),
              QString(),
              nlohmann::json::object());
    return true;
}

Settings SettingsStore::load() const
{
    sqlite::Statement stmt(m_database.handle(),
                           "SELECT company_name, company_phone, company_address, "
                           "default_currency, theme, language, max_discount "
                           "FROM settings WHERE id = 1 LIMIT 1;");

    const Settings defaults;
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        NLOG_WARN(QStringLiteral("SettingsStore"),
                  QStringLiteral("load"),
                  QStringLiteral("settings_row_missing"),
                  QStringLiteral("empty_table"),
                  QStringLiteral("in_memory_defaults"),
                  ::noura::logging::defaultWho(),
                  QString(),
                  nlohmann::json::object());
        return defaults;
    }

    Settings settings;
    settings.companyName = textOr(stmt.get(), 0, defaults.companyName);
    settings.companyPhone = textOr(stmt.get(), 1, defaults.companyPhone);
    settings.companyAddress = textOr(stmt.get(), 2, defaults.companyAddress);
    settings.defaultCurrency = textOr(stmt.get(), 3, defaults.defaultCurrency);
    settings.theme = textOr(stmt.get(), 4, defaults.theme);
    settings.language = textOr(stmt.get(), 5, defaults.language);
    settings.maxDiscount = sqlite3_column_double(stmt.get(), 6);
    return settings;
}

void SettingsStore::validate(const Settings &values)
{
    if (values.defaultCurrency.empty()) {
        throw ValidationError("default currency is required");
    }
    if (!isOneOf(values.theme, kThemes)) {
        throw ValidationError("unknown theme '" + values.theme + "'");
    }
    if (!isOneOf(values.language, kLanguages)) {
        throw ValidationError("unknown language '" + values.language + "'");
    }
    if (!std::isfinite(values.maxDiscount) || values.maxDiscount < 0.0
        || values.maxDiscount > 100.0) {
        throw ValidationError("max discount must be between 0 and 100");
    }
}

void SettingsStore::save(const Settings &values)
{
    validate(values);
    upsert(values);
    m_current = values;

    logging::MutationEvent event;
    event.component = QStringLiteral("SettingsStore");
    event.operation = QStringLiteral("save");
    event.action = QStringLiteral("settings_saved");
    event.entity = "settings";
    event.entityId = 1;
    event.details = nlohmann::json(values);
    logging::logMutation(event);
}

void SettingsStore::upsert(const Settings &values)
{
    sqlite::Statement stmt(m_database.handle(),
                           "INSERT INTO settings (id, company_name, company_phone, "
                           "company_address, default_currency, theme, language, max_discount) "
                           "VALUES (1, ?, ?, ?, ?, ?, ?, ?) "
                           "ON CONFLICT(id) DO UPDATE SET "
                           "company_name = excluded.company_name, "
                           "company_phone = excluded.company_phone, "
                           "company_address = excluded.company_address, "
                           "default_currency = excluded.default_currency, "
                           "theme = excluded.theme, "
                           "language = excluded.language, "
                           "max_discount = excluded.max_discount;");
    sqlite::bindText(stmt.get(), 1, values.companyName);
    sqlite::bindText(stmt.get(), 2, values.companyPhone);
    sqlite::bindText(stmt.get(), 3, values.companyAddress);
    sqlite::bindText(stmt.get(), 4, values.defaultCurrency);
    sqlite::bindText(stmt.get(), 5, values.theme);
    sqlite::bindText(stmt.get(), 6, values.language);
    sqlite3_bind_double(stmt.get(), 7, values.maxDiscount);
    stmt.run("failed to save settings");
}

} // namespace noura

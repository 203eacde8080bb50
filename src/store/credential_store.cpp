#include "store/credential_store.hpp"

#include <QCryptographicHash>
#include <QString>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "store/sqlite_helpers.hpp"

namespace noura {

namespace {

int64_t countRows(sqlite3 *db, const char *sql)
{
    sqlite::Statement stmt(db, sql);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw StorageError("failed to count admin users: " + sqlite::lastError(db));
    }
    return sqlite3_column_int64(stmt.get(), 0);
}

} // namespace

CredentialStore::CredentialStore(NouraDatabase &database)
    : m_database(database)
{
    ensureDefaultAdmin();
}

std::string CredentialStore::hashPassword(const std::string &password)
{
    const QByteArray digest = QCryptographicHash::hash(
        QByteArray::fromStdString(password), QCryptographicHash::Sha256);
    return digest.toHex().toStdString();
}

bool CredentialStore::ensureDefaultAdmin()
{
    if (countRows(m_database.handle(), "SELECT COUNT(*) FROM admin_users;") > 0) {
        return false;
    }

    sqlite::Statement stmt(m_database.handle(),
                           "INSERT INTO admin_users (username, password_hash, "
                           "license_key, active, created_at) VALUES (?, ?, ?, 1, ?);");
    sqlite::bindText(stmt.get(), 1, kDefaultAdminUsername);
    sqlite::bindText(stmt.get(), 2, hashPassword(kDefaultAdminPassword));
    sqlite::bindText(stmt.get(), 3, kDefaultAdminLicense);
    sqlite::bindText(stmt.get(), 4, sqlite::nowTimestamp());
    stmt.run("failed to seed default admin");

    NLOG_WARN(QStringLiteral("CredentialStore"),
              QStringLiteral("ensureDefaultAdmin"),
              QStringLiteral("default_admin_seeded"),
              QStringLiteral("no_admin_rows"),
              QStringLiteral("development_default_credentials"),
              ::noura::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"username", kDefaultAdminUsername},
                              {"note", "change these credentials before production use"}}));
    return true;
}

bool CredentialStore::authenticate(const std::string &username,
                                   const std::string &password,
                                   const std::string &licenseKey) const
{
    if (username.empty() || password.empty() || licenseKey.empty()) {
        return false;
    }

    sqlite::Statement stmt(m_database.handle(),
                           "SELECT 1 FROM admin_users WHERE username = ? "
                           "AND password_hash = ? AND license_key = ? "
                           "AND active = 1 LIMIT 1;");
    sqlite::bindText(stmt.get(), 1, username);
    sqlite::bindText(stmt.get(), 2, hashPassword(password));
    sqlite::bindText(stmt.get(), 3, licenseKey);

    const bool matched = sqlite3_step(stmt.get()) == SQLITE_ROW;
    NLOG_INFO(QStringLiteral("CredentialStore"),
              QStringLiteral("authenticate"),
              matched ? QStringLiteral("login_succeeded") : QStringLiteral("login_rejected"),
              QStringLiteral("user_login"),
              QStringLiteral("sha256_compare"),
              ::noura::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"username", username}}));
    return matched;
}

bool CredentialStore::usesDefaultCredentials() const
{
    sqlite::Statement stmt(m_database.handle(),
                           "SELECT 1 FROM admin_users WHERE username = ? "
                           "AND password_hash = ? AND active = 1 LIMIT 1;");
    sqlite::bindText(stmt.get(), 1, kDefaultAdminUsername);
    sqlite::bindText(stmt.get(), 2, hashPassword(kDefaultAdminPassword));
    return sqlite3_step(stmt.get()) == SQLITE_ROW;
}

void CredentialStore::updateCredentials(const std::string &username,
                                        const std::string &newPassword,
                                        const std::string &newLicenseKey)
{
    if (newPassword.empty()) {
        throw ValidationError("password is required");
    }
    if (newLicenseKey.empty()) {
        throw ValidationError("license key is required");
    }

    sqlite::Statement stmt(m_database.handle(),
                           "UPDATE admin_users SET password_hash = ?, license_key = ? "
                           "WHERE username = ?;");
    sqlite::bindText(stmt.get(), 1, hashPassword(newPassword));
    sqlite::bindText(stmt.get(), 2, newLicenseKey);
    sqlite::bindText(stmt.get(), 3, username);
    stmt.run("failed to update admin credentials");

    if (sqlite3_changes(m_database.handle()) == 0) {
        throw NotFoundError("admin user '" + username + "' not found");
    }

    NLOG_INFO(QStringLiteral("CredentialStore"),
              QStringLiteral("updateCredentials"),
              QStringLiteral("credentials_updated"),
              QStringLiteral("user_request"),
              QStringLiteral("sqlite_update"),
              ::noura::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"username", username}}));
}

void CredentialStore::setActive(const std::string &username, bool active)
{
    sqlite::TransactionScope scope(m_database.handle());

    sqlite::Statement lookup(m_database.handle(),
                             "SELECT active FROM admin_users WHERE username = ? LIMIT 1;");
    sqlite::bindText(lookup.get(), 1, username);
    if (sqlite3_step(lookup.get()) != SQLITE_ROW) {
        throw NotFoundError("admin user '" + username + "' not found");
    }
    const bool wasActive = sqlite3_column_int(lookup.get(), 0) != 0;

    if (wasActive && !active
        && countRows(m_database.handle(),
                     "SELECT COUNT(*) FROM admin_users WHERE active = 1;") <= 1) {
        throw ValidationError("cannot deactivate the last active admin '" + username + "'");
    }

    sqlite::Statement update(m_database.handle(),
                             "UPDATE admin_users SET active = ? WHERE username = ?;");
    sqlite3_bind_int(update.get(), 1, active ? 1 : 0);
    sqlite::bindText(update.get(), 2, username);
    update.run("failed to update admin state");
    scope.commit();
}

std::vector<AdminUser> CredentialStore::listUsers() const
{
    sqlite::Statement stmt(m_database.handle(),
                           "SELECT id, username, license_key, active FROM admin_users "
                           "ORDER BY id ASC;");

    std::vector<AdminUser> users;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        AdminUser user;
        user.id = sqlite3_column_int64(stmt.get(), 0);
        user.username = sqlite::columnText(stmt.get(), 1);
        user.licenseKey = sqlite::columnText(stmt.get(), 2);
        user.active = sqlite3_column_int(stmt.get(), 3) != 0;
        users.push_back(std::move(user));
    }
    return users;
}

} // namespace noura

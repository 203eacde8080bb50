#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"
#include "store/noura_database.hpp"

namespace noura {

// Development-only administrator seeded into an empty admin_users table.
// Deployments are expected to replace it with updateCredentials().
inline constexpr const char *kDefaultAdminUsername = "admin";
inline constexpr const char *kDefaultAdminPassword = "admin123";
inline constexpr const char *kDefaultAdminLicense = "NOURA-DEV-LICENSE";

class CredentialStore {
public:
    explicit CredentialStore(NouraDatabase &database);

    // Seeds the default admin when no admin rows exist. Returns true if it did.
    bool ensureDefaultAdmin();

    // All of username, password hash and license key must match an active row.
    bool authenticate(const std::string &username,
                      const std::string &password,
                      const std::string &licenseKey) const;

    bool usesDefaultCredentials() const;

    void updateCredentials(const std::string &username,
                           const std::string &newPassword,
                           const std::string &newLicenseKey);

    // Refuses to deactivate the last active admin.
    void setActive(const std::string &username, bool active);

    std::vector<AdminUser> listUsers() const;

    // Lowercase hex SHA-256 digest.
    static std::string hashPassword(const std::string &password);

private:
    NouraDatabase &m_database;
};

} // namespace noura

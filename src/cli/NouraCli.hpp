#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include <QString>
#include <QStringList>

#include "common/enums.hpp"
#include "common/models.hpp"

namespace noura {

class NouraEngine;

class NouraCli
{
public:
    // CLI dispatcher for catalog, ledger, settings, admin and report commands.
    // returns exit code
    int run(int argc, char *argv[]);

    enum ExitCode {
        ExitOk = 0,
        ExitInvalid = 1,
        ExitStorage = 2,
        ExitAuthFailed = 3
    };

private:
    int dispatch(const QString &command, const QStringList &args);

    // Each subcommand opens the engine, performs one operation and renders
    // the result in the chosen format.
    int runInit(const QStringList &args);
    int runCustomer(const QStringList &args);
    int runProduct(const QStringList &args);
    int runInvoice(const QStringList &args);
    int runSettings(const QStringList &args);
    int runLogin(const QStringList &args);
    int runAdmin(const QStringList &args);
    int runReport(const QStringList &args);

    std::unique_ptr<NouraEngine> openEngine() const;

    std::vector<InvoiceItem> parseItems(const QString &value) const;

    std::filesystem::path m_databasePath;
    OutputFormat m_format = OutputFormat::Text;
};

} // namespace noura

#include "cli/NouraCli.hpp"

#include <iostream>

#include <QDate>
#include <QDateTime>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/noura_engine.hpp"

namespace noura {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  noura-cli [--db PATH] [--format text|json] [--trace] COMMAND ...\n"
        "\n"
        "  noura-cli init\n"
        "  noura-cli customer add --name N [--email E] [--phone P] [--address A] [--tax-number T]\n"
        "  noura-cli customer update --id ID [fields as for add]\n"
        "  noura-cli customer delete --id ID\n"
        "  noura-cli customer list\n"
        "  noura-cli product add --name N [--description D] [--sale-price X] [--cost-price X]\n"
        "                        [--stock N] [--unit U]\n"
        "  noura-cli product update --id ID [fields as for add]\n"
        "  noura-cli product delete --id ID\n"
        "  noura-cli product list\n"
        "  noura-cli invoice create --items JSON [--number N] [--customer ID] [--date yyyy-MM-dd]\n"
        "                          [--due yyyy-MM-dd] [--status S] [--total X]\n"
        "  noura-cli invoice update --id ID [--items JSON] [--no-customer] [fields as for create]\n"
        "  noura-cli invoice delete --id ID\n"
        "  noura-cli invoice list\n"
        "  noura-cli invoice show --id ID\n"
        "  noura-cli settings show\n"
        "  noura-cli settings set [--company-name N] [--company-phone P] [--company-address A]\n"
        "                         [--currency C] [--theme dark|light] [--language en|tr|id|ar]\n"
        "                         [--max-discount X]\n"
        "  noura-cli login --username U --password P --license L\n"
        "  noura-cli admin list\n"
        "  noura-cli admin passwd --username U --password P --license L\n"
        "  noura-cli admin activate|deactivate --username U\n"
        "  noura-cli report totals\n"
        "  noura-cli report income [--period daily|monthly|yearly] [--from D] [--to D]\n"
        "  noura-cli report products\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

// Drops the global flags so positional lookups see COMMAND and ACTION only.
QStringList stripGlobalFlags(const QStringList &args)
{
    QStringList filtered;
    for (int i = 0; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        if (arg == QStringLiteral("--db") || arg == QStringLiteral("--format")) {
            ++i;
            continue;
        }
        filtered.push_back(arg);
    }
    return filtered;
}

int64_t requireId(const QStringList &args, const QString &key)
{
    bool ok = false;
    const qlonglong value = getArgValue(args, key).toLongLong(&ok);
    if (!ok || value <= 0) {
        throw ValidationError(key.toStdString() + " must be a positive integer");
    }
    return value;
}

std::string requireText(const QStringList &args, const QString &key)
{
    const QString value = getArgValue(args, key);
    if (value.isEmpty()) {
        throw ValidationError(key.toStdString() + " is required");
    }
    return value.toStdString();
}

void overrideText(const QStringList &args, const QString &key, std::string &field)
{
    if (args.contains(key)) {
        field = getArgValue(args, key).toStdString();
    }
}

void overrideNumber(const QStringList &args, const QString &key, double &field)
{
    if (!args.contains(key)) {
        return;
    }
    bool ok = false;
    const double value = getArgValue(args, key).toDouble(&ok);
    if (!ok) {
        throw ValidationError(key.toStdString() + " must be a number");
    }
    field = value;
}

void overrideInteger(const QStringList &args, const QString &key, int64_t &field)
{
    if (!args.contains(key)) {
        return;
    }
    bool ok = false;
    const qlonglong value = getArgValue(args, key).toLongLong(&ok);
    if (!ok) {
        throw ValidationError(key.toStdString() + " must be an integer");
    }
    field = value;
}

std::string money(double value)
{
    return QString::number(value, 'f', 2).toStdString();
}

std::string quantity(double value)
{
    return QString::number(value, 'g', 12).toStdString();
}

void printJson(const nlohmann::json &payload)
{
    std::cout << payload.dump(2) << std::endl;
}

void applyCustomerFlags(const QStringList &args, Customer &customer)
{
    overrideText(args, QStringLiteral("--name"), customer.name);
    overrideText(args, QStringLiteral("--email"), customer.email);
    overrideText(args, QStringLiteral("--phone"), customer.phone);
    overrideText(args, QStringLiteral("--address"), customer.address);
    overrideText(args, QStringLiteral("--tax-number"), customer.taxNumber);
}

void applyProductFlags(const QStringList &args, Product &product)
{
    overrideText(args, QStringLiteral("--name"), product.name);
    overrideText(args, QStringLiteral("--description"), product.description);
    overrideNumber(args, QStringLiteral("--sale-price"), product.salePrice);
    overrideNumber(args, QStringLiteral("--cost-price"), product.costPrice);
    overrideInteger(args, QStringLiteral("--stock"), product.stock);
    overrideText(args, QStringLiteral("--unit"), product.unit);
    product.unitPrice = product.salePrice;
}

void applyInvoiceFlags(const QStringList &args, Invoice &invoice)
{
    overrideText(args, QStringLiteral("--number"), invoice.invoiceNumber);
    overrideText(args, QStringLiteral("--date"), invoice.invoiceDate);
    overrideText(args, QStringLiteral("--due"), invoice.dueDate);
    overrideText(args, QStringLiteral("--status"), invoice.status);
    if (args.contains(QStringLiteral("--customer"))) {
        invoice.customerId = requireId(args, QStringLiteral("--customer"));
    }
    if (args.contains(QStringLiteral("--no-customer"))) {
        invoice.customerId.reset();
    }
}

double sumLineTotals(const std::vector<InvoiceItem> &items)
{
    double total = 0.0;
    for (const auto &item : items) {
        total += item.lineTotal;
    }
    return total;
}

void renderInvoiceDetail(const InvoiceDetail &detail, const std::string &currency)
{
    const Invoice &invoice = detail.invoice;
    std::cout << "Invoice " << invoice.invoiceNumber << " (id " << invoice.id << ")\n";
    if (detail.customer.has_value()) {
        std::cout << "Customer: " << detail.customer->name;
        if (!detail.customer->taxNumber.empty()) {
            std::cout << " (tax " << detail.customer->taxNumber << ")";
        }
        std::cout << "\n";
    }
    std::cout << "Date: " << invoice.invoiceDate << "  Due: " << invoice.dueDate
              << "  Status: " << invoice.status << "\n";
    std::cout << "Items:\n";
    for (const auto &entry : detail.items) {
        std::cout << "  - " << entry.productName << " x " << quantity(entry.item.quantity)
                  << " @ " << money(entry.item.unitPrice);
        if (entry.item.discount > 0.0) {
            std::cout << " (-" << quantity(entry.item.discount) << "%)";
        }
        std::cout << " = " << money(entry.item.lineTotal) << "\n";
    }
    std::cout << "Total: " << money(invoice.totalAmount) << " " << currency << "\n";
}

} // namespace

int NouraCli::run(int argc, char *argv[])
{
    // CLI entry: parse global flags and the command, then delegate.
    QStringList rawArgs;
    rawArgs.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        rawArgs.push_back(QString::fromLocal8Bit(argv[i]));
    }

    const QString dbValue = getArgValue(rawArgs, QStringLiteral("--db"));
    m_databasePath = dbValue.isEmpty()
        ? NouraDatabase::defaultPath()
        : std::filesystem::path(dbValue.toStdString());

    const QString format = getArgValue(rawArgs, QStringLiteral("--format")).toLower();
    if (format.isEmpty() || format == QStringLiteral("text")) {
        m_format = OutputFormat::Text;
    } else if (format == QStringLiteral("json")) {
        m_format = OutputFormat::Json;
    } else {
        std::cerr << "Invalid format. Use text or json." << std::endl;
        return ExitInvalid;
    }

    const QStringList args = stripGlobalFlags(rawArgs);
    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return ExitInvalid;
    }

    const QString command = args.at(1);
    logging::CorrelationScope correlation(logging::newCorrelationId());
    NLOG_INFO(QStringLiteral("NouraCli"),
              QStringLiteral("run"),
              QStringLiteral("cli_command"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              ::noura::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"command", command.toStdString()},
                              {"action", args.value(2).toStdString()}}));

    try {
        return dispatch(command, args);
    } catch (const ValidationError &error) {
        std::cerr << "error: " << error.what() << std::endl;
        return ExitInvalid;
    } catch (const NotFoundError &error) {
        std::cerr << "error: " << error.what() << std::endl;
        return ExitInvalid;
    } catch (const StorageError &error) {
        std::cerr << "storage error: " << error.what() << std::endl;
        return ExitStorage;
    } catch (const nlohmann::json::exception &error) {
        std::cerr << "error: invalid JSON: " << error.what() << std::endl;
        return ExitInvalid;
    }
}

int NouraCli::dispatch(const QString &command, const QStringList &args)
{
    if (command == QStringLiteral("init")) {
        return runInit(args);
    }
    if (command == QStringLiteral("customer")) {
        return runCustomer(args);
    }
    if (command == QStringLiteral("product")) {
        return runProduct(args);
    }
    if (command == QStringLiteral("invoice")) {
        return runInvoice(args);
    }
    if (command == QStringLiteral("settings")) {
        return runSettings(args);
    }
    if (command == QStringLiteral("login")) {
        return runLogin(args);
    }
    if (command == QStringLiteral("admin")) {
        return runAdmin(args);
    }
    if (command == QStringLiteral("report")) {
        return runReport(args);
    }

    std::cerr << usageText().toStdString();
    return ExitInvalid;
}

std::unique_ptr<NouraEngine> NouraCli::openEngine() const
{
    return std::make_unique<NouraEngine>(m_databasePath);
}

std::vector<InvoiceItem> NouraCli::parseItems(const QString &value) const
{
    const auto parsed = nlohmann::json::parse(value.toStdString());
    if (!parsed.is_array()) {
        throw ValidationError("--items must be a JSON array");
    }

    std::vector<InvoiceItem> items;
    for (const auto &entry : parsed) {
        if (!entry.is_object()) {
            throw ValidationError("--items entries must be JSON objects");
        }
        auto item = entry.get<InvoiceItem>();
        if (item.lineTotal < 0.0) {
            item.lineTotal = LedgerEngine::computeLineTotal(item.quantity, item.unitPrice,
                                                            item.discount);
        }
        items.push_back(std::move(item));
    }
    return items;
}

int NouraCli::runInit(const QStringList &)
{
    auto engine = openEngine();
    const bool defaultCredentials = engine->credentials().usesDefaultCredentials();

    if (m_format == OutputFormat::Json) {
        printJson(nlohmann::json{
            {"database", m_databasePath.string()},
            {"schemaVersion", engine->database().schemaVersion()},
            {"latestSchemaVersion", NouraDatabase::latestSchemaVersion()},
            {"defaultCredentials", defaultCredentials}
        });
    } else {
        std::cout << "Database: " << m_databasePath.string() << "\n";
        std::cout << "Schema version: " << engine->database().schemaVersion() << "/"
                  << NouraDatabase::latestSchemaVersion() << "\n";
    }
    if (defaultCredentials) {
        std::cerr << "warning: the development admin account '" << kDefaultAdminUsername
                  << "' still uses its default password; change it with 'admin passwd'."
                  << std::endl;
    }
    return ExitOk;
}

int NouraCli::runCustomer(const QStringList &args)
{
    const QString action = args.value(2);
    auto engine = openEngine();
    CatalogStore &catalog = engine->catalog();

    if (action == QStringLiteral("add")) {
        Customer customer;
        applyCustomerFlags(args, customer);
        const int64_t id = catalog.addCustomer(customer);
        if (m_format == OutputFormat::Json) {
            printJson(nlohmann::json{{"id", id}});
        } else {
            std::cout << "Added customer " << id << "\n";
        }
        return ExitOk;
    }
    if (action == QStringLiteral("update")) {
        const int64_t id = requireId(args, QStringLiteral("--id"));
        auto customer = catalog.getCustomer(id);
        if (!customer.has_value()) {
            throw NotFoundError("customer " + std::to_string(id) + " not found");
        }
        applyCustomerFlags(args, *customer);
        catalog.updateCustomer(id, *customer);
        std::cout << "Updated customer " << id << "\n";
        return ExitOk;
    }
    if (action == QStringLiteral("delete")) {
        const int64_t id = requireId(args, QStringLiteral("--id"));
        catalog.deleteCustomer(id);
        std::cout << "Deleted customer " << id << "\n";
        return ExitOk;
    }
    if (action == QStringLiteral("list")) {
        const auto customers = catalog.listCustomers();
        if (m_format == OutputFormat::Json) {
            printJson(customers);
            return ExitOk;
        }
        for (const auto &customer : customers) {
            std::cout << "#" << customer.id << " " << customer.name;
            if (!customer.email.empty()) {
                std::cout << " <" << customer.email << ">";
            }
            if (!customer.phone.empty()) {
                std::cout << " " << customer.phone;
            }
            std::cout << "\n";
        }
        return ExitOk;
    }

    std::cerr << usageText().toStdString();
    return ExitInvalid;
}

int NouraCli::runProduct(const QStringList &args)
{
    const QString action = args.value(2);
    auto engine = openEngine();
    CatalogStore &catalog = engine->catalog();

    if (action == QStringLiteral("add")) {
        Product product;
        applyProductFlags(args, product);
        const int64_t id = catalog.addProduct(product);
        if (m_format == OutputFormat::Json) {
            printJson(nlohmann::json{{"id", id}});
        } else {
            std::cout << "Added product " << id << "\n";
        }
        return ExitOk;
    }
    if (action == QStringLiteral("update")) {
        const int64_t id = requireId(args, QStringLiteral("--id"));
        auto product = catalog.getProduct(id);
        if (!product.has_value()) {
            throw ProductNotFoundError(id);
        }
        applyProductFlags(args, *product);
        catalog.updateProduct(id, *product);
        std::cout << "Updated product " << id << "\n";
        return ExitOk;
    }
    if (action == QStringLiteral("delete")) {
        const int64_t id = requireId(args, QStringLiteral("--id"));
        catalog.deleteProduct(id);
        std::cout << "Deleted product " << id << "\n";
        return ExitOk;
    }
    if (action == QStringLiteral("list")) {
        const auto products = catalog.listProducts();
        if (m_format == OutputFormat::Json) {
            printJson(products);
            return ExitOk;
        }
        const std::string &currency = engine->settings().current().defaultCurrency;
        for (const auto &product : products) {
            std::cout << "#" << product.id << " " << product.name << "  "
                      << money(product.salePrice) << " " << currency
                      << "  stock " << product.stock;
            if (!product.unit.empty()) {
                std::cout << " " << product.unit;
            }
            std::cout << "\n";
        }
        return ExitOk;
    }

    std::cerr << usageText().toStdString();
    return ExitInvalid;
}

int NouraCli::runInvoice(const QStringList &args)
{
    const QString action = args.value(2);
    auto engine = openEngine();
    LedgerEngine &ledger = engine->ledger();

    if (action == QStringLiteral("create")) {
        const QString itemsValue = getArgValue(args, QStringLiteral("--items"));
        if (itemsValue.isEmpty()) {
            throw ValidationError("--items is required");
        }

        Invoice invoice;
        invoice.invoiceNumber = LedgerEngine::generateInvoiceNumber(QDateTime::currentDateTime());
        invoice.invoiceDate = QDate::currentDate().toString(Qt::ISODate).toStdString();
        invoice.dueDate = invoice.invoiceDate;
        invoice.status = "Draft";
        applyInvoiceFlags(args, invoice);

        const auto items = parseItems(itemsValue);
        invoice.totalAmount = sumLineTotals(items);
        overrideNumber(args, QStringLiteral("--total"), invoice.totalAmount);

        const int64_t id = ledger.createInvoice(invoice, items);
        if (m_format == OutputFormat::Json) {
            printJson(nlohmann::json{{"id", id}, {"invoiceNumber", invoice.invoiceNumber}});
        } else {
            std::cout << "Created invoice " << invoice.invoiceNumber << " (id " << id << ")\n";
        }
        return ExitOk;
    }
    if (action == QStringLiteral("update")) {
        const int64_t id = requireId(args, QStringLiteral("--id"));
        auto invoice = ledger.getInvoice(id);
        if (!invoice.has_value()) {
            throw NotFoundError("invoice " + std::to_string(id) + " not found");
        }
        applyInvoiceFlags(args, *invoice);

        std::vector<InvoiceItem> items;
        const QString itemsValue = getArgValue(args, QStringLiteral("--items"));
        if (itemsValue.isEmpty()) {
            items = ledger.getInvoiceItems(id);
        } else {
            items = parseItems(itemsValue);
            invoice->totalAmount = sumLineTotals(items);
        }
        overrideNumber(args, QStringLiteral("--total"), invoice->totalAmount);

        ledger.updateInvoice(id, *invoice, items);
        std::cout << "Updated invoice " << invoice->invoiceNumber << " (id " << id << ")\n";
        return ExitOk;
    }
    if (action == QStringLiteral("delete")) {
        const int64_t id = requireId(args, QStringLiteral("--id"));
        ledger.deleteInvoice(id);
        std::cout << "Deleted invoice " << id << "\n";
        return ExitOk;
    }
    if (action == QStringLiteral("list")) {
        const auto invoices = ledger.listInvoices();
        if (m_format == OutputFormat::Json) {
            printJson(invoices);
            return ExitOk;
        }
        const std::string &currency = engine->settings().current().defaultCurrency;
        for (const auto &invoice : invoices) {
            std::cout << "#" << invoice.id << " " << invoice.invoiceNumber << "  "
                      << invoice.invoiceDate << "  "
                      << (invoice.customerName.empty() ? "-" : invoice.customerName) << "  "
                      << money(invoice.totalAmount) << " " << currency << "  "
                      << invoice.status << "\n";
        }
        return ExitOk;
    }
    if (action == QStringLiteral("show")) {
        const int64_t id = requireId(args, QStringLiteral("--id"));
        const auto detail = ledger.getInvoiceDetail(id);
        if (!detail.has_value()) {
            throw NotFoundError("invoice " + std::to_string(id) + " not found");
        }
        if (m_format == OutputFormat::Json) {
            printJson(*detail);
        } else {
            renderInvoiceDetail(*detail, engine->settings().current().defaultCurrency);
        }
        return ExitOk;
    }

    std::cerr << usageText().toStdString();
    return ExitInvalid;
}

int NouraCli::runSettings(const QStringList &args)
{
    const QString action = args.value(2);
    auto engine = openEngine();
    SettingsStore &store = engine->settings();

    if (action == QStringLiteral("set")) {
        Settings values = store.current();
        overrideText(args, QStringLiteral("--company-name"), values.companyName);
        overrideText(args, QStringLiteral("--company-phone"), values.companyPhone);
        overrideText(args, QStringLiteral("--company-address"), values.companyAddress);
        overrideText(args, QStringLiteral("--currency"), values.defaultCurrency);
        overrideText(args, QStringLiteral("--theme"), values.theme);
        overrideText(args, QStringLiteral("--language"), values.language);
        overrideNumber(args, QStringLiteral("--max-discount"), values.maxDiscount);
        store.save(values);
    } else if (action != QStringLiteral("show")) {
        std::cerr << usageText().toStdString();
        return ExitInvalid;
    }

    const Settings &current = store.current();
    if (m_format == OutputFormat::Json) {
        printJson(current);
        return ExitOk;
    }
    std::cout << "Company: " << current.companyName << "\n";
    std::cout << "Phone: " << current.companyPhone << "\n";
    std::cout << "Address: " << current.companyAddress << "\n";
    std::cout << "Currency: " << current.defaultCurrency << "\n";
    std::cout << "Theme: " << current.theme << "\n";
    std::cout << "Language: " << current.language << "\n";
    std::cout << "Max discount: " << quantity(current.maxDiscount) << "%\n";
    return ExitOk;
}

int NouraCli::runLogin(const QStringList &args)
{
    const std::string username = getArgValue(args, QStringLiteral("--username")).toStdString();
    const std::string password = getArgValue(args, QStringLiteral("--password")).toStdString();
    const std::string license = getArgValue(args, QStringLiteral("--license")).toStdString();

    auto engine = openEngine();
    if (!engine->credentials().authenticate(username, password, license)) {
        std::cerr << "Invalid credentials or license key." << std::endl;
        return ExitAuthFailed;
    }

    std::cout << "Login succeeded for " << username << "\n";
    if (engine->credentials().usesDefaultCredentials()) {
        std::cerr << "warning: development default credentials are still active." << std::endl;
    }
    return ExitOk;
}

int NouraCli::runAdmin(const QStringList &args)
{
    const QString action = args.value(2);
    auto engine = openEngine();
    CredentialStore &credentials = engine->credentials();

    if (action == QStringLiteral("list")) {
        const auto users = credentials.listUsers();
        if (m_format == OutputFormat::Json) {
            printJson(users);
            return ExitOk;
        }
        for (const auto &user : users) {
            std::cout << user.username << "  license " << user.licenseKey << "  "
                      << (user.active ? "active" : "inactive") << "\n";
        }
        return ExitOk;
    }
    if (action == QStringLiteral("passwd")) {
        const std::string username = requireText(args, QStringLiteral("--username"));
        credentials.updateCredentials(username,
                                      requireText(args, QStringLiteral("--password")),
                                      requireText(args, QStringLiteral("--license")));
        std::cout << "Updated credentials for " << username << "\n";
        return ExitOk;
    }
    if (action == QStringLiteral("activate") || action == QStringLiteral("deactivate")) {
        const std::string username = requireText(args, QStringLiteral("--username"));
        const bool active = action == QStringLiteral("activate");
        credentials.setActive(username, active);
        std::cout << (active ? "Activated " : "Deactivated ") << username << "\n";
        return ExitOk;
    }

    std::cerr << usageText().toStdString();
    return ExitInvalid;
}

int NouraCli::runReport(const QStringList &args)
{
    const QString action = args.value(2);
    auto engine = openEngine();
    ReportingViews &reports = engine->reports();
    const std::string &currency = engine->settings().current().defaultCurrency;

    if (action == QStringLiteral("totals")) {
        const TotalsSummary totals = reports.totals();
        if (m_format == OutputFormat::Json) {
            printJson(totals);
            return ExitOk;
        }
        std::cout << "Total customers: " << totals.totalCustomers << "\n";
        std::cout << "Total invoices: " << totals.totalInvoices << "\n";
        std::cout << "Total revenue: " << money(totals.totalRevenue) << " " << currency << "\n";
        std::cout << "Status breakdown:\n";
        for (const auto &[status, amount] : totals.statusBreakdown) {
            std::cout << "  " << status << ": " << money(amount) << " " << currency << "\n";
        }
        return ExitOk;
    }
    if (action == QStringLiteral("income")) {
        const QString periodValue = getArgValue(args, QStringLiteral("--period"));
        const auto period = parsePeriodString(
            periodValue.isEmpty() ? std::string("monthly") : periodValue.toLower().toStdString());
        if (!period.has_value()) {
            throw ValidationError("--period must be daily, monthly or yearly");
        }

        std::optional<std::string> from;
        std::optional<std::string> to;
        if (args.contains(QStringLiteral("--from"))) {
            from = getArgValue(args, QStringLiteral("--from")).toStdString();
        }
        if (args.contains(QStringLiteral("--to"))) {
            to = getArgValue(args, QStringLiteral("--to")).toStdString();
        }

        const auto buckets = reports.income(*period, from, to);
        if (m_format == OutputFormat::Json) {
            printJson(nlohmann::json{{"period", toPeriodString(*period)}, {"buckets", buckets}});
            return ExitOk;
        }
        if (buckets.empty()) {
            std::cout << "No income in this period.\n";
            return ExitOk;
        }
        for (const auto &bucket : buckets) {
            std::cout << bucket.period << "  gross " << money(bucket.gross)
                      << "  net " << money(bucket.net) << " " << currency << "\n";
        }
        return ExitOk;
    }
    if (action == QStringLiteral("products")) {
        const auto sales = reports.productSales();
        if (m_format == OutputFormat::Json) {
            printJson(sales);
            return ExitOk;
        }
        for (const auto &entry : sales) {
            std::cout << entry.productName << "  sold " << quantity(entry.quantitySold)
                      << "  revenue " << money(entry.revenue) << " " << currency << "\n";
        }
        return ExitOk;
    }

    std::cerr << usageText().toStdString();
    return ExitInvalid;
}

} // namespace noura

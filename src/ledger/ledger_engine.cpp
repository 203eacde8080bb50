#include "ledger/ledger_engine.hpp"

#include <cmath>
#include <optional>

#include <QDate>
#include <QString>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "store/sqlite_helpers.hpp"

namespace noura {

namespace {

constexpr double kQuantityEpsilon = 1e-9;

bool isWholeNumber(double value)
{
    return std::fabs(value - std::round(value)) <= kQuantityEpsilon;
}

bool isValidDate(const std::string &value)
{
    return QDate::fromString(QString::fromStdString(value), Qt::ISODate).isValid();
}

std::string itemLabel(size_t index, const InvoiceItem &item)
{
    std::string label = "item " + std::to_string(index + 1);
    if (!item.description.empty()) {
        label += " ('" + item.description + "')";
    }
    return label;
}

void logCommitted(const QString &operation, const QString &action,
                  std::optional<int64_t> invoiceId, const nlohmann::json &details)
{
    logging::MutationEvent event;
    event.component = QStringLiteral("LedgerEngine");
    event.operation = operation;
    event.action = action;
    event.entity = "invoice";
    event.entityId = invoiceId;
    event.details = details;
    logging::logMutation(event);
}

void logRejected(const QString &operation, std::optional<int64_t> invoiceId,
                 const nlohmann::json &details, const NouraError &error)
{
    logging::MutationEvent event;
    event.component = QStringLiteral("LedgerEngine");
    event.operation = operation;
    event.entity = "invoice";
    event.entityId = invoiceId;
    event.outcome = dynamic_cast<const StorageError *>(&error)
        ? logging::MutationOutcome::Failed
        : logging::MutationOutcome::Rejected;
    event.error = error.what();
    event.details = details;
    if (const auto *stock = dynamic_cast<const StockInsufficientError *>(&error)) {
        event.details["productId"] = stock->productId();
        event.details["productName"] = stock->productName();
        event.details["available"] = stock->available();
        event.details["requested"] = stock->requested();
    }
    logging::logMutation(event);
}

InvoiceItem readItem(sqlite3_stmt *stmt)
{
    InvoiceItem item;
    item.id = sqlite3_column_int64(stmt, 0);
    item.invoiceId = sqlite3_column_int64(stmt, 1);
    item.productId = sqlite::columnOptionalId(stmt, 2);
    item.description = sqlite::columnText(stmt, 3);
    item.quantity = sqlite3_column_double(stmt, 4);
    item.unitPrice = sqlite3_column_double(stmt, 5);
    item.discount = sqlite3_column_double(stmt, 6);
    item.lineTotal = sqlite3_column_double(stmt, 7);
    return item;
}

} // namespace

LedgerEngine::LedgerEngine(NouraDatabase &database, const Settings &settings)
    : m_database(database)
    , m_settings(settings)
{
}

std::string LedgerEngine::generateInvoiceNumber(const QDateTime &now)
{
    return "INV-" + now.toString(QStringLiteral("yyyyMMdd-HHmmss")).toStdString();
}

double LedgerEngine::computeLineTotal(double quantity, double unitPrice, double discount)
{
    return quantity * unitPrice * (1.0 - discount / 100.0);
}

int64_t LedgerEngine::createInvoice(const Invoice &header, const std::vector<InvoiceItem> &items)
{
    const nlohmann::json details{{"invoiceNumber", header.invoiceNumber},
                                 {"items", items.size()}};
    try {
        const StockDemand demand = demandFor(items);

        sqlite::TransactionScope scope(m_database.handle());
        validateHeader(header);
        validateItems(items);
        validateStock(demand);

        const int64_t invoiceId = insertHeader(header);
        insertItems(invoiceId, items);
        debitStock(demand);
        scope.commit();

        logCommitted(QStringLiteral("createInvoice"), QStringLiteral("invoice_created"),
                     invoiceId, details);
        return invoiceId;
    } catch (const NouraError &error) {
        logRejected(QStringLiteral("createInvoice"), std::nullopt, details, error);
        throw;
    }
}

void LedgerEngine::updateInvoice(int64_t invoiceId,
                                 const Invoice &header,
                                 const std::vector<InvoiceItem> &items)
{
    const nlohmann::json details{{"invoiceNumber", header.invoiceNumber},
                                 {"items", items.size()}};
    try {
        const StockDemand demand = demandFor(items);

        sqlite::TransactionScope scope(m_database.handle());
        if (!invoiceExists(invoiceId)) {
            throw NotFoundError("invoice " + std::to_string(invoiceId) + " not found");
        }

        // The new set may reuse what the old set held, so credit first.
        creditStock(storedDemand(invoiceId));

        validateHeader(header);
        validateItems(items);
        validateStock(demand);

        updateHeader(invoiceId, header);
        deleteItems(invoiceId);
        insertItems(invoiceId, items);
        debitStock(demand);
        scope.commit();

        logCommitted(QStringLiteral("updateInvoice"), QStringLiteral("invoice_updated"),
                     invoiceId, details);
    } catch (const NouraError &error) {
        logRejected(QStringLiteral("updateInvoice"), invoiceId, details, error);
        throw;
    }
}

void LedgerEngine::deleteInvoice(int64_t invoiceId)
{
    try {
        sqlite::TransactionScope scope(m_database.handle());
        if (!invoiceExists(invoiceId)) {
            throw NotFoundError("invoice " + std::to_string(invoiceId) + " not found");
        }

        creditStock(storedDemand(invoiceId));
        deleteItems(invoiceId);

        sqlite::Statement stmt(m_database.handle(), "DELETE FROM invoices WHERE id = ?;");
        sqlite3_bind_int64(stmt.get(), 1, invoiceId);
        stmt.run("failed to delete invoice");
        scope.commit();

        logCommitted(QStringLiteral("deleteInvoice"), QStringLiteral("invoice_deleted"),
                     invoiceId, nlohmann::json::object());
    } catch (const NouraError &error) {
        logRejected(QStringLiteral("deleteInvoice"), invoiceId, nlohmann::json::object(), error);
        throw;
    }
}

void LedgerEngine::validateHeader(const Invoice &header) const
{
    if (header.invoiceNumber.empty()) {
        throw ValidationError("invoice number is required");
    }
    if (!header.invoiceDate.empty() && !isValidDate(header.invoiceDate)) {
        throw ValidationError("invoice date '" + header.invoiceDate + "' is not yyyy-MM-dd");
    }
    if (!header.dueDate.empty() && !isValidDate(header.dueDate)) {
        throw ValidationError("due date '" + header.dueDate + "' is not yyyy-MM-dd");
    }
    if (!std::isfinite(header.totalAmount)) {
        throw ValidationError("invoice total is not a number");
    }

    if (header.customerId.has_value()) {
        sqlite::Statement stmt(m_database.handle(),
                               "SELECT 1 FROM customers WHERE id = ? LIMIT 1;");
        sqlite3_bind_int64(stmt.get(), 1, *header.customerId);
        if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
            throw ValidationError("customer " + std::to_string(*header.customerId)
                                  + " does not exist");
        }
    }
}

void LedgerEngine::validateItems(const std::vector<InvoiceItem> &items) const
{
    if (items.empty()) {
        throw ValidationError("an invoice needs at least one item");
    }

    for (size_t i = 0; i < items.size(); ++i) {
        const InvoiceItem &item = items[i];
        if (!std::isfinite(item.quantity) || item.quantity < 0.0) {
            throw ValidationError(itemLabel(i, item) + ": quantity must not be negative");
        }
        if (!std::isfinite(item.unitPrice) || item.unitPrice < 0.0) {
            throw ValidationError(itemLabel(i, item) + ": unit price must not be negative");
        }
        if (!std::isfinite(item.discount) || item.discount < 0.0 || item.discount > 100.0) {
            throw ValidationError(itemLabel(i, item) + ": discount must be between 0 and 100");
        }
        if (m_settings.maxDiscount > 0.0 && item.discount > m_settings.maxDiscount) {
            throw ValidationError(itemLabel(i, item) + ": discount exceeds the allowed maximum of "
                                  + std::to_string(m_settings.maxDiscount) + "%");
        }
        if (item.productId.has_value() && !isWholeNumber(item.quantity)) {
            throw ValidationError(itemLabel(i, item)
                                  + ": stocked products need a whole-number quantity");
        }
    }
}

void LedgerEngine::validateStock(const StockDemand &demand) const
{
    sqlite::Statement stmt(m_database.handle(),
                           "SELECT name, stock FROM products WHERE id = ? LIMIT 1;");
    for (const auto &[productId, requested] : demand) {
        sqlite3_reset(stmt.get());
        sqlite3_bind_int64(stmt.get(), 1, productId);
        if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
            throw ProductNotFoundError(productId);
        }
        const std::string name = sqlite::columnText(stmt.get(), 0);
        const double available = sqlite3_column_double(stmt.get(), 1);
        if (available < requested) {
            throw StockInsufficientError(productId, name, available, requested);
        }
    }
}

LedgerEngine::StockDemand LedgerEngine::demandFor(const std::vector<InvoiceItem> &items)
{
    StockDemand demand;
    for (const auto &item : items) {
        // Stocked quantities are whole within kQuantityEpsilon; count them the
        // way debitStock will.
        if (item.productId.has_value()) {
            demand[*item.productId] += static_cast<double>(std::llround(item.quantity));
        }
    }
    return demand;
}

LedgerEngine::StockDemand LedgerEngine::storedDemand(int64_t invoiceId) const
{
    sqlite::Statement stmt(m_database.handle(),
                           "SELECT product_id, quantity FROM invoice_items "
                           "WHERE invoice_id = ? AND product_id IS NOT NULL;");
    sqlite3_bind_int64(stmt.get(), 1, invoiceId);

    StockDemand demand;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        demand[sqlite3_column_int64(stmt.get(), 0)] +=
            static_cast<double>(std::llround(sqlite3_column_double(stmt.get(), 1)));
    }
    return demand;
}

bool LedgerEngine::invoiceExists(int64_t invoiceId) const
{
    sqlite::Statement stmt(m_database.handle(), "SELECT 1 FROM invoices WHERE id = ? LIMIT 1;");
    sqlite3_bind_int64(stmt.get(), 1, invoiceId);
    return sqlite3_step(stmt.get()) == SQLITE_ROW;
}

int64_t LedgerEngine::insertHeader(const Invoice &header)
{
    sqlite::Statement stmt(m_database.handle(),
                           "INSERT INTO invoices (invoice_number, customer_id, invoice_date, "
                           "due_date, total_amount, status, created_at) "
                           "VALUES (?, ?, ?, ?, ?, ?, ?);");
    sqlite::bindText(stmt.get(), 1, header.invoiceNumber);
    sqlite::bindOptionalId(stmt.get(), 2, header.customerId);
    sqlite::bindOptionalText(stmt.get(), 3, header.invoiceDate);
    sqlite::bindOptionalText(stmt.get(), 4, header.dueDate);
    sqlite3_bind_double(stmt.get(), 5, header.totalAmount);
    sqlite::bindOptionalText(stmt.get(), 6, header.status);
    sqlite::bindText(stmt.get(), 7, sqlite::nowTimestamp());
    stmt.run("failed to insert invoice");
    return sqlite3_last_insert_rowid(m_database.handle());
}

void LedgerEngine::updateHeader(int64_t invoiceId, const Invoice &header)
{
    sqlite::Statement stmt(m_database.handle(),
                           "UPDATE invoices SET invoice_number = ?, customer_id = ?, "
                           "invoice_date = ?, due_date = ?, total_amount = ?, status = ? "
                           "WHERE id = ?;");
    sqlite::bindText(stmt.get(), 1, header.invoiceNumber);
    sqlite::bindOptionalId(stmt.get(), 2, header.customerId);
    sqlite::bindOptionalText(stmt.get(), 3, header.invoiceDate);
    sqlite::bindOptionalText(stmt.get(), 4, header.dueDate);
    sqlite3_bind_double(stmt.get(), 5, header.totalAmount);
    sqlite::bindOptionalText(stmt.get(), 6, header.status);
    sqlite3_bind_int64(stmt.get(), 7, invoiceId);
    stmt.run("failed to update invoice");
}

void LedgerEngine::insertItems(int64_t invoiceId, const std::vector<InvoiceItem> &items)
{
    sqlite::Statement stmt(m_database.handle(),
                           "INSERT INTO invoice_items (invoice_id, product_id, description, "
                           "quantity, unit_price, discount, line_total) "
                           "VALUES (?, ?, ?, ?, ?, ?, ?);");
    for (const auto &item : items) {
        sqlite3_reset(stmt.get());
        sqlite3_clear_bindings(stmt.get());
        sqlite3_bind_int64(stmt.get(), 1, invoiceId);
        sqlite::bindOptionalId(stmt.get(), 2, item.productId);
        sqlite::bindOptionalText(stmt.get(), 3, item.description);
        sqlite3_bind_double(stmt.get(), 4, item.quantity);
        sqlite3_bind_double(stmt.get(), 5, item.unitPrice);
        sqlite3_bind_double(stmt.get(), 6, item.discount);
        sqlite3_bind_double(stmt.get(), 7, item.lineTotal);
        stmt.run("failed to insert invoice item");
    }
}

void LedgerEngine::deleteItems(int64_t invoiceId)
{
    sqlite::Statement stmt(m_database.handle(), "DELETE FROM invoice_items WHERE invoice_id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, invoiceId);
    stmt.run("failed to delete invoice items");
}

void LedgerEngine::debitStock(const StockDemand &demand)
{
    sqlite::Statement stmt(m_database.handle(),
                           "UPDATE products SET stock = stock - ? "
                           "WHERE id = ? AND stock >= ?;");
    for (const auto &[productId, quantity] : demand) {
        const int64_t amount = std::llround(quantity);
        sqlite3_reset(stmt.get());
        sqlite3_bind_int64(stmt.get(), 1, amount);
        sqlite3_bind_int64(stmt.get(), 2, productId);
        sqlite3_bind_int64(stmt.get(), 3, amount);
        stmt.run("failed to debit stock");

        // validateStock ran in this transaction, so this is a broken invariant.
        if (sqlite3_changes(m_database.handle()) != 1) {
            throw StorageError("stock debit for product " + std::to_string(productId)
                               + " did not apply");
        }
    }
}

void LedgerEngine::creditStock(const StockDemand &demand)
{
    sqlite::Statement stmt(m_database.handle(),
                           "UPDATE products SET stock = stock + ? WHERE id = ?;");
    for (const auto &[productId, quantity] : demand) {
        sqlite3_reset(stmt.get());
        sqlite3_bind_int64(stmt.get(), 1, std::llround(quantity));
        sqlite3_bind_int64(stmt.get(), 2, productId);
        stmt.run("failed to credit stock");

        if (sqlite3_changes(m_database.handle()) == 0) {
            NLOG_WARN(QStringLiteral("LedgerEngine"),
                      QStringLiteral("creditStock"),
                      QStringLiteral("credit_skipped"),
                      QStringLiteral("product_missing"),
                      QStringLiteral("sqlite_update"),
                      ::noura::logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"productId", productId}, {"quantity", quantity}}));
        }
    }
}

std::vector<InvoiceSummary> LedgerEngine::listInvoices() const
{
    sqlite::Statement stmt(m_database.handle(),
                           "SELECT i.id, i.invoice_number, i.invoice_date, i.due_date, "
                           "i.total_amount, i.status, c.name "
                           "FROM invoices i LEFT JOIN customers c ON c.id = i.customer_id "
                           "ORDER BY i.id DESC;");

    std::vector<InvoiceSummary> invoices;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        InvoiceSummary summary;
        summary.id = sqlite3_column_int64(stmt.get(), 0);
        summary.invoiceNumber = sqlite::columnText(stmt.get(), 1);
        summary.invoiceDate = sqlite::columnText(stmt.get(), 2);
        summary.dueDate = sqlite::columnText(stmt.get(), 3);
        summary.totalAmount = sqlite3_column_double(stmt.get(), 4);
        summary.status = sqlite::columnText(stmt.get(), 5);
        summary.customerName = sqlite::columnText(stmt.get(), 6);
        invoices.push_back(std::move(summary));
    }
    return invoices;
}

std::optional<Invoice> LedgerEngine::getInvoice(int64_t invoiceId) const
{
    sqlite::Statement stmt(m_database.handle(),
                           "SELECT id, invoice_number, customer_id, invoice_date, due_date, "
                           "total_amount, status, created_at FROM invoices WHERE id = ? LIMIT 1;");
    sqlite3_bind_int64(stmt.get(), 1, invoiceId);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }

    Invoice invoice;
    invoice.id = sqlite3_column_int64(stmt.get(), 0);
    invoice.invoiceNumber = sqlite::columnText(stmt.get(), 1);
    invoice.customerId = sqlite::columnOptionalId(stmt.get(), 2);
    invoice.invoiceDate = sqlite::columnText(stmt.get(), 3);
    invoice.dueDate = sqlite::columnText(stmt.get(), 4);
    invoice.totalAmount = sqlite3_column_double(stmt.get(), 5);
    invoice.status = sqlite::columnText(stmt.get(), 6);
    invoice.createdAt = sqlite::columnText(stmt.get(), 7);
    return invoice;
}

std::vector<InvoiceItem> LedgerEngine::getInvoiceItems(int64_t invoiceId) const
{
    sqlite::Statement stmt(m_database.handle(),
                           "SELECT id, invoice_id, product_id, description, quantity, "
                           "unit_price, discount, line_total FROM invoice_items "
                           "WHERE invoice_id = ? ORDER BY id ASC;");
    sqlite3_bind_int64(stmt.get(), 1, invoiceId);

    std::vector<InvoiceItem> items;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        items.push_back(readItem(stmt.get()));
    }
    return items;
}

std::optional<InvoiceDetail> LedgerEngine::getInvoiceDetail(int64_t invoiceId) const
{
    const auto invoice = getInvoice(invoiceId);
    if (!invoice.has_value()) {
        return std::nullopt;
    }

    InvoiceDetail detail;
    detail.invoice = *invoice;

    if (invoice->customerId.has_value()) {
        sqlite::Statement stmt(m_database.handle(),
                               "SELECT id, name, email, phone, address, tax_number, created_at "
                               "FROM customers WHERE id = ? LIMIT 1;");
        sqlite3_bind_int64(stmt.get(), 1, *invoice->customerId);
        if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            Customer customer;
            customer.id = sqlite3_column_int64(stmt.get(), 0);
            customer.name = sqlite::columnText(stmt.get(), 1);
            customer.email = sqlite::columnText(stmt.get(), 2);
            customer.phone = sqlite::columnText(stmt.get(), 3);
            customer.address = sqlite::columnText(stmt.get(), 4);
            customer.taxNumber = sqlite::columnText(stmt.get(), 5);
            customer.createdAt = sqlite::columnText(stmt.get(), 6);
            detail.customer = std::move(customer);
        }
    }

    sqlite::Statement items(m_database.handle(),
                            "SELECT ii.id, ii.invoice_id, ii.product_id, ii.description, "
                            "ii.quantity, ii.unit_price, ii.discount, ii.line_total, p.name "
                            "FROM invoice_items ii LEFT JOIN products p ON p.id = ii.product_id "
                            "WHERE ii.invoice_id = ? ORDER BY ii.id ASC;");
    sqlite3_bind_int64(items.get(), 1, invoiceId);
    while (sqlite3_step(items.get()) == SQLITE_ROW) {
        InvoiceDetailItem entry;
        entry.item = readItem(items.get());
        entry.productName = sqlite::columnText(items.get(), 8);
        if (entry.productName.empty()) {
            entry.productName = entry.item.description;
        }
        detail.items.push_back(std::move(entry));
    }

    return detail;
}

} // namespace noura

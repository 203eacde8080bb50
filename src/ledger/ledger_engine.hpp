#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <QDateTime>

#include "common/models.hpp"
#include "store/noura_database.hpp"

namespace noura {

/**
 * LedgerEngine owns invoices, their items and the stock they consume.
 *
 * Each of createInvoice/updateInvoice/deleteInvoice runs in exactly one
 * TransactionScope. Validation happens inside the scope, before the first
 * write that depends on it, and every failure rolls the scope back before the
 * exception leaves the engine:
 * - ValidationError / StockInsufficientError for rejected input
 * - NotFoundError / ProductNotFoundError for unknown ids
 * - StorageError for SQLite failures
 *
 * Items that reference a product must carry a whole-number quantity, since
 * stock is an integer count. Ad-hoc items (no product) are never checked
 * against stock and may be fractional.
 */
class LedgerEngine {
public:
    LedgerEngine(NouraDatabase &database, const Settings &settings);

    int64_t createInvoice(const Invoice &header, const std::vector<InvoiceItem> &items);

    // Credits the stored items back, validates the new set against the
    // replenished stock, then replaces header and items and debits again.
    void updateInvoice(int64_t invoiceId,
                       const Invoice &header,
                       const std::vector<InvoiceItem> &items);

    void deleteInvoice(int64_t invoiceId);

    std::vector<InvoiceSummary> listInvoices() const;
    std::optional<Invoice> getInvoice(int64_t invoiceId) const;
    std::vector<InvoiceItem> getInvoiceItems(int64_t invoiceId) const;
    std::optional<InvoiceDetail> getInvoiceDetail(int64_t invoiceId) const;

    static std::string generateInvoiceNumber(const QDateTime &now);
    static double computeLineTotal(double quantity, double unitPrice, double discount);

private:
    // Requested quantity per referenced product, summed over all items.
    using StockDemand = std::map<int64_t, double>;

    void validateHeader(const Invoice &header) const;
    void validateItems(const std::vector<InvoiceItem> &items) const;
    void validateStock(const StockDemand &demand) const;

    static StockDemand demandFor(const std::vector<InvoiceItem> &items);
    StockDemand storedDemand(int64_t invoiceId) const;

    bool invoiceExists(int64_t invoiceId) const;
    int64_t insertHeader(const Invoice &header);
    void updateHeader(int64_t invoiceId, const Invoice &header);
    void insertItems(int64_t invoiceId, const std::vector<InvoiceItem> &items);
    void deleteItems(int64_t invoiceId);
    void debitStock(const StockDemand &demand);
    void creditStock(const StockDemand &demand);

    NouraDatabase &m_database;
    const Settings &m_settings;
};

} // namespace noura

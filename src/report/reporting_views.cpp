#include "report/reporting_views.hpp"

#include <QDate>
#include <QString>

#include "common/errors.hpp"
#include "store/sqlite_helpers.hpp"

namespace noura {

namespace {

const char *bucketFormat(ReportPeriod period)
{
    switch (period) {
    case ReportPeriod::Daily:
        return "%Y-%m-%d";
    case ReportPeriod::Monthly:
        return "%Y-%m";
    case ReportPeriod::Yearly:
        return "%Y";
    }
    return "%Y-%m";
}

void bindDateBound(sqlite3_stmt *stmt, int index, const std::optional<std::string> &value)
{
    if (!value.has_value()) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    if (!QDate::fromString(QString::fromStdString(*value), Qt::ISODate).isValid()) {
        throw ValidationError("report bound '" + *value + "' is not yyyy-MM-dd");
    }
    sqlite::bindText(stmt, index, *value);
}

int64_t scalarInt(sqlite3 *db, const char *sql)
{
    sqlite::Statement stmt(db, sql);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw StorageError("report query failed: " + sqlite::lastError(db));
    }
    return sqlite3_column_int64(stmt.get(), 0);
}

} // namespace

ReportingViews::ReportingViews(NouraDatabase &database)
    : m_database(database)
{
}

TotalsSummary ReportingViews::totals() const
{
    sqlite3 *db = m_database.handle();

    TotalsSummary summary;
    summary.totalCustomers = scalarInt(db, "SELECT COUNT(*) FROM customers;");

    sqlite::Statement invoices(db,
                               "SELECT COUNT(*), COALESCE(SUM(total_amount), 0) FROM invoices;");
    if (sqlite3_step(invoices.get()) != SQLITE_ROW) {
        throw StorageError("report query failed: " + sqlite::lastError(db));
    }
    summary.totalInvoices = sqlite3_column_int64(invoices.get(), 0);
    summary.totalRevenue = sqlite3_column_double(invoices.get(), 1);

    sqlite::Statement breakdown(db,
                                "SELECT COALESCE(NULLIF(status, ''), 'Unknown') AS bucket, "
                                "COALESCE(SUM(total_amount), 0) FROM invoices "
                                "GROUP BY bucket ORDER BY bucket;");
    while (sqlite3_step(breakdown.get()) == SQLITE_ROW) {
        summary.statusBreakdown[sqlite::columnText(breakdown.get(), 0)] +=
            sqlite3_column_double(breakdown.get(), 1);
    }

    return summary;
}

std::vector<IncomeBucket> ReportingViews::income(ReportPeriod period,
                                                 const std::optional<std::string> &from,
                                                 const std::optional<std::string> &to) const
{
    sqlite::Statement stmt(m_database.handle(),
                           "SELECT strftime(?1, i.invoice_date) AS bucket, "
                           "SUM(ii.quantity * ii.unit_price), "
                           "SUM(ii.quantity * COALESCE(p.cost_price, 0)), "
                           "SUM(ii.quantity * ii.unit_price * COALESCE(ii.discount, 0) / 100.0) "
                           "FROM invoice_items ii "
                           "JOIN invoices i ON i.id = ii.invoice_id "
                           "LEFT JOIN products p ON p.id = ii.product_id "
                           "WHERE i.invoice_date IS NOT NULL "
                           "AND (?2 IS NULL OR i.invoice_date >= ?2) "
                           "AND (?3 IS NULL OR i.invoice_date <= ?3) "
                           "GROUP BY bucket HAVING bucket IS NOT NULL "
                           "ORDER BY bucket ASC;");
    sqlite::bindText(stmt.get(), 1, bucketFormat(period));
    bindDateBound(stmt.get(), 2, from);
    bindDateBound(stmt.get(), 3, to);

    std::vector<IncomeBucket> buckets;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        IncomeBucket bucket;
        bucket.period = sqlite::columnText(stmt.get(), 0);
        bucket.gross = sqlite3_column_double(stmt.get(), 1);
        const double cost = sqlite3_column_double(stmt.get(), 2);
        const double discount = sqlite3_column_double(stmt.get(), 3);
        bucket.net = bucket.gross - cost - discount;
        buckets.push_back(std::move(bucket));
    }
    return buckets;
}

std::vector<ProductSales> ReportingViews::productSales() const
{
    sqlite::Statement stmt(m_database.handle(),
                           "SELECT p.name, SUM(ii.quantity), SUM(ii.line_total) AS revenue "
                           "FROM invoice_items ii JOIN products p ON p.id = ii.product_id "
                           "GROUP BY p.name ORDER BY revenue DESC, p.name ASC;");

    std::vector<ProductSales> sales;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        ProductSales entry;
        entry.productName = sqlite::columnText(stmt.get(), 0);
        entry.quantitySold = sqlite3_column_double(stmt.get(), 1);
        entry.revenue = sqlite3_column_double(stmt.get(), 2);
        sales.push_back(std::move(entry));
    }
    return sales;
}

} // namespace noura

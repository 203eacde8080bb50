#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "store/noura_database.hpp"

namespace noura {

// Read-only aggregates over invoices, items and products.
class ReportingViews {
public:
    explicit ReportingViews(NouraDatabase &database);

    // Invoices without a status are counted under "Unknown".
    TotalsSummary totals() const;

    // Buckets by invoice date; periods with no invoices are absent.
    // from/to are inclusive yyyy-MM-dd bounds.
    std::vector<IncomeBucket> income(ReportPeriod period,
                                     const std::optional<std::string> &from = std::nullopt,
                                     const std::optional<std::string> &to = std::nullopt) const;

    // Ordered by revenue, highest first. Ad-hoc lines are not included.
    std::vector<ProductSales> productSales() const;

private:
    NouraDatabase &m_database;
};

} // namespace noura

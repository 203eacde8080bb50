#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace noura {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::string toPeriodString(ReportPeriod period)
{
    switch (period) {
    case ReportPeriod::Daily:
        return "daily";
    case ReportPeriod::Monthly:
        return "monthly";
    case ReportPeriod::Yearly:
        return "yearly";
    }
    return "monthly";
}

inline std::optional<ReportPeriod> parsePeriodString(const std::string &value)
{
    if (value == "daily") {
        return ReportPeriod::Daily;
    }
    if (value == "monthly") {
        return ReportPeriod::Monthly;
    }
    if (value == "yearly") {
        return ReportPeriod::Yearly;
    }
    return std::nullopt;
}

inline nlohmann::json optionalIdToJson(const std::optional<int64_t> &id)
{
    if (!id.has_value()) {
        return nullptr;
    }
    return *id;
}

inline std::optional<int64_t> optionalIdFromJson(const nlohmann::json &j, const char *key)
{
    if (!j.contains(key) || !j.at(key).is_number_integer()) {
        return std::nullopt;
    }
    return j.at(key).get<int64_t>();
}

inline void to_json(nlohmann::json &j, const Customer &customer)
{
    j = nlohmann::json{
        {"id", customer.id},
        {"name", customer.name},
        {"email", customer.email},
        {"phone", customer.phone},
        {"address", customer.address},
        {"taxNumber", customer.taxNumber},
        {"createdAt", customer.createdAt}
    };
}

inline void from_json(const nlohmann::json &j, Customer &customer)
{
    customer.id = j.value("id", static_cast<int64_t>(0));
    customer.name = j.value("name", "");
    customer.email = j.value("email", "");
    customer.phone = j.value("phone", "");
    customer.address = j.value("address", "");
    customer.taxNumber = j.value("taxNumber", "");
    customer.createdAt = j.value("createdAt", "");
}

inline void to_json(nlohmann::json &j, const Product &product)
{
    j = nlohmann::json{
        {"id", product.id},
        {"name", product.name},
        {"description", product.description},
        {"unitPrice", product.unitPrice},
        {"costPrice", product.costPrice},
        {"salePrice", product.salePrice},
        {"stock", product.stock},
        {"unit", product.unit},
        {"createdAt", product.createdAt}
    };
}

inline void from_json(const nlohmann::json &j, Product &product)
{
    product.id = j.value("id", static_cast<int64_t>(0));
    product.name = j.value("name", "");
    product.description = j.value("description", "");
    product.unitPrice = j.value("unitPrice", 0.0);
    product.costPrice = j.value("costPrice", 0.0);
    product.salePrice = j.value("salePrice", product.unitPrice);
    product.stock = j.value("stock", static_cast<int64_t>(0));
    product.unit = j.value("unit", "");
    product.createdAt = j.value("createdAt", "");
}

inline void to_json(nlohmann::json &j, const Invoice &invoice)
{
    j = nlohmann::json{
        {"id", invoice.id},
        {"invoiceNumber", invoice.invoiceNumber},
        {"customerId", optionalIdToJson(invoice.customerId)},
        {"invoiceDate", invoice.invoiceDate},
        {"dueDate", invoice.dueDate},
        {"totalAmount", invoice.totalAmount},
        {"status", invoice.status},
        {"createdAt", invoice.createdAt}
    };
}

inline void from_json(const nlohmann::json &j, Invoice &invoice)
{
    invoice.id = j.value("id", static_cast<int64_t>(0));
    invoice.invoiceNumber = j.value("invoiceNumber", "");
    invoice.customerId = optionalIdFromJson(j, "customerId");
    invoice.invoiceDate = j.value("invoiceDate", "");
    invoice.dueDate = j.value("dueDate", "");
    invoice.totalAmount = j.value("totalAmount", 0.0);
    invoice.status = j.value("status", "");
    invoice.createdAt = j.value("createdAt", "");
}

inline void to_json(nlohmann::json &j, const InvoiceItem &item)
{
    j = nlohmann::json{
        {"id", item.id},
        {"invoiceId", item.invoiceId},
        {"productId", optionalIdToJson(item.productId)},
        {"description", item.description},
        {"quantity", item.quantity},
        {"unitPrice", item.unitPrice},
        {"discount", item.discount},
        {"lineTotal", item.lineTotal}
    };
}

// lineTotal stays negative when absent so callers can tell it was not supplied.
inline void from_json(const nlohmann::json &j, InvoiceItem &item)
{
    item.id = j.value("id", static_cast<int64_t>(0));
    item.invoiceId = j.value("invoiceId", static_cast<int64_t>(0));
    item.productId = optionalIdFromJson(j, "productId");
    item.description = j.value("description", "");
    item.quantity = j.value("quantity", 0.0);
    item.unitPrice = j.value("unitPrice", 0.0);
    item.discount = j.value("discount", 0.0);
    item.lineTotal = j.value("lineTotal", -1.0);
}

inline void to_json(nlohmann::json &j, const InvoiceSummary &summary)
{
    j = nlohmann::json{
        {"id", summary.id},
        {"invoiceNumber", summary.invoiceNumber},
        {"invoiceDate", summary.invoiceDate},
        {"dueDate", summary.dueDate},
        {"totalAmount", summary.totalAmount},
        {"status", summary.status},
        {"customerName", summary.customerName}
    };
}

inline void to_json(nlohmann::json &j, const InvoiceDetail &detail)
{
    nlohmann::json items = nlohmann::json::array();
    for (const auto &entry : detail.items) {
        nlohmann::json itemJson = entry.item;
        itemJson["productName"] = entry.productName;
        items.push_back(std::move(itemJson));
    }
    j = nlohmann::json{
        {"invoice", detail.invoice},
        {"customer", detail.customer.has_value() ? nlohmann::json(*detail.customer)
                                                 : nlohmann::json(nullptr)},
        {"items", items}
    };
}

inline void to_json(nlohmann::json &j, const Settings &settings)
{
    j = nlohmann::json{
        {"companyName", settings.companyName},
        {"companyPhone", settings.companyPhone},
        {"companyAddress", settings.companyAddress},
        {"defaultCurrency", settings.defaultCurrency},
        {"theme", settings.theme},
        {"language", settings.language},
        {"maxDiscount", settings.maxDiscount}
    };
}

inline void from_json(const nlohmann::json &j, Settings &settings)
{
    const Settings defaults;
    settings.companyName = j.value("companyName", defaults.companyName);
    settings.companyPhone = j.value("companyPhone", defaults.companyPhone);
    settings.companyAddress = j.value("companyAddress", defaults.companyAddress);
    settings.defaultCurrency = j.value("defaultCurrency", defaults.defaultCurrency);
    settings.theme = j.value("theme", defaults.theme);
    settings.language = j.value("language", defaults.language);
    settings.maxDiscount = j.value("maxDiscount", defaults.maxDiscount);
}

inline void to_json(nlohmann::json &j, const AdminUser &user)
{
    j = nlohmann::json{
        {"id", user.id},
        {"username", user.username},
        {"licenseKey", user.licenseKey},
        {"active", user.active}
    };
}

inline void to_json(nlohmann::json &j, const TotalsSummary &totals)
{
    j = nlohmann::json{
        {"totalCustomers", totals.totalCustomers},
        {"totalInvoices", totals.totalInvoices},
        {"totalRevenue", totals.totalRevenue},
        {"statusBreakdown", totals.statusBreakdown}
    };
}

inline void to_json(nlohmann::json &j, const IncomeBucket &bucket)
{
    j = nlohmann::json{
        {"period", bucket.period},
        {"gross", bucket.gross},
        {"net", bucket.net}
    };
}

inline void to_json(nlohmann::json &j, const ProductSales &sales)
{
    j = nlohmann::json{
        {"productName", sales.productName},
        {"quantitySold", sales.quantitySold},
        {"revenue", sales.revenue}
    };
}

} // namespace noura

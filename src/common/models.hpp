#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace noura {

struct Customer {
    int64_t id = 0;
    std::string name;
    std::string email;
    std::string phone;
    std::string address;
    std::string taxNumber;
    std::string createdAt;
};

// unitPrice is the display price kept for rows written by older versions.
// Writes always store salePrice into both columns.
struct Product {
    int64_t id = 0;
    std::string name;
    std::string description;
    double unitPrice = 0.0;
    double costPrice = 0.0;
    double salePrice = 0.0;
    int64_t stock = 0;
    std::string unit;
    std::string createdAt;
};

struct Invoice {
    int64_t id = 0;
    std::string invoiceNumber;
    std::optional<int64_t> customerId;
    std::string invoiceDate;
    std::string dueDate;
    double totalAmount = 0.0;
    std::string status;
    std::string createdAt;
};

// An unset productId marks an ad-hoc line that does not touch stock.
struct InvoiceItem {
    int64_t id = 0;
    int64_t invoiceId = 0;
    std::optional<int64_t> productId;
    std::string description;
    double quantity = 0.0;
    double unitPrice = 0.0;
    double discount = 0.0;
    double lineTotal = 0.0;
};

// Row shape of the invoice list: header plus the customer's display name.
struct InvoiceSummary {
    int64_t id = 0;
    std::string invoiceNumber;
    std::string invoiceDate;
    std::string dueDate;
    double totalAmount = 0.0;
    std::string status;
    std::string customerName;
};

struct InvoiceDetailItem {
    InvoiceItem item;
    std::string productName;
};

// Everything needed to print or export a single invoice.
struct InvoiceDetail {
    Invoice invoice;
    std::optional<Customer> customer;
    std::vector<InvoiceDetailItem> items;
};

struct Settings {
    std::string companyName = "Noura";
    std::string companyPhone;
    std::string companyAddress;
    std::string defaultCurrency = "USD";
    std::string theme = "dark";
    std::string language = "en";
    double maxDiscount = 0.0;
};

struct AdminUser {
    int64_t id = 0;
    std::string username;
    std::string licenseKey;
    bool active = true;
};

struct TotalsSummary {
    int64_t totalCustomers = 0;
    int64_t totalInvoices = 0;
    double totalRevenue = 0.0;
    std::map<std::string, double> statusBreakdown;
};

struct IncomeBucket {
    std::string period;
    double gross = 0.0;
    double net = 0.0;
};

struct ProductSales {
    std::string productName;
    double quantitySold = 0.0;
    double revenue = 0.0;
};

} // namespace noura

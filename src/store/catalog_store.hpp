#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "common/models.hpp"
#include "store/noura_database.hpp"

namespace noura {

// CatalogStore is plain single-row CRUD for customers and products.
// Updates on unknown ids affect zero rows and are not reported. Deleting a
// row still referenced by invoices fails on the foreign key (StorageError).
class CatalogStore {
public:
    explicit CatalogStore(NouraDatabase &database);

    int64_t addCustomer(const Customer &customer);
    void updateCustomer(int64_t id, const Customer &customer);
    void deleteCustomer(int64_t id);
    std::vector<Customer> listCustomers() const;
    std::optional<Customer> getCustomer(int64_t id) const;

    // salePrice is written to both unit_price and sale_price.
    int64_t addProduct(const Product &product);
    void updateProduct(int64_t id, const Product &product);
    void deleteProduct(int64_t id);
    std::vector<Product> listProducts() const;
    std::optional<Product> getProduct(int64_t id) const;

private:
    NouraDatabase &m_database;
};

} // namespace noura

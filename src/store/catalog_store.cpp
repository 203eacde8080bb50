#include "store/catalog_store.hpp"

#include <string>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "store/sqlite_helpers.hpp"

namespace noura {

namespace {

constexpr const char *kSelectCustomer =
    "SELECT id, name, email, phone, address, tax_number, created_at FROM customers";

constexpr const char *kSelectProduct =
    "SELECT id, name, description, unit_price, cost_price, sale_price, stock, unit, "
    "created_at FROM products";

void validateCustomer(const Customer &customer)
{
    if (customer.name.empty()) {
        throw ValidationError("customer name is required");
    }
}

void validateProduct(const Product &product)
{
    if (product.name.empty()) {
        throw ValidationError("product name is required");
    }
    if (product.salePrice < 0.0 || product.unitPrice < 0.0 || product.costPrice < 0.0) {
        throw ValidationError("product prices must not be negative");
    }
    if (product.stock < 0) {
        throw ValidationError("product stock must not be negative");
    }
}

Customer readCustomer(sqlite3_stmt *stmt)
{
    Customer customer;
    customer.id = sqlite3_column_int64(stmt, 0);
    customer.name = sqlite::columnText(stmt, 1);
    customer.email = sqlite::columnText(stmt, 2);
    customer.phone = sqlite::columnText(stmt, 3);
    customer.address = sqlite::columnText(stmt, 4);
    customer.taxNumber = sqlite::columnText(stmt, 5);
    customer.createdAt = sqlite::columnText(stmt, 6);
    return customer;
}

Product readProduct(sqlite3_stmt *stmt)
{
    Product product;
    product.id = sqlite3_column_int64(stmt, 0);
    product.name = sqlite::columnText(stmt, 1);
    product.description = sqlite::columnText(stmt, 2);
    product.unitPrice = sqlite3_column_double(stmt, 3);
    product.costPrice = sqlite3_column_double(stmt, 4);
    product.salePrice = sqlite3_column_double(stmt, 5);
    if (product.salePrice == 0.0) {
        product.salePrice = product.unitPrice;
    }
    product.stock = sqlite3_column_int64(stmt, 6);
    product.unit = sqlite::columnText(stmt, 7);
    product.createdAt = sqlite::columnText(stmt, 8);
    return product;
}

void bindCustomerFields(sqlite3_stmt *stmt, const Customer &customer)
{
    sqlite::bindText(stmt, 1, customer.name);
    sqlite::bindOptionalText(stmt, 2, customer.email);
    sqlite::bindOptionalText(stmt, 3, customer.phone);
    sqlite::bindOptionalText(stmt, 4, customer.address);
    sqlite::bindOptionalText(stmt, 5, customer.taxNumber);
}

// Callers written against the old single-price form only fill unitPrice.
double resolvedSalePrice(const Product &product)
{
    return product.salePrice != 0.0 ? product.salePrice : product.unitPrice;
}

void bindProductFields(sqlite3_stmt *stmt, const Product &product)
{
    const double price = resolvedSalePrice(product);
    sqlite::bindText(stmt, 1, product.name);
    sqlite::bindOptionalText(stmt, 2, product.description);
    sqlite3_bind_double(stmt, 3, price);
    sqlite3_bind_double(stmt, 4, product.costPrice);
    sqlite3_bind_double(stmt, 5, price);
    sqlite3_bind_int64(stmt, 6, product.stock);
    sqlite::bindOptionalText(stmt, 7, product.unit);
}

// Updates and deletes of an unknown id are no-ops; rowsChanged is 0 for those.
void logCatalogChange(const QString &operation, const QString &action, const std::string &entity,
                      int64_t id, int rowsChanged)
{
    logging::MutationEvent event;
    event.component = QStringLiteral("CatalogStore");
    event.operation = operation;
    event.action = action;
    event.entity = entity;
    event.entityId = id;
    event.details = nlohmann::json{{"rowsChanged", rowsChanged}};
    logging::logMutation(event);
}

} // namespace

CatalogStore::CatalogStore(NouraDatabase &database)
    : m_database(database)
{
}

int64_t CatalogStore::addCustomer(const Customer &customer)
{
    validateCustomer(customer);

    sqlite::Statement stmt(m_database.handle(),
                           "INSERT INTO customers (name, email, phone, address, "
                           "tax_number, created_at) VALUES (?, ?, ?, ?, ?, ?);");
    bindCustomerFields(stmt.get(), customer);
    sqlite::bindText(stmt.get(), 6, sqlite::nowTimestamp());
    stmt.run("failed to insert customer");

    const int64_t id = sqlite3_last_insert_rowid(m_database.handle());
    logCatalogChange(QStringLiteral("addCustomer"), QStringLiteral("customer_added"),
                     "customer", id, 1);
    return id;
}

void CatalogStore::updateCustomer(int64_t id, const Customer &customer)
{
    validateCustomer(customer);

    sqlite::Statement stmt(m_database.handle(),
                           "UPDATE customers SET name = ?, email = ?, phone = ?, "
                           "address = ?, tax_number = ? WHERE id = ?;");
    bindCustomerFields(stmt.get(), customer);
    sqlite3_bind_int64(stmt.get(), 6, id);
    stmt.run("failed to update customer");
    logCatalogChange(QStringLiteral("updateCustomer"), QStringLiteral("customer_updated"),
                     "customer", id, sqlite3_changes(m_database.handle()));
}

void CatalogStore::deleteCustomer(int64_t id)
{
    sqlite::Statement stmt(m_database.handle(), "DELETE FROM customers WHERE id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, id);
    stmt.run("failed to delete customer");
    logCatalogChange(QStringLiteral("deleteCustomer"), QStringLiteral("customer_deleted"),
                     "customer", id, sqlite3_changes(m_database.handle()));
}

std::vector<Customer> CatalogStore::listCustomers() const
{
    const std::string sql = std::string(kSelectCustomer) + " ORDER BY id DESC;";
    sqlite::Statement stmt(m_database.handle(), sql.c_str());

    std::vector<Customer> customers;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        customers.push_back(readCustomer(stmt.get()));
    }
    return customers;
}

std::optional<Customer> CatalogStore::getCustomer(int64_t id) const
{
    const std::string sql = std::string(kSelectCustomer) + " WHERE id = ? LIMIT 1;";
    sqlite::Statement stmt(m_database.handle(), sql.c_str());
    sqlite3_bind_int64(stmt.get(), 1, id);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return readCustomer(stmt.get());
}

int64_t CatalogStore::addProduct(const Product &product)
{
    validateProduct(product);

    sqlite::Statement stmt(m_database.handle(),
                           "INSERT INTO products (name, description, unit_price, "
                           "cost_price, sale_price, stock, unit, created_at) "
                           "VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
    bindProductFields(stmt.get(), product);
    sqlite::bindText(stmt.get(), 8, sqlite::nowTimestamp());
    stmt.run("failed to insert product");

    const int64_t id = sqlite3_last_insert_rowid(m_database.handle());
    logCatalogChange(QStringLiteral("addProduct"), QStringLiteral("product_added"),
                     "product", id, 1);
    return id;
}

void CatalogStore::updateProduct(int64_t id, const Product &product)
{
    validateProduct(product);

    sqlite::Statement stmt(m_database.handle(),
                           "UPDATE products SET name = ?, description = ?, unit_price = ?, "
                           "cost_price = ?, sale_price = ?, stock = ?, unit = ? "
                           "WHERE id = ?;");
    bindProductFields(stmt.get(), product);
    sqlite3_bind_int64(stmt.get(), 8, id);
    stmt.run("failed to update product");
    logCatalogChange(QStringLiteral("updateProduct"), QStringLiteral("product_updated"),
                     "product", id, sqlite3_changes(m_database.handle()));
}

void CatalogStore::deleteProduct(int64_t id)
{
    sqlite::Statement stmt(m_database.handle(), "DELETE FROM products WHERE id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, id);
    stmt.run("failed to delete product");
    logCatalogChange(QStringLiteral("deleteProduct"), QStringLiteral("product_deleted"),
                     "product", id, sqlite3_changes(m_database.handle()));
}

std::vector<Product> CatalogStore::listProducts() const
{
    const std::string sql = std::string(kSelectProduct) + " ORDER BY id DESC;";
    sqlite::Statement stmt(m_database.handle(), sql.c_str());

    std::vector<Product> products;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        products.push_back(readProduct(stmt.get()));
    }
    return products;
}

std::optional<Product> CatalogStore::getProduct(int64_t id) const
{
    const std::string sql = std::string(kSelectProduct) + " WHERE id = ? LIMIT 1;";
    sqlite::Statement stmt(m_database.handle(), sql.c_str());
    sqlite3_bind_int64(stmt.get(), 1, id);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return readProduct(stmt.get());
}

} // namespace noura

#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <memory>
#include <vector>

#include "common/errors.hpp"
#include "ledger/ledger_engine.hpp"
#include "store/catalog_store.hpp"
#include "store/noura_database.hpp"
#include "store/sqlite_helpers.hpp"

namespace {

int64_t countRows(sqlite3 *db, const char *sql)
{
    noura::sqlite::Statement stmt(db, sql);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return -1;
    }
    return sqlite3_column_int64(stmt.get(), 0);
}

} // namespace

class CatalogTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();
    void testCustomerCrud();
    void testCustomerNameRequired();
    void testProductCrud();
    void testProductValidation();
    void testLegacySalePriceFallback();
    void testReferencedRowsCannotBeDeleted();
    void testUnknownIdIsNoOp();
    void testListsNewestFirst();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    std::unique_ptr<noura::NouraDatabase> m_database;
    int m_counter = 0;
};

void CatalogTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void CatalogTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void CatalogTests::init()
{
    const QString path = m_tempDir.path() + QStringLiteral("/catalog-%1.db").arg(++m_counter);
    m_database = std::make_unique<noura::NouraDatabase>(path.toStdString());
}

void CatalogTests::cleanup()
{
    m_database.reset();
}

void CatalogTests::testCustomerCrud()
{
    noura::CatalogStore catalog(*m_database);

    noura::Customer ada;
    ada.name = "Ada Lovelace";
    ada.email = "ada@example.com";
    ada.taxNumber = "TR-1";
    const int64_t adaId = catalog.addCustomer(ada);

    noura::Customer bob;
    bob.name = "Bob";
    const int64_t bobId = catalog.addCustomer(bob);
    QVERIFY(bobId > adaId);

    auto customers = catalog.listCustomers();
    QCOMPARE(customers.size(), static_cast<size_t>(2));
    QCOMPARE(customers.front().id, bobId);

    auto loaded = catalog.getCustomer(adaId);
    QVERIFY(loaded.has_value());
    QCOMPARE(QString::fromStdString(loaded->taxNumber), QStringLiteral("TR-1"));
    QVERIFY(!loaded->createdAt.empty());

    loaded->phone = "555-0101";
    catalog.updateCustomer(adaId, *loaded);
    QCOMPARE(QString::fromStdString(catalog.getCustomer(adaId)->phone), QStringLiteral("555-0101"));

    catalog.deleteCustomer(bobId);
    QVERIFY(!catalog.getCustomer(bobId).has_value());
    QCOMPARE(catalog.listCustomers().size(), static_cast<size_t>(1));
}

void CatalogTests::testCustomerNameRequired()
{
    noura::CatalogStore catalog(*m_database);
    noura::Customer nameless;
    nameless.email = "x@example.com";
    QVERIFY_EXCEPTION_THROWN(catalog.addCustomer(nameless), noura::ValidationError);
    QVERIFY(catalog.listCustomers().empty());
}

void CatalogTests::testProductCrud()
{
    noura::CatalogStore catalog(*m_database);

    noura::Product widget;
    widget.name = "Widget";
    widget.salePrice = 4.0;
    widget.costPrice = 2.5;
    widget.stock = 10;
    widget.unit = "pcs";
    const int64_t id = catalog.addProduct(widget);

    auto loaded = catalog.getProduct(id);
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->salePrice, 4.0);
    QCOMPARE(loaded->unitPrice, 4.0);
    QCOMPARE(loaded->costPrice, 2.5);
    QCOMPARE(loaded->stock, static_cast<int64_t>(10));

    loaded->salePrice = 5.0;
    loaded->stock = 12;
    catalog.updateProduct(id, *loaded);
    loaded = catalog.getProduct(id);
    QCOMPARE(loaded->salePrice, 5.0);
    QCOMPARE(loaded->unitPrice, 5.0);
    QCOMPARE(loaded->stock, static_cast<int64_t>(12));

    catalog.deleteProduct(id);
    QVERIFY(!catalog.getProduct(id).has_value());
    QVERIFY(catalog.listProducts().empty());
}

void CatalogTests::testProductValidation()
{
    noura::CatalogStore catalog(*m_database);

    noura::Product unnamed;
    unnamed.salePrice = 1.0;
    QVERIFY_EXCEPTION_THROWN(catalog.addProduct(unnamed), noura::ValidationError);

    noura::Product negativePrice;
    negativePrice.name = "Bad";
    negativePrice.salePrice = -1.0;
    QVERIFY_EXCEPTION_THROWN(catalog.addProduct(negativePrice), noura::ValidationError);

    noura::Product negativeStock;
    negativeStock.name = "Bad";
    negativeStock.stock = -3;
    QVERIFY_EXCEPTION_THROWN(catalog.addProduct(negativeStock), noura::ValidationError);

    QVERIFY(catalog.listProducts().empty());
}

void CatalogTests::testLegacySalePriceFallback()
{
    noura::CatalogStore catalog(*m_database);
    noura::sqlite::execOrThrow(m_database->handle(),
                               "INSERT INTO products (name, unit_price, sale_price, stock) "
                               "VALUES ('Legacy', 7.25, 0, 2);");

    const auto products = catalog.listProducts();
    QCOMPARE(products.size(), static_cast<size_t>(1));
    QCOMPARE(products.front().salePrice, 7.25);
}

void CatalogTests::testReferencedRowsCannotBeDeleted()
{
    noura::CatalogStore catalog(*m_database);
    const noura::Settings settings;
    noura::LedgerEngine ledger(*m_database, settings);

    noura::Customer customer;
    customer.name = "Ada";
    const int64_t customerId = catalog.addCustomer(customer);

    noura::Product product;
    product.name = "Widget";
    product.salePrice = 4.0;
    product.stock = 5;
    const int64_t productId = catalog.addProduct(product);

    noura::Invoice header;
    header.invoiceNumber = "INV-REF-1";
    header.customerId = customerId;
    header.invoiceDate = "2024-03-01";
    noura::InvoiceItem item;
    item.productId = productId;
    item.quantity = 1.0;
    item.unitPrice = 4.0;
    item.lineTotal = 4.0;
    ledger.createInvoice(header, {item});

    QVERIFY_EXCEPTION_THROWN(catalog.deleteCustomer(customerId), noura::StorageError);
    QVERIFY_EXCEPTION_THROWN(catalog.deleteProduct(productId), noura::StorageError);
    QVERIFY(catalog.getCustomer(customerId).has_value());
    QVERIFY(catalog.getProduct(productId).has_value());
}

void CatalogTests::testUnknownIdIsNoOp()
{
    noura::CatalogStore catalog(*m_database);

    noura::Customer customer;
    customer.name = "Existing";
    const int64_t customerId = catalog.addCustomer(customer);

    noura::Product product;
    product.name = "Existing";
    product.salePrice = 3.0;
    product.stock = 2;
    const int64_t productId = catalog.addProduct(product);

    noura::Customer renamedCustomer;
    renamedCustomer.name = "Ghost";
    noura::Product renamedProduct = product;
    renamedProduct.name = "Ghost";

    const int64_t unknownId = 9999;
    try {
        catalog.updateCustomer(unknownId, renamedCustomer);
        catalog.deleteCustomer(unknownId);
        catalog.updateProduct(unknownId, renamedProduct);
        catalog.deleteProduct(unknownId);
    } catch (const std::exception &error) {
        QFAIL(error.what());
    }

    QCOMPARE(countRows(m_database->handle(), "SELECT COUNT(*) FROM customers;"),
             static_cast<int64_t>(1));
    QCOMPARE(countRows(m_database->handle(), "SELECT COUNT(*) FROM products;"),
             static_cast<int64_t>(1));
    QVERIFY(!catalog.getCustomer(unknownId).has_value());
    QVERIFY(!catalog.getProduct(unknownId).has_value());
    QCOMPARE(QString::fromStdString(catalog.getCustomer(customerId)->name),
             QStringLiteral("Existing"));
    QCOMPARE(QString::fromStdString(catalog.getProduct(productId)->name),
             QStringLiteral("Existing"));
}

void CatalogTests::testListsNewestFirst()
{
    noura::CatalogStore catalog(*m_database);

    std::vector<int64_t> customerIds;
    std::vector<int64_t> productIds;
    for (const char *name : {"First", "Second", "Third"}) {
        noura::Customer customer;
        customer.name = name;
        customerIds.push_back(catalog.addCustomer(customer));

        noura::Product product;
        product.name = name;
        product.salePrice = 1.0;
        productIds.push_back(catalog.addProduct(product));
    }

    const auto customers = catalog.listCustomers();
    QCOMPARE(customers.size(), static_cast<size_t>(3));
    QCOMPARE(customers[0].id, customerIds[2]);
    QCOMPARE(customers[1].id, customerIds[1]);
    QCOMPARE(customers[2].id, customerIds[0]);
    QCOMPARE(QString::fromStdString(customers[0].name), QStringLiteral("Third"));

    const auto products = catalog.listProducts();
    QCOMPARE(products.size(), static_cast<size_t>(3));
    QCOMPARE(products[0].id, productIds[2]);
    QCOMPARE(products[1].id, productIds[1]);
    QCOMPARE(products[2].id, productIds[0]);
    QCOMPARE(QString::fromStdString(products[2].name), QStringLiteral("First"));
}

QTEST_MAIN(CatalogTests)
#include "test_catalog.moc"

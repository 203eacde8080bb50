#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <memory>

#include "common/errors.hpp"
#include "ledger/ledger_engine.hpp"
#include "report/reporting_views.hpp"
#include "store/catalog_store.hpp"
#include "store/noura_database.hpp"

class ReportingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();
    void testEmptyStore();
    void testTotals();
    void testMonthlyIncome();
    void testDailyAndYearlyIncome();
    void testIncomeBounds();
    void testProductSales();

private:
    void seedLedger();

    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    std::unique_ptr<noura::NouraDatabase> m_database;
    std::unique_ptr<noura::ReportingViews> m_reports;
    noura::Settings m_settings;
    int m_counter = 0;
};

void ReportingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void ReportingTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void ReportingTests::init()
{
    const QString path = m_tempDir.path() + QStringLiteral("/reporting-%1.db").arg(++m_counter);
    m_database = std::make_unique<noura::NouraDatabase>(path.toStdString());
    m_reports = std::make_unique<noura::ReportingViews>(*m_database);
}

void ReportingTests::cleanup()
{
    m_reports.reset();
    m_database.reset();
}

// Three invoices over two months:
//   2024-01-15 Paid: 2 x Widget @ 10, 10% off          = 18
//   2024-01-20 (no status): ad-hoc consulting @ 50     = 50
//   2024-02-03 Paid: 1 x Widget @ 10, 1 x Gadget @ 30  = 40
void ReportingTests::seedLedger()
{
    noura::CatalogStore catalog(*m_database);
    noura::LedgerEngine ledger(*m_database, m_settings);

    noura::Customer customer;
    customer.name = "Ada";
    catalog.addCustomer(customer);

    noura::Product widget;
    widget.name = "Widget";
    widget.salePrice = 10.0;
    widget.costPrice = 2.0;
    widget.stock = 10;
    const int64_t widgetId = catalog.addProduct(widget);

    noura::Product gadget;
    gadget.name = "Gadget";
    gadget.salePrice = 30.0;
    gadget.costPrice = 12.0;
    gadget.stock = 5;
    const int64_t gadgetId = catalog.addProduct(gadget);

    auto item = [](std::optional<int64_t> productId, double quantity, double price,
                   double discount) {
        noura::InvoiceItem entry;
        entry.productId = productId;
        entry.description = productId.has_value() ? "" : "Consulting";
        entry.quantity = quantity;
        entry.unitPrice = price;
        entry.discount = discount;
        entry.lineTotal = noura::LedgerEngine::computeLineTotal(quantity, price, discount);
        return entry;
    };

    noura::Invoice january;
    january.invoiceNumber = "INV-1";
    january.invoiceDate = "2024-01-15";
    january.status = "Paid";
    january.totalAmount = 18.0;
    ledger.createInvoice(january, {item(widgetId, 2, 10.0, 10.0)});

    noura::Invoice consulting;
    consulting.invoiceNumber = "INV-2";
    consulting.invoiceDate = "2024-01-20";
    consulting.totalAmount = 50.0;
    ledger.createInvoice(consulting, {item(std::nullopt, 1, 50.0, 0.0)});

    noura::Invoice february;
    february.invoiceNumber = "INV-3";
    february.invoiceDate = "2024-02-03";
    february.status = "Paid";
    february.totalAmount = 40.0;
    ledger.createInvoice(february, {item(widgetId, 1, 10.0, 0.0), item(gadgetId, 1, 30.0, 0.0)});
}

void ReportingTests::testEmptyStore()
{
    const auto totals = m_reports->totals();
    QCOMPARE(totals.totalCustomers, static_cast<int64_t>(0));
    QCOMPARE(totals.totalInvoices, static_cast<int64_t>(0));
    QCOMPARE(totals.totalRevenue, 0.0);
    QVERIFY(totals.statusBreakdown.empty());
    QVERIFY(m_reports->income(noura::ReportPeriod::Monthly).empty());
    QVERIFY(m_reports->productSales().empty());
}

void ReportingTests::testTotals()
{
    seedLedger();
    const auto totals = m_reports->totals();
    QCOMPARE(totals.totalCustomers, static_cast<int64_t>(1));
    QCOMPARE(totals.totalInvoices, static_cast<int64_t>(3));
    QCOMPARE(totals.totalRevenue, 108.0);
    QCOMPARE(totals.statusBreakdown.size(), static_cast<size_t>(2));
    QCOMPARE(totals.statusBreakdown.at("Paid"), 58.0);
    QCOMPARE(totals.statusBreakdown.at("Unknown"), 50.0);
}

void ReportingTests::testMonthlyIncome()
{
    seedLedger();
    const auto buckets = m_reports->income(noura::ReportPeriod::Monthly);
    QCOMPARE(buckets.size(), static_cast<size_t>(2));

    QCOMPARE(QString::fromStdString(buckets[0].period), QStringLiteral("2024-01"));
    QCOMPARE(buckets[0].gross, 70.0);
    QCOMPARE(buckets[0].net, 64.0);

    QCOMPARE(QString::fromStdString(buckets[1].period), QStringLiteral("2024-02"));
    QCOMPARE(buckets[1].gross, 40.0);
    QCOMPARE(buckets[1].net, 26.0);
}

void ReportingTests::testDailyAndYearlyIncome()
{
    seedLedger();
    const auto daily = m_reports->income(noura::ReportPeriod::Daily);
    QCOMPARE(daily.size(), static_cast<size_t>(3));
    QCOMPARE(QString::fromStdString(daily.front().period), QStringLiteral("2024-01-15"));

    const auto yearly = m_reports->income(noura::ReportPeriod::Yearly);
    QCOMPARE(yearly.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(yearly.front().period), QStringLiteral("2024"));
    QCOMPARE(yearly.front().gross, 110.0);
    QCOMPARE(yearly.front().net, 90.0);
}

void ReportingTests::testIncomeBounds()
{
    seedLedger();
    const auto february = m_reports->income(noura::ReportPeriod::Monthly,
                                            std::string("2024-02-01"), std::nullopt);
    QCOMPARE(february.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(february.front().period), QStringLiteral("2024-02"));

    const auto midJanuary = m_reports->income(noura::ReportPeriod::Daily,
                                              std::string("2024-01-15"),
                                              std::string("2024-01-15"));
    QCOMPARE(midJanuary.size(), static_cast<size_t>(1));
    QCOMPARE(midJanuary.front().gross, 20.0);

    QVERIFY_EXCEPTION_THROWN(m_reports->income(noura::ReportPeriod::Monthly,
                                                std::string("January"), std::nullopt),
                             noura::ValidationError);
}

void ReportingTests::testProductSales()
{
    seedLedger();
    const auto sales = m_reports->productSales();
    QCOMPARE(sales.size(), static_cast<size_t>(2));

    QCOMPARE(QString::fromStdString(sales[0].productName), QStringLiteral("Gadget"));
    QCOMPARE(sales[0].quantitySold, 1.0);
    QCOMPARE(sales[0].revenue, 30.0);

    QCOMPARE(QString::fromStdString(sales[1].productName), QStringLiteral("Widget"));
    QCOMPARE(sales[1].quantitySold, 3.0);
    QCOMPARE(sales[1].revenue, 28.0);
}

QTEST_MAIN(ReportingTests)
#include "test_reporting.moc"

#include <gtest/gtest.h>

#include <QThread>

#include "KardexError.h"
#include "KardexReportService.h"
#include "KardexTestData.h"

using namespace testdata;

namespace {

class FakeCompanyRepository : public ICompanyRepository
{
public:
    bool findAll(QList<Company> &out) override
    {
        out = companies;
        return ok;
    }

    QList<Company> companies = { jmCompany(), olgCompany() };
    bool ok = true;
};

class FakePartnerRepository : public IPartnerRepository
{
public:
    bool fetchPartnerNames(const QStringList &companyIds,
                           const QDeadlineTimer &deadline,
                           QHash<QString, QString> &out) override
    {
        requestedCompanies = companyIds;
        if (stall) {
            while (!deadline.hasExpired()) QThread::msleep(1);
            return false;
        }
        out = names;
        return ok;
    }

    QHash<QString, QString> names;
    bool ok = true;
    bool stall = false;
    QStringList requestedCompanies;
};

class FakeInvoiceRepository : public IInvoiceRepository
{
public:
    bool fetchInvoiceItems(const QStringList &companyIds,
                           const QDateTime &from,
                           const QDateTime &until,
                           const QDeadlineTimer &deadline,
                           QList<InvoiceItemRecord> &out) override
    {
        ++calls;
        requestedCompanies = companyIds;
        requestedFrom = from;
        requestedUntil = until;
        if (stall) {
            while (!deadline.hasExpired()) QThread::msleep(1);
            return false;
        }
        for (const InvoiceItemRecord &item : items) {
            if (item.issuedAt >= from && item.issuedAt <= until) out.append(item);
        }
        return ok;
    }

    QList<InvoiceItemRecord> items;
    bool ok = true;
    bool stall = false;
    int calls = 0;
    QStringList requestedCompanies;
    QDateTime requestedFrom;
    QDateTime requestedUntil;
};

} // namespace

class KardexReportServiceTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        config = testConfig();
        config.openingStockSacks = dec("100");
        config.openingCostPerSack = dec("500");

        invoices.items = {
            makeItem("nf1", utc(2025, 1, 10), InvoiceDirection::Inbound, kRawMaterialName, "50", "600"),
            makeItem("nf2", utc(2025, 2, 5), InvoiceDirection::Outbound, kRanchoName, "10", "50"),
            makeItem("nf3", utc(2025, 2, 20), InvoiceDirection::Outbound, kRawMaterialName, "200", "700"),
            makeItem("nf4", utc(2025, 3, 2), InvoiceDirection::Inbound, kRawMaterialName, "10", "700")
        };
    }

    KardexReport build(const QDate &from, const QDate &until)
    {
        KardexReportService service(config, &companies, &partners, &invoices);
        return service.buildReport({ from, until });
    }

    KardexConfig config;
    FakeCompanyRepository companies;
    FakePartnerRepository partners;
    FakeInvoiceRepository invoices;
};

TEST_F(KardexReportServiceTest, FebruaryWindow_ShouldStartFromPriorBalance) {
    // When the February report is built
    const KardexReport report = build(QDate(2025, 2, 1), QDate(2025, 2, 28));

    // Then history is fetched from the epoch up to the end of the last day
    EXPECT_EQ(invoices.requestedFrom, utc(2025, 1, 1, 0, 0));
    EXPECT_EQ(invoices.requestedUntil, QDateTime(QDate(2025, 2, 28), QTime(23, 59, 59, 999), QTimeZone::UTC));
    EXPECT_EQ(invoices.requestedCompanies, QStringList({ kJmId, kOlgId }));
    EXPECT_EQ(partners.requestedCompanies, QStringList({ kJmId, kOlgId }));

    // and the window opens with the January closing balance
    ASSERT_EQ(report.movements.size(), 4);
    EXPECT_EQ(report.openingBalance.type, MovementType::PriorBalance);
    EXPECT_EQ(report.openingBalance.balanceQuantityAfter, dec("150"));
    EXPECT_EQ(report.openingBalance.movingAverageCostAfter, dec("533.333333"));

    // consumption of 5 sacks, then the sale of 200 clamps at 145
    EXPECT_EQ(report.movements[1].appliedQuantitySacks, dec("-5"));
    EXPECT_EQ(report.movements[2].appliedQuantitySacks, dec("-145"));
    EXPECT_TRUE(report.movements[3].blocked);
    EXPECT_EQ(report.movements[3].requestedQuantitySacks, dec("-55"));

    ASSERT_EQ(report.finishedSales.size(), 1);
    EXPECT_EQ(*report.finishedSales[0].costPerSackAtConsumption, dec("533.333333"));
    EXPECT_EQ(*report.finishedSales[0].rawMaterialCostValue, dec("2666.666665"));

    EXPECT_EQ(report.grandTotals.movements.entriesSacks, dec("0"));
    EXPECT_EQ(report.grandTotals.movements.exitsSacks, dec("150"));
    EXPECT_EQ(report.grandTotals.balanceSacks, dec("0"));
    EXPECT_EQ(report.grandTotals.balanceValue, dec("0"));
    EXPECT_EQ(report.grandTotals.finished.unitsSold, dec("10"));

    ASSERT_EQ(report.dailyTotals.size(), 2);
    EXPECT_EQ(report.dailyTotals[0].date, QDate(2025, 2, 5));
    ASSERT_EQ(report.productTotals.size(), 1);
    EXPECT_EQ(report.productTotals[0].productAlias, ProductAlias::FinishedA);

    ASSERT_EQ(report.filters.companies.size(), 2);
    EXPECT_EQ(report.filters.from, utc(2025, 2, 1, 0, 0));
}

TEST_F(KardexReportServiceTest, WindowFromEpoch_ShouldOpenWithInitialBalance) {
    const KardexReport report = build(QDate(2025, 1, 1), QDate(2025, 1, 31));

    ASSERT_EQ(report.movements.size(), 2);
    EXPECT_EQ(report.openingBalance.type, MovementType::Opening);
    EXPECT_EQ(report.openingBalance.balanceQuantityAfter, dec("100"));
    EXPECT_EQ(report.grandTotals.balanceSacks, dec("150"));
    EXPECT_EQ(report.grandTotals.movements.entriesSacks, dec("50"));
}

TEST_F(KardexReportServiceTest, LaterUntil_ShouldRestartCostAfterZeroBalance) {
    const KardexReport report = build(QDate(2025, 3, 1), QDate(2025, 3, 31));

    ASSERT_EQ(report.movements.size(), 2);
    EXPECT_TRUE(report.movements[1].costRestarted);
    EXPECT_EQ(report.grandTotals.movingAverageCost, dec("700"));
    EXPECT_EQ(report.grandTotals.balanceValue, dec("7000"));
}

TEST_F(KardexReportServiceTest, UnmatchedCompany_ShouldFailBeforeFetching) {
    companies.companies = { jmCompany() };

    try {
        build(QDate(2025, 2, 1), QDate(2025, 2, 28));
        FAIL() << "expected KardexError";
    } catch (const KardexError &e) {
        EXPECT_EQ(e.code(), KardexError::Code::Configuration);
        EXPECT_EQ(e.httpStatus(), 400);
    }
    EXPECT_EQ(invoices.calls, 0);
}

TEST_F(KardexReportServiceTest, FailedFetch_ShouldRaiseDataAccessError) {
    invoices.ok = false;

    try {
        build(QDate(2025, 2, 1), QDate(2025, 2, 28));
        FAIL() << "expected KardexError";
    } catch (const KardexError &e) {
        EXPECT_EQ(e.code(), KardexError::Code::DataAccess);
        EXPECT_EQ(e.httpStatus(), 500);
    }
}

TEST_F(KardexReportServiceTest, FailedCompanyLookup_ShouldRaiseDataAccessError) {
    companies.ok = false;
    EXPECT_THROW(build(QDate(2025, 2, 1), QDate(2025, 2, 28)), KardexError);
    EXPECT_EQ(invoices.calls, 0);
}

TEST_F(KardexReportServiceTest, ExpiredDeadline_ShouldRaiseTimeout) {
    config.fetchTimeoutMs = 5;
    invoices.stall = true;

    try {
        build(QDate(2025, 2, 1), QDate(2025, 2, 28));
        FAIL() << "expected KardexError";
    } catch (const KardexError &e) {
        EXPECT_EQ(e.code(), KardexError::Code::Timeout);
        EXPECT_EQ(e.httpStatus(), 504);
    }
}

TEST_F(KardexReportServiceTest, MissingUntil_ShouldDefaultToTodayUtc) {
    build(QDate(), QDate());

    EXPECT_EQ(invoices.requestedUntil.date(), QDateTime::currentDateTimeUtc().date());
    EXPECT_EQ(invoices.requestedUntil.time(), QTime(23, 59, 59, 999));
}

TEST_F(KardexReportServiceTest, PartnerLookupPastDeadline_ShouldRaiseTimeout) {
    // Given invoices arrive in time but the partner lookup stalls
    config.fetchTimeoutMs = 50;
    partners.stall = true;

    try {
        build(QDate(2025, 2, 1), QDate(2025, 2, 28));
        FAIL() << "expected KardexError";
    } catch (const KardexError &e) {
        // Then the shared deadline turns it into a timeout
        EXPECT_EQ(e.code(), KardexError::Code::Timeout);
        EXPECT_EQ(e.httpStatus(), 504);
    }
    EXPECT_EQ(invoices.calls, 1);
}

TEST_F(KardexReportServiceTest, FailedPartnerLookup_ShouldRaiseDataAccessError) {
    partners.ok = false;

    try {
        build(QDate(2025, 2, 1), QDate(2025, 2, 28));
        FAIL() << "expected KardexError";
    } catch (const KardexError &e) {
        EXPECT_EQ(e.code(), KardexError::Code::DataAccess);
    }
}

#include <gtest/gtest.h>

#include "PeriodWindower.h"
#include "KardexTestData.h"

using namespace testdata;

class PeriodWindowerTest : public ::testing::Test {
protected:
    static LedgerMovement row(MovementType type, const QDateTime &ts, const char *balance, const char *average)
    {
        LedgerMovement m;
        m.type = type;
        m.timestamp = ts;
        m.balanceQuantityAfter = Decimal(balance);
        m.movingAverageCostAfter = Decimal(average);
        m.balanceValueAfter = roundDecimal(m.balanceQuantityAfter * m.movingAverageCostAfter);
        return m;
    }

    QList<LedgerMovement> ledger() const
    {
        return {
            row(MovementType::Opening, utc(2025, 1, 1, 0, 0), "100", "500"),
            row(MovementType::Entry, utc(2025, 1, 10), "150", "520"),
            row(MovementType::Exit, utc(2025, 1, 31, 23, 59), "140", "520"),
            row(MovementType::Entry, utc(2025, 2, 3), "160", "530"),
            row(MovementType::Exit, utc(2025, 3, 1), "150", "530")
        };
    }
};

TEST_F(PeriodWindowerTest, FromAfterHistory_ShouldPrependPriorBalance) {
    const QList<LedgerMovement> res =
        PeriodWindower::window(ledger(), utc(2025, 2, 1, 0, 0), QDateTime(QDate(2025, 2, 28), QTime(23, 59, 59, 999), QTimeZone::UTC));

    ASSERT_EQ(res.size(), 2);
    EXPECT_EQ(res[0].type, MovementType::PriorBalance);
    EXPECT_EQ(res[0].typeString(), "SALDO_ANTERIOR");
    EXPECT_EQ(res[0].timestamp, utc(2025, 2, 1, 0, 0));
    EXPECT_EQ(res[0].balanceQuantityAfter, dec("140"));
    EXPECT_EQ(res[0].movingAverageCostAfter, dec("520"));
    EXPECT_EQ(res[0].appliedQuantitySacks, dec("0"));
    EXPECT_EQ(res[1].timestamp, utc(2025, 2, 3));
}

TEST_F(PeriodWindowerTest, OpenBounds_ShouldKeepEverything) {
    const QList<LedgerMovement> res = PeriodWindower::window(ledger(), QDateTime(), QDateTime());
    EXPECT_EQ(res.size(), 5);
    EXPECT_EQ(res[0].type, MovementType::Opening);
}

TEST_F(PeriodWindowerTest, FromAtEpoch_ShouldKeepOpeningWithoutPriorBalance) {
    const QList<LedgerMovement> res = PeriodWindower::window(ledger(), utc(2025, 1, 1, 0, 0), utc(2025, 1, 15));

    ASSERT_EQ(res.size(), 2);
    EXPECT_EQ(res[0].type, MovementType::Opening);
    EXPECT_EQ(res[1].type, MovementType::Entry);
}

TEST_F(PeriodWindowerTest, MovementWithoutTimestamp_ShouldAlwaysPass) {
    QList<LedgerMovement> movements = ledger();
    movements.append(row(MovementType::Exit, QDateTime(), "150", "530"));

    const QList<LedgerMovement> res = PeriodWindower::window(movements, utc(2025, 2, 1, 0, 0), utc(2025, 2, 5));

    ASSERT_EQ(res.size(), 3);
    EXPECT_FALSE(res[2].timestamp.isValid());
}

TEST_F(PeriodWindowerTest, WindowSales_ShouldUseSameBounds) {
    QList<FinishedSaleRecord> sales(3);
    sales[0].timestamp = utc(2025, 1, 31, 23, 59);
    sales[1].timestamp = utc(2025, 2, 1, 0, 0);
    sales[2].timestamp = utc(2025, 3, 1, 0, 0);

    const QList<FinishedSaleRecord> res =
        PeriodWindower::windowSales(sales, utc(2025, 2, 1, 0, 0), utc(2025, 2, 28, 23, 59));

    ASSERT_EQ(res.size(), 1);
    EXPECT_EQ(res[0].timestamp, utc(2025, 2, 1, 0, 0));
}

#include <gtest/gtest.h>

#include <QSettings>
#include <QTemporaryDir>

#include "KardexConfig.h"
#include "KardexTestData.h"

using testdata::dec;

class KardexConfigTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(dir.isValid());
        path = dir.filePath("kardex.ini");
    }

    QTemporaryDir dir;
    QString path;
};

TEST_F(KardexConfigTest, Defaults_ShouldCarryKnownConstants) {
    const KardexConfig c = KardexConfig::defaults();

    EXPECT_EQ(c.epoch, QDate(2025, 1, 1));
    EXPECT_EQ(c.consumptionRatioSacksPerUnit, dec("0.104167"));
    EXPECT_EQ(c.finishedUnitsPerSack, dec("9.6"));
    EXPECT_EQ(c.excludedCfops, QStringList({ "5905", "5906" }));
    ASSERT_EQ(c.companyMatchers.size(), 2);
    EXPECT_EQ(c.companyMatchers[0].alias, "JM");
    EXPECT_EQ(c.productNames.size(), 4);
}

TEST_F(KardexConfigTest, FromSettings_ShouldOverrideDefaults) {
    {
        QSettings w(path, QSettings::IniFormat);
        w.setValue("opening/date", "2024-07-01");
        w.setValue("opening/stockSacks", "120.5");
        w.setValue("opening/costPerSack", "890,25");
        w.setValue("consumption/ratioSacksPerUnit", "0.1");
        w.setValue("filters/blockedCounterparties", QStringList({ "33.333.333/0001-33", "123" }));
        w.setValue("fetch/timeoutMs", 5000);
        w.beginGroup("companies");
        w.beginWriteArray("matchers");
        w.setArrayIndex(0);
        w.setValue("alias", "SUL");
        w.setValue("tokens", QStringList({ "ARMAZEM", "SUL" }));
        w.endArray();
        w.endGroup();
        w.sync();
    }

    QSettings r(path, QSettings::IniFormat);
    const KardexConfig c = KardexConfig::fromSettings(r);

    EXPECT_EQ(c.epoch, QDate(2024, 7, 1));
    EXPECT_EQ(c.openingStockSacks, dec("120.5"));
    EXPECT_EQ(c.openingCostPerSack, dec("890.25"));
    EXPECT_EQ(c.consumptionRatioSacksPerUnit, dec("0.1"));
    EXPECT_EQ(c.fetchTimeoutMs, 5000);
    ASSERT_EQ(c.companyMatchers.size(), 1);
    EXPECT_EQ(c.companyMatchers[0].alias, "SUL");
    EXPECT_EQ(c.companyMatchers[0].nameTokens, QStringList({ "ARMAZEM", "SUL" }));

    // only well formed CNPJs are used for blocking
    EXPECT_EQ(c.blockedCnpjDigits(), QStringList({ "33333333000133" }));

    // untouched groups keep their defaults
    EXPECT_EQ(c.finishedUnitsPerSack, dec("9.6"));
    EXPECT_EQ(c.excludedCfops, QStringList({ "5905", "5906" }));
}

TEST_F(KardexConfigTest, InvalidValues_ShouldFallBackWithoutThrowing) {
    {
        QSettings w(path, QSettings::IniFormat);
        w.setValue("opening/date", "not-a-date");
        w.setValue("opening/stockSacks", "abc");
        w.setValue("fetch/timeoutMs", -1);
        w.sync();
    }

    QSettings r(path, QSettings::IniFormat);
    const KardexConfig c = KardexConfig::fromSettings(r);

    EXPECT_EQ(c.epoch, QDate(2025, 1, 1));
    EXPECT_EQ(c.openingStockSacks, dec("0"));
    EXPECT_EQ(c.fetchTimeoutMs, 30000);
}

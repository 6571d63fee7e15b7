#include <gtest/gtest.h>

#include "UnitNormalizer.h"
#include "KardexTestData.h"

using testdata::dec;

class UnitNormalizerTest : public ::testing::Test {};

TEST_F(UnitNormalizerTest, Kilograms_ShouldDivideBySixty) {
    bool recognized = false;
    EXPECT_EQ(UnitNormalizer::toSacks(dec("120"), "KG", &recognized), dec("2"));
    EXPECT_TRUE(recognized);
    EXPECT_EQ(UnitNormalizer::toSacks(dec("30"), "kilogramas"), dec("0.5"));
}

TEST_F(UnitNormalizerTest, SackSpellings_ShouldPassThrough) {
    for (const QString &unit : { "SC", "saca", "Sacas", "SC60KG", "sacas de 60kg" }) {
        bool recognized = false;
        EXPECT_EQ(UnitNormalizer::toSacks(dec("7.5"), unit, &recognized), dec("7.5")) << unit.toStdString();
        EXPECT_TRUE(recognized) << unit.toStdString();
    }
}

TEST_F(UnitNormalizerTest, Tons_ShouldConvertThroughKilograms) {
    EXPECT_EQ(UnitNormalizer::toSacks(dec("3"), "TON"), dec("50"));
    EXPECT_EQ(roundDecimal(UnitNormalizer::toSacks(dec("1"), "TON")), dec("16.666667"));
    EXPECT_EQ(UnitNormalizer::classify("Toneladas"), UnitNormalizer::UnitKind::Ton);
}

TEST_F(UnitNormalizerTest, UnknownUnit_ShouldBeTakenAsSacksAndReported) {
    bool recognized = true;
    EXPECT_EQ(UnitNormalizer::toSacks(dec("12"), "UN", &recognized), dec("12"));
    EXPECT_FALSE(recognized);

    recognized = true;
    EXPECT_EQ(UnitNormalizer::toSacks(dec("4"), "", &recognized), dec("4"));
    EXPECT_FALSE(recognized);
}

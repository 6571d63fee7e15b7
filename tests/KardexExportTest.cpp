#include <gtest/gtest.h>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include "KardexExport.h"
#include "KardexTestData.h"

using namespace testdata;

class KardexExportTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        LedgerMovement opening;
        opening.type = MovementType::Opening;
        opening.timestamp = utc(2025, 1, 1, 0, 0);
        opening.balanceQuantityAfter = dec("100");
        opening.balanceValueAfter = dec("50000");
        opening.movingAverageCostAfter = dec("500");
        opening.unitCost = dec("500");
        opening.notes = "Saldo inicial";

        LedgerMovement entry;
        entry.type = MovementType::Entry;
        entry.timestamp = utc(2025, 1, 10, 14, 30);
        entry.document = "1234";
        entry.counterparty = "Sitio \"Boa Vista\"; Lote 2";
        entry.counterpartyId = "33333333000133";
        entry.cfop = "1101";
        entry.appliedQuantitySacks = dec("50");
        entry.requestedQuantitySacks = dec("50");
        entry.unitCost = dec("600");
        entry.movingAverageCostAfter = dec("533.333333");
        entry.balanceQuantityAfter = dec("150");
        entry.balanceValueAfter = dec("80000");
        entry.notes = "Entrada MP";

        LedgerMovement blocked;
        blocked.type = MovementType::Exit;
        blocked.timestamp = utc(2025, 1, 12);
        blocked.requestedQuantitySacks = dec("-5");
        blocked.blocked = true;
        blocked.notes = "Movimentação não aplicada (saldo zero)";

        FinishedSaleRecord sale;
        sale.timestamp = utc(2025, 1, 11);
        sale.document = "5678";
        sale.counterpartyId = "44444444000144";
        sale.productAlias = ProductAlias::FinishedB;
        sale.unitsSold = dec("10");
        sale.unitNetPrice = dec("45.5");
        sale.valuePerSack = dec("436.8");
        sale.rawMaterialConsumedSacks = dec("0");

        report.filters.from = utc(2025, 1, 1, 0, 0);
        report.filters.to = QDateTime(QDate(2025, 1, 31), QTime(23, 59, 59, 999), QTimeZone::UTC);
        report.filters.companies = groupCompanies();
        report.openingBalance = opening;
        report.movements = { opening, entry, blocked };
        report.finishedSales = { sale };
        report.grandTotals.movements.entriesSacks = dec("50");
        report.grandTotals.balanceSacks = dec("150");
        report.grandTotals.balanceValue = dec("80000");
        report.grandTotals.movingAverageCost = dec("533.333333");
    }

    KardexReport report;
};

TEST_F(KardexExportTest, Csv_ShouldContainBothBlocksWithHeaders) {
    const QStringList lines = QString::fromUtf8(KardexExport::toCsv(report)).split('\n');

    ASSERT_EQ(lines.size(), 10);
    EXPECT_EQ(lines[0], "Relatório Kardex Consolidado");
    EXPECT_TRUE(lines[1].startsWith("Bloco 1"));
    EXPECT_TRUE(lines[1].contains("MP_CONILON"));
    EXPECT_TRUE(lines[2].startsWith("Data/Hora;Documento;Parceiro;CFOP;Tipo;Status;Qtd (SC)"));
    EXPECT_EQ(lines[6], "");
    EXPECT_TRUE(lines[7].startsWith("Bloco 2"));
    EXPECT_TRUE(lines[8].endsWith("Valor da Saca Bruta (R$)"));
}

TEST_F(KardexExportTest, Csv_ShouldFormatOpeningAndBlockedRows) {
    const QStringList lines = QString::fromUtf8(KardexExport::toCsv(report)).split('\n');

    EXPECT_EQ(lines[3], "2025-01-01T00:00:00.000Z;;;;Saldo Inicial;Normal;100.0000;500.00;500.00;100.0000;Não;Saldo inicial");

    const QStringList blocked = lines[5].split(';');
    EXPECT_EQ(blocked[4], "SAIDA");
    EXPECT_EQ(blocked[5], "Bloqueada (saldo zero)");
    EXPECT_EQ(blocked[6], "0.0000");
}

TEST_F(KardexExportTest, Csv_ShouldQuoteValuesWithSeparatorsOrQuotes) {
    const QStringList lines = QString::fromUtf8(KardexExport::toCsv(report)).split('\n');

    EXPECT_TRUE(lines[4].contains(";\"Sitio \"\"Boa Vista\"\"; Lote 2\";"));
    EXPECT_EQ(KardexExport::escapeCsvValue("linha 1\nlinha 2"), "\"linha 1\nlinha 2\"");
    EXPECT_EQ(KardexExport::escapeCsvValue("simples"), "simples");
}

TEST_F(KardexExportTest, CsvSale_ShouldFallBackToCnpjAndLeaveMissingCostEmpty) {
    const QStringList lines = QString::fromUtf8(KardexExport::toCsv(report)).split('\n');

    EXPECT_EQ(lines[9], "2025-01-11T12:00:00.000Z;5678;44444444000144;ACABADO_RANCHO_20X250;"
                         "10.0000;45.50;0.0000;;436.80");
}

TEST_F(KardexExportTest, Json_ShouldUseFixedDecimalStrings) {
    const QJsonObject root = QJsonDocument::fromJson(KardexExport::toJson(report)).object();

    const QJsonArray movements = root["mpMovements"].toArray();
    ASSERT_EQ(movements.size(), 3);
    const QJsonObject entry = movements[1].toObject();
    EXPECT_EQ(entry["type"].toString(), "ENTRADA");
    EXPECT_EQ(entry["qtySc"].toString(), "50.0000");
    EXPECT_EQ(entry["movingAverageCost"].toString(), "533.33");
    EXPECT_EQ(entry["balanceValue"].toString(), "80000.00");
    EXPECT_EQ(entry["costRestartLabel"].toString(), "Não");

    const QJsonObject sale = root["finishedSales"].toArray()[0].toObject();
    EXPECT_TRUE(sale["costAverageSc"].isNull());
    EXPECT_TRUE(sale["mpCostValue"].isNull());
    EXPECT_EQ(sale["productAlias"].toString(), "ACABADO_RANCHO_20X250");

    const QJsonObject totals = root["mpTotals"].toObject();
    EXPECT_EQ(totals["balanceSc"].toString(), "150.0000");
    EXPECT_EQ(totals["movingAverageCost"].toString(), "533.33");

    const QJsonObject filters = root["filters"].toObject();
    EXPECT_EQ(filters["to"].toString(), "2025-01-31T23:59:59.999Z");
    EXPECT_EQ(filters["companies"].toArray().size(), 2);
}

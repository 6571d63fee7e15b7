#ifndef KARDEXREPORT_H
#define KARDEXREPORT_H

#include <QDate>
#include <QDateTime>
#include <QList>

#include "EventExtractor.h"
#include "KardexAggregator.h"
#include "KardexTypes.h"

/**
 * @brief Запрос отчета; пустые даты означают "с начала истории" / "по сегодня"
 */
struct KardexReportRequest {
    QDate from;
    QDate until;
};

struct KardexReportFilters {
    QDateTime from;
    QDateTime to;
    QList<ResolvedCompany> companies;
};

struct KardexGrandTotals {
    MovementTotals movements;
    Decimal balanceSacks = 0;
    Decimal balanceValue = 0;
    Decimal movingAverageCost = 0;
    FinishedTotals finished;
};

/**
 * @brief Готовый отчет Kardex
 *
 * Экспорт (JSON, CSV, экран) только читает эту структуру.
 */
struct KardexReport {
    KardexReportFilters filters;
    LedgerMovement openingBalance;
    QList<LedgerMovement> movements;
    QList<FinishedSaleRecord> finishedSales;
    QList<DailyTotal> dailyTotals;
    QList<ProductTotal> productTotals;
    KardexGrandTotals grandTotals;
    ExtractionStats stats;
};

#endif // KARDEXREPORT_H

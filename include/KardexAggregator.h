#ifndef KARDEXAGGREGATOR_H
#define KARDEXAGGREGATOR_H

#include <QList>

#include "KardexTypes.h"

struct MovementTotals {
    Decimal entriesSacks = 0;
    Decimal exitsSacks = 0;
};

struct FinishedTotals {
    Decimal unitsSold = 0;
    Decimal rawMaterialConsumedSacks = 0;
    Decimal revenuePerSack = 0;
    Decimal rawMaterialCostValue = 0;
};

/**
 * @brief Итоги по дням и по товарам
 *
 * Строки SALDO_INICIAL и SALDO_ANTERIOR в итоги не входят.
 */
class KardexAggregator
{
public:
    static QList<DailyTotal> dailyTotals(const QList<LedgerMovement> &movements);
    static QList<ProductTotal> productTotals(const QList<FinishedSaleRecord> &sales);
    static MovementTotals movementTotals(const QList<LedgerMovement> &movements);
    static FinishedTotals finishedTotals(const QList<ProductTotal> &products);

    static bool isBalanceRow(const LedgerMovement &movement);
};

#endif // KARDEXAGGREGATOR_H

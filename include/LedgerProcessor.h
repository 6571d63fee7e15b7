#ifndef LEDGERPROCESSOR_H
#define LEDGERPROCESSOR_H

#include <QDateTime>
#include <QList>

#include "KardexTypes.h"

/**
 * @brief Состояние Kardex между событиями
 */
struct LedgerState {
    Decimal balanceQuantitySacks = 0;
    Decimal balanceValue = 0;
    Decimal movingAverageCost = 0;
};

struct LedgerResult {
    QList<LedgerMovement> movements;
    LedgerState finalState;
};

/**
 * @brief Kardex сырья по скользящей средней
 *
 * События сортируются по (timestamp, invoiceId, itemId, eventOrder) и
 * сворачиваются строго по порядку. Средняя меняется только на приходах;
 * приход на нулевой остаток перезапускает среднюю ценой прихода.
 * Расход сверх остатка урезается до остатка, недостача фиксируется
 * отдельной заблокированной строкой.
 */
class LedgerProcessor
{
public:
    LedgerProcessor(const Decimal &openingQuantitySacks,
                    const Decimal &openingCostPerSack,
                    const QDateTime &openingTimestamp);

    /**
     * @brief Построить Kardex
     * @param sales черновики продаж, дополняются по StockEvent::saleIndex
     */
    LedgerResult process(QList<StockEvent> events, QList<FinishedSaleRecord> &sales) const;

    LedgerMovement openingMovement() const;

    static bool eventLessThan(const StockEvent &a, const StockEvent &b);
    static void sortEvents(QList<StockEvent> &events);

private:
    void applyEntry(const StockEvent &event, LedgerState &state, QList<LedgerMovement> &out) const;
    void applyWithdrawal(const StockEvent &event, LedgerState &state, QList<LedgerMovement> &out,
                         FinishedSaleRecord *sale) const;

    LedgerMovement movementFor(const StockEvent &event, const LedgerState &state) const;

    Decimal m_openingQuantity;
    Decimal m_openingCost;
    QDateTime m_openingTimestamp;
};

#endif // LEDGERPROCESSOR_H

#ifndef PERIODWINDOWER_H
#define PERIODWINDOWER_H

#include <QDateTime>
#include <QList>

#include "KardexTypes.h"

/**
 * @brief Срез полного Kardex на период [from, to]
 *
 * Если до from есть строки, первой строкой среза идет SALDO_ANTERIOR с
 * остатком и средней последней строки строго до from. Пустой QDateTime
 * означает открытую границу; строки без даты проходят всегда.
 */
class PeriodWindower
{
public:
    static QList<LedgerMovement> window(const QList<LedgerMovement> &movements,
                                        const QDateTime &from,
                                        const QDateTime &to);

    static QList<FinishedSaleRecord> windowSales(const QList<FinishedSaleRecord> &sales,
                                                 const QDateTime &from,
                                                 const QDateTime &to);

    static LedgerMovement priorBalance(const LedgerMovement &last, const QDateTime &from);

private:
    static bool inWindow(const QDateTime &timestamp, const QDateTime &from, const QDateTime &to);
};

#endif // PERIODWINDOWER_H

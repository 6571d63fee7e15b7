#include "PeriodWindower.h"

bool PeriodWindower::inWindow(const QDateTime &timestamp, const QDateTime &from, const QDateTime &to)
{
    if (!timestamp.isValid()) return true;
    if (from.isValid() && timestamp < from) return false;
    if (to.isValid() && timestamp > to) return false;
    return true;
}

LedgerMovement PeriodWindower::priorBalance(const LedgerMovement &last, const QDateTime &from)
{
    LedgerMovement m;
    m.type = MovementType::PriorBalance;
    m.timestamp = from;
    m.unitCost = last.movingAverageCostAfter;
    m.movingAverageCostAfter = last.movingAverageCostAfter;
    m.balanceQuantityAfter = last.balanceQuantityAfter;
    m.balanceValueAfter = last.balanceValueAfter;
    m.notes = "Saldo anterior ao período selecionado.";
    return m;
}

QList<LedgerMovement> PeriodWindower::window(const QList<LedgerMovement> &movements,
                                             const QDateTime &from,
                                             const QDateTime &to)
{
    QList<LedgerMovement> res;

    if (from.isValid()) {
        for (auto it = movements.crbegin(); it != movements.crend(); ++it) {
            if (it->timestamp.isValid() && it->timestamp < from) {
                res.append(priorBalance(*it, from));
                break;
            }
        }
    }

    for (const LedgerMovement &m : movements) {
        if (inWindow(m.timestamp, from, to)) res.append(m);
    }
    return res;
}

QList<FinishedSaleRecord> PeriodWindower::windowSales(const QList<FinishedSaleRecord> &sales,
                                                      const QDateTime &from,
                                                      const QDateTime &to)
{
    QList<FinishedSaleRecord> res;
    for (const FinishedSaleRecord &s : sales) {
        if (inWindow(s.timestamp, from, to)) res.append(s);
    }
    return res;
}

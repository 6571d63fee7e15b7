#include "KardexAggregator.h"

#include <QMap>

#include <map>

bool KardexAggregator::isBalanceRow(const LedgerMovement &movement)
{
    return movement.type == MovementType::Opening || movement.type == MovementType::PriorBalance;
}

QList<DailyTotal> KardexAggregator::dailyTotals(const QList<LedgerMovement> &movements)
{
    QMap<QDate, DailyTotal> byDay;

    for (const LedgerMovement &m : movements) {
        if (isBalanceRow(m) || !m.timestamp.isValid()) continue;

        const QDate day = m.timestamp.toUTC().date();
        auto it = byDay.find(day);
        if (it == byDay.end()) {
            DailyTotal fresh;
            fresh.date = day;
            it = byDay.insert(day, fresh);
        }

        DailyTotal &bucket = it.value();
        if (m.appliedQuantitySacks > 0) {
            bucket.entriesSacks += m.appliedQuantitySacks;
        } else if (m.appliedQuantitySacks < 0) {
            bucket.exitsSacks += boost::multiprecision::abs(m.appliedQuantitySacks);
        }
        // остаток на конец дня: последняя строка дня
        bucket.balanceSacks = m.balanceQuantityAfter;
        bucket.movingAverageCost = m.movingAverageCostAfter;
    }

    return byDay.values();
}

QList<ProductTotal> KardexAggregator::productTotals(const QList<FinishedSaleRecord> &sales)
{
    std::map<ProductAlias, ProductTotal> byProduct;

    for (const FinishedSaleRecord &s : sales) {
        ProductTotal &bucket = byProduct[s.productAlias];
        bucket.productAlias = s.productAlias;
        bucket.unitsSold += s.unitsSold;
        bucket.rawMaterialConsumedSacks += s.rawMaterialConsumedSacks;
        bucket.revenuePerSack += s.valuePerSack;
        if (s.rawMaterialCostValue) {
            bucket.rawMaterialCostValue += *s.rawMaterialCostValue;
        }
    }

    QList<ProductTotal> res;
    for (const auto &entry : byProduct) res.append(entry.second);
    return res;
}

MovementTotals KardexAggregator::movementTotals(const QList<LedgerMovement> &movements)
{
    MovementTotals totals;
    for (const LedgerMovement &m : movements) {
        if (isBalanceRow(m)) continue;
        if (m.appliedQuantitySacks > 0) {
            totals.entriesSacks += m.appliedQuantitySacks;
        } else if (m.appliedQuantitySacks < 0) {
            totals.exitsSacks += boost::multiprecision::abs(m.appliedQuantitySacks);
        }
    }
    return totals;
}

FinishedTotals KardexAggregator::finishedTotals(const QList<ProductTotal> &products)
{
    FinishedTotals totals;
    for (const ProductTotal &p : products) {
        totals.unitsSold += p.unitsSold;
        totals.rawMaterialConsumedSacks += p.rawMaterialConsumedSacks;
        totals.revenuePerSack += p.revenuePerSack;
        totals.rawMaterialCostValue += p.rawMaterialCostValue;
    }
    return totals;
}

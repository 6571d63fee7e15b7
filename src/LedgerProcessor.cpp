#include "LedgerProcessor.h"

#include <QLoggingCategory>

#include <algorithm>

Q_LOGGING_CATEGORY(ledger, "kardex.ledger")

static const char *kBlockedNote = "Movimentação não aplicada (saldo zero)";
static const char *kClampedNote = "Quantidade limitada ao saldo disponível";

static Decimal negated(const Decimal &value)
{
    return decimalIsZero(value) ? Decimal(0) : Decimal(-value);
}

static QString joinNotes(const QStringList &parts)
{
    QStringList nonEmpty;
    for (const QString &p : parts) {
        if (!p.isEmpty()) nonEmpty.append(p);
    }
    return nonEmpty.join(" | ");
}

static qint64 sortTime(const QDateTime &timestamp)
{
    return timestamp.isValid() ? timestamp.toMSecsSinceEpoch() : 0;
}

LedgerProcessor::LedgerProcessor(const Decimal &openingQuantitySacks,
                                 const Decimal &openingCostPerSack,
                                 const QDateTime &openingTimestamp)
    : m_openingQuantity(roundDecimal(openingQuantitySacks))
    , m_openingCost(roundDecimal(openingCostPerSack))
    , m_openingTimestamp(openingTimestamp)
{
}

bool LedgerProcessor::eventLessThan(const StockEvent &a, const StockEvent &b)
{
    const qint64 ta = sortTime(a.timestamp);
    const qint64 tb = sortTime(b.timestamp);
    if (ta != tb) return ta < tb;
    if (a.invoiceId != b.invoiceId) return a.invoiceId < b.invoiceId;
    if (a.itemId != b.itemId) return a.itemId < b.itemId;
    return a.eventOrder < b.eventOrder;
}

void LedgerProcessor::sortEvents(QList<StockEvent> &events)
{
    std::stable_sort(events.begin(), events.end(), &LedgerProcessor::eventLessThan);
}

LedgerMovement LedgerProcessor::openingMovement() const
{
    LedgerMovement m;
    m.type = MovementType::Opening;
    m.timestamp = m_openingTimestamp;
    m.unitCost = m_openingCost;
    m.balanceQuantityAfter = m_openingQuantity;
    m.balanceValueAfter = decimalIsZero(m_openingQuantity)
        ? Decimal(0)
        : roundDecimal(m_openingQuantity * m_openingCost);
    m.movingAverageCostAfter = decimalIsZero(m_openingQuantity)
        ? Decimal(0)
        : roundDecimal(m.balanceValueAfter / m_openingQuantity);
    m.notes = "Saldo inicial";
    return m;
}

LedgerResult LedgerProcessor::process(QList<StockEvent> events, QList<FinishedSaleRecord> &sales) const
{
    LedgerResult result;

    const LedgerMovement opening = openingMovement();
    LedgerState &state = result.finalState;
    state.balanceQuantitySacks = opening.balanceQuantityAfter;
    state.balanceValue = opening.balanceValueAfter;
    state.movingAverageCost = opening.movingAverageCostAfter;
    result.movements.append(opening);

    sortEvents(events);

    for (const StockEvent &event : events) {
        if (event.kind == StockEventKind::Entry) {
            applyEntry(event, state, result.movements);
            continue;
        }

        FinishedSaleRecord *sale = nullptr;
        if (event.saleIndex >= 0 && event.saleIndex < sales.size()) {
            sale = &sales[event.saleIndex];
        }
        applyWithdrawal(event, state, result.movements, sale);
    }

    qInfo(ledger) << "LedgerProcessor: events" << events.size()
                  << "movements" << result.movements.size()
                  << "final balance" << decimalToString(state.balanceQuantitySacks, 4)
                  << "average cost" << decimalToString(state.movingAverageCost);
    return result;
}

LedgerMovement LedgerProcessor::movementFor(const StockEvent &event, const LedgerState &state) const
{
    LedgerMovement m;
    m.timestamp = event.timestamp;
    m.document = event.document;
    m.counterparty = event.counterpartyName.isEmpty() ? event.counterpartyId : event.counterpartyName;
    m.counterpartyId = event.counterpartyId;
    m.cfop = event.cfop;
    m.invoiceId = event.invoiceId;
    m.itemId = event.itemId;
    m.movingAverageCostAfter = state.movingAverageCost;
    m.balanceQuantityAfter = state.balanceQuantitySacks;
    m.balanceValueAfter = state.balanceValue;
    return m;
}

void LedgerProcessor::applyEntry(const StockEvent &event, LedgerState &state, QList<LedgerMovement> &out) const
{
    const Decimal quantity = roundDecimal(event.quantitySacks);

    Decimal unitCost = 0;
    Decimal entryValue = 0;
    if (event.unitCost) {
        unitCost = roundDecimal(*event.unitCost);
        entryValue = roundDecimal(*event.unitCost * quantity);
    } else if (event.netTotal) {
        unitCost = decimalIsZero(quantity) ? Decimal(0) : roundDecimal(*event.netTotal / quantity);
        entryValue = roundDecimal(*event.netTotal);
    } else {
        unitCost = state.movingAverageCost;
        entryValue = roundDecimal(unitCost * quantity);
    }

    const bool costRestart = decimalIsZero(state.balanceQuantitySacks);

    state.balanceQuantitySacks = roundDecimal(state.balanceQuantitySacks + quantity);
    state.balanceValue = roundDecimal(state.balanceValue + entryValue);
    if (costRestart) {
        state.movingAverageCost = unitCost;
    } else if (!decimalIsZero(state.balanceQuantitySacks)) {
        state.movingAverageCost = roundDecimal(state.balanceValue / state.balanceQuantitySacks);
    }
    if (decimalIsZero(state.balanceQuantitySacks)) {
        state.balanceValue = 0;
    }

    LedgerMovement m = movementFor(event, state);
    m.type = MovementType::Entry;
    m.appliedQuantitySacks = quantity;
    m.requestedQuantitySacks = quantity;
    m.unitCost = unitCost;
    m.costRestarted = costRestart;
    m.notes = event.notes;
    out.append(m);
}

void LedgerProcessor::applyWithdrawal(const StockEvent &event, LedgerState &state, QList<LedgerMovement> &out,
                                      FinishedSaleRecord *sale) const
{
    const Decimal requested = roundDecimal(boost::multiprecision::abs(event.quantitySacks));

    if (decimalIsZero(state.balanceQuantitySacks)) {
        if (sale) {
            sale->rawMaterialConsumedSacks = 0;
            sale->costPerSackAtConsumption.reset();
            sale->rawMaterialCostValue.reset();
        }

        LedgerMovement blocked = movementFor(event, state);
        blocked.type = MovementType::Exit;
        blocked.appliedQuantitySacks = 0;
        blocked.requestedQuantitySacks = negated(requested);
        blocked.unitCost = state.movingAverageCost;
        blocked.blocked = true;
        blocked.notes = joinNotes({ event.notes, kBlockedNote });
        out.append(blocked);

        qDebug(ledger) << "LedgerProcessor: blocked withdrawal of" << decimalToString(requested, 4)
                       << "SC on zero balance, invoice" << event.invoiceId << "item" << event.itemId;
        return;
    }

    const Decimal averageCost = state.movingAverageCost;
    const Decimal applied = requested > state.balanceQuantitySacks ? state.balanceQuantitySacks : requested;
    const Decimal exitValue = roundDecimal(averageCost * applied);

    state.balanceQuantitySacks = roundDecimal(state.balanceQuantitySacks - applied);
    if (state.balanceQuantitySacks < 0) state.balanceQuantitySacks = 0;
    state.balanceValue = roundDecimal(state.balanceValue - exitValue);
    if (state.balanceValue < 0) state.balanceValue = 0;
    if (decimalIsZero(state.balanceQuantitySacks)) state.balanceValue = 0;

    if (sale) {
        sale->rawMaterialConsumedSacks = applied;
        if (decimalIsZero(applied)) {
            sale->costPerSackAtConsumption.reset();
            sale->rawMaterialCostValue.reset();
        } else {
            sale->costPerSackAtConsumption = averageCost;
            sale->rawMaterialCostValue = exitValue;
        }
    }

    const bool clamped = requested > applied;

    LedgerMovement m = movementFor(event, state);
    m.type = MovementType::Exit;
    m.appliedQuantitySacks = negated(applied);
    m.requestedQuantitySacks = negated(requested);
    m.unitCost = averageCost;
    m.notes = joinNotes({ event.notes, clamped ? QString(kClampedNote) : QString() });
    out.append(m);

    if (!clamped) return;

    const Decimal remaining = roundDecimal(requested - applied);
    LedgerMovement blocked = movementFor(event, state);
    blocked.type = MovementType::Exit;
    blocked.appliedQuantitySacks = 0;
    blocked.requestedQuantitySacks = negated(remaining);
    blocked.unitCost = averageCost;
    blocked.blocked = true;
    blocked.notes = joinNotes({
        event.notes,
        kBlockedNote,
        QString("Quantidade bloqueada: %1 SC").arg(decimalToString(remaining, 4))
    });
    out.append(blocked);

    qDebug(ledger) << "LedgerProcessor: withdrawal clamped to" << decimalToString(applied, 4)
                   << "SC, blocked" << decimalToString(remaining, 4) << "SC, invoice" << event.invoiceId;
}

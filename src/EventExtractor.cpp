#include "EventExtractor.h"
#include "TextUtils.h"
#include "UnitNormalizer.h"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(extractor, "kardex.extractor")

EventExtractor::EventExtractor(const KardexConfig &config,
                               const QList<ResolvedCompany> &companies,
                               const QHash<QString, QString> &partnerNames)
    : m_config(config)
    , m_aliasResolver(config)
    , m_partnerNames(partnerNames)
{
    for (const ResolvedCompany &c : companies) {
        m_companyCnpjs.insert(c.id, c.cnpjDigits);
        if (!c.cnpjDigits.isEmpty()) m_groupCnpjs.insert(c.cnpjDigits);
    }
    for (const QString &cnpj : config.blockedCnpjDigits()) {
        m_blockedCnpjs.insert(cnpj);
    }
    for (const QString &cfop : config.excludedCfops) {
        m_excludedCfops.insert(cfop.trimmed());
    }
}

QString EventExtractor::partnerKey(const QString &companyId, const QString &cnpjDigits)
{
    return companyId + ':' + cnpjDigits;
}

Decimal EventExtractor::unitNetPrice(const InvoiceItemRecord &item)
{
    if (decimalIsZero(item.quantity)) return Decimal(0);
    return Decimal((item.gross - item.discount) / item.quantity);
}

QString EventExtractor::documentFor(const InvoiceItemRecord &item)
{
    return item.invoiceNumber.isEmpty() ? item.accessKey : item.invoiceNumber;
}

QString EventExtractor::counterpartyId(const InvoiceItemRecord &item) const
{
    const QString own = m_companyCnpjs.value(item.companyId);
    const QString issuer = normalizeCnpj(item.issuerCnpj);
    const QString recipient = normalizeCnpj(item.recipientCnpj);

    if (item.direction == InvoiceDirection::Inbound) {
        return issuer != own ? issuer : recipient;
    }
    return recipient != own ? recipient : issuer;
}

QString EventExtractor::counterpartyName(const InvoiceItemRecord &item) const
{
    const QString cnpj = counterpartyId(item);
    if (cnpj.isEmpty()) return QString();
    return m_partnerNames.value(partnerKey(item.companyId, cnpj), cnpj);
}

EventExtractor::InvoiceVerdict EventExtractor::classifyInvoice(const InvoiceItemRecord &item) const
{
    const QString issuer = normalizeCnpj(item.issuerCnpj);
    const QString recipient = normalizeCnpj(item.recipientCnpj);

    if ((!issuer.isEmpty() && m_blockedCnpjs.contains(issuer))
        || (!recipient.isEmpty() && m_blockedCnpjs.contains(recipient))) {
        return InvoiceVerdict::Blocked;
    }

    if (issuer != recipient && m_groupCnpjs.contains(issuer) && m_groupCnpjs.contains(recipient)) {
        return InvoiceVerdict::Intercompany;
    }

    return InvoiceVerdict::Keep;
}

StockEvent EventExtractor::baseEvent(const InvoiceItemRecord &item, StockEventKind kind) const
{
    StockEvent e;
    e.kind = kind;
    e.eventOrder = StockEvent::orderFor(kind);
    e.timestamp = item.issuedAt;
    e.invoiceId = item.invoiceId;
    e.itemId = item.itemId;
    e.counterpartyId = counterpartyId(item);
    e.counterpartyName = counterpartyName(item);
    e.document = documentFor(item);
    e.cfop = item.cfop;
    return e;
}

ExtractionResult EventExtractor::extract(const QList<InvoiceItemRecord> &items) const
{
    ExtractionResult result;
    ExtractionStats &stats = result.stats;

    for (const InvoiceItemRecord &item : items) {
        ++stats.itemsSeen;

        if (m_excludedCfops.contains(item.cfop.trimmed())) {
            ++stats.skippedExcludedCfop;
            continue;
        }

        if (item.cancelled) {
            ++stats.skippedCancelled;
            continue;
        }

        const InvoiceVerdict verdict = classifyInvoice(item);
        if (verdict == InvoiceVerdict::Blocked) {
            ++stats.skippedBlockedCounterparty;
            continue;
        }
        if (verdict == InvoiceVerdict::Intercompany) {
            ++stats.skippedIntercompany;
            continue;
        }

        const std::optional<ProductAlias> alias = m_aliasResolver.resolve(item);
        if (!alias) {
            ++stats.skippedUnresolvedProduct;
            continue;
        }

        if (item.hadMalformedNumber) {
            ++stats.malformedNumbers;
            qWarning(extractor) << "EventExtractor: non-numeric value read as 0 in invoice"
                                << item.invoiceId << "item" << item.itemId;
        }

        if (*alias == ProductAlias::RawMaterial) {
            if (item.direction == InvoiceDirection::Inbound && item.quantity < 0) {
                ++stats.skippedNegativeEntry;
                qWarning(extractor) << "EventExtractor: negative quantity" << decimalToString(item.quantity, 4)
                                    << "on inbound raw material skipped, invoice"
                                    << item.invoiceId << "item" << item.itemId;
                continue;
            }

            bool recognized = true;
            UnitNormalizer::toSacks(item.quantity, item.unit, &recognized);
            if (!recognized) {
                ++stats.unrecognizedUnits;
                qWarning(extractor) << "EventExtractor: unit" << item.unit
                                    << "not recognized, quantity taken as sacks in invoice"
                                    << item.invoiceId << "item" << item.itemId;
            }
            appendRawMaterialEvent(item, result);
            continue;
        }

        if (item.direction != InvoiceDirection::Outbound) {
            ++stats.skippedIgnoredDirection;
            continue;
        }
        if (decimalIsZero(item.quantity)) {
            ++stats.skippedZeroQuantity;
            continue;
        }
        appendConsumptionEvent(item, *alias, result);
    }

    qInfo(extractor) << "EventExtractor: items" << stats.itemsSeen
                     << "events" << result.events.size()
                     << "finished sales" << result.sales.size()
                     << "intercompany" << stats.skippedIntercompany
                     << "blocked" << stats.skippedBlockedCounterparty
                     << "cancelled" << stats.skippedCancelled
                     << "unresolved" << stats.skippedUnresolvedProduct;
    return result;
}

void EventExtractor::appendRawMaterialEvent(const InvoiceItemRecord &item, ExtractionResult &result) const
{
    const bool inbound = item.direction == InvoiceDirection::Inbound;
    StockEvent e = baseEvent(item, inbound ? StockEventKind::Entry : StockEventKind::Exit);

    const Decimal qtySacks = UnitNormalizer::toSacks(item.quantity, item.unit);
    const Decimal netTotal = unitNetPrice(item) * item.quantity;

    e.quantitySacks = qtySacks;
    e.netTotal = netTotal;
    e.unitCost = decimalIsZero(qtySacks) ? Decimal(0) : Decimal(netTotal / qtySacks);
    e.notes = inbound ? "Entrada MP" : "Venda MP";

    result.events.append(e);
}

void EventExtractor::appendConsumptionEvent(const InvoiceItemRecord &item, ProductAlias alias,
                                            ExtractionResult &result) const
{
    const Decimal price = unitNetPrice(item);
    const Decimal consumed = item.quantity * m_config.consumptionRatioSacksPerUnit;

    FinishedSaleRecord sale;
    sale.timestamp = item.issuedAt;
    sale.invoiceId = item.invoiceId;
    sale.itemId = item.itemId;
    sale.productAlias = alias;
    sale.document = documentFor(item);
    sale.counterpartyId = counterpartyId(item);
    sale.counterparty = counterpartyName(item);
    sale.cfop = item.cfop;
    sale.natureOfOperation = item.natureOfOperation;
    sale.unitsSold = item.quantity;
    sale.unitNetPrice = price;
    sale.valuePerSack = price * m_config.finishedUnitsPerSack;
    sale.nominalConsumptionSacks = consumed;
    sale.rawMaterialConsumedSacks = consumed;

    StockEvent e = baseEvent(item, StockEventKind::Consumption);
    e.quantitySacks = consumed;
    e.notes = QString("Consumo por %1").arg(productAliasCode(alias));
    e.saleIndex = result.sales.size();

    result.sales.append(sale);
    result.events.append(e);
}

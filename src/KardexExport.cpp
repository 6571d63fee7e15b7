#include "KardexExport.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonValue>

static const int kQtyDigits = 4;
static const int kMoneyDigits = 2;

static QJsonValue optionalMoney(const std::optional<Decimal> &value)
{
    if (!value) return QJsonValue(QJsonValue::Null);
    return decimalToString(*value, kMoneyDigits);
}

static QJsonValue nullableText(const QString &value)
{
    if (value.isEmpty()) return QJsonValue(QJsonValue::Null);
    return value;
}

static QString yesNo(bool value)
{
    return value ? QStringLiteral("Sim") : QStringLiteral("Não");
}

QString KardexExport::formatTimestamp(const QDateTime &timestamp)
{
    if (!timestamp.isValid()) return QString();
    return timestamp.toUTC().toString(Qt::ISODateWithMs);
}

QString KardexExport::escapeCsvValue(const QString &value)
{
    if (value.contains('"') || value.contains(';') || value.contains('\n')) {
        QString escaped = value;
        escaped.replace("\"", "\"\"");
        return '"' + escaped + '"';
    }
    return value;
}

QJsonObject KardexExport::toJsonObject(const KardexReport &report)
{
    QJsonObject filters;
    filters["from"] = report.filters.from.isValid()
        ? QJsonValue(formatTimestamp(report.filters.from))
        : QJsonValue(QJsonValue::Null);
    filters["to"] = formatTimestamp(report.filters.to);
    QJsonArray companies;
    for (const ResolvedCompany &c : report.filters.companies) {
        QJsonObject o;
        o["id"] = c.id;
        o["name"] = c.name;
        o["cnpj"] = c.cnpj;
        o["alias"] = nullableText(c.alias);
        companies.append(o);
    }
    filters["companies"] = companies;

    QJsonArray movements;
    for (const LedgerMovement &m : report.movements) {
        QJsonObject o;
        o["type"] = m.typeString();
        o["timestamp"] = nullableText(formatTimestamp(m.timestamp));
        o["document"] = nullableText(m.document);
        o["partner"] = nullableText(m.counterparty);
        o["partnerCnpj"] = nullableText(m.counterpartyId);
        o["cfop"] = nullableText(m.cfop);
        o["qtySc"] = decimalToString(m.appliedQuantitySacks, kQtyDigits);
        o["requestedQtySc"] = decimalToString(m.requestedQuantitySacks, kQtyDigits);
        o["unitCostSc"] = decimalToString(m.unitCost, kMoneyDigits);
        o["movingAverageCost"] = decimalToString(m.movingAverageCostAfter, kMoneyDigits);
        o["balanceSc"] = decimalToString(m.balanceQuantityAfter, kQtyDigits);
        o["balanceValue"] = decimalToString(m.balanceValueAfter, kMoneyDigits);
        o["notes"] = nullableText(m.notes);
        o["invoiceId"] = nullableText(m.invoiceId);
        o["itemId"] = nullableText(m.itemId);
        o["blocked"] = m.blocked;
        o["statusLabel"] = m.statusLabel();
        o["costRestart"] = m.costRestarted;
        o["costRestartLabel"] = yesNo(m.costRestarted);
        movements.append(o);
    }

    QJsonArray sales;
    for (const FinishedSaleRecord &s : report.finishedSales) {
        QJsonObject o;
        o["timestamp"] = nullableText(formatTimestamp(s.timestamp));
        o["document"] = nullableText(s.document);
        o["partner"] = nullableText(s.counterparty.isEmpty() ? s.counterpartyId : s.counterparty);
        o["partnerCnpj"] = nullableText(s.counterpartyId);
        o["productAlias"] = productAliasCode(s.productAlias);
        o["qtyUnits"] = decimalToString(s.unitsSold, kQtyDigits);
        o["unitPrice"] = decimalToString(s.unitNetPrice, kMoneyDigits);
        o["mpConsumedSc"] = decimalToString(s.rawMaterialConsumedSacks, kQtyDigits);
        o["costAverageSc"] = optionalMoney(s.costPerSackAtConsumption);
        o["mpCostValue"] = optionalMoney(s.rawMaterialCostValue);
        o["valuePerSc"] = decimalToString(s.valuePerSack, kMoneyDigits);
        o["cfop"] = nullableText(s.cfop);
        o["natOp"] = nullableText(s.natureOfOperation);
        o["invoiceId"] = s.invoiceId;
        o["itemId"] = s.itemId;
        sales.append(o);
    }

    QJsonArray daily;
    for (const DailyTotal &d : report.dailyTotals) {
        QJsonObject o;
        o["date"] = d.date.toString(Qt::ISODate);
        o["entriesSc"] = decimalToString(d.entriesSacks, kQtyDigits);
        o["exitsSc"] = decimalToString(d.exitsSacks, kQtyDigits);
        o["balanceSc"] = decimalToString(d.balanceSacks, kQtyDigits);
        o["movingAverageCost"] = decimalToString(d.movingAverageCost, kMoneyDigits);
        daily.append(o);
    }

    QJsonArray products;
    for (const ProductTotal &p : report.productTotals) {
        QJsonObject o;
        o["productAlias"] = productAliasCode(p.productAlias);
        o["qtyUnits"] = decimalToString(p.unitsSold, kQtyDigits);
        o["mpConsumedSc"] = decimalToString(p.rawMaterialConsumedSacks, kQtyDigits);
        o["revenuePerSc"] = decimalToString(p.revenuePerSack, kMoneyDigits);
        o["mpCostValue"] = decimalToString(p.rawMaterialCostValue, kMoneyDigits);
        products.append(o);
    }

    const KardexGrandTotals &g = report.grandTotals;
    QJsonObject mpTotals;
    mpTotals["entriesSc"] = decimalToString(g.movements.entriesSacks, kQtyDigits);
    mpTotals["exitsSc"] = decimalToString(g.movements.exitsSacks, kQtyDigits);
    mpTotals["balanceSc"] = decimalToString(g.balanceSacks, kQtyDigits);
    mpTotals["balanceValue"] = decimalToString(g.balanceValue, kMoneyDigits);
    mpTotals["movingAverageCost"] = decimalToString(g.movingAverageCost, kMoneyDigits);

    QJsonObject finishedTotals;
    finishedTotals["qtyUnits"] = decimalToString(g.finished.unitsSold, kQtyDigits);
    finishedTotals["mpConsumedSc"] = decimalToString(g.finished.rawMaterialConsumedSacks, kQtyDigits);
    finishedTotals["revenuePerSc"] = decimalToString(g.finished.revenuePerSack, kMoneyDigits);
    finishedTotals["mpCostValue"] = decimalToString(g.finished.rawMaterialCostValue, kMoneyDigits);

    const ExtractionStats &st = report.stats;
    QJsonObject stats;
    stats["itemsSeen"] = st.itemsSeen;
    stats["skippedExcludedCfop"] = st.skippedExcludedCfop;
    stats["skippedCancelled"] = st.skippedCancelled;
    stats["skippedIntercompany"] = st.skippedIntercompany;
    stats["skippedBlockedCounterparty"] = st.skippedBlockedCounterparty;
    stats["skippedUnresolvedProduct"] = st.skippedUnresolvedProduct;
    stats["skippedIgnoredDirection"] = st.skippedIgnoredDirection;
    stats["skippedZeroQuantity"] = st.skippedZeroQuantity;
    stats["skippedNegativeEntry"] = st.skippedNegativeEntry;
    stats["malformedNumbers"] = st.malformedNumbers;
    stats["unrecognizedUnits"] = st.unrecognizedUnits;

    QJsonObject root;
    root["filters"] = filters;
    root["mpMovements"] = movements;
    root["finishedSales"] = sales;
    root["mpDailyTotals"] = daily;
    root["mpTotals"] = mpTotals;
    root["finishedTotalsByProduct"] = products;
    root["finishedTotals"] = finishedTotals;
    root["stats"] = stats;
    return root;
}

QByteArray KardexExport::toJson(const KardexReport &report)
{
    return QJsonDocument(toJsonObject(report)).toJson(QJsonDocument::Indented);
}

QStringList KardexExport::movementCsvRow(const LedgerMovement &m)
{
    if (m.type == MovementType::Opening) {
        const QString balance = decimalToString(m.balanceQuantityAfter, kQtyDigits);
        const QString average = decimalToString(m.movingAverageCostAfter, kMoneyDigits);
        return {
            formatTimestamp(m.timestamp), QString(), QString(), QString(),
            QStringLiteral("Saldo Inicial"), m.statusLabel(),
            balance, average, average, balance,
            yesNo(false), m.notes
        };
    }

    return {
        formatTimestamp(m.timestamp),
        m.document,
        m.counterparty,
        m.cfop,
        m.typeString(),
        m.statusLabel(),
        decimalToString(m.appliedQuantitySacks, kQtyDigits),
        decimalToString(m.unitCost, kMoneyDigits),
        decimalToString(m.movingAverageCostAfter, kMoneyDigits),
        decimalToString(m.balanceQuantityAfter, kQtyDigits),
        yesNo(m.costRestarted),
        m.notes
    };
}

QStringList KardexExport::saleCsvRow(const FinishedSaleRecord &s)
{
    return {
        formatTimestamp(s.timestamp),
        s.document,
        s.counterparty.isEmpty() ? s.counterpartyId : s.counterparty,
        productAliasCode(s.productAlias),
        decimalToString(s.unitsSold, kQtyDigits),
        decimalToString(s.unitNetPrice, kMoneyDigits),
        decimalToString(s.rawMaterialConsumedSacks, kQtyDigits),
        s.costPerSackAtConsumption ? decimalToString(*s.costPerSackAtConsumption, kMoneyDigits) : QString(),
        decimalToString(s.valuePerSack, kMoneyDigits)
    };
}

QByteArray KardexExport::toCsv(const KardexReport &report)
{
    QList<QStringList> rows;
    rows.append({ QStringLiteral("Relatório Kardex Consolidado") });
    rows.append({ QStringLiteral("Bloco 1 - Kardex da Matéria-Prima (%1)")
                      .arg(productAliasCode(ProductAlias::RawMaterial)) });
    rows.append({
        "Data/Hora", "Documento", "Parceiro", "CFOP", "Tipo", "Status", "Qtd (SC)",
        "Custo Unitário (R$/SC)", "Custo Médio Após Movimento (R$/SC)", "Saldo (SC)",
        "Reinício de custo", "Observações"
    });
    for (const LedgerMovement &m : report.movements) {
        rows.append(movementCsvRow(m));
    }

    rows.append({ QString() });
    rows.append({ QStringLiteral("Bloco 2 - Vendas de Produtos Acabados") });
    rows.append({
        "Data/Hora", "Documento", "Parceiro", "Produto", "Qtd (unid)",
        "Preço Unitário Venda (R$)", "MP Consumida (SC)",
        "Custo Médio SC na Data/Hora (R$)", "Valor da Saca Bruta (R$)"
    });
    for (const FinishedSaleRecord &s : report.finishedSales) {
        rows.append(saleCsvRow(s));
    }

    QStringList lines;
    for (const QStringList &row : rows) {
        QStringList cells;
        for (const QString &cell : row) cells.append(escapeCsvValue(cell));
        lines.append(cells.join(';'));
    }
    return lines.join('\n').toUtf8();
}

#ifndef KARDEXTESTDATA_H
#define KARDEXTESTDATA_H

#include <QDateTime>
#include <QTimeZone>

#include "DecimalUtils.h"
#include "KardexConfig.h"
#include "KardexTypes.h"

namespace testdata {

const QString kJmId = "c-jm";
const QString kOlgId = "c-olg";
const QString kJmCnpj = "11.111.111/0001-11";
const QString kOlgCnpj = "22.222.222/0001-22";
const QString kSupplierCnpj = "33.333.333/0001-33";
const QString kCustomerCnpj = "44.444.444/0001-44";

const QString kRawMaterialName = "Café Conilon Beneficiado";
const QString kRanchoName = "CAFE RANCHO 10X500G";

inline Decimal dec(const char *value)
{
    return Decimal(value);
}

inline QDateTime utc(int y, int m, int d, int h = 12, int min = 0)
{
    return QDateTime(QDate(y, m, d), QTime(h, min), QTimeZone::UTC);
}

inline Company jmCompany()
{
    return { kJmId, "JM Comercio de Cafe Ltda", kJmCnpj };
}

inline Company olgCompany()
{
    return { kOlgId, "OLG Industria de Alimentos", kOlgCnpj };
}

inline ResolvedCompany resolved(const Company &c, const QString &alias)
{
    ResolvedCompany r;
    r.id = c.id;
    r.name = c.name;
    r.cnpj = c.cnpj;
    r.alias = alias;
    QString digits;
    for (const QChar ch : c.cnpj) {
        if (ch.isDigit()) digits.append(ch);
    }
    r.cnpjDigits = digits;
    return r;
}

inline QList<ResolvedCompany> groupCompanies()
{
    return { resolved(jmCompany(), "JM"), resolved(olgCompany(), "OLG") };
}

/**
 * Invoice line of JM: inbound lines come from the supplier, outbound go to the customer.
 */
inline InvoiceItemRecord makeItem(const QString &invoiceId,
                                  const QDateTime &issuedAt,
                                  InvoiceDirection direction,
                                  const QString &description,
                                  const char *quantity,
                                  const char *unitPrice,
                                  const QString &unit = "SC")
{
    InvoiceItemRecord r;
    r.invoiceId = invoiceId;
    r.itemId = invoiceId + "-1";
    r.companyId = kJmId;
    r.issuedAt = issuedAt;
    r.direction = direction;
    r.invoiceNumber = invoiceId.toUpper();
    r.accessKey = "KEY-" + invoiceId;
    const bool inbound = direction == InvoiceDirection::Inbound;
    r.issuerCnpj = inbound ? kSupplierCnpj : kJmCnpj;
    r.recipientCnpj = inbound ? kJmCnpj : kCustomerCnpj;
    r.natureOfOperation = inbound ? "Compra para industrializacao" : "Venda de producao do estabelecimento";
    r.cfop = inbound ? "1101" : "5101";
    r.description = description;
    r.unit = unit;
    r.quantity = Decimal(quantity);
    r.unitPrice = Decimal(unitPrice);
    r.gross = r.quantity * r.unitPrice;
    r.discount = 0;
    return r;
}

inline KardexConfig testConfig()
{
    KardexConfig c = KardexConfig::defaults();
    c.consumptionRatioSacksPerUnit = dec("0.5");
    c.finishedUnitsPerSack = dec("9.6");
    return c;
}

} // namespace testdata

#endif // KARDEXTESTDATA_H

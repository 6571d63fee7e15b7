#include "repositories/InvoiceRepository.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QTimeZone>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(invoiceRepo, "repository.invoice")

InvoiceRepository::InvoiceRepository(QSqlDatabase db)
    : m_db(db)
{
    if (!m_db.isOpen()) {
        qCritical(invoiceRepo) << "InvoiceRepository: Database is not open";
    }
}

bool InvoiceRepository::executeQuery(QSqlQuery& q, const QString& context) const
{
    if (!q.exec()) {
        qCritical(invoiceRepo) << "InvoiceRepository::" << context << "- SQL error:" << q.lastError().text();
        qCritical(invoiceRepo) << "InvoiceRepository::" << context << "- SQL:" << q.executedQuery();
        return false;
    }
    return true;
}

QString InvoiceRepository::toDbTimestamp(const QDateTime& value)
{
    return value.toUTC().toString(Qt::ISODateWithMs);
}

QDateTime InvoiceRepository::fromDbTimestamp(const QString& value)
{
    const QString text = value.trimmed();
    if (text.isEmpty()) return QDateTime();

    QDateTime dt = QDateTime::fromString(text, Qt::ISODateWithMs);
    if (!dt.isValid()) dt = QDateTime::fromString(text, Qt::ISODate);
    if (!dt.isValid()) {
        // дата без времени
        const QDate d = QDate::fromString(text.left(10), Qt::ISODate);
        if (!d.isValid()) return QDateTime();
        return QDateTime(d, QTime(0, 0), QTimeZone::UTC);
    }

    // без явного смещения считаем время UTC
    if (dt.timeSpec() == Qt::LocalTime) {
        dt = QDateTime(dt.date(), dt.time(), QTimeZone::UTC);
    }
    return dt.toUTC();
}

static Decimal readDecimal(const QSqlQuery& q, const char* column, bool& malformed)
{
    bool ok = true;
    const Decimal value = decimalFromVariant(q.value(column), &ok);
    if (!ok) malformed = true;
    return value;
}

InvoiceItemRecord InvoiceRepository::itemFromQuery(const QSqlQuery& q) const
{
    InvoiceItemRecord r;
    r.invoiceId = q.value("invoice_id").toString();
    r.itemId = q.value("item_id").toString();
    r.companyId = q.value("company_id").toString();
    r.issuedAt = fromDbTimestamp(q.value("emissao").toString());
    r.direction = q.value("type").toString().compare("IN", Qt::CaseInsensitive) == 0
        ? InvoiceDirection::Inbound
        : InvoiceDirection::Outbound;
    r.invoiceNumber = q.value("numero").toString();
    r.accessKey = q.value("chave").toString();
    r.issuerCnpj = q.value("issuer_cnpj").toString();
    r.recipientCnpj = q.value("recipient_cnpj").toString();
    r.natureOfOperation = q.value("nat_op").toString();
    r.cfop = q.value("cfop_code").toString().trimmed();
    r.mappedProductName = q.value("mapped_name").toString();
    r.mappedProductDescription = q.value("mapped_description").toString();
    r.description = q.value("description").toString();
    r.productCode = q.value("product_code").toString();
    r.unit = q.value("unit").toString();

    bool malformed = false;
    r.quantity = readDecimal(q, "qty", malformed);
    r.unitPrice = readDecimal(q, "unit_price", malformed);
    r.gross = readDecimal(q, "gross", malformed);
    r.discount = readDecimal(q, "discount", malformed);
    r.hadMalformedNumber = malformed;

    r.cancelled = q.value("cancelled").toInt() != 0;
    return r;
}

bool InvoiceRepository::fetchInvoiceItems(const QStringList& companyIds,
                                          const QDateTime& from,
                                          const QDateTime& until,
                                          const QDeadlineTimer& deadline,
                                          QList<InvoiceItemRecord>& out)
{
    out.clear();
    if (companyIds.isEmpty()) return true;

    if (deadline.hasExpired()) {
        qCritical(invoiceRepo) << "InvoiceRepository: deadline expired before fetchInvoiceItems";
        return false;
    }

    QStringList placeholders;
    for (int i = 0; i < companyIds.size(); ++i) placeholders << QString(":c%1").arg(i);

    QSqlQuery q(m_db);
    q.setForwardOnly(true);
    q.prepare(QString(R"(
        SELECT
            i.id AS invoice_id,
            it.id AS item_id,
            i.company_id,
            i.emissao,
            i.type,
            i.numero,
            i.chave,
            i.issuer_cnpj,
            i.recipient_cnpj,
            i.nat_op,
            it.cfop_code,
            it.description,
            it.product_code,
            it.unit,
            it.qty,
            it.unit_price,
            it.gross,
            it.discount,
            p.name AS mapped_name,
            p.description AS mapped_description,
            EXISTS (
                SELECT 1 FROM invoice_cancellations c
                WHERE c.company_id = i.company_id AND c.chave = i.chave
            ) AS cancelled
        FROM invoice_items it
        JOIN invoices i ON i.id = it.invoice_id
        LEFT JOIN invoice_item_mappings m ON m.invoice_item_id = it.id
        LEFT JOIN products p ON p.id = m.product_id
        WHERE i.company_id IN (%1)
          AND strftime('%Y-%m-%dT%H:%M:%fZ', i.emissao) BETWEEN :from AND :until
        ORDER BY strftime('%Y-%m-%dT%H:%M:%fZ', i.emissao), i.id, it.id
    )").arg(placeholders.join(", ")));

    for (int i = 0; i < companyIds.size(); ++i) q.bindValue(placeholders[i], companyIds[i]);
    q.bindValue(":from", toDbTimestamp(from));
    q.bindValue(":until", toDbTimestamp(until));

    if (!executeQuery(q, "fetchInvoiceItems")) return false;

    while (q.next()) {
        if (deadline.hasExpired()) {
            qCritical(invoiceRepo) << "InvoiceRepository: deadline expired after" << out.size() << "rows";
            out.clear();
            return false;
        }
        out.append(itemFromQuery(q));
    }

    qInfo(invoiceRepo) << "InvoiceRepository: fetched" << out.size() << "invoice items for"
                       << companyIds.size() << "companies";
    return true;
}

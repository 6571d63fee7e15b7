#ifndef INVOICEREPOSITORY_H
#define INVOICEREPOSITORY_H

#include <QSqlDatabase>
#include <QSqlQuery>
#include "repositories/IInvoiceRepository.h"

class InvoiceRepository : public IInvoiceRepository
{
public:
    explicit InvoiceRepository(QSqlDatabase db);

    bool fetchInvoiceItems(const QStringList& companyIds,
                           const QDateTime& from,
                           const QDateTime& until,
                           const QDeadlineTimer& deadline,
                           QList<InvoiceItemRecord>& out) override;

    static QString toDbTimestamp(const QDateTime& value);
    static QDateTime fromDbTimestamp(const QString& value);

private:
    InvoiceItemRecord itemFromQuery(const QSqlQuery& q) const;
    bool executeQuery(QSqlQuery& q, const QString& context) const;

private:
    QSqlDatabase m_db;
};

#endif // INVOICEREPOSITORY_H

#ifndef IINVOICEREPOSITORY_H
#define IINVOICEREPOSITORY_H

#include <QDateTime>
#include <QDeadlineTimer>
#include <QList>
#include <QStringList>

#include "KardexTypes.h"

/**
 * @brief Интерфейс чтения строк НФ
 *
 * Запись НФ ведет подсистема загрузки XML, здесь только чтение.
 */
class IInvoiceRepository
{
public:
    virtual ~IInvoiceRepository() = default;

    /**
     * @brief Все строки НФ компаний за [from, until]
     *
     * Порядок: дата выдачи, id НФ, id строки. Выборка прерывается, если
     * истек @p deadline.
     * @return false при ошибке SQL или истечении срока
     */
    virtual bool fetchInvoiceItems(const QStringList &companyIds,
                                   const QDateTime &from,
                                   const QDateTime &until,
                                   const QDeadlineTimer &deadline,
                                   QList<InvoiceItemRecord> &out) = 0;
};

#endif // IINVOICEREPOSITORY_H

#ifndef IPARTNERREPOSITORY_H
#define IPARTNERREPOSITORY_H

#include <QDeadlineTimer>
#include <QHash>
#include <QString>
#include <QStringList>

/**
 * @brief Интерфейс справочника контрагентов
 */
class IPartnerRepository
{
public:
    virtual ~IPartnerRepository() = default;

    /**
     * @brief Наименования контрагентов
     * @param out ключ "companyId:cnpj" (только цифры) -> наименование
     * @return false при ошибке SQL или истечении deadline
     *
     * Отсутствие имени не ошибка, вместо него выводится CNPJ.
     */
    virtual bool fetchPartnerNames(const QStringList &companyIds,
                                   const QDeadlineTimer &deadline,
                                   QHash<QString, QString> &out) = 0;
};

#endif // IPARTNERREPOSITORY_H

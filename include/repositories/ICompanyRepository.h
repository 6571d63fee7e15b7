#ifndef ICOMPANYREPOSITORY_H
#define ICOMPANYREPOSITORY_H

#include <QList>

#include "KardexTypes.h"

/**
 * @brief Интерфейс репозитория юрлиц
 */
class ICompanyRepository
{
public:
    virtual ~ICompanyRepository() = default;

    /**
     * @brief Все юрлица; при ошибке SQL возвращает false
     */
    virtual bool findAll(QList<Company> &out) = 0;
};

#endif // ICOMPANYREPOSITORY_H

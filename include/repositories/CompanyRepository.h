#ifndef COMPANYREPOSITORY_H
#define COMPANYREPOSITORY_H

#include <QSqlDatabase>
#include <QSqlQuery>
#include "repositories/ICompanyRepository.h"

class CompanyRepository : public ICompanyRepository
{
public:
    explicit CompanyRepository(QSqlDatabase db);

    bool findAll(QList<Company>& out) override;

private:
    bool executeQuery(QSqlQuery& q, const QString& context) const;

private:
    QSqlDatabase m_db;
};

#endif // COMPANYREPOSITORY_H

#include "repositories/CompanyRepository.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(companyRepo, "repository.company")

CompanyRepository::CompanyRepository(QSqlDatabase db)
    : m_db(db)
{
    if (!m_db.isOpen()) {
        qCritical(companyRepo) << "CompanyRepository: Database is not open";
    }
}

bool CompanyRepository::executeQuery(QSqlQuery& q, const QString& context) const
{
    if (!q.exec()) {
        qCritical(companyRepo) << "CompanyRepository::" << context << "- SQL error:" << q.lastError().text();
        qCritical(companyRepo) << "CompanyRepository::" << context << "- SQL:" << q.executedQuery();
        return false;
    }
    return true;
}

bool CompanyRepository::findAll(QList<Company>& out)
{
    out.clear();

    QSqlQuery q(m_db);
    q.prepare(R"(
        SELECT id, name, cnpj
        FROM companies
        ORDER BY name, id
    )");

    if (!executeQuery(q, "findAll")) return false;

    while (q.next()) {
        Company c;
        c.id = q.value("id").toString();
        c.name = q.value("name").toString();
        c.cnpj = q.value("cnpj").toString();
        out.append(c);
    }
    return true;
}

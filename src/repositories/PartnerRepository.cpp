#include "repositories/PartnerRepository.h"
#include "TextUtils.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(partnerRepo, "repository.partner")

PartnerRepository::PartnerRepository(QSqlDatabase db)
    : m_db(db)
{
    if (!m_db.isOpen()) {
        qCritical(partnerRepo) << "PartnerRepository: Database is not open";
    }
}

bool PartnerRepository::executeQuery(QSqlQuery& q, const QString& context) const
{
    if (!q.exec()) {
        qCritical(partnerRepo) << "PartnerRepository::" << context << "- SQL error:" << q.lastError().text();
        qCritical(partnerRepo) << "PartnerRepository::" << context << "- SQL:" << q.executedQuery();
        return false;
    }
    return true;
}

bool PartnerRepository::fetchPartnerNames(const QStringList& companyIds,
                                          const QDeadlineTimer& deadline,
                                          QHash<QString, QString>& out)
{
    out.clear();
    if (companyIds.isEmpty()) return true;

    QStringList placeholders;
    for (int i = 0; i < companyIds.size(); ++i) placeholders << QString(":c%1").arg(i);

    QSqlQuery q(m_db);
    q.prepare(QString(R"(
        SELECT company_id, cnpj_cpf, name
        FROM partners
        WHERE company_id IN (%1)
        ORDER BY company_id, id
    )").arg(placeholders.join(", ")));
    for (int i = 0; i < companyIds.size(); ++i) q.bindValue(placeholders[i], companyIds[i]);

    if (deadline.hasExpired()) {
        qCritical(partnerRepo) << "PartnerRepository::fetchPartnerNames - deadline expired before query";
        return false;
    }
    if (!executeQuery(q, "fetchPartnerNames")) return false;

    while (q.next()) {
        if (deadline.hasExpired()) {
            qCritical(partnerRepo) << "PartnerRepository::fetchPartnerNames - deadline expired after"
                                   << out.size() << "rows";
            out.clear();
            return false;
        }
        const QString digits = normalizeCnpj(q.value("cnpj_cpf").toString());
        if (digits.isEmpty()) continue;
        out.insert(q.value("company_id").toString() + ':' + digits, q.value("name").toString());
    }
    return true;
}

#ifndef PARTNERREPOSITORY_H
#define PARTNERREPOSITORY_H

#include <QSqlDatabase>
#include <QSqlQuery>
#include "repositories/IPartnerRepository.h"

class PartnerRepository : public IPartnerRepository
{
public:
    explicit PartnerRepository(QSqlDatabase db);

    bool fetchPartnerNames(const QStringList& companyIds,
                           const QDeadlineTimer& deadline,
                           QHash<QString, QString>& out) override;

private:
    bool executeQuery(QSqlQuery& q, const QString& context) const;

private:
    QSqlDatabase m_db;
};

#endif // PARTNERREPOSITORY_H

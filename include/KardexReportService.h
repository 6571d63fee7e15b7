#ifndef KARDEXREPORTSERVICE_H
#define KARDEXREPORTSERVICE_H

#include <QObject>

#include "KardexConfig.h"
#include "KardexReport.h"
#include "repositories/ICompanyRepository.h"
#include "repositories/IInvoiceRepository.h"
#include "repositories/IPartnerRepository.h"

class KardexReportService : public QObject
{
    Q_OBJECT

public:
    explicit KardexReportService(
        const KardexConfig &config,
        ICompanyRepository* companyRepo,
        IPartnerRepository* partnerRepo,
        IInvoiceRepository* invoiceRepo,
        QObject *parent = nullptr
    );

    /**
     * @brief Построить консолидированный Kardex за период
     *
     * Вся история пересчитывается с эпохи конфигурации, затем отсекается
     * окном [from, until]. Пустой until означает сегодня (UTC).
     * @throws KardexError при ошибке конфигурации, SQL или истечении срока выборки
     */
    KardexReport buildReport(const KardexReportRequest &request) const;

    const KardexConfig& config() const { return m_config; }

    static QDateTime startOfDayUtc(const QDate &date);
    static QDateTime endOfDayUtc(const QDate &date);

private:
    QList<ResolvedCompany> resolveCompanies() const;

    KardexConfig m_config;
    ICompanyRepository* m_companyRepo;
    IPartnerRepository* m_partnerRepo;
    IInvoiceRepository* m_invoiceRepo;
};

#endif // KARDEXREPORTSERVICE_H

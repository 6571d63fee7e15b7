#include "KardexReportService.h"
#include "CompanyResolver.h"
#include "EventExtractor.h"
#include "KardexAggregator.h"
#include "KardexError.h"
#include "LedgerProcessor.h"
#include "PeriodWindower.h"

#include <QDeadlineTimer>
#include <QTimeZone>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(kardexService, "service.kardex")

KardexReportService::KardexReportService(
    const KardexConfig &config,
    ICompanyRepository* companyRepo,
    IPartnerRepository* partnerRepo,
    IInvoiceRepository* invoiceRepo,
    QObject *parent
)
    : QObject(parent)
    , m_config(config)
    , m_companyRepo(companyRepo)
    , m_partnerRepo(partnerRepo)
    , m_invoiceRepo(invoiceRepo)
{
}

QDateTime KardexReportService::startOfDayUtc(const QDate &date)
{
    if (!date.isValid()) return QDateTime();
    return QDateTime(date, QTime(0, 0), QTimeZone::UTC);
}

QDateTime KardexReportService::endOfDayUtc(const QDate &date)
{
    if (!date.isValid()) return QDateTime();
    return QDateTime(date, QTime(23, 59, 59, 999), QTimeZone::UTC);
}

QList<ResolvedCompany> KardexReportService::resolveCompanies() const
{
    QList<Company> available;
    if (!m_companyRepo->findAll(available)) {
        qCritical(kardexService) << "KardexReportService: cannot load companies";
        throw KardexError::dataAccess("Falha ao carregar as empresas.");
    }
    return CompanyResolver(m_config).resolve(available);
}

KardexReport KardexReportService::buildReport(const KardexReportRequest &request) const
{
    KardexReport report;

    const QList<ResolvedCompany> companies = resolveCompanies();
    QStringList companyIds;
    for (const ResolvedCompany &c : companies) companyIds.append(c.id);

    const QDate untilDate = request.until.isValid()
        ? request.until
        : QDateTime::currentDateTimeUtc().date();
    const QDateTime from = startOfDayUtc(request.from);
    const QDateTime until = endOfDayUtc(untilDate);
    const QDateTime epoch = startOfDayUtc(m_config.epoch);

    report.filters.from = from;
    report.filters.to = until;
    report.filters.companies = companies;

    qInfo(kardexService) << "KardexReportService: building report for" << companyIds
                         << "from" << from.toString(Qt::ISODate)
                         << "until" << until.toString(Qt::ISODate);

    QList<InvoiceItemRecord> items;
    const QDeadlineTimer deadline(m_config.fetchTimeoutMs);
    if (!m_invoiceRepo->fetchInvoiceItems(companyIds, epoch, until, deadline, items)) {
        if (deadline.hasExpired()) {
            qCritical(kardexService) << "KardexReportService: invoice fetch exceeded"
                                     << m_config.fetchTimeoutMs << "ms";
            throw KardexError::timeout("Tempo limite excedido ao consultar as notas fiscais.");
        }
        qCritical(kardexService) << "KardexReportService: invoice fetch failed";
        throw KardexError::dataAccess("Falha ao consultar as notas fiscais.");
    }

    QHash<QString, QString> partnerNames;
    if (!m_partnerRepo->fetchPartnerNames(companyIds, deadline, partnerNames)) {
        if (deadline.hasExpired()) {
            qCritical(kardexService) << "KardexReportService: partner fetch exceeded"
                                     << m_config.fetchTimeoutMs << "ms";
            throw KardexError::timeout("Tempo limite excedido ao consultar os parceiros.");
        }
        qCritical(kardexService) << "KardexReportService: partner fetch failed";
        throw KardexError::dataAccess("Falha ao consultar os parceiros.");
    }

    const EventExtractor extractor(m_config, companies, partnerNames);
    ExtractionResult extracted = extractor.extract(items);
    report.stats = extracted.stats;

    const LedgerProcessor processor(m_config.openingStockSacks, m_config.openingCostPerSack, epoch);
    const LedgerResult ledger = processor.process(extracted.events, extracted.sales);

    report.movements = PeriodWindower::window(ledger.movements, from, until);
    report.finishedSales = PeriodWindower::windowSales(extracted.sales, from, until);
    report.openingBalance = report.movements.isEmpty()
        ? processor.openingMovement()
        : report.movements.first();

    report.dailyTotals = KardexAggregator::dailyTotals(report.movements);
    report.productTotals = KardexAggregator::productTotals(report.finishedSales);

    report.grandTotals.movements = KardexAggregator::movementTotals(report.movements);
    report.grandTotals.balanceSacks = ledger.finalState.balanceQuantitySacks;
    report.grandTotals.balanceValue = ledger.finalState.balanceValue;
    report.grandTotals.movingAverageCost = ledger.finalState.movingAverageCost;
    report.grandTotals.finished = KardexAggregator::finishedTotals(report.productTotals);

    qInfo(kardexService) << "KardexReportService: report ready, movements" << report.movements.size()
                         << "finished sales" << report.finishedSales.size()
                         << "balance" << decimalToString(report.grandTotals.balanceSacks, 4);
    return report;
}

#ifndef EVENTEXTRACTOR_H
#define EVENTEXTRACTOR_H

#include <QHash>
#include <QList>
#include <QSet>
#include <QString>

#include "KardexConfig.h"
#include "KardexTypes.h"
#include "ProductAliasResolver.h"

/**
 * @brief Счетчики пропущенных и подозрительных строк НФ
 */
struct ExtractionStats {
    int itemsSeen = 0;
    int skippedExcludedCfop = 0;
    int skippedCancelled = 0;
    int skippedIntercompany = 0;
    int skippedBlockedCounterparty = 0;
    int skippedUnresolvedProduct = 0;
    int skippedIgnoredDirection = 0;
    int skippedZeroQuantity = 0;
    // приход сырья с отрицательным количеством увел бы остаток ниже нуля
    int skippedNegativeEntry = 0;
    int malformedNumbers = 0;
    int unrecognizedUnits = 0;
};

struct ExtractionResult {
    QList<StockEvent> events;
    // черновики, дополняются LedgerProcessor по StockEvent::saleIndex
    QList<FinishedSaleRecord> sales;
    ExtractionStats stats;
};

/**
 * @brief Извлечение складских событий из строк НФ
 *
 * Чистая функция от входного списка: не обращается к хранилищу.
 */
class EventExtractor
{
public:
    /**
     * @param partnerNames ключ "companyId:cnpj" -> наименование контрагента
     */
    EventExtractor(const KardexConfig &config,
                   const QList<ResolvedCompany> &companies,
                   const QHash<QString, QString> &partnerNames);

    ExtractionResult extract(const QList<InvoiceItemRecord> &items) const;

    QString counterpartyId(const InvoiceItemRecord &item) const;
    QString counterpartyName(const InvoiceItemRecord &item) const;

    /**
     * @brief Чистая цена за единицу НФ: (gross - discount) / qty, 0 при qty == 0
     */
    static Decimal unitNetPrice(const InvoiceItemRecord &item);

    static QString partnerKey(const QString &companyId, const QString &cnpjDigits);

private:
    enum class InvoiceVerdict {
        Keep,
        Intercompany,
        Blocked
    };

    InvoiceVerdict classifyInvoice(const InvoiceItemRecord &item) const;

    void appendRawMaterialEvent(const InvoiceItemRecord &item, ExtractionResult &result) const;
    void appendConsumptionEvent(const InvoiceItemRecord &item, ProductAlias alias, ExtractionResult &result) const;

    StockEvent baseEvent(const InvoiceItemRecord &item, StockEventKind kind) const;
    static QString documentFor(const InvoiceItemRecord &item);

    KardexConfig m_config;
    ProductAliasResolver m_aliasResolver;
    QHash<QString, QString> m_companyCnpjs;
    QSet<QString> m_groupCnpjs;
    QSet<QString> m_blockedCnpjs;
    QSet<QString> m_excludedCfops;
    QHash<QString, QString> m_partnerNames;
};

#endif // EVENTEXTRACTOR_H

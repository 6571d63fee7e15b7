#ifndef KARDEXTYPES_H
#define KARDEXTYPES_H

#include <QList>
#include <QString>
#include <QStringList>
#include <QDate>
#include <QDateTime>

#include <optional>

#include "DecimalUtils.h"

/**
 * @brief Известные товары Kardex: одно сырье и три готовых продукта
 */
enum class ProductAlias {
    RawMaterial,
    FinishedA,
    FinishedB,
    FinishedC
};

enum class InvoiceDirection {
    Inbound,
    Outbound
};

/**
 * @brief Строка НФ (NFe/CTe) в том виде, в каком ее отдает слой хранения
 */
struct InvoiceItemRecord {
    QString invoiceId;
    QString itemId;
    QString companyId;
    QDateTime issuedAt;
    InvoiceDirection direction = InvoiceDirection::Inbound;
    QString invoiceNumber;
    QString accessKey;
    QString issuerCnpj;
    QString recipientCnpj;
    QString natureOfOperation;
    QString cfop;
    QString mappedProductName;
    QString mappedProductDescription;
    QString description;
    QString productCode;
    QString unit;
    Decimal quantity = 0;
    Decimal unitPrice = 0;
    Decimal gross = 0;
    Decimal discount = 0;
    bool cancelled = false;
    // хотя бы одно числовое поле было нечисловым и прочитано как 0
    bool hadMalformedNumber = false;

    bool isValid() const { return !invoiceId.isEmpty() && !itemId.isEmpty(); }
};

struct Company {
    QString id;
    QString name;
    QString cnpj;

    bool isValid() const { return !id.isEmpty(); }
};

struct ResolvedCompany {
    QString id;
    QString name;
    QString cnpj;
    QString cnpjDigits;
    QString alias;
};

enum class StockEventKind {
    Entry,
    Exit,
    Consumption
};

/**
 * @brief Складское событие, извлеченное из строки НФ
 *
 * eventOrder разрешает совпадения сортировки: ENTRY=0, EXIT=1, CONSUMPTION=2.
 * saleIndex указывает на FinishedSaleRecord для CONSUMPTION, иначе -1.
 */
struct StockEvent {
    StockEventKind kind = StockEventKind::Entry;
    QDateTime timestamp;
    QString invoiceId;
    QString itemId;
    Decimal quantitySacks = 0;
    std::optional<Decimal> unitCost;
    std::optional<Decimal> netTotal;
    QString counterpartyName;
    QString counterpartyId;
    QString document;
    QString cfop;
    QString notes;
    int eventOrder = 0;
    int saleIndex = -1;

    static int orderFor(StockEventKind kind);
};

enum class MovementType {
    Opening,
    PriorBalance,
    Entry,
    Exit
};

/**
 * @brief Строка Kardex
 *
 * Количества со знаком: приход > 0, расход < 0.
 * Инварианты: balanceQuantityAfter >= 0; при нулевом остатке balanceValueAfter == 0.
 */
struct LedgerMovement {
    MovementType type = MovementType::Entry;
    QDateTime timestamp;
    QString document;
    QString counterparty;
    QString counterpartyId;
    QString cfop;
    QString invoiceId;
    QString itemId;
    Decimal appliedQuantitySacks = 0;
    Decimal requestedQuantitySacks = 0;
    Decimal unitCost = 0;
    Decimal movingAverageCostAfter = 0;
    Decimal balanceQuantityAfter = 0;
    Decimal balanceValueAfter = 0;
    bool blocked = false;
    bool costRestarted = false;
    QString notes;

    QString typeString() const;
    QString statusLabel() const;
};

/**
 * @brief Продажа готового продукта и списанное под нее сырье
 *
 * costPerSackAtConsumption и rawMaterialCostValue пусты, если сырье не списано.
 */
struct FinishedSaleRecord {
    QDateTime timestamp;
    QString invoiceId;
    QString itemId;
    ProductAlias productAlias = ProductAlias::FinishedA;
    QString document;
    QString counterparty;
    QString counterpartyId;
    QString cfop;
    QString natureOfOperation;
    Decimal unitsSold = 0;
    Decimal unitNetPrice = 0;
    Decimal valuePerSack = 0;
    Decimal nominalConsumptionSacks = 0;
    Decimal rawMaterialConsumedSacks = 0;
    std::optional<Decimal> costPerSackAtConsumption;
    std::optional<Decimal> rawMaterialCostValue;
};

struct DailyTotal {
    QDate date;
    Decimal entriesSacks = 0;
    Decimal exitsSacks = 0;
    Decimal balanceSacks = 0;
    Decimal movingAverageCost = 0;
};

struct ProductTotal {
    ProductAlias productAlias = ProductAlias::FinishedA;
    Decimal unitsSold = 0;
    Decimal rawMaterialConsumedSacks = 0;
    Decimal revenuePerSack = 0;
    Decimal rawMaterialCostValue = 0;
};

QString productAliasCode(ProductAlias alias);
bool productAliasFromCode(const QString &code, ProductAlias *alias);
bool isFinishedProduct(ProductAlias alias);
QList<ProductAlias> allProductAliases();

QString movementTypeString(MovementType type);

#endif // KARDEXTYPES_H

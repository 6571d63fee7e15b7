#ifndef KARDEXCONFIG_H
#define KARDEXCONFIG_H

#include <QDate>
#include <QList>
#include <QMap>
#include <QString>
#include <QStringList>

#include "DecimalUtils.h"
#include "KardexTypes.h"

class QSettings;

struct CompanyMatcher {
    QString alias;
    QStringList nameTokens;
};

/**
 * @brief Параметры отчета Kardex
 *
 * Передается в конструктор KardexReportService, глобального состояния нет.
 */
struct KardexConfig {
    QDate epoch = QDate(2025, 1, 1);
    Decimal openingStockSacks = 0;
    Decimal openingCostPerSack = 0;

    QMap<ProductAlias, QStringList> productNames;
    QStringList rawMaterialNeedles;
    QString rawMaterialQualifier;

    Decimal consumptionRatioSacksPerUnit = 0;
    Decimal finishedUnitsPerSack = 0;

    QStringList blockedCounterparties;
    QStringList excludedCfops;

    QStringList companyIds;
    QStringList companyCnpjs;
    QList<CompanyMatcher> companyMatchers;

    int fetchTimeoutMs = 30000;

    static KardexConfig defaults();

    /**
     * @brief Прочитать конфигурацию поверх значений по умолчанию
     *
     * Группы INI: [opening], [products], [consumption], [filters], [companies], [fetch].
     */
    static KardexConfig fromSettings(QSettings &settings);

    /**
     * @brief Нормализованные 14-значные CNPJ из blockedCounterparties
     */
    QStringList blockedCnpjDigits() const;
};

#endif // KARDEXCONFIG_H

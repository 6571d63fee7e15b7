#ifndef KARDEXEXPORT_H
#define KARDEXEXPORT_H

#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <QStringList>

#include "KardexReport.h"

/**
 * @brief Выгрузка готового отчета Kardex в JSON и CSV
 *
 * Только читает KardexReport, ничего не пересчитывает.
 * Количества выводятся с 4 знаками, деньги с 2.
 */
class KardexExport
{
public:
    static QJsonObject toJsonObject(const KardexReport &report);
    static QByteArray toJson(const KardexReport &report);

    /**
     * @brief CSV с разделителем ';' из двух блоков: Kardex сырья и продажи готовой продукции
     */
    static QByteArray toCsv(const KardexReport &report);

    static QString escapeCsvValue(const QString &value);
    static QString formatTimestamp(const QDateTime &timestamp);

private:
    static QStringList movementCsvRow(const LedgerMovement &movement);
    static QStringList saleCsvRow(const FinishedSaleRecord &sale);
};

#endif // KARDEXEXPORT_H

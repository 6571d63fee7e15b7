#ifndef PRODUCTALIASRESOLVER_H
#define PRODUCTALIASRESOLVER_H

#include <QHash>
#include <QString>
#include <QStringList>

#include <optional>

#include "KardexConfig.h"
#include "KardexTypes.h"

/**
 * @brief Сопоставление описания товара из НФ с известным товаром Kardex
 *
 * Никогда не угадывает: если ни таблица, ни эвристика сырья не сработали,
 * строка НФ в Kardex не попадает.
 */
class ProductAliasResolver
{
public:
    explicit ProductAliasResolver(const KardexConfig &config);

    /**
     * @brief Кандидаты по порядку: имя связанного товара, его описание, описание строки, код
     */
    std::optional<ProductAlias> resolve(const InvoiceItemRecord &item) const;

    std::optional<ProductAlias> resolveText(const QString &text) const;

private:
    std::optional<ProductAlias> resolveByHeuristics(const QString &key) const;

    QHash<QString, ProductAlias> m_lookup;
    QStringList m_needles;
    QString m_qualifier;
};

#endif // PRODUCTALIASRESOLVER_H

#include "ProductAliasResolver.h"
#include "TextUtils.h"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(aliasResolver, "kardex.alias")

ProductAliasResolver::ProductAliasResolver(const KardexConfig &config)
    : m_qualifier(normalizeKey(config.rawMaterialQualifier))
{
    for (auto it = config.productNames.cbegin(); it != config.productNames.cend(); ++it) {
        for (const QString &name : it.value()) {
            const QString key = normalizeKey(name);
            if (key.isEmpty()) continue;
            if (m_lookup.contains(key) && m_lookup.value(key) != it.key()) {
                qWarning(aliasResolver) << "ProductAliasResolver: name" << name
                                        << "listed for" << productAliasCode(m_lookup.value(key))
                                        << "and" << productAliasCode(it.key()) << "- last one wins";
            }
            m_lookup.insert(key, it.key());
        }
    }

    for (const QString &needle : config.rawMaterialNeedles) {
        const QString key = normalizeKey(needle);
        if (!key.isEmpty()) m_needles.append(key);
    }
}

std::optional<ProductAlias> ProductAliasResolver::resolve(const InvoiceItemRecord &item) const
{
    const QStringList candidates = {
        item.mappedProductName,
        item.mappedProductDescription,
        item.description,
        item.productCode
    };

    for (const QString &candidate : candidates) {
        if (candidate.trimmed().isEmpty()) continue;
        const std::optional<ProductAlias> alias = resolveText(candidate);
        if (alias) return alias;
    }
    return std::nullopt;
}

std::optional<ProductAlias> ProductAliasResolver::resolveText(const QString &text) const
{
    const QString key = normalizeKey(text);
    if (key.isEmpty()) return std::nullopt;

    const auto it = m_lookup.constFind(key);
    if (it != m_lookup.cend()) return it.value();

    return resolveByHeuristics(key);
}

std::optional<ProductAlias> ProductAliasResolver::resolveByHeuristics(const QString &key) const
{
    if (m_qualifier.isEmpty() || !key.contains(m_qualifier)) return std::nullopt;

    for (const QString &needle : m_needles) {
        if (key.contains(needle)) return ProductAlias::RawMaterial;
    }
    return std::nullopt;
}

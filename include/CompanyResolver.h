#ifndef COMPANYRESOLVER_H
#define COMPANYRESOLVER_H

#include <QList>

#include "KardexConfig.h"
#include "KardexTypes.h"

/**
 * @brief Набор юрлиц, консолидируемых в Kardex
 *
 * Приоритет: явные ID, затем явные CNPJ, затем сопоставление по токенам имени.
 * Частичная консолидация недопустима: без полного набора нельзя отличить
 * внутригрупповую передачу от продажи.
 */
class CompanyResolver
{
public:
    explicit CompanyResolver(const KardexConfig &config);

    /**
     * @brief Упорядоченный список участников
     * @throws KardexError (Configuration), если набор неполон или пуст
     */
    QList<ResolvedCompany> resolve(const QList<Company> &available) const;

    static bool matches(const Company &company, const CompanyMatcher &matcher);

private:
    QList<ResolvedCompany> resolveByIds(const QList<Company> &available) const;
    QList<ResolvedCompany> resolveByCnpjs(const QList<Company> &available) const;
    QList<ResolvedCompany> resolveByMatchers(const QList<Company> &available) const;

    ResolvedCompany toResolved(const Company &company, const QString &alias) const;
    QString aliasFor(const Company &company) const;

    QStringList m_ids;
    QStringList m_cnpjs;
    QList<CompanyMatcher> m_matchers;
};

#endif // COMPANYRESOLVER_H

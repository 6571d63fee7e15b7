#include "CompanyResolver.h"
#include "KardexError.h"
#include "TextUtils.h"

#include <QHash>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(companyResolver, "kardex.companies")

CompanyResolver::CompanyResolver(const KardexConfig &config)
    : m_matchers(config.companyMatchers)
{
    for (const QString &id : config.companyIds) {
        const QString t = id.trimmed();
        if (!t.isEmpty()) m_ids.append(t);
    }
    for (const QString &cnpj : config.companyCnpjs) {
        const QString digits = normalizeCnpj(cnpj);
        if (digits.size() == 14) {
            m_cnpjs.append(digits);
        } else {
            qWarning(companyResolver) << "CompanyResolver: ignoring malformed CNPJ" << cnpj;
        }
    }
}

bool CompanyResolver::matches(const Company &company, const CompanyMatcher &matcher)
{
    if (matcher.nameTokens.isEmpty()) return false;

    const QStringList companyTokens = normalizeTokens(company.name);
    for (const QString &token : matcher.nameTokens) {
        if (!companyTokens.contains(normalizeText(token))) return false;
    }
    return true;
}

QList<ResolvedCompany> CompanyResolver::resolve(const QList<Company> &available) const
{
    QList<ResolvedCompany> res;
    if (!m_ids.isEmpty()) {
        res = resolveByIds(available);
    } else if (!m_cnpjs.isEmpty()) {
        res = resolveByCnpjs(available);
    } else {
        res = resolveByMatchers(available);
    }

    QStringList names;
    for (const ResolvedCompany &c : res) names.append(c.name);
    qInfo(companyResolver) << "CompanyResolver: consolidating" << names;
    return res;
}

QList<ResolvedCompany> CompanyResolver::resolveByIds(const QList<Company> &available) const
{
    QHash<QString, Company> byId;
    for (const Company &c : available) byId.insert(c.id, c);

    QList<ResolvedCompany> res;
    QStringList missing;
    for (const QString &id : m_ids) {
        const auto it = byId.constFind(id);
        if (it == byId.cend()) {
            missing.append(id);
            continue;
        }
        res.append(toResolved(it.value(), aliasFor(it.value())));
    }

    if (res.isEmpty()) {
        throw KardexError::configuration("Nenhuma empresa corresponde aos IDs configurados.");
    }
    if (!missing.isEmpty()) {
        throw KardexError::configuration(
            QString("Empresas não encontradas para os IDs: %1").arg(missing.join(", ")));
    }
    return res;
}

QList<ResolvedCompany> CompanyResolver::resolveByCnpjs(const QList<Company> &available) const
{
    QHash<QString, Company> byCnpj;
    for (const Company &c : available) byCnpj.insert(normalizeCnpj(c.cnpj), c);

    QList<ResolvedCompany> res;
    QStringList missing;
    for (const QString &cnpj : m_cnpjs) {
        const auto it = byCnpj.constFind(cnpj);
        if (it == byCnpj.cend()) {
            missing.append(cnpj);
            continue;
        }
        res.append(toResolved(it.value(), aliasFor(it.value())));
    }

    if (res.isEmpty()) {
        throw KardexError::configuration("Nenhuma empresa corresponde aos CNPJs configurados.");
    }
    if (!missing.isEmpty()) {
        throw KardexError::configuration(
            QString("Empresas não encontradas para os CNPJs: %1").arg(missing.join(", ")));
    }
    return res;
}

QList<ResolvedCompany> CompanyResolver::resolveByMatchers(const QList<Company> &available) const
{
    if (m_matchers.isEmpty()) {
        throw KardexError::configuration("Nenhum critério de empresa configurado para o Kardex consolidado.");
    }

    QList<ResolvedCompany> res;
    QStringList missing;
    for (const CompanyMatcher &matcher : m_matchers) {
        bool found = false;
        for (const Company &c : available) {
            if (matches(c, matcher)) {
                res.append(toResolved(c, matcher.alias));
                found = true;
                break;
            }
        }
        if (!found) missing.append(matcher.alias);
    }

    if (res.isEmpty()) {
        throw KardexError::configuration("Nenhuma empresa alvo encontrada para o Kardex consolidado.");
    }
    if (!missing.isEmpty()) {
        throw KardexError::configuration(
            QString("Empresas alvo não encontradas: %1").arg(missing.join(", ")));
    }
    return res;
}

ResolvedCompany CompanyResolver::toResolved(const Company &company, const QString &alias) const
{
    ResolvedCompany r;
    r.id = company.id;
    r.name = company.name;
    r.cnpj = company.cnpj;
    r.cnpjDigits = normalizeCnpj(company.cnpj);
    r.alias = alias;
    return r;
}

QString CompanyResolver::aliasFor(const Company &company) const
{
    for (const CompanyMatcher &matcher : m_matchers) {
        if (matches(company, matcher)) return matcher.alias;
    }
    return QString();
}

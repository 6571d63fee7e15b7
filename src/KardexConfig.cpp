#include "KardexConfig.h"
#include "TextUtils.h"

#include <QSettings>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(kardexConfig, "kardex.config")

KardexConfig KardexConfig::defaults()
{
    KardexConfig c;
    c.epoch = QDate(2025, 1, 1);
    c.openingStockSacks = 0;
    c.openingCostPerSack = 0;

    c.productNames[ProductAlias::RawMaterial] = {
        "CAFE CONILON BENEFICIADO",
        "CAFE CONILLON BENEFICIADO",
        "CAFE CANILON BENEFICIADO",
        "CAFE CONILON BENEFICIADO TIPO 7",
        "CAFE CONILON"
    };
    c.productNames[ProductAlias::FinishedA] = {
        "CAFE RANCHO 10X500G",
        "CAFE TORRADO E MOIDO RANCHO 10X500G",
        "RANCHO 10X500"
    };
    c.productNames[ProductAlias::FinishedB] = {
        "CAFE RANCHO 20X250G",
        "CAFE TORRADO E MOIDO RANCHO 20X250G",
        "RANCHO 20X250"
    };
    c.productNames[ProductAlias::FinishedC] = {
        "CAFE NOVA ERA 10X500G",
        "CAFE TORRADO E MOIDO NOVA ERA 10X500G",
        "NOVA ERA 10X500"
    };
    c.rawMaterialNeedles = { "CAFECONILON", "CAFECONILLON", "CAFECANILON" };
    c.rawMaterialQualifier = "BENEFICIAD";

    // фардо 5 кг обжаренного, из мешка сырья выходит 48 кг -> 5/48 мешка на фардо
    c.consumptionRatioSacksPerUnit = roundDecimal(Decimal(5) / Decimal(48));
    c.finishedUnitsPerSack = Decimal("9.6");

    c.excludedCfops = { "5905", "5906" };

    c.companyMatchers = {
        { "JM", { "JM" } },
        { "OLG", { "OLG" } }
    };

    c.fetchTimeoutMs = 30000;
    return c;
}

static Decimal readDecimal(QSettings &settings, const QString &key, const Decimal &fallback)
{
    if (!settings.contains(key)) return fallback;

    bool ok = true;
    const Decimal value = decimalFromVariant(settings.value(key), &ok);
    if (!ok) {
        qWarning(kardexConfig) << "KardexConfig: non-numeric value for" << key
                               << "-" << settings.value(key).toString() << "read as 0";
    }
    return value;
}

static QStringList readList(QSettings &settings, const QString &key, const QStringList &fallback)
{
    if (!settings.contains(key)) return fallback;

    QStringList res;
    const QStringList raw = settings.value(key).toStringList();
    for (const QString &v : raw) {
        const QString t = v.trimmed();
        if (!t.isEmpty()) res.append(t);
    }
    return res;
}

KardexConfig KardexConfig::fromSettings(QSettings &settings)
{
    KardexConfig c = defaults();

    settings.beginGroup("opening");
    if (settings.contains("date")) {
        const QDate d = QDate::fromString(settings.value("date").toString(), Qt::ISODate);
        if (d.isValid()) {
            c.epoch = d;
        } else {
            qWarning(kardexConfig) << "KardexConfig: invalid opening date" << settings.value("date").toString();
        }
    }
    c.openingStockSacks = readDecimal(settings, "stockSacks", c.openingStockSacks);
    c.openingCostPerSack = readDecimal(settings, "costPerSack", c.openingCostPerSack);
    settings.endGroup();

    settings.beginGroup("products");
    for (ProductAlias alias : allProductAliases()) {
        const QString code = productAliasCode(alias);
        c.productNames[alias] = readList(settings, code, c.productNames.value(alias));
    }
    c.rawMaterialNeedles = readList(settings, "rawMaterialNeedles", c.rawMaterialNeedles);
    c.rawMaterialQualifier = settings.value("rawMaterialQualifier", c.rawMaterialQualifier).toString();
    settings.endGroup();

    settings.beginGroup("consumption");
    c.consumptionRatioSacksPerUnit = readDecimal(settings, "ratioSacksPerUnit", c.consumptionRatioSacksPerUnit);
    c.finishedUnitsPerSack = readDecimal(settings, "finishedUnitsPerSack", c.finishedUnitsPerSack);
    settings.endGroup();

    settings.beginGroup("filters");
    c.blockedCounterparties = readList(settings, "blockedCounterparties", c.blockedCounterparties);
    c.excludedCfops = readList(settings, "excludedCfops", c.excludedCfops);
    settings.endGroup();

    settings.beginGroup("companies");
    c.companyIds = readList(settings, "ids", c.companyIds);
    c.companyCnpjs = readList(settings, "cnpjs", c.companyCnpjs);
    const int matcherCount = settings.beginReadArray("matchers");
    if (matcherCount > 0) {
        c.companyMatchers.clear();
        for (int i = 0; i < matcherCount; ++i) {
            settings.setArrayIndex(i);
            CompanyMatcher m;
            m.alias = settings.value("alias").toString().trimmed();
            m.nameTokens = readList(settings, "tokens", QStringList());
            if (m.alias.isEmpty() || m.nameTokens.isEmpty()) {
                qWarning(kardexConfig) << "KardexConfig: skipping incomplete company matcher" << i;
                continue;
            }
            c.companyMatchers.append(m);
        }
    }
    settings.endArray();
    settings.endGroup();

    settings.beginGroup("fetch");
    bool ok = false;
    const int timeout = settings.value("timeoutMs", c.fetchTimeoutMs).toInt(&ok);
    if (ok && timeout > 0) {
        c.fetchTimeoutMs = timeout;
    }
    settings.endGroup();

    qInfo(kardexConfig) << "KardexConfig: loaded from" << settings.fileName()
                        << "epoch" << c.epoch.toString(Qt::ISODate)
                        << "matchers" << c.companyMatchers.size();
    return c;
}

QStringList KardexConfig::blockedCnpjDigits() const
{
    QStringList res;
    for (const QString &v : blockedCounterparties) {
        const QString digits = normalizeCnpj(v);
        if (digits.size() == 14 && !res.contains(digits)) {
            res.append(digits);
        }
    }
    return res;
}

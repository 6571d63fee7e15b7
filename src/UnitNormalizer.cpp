#include "UnitNormalizer.h"
#include "TextUtils.h"

UnitNormalizer::UnitKind UnitNormalizer::classify(const QString &unit)
{
    const QString v = normalizeText(unit);
    if (v == "KG" || v == "KILOGRAMA" || v == "KILOGRAMAS") return UnitKind::Kilogram;
    if (v == "SC" || v == "SACA" || v == "SACAS" || v == "SC60KG" || v == "SACAS DE 60KG") return UnitKind::Sack;
    if (v == "TON" || v == "TONELADA" || v == "TONELADAS") return UnitKind::Ton;
    return UnitKind::Unknown;
}

Decimal UnitNormalizer::toSacks(const Decimal &quantity, const QString &unit, bool *recognized)
{
    const UnitKind kind = classify(unit);
    if (recognized) *recognized = kind != UnitKind::Unknown;

    switch (kind) {
        case UnitKind::Kilogram: return Decimal(quantity / kilogramsPerSack());
        case UnitKind::Sack:     return quantity;
        case UnitKind::Ton:      return Decimal(quantity * 1000 / kilogramsPerSack());
        case UnitKind::Unknown:  return quantity;
    }
    return quantity;
}

#include "KardexTypes.h"

int StockEvent::orderFor(StockEventKind kind)
{
    switch (kind) {
        case StockEventKind::Entry:       return 0;
        case StockEventKind::Exit:        return 1;
        case StockEventKind::Consumption: return 2;
    }
    return 0;
}

QString LedgerMovement::typeString() const
{
    return movementTypeString(type);
}

QString LedgerMovement::statusLabel() const
{
    return blocked ? "Bloqueada (saldo zero)" : "Normal";
}

QString movementTypeString(MovementType type)
{
    switch (type) {
        case MovementType::Opening:      return "SALDO_INICIAL";
        case MovementType::PriorBalance: return "SALDO_ANTERIOR";
        case MovementType::Entry:        return "ENTRADA";
        case MovementType::Exit:         return "SAIDA";
    }
    return "ENTRADA";
}

QString productAliasCode(ProductAlias alias)
{
    switch (alias) {
        case ProductAlias::RawMaterial: return "MP_CONILON";
        case ProductAlias::FinishedA:   return "ACABADO_RANCHO_10X500";
        case ProductAlias::FinishedB:   return "ACABADO_RANCHO_20X250";
        case ProductAlias::FinishedC:   return "ACABADO_NOVAERA_10X500";
    }
    return "MP_CONILON";
}

bool productAliasFromCode(const QString &code, ProductAlias *alias)
{
    const QString v = code.trimmed().toUpper();
    for (ProductAlias candidate : allProductAliases()) {
        if (productAliasCode(candidate) == v) {
            if (alias) *alias = candidate;
            return true;
        }
    }
    return false;
}

bool isFinishedProduct(ProductAlias alias)
{
    return alias != ProductAlias::RawMaterial;
}

QList<ProductAlias> allProductAliases()
{
    return {
        ProductAlias::RawMaterial,
        ProductAlias::FinishedA,
        ProductAlias::FinishedB,
        ProductAlias::FinishedC
    };
}

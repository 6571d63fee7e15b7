#ifndef UNITNORMALIZER_H
#define UNITNORMALIZER_H

#include <QString>

#include "DecimalUtils.h"

/**
 * @brief Перевод количества в мешки (SC, 60 кг)
 */
class UnitNormalizer
{
public:
    enum class UnitKind {
        Kilogram,
        Sack,
        Ton,
        Unknown
    };

    static UnitKind classify(const QString &unit);

    /**
     * @brief Количество в мешках
     *
     * Нераспознанная единица считается уже мешками (совместимость с историческими
     * отчетами); @p recognized сообщает об этом вызывающему.
     */
    static Decimal toSacks(const Decimal &quantity, const QString &unit, bool *recognized = nullptr);

    static Decimal kilogramsPerSack() { return Decimal(60); }
};

#endif // UNITNORMALIZER_H

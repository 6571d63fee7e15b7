#ifndef DECIMALUTILS_H
#define DECIMALUTILS_H

#include <QRegularExpression>
#include <QString>
#include <QVariant>

#include <boost/multiprecision/cpp_dec_float.hpp>

#include <exception>
#include <iomanip>
#include <sstream>

using Decimal = boost::multiprecision::cpp_dec_float_50;

/**
 * @brief Количество знаков, до которого округляется каждое промежуточное значение Kardex
 */
constexpr int kLedgerPrecision = 6;

/**
 * @brief Разобрать десятичное число из текста
 *
 * Пустая или нечисловая строка дает ноль (так исторически читаются данные НФ).
 * @param ok false, если строка не была числом
 */
inline Decimal decimalFromString(const QString &input, bool *ok = nullptr)
{
    if (ok) *ok = true;

    QString normalized = input.trimmed();
    if (normalized.isEmpty()) {
        return Decimal(0);
    }
    normalized.replace(',', '.');

    // cpp_dec_float сам по себе принимает "nan" и "inf"
    static const QRegularExpression literal(QStringLiteral("^[+-]?(\\d+\\.?\\d*|\\.\\d+)([eE][+-]?\\d+)?$"));
    if (!literal.match(normalized).hasMatch()) {
        if (ok) *ok = false;
        return Decimal(0);
    }
    try {
        return Decimal(normalized.toStdString());
    } catch (const std::exception&) {
        if (ok) *ok = false;
        return Decimal(0);
    }
}

inline Decimal decimalFromVariant(const QVariant &value, bool *ok = nullptr)
{
    if (value.isNull()) {
        if (ok) *ok = true;
        return Decimal(0);
    }
    return decimalFromString(value.toString(), ok);
}

inline QString decimalToString(const Decimal &value, int decimals = 2)
{
    std::ostringstream stream;
    stream << std::fixed << std::setprecision(decimals) << value;
    QString text = QString::fromStdString(stream.str());
    // "-0.00" -> "0.00"
    if (text.startsWith('-') && text.mid(1).remove('0').remove('.').isEmpty()) {
        text.remove(0, 1);
    }
    return text;
}

/**
 * @brief Округление (half away from zero) до фиксированного числа знаков
 */
inline Decimal roundDecimal(const Decimal &value, int decimals = kLedgerPrecision)
{
    const Decimal scale = boost::multiprecision::pow(Decimal(10), decimals);
    return Decimal(boost::multiprecision::round(value * scale) / scale);
}

inline bool decimalIsZero(const Decimal &value)
{
    return value == 0;
}

#endif // DECIMALUTILS_H

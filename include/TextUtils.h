#ifndef TEXTUTILS_H
#define TEXTUTILS_H

#include <QString>
#include <QStringList>
#include <QChar>

/**
 * @brief Убрать диакритику, схлопнуть пробелы, привести к верхнему регистру
 */
inline QString normalizeText(const QString &value)
{
    if (value.isEmpty()) return QString();

    const QString decomposed = value.normalized(QString::NormalizationForm_D);
    QString stripped;
    stripped.reserve(decomposed.size());
    for (const QChar ch : decomposed) {
        if (ch.category() == QChar::Mark_NonSpacing) continue;
        stripped.append(ch);
    }
    return stripped.simplified().toUpper();
}

/**
 * @brief Ключ поиска: нормализованный текст, только [A-Z0-9]
 */
inline QString normalizeKey(const QString &value)
{
    const QString text = normalizeText(value);
    QString key;
    key.reserve(text.size());
    for (const QChar ch : text) {
        const char16_t c = ch.unicode();
        if ((c >= u'A' && c <= u'Z') || (c >= u'0' && c <= u'9')) {
            key.append(ch);
        }
    }
    return key;
}

inline QStringList normalizeTokens(const QString &value)
{
    return normalizeText(value).split(' ', Qt::SkipEmptyParts);
}

/**
 * @brief Только цифры CNPJ/CPF
 */
inline QString normalizeCnpj(const QString &value)
{
    QString digits;
    digits.reserve(value.size());
    for (const QChar ch : value) {
        if (ch.isDigit()) digits.append(ch);
    }
    return digits;
}

#endif // TEXTUTILS_H

#ifndef KARDEXERROR_H
#define KARDEXERROR_H

#include <QString>

#include <stdexcept>

/**
 * @brief Ошибка построения отчета Kardex
 *
 * Configuration соответствует 4xx: набор компаний неполон или неоднозначен,
 * отчет не строится вовсе.
 */
class KardexError : public std::runtime_error
{
public:
    enum class Code {
        Configuration,
        DataAccess,
        Timeout
    };

    KardexError(Code code, const QString &message)
        : std::runtime_error(message.toStdString())
        , m_code(code)
    {
    }

    static KardexError configuration(const QString &message)
    {
        return KardexError(Code::Configuration, message);
    }

    static KardexError dataAccess(const QString &message)
    {
        return KardexError(Code::DataAccess, message);
    }

    static KardexError timeout(const QString &message)
    {
        return KardexError(Code::Timeout, message);
    }

    Code code() const { return m_code; }

    int httpStatus() const
    {
        switch (m_code) {
            case Code::Configuration: return 400;
            case Code::DataAccess:    return 500;
            case Code::Timeout:       return 504;
        }
        return 500;
    }

    QString message() const { return QString::fromStdString(what()); }

private:
    Code m_code;
};

#endif // KARDEXERROR_H

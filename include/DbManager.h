#ifndef DBMANAGER_H
#define DBMANAGER_H

#include <QObject>
#include <QSqlDatabase>
#include <QString>

/**
 * @brief Единственное подключение к SQLite с НФ
 */
class DbManager : public QObject
{
    Q_OBJECT

public:
    static DbManager& instance();

    /**
     * @brief Открыть базу; пустой путь означает файл по умолчанию в AppDataLocation
     */
    bool initialize(const QString& path = QString());
    bool isOpen() const;

    QSqlDatabase database() const;
    QString databasePath() const;

    void close();

    static QString defaultDatabasePath();

private:
    explicit DbManager();
    ~DbManager() override = default;

    DbManager(const DbManager&) = delete;
    DbManager& operator=(const DbManager&) = delete;

private:
    QSqlDatabase m_db;
    QString m_databasePath;

private:
    bool enableForeignKeys();
};

#endif // DBMANAGER_H

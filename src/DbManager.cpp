#include "DbManager.h"

#include <QStandardPaths>
#include <QDir>
#include <QSqlQuery>
#include <QSqlError>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(dbManager, "db")

DbManager& DbManager::instance()
{
    static DbManager instance;
    return instance;
}

DbManager::DbManager()
{
}

QString DbManager::defaultDatabasePath()
{
    const QString dataPath = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    QDir dir;
    if (!dir.exists(dataPath)) {
        dir.mkpath(dataPath);
    }
    return dataPath + "/kardex.db";
}

bool DbManager::initialize(const QString& path)
{
    m_databasePath = path.isEmpty() ? defaultDatabasePath() : path;

    const QString connName = "KardexConnection";
    if (QSqlDatabase::contains(connName)) {
        m_db = QSqlDatabase::database(connName, false);
    } else {
        m_db = QSqlDatabase::addDatabase("QSQLITE", connName);
    }

    if (m_db.isOpen()) {
        m_db.close();
    }
    m_db.setDatabaseName(m_databasePath);

    if (!m_db.open()) {
        qCritical(dbManager) << "DbManager: Cannot open database:" << m_db.lastError().text();
        qCritical(dbManager) << "DbManager: Database path:" << m_databasePath;
        return false;
    }

    qInfo(dbManager) << "DbManager: Database opened successfully at" << m_databasePath;

    if (!enableForeignKeys()) {
        qCritical(dbManager) << "DbManager: Cannot enable foreign keys";
        return false;
    }

    return true;
}

bool DbManager::isOpen() const
{
    return m_db.isOpen();
}

QSqlDatabase DbManager::database() const
{
    return m_db;
}

QString DbManager::databasePath() const
{
    return m_databasePath;
}

void DbManager::close()
{
    if (m_db.isOpen()) {
        m_db.close();
        qInfo(dbManager) << "DbManager: Database connection closed";
    }
}

bool DbManager::enableForeignKeys()
{
    QSqlQuery query(m_db);
    if (!query.exec("PRAGMA foreign_keys = ON")) {
        qCritical(dbManager) << "DbManager: Cannot enable foreign keys:" << query.lastError().text();
        return false;
    }

    if (query.exec("PRAGMA foreign_keys")) {
        if (query.next() && query.value(0).toInt() == 1) {
            qInfo(dbManager) << "DbManager: Foreign keys enabled";
            return true;
        }
    }

    qWarning(dbManager) << "DbManager: Foreign keys check failed";
    return false;
}

#ifndef MIGRATIONRUNNER_H
#define MIGRATIONRUNNER_H

#include <QObject>
#include <QSqlDatabase>
#include <QString>

/**
 * @brief Создание схемы НФ, по которой строится Kardex
 *
 * Идентификаторы текстовые, денежные и количественные поля хранятся как TEXT,
 * чтобы не терять точность при чтении в Decimal.
 */
class MigrationRunner : public QObject
{
    Q_OBJECT

public:
    explicit MigrationRunner(QSqlDatabase db, QObject *parent = nullptr);

    bool runMigrations();

    bool tableExists(const QString &tableName);

private:
    QSqlDatabase m_db;

    bool createAllTables();

    bool createCompaniesTable();
    bool createPartnersTable();
    bool createProductsTable();
    bool createInvoicesTable();
    bool createInvoiceItemsTable();
    bool createInvoiceItemMappingsTable();
    bool createInvoiceCancellationsTable();

    bool createIndexes();

    bool executeQuery(const QString &sql, const QString &errorContext = "");
};

#endif // MIGRATIONRUNNER_H

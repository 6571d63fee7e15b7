#include "MigrationRunner.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QStringList>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(migration, "migration")

MigrationRunner::MigrationRunner(QSqlDatabase db, QObject *parent)
    : QObject(parent)
    , m_db(db)
{
}

bool MigrationRunner::runMigrations()
{
    if (!m_db.isOpen()) {
        qCritical(migration) << "MigrationRunner: Database is not open";
        return false;
    }

    const QStringList requiredTables = {
        "companies",
        "partners",
        "products",
        "invoices",
        "invoice_items",
        "invoice_item_mappings",
        "invoice_cancellations"
    };

    bool needsMigration = false;
    for (const QString &tableName : requiredTables) {
        if (!tableExists(tableName)) {
            needsMigration = true;
            qInfo(migration) << "MigrationRunner: Table" << tableName << "does not exist, migration needed";
            break;
        }
    }

    if (!needsMigration) {
        qInfo(migration) << "MigrationRunner: Schema is up to date";
        return true;
    }

    if (!m_db.transaction()) {
        qCritical(migration) << "MigrationRunner: Cannot start transaction:" << m_db.lastError().text();
        return false;
    }

    qInfo(migration) << "MigrationRunner: Starting migrations...";

    if (!createAllTables()) {
        qCritical(migration) << "MigrationRunner: Failed to create tables";
        m_db.rollback();
        return false;
    }

    if (!createIndexes()) {
        qCritical(migration) << "MigrationRunner: Failed to create indexes";
        m_db.rollback();
        return false;
    }

    if (!m_db.commit()) {
        qCritical(migration) << "MigrationRunner: Cannot commit transaction:" << m_db.lastError().text();
        m_db.rollback();
        return false;
    }

    qInfo(migration) << "MigrationRunner: Migrations completed successfully";
    return true;
}

bool MigrationRunner::tableExists(const QString &tableName)
{
    QSqlQuery query(m_db);
    query.prepare("SELECT name FROM sqlite_master WHERE type='table' AND name=?");
    query.addBindValue(tableName);

    if (!query.exec()) {
        qWarning(migration) << "MigrationRunner: Cannot check table existence:" << query.lastError().text();
        return false;
    }

    return query.next();
}

bool MigrationRunner::createAllTables()
{
    return createCompaniesTable() &&
           createPartnersTable() &&
           createProductsTable() &&
           createInvoicesTable() &&
           createInvoiceItemsTable() &&
           createInvoiceItemMappingsTable() &&
           createInvoiceCancellationsTable();
}

bool MigrationRunner::createCompaniesTable()
{
    QString sql = R"(
        CREATE TABLE IF NOT EXISTS companies (
            id TEXT PRIMARY KEY,
            name TEXT NOT NULL,
            cnpj TEXT UNIQUE,
            created_at TEXT NOT NULL DEFAULT (datetime('now'))
        )
    )";

    return executeQuery(sql, "createCompaniesTable");
}

bool MigrationRunner::createPartnersTable()
{
    QString sql = R"(
        CREATE TABLE IF NOT EXISTS partners (
            id TEXT PRIMARY KEY,
            company_id TEXT NOT NULL,
            cnpj_cpf TEXT NOT NULL,
            name TEXT NOT NULL,
            FOREIGN KEY (company_id) REFERENCES companies(id) ON DELETE CASCADE
        )
    )";

    return executeQuery(sql, "createPartnersTable");
}

bool MigrationRunner::createProductsTable()
{
    QString sql = R"(
        CREATE TABLE IF NOT EXISTS products (
            id TEXT PRIMARY KEY,
            company_id TEXT NOT NULL,
            name TEXT NOT NULL,
            description TEXT,
            unit TEXT,
            FOREIGN KEY (company_id) REFERENCES companies(id) ON DELETE CASCADE
        )
    )";

    return executeQuery(sql, "createProductsTable");
}

bool MigrationRunner::createInvoicesTable()
{
    QString sql = R"(
        CREATE TABLE IF NOT EXISTS invoices (
            id TEXT PRIMARY KEY,
            company_id TEXT NOT NULL,
            chave TEXT NOT NULL UNIQUE,
            numero TEXT,
            emissao TEXT NOT NULL,
            type TEXT NOT NULL CHECK(type IN ('IN', 'OUT')),
            issuer_cnpj TEXT,
            recipient_cnpj TEXT,
            nat_op TEXT,
            total_nfe TEXT,
            FOREIGN KEY (company_id) REFERENCES companies(id) ON DELETE CASCADE
        )
    )";

    return executeQuery(sql, "createInvoicesTable");
}

bool MigrationRunner::createInvoiceItemsTable()
{
    QString sql = R"(
        CREATE TABLE IF NOT EXISTS invoice_items (
            id TEXT PRIMARY KEY,
            invoice_id TEXT NOT NULL,
            cfop_code TEXT,
            description TEXT,
            product_code TEXT,
            unit TEXT,
            qty TEXT NOT NULL DEFAULT '0',
            unit_price TEXT NOT NULL DEFAULT '0',
            gross TEXT NOT NULL DEFAULT '0',
            discount TEXT NOT NULL DEFAULT '0',
            FOREIGN KEY (invoice_id) REFERENCES invoices(id) ON DELETE CASCADE
        )
    )";

    return executeQuery(sql, "createInvoiceItemsTable");
}

bool MigrationRunner::createInvoiceItemMappingsTable()
{
    QString sql = R"(
        CREATE TABLE IF NOT EXISTS invoice_item_mappings (
            invoice_item_id TEXT PRIMARY KEY,
            product_id TEXT NOT NULL,
            FOREIGN KEY (invoice_item_id) REFERENCES invoice_items(id) ON DELETE CASCADE,
            FOREIGN KEY (product_id) REFERENCES products(id)
        )
    )";

    return executeQuery(sql, "createInvoiceItemMappingsTable");
}

bool MigrationRunner::createInvoiceCancellationsTable()
{
    QString sql = R"(
        CREATE TABLE IF NOT EXISTS invoice_cancellations (
            id TEXT PRIMARY KEY,
            company_id TEXT NOT NULL,
            chave TEXT NOT NULL,
            event_timestamp TEXT,
            UNIQUE(company_id, chave),
            FOREIGN KEY (company_id) REFERENCES companies(id) ON DELETE CASCADE
        )
    )";

    return executeQuery(sql, "createInvoiceCancellationsTable");
}

bool MigrationRunner::createIndexes()
{
    bool success = true;

    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_partners_company ON partners(company_id)",
        "createIndexes: partners_company"
    );
    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_invoices_company_emissao ON invoices(company_id, emissao)",
        "createIndexes: invoices_company_emissao"
    );
    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_invoice_items_invoice ON invoice_items(invoice_id)",
        "createIndexes: invoice_items_invoice"
    );
    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_invoice_item_mappings_product ON invoice_item_mappings(product_id)",
        "createIndexes: invoice_item_mappings_product"
    );

    return success;
}

bool MigrationRunner::executeQuery(const QString &sql, const QString &errorContext)
{
    QSqlQuery query(m_db);
    if (!query.exec(sql)) {
        qCritical(migration) << "MigrationRunner: SQL error in" << errorContext << ":" << query.lastError().text();
        qCritical(migration) << "MigrationRunner: SQL:" << sql;
        return false;
    }
    return true;
}

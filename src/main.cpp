#include "MainWindow.h"
#include "DbManager.h"
#include "MigrationRunner.h"
#include "KardexConfig.h"
#include "KardexReportService.h"

#include "repositories/CompanyRepository.h"
#include "repositories/PartnerRepository.h"
#include "repositories/InvoiceRepository.h"

#include <QApplication>
#include <QMessageBox>
#include <QStyleFactory>
#include <QStandardPaths>
#include <QSettings>
#include <QFile>

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);
    app.setApplicationName("kardex");
    app.setStyle(QStyleFactory::create("Fusion"));

    DbManager& dbManager = DbManager::instance();
    if (!dbManager.initialize()) {
        QMessageBox::critical(nullptr, "Erro",
            "Não foi possível abrir o banco de dados.\n"
            "O aplicativo será encerrado.");
        return 1;
    }

    MigrationRunner migrationRunner(dbManager.database());
    if (!migrationRunner.runMigrations()) {
        QMessageBox::critical(nullptr, "Erro",
            "Não foi possível criar o esquema do banco de dados.\n"
            "O aplicativo será encerrado.");
        dbManager.close();
        return 1;
    }

    KardexConfig config = KardexConfig::defaults();
    const QString configPath =
        QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation) + "/kardex.ini";
    if (QFile::exists(configPath)) {
        QSettings settings(configPath, QSettings::IniFormat);
        config = KardexConfig::fromSettings(settings);
    }

    CompanyRepository companyRepo(dbManager.database());
    PartnerRepository partnerRepo(dbManager.database());
    InvoiceRepository invoiceRepo(dbManager.database());

    KardexReportService kardexService(config, &companyRepo, &partnerRepo, &invoiceRepo);

    MainWindow window(&kardexService);
    window.show();

    const int rc = app.exec();
    dbManager.close();
    return rc;
}

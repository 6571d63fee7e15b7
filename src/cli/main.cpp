#include "DbManager.h"
#include "KardexConfig.h"
#include "KardexError.h"
#include "KardexExport.h"
#include "KardexReportService.h"
#include "MigrationRunner.h"

#include "repositories/CompanyRepository.h"
#include "repositories/PartnerRepository.h"
#include "repositories/InvoiceRepository.h"

#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFile>
#include <QFileInfo>
#include <QSettings>
#include <QTextStream>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(kardexCli, "cli.kardex")

static QDate parseDateOption(const QCommandLineParser &parser, const QString &name, bool &ok)
{
    ok = true;
    if (!parser.isSet(name)) return QDate();
    const QDate d = QDate::fromString(parser.value(name), Qt::ISODate);
    if (!d.isValid()) ok = false;
    return d;
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("kardex_export");

    QCommandLineParser parser;
    parser.setApplicationDescription("Exporta o Kardex consolidado da matéria-prima em JSON ou CSV.");
    parser.addHelpOption();

    const QCommandLineOption dbOption("db", "Arquivo SQLite com as notas fiscais.", "path");
    const QCommandLineOption configOption("config", "Arquivo INI de configuração.", "path");
    const QCommandLineOption fromOption("from", "Data inicial (YYYY-MM-DD).", "date");
    const QCommandLineOption toOption("to", "Data final (YYYY-MM-DD), padrão hoje.", "date");
    const QCommandLineOption formatOption("format", "json ou csv.", "format", "json");
    const QCommandLineOption outputOption("output", "Arquivo de saída, padrão stdout.", "path");
    parser.addOptions({ dbOption, configOption, fromOption, toOption, formatOption, outputOption });

    parser.process(app);

    QTextStream err(stderr);

    const QString format = parser.value(formatOption).toLower();
    if (format != "json" && format != "csv") {
        err << "Formato inválido: " << format << "\n";
        return 2;
    }

    bool fromOk = true;
    bool toOk = true;
    KardexReportRequest request;
    request.from = parseDateOption(parser, "from", fromOk);
    request.until = parseDateOption(parser, "to", toOk);
    if (!fromOk || !toOk) {
        err << "Data inválida, use YYYY-MM-DD\n";
        return 2;
    }

    KardexConfig config = KardexConfig::defaults();
    if (parser.isSet(configOption)) {
        const QString configPath = parser.value(configOption);
        if (!QFileInfo::exists(configPath)) {
            err << "Arquivo de configuração não encontrado: " << configPath << "\n";
            return 2;
        }
        QSettings settings(configPath, QSettings::IniFormat);
        config = KardexConfig::fromSettings(settings);
    }

    DbManager& dbManager = DbManager::instance();
    if (!dbManager.initialize(parser.value(dbOption))) {
        err << "Não foi possível abrir o banco de dados\n";
        return 1;
    }

    MigrationRunner migrationRunner(dbManager.database());
    if (!migrationRunner.runMigrations()) {
        err << "Não foi possível criar o esquema do banco de dados\n";
        dbManager.close();
        return 1;
    }

    CompanyRepository companyRepo(dbManager.database());
    PartnerRepository partnerRepo(dbManager.database());
    InvoiceRepository invoiceRepo(dbManager.database());
    KardexReportService service(config, &companyRepo, &partnerRepo, &invoiceRepo);

    KardexReport report;
    try {
        report = service.buildReport(request);
    } catch (const KardexError &e) {
        qCritical(kardexCli) << "kardex_export: status" << e.httpStatus() << "-" << e.message();
        err << e.message() << "\n";
        dbManager.close();
        return e.code() == KardexError::Code::Configuration ? 2 : 1;
    }
    dbManager.close();

    const QByteArray payload = format == "csv" ? KardexExport::toCsv(report) : KardexExport::toJson(report);

    if (!parser.isSet(outputOption)) {
        QFile out;
        if (!out.open(stdout, QIODevice::WriteOnly)) {
            err << "Não foi possível escrever na saída padrão\n";
            return 1;
        }
        out.write(payload);
        return 0;
    }

    QFile out(parser.value(outputOption));
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        err << "Não foi possível gravar " << out.fileName() << ": " << out.errorString() << "\n";
        return 1;
    }
    out.write(payload);
    qInfo(kardexCli) << "kardex_export: wrote" << payload.size() << "bytes to" << out.fileName();
    return 0;
}

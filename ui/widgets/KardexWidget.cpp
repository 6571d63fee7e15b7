#include "KardexWidget.h"
#include "KardexReportService.h"
#include "KardexExport.h"
#include "KardexError.h"
#include "DecimalUtils.h"

#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QSplitter>
#include <QFileDialog>
#include <QFile>
#include <QMessageBox>
#include <QColor>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(kardexUi, "ui.kardex")

static QString displayTimestamp(const QDateTime &timestamp)
{
    if (!timestamp.isValid()) return QString();
    return timestamp.toUTC().toString("dd.MM.yyyy HH:mm");
}

// ---------------------
// Movements model
// ---------------------

KardexMovementsModel::KardexMovementsModel(QObject *parent)
    : QAbstractTableModel(parent)
{
}

int KardexMovementsModel::rowCount(const QModelIndex &parent) const
{
    Q_UNUSED(parent)
    return m_data.size();
}

int KardexMovementsModel::columnCount(const QModelIndex &parent) const
{
    Q_UNUSED(parent)
    return 11; // Data | Doc | Parceiro | CFOP | Tipo | Status | Qtd | Custo | Médio | Saldo | Obs
}

QVariant KardexMovementsModel::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() >= m_data.size())
        return {};

    const LedgerMovement &m = m_data[index.row()];

    if (role == Qt::DisplayRole) {
        switch (index.column()) {
            case 0: return displayTimestamp(m.timestamp);
            case 1: return m.document;
            case 2: return m.counterparty;
            case 3: return m.cfop;
            case 4: return m.typeString();
            case 5: return m.statusLabel();
            case 6: return decimalToString(m.blocked ? m.requestedQuantitySacks : m.appliedQuantitySacks, 4);
            case 7: return decimalToString(m.unitCost);
            case 8: return decimalToString(m.movingAverageCostAfter);
            case 9: return decimalToString(m.balanceQuantityAfter, 4);
            case 10: return m.notes;
            default: return {};
        }
    }

    if (role == Qt::ForegroundRole) {
        if (m.blocked)
            return QColor(Qt::red);
        if (m.type == MovementType::Opening || m.type == MovementType::PriorBalance)
            return QColor(Qt::darkGray);
    }

    if (role == Qt::BackgroundRole) {
        if (m.costRestarted)
            return QColor(255, 248, 220);
    }

    if (role == Qt::ToolTipRole && m.costRestarted) {
        return "Reinício de custo";
    }

    if (role == Qt::TextAlignmentRole) {
        if (index.column() >= 6 && index.column() <= 9)
            return QVariant(int(Qt::AlignRight | Qt::AlignVCenter));
    }

    return {};
}

QVariant KardexMovementsModel::headerData(int section, Qt::Orientation orientation, int role) const
{
    if (orientation == Qt::Horizontal && role == Qt::DisplayRole) {
        switch (section) {
            case 0: return "Data/Hora";
            case 1: return "Documento";
            case 2: return "Parceiro";
            case 3: return "CFOP";
            case 4: return "Tipo";
            case 5: return "Status";
            case 6: return "Qtd (SC)";
            case 7: return "Custo Unitário";
            case 8: return "Custo Médio";
            case 9: return "Saldo (SC)";
            case 10: return "Observações";
            default: return {};
        }
    }
    return {};
}

void KardexMovementsModel::setMovements(const QList<LedgerMovement> &movements)
{
    beginResetModel();
    m_data = movements;
    endResetModel();
}

// ---------------------
// Finished sales model
// ---------------------

FinishedSalesModel::FinishedSalesModel(QObject *parent)
    : QAbstractTableModel(parent)
{
}

int FinishedSalesModel::rowCount(const QModelIndex &parent) const
{
    Q_UNUSED(parent)
    return m_data.size();
}

int FinishedSalesModel::columnCount(const QModelIndex &parent) const
{
    Q_UNUSED(parent)
    return 9;
}

QVariant FinishedSalesModel::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() >= m_data.size())
        return {};

    const FinishedSaleRecord &s = m_data[index.row()];

    if (role == Qt::DisplayRole) {
        switch (index.column()) {
            case 0: return displayTimestamp(s.timestamp);
            case 1: return s.document;
            case 2: return s.counterparty.isEmpty() ? s.counterpartyId : s.counterparty;
            case 3: return productAliasCode(s.productAlias);
            case 4: return decimalToString(s.unitsSold, 4);
            case 5: return decimalToString(s.unitNetPrice);
            case 6: return decimalToString(s.rawMaterialConsumedSacks, 4);
            case 7: return s.costPerSackAtConsumption ? decimalToString(*s.costPerSackAtConsumption) : QString("-");
            case 8: return decimalToString(s.valuePerSack);
            default: return {};
        }
    }

    if (role == Qt::ForegroundRole) {
        if (!s.rawMaterialCostValue)
            return QColor(Qt::gray);
    }

    if (role == Qt::TextAlignmentRole) {
        if (index.column() >= 4)
            return QVariant(int(Qt::AlignRight | Qt::AlignVCenter));
    }

    return {};
}

QVariant FinishedSalesModel::headerData(int section, Qt::Orientation orientation, int role) const
{
    if (orientation == Qt::Horizontal && role == Qt::DisplayRole) {
        switch (section) {
            case 0: return "Data/Hora";
            case 1: return "Documento";
            case 2: return "Parceiro";
            case 3: return "Produto";
            case 4: return "Qtd (unid)";
            case 5: return "Preço Unitário";
            case 6: return "MP Consumida (SC)";
            case 7: return "Custo Médio SC";
            case 8: return "Valor da Saca Bruta";
            default: return {};
        }
    }
    return {};
}

void FinishedSalesModel::setSales(const QList<FinishedSaleRecord> &sales)
{
    beginResetModel();
    m_data = sales;
    endResetModel();
}

// ---------------------
// Widget
// ---------------------

KardexWidget::KardexWidget(KardexReportService* service, QWidget *parent)
    : QWidget(parent)
    , m_service(service)
{
    setupUi();
}

void KardexWidget::setupUi()
{
    QVBoxLayout* mainLayout = new QVBoxLayout(this);

    QHBoxLayout* topLayout = new QHBoxLayout();

    const QDate today = QDateTime::currentDateTimeUtc().date();
    m_fromEdit = new QDateEdit(QDate(today.year(), today.month(), 1), this);
    m_fromEdit->setCalendarPopup(true);
    m_toEdit = new QDateEdit(today, this);
    m_toEdit->setCalendarPopup(true);

    topLayout->addWidget(new QLabel("De:", this));
    topLayout->addWidget(m_fromEdit);
    topLayout->addWidget(new QLabel("Até:", this));
    topLayout->addWidget(m_toEdit);
    topLayout->addStretch();

    m_exportButton = new QPushButton("Exportar CSV", this);
    m_exportButton->setEnabled(false);
    topLayout->addWidget(m_exportButton);

    m_refreshButton = new QPushButton("Atualizar", this);
    topLayout->addWidget(m_refreshButton);

    mainLayout->addLayout(topLayout);

    QSplitter* splitter = new QSplitter(Qt::Vertical, this);

    m_movementsView = new QTableView(splitter);
    m_movementsModel = new KardexMovementsModel(this);
    m_movementsView->setModel(m_movementsModel);
    m_movementsView->setSelectionBehavior(QAbstractItemView::SelectRows);
    m_movementsView->setSelectionMode(QAbstractItemView::SingleSelection);
    m_movementsView->horizontalHeader()->setStretchLastSection(true);
    m_movementsView->setAlternatingRowColors(true);

    m_salesView = new QTableView(splitter);
    m_salesModel = new FinishedSalesModel(this);
    m_salesView->setModel(m_salesModel);
    m_salesView->setSelectionBehavior(QAbstractItemView::SelectRows);
    m_salesView->setSelectionMode(QAbstractItemView::SingleSelection);
    m_salesView->horizontalHeader()->setStretchLastSection(true);
    m_salesView->setAlternatingRowColors(true);

    splitter->addWidget(m_movementsView);
    splitter->addWidget(m_salesView);
    splitter->setStretchFactor(0, 3);
    splitter->setStretchFactor(1, 1);
    mainLayout->addWidget(splitter);

    m_totalsLabel = new QLabel(this);
    mainLayout->addWidget(m_totalsLabel);

    connect(m_refreshButton, &QPushButton::clicked, this, &KardexWidget::onRefreshClicked);
    connect(m_exportButton, &QPushButton::clicked, this, &KardexWidget::onExportCsvClicked);
}

void KardexWidget::onRefreshClicked()
{
    if (m_fromEdit->date() > m_toEdit->date()) {
        QMessageBox::warning(this, "Kardex", "A data inicial é posterior à data final.");
        return;
    }

    KardexReportRequest request;
    request.from = m_fromEdit->date();
    request.until = m_toEdit->date();

    try {
        showReport(m_service->buildReport(request));
    } catch (const KardexError &e) {
        qWarning(kardexUi) << "KardexWidget: report failed, status" << e.httpStatus() << "-" << e.message();
        QMessageBox::critical(this, "Kardex", e.message());
    }
}

void KardexWidget::showReport(const KardexReport &report)
{
    m_report = report;
    m_hasReport = true;
    m_exportButton->setEnabled(true);

    m_movementsModel->setMovements(report.movements);
    m_salesModel->setSales(report.finishedSales);

    const KardexGrandTotals &g = report.grandTotals;
    m_totalsLabel->setText(QString(
        "Entradas: %1 SC | Saídas: %2 SC | Saldo: %3 SC | Valor: R$ %4 | Custo médio: R$ %5 | "
        "Acabados: %6 unid, MP %7 SC")
        .arg(decimalToString(g.movements.entriesSacks, 4),
             decimalToString(g.movements.exitsSacks, 4),
             decimalToString(g.balanceSacks, 4),
             decimalToString(g.balanceValue),
             decimalToString(g.movingAverageCost),
             decimalToString(g.finished.unitsSold, 4),
             decimalToString(g.finished.rawMaterialConsumedSacks, 4)));
}

void KardexWidget::onExportCsvClicked()
{
    if (!m_hasReport) return;

    const QString fileName = QFileDialog::getSaveFileName(
        this, "Exportar CSV",
        QString("kardex-%1-%2.csv").arg(m_fromEdit->date().toString(Qt::ISODate),
                                        m_toEdit->date().toString(Qt::ISODate)),
        "CSV (*.csv)");
    if (fileName.isEmpty()) return;

    QFile f(fileName);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        QMessageBox::critical(this, "Exportar CSV", "Não foi possível gravar o arquivo:\n" + f.errorString());
        return;
    }
    f.write(KardexExport::toCsv(m_report));
    f.close();

    qInfo(kardexUi) << "KardexWidget: CSV exported to" << fileName;
}

#ifndef KARDEXWIDGET_H
#define KARDEXWIDGET_H

#include <QWidget>
#include <QTableView>
#include <QPushButton>
#include <QDateEdit>
#include <QLabel>
#include <QAbstractTableModel>
#include <QList>

#include "KardexReport.h"

class KardexReportService;

class KardexMovementsModel : public QAbstractTableModel
{
    Q_OBJECT
public:
    explicit KardexMovementsModel(QObject *parent = nullptr);

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    int columnCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    QVariant headerData(int section, Qt::Orientation orientation, int role = Qt::DisplayRole) const override;

    void setMovements(const QList<LedgerMovement> &movements);
    const LedgerMovement& movementAt(int row) const { return m_data[row]; }

private:
    QList<LedgerMovement> m_data;
};

class FinishedSalesModel : public QAbstractTableModel
{
    Q_OBJECT
public:
    explicit FinishedSalesModel(QObject *parent = nullptr);

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    int columnCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    QVariant headerData(int section, Qt::Orientation orientation, int role = Qt::DisplayRole) const override;

    void setSales(const QList<FinishedSaleRecord> &sales);

private:
    QList<FinishedSaleRecord> m_data;
};

class KardexWidget : public QWidget
{
    Q_OBJECT

public:
    explicit KardexWidget(KardexReportService* service, QWidget *parent = nullptr);

private slots:
    void onRefreshClicked();
    void onExportCsvClicked();

private:
    void setupUi();
    void showReport(const KardexReport &report);

    KardexReportService* m_service = nullptr;
    KardexReport m_report;
    bool m_hasReport = false;

    QDateEdit* m_fromEdit = nullptr;
    QDateEdit* m_toEdit = nullptr;
    QPushButton* m_refreshButton = nullptr;
    QPushButton* m_exportButton = nullptr;

    QTableView* m_movementsView = nullptr;
    KardexMovementsModel* m_movementsModel = nullptr;

    QTableView* m_salesView = nullptr;
    FinishedSalesModel* m_salesModel = nullptr;

    QLabel* m_totalsLabel = nullptr;
};

#endif // KARDEXWIDGET_H

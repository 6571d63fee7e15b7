#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QTabWidget>

class KardexReportService;

class MainWindow : public QMainWindow
{
    Q_OBJECT
public:
    explicit MainWindow(KardexReportService* kardexService, QWidget *parent = nullptr);
    ~MainWindow();

private slots:
    void onAboutClicked();
    void onExitClicked();

private:
    void setupUi();
    void createMenuBar();

private:
    KardexReportService* m_kardexService = nullptr;
    QTabWidget* m_tabWidget = nullptr;
};

#endif // MAINWINDOW_H

#include "MainWindow.h"

#include "widgets/KardexWidget.h"

#include <QMenuBar>
#include <QMenu>
#include <QAction>
#include <QMessageBox>
#include <QApplication>

MainWindow::MainWindow(KardexReportService* kardexService, QWidget *parent)
    : QMainWindow(parent)
    , m_kardexService(kardexService)
{
    setupUi();
    createMenuBar();
    setWindowTitle("Kardex Consolidado");
    resize(1200, 800);
}

MainWindow::~MainWindow() {}

void MainWindow::setupUi()
{
    m_tabWidget = new QTabWidget(this);
    setCentralWidget(m_tabWidget);

    m_tabWidget->addTab(new KardexWidget(m_kardexService, this), "Kardex MP");
}

void MainWindow::createMenuBar()
{
    QMenuBar* menuBar = this->menuBar();

    QMenu* fileMenu = menuBar->addMenu("Arquivo");
    QAction* exitAction = fileMenu->addAction("Sair");
    connect(exitAction, &QAction::triggered, this, &MainWindow::onExitClicked);

    QMenu* helpMenu = menuBar->addMenu("Ajuda");
    QAction* aboutAction = helpMenu->addAction("Sobre");
    connect(aboutAction, &QAction::triggered, this, &MainWindow::onAboutClicked);
}

void MainWindow::onAboutClicked()
{
    QMessageBox::about(this, "Sobre",
        "Kardex Consolidado da Matéria-Prima\n"
        "Custo médio móvel em sacas de 60 kg");
}

void MainWindow::onExitClicked()
{
    QApplication::quit();
}

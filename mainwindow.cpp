#include "mainwindow.h"
#include "commandexecutor.h"
#include "deeplinkstore.h"
#include "storebackend.h"

#include <QAction>
#include <QApplication>
#include <QCloseEvent>
#include <QColor>
#include <QComboBox>
#include <QDebug>
#include <QDockWidget>
#include <QFileDialog>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QInputDialog>
#include <QLabel>
#include <QLineEdit>
#include <QListWidget>
#include <QMenu>
#include <QMenuBar>
#include <QMessageBox>
#include <QPushButton>
#include <QSizePolicy>
#include <QStatusBar>
#include <QTextEdit>
#include <QVBoxLayout>
#include <memory>

MainWindow::MainWindow(QWidget *parent, const QString &adbPath, const QString &dataFile, const QString &preferredSerial)
    : QMainWindow(parent),
      m_executor(new CommandExecutor(this)),
      m_enumerator(m_executor),
      m_dispatcher(m_executor),
      m_preferredSerial(preferredSerial) {
    setWindowTitle(QApplication::applicationName());
    setMinimumSize(900, 500);
    if (!adbPath.isEmpty()) m_executor->setAdbPath(adbPath);
    if (!m_executor->hasAdb()) {
        qWarning() << "adb executable not found; device list will stay empty";}
    connect(m_executor, &CommandExecutor::commandStarted, this, [this](const QString &commandLine) {
        appendLog(QString(">>> %1").arg(commandLine), "#FFE066");});
    connect(m_executor, &CommandExecutor::outputReceived, this, &MainWindow::onOutput);
    connect(m_executor, &CommandExecutor::errorReceived, this, &MainWindow::onError);
    connect(m_executor, &CommandExecutor::finished, this, &MainWindow::onProcessFinished);

    const QString storePath = dataFile.isEmpty() ? JsonFileBackend::defaultFilePath() : dataFile;
    m_store = new DeeplinkStore(std::make_unique<JsonFileBackend>(storePath), this);
    connect(m_store, &DeeplinkStore::historyChanged, this, &MainWindow::populateHistoryList);
    connect(m_store, &DeeplinkStore::favoritesChanged, this, &MainWindow::populateFavoritesList);

    setupMenus();
    setCentralWidget(createLauncherWidget());
    // Console dock
    m_log = new QTextEdit();
    m_log->setReadOnly(true);
    m_log->setStyleSheet("background: #000; color: #f0f0f0; font-family: monospace;");
    m_dockLog = new QDockWidget(tr("Execution Console"), this);
    m_dockLog->setObjectName("dockLog");
    m_dockLog->setWidget(m_log);
    m_dockLog->setAllowedAreas(Qt::BottomDockWidgetArea | Qt::RightDockWidgetArea);
    addDockWidget(Qt::BottomDockWidgetArea, m_dockLog);
    QMenu *viewMenu = menuBar()->addMenu("&View");
    viewMenu->addAction(m_dockLog->toggleViewAction());

    m_store->load();
    statusBar()->showMessage(tr("Data file: %1").arg(m_store->location()));
    restoreWindowStateFromSettings();
    refreshDevices();}

MainWindow::~MainWindow() {
    saveWindowStateToSettings();}

void MainWindow::setupMenus() {
    QMenu *file = menuBar()->addMenu("&File");
    QAction *importAct = file->addAction("Import…");
    importAct->setShortcut(QKeySequence(tr("Ctrl+O")));
    connect(importAct, &QAction::triggered, this, &MainWindow::importDeeplinks);
    QAction *exportAct = file->addAction("Export…");
    exportAct->setShortcut(QKeySequence(tr("Ctrl+S")));
    connect(exportAct, &QAction::triggered, this, &MainWindow::exportDeeplinks);
    file->addSeparator();
    QAction *quitAct = file->addAction("Quit");
    connect(quitAct, &QAction::triggered, this, &QMainWindow::close);
    QMenu *devices = menuBar()->addMenu("&Devices");
    QAction *refreshAct = devices->addAction("Refresh");
    refreshAct->setShortcut(QKeySequence(Qt::Key_F5));
    connect(refreshAct, &QAction::triggered, this, &MainWindow::refreshDevices);
    QMenu *settings = menuBar()->addMenu("&Settings");
    QAction *adbPathAct = settings->addAction("ADB path…");
    connect(adbPathAct, &QAction::triggered, this, &MainWindow::showAdbPathDialog);}

QWidget* MainWindow::createLauncherWidget() {
    QWidget *w = new QWidget();
    auto mainLayout = new QVBoxLayout(w);
    auto fileLayout = new QHBoxLayout();
    QPushButton *importBtn = new QPushButton("📥 Import file");
    connect(importBtn, &QPushButton::clicked, this, &MainWindow::importDeeplinks);
    fileLayout->addWidget(importBtn);
    QPushButton *exportBtn = new QPushButton("📤 Export file");
    connect(exportBtn, &QPushButton::clicked, this, &MainWindow::exportDeeplinks);
    fileLayout->addWidget(exportBtn);
    mainLayout->addLayout(fileLayout);

    auto deviceLayout = new QHBoxLayout();
    deviceLayout->addWidget(new QLabel("Device:"));
    m_deviceCombo = new QComboBox();
    m_deviceCombo->addItem("Detecting...");
    connect(m_deviceCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, &MainWindow::onDeviceSelected);
    deviceLayout->addWidget(m_deviceCombo, 1);
    m_refreshDevicesBtn = new QPushButton("Refresh");
    m_refreshDevicesBtn->setSizePolicy(QSizePolicy::Maximum, QSizePolicy::Fixed);
    m_refreshDevicesBtn->setToolTip("Refresh device list");
    connect(m_refreshDevicesBtn, &QPushButton::clicked, this, &MainWindow::refreshDevices);
    deviceLayout->addWidget(m_refreshDevicesBtn);
    mainLayout->addLayout(deviceLayout);

    mainLayout->addWidget(new QLabel("Deeplink:"));
    m_deeplinkEdit = new QLineEdit();
    m_deeplinkEdit->setClearButtonEnabled(true);
    connect(m_deeplinkEdit, &QLineEdit::returnPressed, this, &MainWindow::launch);
    mainLayout->addWidget(m_deeplinkEdit);

    auto btnLayout = new QHBoxLayout();
    QPushButton *launchBtn = new QPushButton("Launch");
    launchBtn->setStyleSheet("background-color: #3CB043;");
    connect(launchBtn, &QPushButton::clicked, this, &MainWindow::launch);
    btnLayout->addWidget(launchBtn);
    QPushButton *favBtn = new QPushButton("Add to favorites");
    connect(favBtn, &QPushButton::clicked, this, &MainWindow::addToFavorites);
    btnLayout->addWidget(favBtn);
    mainLayout->addLayout(btnLayout);

    auto listsLayout = new QHBoxLayout();
    QGroupBox *historyBox = new QGroupBox("History");
    auto historyLayout = new QVBoxLayout(historyBox);
    m_historyList = new QListWidget();
    connect(m_historyList, &QListWidget::itemClicked, this, &MainWindow::onHistoryClicked);
    connect(m_historyList, &QListWidget::itemDoubleClicked, this, &MainWindow::onHistoryDoubleClicked);
    historyLayout->addWidget(m_historyList);
    QPushButton *clearHistoryBtn = new QPushButton("Clear history");
    connect(clearHistoryBtn, &QPushButton::clicked, this, &MainWindow::clearHistory);
    historyLayout->addWidget(clearHistoryBtn);
    listsLayout->addWidget(historyBox);

    QGroupBox *favoritesBox = new QGroupBox("Favorites");
    auto favoritesLayout = new QVBoxLayout(favoritesBox);
    m_favoritesList = new QListWidget();
    connect(m_favoritesList, &QListWidget::itemClicked, this, &MainWindow::onFavoriteClicked);
    connect(m_favoritesList, &QListWidget::itemDoubleClicked, this, &MainWindow::onFavoriteDoubleClicked);
    favoritesLayout->addWidget(m_favoritesList);
    auto favBtnLayout = new QHBoxLayout();
    QPushButton *renameBtn = new QPushButton("Rename");
    connect(renameBtn, &QPushButton::clicked, this, &MainWindow::renameFavorite);
    favBtnLayout->addWidget(renameBtn);
    QPushButton *deleteBtn = new QPushButton("Delete");
    connect(deleteBtn, &QPushButton::clicked, this, &MainWindow::deleteFavorite);
    favBtnLayout->addWidget(deleteBtn);
    QPushButton *clearBtn = new QPushButton("Delete all");
    clearBtn->setStyleSheet("background-color: #F44336; color: white;");
    connect(clearBtn, &QPushButton::clicked, this, &MainWindow::clearFavorites);
    favBtnLayout->addWidget(clearBtn);
    favoritesLayout->addLayout(favBtnLayout);
    listsLayout->addWidget(favoritesBox);
    mainLayout->addLayout(listsLayout, 1);
    return w;}

void MainWindow::refreshDevices() {
    QString selected = currentDeviceSerial();
    if (selected.isEmpty()) selected = m_preferredSerial;
    if (selected.isEmpty()) selected = m_settings.value("lastDevice").toString();
    QApplication::setOverrideCursor(Qt::WaitCursor);
    const QVector<AdbDevice> devices = m_enumerator.listDevices();
    QApplication::restoreOverrideCursor();
    m_deviceCombo->blockSignals(true);
    m_deviceCombo->clear();
    for (const AdbDevice &device : devices) {
        m_deviceCombo->addItem(device.displayText(), device.serial);}
    if (devices.isEmpty()) {
        m_deviceCombo->addItem("No devices found");
    } else if (!selected.isEmpty()) {
        const int index = m_deviceCombo->findData(selected);
        if (index >= 0) m_deviceCombo->setCurrentIndex(index);}
    m_deviceCombo->blockSignals(false);
    appendLog(QString("Devices found: %1").arg(devices.size()), "#2196F3");
    if (devices.isEmpty()) {
        QMessageBox::information(this, "ADB",
                                 "No devices found.\n\n"
                                 "Check that:\n"
                                 "• adb is installed\n"
                                 "• the device is connected\n"
                                 "• USB debugging is enabled");
        return;}
    onDeviceSelected(m_deviceCombo->currentIndex());}

void MainWindow::onDeviceSelected(int index) {
    if (index < 0 || index >= m_deviceCombo->count()) return;
    const QString serial = m_deviceCombo->itemData(index).toString();
    if (serial.isEmpty()) return;
    m_preferredSerial.clear();
    m_settings.setValue("lastDevice", serial);
    appendLog(QString("Target device set to: %1").arg(serial), "#2196F3");}

QString MainWindow::currentDeviceSerial() const {
    if (!m_deviceCombo || m_deviceCombo->currentIndex() < 0) return QString();
    return m_deviceCombo->currentData().toString();}

void MainWindow::launch() {
    const QString deeplink = m_deeplinkEdit->text().trimmed();
    if (deeplink.isEmpty()) {
        QMessageBox::warning(this, "Error", "Enter a deeplink");
        return;}
    try {
        m_dispatcher.dispatch(currentDeviceSerial(), deeplink);
    } catch (const AdbCommandError &e) {
        QMessageBox::critical(this, "ADB error", QString::fromStdString(e.what()));
        return;}
    appendLog(QString("Launched: %1").arg(deeplink), "#4CAF50");
    try {
        m_store->recordLaunch(deeplink);
    } catch (const StoreIoError &e) {
        showSaveError(e);}}

void MainWindow::addToFavorites() {
    const QString deeplink = m_deeplinkEdit->text().trimmed();
    if (deeplink.isEmpty()) return;
    bool ok;
    const QString name = QInputDialog::getText(this, "Name", "Enter a name:", QLineEdit::Normal, QString(), &ok);
    if (!ok || name.isEmpty()) return;
    try {
        m_store->addFavorite(name, deeplink);
    } catch (const StoreIoError &e) {
        showSaveError(e);}}

void MainWindow::renameFavorite() {
    const int row = m_favoritesList->currentRow();
    if (row < 0 || row >= m_store->favorites().size()) return;
    const FavoriteEntry fav = m_store->favorites().at(row);
    bool ok;
    const QString newName = QInputDialog::getText(this, "Rename", "New name:", QLineEdit::Normal, fav.name, &ok);
    if (!ok || newName.isEmpty()) return;
    try {
        m_store->renameFavorite(row, newName);
    } catch (const StoreIoError &e) {
        showSaveError(e);}
    m_favoritesList->setCurrentRow(row);}

void MainWindow::deleteFavorite() {
    const int row = m_favoritesList->currentRow();
    if (row < 0 || row >= m_store->favorites().size()) return;
    const FavoriteEntry fav = m_store->favorites().at(row);
    if (!confirm("Delete", QString("Delete favorite:\n\n%1?").arg(fav.name))) return;
    try {
        m_store->deleteFavorite(row);
    } catch (const StoreIoError &e) {
        showSaveError(e);}}

void MainWindow::clearFavorites() {
    if (m_store->favorites().isEmpty()) return;
    if (!confirm("Delete", "Delete all deeplinks from favorites?")) return;
    try {
        m_store->clearFavorites();
    } catch (const StoreIoError &e) {
        showSaveError(e);}}

void MainWindow::clearHistory() {
    if (m_store->history().isEmpty()) return;
    if (!confirm("Clear history", "Are you sure you want to clear the history?")) return;
    try {
        m_store->clearHistory();
    } catch (const StoreIoError &e) {
        showSaveError(e);}}

void MainWindow::importDeeplinks() {
    const QString path = QFileDialog::getOpenFileName(this, tr("Import deeplinks"), QString(), tr("JSON files (*.json)"));
    if (path.isEmpty()) return;
    ImportResult result;
    try {
        result = m_store->importFromFile(path);
    } catch (const ImportSaveError &e) {
        appendLog(QString("Imported from %1 but not saved").arg(path), "#FF9800");
        showSaveError(e);
        QMessageBox::information(this, "Import complete",
                                 QString("Added:\n• Favorites: %1\n• History: %2")
                                     .arg(e.result.favoritesAdded).arg(e.result.historyAdded));
        return;
    } catch (const StoreFormatError &e) {
        QMessageBox::critical(this, "Error", QString("Invalid file format\n\n%1").arg(QString::fromStdString(e.what())));
        return;
    } catch (const StoreIoError &e) {
        QMessageBox::critical(this, "Import error", QString::fromStdString(e.what()));
        return;}
    appendLog(QString("Imported from %1").arg(path), "#8BC34A");
    QMessageBox::information(this, "Import complete",
                             QString("Added:\n• Favorites: %1\n• History: %2").arg(result.favoritesAdded).arg(result.historyAdded));}

void MainWindow::exportDeeplinks() {
    const QString path = QFileDialog::getSaveFileName(this, tr("Export deeplinks"), "deeplinks.json", tr("JSON files (*.json)"));
    if (path.isEmpty()) return;
    try {
        m_store->exportToFile(path);
    } catch (const StoreIoError &e) {
        QMessageBox::critical(this, "Export error", QString::fromStdString(e.what()));
        return;}
    QMessageBox::information(this, "Export", "Deeplinks exported successfully");}

void MainWindow::populateHistoryList() {
    m_historyList->clear();
    m_historyList->addItems(m_store->history());}

void MainWindow::populateFavoritesList() {
    const int row = m_favoritesList->currentRow();
    m_favoritesList->clear();
    for (const FavoriteEntry &fav : m_store->favorites()) {
        m_favoritesList->addItem(fav.displayText());}
    if (row >= 0 && row < m_favoritesList->count()) m_favoritesList->setCurrentRow(row);}

void MainWindow::onHistoryClicked(QListWidgetItem *item) {
    if (item) m_deeplinkEdit->setText(item->text());}

void MainWindow::onHistoryDoubleClicked(QListWidgetItem *item) {
    if (!item) return;
    m_deeplinkEdit->setText(item->text());
    launch();}

void MainWindow::onFavoriteClicked(QListWidgetItem *item) {
    const int row = m_favoritesList->row(item);
    if (row < 0 || row >= m_store->favorites().size()) return;
    m_deeplinkEdit->setText(m_store->favorites().at(row).deeplink);}

void MainWindow::onFavoriteDoubleClicked(QListWidgetItem *item) {
    const int row = m_favoritesList->row(item);
    if (row < 0 || row >= m_store->favorites().size()) return;
    m_deeplinkEdit->setText(m_store->favorites().at(row).deeplink);
    launch();}

void MainWindow::showAdbPathDialog() {
    bool ok;
    const QString path = QInputDialog::getText(this, "ADB path", "Path to the adb executable:",
                                               QLineEdit::Normal, m_executor->adbPath(), &ok).trimmed();
    if (!ok) return;
    if (!path.isEmpty() && CommandExecutor::resolveAdbPath(path).isEmpty()) {
        QMessageBox::warning(this, "ADB path", QString("adb not found at:\n%1").arg(path));
        return;}
    m_executor->setAdbPath(path);
    m_settings.setValue("adbPath", path);
    appendLog(QString("adb path: %1").arg(m_executor->hasAdb() ? m_executor->adbPath() : QStringLiteral("<not found>")), "#BDBDBD");
    refreshDevices();}

bool MainWindow::confirm(const QString &title, const QString &text) {
    return QMessageBox::question(this, title, text, QMessageBox::Yes | QMessageBox::No) == QMessageBox::Yes;}

void MainWindow::showSaveError(const std::exception &e) {
    qCritical() << "Save failed:" << e.what();
    QMessageBox::critical(this, "Save error", QString("Could not save data:\n%1").arg(QString::fromStdString(e.what())));}

void MainWindow::onOutput(const QString &text) {
    const QStringList lines = text.split('\n');
    for (const QString &l : lines) {
        if (!l.trimmed().isEmpty()) {
            appendLog(l.trimmed(), "#A9FFAC");}}}

void MainWindow::onError(const QString &text) {
    const QStringList lines = text.split('\n');
    for (const QString &l : lines) {
        if (!l.trimmed().isEmpty()) {
            appendLog(QString("!!! %1").arg(l.trimmed()), "#FF6565");}}}

void MainWindow::onProcessFinished(int exitCode, QProcess::ExitStatus) {
    if (exitCode != 0) appendLog(QString("Command finished with error code: %1").arg(exitCode), "#FF6565");
    else appendLog("adb process finished.", "#BDBDBD");}

void MainWindow::appendLog(const QString &text, const QString &color) {
    if (!m_log) return;
    if (!color.isEmpty()) m_log->setTextColor(QColor(color)); else m_log->setTextColor(QColor("#F0F0F0"));
    m_log->append(text);
    m_log->setTextColor(QColor("#F0F0F0"));}

void MainWindow::restoreWindowStateFromSettings() {
    if (m_settings.contains("geometry")) restoreGeometry(m_settings.value("geometry").toByteArray());
    if (m_settings.contains("windowState")) restoreState(m_settings.value("windowState").toByteArray());}

void MainWindow::saveWindowStateToSettings() {
    m_settings.setValue("geometry", saveGeometry());
    m_settings.setValue("windowState", saveState());}

void MainWindow::closeEvent(QCloseEvent *event) {
    saveWindowStateToSettings();
    QMainWindow::closeEvent(event);}

#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include "deeplinkdispatcher.h"
#include "deviceenumerator.h"

#include <QMainWindow>
#include <QProcess>
#include <QSettings>
#include <QString>
#include <exception>

class QComboBox;
class QDockWidget;
class QLineEdit;
class QListWidget;
class QListWidgetItem;
class QPushButton;
class QTextEdit;
class CommandExecutor;
class DeeplinkStore;

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    explicit MainWindow(QWidget *parent = nullptr,
                        const QString &adbPath = QString(),
                        const QString &dataFile = QString(),
                        const QString &preferredSerial = QString());
    ~MainWindow() override;

protected:
    void closeEvent(QCloseEvent *event) override;

private slots:
    void refreshDevices();
    void onDeviceSelected(int index);
    void launch();
    void addToFavorites();
    void renameFavorite();
    void deleteFavorite();
    void clearFavorites();
    void clearHistory();
    void importDeeplinks();
    void exportDeeplinks();
    void populateHistoryList();
    void populateFavoritesList();
    void onHistoryClicked(QListWidgetItem *item);
    void onHistoryDoubleClicked(QListWidgetItem *item);
    void onFavoriteClicked(QListWidgetItem *item);
    void onFavoriteDoubleClicked(QListWidgetItem *item);
    void showAdbPathDialog();
    void onOutput(const QString &text);
    void onError(const QString &text);
    void onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus);

private:
    CommandExecutor *m_executor = nullptr;
    DeviceEnumerator m_enumerator;
    DeeplinkDispatcher m_dispatcher;
    DeeplinkStore *m_store = nullptr;
    QComboBox *m_deviceCombo = nullptr;
    QPushButton *m_refreshDevicesBtn = nullptr;
    QLineEdit *m_deeplinkEdit = nullptr;
    QListWidget *m_historyList = nullptr;
    QListWidget *m_favoritesList = nullptr;
    QTextEdit *m_log = nullptr;
    QDockWidget *m_dockLog = nullptr;
    QString m_preferredSerial;
    QSettings m_settings{"AdbDeeplink", "deeplink_launcher"};
    QWidget* createLauncherWidget();
    void setupMenus();
    QString currentDeviceSerial() const;
    bool confirm(const QString &title, const QString &text);
    void showSaveError(const std::exception &e);
    void appendLog(const QString &text, const QString &color = QString());
    void restoreWindowStateFromSettings();
    void saveWindowStateToSettings();
};

#endif // MAINWINDOW_H

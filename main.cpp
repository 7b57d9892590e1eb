#include "mainwindow.h"
#include "applog.h"
#include "argsparser.h"
#include "storebackend.h"
#include <QApplication>
#include <QDebug>
#include <QFileInfo>
#include <QSettings>

int main(int argc, char *argv[])
{
    QApplication a(argc, argv);
    a.setApplicationName("ADB Deeplink Launcher");
    a.setApplicationVersion("1.0");
    a.setOrganizationName("AdbDeeplink");
    ArgsParser::parse(a.arguments());
    QSettings settings("AdbDeeplink", "deeplink_launcher");
    const QString adbPath = ArgsParser::get("adb-path", settings.value("adbPath").toString());
    QString dataFile = ArgsParser::get("data-file", settings.value("dataFile").toString());
    if (dataFile.isEmpty()) dataFile = JsonFileBackend::defaultFilePath();
    const QString targetSerial = ArgsParser::get("device-serial");
    installFileLogger(QFileInfo(dataFile).absoluteDir().filePath("launcher.log"));
    qInfo() << a.applicationName() << a.applicationVersion() << "starting, data file" << dataFile;
    MainWindow w(nullptr, adbPath, dataFile, targetSerial);
    w.show();
    return a.exec();}

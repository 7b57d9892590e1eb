#include "storebackend.h"
#include <QByteArray>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>

JsonFileBackend::JsonFileBackend(const QString &filePath) : m_filePath(filePath) {}

QString JsonFileBackend::defaultFilePath() {
#ifdef Q_OS_WIN
    // Roaming profile, where earlier releases kept deeplinks.json.
    QString base = qEnvironmentVariable("APPDATA");
#else
    QString base = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
#endif
    if (base.isEmpty()) base = QDir::homePath();
    QString appName = QCoreApplication::applicationName();
    if (appName.isEmpty()) appName = QStringLiteral("ADB Deeplink Launcher");
    return QDir(base).filePath(appName + "/deeplinks.json");}

std::optional<std::string> JsonFileBackend::load() {
    if (!QFileInfo::exists(m_filePath)) {
        qInfo() << "No store at" << m_filePath << "- starting empty";
        return std::nullopt;}
    QFile f(m_filePath);
    if (!f.open(QIODevice::ReadOnly)) {
        qWarning() << "Cannot open store file" << m_filePath << ":" << f.errorString();
        return std::nullopt;}
    return f.readAll().toStdString();}

void JsonFileBackend::save(const std::string &contents) {
    QFileInfo fileInfo(m_filePath);
    QDir dir;
    if (!dir.mkpath(fileInfo.absolutePath())) {
        throw StoreIoError(QString("Cannot create directory: %1").arg(fileInfo.absolutePath()));}
    QFile f(m_filePath);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        throw StoreIoError(QString("Cannot write JSON: %1\n%2").arg(m_filePath, f.errorString()));}
    const QByteArray data = QByteArray::fromStdString(contents);
    if (f.write(data) != data.size() || !f.flush()) {
        throw StoreIoError(QString("Write to %1 did not complete: %2").arg(m_filePath, f.errorString()));}
    f.close();}

#include "deviceenumerator.h"
#include "commandexecutor.h"
#include <QDebug>
#include <QRegularExpression>
#include <QStringList>

QString AdbDevice::displayText() const {
    return QString("%1 | %2 | Android %3").arg(serial, model, osVersion);}

DeviceEnumerator::DeviceEnumerator(CommandExecutor *executor) : m_executor(executor) {}

QVector<AdbDevice> DeviceEnumerator::parseDevicesOutput(const QString &output) {
    QVector<AdbDevice> devices;
    const QStringList lines = output.split('\n', Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        if (line.startsWith("List of")) continue;
        if (line.trimmed().isEmpty() || line.startsWith('*')) continue;
        const QStringList parts = line.split(QRegularExpression("\\s+"), Qt::SkipEmptyParts);
        if (parts.size() < 2 || parts[1] != "device") continue;
        AdbDevice device;
        device.serial = parts[0];
        for (const QString &part : parts) {
            if (part.startsWith("model:")) {
                device.model = part.mid(6).replace('_', ' ');}}
        devices.append(device);}
    return devices;}

QVector<AdbDevice> DeviceEnumerator::listDevices() const {
    if (!m_executor) return {};
    const CommandResult result = m_executor->runAdbCommand(QStringList() << "devices" << "-l", ListTimeoutMs);
    if (!result.succeeded()) {
        qWarning() << "adb devices failed:" << (result.errorString.isEmpty() ? result.stdErr.trimmed() : result.errorString);
        return {};}
    QVector<AdbDevice> devices = parseDevicesOutput(result.stdOut);
    for (AdbDevice &device : devices) {
        device.osVersion = queryOsVersion(device.serial);}
    qInfo() << "Found" << devices.size() << "device(s)";
    return devices;}

QString DeviceEnumerator::queryOsVersion(const QString &serial) const {
    const CommandResult result = m_executor->runDeviceCommand(
        serial, QStringList() << "shell" << "getprop" << "ro.build.version.release", PropertyTimeoutMs);
    const QString version = result.stdOut.trimmed();
    if (!result.succeeded() || version.isEmpty()) {
        qDebug() << "No Android version for" << serial;
        return QStringLiteral("?");}
    return version;}

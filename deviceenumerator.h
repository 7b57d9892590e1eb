#pragma once

#include <QString>
#include <QVector>

class CommandExecutor;

struct AdbDevice {
    QString serial;
    QString model = QStringLiteral("Unknown");
    QString osVersion = QStringLiteral("?");

    QString displayText() const;
};

class DeviceEnumerator {
public:
    static constexpr int ListTimeoutMs = 10000;
    static constexpr int PropertyTimeoutMs = 2000;

    explicit DeviceEnumerator(CommandExecutor *executor);

    // Point-in-time snapshot. Returns an empty list when adb cannot be run.
    QVector<AdbDevice> listDevices() const;

    // Parses `adb devices -l` output; only devices in the "device" state are kept.
    static QVector<AdbDevice> parseDevicesOutput(const QString &output);

private:
    CommandExecutor *m_executor;
    QString queryOsVersion(const QString &serial) const;
};

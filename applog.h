#pragma once

#include <QString>

// Mirrors Qt messages to stderr and appends them to a log file as
// "ISO-timestamp - LEVEL - message". Debug messages only go to stderr.
void installFileLogger(const QString &logFilePath);
void uninstallFileLogger();
QString currentLogFilePath();

#pragma once
#include <QMap>
#include <QString>
#include <QStringList>

// Parses "--key value" and "--key=value" options from the command line.
class ArgsParser {
public:
    static QStringList parse(const QStringList &arguments) {
        values().clear();
        QStringList positional;
        for (int i = 1; i < arguments.size(); ++i) {
            const QString &arg = arguments.at(i);
            if (!arg.startsWith("--") || arg.size() == 2) {
                positional.append(arg);
                continue;}
            const QString body = arg.mid(2);
            const int eq = body.indexOf('=');
            if (eq >= 0) {
                values().insert(body.left(eq), body.mid(eq + 1));
            } else if (i + 1 < arguments.size() && !arguments.at(i + 1).startsWith("--")) {
                values().insert(body, arguments.at(++i));
            } else {
                values().insert(body, QString());}}
        return positional;}

    static QString get(const QString &key, const QString &fallback = QString()) {
        return values().value(key, fallback);}

    static bool has(const QString &key) { return values().contains(key); }

private:
    static QMap<QString, QString> &values() {
        static QMap<QString, QString> parsed;
        return parsed;}};

#pragma once

#include <QString>
#include <optional>
#include <stdexcept>
#include <string>

class StoreIoError : public std::runtime_error {
public:
    explicit StoreIoError(const QString &message)
        : std::runtime_error(message.toStdString()) {}
};

// Where the store document lives. save() replaces the whole document.
class StoreBackend {
public:
    virtual ~StoreBackend() = default;
    virtual std::optional<std::string> load() = 0;
    virtual void save(const std::string &contents) = 0;
    virtual QString location() const = 0;
};

class JsonFileBackend : public StoreBackend {
public:
    explicit JsonFileBackend(const QString &filePath);

    std::optional<std::string> load() override;
    void save(const std::string &contents) override;
    QString location() const override { return m_filePath; }

    static QString defaultFilePath();

private:
    QString m_filePath;
};

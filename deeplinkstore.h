#pragma once

#include "storebackend.h"
#include "nlohmann/json.hpp"

#include <QObject>
#include <QString>
#include <QStringList>
#include <QVector>
#include <memory>
#include <stdexcept>

class StoreFormatError : public std::runtime_error {
public:
    explicit StoreFormatError(const QString &message)
        : std::runtime_error(message.toStdString()) {}
};

struct FavoriteEntry {
    QString name;
    QString deeplink;

    nlohmann::json toJson() const;
    static FavoriteEntry fromJson(const nlohmann::json &obj);
    QString displayText() const;

    bool operator==(const FavoriteEntry &other) const {
        return name == other.name && deeplink == other.deeplink; }
    bool operator!=(const FavoriteEntry &other) const { return !(*this == other); }
};

struct ImportResult {
    int favoritesAdded = 0;
    int historyAdded = 0;
};

// The merge went through in memory but the store could not be written.
class ImportSaveError : public StoreIoError {
public:
    ImportSaveError(const ImportResult &merged, const QString &message)
        : StoreIoError(message), result(merged) {}

    ImportResult result;
};

// History and favorites. Every mutation rewrites the whole backend document;
// on a write failure StoreIoError is thrown and the in-memory change stays.
class DeeplinkStore : public QObject {
    Q_OBJECT
public:
    static constexpr int ExportVersion = 1;

    explicit DeeplinkStore(std::unique_ptr<StoreBackend> backend, QObject *parent = nullptr);
    ~DeeplinkStore() override;

    void load();

    const QStringList &history() const { return m_history; }
    const QVector<FavoriteEntry> &favorites() const { return m_favorites; }
    QString location() const;

    bool recordLaunch(const QString &deeplink);
    void addFavorite(const QString &name, const QString &deeplink);
    bool renameFavorite(int index, const QString &newName);
    bool deleteFavorite(int index);
    void clearFavorites();
    void clearHistory();

    nlohmann::json toJson() const;
    nlohmann::json exportDocument() const;
    void exportToFile(const QString &path) const;

    // Appends entries not already present. Throws StoreFormatError without
    // touching the store when the document is malformed, ImportSaveError when
    // the merged store cannot be persisted.
    ImportResult importAndMerge(const nlohmann::json &document);
    ImportResult importFromFile(const QString &path);

signals:
    void historyChanged();
    void favoritesChanged();

private:
    std::unique_ptr<StoreBackend> m_backend;
    QStringList m_history;
    QVector<FavoriteEntry> m_favorites;

    void persist();
};

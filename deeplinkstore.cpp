#include "deeplinkstore.h"
#include <QByteArray>
#include <QDebug>
#include <QFile>

namespace {

QString jsonString(const nlohmann::json &value) {
    return QString::fromStdString(value.get<std::string>());}

bool isFavoriteObject(const nlohmann::json &obj) {
    return obj.is_object()
        && obj.contains("name") && obj.at("name").is_string()
        && obj.contains("deeplink") && obj.at("deeplink").is_string();}

} // namespace

nlohmann::json FavoriteEntry::toJson() const {
    return {{"name", name.toStdString()}, {"deeplink", deeplink.toStdString()}};}

FavoriteEntry FavoriteEntry::fromJson(const nlohmann::json &obj) {
    FavoriteEntry entry;
    entry.name = jsonString(obj.at("name"));
    entry.deeplink = jsonString(obj.at("deeplink"));
    return entry;}

QString FavoriteEntry::displayText() const {
    return QString("%1  →  %2").arg(name, deeplink);}

DeeplinkStore::DeeplinkStore(std::unique_ptr<StoreBackend> backend, QObject *parent)
    : QObject(parent), m_backend(std::move(backend)) {}

DeeplinkStore::~DeeplinkStore() = default;

QString DeeplinkStore::location() const {
    return m_backend ? m_backend->location() : QString();}

void DeeplinkStore::load() {
    m_history.clear();
    m_favorites.clear();
    const std::optional<std::string> contents = m_backend ? m_backend->load() : std::nullopt;
    if (contents) {
        try {
            const nlohmann::json j = nlohmann::json::parse(*contents);
            if (j.is_object()) {
                if (j.contains("history") && j.at("history").is_array()) {
                    for (const auto &link : j.at("history")) {
                        if (!link.is_string()) continue;
                        const QString value = jsonString(link);
                        if (!m_history.contains(value)) m_history.append(value);}}
                if (j.contains("favorites") && j.at("favorites").is_array()) {
                    for (const auto &fav : j.at("favorites")) {
                        if (isFavoriteObject(fav)) m_favorites.append(FavoriteEntry::fromJson(fav));}}
            } else {
                qWarning() << "Store" << location() << "is not a JSON object - starting empty";}
        } catch (const nlohmann::json::exception &e) {
            qWarning() << "Cannot parse store" << location() << ":" << e.what();
            m_history.clear();
            m_favorites.clear();}}
    qInfo() << "Loaded" << m_history.size() << "history and" << m_favorites.size() << "favorite entries";
    emit historyChanged();
    emit favoritesChanged();}

bool DeeplinkStore::recordLaunch(const QString &deeplink) {
    if (m_history.contains(deeplink)) return false;
    m_history.prepend(deeplink);
    emit historyChanged();
    persist();
    return true;}

void DeeplinkStore::addFavorite(const QString &name, const QString &deeplink) {
    FavoriteEntry entry;
    entry.name = name;
    entry.deeplink = deeplink;
    m_favorites.append(entry);
    emit favoritesChanged();
    persist();}

bool DeeplinkStore::renameFavorite(int index, const QString &newName) {
    if (index < 0 || index >= m_favorites.size() || newName.isEmpty()) return false;
    m_favorites[index].name = newName;
    emit favoritesChanged();
    persist();
    return true;}

bool DeeplinkStore::deleteFavorite(int index) {
    if (index < 0 || index >= m_favorites.size()) return false;
    m_favorites.removeAt(index);
    emit favoritesChanged();
    persist();
    return true;}

void DeeplinkStore::clearFavorites() {
    m_favorites.clear();
    emit favoritesChanged();
    persist();}

void DeeplinkStore::clearHistory() {
    m_history.clear();
    emit historyChanged();
    persist();}

nlohmann::json DeeplinkStore::toJson() const {
    nlohmann::json history = nlohmann::json::array();
    for (const QString &link : m_history) history.push_back(link.toStdString());
    nlohmann::json favorites = nlohmann::json::array();
    for (const FavoriteEntry &fav : m_favorites) favorites.push_back(fav.toJson());
    return {{"history", history}, {"favorites", favorites}};}

nlohmann::json DeeplinkStore::exportDocument() const {
    nlohmann::json doc = toJson();
    doc["version"] = ExportVersion;
    return doc;}

void DeeplinkStore::exportToFile(const QString &path) const {
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        throw StoreIoError(QString("Cannot write file: %1\n%2").arg(path, f.errorString()));}
    const QByteArray data = QByteArray::fromStdString(exportDocument().dump(2));
    if (f.write(data) != data.size() || !f.flush()) {
        throw StoreIoError(QString("Write to %1 did not complete: %2").arg(path, f.errorString()));}
    f.close();
    qInfo() << "Exported" << m_favorites.size() << "favorites and" << m_history.size() << "history entries to" << path;}

ImportResult DeeplinkStore::importAndMerge(const nlohmann::json &document) {
    if (!document.is_object() || !document.contains("favorites")) {
        throw StoreFormatError(QStringLiteral("Invalid file format: expected an object with \"favorites\""));}
    const nlohmann::json &favorites = document.at("favorites");
    if (!favorites.is_array()) {
        throw StoreFormatError(QStringLiteral("Invalid file format: \"favorites\" is not a list"));}
    QVector<FavoriteEntry> incomingFavorites;
    for (const auto &fav : favorites) {
        if (!isFavoriteObject(fav)) {
            throw StoreFormatError(QStringLiteral("Invalid file format: favorite without name or deeplink"));}
        incomingFavorites.append(FavoriteEntry::fromJson(fav));}
    QStringList incomingHistory;
    if (document.contains("history") && !document.at("history").is_null()) {
        const nlohmann::json &history = document.at("history");
        if (!history.is_array()) {
            throw StoreFormatError(QStringLiteral("Invalid file format: \"history\" is not a list"));}
        for (const auto &link : history) {
            if (!link.is_string()) {
                throw StoreFormatError(QStringLiteral("Invalid file format: history entry is not a string"));}
            incomingHistory.append(jsonString(link));}}

    ImportResult result;
    for (const FavoriteEntry &fav : incomingFavorites) {
        if (m_favorites.contains(fav)) continue;
        m_favorites.append(fav);
        ++result.favoritesAdded;}
    for (const QString &link : incomingHistory) {
        if (m_history.contains(link)) continue;
        m_history.append(link);
        ++result.historyAdded;}
    qInfo() << "Import added" << result.favoritesAdded << "favorites and" << result.historyAdded << "history entries";
    if (result.favoritesAdded > 0) emit favoritesChanged();
    if (result.historyAdded > 0) emit historyChanged();
    try {
        persist();
    } catch (const StoreIoError &e) {
        throw ImportSaveError(result, QString::fromUtf8(e.what()));}
    return result;}

ImportResult DeeplinkStore::importFromFile(const QString &path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        throw StoreIoError(QString("Cannot read file: %1\n%2").arg(path, f.errorString()));}
    const QByteArray data = f.readAll();
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(data.constBegin(), data.constEnd());
    } catch (const nlohmann::json::exception &e) {
        throw StoreFormatError(QString("Cannot parse JSON file: %1\nError: %2").arg(path, QString::fromUtf8(e.what())));}
    return importAndMerge(document);}

void DeeplinkStore::persist() {
    if (!m_backend) return;
    m_backend->save(toJson().dump(2));}

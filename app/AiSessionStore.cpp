#include "AiSessionStore.hpp"
#include "AppLogging.hpp"
#include "opendir/ConfigPaths.hpp"

#include <QDateTime>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>

#include <system_error>

namespace opendir {

namespace fs = std::filesystem;

AiSessionStore::AiSessionStore() : dir_(aiSessionsDir()) {}

AiSessionStore::AiSessionStore(fs::path dir) : dir_(std::move(dir)) {}

bool AiSessionStore::save(const AiSession &session, std::string &err) const {
    if (!isValidSessionId(session.session_id)) {
        err = "Invalid session ID format";
        return false;
    }
    if (!ensurePrivateDirectory(dir_, err))
        return false;

    QJsonArray items;
    for (const auto &item : session.history) {
        QJsonObject o;
        o["tag"] = QString::fromLatin1(historyTagName(item.tag));
        o["content"] = QString::fromStdString(item.content);
        items.append(o);
    }
    QJsonObject root;
    root["session_id"] = QString::fromStdString(session.session_id);
    root["current_path"] = QString::fromStdString(session.current_path);
    root["history"] = items;
    root["saved_at"] = QDateTime::currentDateTimeUtc().toString(Qt::ISODate);

    const fs::path file = dir_ / (session.session_id + ".json");
    QSaveFile out(QString::fromStdString(file.string()));
    if (!out.open(QIODevice::WriteOnly)) {
        err = "Failed to write session '" + file.string() +
              "': " + out.errorString().toStdString();
        return false;
    }
    out.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!out.commit()) {
        err = "Failed to write session '" + file.string() +
              "': " + out.errorString().toStdString();
        return false;
    }
    qCDebug(odAi) << "Saved session with" << session.history.size() << "items";
    return true;
}

bool AiSessionStore::load(const fs::path &file, AiSession &out,
                          std::string &err) const {
    QFile in(QString::fromStdString(file.string()));
    if (!in.open(QIODevice::ReadOnly)) {
        err = "Failed to read session '" + file.string() +
              "': " + in.errorString().toStdString();
        return false;
    }
    QJsonParseError perr{};
    const QJsonDocument doc = QJsonDocument::fromJson(in.readAll(), &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
        err = "Invalid session file '" + file.string() +
              "': " + perr.errorString().toStdString();
        return false;
    }
    const QJsonObject root = doc.object();
    AiSession s;
    s.session_id = root.value("session_id").toString().toStdString();
    s.current_path = root.value("current_path").toString().toStdString();
    if (!isValidSessionId(s.session_id)) {
        err = "Invalid session ID in '" + file.string() + "'";
        return false;
    }
    for (const auto &v : root.value("history").toArray()) {
        const QJsonObject o = v.toObject();
        HistoryItem item;
        if (!parseHistoryTag(o.value("tag").toString().toStdString(), item.tag))
            continue;
        item.content = o.value("content").toString().toStdString();
        s.history.push_back(std::move(item));
    }
    if (s.history.size() > kMaxHistoryItems)
        s.history.erase(s.history.begin(),
                        s.history.end() - long(kMaxHistoryItems));
    out = std::move(s);
    return true;
}

bool AiSessionStore::restoreLatest(const std::string &path, AiSession &out,
                                   std::string &err) const {
    std::error_code ec;
    if (!fs::is_directory(dir_, ec))
        return false;

    fs::file_time_type bestTime{};
    bool found = false;
    fs::directory_iterator it(dir_, ec), end;
    if (ec) {
        err = "Failed to read dir '" + dir_.string() + "': " + ec.message();
        return false;
    }
    for (; !ec && it != end; it.increment(ec)) {
        const fs::path file = it->path();
        if (file.extension() != ".json")
            continue;
        std::error_code tec;
        const auto mtime = fs::last_write_time(file, tec);
        if (tec || (found && mtime <= bestTime))
            continue;
        AiSession candidate;
        std::string loadErr;
        if (!load(file, candidate, loadErr)) {
            qCWarning(odAi) << "Skipping session file:"
                            << QString::fromStdString(loadErr);
            continue;
        }
        if (candidate.current_path != path)
            continue;
        out = std::move(candidate);
        bestTime = mtime;
        found = true;
    }
    if (found)
        qCInfo(odAi) << "Restored session with" << out.history.size()
                     << "items";
    return found;
}

} // namespace opendir

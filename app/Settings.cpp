#include "Settings.hpp"
#include "AppLogging.hpp"
#include "CredentialCodec.hpp"
#include "opendir/ConfigPaths.hpp"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>

#include <cstdlib>

namespace opendir {

namespace {

constexpr int kDefaultPanelCount = 2;

QString qs(const std::string &s) { return QString::fromStdString(s); }
std::string ss(const QString &s) { return s.toStdString(); }

QJsonObject profileToJson(const RemoteProfile &p) {
    QJsonObject auth;
    if (p.auth.kind == RemoteAuth::Kind::Password) {
        auth["type"] = "password";
        auth["password"] = obfuscate(qs(p.auth.password));
    } else {
        auth["type"] = "key_file";
        auth["path"] = qs(p.auth.key_path);
        if (p.auth.passphrase)
            auth["passphrase"] = obfuscate(qs(*p.auth.passphrase));
    }
    QJsonObject o;
    o["name"] = qs(p.name);
    o["host"] = qs(p.host);
    o["port"] = int(p.port);
    o["user"] = qs(p.user);
    o["auth"] = auth;
    o["default_path"] = qs(p.default_path);
    return o;
}

bool profileFromJson(const QJsonObject &o, RemoteProfile &p, QString &err) {
    p.name = ss(o.value("name").toString());
    p.host = ss(o.value("host").toString());
    p.user = ss(o.value("user").toString());
    p.default_path = ss(o.value("default_path").toString());
    const int port = o.value("port").toInt(kDefaultSshPort);
    p.port = (port > 0 && port <= 65535) ? std::uint16_t(port)
                                         : kDefaultSshPort;
    if (p.host.empty() || p.user.empty()) {
        err = QStringLiteral("Remote profile without host or user");
        return false;
    }

    const QJsonObject auth = o.value("auth").toObject();
    if (auth.value("type").toString() == QLatin1String("key_file")) {
        std::optional<std::string> passphrase;
        if (auth.contains("passphrase"))
            passphrase = ss(deobfuscate(auth.value("passphrase").toString()));
        p.auth = RemoteAuth::withKeyFile(ss(auth.value("path").toString()),
                                         passphrase);
    } else {
        p.auth = RemoteAuth::withPassword(
            ss(deobfuscate(auth.value("password").toString())));
    }
    return true;
}

QJsonObject panelToJson(const PanelSettings &p) {
    QJsonObject o;
    o["start_path"] =
        p.start_path ? QJsonValue(qs(*p.start_path)) : QJsonValue();
    o["sort_by"] = sortFieldName(p.sort_by);
    o["sort_order"] = sortOrderName(p.sort_order);
    return o;
}

PanelSettings panelFromJson(const QJsonObject &o) {
    PanelSettings p;
    const QJsonValue start = o.value("start_path");
    if (start.isString() && !start.toString().isEmpty())
        p.start_path = ss(start.toString());
    SortField field;
    if (parseSortField(ss(o.value("sort_by").toString()), field))
        p.sort_by = field;
    SortOrder order;
    if (parseSortOrder(ss(o.value("sort_order").toString()), order))
        p.sort_order = order;
    return p;
}

} // namespace

Settings Settings::defaults() {
    Settings s;
    s.panels.assign(kDefaultPanelCount, PanelSettings{});
    const std::string edit = "${EDITOR:-vi} {{FILEPATH}}";
    const std::string open = "@xdg-open {{FILEPATH}}";
    for (const char *ext : {"txt", "md", "log", "conf"})
        s.extension_handler[ext] = {edit};
    for (const char *ext : {"zip", "pdf", "png", "jpg", "jpeg", "gif"})
        s.extension_handler[ext] = {open};
    return s;
}

std::optional<std::string> Settings::effectiveTarPath() const {
    const char *env = std::getenv("OPENDIR_TAR");
    if (env && *env)
        return std::string(env);
    return tar_path;
}

const RemoteProfile *Settings::findProfile(const std::string &user,
                                           const std::string &host,
                                           std::uint16_t port) const {
    for (const auto &p : remote_profiles) {
        if (p.sameEndpoint(user, host, port))
            return &p;
    }
    return nullptr;
}

void Settings::upsertProfile(const RemoteProfile &profile) {
    for (auto &p : remote_profiles) {
        if (p.sameEndpoint(profile.user, profile.host, profile.port)) {
            p = profile;
            return;
        }
    }
    remote_profiles.push_back(profile);
}

bool Settings::operator==(const Settings &o) const {
    return theme_name == o.theme_name && tar_path == o.tar_path &&
           extension_handler == o.extension_handler &&
           bookmarked_path == o.bookmarked_path && panels == o.panels &&
           active_panel_index == o.active_panel_index &&
           diff_compare_method == o.diff_compare_method &&
           remote_profiles == o.remote_profiles;
}

QString settingsPath() {
    return qs((configRoot() / "settings.json").string());
}

bool loadSettings(const QString &path, Settings &out, QString &err) {
    out = Settings::defaults();
    QFile f(path);
    if (!f.exists())
        return true;
    if (!f.open(QIODevice::ReadOnly)) {
        err = QStringLiteral("Cannot read %1: %2").arg(path, f.errorString());
        return false;
    }
    QJsonParseError perr{};
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
        err = QStringLiteral("Invalid settings file %1: %2")
                  .arg(path, perr.errorString());
        return false;
    }
    const QJsonObject root = doc.object();

    const QString theme =
        root.value("theme").toObject().value("name").toString();
    if (!theme.isEmpty())
        out.theme_name = ss(theme);

    const QString tar = root.value("tar_path").toString();
    if (!tar.isEmpty())
        out.tar_path = ss(tar);

    if (root.contains("extension_handler")) {
        out.extension_handler.clear();
        const QJsonObject handlers = root.value("extension_handler").toObject();
        for (auto it = handlers.begin(); it != handlers.end(); ++it) {
            std::vector<std::string> cmds;
            for (const auto &v : it.value().toArray()) {
                if (v.isString())
                    cmds.push_back(ss(v.toString()));
            }
            if (!cmds.empty())
                out.extension_handler[ss(it.key().toLower())] = cmds;
        }
    }

    for (const auto &v : root.value("bookmarked_path").toArray()) {
        if (v.isString() && !v.toString().isEmpty())
            out.bookmarked_path.push_back(ss(v.toString()));
    }

    const QJsonArray panels = root.value("panels").toArray();
    if (!panels.isEmpty()) {
        out.panels.clear();
        for (const auto &v : panels)
            out.panels.push_back(panelFromJson(v.toObject()));
    }

    const int active = root.value("active_panel_index").toInt(0);
    out.active_panel_index =
        (active >= 0 && active < int(out.panels.size())) ? active : 0;

    CompareMethod method;
    if (parseCompareMethod(ss(root.value("diff_compare_method").toString()),
                           method))
        out.diff_compare_method = method;

    for (const auto &v : root.value("remote_profiles").toArray()) {
        RemoteProfile p;
        QString perr2;
        if (profileFromJson(v.toObject(), p, perr2))
            out.remote_profiles.push_back(p);
        else
            qCWarning(odConfig) << "Skipping remote profile:" << perr2;
    }
    return true;
}

bool saveSettings(const QString &path, const Settings &settings, QString &err) {
    std::string dirErr;
    if (!ensurePrivateDirectory(std::filesystem::path(ss(path)).parent_path(),
                                dirErr)) {
        err = qs(dirErr);
        return false;
    }

    QJsonObject root;
    root["theme"] = QJsonObject{{"name", qs(settings.theme_name)}};
    if (settings.tar_path)
        root["tar_path"] = qs(*settings.tar_path);

    QJsonObject handlers;
    for (const auto &kv : settings.extension_handler) {
        QJsonArray cmds;
        for (const auto &c : kv.second)
            cmds.append(qs(c));
        handlers[qs(kv.first)] = cmds;
    }
    root["extension_handler"] = handlers;

    QJsonArray bookmarks;
    for (const auto &b : settings.bookmarked_path)
        bookmarks.append(qs(b));
    root["bookmarked_path"] = bookmarks;

    QJsonArray panels;
    for (const auto &p : settings.panels)
        panels.append(panelToJson(p));
    root["panels"] = panels;
    root["active_panel_index"] = settings.active_panel_index;
    root["diff_compare_method"] =
        compareMethodName(settings.diff_compare_method);

    QJsonArray profiles;
    for (const auto &p : settings.remote_profiles)
        profiles.append(profileToJson(p));
    root["remote_profiles"] = profiles;

    QSaveFile f(path);
    if (!f.open(QIODevice::WriteOnly)) {
        err = QStringLiteral("Cannot write %1: %2").arg(path, f.errorString());
        return false;
    }
    const QByteArray data = QJsonDocument(root).toJson(QJsonDocument::Indented);
    if (f.write(data) != data.size()) {
        err = QStringLiteral("Cannot write %1: %2").arg(path, f.errorString());
        f.cancelWriting();
        return false;
    }
    if (!f.commit()) {
        err = QStringLiteral("Cannot save %1: %2").arg(path, f.errorString());
        return false;
    }
    if (!QFile::setPermissions(path,
                               QFileDevice::ReadOwner | QFileDevice::WriteOwner))
        qCWarning(odConfig) << "Cannot restrict permissions of" << path;
    qCInfo(odConfig) << "Settings saved to" << path;
    return true;
}

} // namespace opendir

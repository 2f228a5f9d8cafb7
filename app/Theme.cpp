#include "Theme.hpp"
#include "AppLogging.hpp"
#include "Settings.hpp"
#include "opendir/ConfigPaths.hpp"

#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>

namespace opendir {

namespace {

// Order matches themeColorKeys().
struct Palette {
    const char *name;
    int values[17];
};

const Palette kPalettes[] = {
    {"dark",
     {252, 235, 236, 117, 81, 214, 250, 203, 71, 75, 237, 252, 245, 114, 221, 176, 110}},
    {"light",
     {235, 255, 252, 25, 31, 130, 238, 160, 28, 26, 254, 235, 244, 28, 136, 90, 24}},
    {"dawn_of_coding",
     {223, 234, 237, 180, 109, 208, 187, 167, 108, 142, 235, 223, 243, 108, 214, 175, 109}},
};

const Palette *findPalette(const std::string &name) {
    for (const auto &p : kPalettes) {
        if (name == p.name)
            return &p;
    }
    return nullptr;
}

} // namespace

const std::vector<std::string> &themeColorKeys() {
    static const std::vector<std::string> keys = {
        "panel_fg",     "panel_bg",      "selected_bg",  "directory_fg",
        "symlink_fg",   "marked_fg",     "status_fg",    "error_fg",
        "progress_fg",  "header_fg",     "dialog_bg",    "dialog_fg",
        "border_fg",    "diff_added_fg", "diff_changed_fg", "ai_user_fg",
        "ai_assistant_fg"};
    return keys;
}

int ThemeColors::color(const std::string &key) const {
    auto it = colors.find(key);
    return it == colors.end() ? -1 : it->second;
}

bool isBuiltinTheme(const std::string &name) {
    return findPalette(name) != nullptr;
}

ThemeColors builtinTheme(const std::string &name) {
    const Palette *p = findPalette(name);
    if (!p)
        p = findPalette(kDefaultThemeName);
    ThemeColors t;
    t.name = p->name;
    const auto &keys = themeColorKeys();
    for (std::size_t i = 0; i < keys.size(); ++i)
        t.colors[keys[i]] = p->values[i];
    return t;
}

QString themeFilePath(const std::string &name) {
    return QString::fromStdString((themesDir() / (name + ".json")).string());
}

bool loadTheme(const std::string &name, ThemeColors &out, QString &err) {
    ThemeColors theme = builtinTheme(name);
    theme.name = name;
    QFile f(themeFilePath(name));
    if (!f.exists()) {
        if (!isBuiltinTheme(name)) {
            qCWarning(odConfig) << "Unknown theme" << QString::fromStdString(name)
                                << "- using" << kDefaultThemeName;
            theme.name = kDefaultThemeName;
        }
        out = theme;
        return true;
    }
    if (!f.open(QIODevice::ReadOnly)) {
        err = QStringLiteral("Cannot read theme %1: %2")
                  .arg(f.fileName(), f.errorString());
        return false;
    }
    QJsonParseError perr{};
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
        err = QStringLiteral("Invalid theme %1: %2")
                  .arg(f.fileName(), perr.errorString());
        return false;
    }
    const QJsonObject colors = doc.object().value("colors").toObject();
    for (auto it = colors.begin(); it != colors.end(); ++it) {
        const int v = it.value().toInt(-2);
        if (v >= -1 && v <= 255)
            theme.colors[it.key().toStdString()] = v;
    }
    out = theme;
    return true;
}

ThemeWatcher::ThemeWatcher(std::string name) : name_(std::move(name)) {
    lastModified_ = QFileInfo(themeFilePath(name_)).lastModified();
}

bool ThemeWatcher::poll(ThemeColors &colors, QString &err) {
    const QDateTime modified = QFileInfo(themeFilePath(name_)).lastModified();
    if (modified == lastModified_)
        return false;
    lastModified_ = modified;
    if (!loadTheme(name_, colors, err))
        return false;
    qCInfo(odConfig) << "Theme reloaded:" << QString::fromStdString(name_);
    return true;
}

} // namespace opendir

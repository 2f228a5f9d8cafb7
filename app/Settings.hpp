// settings.json model. Read with QJsonDocument, written through QSaveFile.
#pragma once

#include "FileItem.hpp"
#include "opendir/DirDiff.hpp"
#include "opendir/SftpTypes.hpp"

#include <QString>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace opendir {

inline constexpr const char *kDefaultThemeName = "dawn_of_coding";

struct PanelSettings {
    std::optional<std::string> start_path;
    SortField sort_by = SortField::Name;
    SortOrder sort_order = SortOrder::Asc;

    bool operator==(const PanelSettings &o) const {
        return start_path == o.start_path && sort_by == o.sort_by &&
               sort_order == o.sort_order;
    }
};

struct Settings {
    std::string theme_name = kDefaultThemeName;
    std::optional<std::string> tar_path;
    // extension (lower case, no dot) -> command templates tried in order
    std::map<std::string, std::vector<std::string>> extension_handler;
    std::vector<std::string> bookmarked_path;
    std::vector<PanelSettings> panels;
    int active_panel_index = 0;
    CompareMethod diff_compare_method = CompareMethod::Content;
    std::vector<RemoteProfile> remote_profiles;

    static Settings defaults();

    // OPENDIR_TAR wins over tar_path.
    std::optional<std::string> effectiveTarPath() const;

    const RemoteProfile *findProfile(const std::string &user,
                                     const std::string &host,
                                     std::uint16_t port) const;
    void upsertProfile(const RemoteProfile &profile);

    bool operator==(const Settings &o) const;
    bool operator!=(const Settings &o) const { return !(*this == o); }
};

QString settingsPath();

// A missing file yields defaults and true. Unknown keys are ignored and
// invalid values fall back to their defaults.
bool loadSettings(const QString &path, Settings &out, QString &err);
bool saveSettings(const QString &path, const Settings &settings, QString &err);

} // namespace opendir

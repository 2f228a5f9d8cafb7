// Named 256-color indices used by the frontend, loaded from
// themes/{name}.json over a built-in base.
#pragma once

#include <QDateTime>
#include <QString>

#include <map>
#include <string>
#include <vector>

namespace opendir {

struct ThemeColors {
    std::string name;
    std::map<std::string, int> colors;

    // -1 (terminal default) for unknown keys.
    int color(const std::string &key) const;
};

// Keys every theme defines.
const std::vector<std::string> &themeColorKeys();

bool isBuiltinTheme(const std::string &name);
ThemeColors builtinTheme(const std::string &name); // falls back to dawn_of_coding

QString themeFilePath(const std::string &name);

// Falls back to the built-in theme of the same name (or dawn_of_coding) when
// no file exists. A malformed file is an error and leaves out untouched.
bool loadTheme(const std::string &name, ThemeColors &out, QString &err);

// Tracks the active theme file for --design hot reload.
class ThemeWatcher {
public:
    explicit ThemeWatcher(std::string name);
    // True when the file changed since the last call and was reloaded.
    bool poll(ThemeColors &colors, QString &err);

private:
    std::string name_;
    QDateTime lastModified_;
};

} // namespace opendir

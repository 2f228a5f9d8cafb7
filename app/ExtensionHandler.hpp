// Opens files with the command templates configured per extension.
#pragma once

#include "Frontend.hpp"

#include <QString>

#include <map>
#include <string>
#include <vector>

namespace opendir {

using HandlerMap = std::map<std::string, std::vector<std::string>>;

// Single-quoted for sh.
std::string shellQuote(const std::string &text);

// Lower case, no dot; "" when the name has no extension.
std::string extensionOf(const std::string &fileName);

// Replaces every {{FILEPATH}} with the quoted path.
std::string expandTemplate(const std::string &tmpl, const std::string &path);

// The sh -c script that decodes a base64 command with `self --base64`.
QString wrappedShellScript(const QString &selfExe, const std::string &command);

struct HandlerLaunch {
    bool handled = false;   // a template ran successfully
    bool background = false;
    std::string command;    // the template that ran
};

class ExtensionHandler {
public:
    ExtensionHandler(HandlerMap handlers, QString selfExe);

    bool hasHandler(const std::string &path) const;

    // Templates are tried in order until one succeeds. Foreground commands
    // run with the frontend suspended. False with err when none worked.
    bool open(const std::string &path, Frontend *frontend, HandlerLaunch &out,
              std::string &err) const;

private:
    HandlerMap handlers_;
    QString selfExe_;

    bool runForeground(const std::string &command, Frontend *frontend,
                       std::string &err) const;
    bool runBackground(const std::string &command, std::string &err) const;
};

} // namespace opendir

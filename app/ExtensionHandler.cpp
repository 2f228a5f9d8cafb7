#include "ExtensionHandler.hpp"
#include "AppLogging.hpp"

#include <QProcess>

#include <cctype>

namespace opendir {

namespace {

const char *const kPlaceholder = "{{FILEPATH}}";

} // namespace

std::string shellQuote(const std::string &text) {
    std::string out = "'";
    for (char c : text) {
        if (c == '\'')
            out += "'\\''";
        else
            out += c;
    }
    out += '\'';
    return out;
}

std::string extensionOf(const std::string &fileName) {
    const auto dot = fileName.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == fileName.size())
        return {};
    std::string ext = fileName.substr(dot + 1);
    for (auto &c : ext)
        c = char(std::tolower(static_cast<unsigned char>(c)));
    return ext;
}

std::string expandTemplate(const std::string &tmpl, const std::string &path) {
    const std::string quoted = shellQuote(path);
    const std::size_t len = std::char_traits<char>::length(kPlaceholder);
    std::string out;
    std::size_t pos = 0;
    for (;;) {
        const auto hit = tmpl.find(kPlaceholder, pos);
        if (hit == std::string::npos)
            break;
        out.append(tmpl, pos, hit - pos);
        out += quoted;
        pos = hit + len;
    }
    out.append(tmpl, pos, std::string::npos);
    return out;
}

QString wrappedShellScript(const QString &selfExe, const std::string &command) {
    const QByteArray b64 = QByteArray::fromStdString(command).toBase64();
    return QStringLiteral("eval \"$(%1 --base64 %2)\"")
        .arg(QString::fromStdString(shellQuote(selfExe.toStdString())),
             QString::fromLatin1(b64));
}

ExtensionHandler::ExtensionHandler(HandlerMap handlers, QString selfExe)
    : handlers_(std::move(handlers)), selfExe_(std::move(selfExe)) {}

bool ExtensionHandler::hasHandler(const std::string &path) const {
    const auto it = handlers_.find(extensionOf(path));
    return it != handlers_.end() && !it->second.empty();
}

bool ExtensionHandler::runForeground(const std::string &command,
                                     Frontend *frontend,
                                     std::string &err) const {
    SuspendGuard guard(frontend);
    QProcess proc;
    proc.setProcessChannelMode(QProcess::ForwardedChannels);
    proc.setInputChannelMode(QProcess::ForwardedInputChannel);
    proc.start(QStringLiteral("sh"),
               {QStringLiteral("-c"), wrappedShellScript(selfExe_, command)});
    if (!proc.waitForStarted()) {
        err = "Failed to start shell: " + proc.errorString().toStdString();
        return false;
    }
    proc.waitForFinished(-1);
    if (proc.exitStatus() != QProcess::NormalExit || proc.exitCode() != 0) {
        err = "Command failed: " + command;
        return false;
    }
    return true;
}

bool ExtensionHandler::runBackground(const std::string &command,
                                     std::string &err) const {
    QProcess proc;
    proc.setProgram(QStringLiteral("sh"));
    proc.setArguments(
        {QStringLiteral("-c"), wrappedShellScript(selfExe_, command)});
    proc.setStandardInputFile(QProcess::nullDevice());
    proc.setStandardOutputFile(QProcess::nullDevice());
    proc.setStandardErrorFile(QProcess::nullDevice());
    if (!proc.startDetached()) {
        err = "Failed to start: " + command;
        return false;
    }
    return true;
}

bool ExtensionHandler::open(const std::string &path, Frontend *frontend,
                            HandlerLaunch &out, std::string &err) const {
    const std::string ext = extensionOf(path);
    const auto it = handlers_.find(ext);
    if (it == handlers_.end() || it->second.empty()) {
        err = ext.empty() ? "No handler for files without extension"
                          : "No handler for ." + ext;
        return false;
    }
    for (const auto &tmpl : it->second) {
        const bool background = !tmpl.empty() && tmpl.front() == '@';
        const std::string command =
            expandTemplate(background ? tmpl.substr(1) : tmpl, path);
        std::string runErr;
        const bool ok = background ? runBackground(command, runErr)
                                   : runForeground(command, frontend, runErr);
        if (ok) {
            qCDebug(odConfig) << "Opened with handler for" << ext.c_str()
                              << (background ? "(background)" : "");
            out = HandlerLaunch{true, background, command};
            return true;
        }
        err = runErr;
        qCWarning(odConfig) << "Handler failed:" << redacted(runErr);
    }
    return false;
}

} // namespace opendir

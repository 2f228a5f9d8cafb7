#include "App.hpp"
#include "AppLogging.hpp"
#include "ClaudeCliProvider.hpp"
#include "Settings.hpp"
#include "TerminalFrontend.hpp"
#include "VersionCheck.hpp"
#include "opendir/Libssh2SftpClient.hpp"

#include <QByteArray>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFile>

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

using namespace opendir;

namespace {

int decodeBase64(const QString &text) {
    const auto decoded = QByteArray::fromBase64Encoding(
        text.toLatin1(), QByteArray::AbortOnBase64DecodingErrors);
    if (!decoded) {
        std::fprintf(stderr, "opendir: invalid base64 input\n");
        return 1;
    }
    const QByteArray &bytes = decoded.decoded;
    std::fwrite(bytes.constData(), 1, static_cast<std::size_t>(bytes.size()),
                stdout);
    return 0;
}

int runPrompt(const QString &text) {
    const std::string cwd = QFile::encodeName(QDir::currentPath()).toStdString();
    ClaudeCliProvider provider;
    AiRequest request;
    request.prompt = buildContextPrompt(cwd, text.toStdString());
    request.working_dir = cwd;
    std::string out;
    std::string err;
    if (!provider.runOnce(request, out, err)) {
        std::fprintf(stderr, "%s\n", err.c_str());
        return 1;
    }
    std::printf("%s\n", out.c_str());
    return 0;
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication qapp(argc, argv);
    QCoreApplication::setApplicationName("opendir");
    QCoreApplication::setApplicationVersion(currentVersion());

    QCommandLineParser parser;
    parser.setApplicationDescription("Multi-panel terminal file manager");
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption promptOpt(
        "prompt", "Send TEXT to the AI assistant, print the answer and exit.",
        "TEXT");
    const QCommandLineOption base64Opt(
        "base64", "Decode TEXT from base64 to stdout (used by handlers).",
        "TEXT");
    const QCommandLineOption designOpt("design", "Reload the theme file on change.");
    parser.addOption(promptOpt);
    parser.addOption(base64Opt);
    parser.addOption(designOpt);
    parser.addPositionalArgument("paths", "Up to 10 start directories.",
                                 "[PATH...]");
    parser.process(qapp);

    if (parser.isSet(base64Opt))
        return decodeBase64(parser.value(base64Opt));

    installLogSink();

    if (parser.isSet(promptOpt))
        return runPrompt(parser.value(promptOpt));

    std::vector<std::string> paths;
    for (const QString &p : parser.positionalArguments()) {
        if (paths.size() == kMaxPanels) {
            std::fprintf(stderr, "opendir: at most %zu paths, ignoring the rest\n",
                         kMaxPanels);
            break;
        }
        paths.push_back(QFile::encodeName(p).toStdString());
    }

    const QString settingsFile = settingsPath();
    Settings settings = Settings::defaults();
    QString err;
    if (!loadSettings(settingsFile, settings, err)) {
        qCWarning(odConfig) << "Settings not loaded, using defaults:" << err;
        settings = Settings::defaults();
    }

    TerminalFrontend frontend;
    std::string terr;
    if (!frontend.start(terr)) {
        std::fprintf(stderr, "opendir: %s\n", terr.c_str());
        return 1;
    }

    AppOptions options;
    options.design_mode = parser.isSet(designOpt);
    options.settings_path = settingsFile;
    options.self_exe = QCoreApplication::applicationFilePath();

    {
        App app(std::move(settings), std::move(paths), &frontend,
                [] { return std::make_unique<Libssh2SftpClient>(); },
                std::make_unique<ClaudeCliProvider>(), options);
        app.run();
    }
    frontend.suspend();

    if (const auto newer = fetchNewerVersion())
        std::printf("A new opendir release is available: %s (installed %s)\n",
                    newer->c_str(), currentVersion());
    return 0;
}

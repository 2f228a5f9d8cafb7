#include "AppLogging.hpp"
#include "opendir/ConfigPaths.hpp"
#include "opendir/RuntimeLogging.hpp"

#include <QDateTime>
#include <QFile>
#include <QMutex>
#include <QMutexLocker>
#include <QTextStream>

Q_LOGGING_CATEGORY(odXfer, "opendir.transfer")
Q_LOGGING_CATEGORY(odRemote, "opendir.remote")
Q_LOGGING_CATEGORY(odAi, "opendir.ai")
Q_LOGGING_CATEGORY(odConfig, "opendir.config")

namespace opendir {

namespace {

QMutex g_logMutex;
QString g_logPath;

const char *levelName(QtMsgType type) {
    switch (type) {
    case QtDebugMsg:
        return "debug";
    case QtInfoMsg:
        return "info";
    case QtWarningMsg:
        return "warning";
    case QtCriticalMsg:
        return "critical";
    case QtFatalMsg:
        return "fatal";
    }
    return "info";
}

void fileMessageHandler(QtMsgType type, const QMessageLogContext &ctx,
                        const QString &msg) {
    QMutexLocker lock(&g_logMutex);
    QFile f(g_logPath);
    if (!f.open(QIODevice::Append | QIODevice::Text))
        return;
    QTextStream out(&f);
    out << QDateTime::currentDateTime().toString(Qt::ISODateWithMs) << ' '
        << levelName(type) << ' ' << (ctx.category ? ctx.category : "default")
        << ": " << msg << '\n';
}

} // namespace

void installLogSink() {
    std::string err;
    const auto root = configRoot();
    if (!ensurePrivateDirectory(root, err))
        return; // Qt's default handler stays in place
    g_logPath = QString::fromStdString((root / "opendir.log").string());
    qInstallMessageHandler(fileMessageHandler);
    if (debugLoggingEnabled())
        QLoggingCategory::setFilterRules(QStringLiteral("opendir.*.debug=true"));
}

QString redacted(const QString &value) {
    return sensitiveLoggingEnabled() ? value : QStringLiteral("<redacted>");
}

QString redacted(const std::string &value) {
    return redacted(QString::fromStdString(value));
}

} // namespace opendir

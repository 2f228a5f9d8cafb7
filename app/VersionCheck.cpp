#include "VersionCheck.hpp"
#include "AppLogging.hpp"

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QRegularExpression>
#include <QStringList>
#include <QTimer>
#include <QUrl>

#include <algorithm>
#include <cstdlib>

#ifndef OPENDIR_VERSION
#define OPENDIR_VERSION "0.0.0"
#endif

namespace opendir {

namespace {

const char *const kDefaultManifestUrl =
    "https://raw.githubusercontent.com/opendir/opendir/main/version.toml";

} // namespace

const char *currentVersion() { return OPENDIR_VERSION; }

bool parseManifestVersion(const QByteArray &manifest, std::string &version) {
    static const QRegularExpression re(
        QStringLiteral("^\\s*version\\s*=\\s*\"([0-9]+(?:\\.[0-9]+)*)\""),
        QRegularExpression::MultilineOption);
    const QRegularExpressionMatch m = re.match(QString::fromUtf8(manifest));
    if (!m.hasMatch())
        return false;
    version = m.captured(1).toStdString();
    return true;
}

int compareVersions(const std::string &a, const std::string &b) {
    const QStringList pa = QString::fromStdString(a).split('.');
    const QStringList pb = QString::fromStdString(b).split('.');
    const int n = std::max(pa.size(), pb.size());
    for (int i = 0; i < n; ++i) {
        const int va = i < pa.size() ? pa[i].toInt() : 0;
        const int vb = i < pb.size() ? pb[i].toInt() : 0;
        if (va != vb)
            return va < vb ? -1 : 1;
    }
    return 0;
}

QString manifestUrl() {
    const char *env = std::getenv("OPENDIR_UPDATE_URL");
    if (env && *env)
        return QString::fromUtf8(env);
    return QString::fromLatin1(kDefaultManifestUrl);
}

std::optional<std::string> fetchNewerVersion(int timeoutMs) {
    QNetworkAccessManager nam;
    QNetworkRequest request{QUrl(manifestUrl())};
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);
    QNetworkReply *reply = nam.get(request);

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    timer.start(timeoutMs);
    loop.exec();

    if (!reply->isFinished()) {
        qCDebug(odConfig) << "Version check timed out";
        reply->abort();
        reply->deleteLater();
        return std::nullopt;
    }
    if (reply->error() != QNetworkReply::NoError) {
        qCDebug(odConfig) << "Version check failed:" << reply->errorString();
        reply->deleteLater();
        return std::nullopt;
    }
    const QByteArray body = reply->readAll();
    reply->deleteLater();

    std::string latest;
    if (!parseManifestVersion(body, latest)) {
        qCDebug(odConfig) << "Version check: no version line";
        return std::nullopt;
    }
    if (compareVersions(latest, currentVersion()) > 0)
        return latest;
    return std::nullopt;
}

} // namespace opendir

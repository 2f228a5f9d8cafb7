#include "CredentialCodec.hpp"
#include "AppLogging.hpp"

#include <QByteArray>
#include <QStringDecoder>

namespace opendir {

namespace {

// Shared with settings files written by earlier releases; changing it makes
// every stored password unreadable.
const QByteArray &obfuscationKey() {
    static const QByteArray key("cokacdir_remote_v1_key");
    return key;
}

QByteArray xorWithKey(const QByteArray &in) {
    const QByteArray &key = obfuscationKey();
    QByteArray out(in.size(), '\0');
    for (int i = 0; i < in.size(); ++i)
        out[i] = static_cast<char>(in[i] ^ key[i % key.size()]);
    return out;
}

} // namespace

QString obfuscate(const QString &plain) {
    const QByteArray mixed = xorWithKey(plain.toUtf8());
    return QLatin1String(kObfuscatedPrefix) +
           QString::fromLatin1(mixed.toBase64());
}

QString deobfuscate(const QString &stored) {
    if (!stored.startsWith(QLatin1String(kObfuscatedPrefix)))
        return stored;
    const QByteArray encoded =
        stored.mid(int(qstrlen(kObfuscatedPrefix))).toLatin1();
    const auto decoded = QByteArray::fromBase64Encoding(
        encoded, QByteArray::AbortOnBase64DecodingErrors);
    if (!decoded) {
        qCWarning(odConfig) << "Stored credential is not valid base64; using it as is";
        return stored;
    }
    QStringDecoder toUtf16(QStringDecoder::Utf8);
    const QString plain = toUtf16(xorWithKey(*decoded));
    if (toUtf16.hasError()) {
        qCWarning(odConfig) << "Stored credential is not valid UTF-8; using it as is";
        return stored;
    }
    return plain;
}

} // namespace opendir

// Reversible obfuscation of stored credentials ("enc:" + base64 of XOR).
// Keeps secrets out of casual view in settings.json; it is not encryption.
#pragma once

#include <QString>

namespace opendir {

inline constexpr const char *kObfuscatedPrefix = "enc:";

QString obfuscate(const QString &plain);

// Unprefixed input is returned unchanged (older plaintext settings). A
// prefixed value that is not valid base64 or does not decode to UTF-8 is
// also returned as stored, so a hand-edited entry never drops its profile.
QString deobfuscate(const QString &stored);

} // namespace opendir

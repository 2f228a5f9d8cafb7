// Exit-time check for a newer release.
#pragma once

#include <QByteArray>
#include <QString>

#include <optional>
#include <string>

namespace opendir {

const char *currentVersion();

// First `version = "x.y.z"` line of a manifest.
bool parseManifestVersion(const QByteArray &manifest, std::string &version);

// Numeric, component-wise. Negative, zero or positive like strcmp.
int compareVersions(const std::string &a, const std::string &b);

// OPENDIR_UPDATE_URL overrides the built-in manifest location.
QString manifestUrl();

// Blocks for at most timeoutMs. The newer version, if any.
std::optional<std::string> fetchNewerVersion(int timeoutMs = 3000);

} // namespace opendir

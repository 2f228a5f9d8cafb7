// Logging categories of the app layer and the file sink installed by main.
#pragma once

#include <QLoggingCategory>
#include <QString>

#include <string>

Q_DECLARE_LOGGING_CATEGORY(odXfer)
Q_DECLARE_LOGGING_CATEGORY(odRemote)
Q_DECLARE_LOGGING_CATEGORY(odAi)
Q_DECLARE_LOGGING_CATEGORY(odConfig)

namespace opendir {

// Redirects Qt messages to <config root>/opendir.log; the terminal belongs to
// the frontend. Enables opendir.*.debug when OPENDIR_DEBUG is set.
void installLogSink();

// "<redacted>" unless sensitive logging is enabled.
QString redacted(const QString &value);
QString redacted(const std::string &value);

} // namespace opendir

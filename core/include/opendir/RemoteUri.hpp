// "user@host:/path" and "user@host:port:/path" as used by the goto dialog
// and bookmarks.
#pragma once

#include <cstdint>
#include <string>

namespace opendir {

struct RemoteUri {
    std::string user;
    std::string host;
    std::uint16_t port = 22;
    std::string path = "/";
};

bool looksLikeRemoteUri(const std::string &text);
bool parseRemoteUri(const std::string &text, RemoteUri &out, std::string &err);
std::string formatRemoteDisplay(const std::string &user,
                                const std::string &host, std::uint16_t port,
                                const std::string &path);

} // namespace opendir

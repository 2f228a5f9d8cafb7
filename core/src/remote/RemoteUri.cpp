#include "opendir/RemoteUri.hpp"

#include <cctype>
#include <stdexcept>

namespace opendir {

bool looksLikeRemoteUri(const std::string &text) {
    const auto at = text.find('@');
    if (at == std::string::npos || at == 0)
        return false;
    const auto colon = text.find(':', at);
    return colon != std::string::npos && colon > at + 1 && text[0] != '/';
}

bool parseRemoteUri(const std::string &text, RemoteUri &out,
                    std::string &err) {
    const auto at = text.find('@');
    if (at == std::string::npos) {
        err = "Missing user (expected user@host:/path)";
        return false;
    }
    RemoteUri uri;
    uri.user = text.substr(0, at);
    const std::string rest = text.substr(at + 1);
    const auto colon = rest.find(':');
    if (colon == std::string::npos) {
        err = "Missing ':' after host (expected user@host:/path)";
        return false;
    }
    uri.host = rest.substr(0, colon);
    std::string tail = rest.substr(colon + 1);
    if (uri.user.empty() || uri.host.empty()) {
        err = "User and host must not be empty";
        return false;
    }

    // Optional "port:" segment before the path.
    const auto second = tail.find(':');
    if (second != std::string::npos && tail[0] != '/') {
        const std::string portText = tail.substr(0, second);
        bool digits = !portText.empty();
        for (char c : portText)
            digits = digits && std::isdigit(static_cast<unsigned char>(c));
        if (!digits) {
            err = "Invalid port: " + portText;
            return false;
        }
        unsigned long port = 0;
        try {
            port = std::stoul(portText);
        } catch (const std::exception &) {
            err = "Invalid port: " + portText;
            return false;
        }
        if (port == 0 || port > 65535) {
            err = "Invalid port: " + portText;
            return false;
        }
        uri.port = static_cast<std::uint16_t>(port);
        tail = tail.substr(second + 1);
    }

    if (tail.empty())
        tail = "/";
    else if (tail[0] != '/')
        tail = "/" + tail;
    uri.path = tail;
    out = uri;
    return true;
}

std::string formatRemoteDisplay(const std::string &user,
                                const std::string &host, std::uint16_t port,
                                const std::string &path) {
    if (port == 22)
        return user + "@" + host + ":" + path;
    return user + "@" + host + ":" + std::to_string(port) + ":" + path;
}

} // namespace opendir

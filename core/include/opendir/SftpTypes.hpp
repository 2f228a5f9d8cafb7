// Remote-side value types: profiles, credentials, session options and
// directory entries. Plain structs so the app layer can copy them freely.
#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace opendir {

constexpr std::uint16_t kDefaultSshPort = 22;

// Host key verification against known_hosts.
enum class KnownHostsPolicy {
    Strict,    // exact match required
    AcceptNew, // trust on first use, reject changed keys
    Off        // no verification
};

struct SftpEntry {
    std::string name;
    bool is_dir = false;
    bool is_symlink = false;
    std::uint64_t size = 0;
    std::uint64_t mtime = 0; // epoch seconds
    std::uint32_t mode = 0;  // POSIX type + permission bits
};

// "rwxr-xr-x" from the permission bits of mode.
std::string permissionString(std::uint32_t mode);

struct RemoteAuth {
    enum class Kind { Password, KeyFile };

    Kind kind = Kind::Password;
    std::string password;
    std::string key_path;
    std::optional<std::string> passphrase;

    static RemoteAuth withPassword(std::string pw) {
        RemoteAuth a;
        a.kind = Kind::Password;
        a.password = std::move(pw);
        return a;
    }
    static RemoteAuth withKeyFile(std::string path,
                                  std::optional<std::string> pass = {}) {
        RemoteAuth a;
        a.kind = Kind::KeyFile;
        a.key_path = std::move(path);
        a.passphrase = std::move(pass);
        return a;
    }

    bool operator==(const RemoteAuth &o) const {
        return kind == o.kind && password == o.password &&
               key_path == o.key_path && passphrase == o.passphrase;
    }
};

struct RemoteProfile {
    std::string name;
    std::string host;
    std::uint16_t port = kDefaultSshPort;
    std::string user;
    RemoteAuth auth;
    std::string default_path;

    bool sameEndpoint(const std::string &u, const std::string &h,
                      std::uint16_t p) const {
        return user == u && host == h && port == p;
    }
    bool operator==(const RemoteProfile &o) const {
        return name == o.name && host == o.host && port == o.port &&
               user == o.user && auth == o.auth &&
               default_path == o.default_path;
    }
};

struct SessionOptions {
    std::string host;
    std::uint16_t port = kDefaultSshPort;
    std::string username;

    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    std::optional<std::string> known_hosts_path; // default ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::AcceptNew;

    // Asked for unknown hosts under AcceptNew; when unset the key is accepted.
    std::function<bool(const std::string &host, std::uint16_t port,
                       const std::string &algorithm,
                       const std::string &fingerprint)>
        hostkey_confirm_cb;
};

// Expands "~" in key paths.
SessionOptions sessionOptionsFor(const RemoteProfile &profile);

struct ConnectionStatus {
    bool connected = false;
    std::string reason;

    static ConnectionStatus Connected() { return {true, {}}; }
    static ConnectionStatus Disconnected(std::string why) {
        return {false, std::move(why)};
    }
};

} // namespace opendir

// libssh2 backend: TCP socket, SSH session and one SFTP channel.
// Keepalive, known_hosts verification and chunked transfers with cancel.
#include "opendir/Libssh2SftpClient.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

// POSIX sockets
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace opendir {

static std::once_flag g_libssh2_once;

namespace {

struct KbdIntCtx {
    const char *user;
    const char *pass;
};

char *dupResponse(const char *s, std::size_t len) {
    char *buf = static_cast<char *>(std::malloc(len + 1));
    if (!buf)
        return nullptr;
    std::memcpy(buf, s, len);
    buf[len] = '\0';
    return buf;
}

// Answers keyboard-interactive prompts: prompts mentioning "user"/"name"
// get the user name, everything else the password.
void kbintCallback(const char *, int, const char *, int, int num_prompts,
                   const LIBSSH2_USERAUTH_KBDINT_PROMPT *prompts,
                   LIBSSH2_USERAUTH_KBDINT_RESPONSE *responses,
                   void **abstract) {
    if (!abstract || !*abstract)
        return;
    const KbdIntCtx *ctx = static_cast<const KbdIntCtx *>(*abstract);
    for (int i = 0; i < num_prompts; ++i) {
        std::string prompt;
        if (prompts && prompts[i].text)
            prompt.assign(reinterpret_cast<const char *>(prompts[i].text),
                          prompts[i].length);
        for (char &c : prompt)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        const bool wantUser = prompt.find("user") != std::string::npos ||
                              prompt.find("name") != std::string::npos;
        const char *ans = wantUser ? ctx->user : ctx->pass;
        const std::size_t alen = ans ? std::strlen(ans) : 0;
        responses[i].text = alen ? dupResponse(ans, alen) : nullptr;
        responses[i].length =
            responses[i].text ? static_cast<unsigned int>(alen) : 0;
    }
}

std::string lastSessionError(LIBSSH2_SESSION *session) {
    char *msg = nullptr;
    int len = 0;
    (void)libssh2_session_last_error(session, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<std::size_t>(len))
                            : std::string();
}

std::string sftpCodeText(unsigned long code) {
    switch (code) {
    case LIBSSH2_FX_NO_SUCH_FILE:
    case LIBSSH2_FX_NO_SUCH_PATH:
        return "no such file or directory";
    case LIBSSH2_FX_PERMISSION_DENIED:
        return "permission denied";
    case LIBSSH2_FX_FILE_ALREADY_EXISTS:
        return "already exists";
    case LIBSSH2_FX_DIR_NOT_EMPTY:
        return "directory not empty";
    case LIBSSH2_FX_NOT_A_DIRECTORY:
        return "not a directory";
    case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM:
    case LIBSSH2_FX_QUOTA_EXCEEDED:
        return "no space left";
    case LIBSSH2_FX_CONNECTION_LOST:
    case LIBSSH2_FX_NO_CONNECTION:
        return "connection lost";
    default:
        return "SFTP error " + std::to_string(code);
    }
}

SftpEntry entryFromAttrs(const std::string &name,
                         const LIBSSH2_SFTP_ATTRIBUTES &attrs) {
    SftpEntry e;
    e.name = name;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
        e.mode = static_cast<std::uint32_t>(attrs.permissions);
        const auto type = attrs.permissions & LIBSSH2_SFTP_S_IFMT;
        e.is_dir = type == LIBSSH2_SFTP_S_IFDIR;
        e.is_symlink = type == LIBSSH2_SFTP_S_IFLNK;
    }
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE)
        e.size = attrs.filesize;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME)
        e.mtime = attrs.mtime;
    return e;
}

std::string fingerprint(LIBSSH2_SESSION *session) {
    const unsigned char *h = reinterpret_cast<const unsigned char *>(
        libssh2_hostkey_hash(session, LIBSSH2_HOSTKEY_HASH_SHA256));
    if (!h)
        return {};
    std::ostringstream oss;
    oss << "SHA256:";
    for (int i = 0; i < 32; ++i) {
        char b[4];
        std::snprintf(b, sizeof(b), "%02X", static_cast<unsigned>(h[i]));
        if (i)
            oss << ':';
        oss << b;
    }
    return oss.str();
}

} // namespace

Libssh2SftpClient::Libssh2SftpClient() {
    std::call_once(g_libssh2_once, [] { libssh2_init(0); });
}

Libssh2SftpClient::~Libssh2SftpClient() { disconnect(); }

bool Libssh2SftpClient::tcpConnect(const std::string &host,
                                   std::uint16_t port, std::string &err) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    addrinfo *res = nullptr;
    const int gai = ::getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err = "Cannot resolve '" + host + "': " + gai_strerror(gai);
        return false;
    }

    for (addrinfo *rp = res; rp != nullptr; rp = rp->ai_next) {
        const int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1)
            continue;
        int on = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));
#if defined(__linux__)
        int idle = 60, intvl = 10, cnt = kSshKeepaliveMaxFailures;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_ = s;
            ::freeaddrinfo(res);
            return true;
        }
        ::close(s);
    }
    ::freeaddrinfo(res);
    err = "Cannot connect to " + host + ":" + portStr;
    return false;
}

bool Libssh2SftpClient::verifyHostKey(const SessionOptions &opt,
                                      std::string &err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off)
        return true;

    LIBSSH2_KNOWNHOSTS *nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err = "Cannot initialize known_hosts";
        return false;
    }

    std::string khPath;
    if (opt.known_hosts_path.has_value()) {
        khPath = *opt.known_hosts_path;
    } else if (const char *home = std::getenv("HOME")) {
        khPath = std::string(home) + "/.ssh/known_hosts";
    }
    const bool loaded =
        !khPath.empty() &&
        libssh2_knownhost_readfile(nh, khPath.c_str(),
                                   LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0;
    if (!loaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err = "known_hosts missing or unreadable (strict policy)";
        return false;
    }

    std::size_t keylen = 0;
    int keytype = 0;
    const char *hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err = "Cannot read server host key";
        return false;
    }

    int alg = 0;
    std::string algName = "UNKNOWN";
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        alg = LIBSSH2_KNOWNHOST_KEY_SSHRSA;
        algName = "RSA";
        break;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
        algName = "ECDSA-256";
        break;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
        algName = "ECDSA-384";
        break;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
        algName = "ECDSA-521";
        break;
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        alg = LIBSSH2_KNOWNHOST_KEY_ED25519;
        algName = "ED25519";
        break;
    default:
        break;
    }

    libssh2_knownhost *found = nullptr;
    int check = libssh2_knownhost_checkp(
        nh, opt.host.c_str(), opt.port, hostkey, keylen,
        LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
        &found);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(
            nh, opt.host.c_str(), opt.port, hostkey, keylen,
            LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
            &found);
    }

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }
    if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        libssh2_knownhost_free(nh);
        err = "Host key for " + opt.host + " does not match known_hosts";
        return false;
    }
    if (opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err = "Unknown host " + opt.host + " (not in known_hosts)";
        return false;
    }

    // AcceptNew: trust on first use.
    if (opt.hostkey_confirm_cb &&
        !opt.hostkey_confirm_cb(opt.host, opt.port, algName,
                                fingerprint(session_))) {
        libssh2_knownhost_free(nh);
        err = "Host key for " + opt.host + " was not accepted";
        return false;
    }
    if (!khPath.empty()) {
        // An unwritable known_hosts does not block the session; the key is
        // simply offered again next time.
        const std::string entryHost =
            opt.port == kDefaultSshPort
                ? opt.host
                : "[" + opt.host + "]:" + std::to_string(opt.port);
        if (libssh2_knownhost_addc(
                nh, entryHost.c_str(), nullptr, hostkey, keylen, nullptr, 0,
                LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW |
                    alg,
                nullptr) == 0) {
            (void)libssh2_knownhost_writefile(nh, khPath.c_str(),
                                              LIBSSH2_KNOWNHOST_FILE_OPENSSH);
        }
    }
    libssh2_knownhost_free(nh);
    return true;
}

bool Libssh2SftpClient::authenticate(const SessionOptions &opt,
                                     std::string &err) {
    if (opt.private_key_path.has_value()) {
        const char *passphrase = opt.private_key_passphrase
                                     ? opt.private_key_passphrase->c_str()
                                     : nullptr;
        const int rc = libssh2_userauth_publickey_fromfile(
            session_, opt.username.c_str(), nullptr,
            opt.private_key_path->c_str(), passphrase);
        if (rc == 0)
            return true;
        if (rc == LIBSSH2_ERROR_AUTHENTICATION_FAILED ||
            rc == LIBSSH2_ERROR_PUBLICKEY_UNVERIFIED) {
            err = "Authentication rejected by server";
        } else {
            const std::string detail = lastSessionError(session_);
            err = "Key authentication failed for '" + *opt.private_key_path +
                  "'" + (detail.empty() ? "" : ": " + detail);
        }
        return false;
    }

    if (!opt.password.has_value()) {
        err = "No credentials configured";
        return false;
    }

    int rc = 0;
    do {
        rc = libssh2_userauth_password(session_, opt.username.c_str(),
                                       opt.password->c_str());
        if (rc == LIBSSH2_ERROR_EAGAIN)
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
    } while (rc == LIBSSH2_ERROR_EAGAIN);
    if (rc == 0)
        return true;
    if (rc == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
        rc == LIBSSH2_ERROR_SOCKET_SEND || rc == LIBSSH2_ERROR_SOCKET_RECV) {
        err = "Server closed the connection during authentication";
        return false;
    }

    // Servers that only offer keyboard-interactive.
    const char *methods = libssh2_userauth_list(
        session_, opt.username.c_str(),
        static_cast<unsigned>(opt.username.size()));
    if (methods && std::strstr(methods, "keyboard-interactive")) {
        KbdIntCtx ctx{opt.username.c_str(), opt.password->c_str()};
        void **abs = libssh2_session_abstract(session_);
        if (abs)
            *abs = &ctx;
        do {
            rc = libssh2_userauth_keyboard_interactive(
                session_, opt.username.c_str(), kbintCallback);
            if (rc == LIBSSH2_ERROR_EAGAIN)
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
        } while (rc == LIBSSH2_ERROR_EAGAIN);
        if (abs)
            *abs = nullptr;
        if (rc == 0)
            return true;
    }
    err = "Authentication rejected by server";
    return false;
}

bool Libssh2SftpClient::connect(const SessionOptions &opt, std::string &err) {
    if (connected_) {
        err = "Already connected";
        return false;
    }
    if (opt.host.empty() || opt.username.empty()) {
        err = "Host and user are required";
        return false;
    }
    if (!tcpConnect(opt.host, opt.port, err))
        return false;

    session_ = libssh2_session_init();
    if (!session_) {
        err = "libssh2_session_init failed";
        disconnect();
        return false;
    }
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, kSshAuthTimeoutSec * 1000L);
    if (libssh2_session_handshake(session_, sock_) != 0) {
        err = "SSH handshake failed: " + lastSessionError(session_);
        disconnect();
        return false;
    }
    libssh2_keepalive_config(session_, 1, kSshKeepaliveIntervalSec);

    if (!verifyHostKey(opt, err) || !authenticate(opt, err)) {
        disconnect();
        return false;
    }

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        err = "Cannot open SFTP subsystem: " + lastSessionError(session_);
        disconnect();
        return false;
    }
    libssh2_session_set_timeout(session_, kSshInactivityTimeoutSec * 1000L);
    keepaliveFailures_ = 0;
    connected_ = true;
    return true;
}

void Libssh2SftpClient::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
}

bool Libssh2SftpClient::ensureAlive(std::string &err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    int next = 0;
    if (libssh2_keepalive_send(session_, &next) != 0) {
        if (++keepaliveFailures_ >= kSshKeepaliveMaxFailures) {
            disconnect();
            err = "Not connected (keepalive failed)";
            return false;
        }
    } else {
        keepaliveFailures_ = 0;
    }
    return true;
}

std::string Libssh2SftpClient::sftpError(const std::string &what,
                                         const std::string &path) const {
    const unsigned long code = sftp_ ? libssh2_sftp_last_error(sftp_) : 0;
    std::string detail =
        code ? sftpCodeText(code) : lastSessionError(session_);
    if (detail.empty())
        detail = "unknown error";
    return what + " '" + path + "': " + detail;
}

bool Libssh2SftpClient::list(const std::string &remote_path,
                             std::vector<SftpEntry> &out, std::string &err) {
    if (!ensureAlive(err))
        return false;
    const std::string path = remote_path.empty() ? "/" : remote_path;
    LIBSSH2_SFTP_HANDLE *dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        err = sftpError("Failed to read dir", path);
        return false;
    }

    out.clear();
    char filename[1024];
    char longentry[2048];
    while (true) {
        LIBSSH2_SFTP_ATTRIBUTES attrs{};
        const int rc = libssh2_sftp_readdir_ex(dir, filename, sizeof(filename),
                                               longentry, sizeof(longentry),
                                               &attrs);
        if (rc == 0)
            break;
        if (rc < 0) {
            err = sftpError("Failed to read dir", path);
            libssh2_sftp_closedir(dir);
            return false;
        }
        const std::string name(filename, static_cast<std::size_t>(rc));
        if (name == "." || name == "..")
            continue;
        SftpEntry e = entryFromAttrs(name, attrs);
        if (e.is_symlink) {
            // Show links to directories as directories.
            LIBSSH2_SFTP_ATTRIBUTES target{};
            const std::string full = joinRemotePath(path, name);
            if (libssh2_sftp_stat_ex(sftp_, full.c_str(),
                                     static_cast<unsigned>(full.size()),
                                     LIBSSH2_SFTP_STAT, &target) == 0 &&
                (target.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)) {
                e.is_dir = (target.permissions & LIBSSH2_SFTP_S_IFMT) ==
                           LIBSSH2_SFTP_S_IFDIR;
            }
        }
        out.push_back(std::move(e));
    }
    libssh2_sftp_closedir(dir);
    return true;
}

bool Libssh2SftpClient::stat(const std::string &remote_path, SftpEntry &info,
                             std::string &err) {
    if (!ensureAlive(err))
        return false;
    LIBSSH2_SFTP_ATTRIBUTES st{};
    const int rc = libssh2_sftp_stat_ex(
        sftp_, remote_path.c_str(), static_cast<unsigned>(remote_path.size()),
        LIBSSH2_SFTP_STAT, &st);
    if (rc != 0) {
        const unsigned long code = libssh2_sftp_last_error(sftp_);
        if (code == LIBSSH2_FX_NO_SUCH_FILE || code == LIBSSH2_FX_NO_SUCH_PATH) {
            err.clear();
            return false;
        }
        err = sftpError("Failed to stat", remote_path);
        return false;
    }
    info = entryFromAttrs(remoteBaseName(remote_path), st);
    return true;
}

bool Libssh2SftpClient::realpath(const std::string &remote_path,
                                 std::string &out, std::string &err) {
    if (!ensureAlive(err))
        return false;
    char buf[4096];
    const int rc = libssh2_sftp_realpath(sftp_, remote_path.c_str(), buf,
                                         sizeof(buf));
    if (rc < 0) {
        err = sftpError("Failed to resolve", remote_path);
        return false;
    }
    out.assign(buf, static_cast<std::size_t>(rc));
    return true;
}

bool Libssh2SftpClient::mkdir(const std::string &remote_dir, std::string &err,
                              unsigned int mode) {
    if (!ensureAlive(err))
        return false;
    if (libssh2_sftp_mkdir(sftp_, remote_dir.c_str(), mode) != 0) {
        err = sftpError("Failed to create directory", remote_dir);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::createFile(const std::string &remote_path,
                                   std::string &err) {
    if (!ensureAlive(err))
        return false;
    LIBSSH2_SFTP_HANDLE *h = libssh2_sftp_open_ex(
        sftp_, remote_path.c_str(), static_cast<unsigned>(remote_path.size()),
        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_EXCL, 0644,
        LIBSSH2_SFTP_OPENFILE);
    if (!h) {
        err = sftpError("Failed to create file", remote_path);
        return false;
    }
    libssh2_sftp_close(h);
    return true;
}

bool Libssh2SftpClient::removeFile(const std::string &remote_path,
                                   std::string &err) {
    if (!ensureAlive(err))
        return false;
    if (libssh2_sftp_unlink(sftp_, remote_path.c_str()) != 0) {
        err = sftpError("Failed to delete", remote_path);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::removeDir(const std::string &remote_dir,
                                  std::string &err) {
    if (!ensureAlive(err))
        return false;
    if (libssh2_sftp_rmdir(sftp_, remote_dir.c_str()) != 0) {
        err = sftpError("Failed to remove directory", remote_dir);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::rename(const std::string &from, const std::string &to,
                               std::string &err) {
    if (!ensureAlive(err))
        return false;
    const long flags = LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE;
    if (libssh2_sftp_rename_ex(sftp_, from.c_str(),
                               static_cast<unsigned>(from.size()), to.c_str(),
                               static_cast<unsigned>(to.size()), flags) != 0) {
        err = sftpError("Failed to rename", from);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::get(const std::string &remote,
                            const std::string &local, std::string &err,
                            ProgressCB progress, CancelCB shouldCancel) {
    if (!ensureAlive(err))
        return false;

    LIBSSH2_SFTP_ATTRIBUTES st{};
    if (libssh2_sftp_stat_ex(sftp_, remote.c_str(),
                             static_cast<unsigned>(remote.size()),
                             LIBSSH2_SFTP_STAT, &st) != 0) {
        err = sftpError("Failed to stat", remote);
        return false;
    }
    const std::uint64_t total =
        (st.flags & LIBSSH2_SFTP_ATTR_SIZE) ? st.filesize : 0;

    LIBSSH2_SFTP_HANDLE *rh = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), static_cast<unsigned>(remote.size()),
        LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        err = sftpError("Failed to open", remote);
        return false;
    }
    const std::string staged = downloadStagingPath(local);
    FILE *lf = std::fopen(staged.c_str(), "wb");
    if (!lf) {
        err = "Failed to open local '" + staged + "': " + std::strerror(errno);
        libssh2_sftp_close(rh);
        return false;
    }

    std::vector<char> buf(64 * 1024);
    std::uint64_t done = 0;
    bool ok = true;
    while (true) {
        if (shouldCancel && shouldCancel()) {
            err = "Cancelled";
            ok = false;
            break;
        }
        const ssize_t n = libssh2_sftp_read(rh, buf.data(), buf.size());
        if (n == 0)
            break;
        if (n < 0) {
            err = sftpError("Failed to read", remote);
            ok = false;
            break;
        }
        if (std::fwrite(buf.data(), 1, static_cast<std::size_t>(n), lf) !=
            static_cast<std::size_t>(n)) {
            err = "Failed to write local '" + staged +
                  "': " + std::strerror(errno);
            ok = false;
            break;
        }
        done += static_cast<std::uint64_t>(n);
        if (progress)
            progress(done, total);
    }
    libssh2_sftp_close(rh);
    if (std::fclose(lf) != 0 && ok) {
        err = "Failed to write local '" + staged + "': " + std::strerror(errno);
        ok = false;
    }
    if (!ok) {
        std::remove(staged.c_str());
        return false;
    }
    return commitDownload(staged, local, err);
}

bool Libssh2SftpClient::put(const std::string &local,
                            const std::string &remote, std::string &err,
                            ProgressCB progress, CancelCB shouldCancel) {
    if (!ensureAlive(err))
        return false;

    FILE *lf = std::fopen(local.c_str(), "rb");
    if (!lf) {
        err = "Failed to open local '" + local + "': " + std::strerror(errno);
        return false;
    }
    std::fseek(lf, 0, SEEK_END);
    const long fsz = std::ftell(lf);
    std::fseek(lf, 0, SEEK_SET);
    const std::uint64_t total = fsz > 0 ? static_cast<std::uint64_t>(fsz) : 0;

    LIBSSH2_SFTP_HANDLE *wh = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), static_cast<unsigned>(remote.size()),
        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC, 0644,
        LIBSSH2_SFTP_OPENFILE);
    if (!wh) {
        std::fclose(lf);
        err = sftpError("Failed to open for writing", remote);
        return false;
    }

    std::vector<char> buf(64 * 1024);
    std::uint64_t done = 0;
    bool ok = true;
    while (ok) {
        const std::size_t n = std::fread(buf.data(), 1, buf.size(), lf);
        if (n == 0) {
            if (std::ferror(lf)) {
                err = "Failed to read local '" + local + "'";
                ok = false;
            }
            break;
        }
        const char *p = buf.data();
        std::size_t remain = n;
        while (remain > 0) {
            if (shouldCancel && shouldCancel()) {
                err = "Cancelled";
                ok = false;
                break;
            }
            const ssize_t w = libssh2_sftp_write(wh, p, remain);
            if (w < 0) {
                err = sftpError("Failed to write", remote);
                ok = false;
                break;
            }
            remain -= static_cast<std::size_t>(w);
            p += w;
            done += static_cast<std::uint64_t>(w);
            if (progress)
                progress(done, total);
        }
    }
    libssh2_sftp_close(wh);
    std::fclose(lf);
    if (!ok && err == "Cancelled") {
        // Partial remote file; a failed unlink leaves it for the user.
        if (libssh2_sftp_unlink(sftp_, remote.c_str()) != 0)
            err += " (partial file left at '" + remote + "')";
    }
    return ok;
}

} // namespace opendir

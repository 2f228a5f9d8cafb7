#pragma once

#include "SftpClient.hpp"

#include <string>
#include <vector>

// libssh2 internal type names (underscore-prefixed)
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace opendir {

constexpr int kSshAuthTimeoutSec = 20;
constexpr int kSshInactivityTimeoutSec = 300;
constexpr int kSshKeepaliveIntervalSec = 30;
constexpr int kSshKeepaliveMaxFailures = 3;

class Libssh2SftpClient : public SftpClient {
public:
    Libssh2SftpClient();
    ~Libssh2SftpClient() override;

    bool connect(const SessionOptions &opt, std::string &err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }

    bool list(const std::string &remote_path, std::vector<SftpEntry> &out,
              std::string &err) override;
    bool stat(const std::string &remote_path, SftpEntry &info,
              std::string &err) override;
    bool realpath(const std::string &remote_path, std::string &out,
                  std::string &err) override;
    bool mkdir(const std::string &remote_dir, std::string &err,
               unsigned int mode = 0755) override;
    bool createFile(const std::string &remote_path, std::string &err) override;
    bool removeFile(const std::string &remote_path, std::string &err) override;
    bool removeDir(const std::string &remote_dir, std::string &err) override;
    bool rename(const std::string &from, const std::string &to,
                std::string &err) override;

    bool get(const std::string &remote, const std::string &local,
             std::string &err, ProgressCB progress = {},
             CancelCB shouldCancel = {}) override;
    bool put(const std::string &local, const std::string &remote,
             std::string &err, ProgressCB progress = {},
             CancelCB shouldCancel = {}) override;

private:
    bool connected_ = false;
    int sock_ = -1;
    int keepaliveFailures_ = 0;
    _LIBSSH2_SESSION *session_ = nullptr;
    _LIBSSH2_SFTP *sftp_ = nullptr;

    bool tcpConnect(const std::string &host, std::uint16_t port,
                    std::string &err);
    bool verifyHostKey(const SessionOptions &opt, std::string &err);
    bool authenticate(const SessionOptions &opt, std::string &err);
    bool ensureAlive(std::string &err);
    std::string sftpError(const std::string &what,
                          const std::string &path) const;
};

} // namespace opendir

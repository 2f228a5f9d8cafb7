// One SSH connection plus its SFTP channel, owned by exactly one thread at a
// time. Panels lend it to workers by moving the unique_ptr.
#pragma once

#include "SftpClient.hpp"

#include <memory>

namespace opendir {

class RemoteContext {
public:
    RemoteContext(RemoteProfile profile, std::unique_ptr<SftpClient> client);
    ~RemoteContext();

    RemoteContext(const RemoteContext &) = delete;
    RemoteContext &operator=(const RemoteContext &) = delete;

    bool connect(std::string &err);
    void disconnect();

    SftpClient &client() { return *client_; }
    const RemoteProfile &profile() const { return profile_; }
    const ConnectionStatus &status() const { return status_; }
    bool isConnected() const;

    void markDisconnected(std::string reason);

private:
    RemoteProfile profile_;
    std::unique_ptr<SftpClient> client_;
    ConnectionStatus status_;
};

} // namespace opendir

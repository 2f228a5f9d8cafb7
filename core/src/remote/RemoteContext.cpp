#include "opendir/RemoteContext.hpp"

namespace opendir {

RemoteContext::RemoteContext(RemoteProfile profile,
                             std::unique_ptr<SftpClient> client)
    : profile_(std::move(profile)), client_(std::move(client)),
      status_(ConnectionStatus::Disconnected("Not connected")) {}

RemoteContext::~RemoteContext() { disconnect(); }

bool RemoteContext::connect(std::string &err) {
    if (!client_) {
        err = "No SFTP backend available";
        status_ = ConnectionStatus::Disconnected(err);
        return false;
    }
    if (!client_->connect(sessionOptionsFor(profile_), err)) {
        status_ = ConnectionStatus::Disconnected(err);
        return false;
    }
    status_ = ConnectionStatus::Connected();
    return true;
}

void RemoteContext::disconnect() {
    if (client_)
        client_->disconnect();
    if (status_.connected)
        status_ = ConnectionStatus::Disconnected("Disconnected");
}

bool RemoteContext::isConnected() const {
    return status_.connected && client_ && client_->isConnected();
}

void RemoteContext::markDisconnected(std::string reason) {
    status_ = ConnectionStatus::Disconnected(std::move(reason));
}

} // namespace opendir

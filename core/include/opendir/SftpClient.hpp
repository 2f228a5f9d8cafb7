// Abstract SFTP API. Concrete backends (libssh2, mock) implement it so the
// engines and the app never depend on a specific transport.
#pragma once

#include "SftpTypes.hpp"

#include <functional>
#include <memory>

namespace opendir {

class SftpClient {
public:
    using ProgressCB =
        std::function<void(std::uint64_t /*done*/, std::uint64_t /*total*/)>;
    using CancelCB = std::function<bool()>;

    virtual ~SftpClient() = default;

    virtual bool connect(const SessionOptions &opt, std::string &err) = 0;
    // Idempotent.
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Drops "." and "..".
    virtual bool list(const std::string &remote_path,
                      std::vector<SftpEntry> &out, std::string &err) = 0;

    // False with empty err when the path does not exist.
    virtual bool stat(const std::string &remote_path, SftpEntry &info,
                      std::string &err) = 0;

    virtual bool realpath(const std::string &remote_path, std::string &out,
                          std::string &err) = 0;

    virtual bool mkdir(const std::string &remote_dir, std::string &err,
                       unsigned int mode = 0755) = 0;
    virtual bool createFile(const std::string &remote_path,
                            std::string &err) = 0;
    virtual bool removeFile(const std::string &remote_path,
                            std::string &err) = 0;
    virtual bool removeDir(const std::string &remote_dir,
                           std::string &err) = 0;
    virtual bool rename(const std::string &from, const std::string &to,
                        std::string &err) = 0;

    // 64 KiB chunks into downloadStagingPath(local), renamed over local on
    // success. A failed or cancelled download leaves an existing local file
    // untouched; err is "Cancelled" on cancel.
    virtual bool get(const std::string &remote, const std::string &local,
                     std::string &err, ProgressCB progress = {},
                     CancelCB shouldCancel = {}) = 0;

    virtual bool put(const std::string &local, const std::string &remote,
                     std::string &err, ProgressCB progress = {},
                     CancelCB shouldCancel = {}) = 0;

    bool exists(const std::string &remote_path, bool &isDir, std::string &err);

    // Depth-first for directories.
    bool remove(const std::string &remote_path, bool isDir, std::string &err);
};

using SftpClientFactory = std::function<std::unique_ptr<SftpClient>()>;

std::string joinRemotePath(const std::string &base, const std::string &name);
std::string remoteParentPath(const std::string &path);
std::string remoteBaseName(const std::string &path);

// Sibling of local that a download writes before it is renamed into place.
std::string downloadStagingPath(const std::string &local);
// Renames the staged download over local; the staged file is removed on
// failure.
bool commitDownload(const std::string &staged, const std::string &local,
                    std::string &err);

} // namespace opendir

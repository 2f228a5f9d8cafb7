// In-memory SFTP backend for tests. Paths are absolute and "/"-separated.
#pragma once

#include "SftpClient.hpp"

#include <map>
#include <memory>
#include <string>

namespace opendir {

class MockSftpClient : public SftpClient {
public:
    MockSftpClient();

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

    // Test setup. Parent directories are created as needed.
    void addDirectory(const std::string &path);
    void setFileContent(const std::string &path, const std::string &content);
    bool fileContent(const std::string &path, std::string &out) const;
    bool hasPath(const std::string &path) const;

    // New unconnected client over the same in-memory tree; stands in for a
    // second SSH session in worker tests.
    std::unique_ptr<MockSftpClient> sibling() const;

    void setFailConnect(bool fail) { failConnect_ = fail; }
    void setChunkSize(std::size_t bytes) { chunkSize_ = bytes ? bytes : 1; }
    const SessionOptions &lastOptions() const { return lastOpt_; }

private:
    struct Node {
        bool is_dir = false;
        std::string content;
        std::uint32_t mode = 0;
        std::uint64_t mtime = 0;
    };

    bool connected_ = false;
    bool failConnect_ = false;
    std::size_t chunkSize_ = 64 * 1024;
    SessionOptions lastOpt_{};
    std::shared_ptr<std::map<std::string, Node>> nodes_;

    static std::string normalize(const std::string &path);
    bool requireConnected(std::string &err) const;
    bool parentIsDir(const std::string &path) const;
    bool hasChildren(const std::string &dir) const;
};

} // namespace opendir

#include "opendir/MockSftpClient.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <vector>

namespace opendir {

namespace {

constexpr std::uint32_t kDirMode = S_IFDIR | 0755;
constexpr std::uint32_t kFileMode = S_IFREG | 0644;
constexpr std::uint64_t kMockMtime = 1700000000;

} // namespace

MockSftpClient::MockSftpClient()
    : nodes_(std::make_shared<std::map<std::string, Node>>()) {
    Node root;
    root.is_dir = true;
    root.mode = kDirMode;
    root.mtime = kMockMtime;
    (*nodes_)["/"] = root;
}

std::string MockSftpClient::normalize(const std::string &path) {
    std::vector<std::string> parts;
    std::stringstream ss(path);
    std::string seg;
    while (std::getline(ss, seg, '/')) {
        if (seg.empty() || seg == ".")
            continue;
        if (seg == "..") {
            if (!parts.empty())
                parts.pop_back();
            continue;
        }
        parts.push_back(seg);
    }
    std::string out;
    for (const auto &p : parts)
        out += "/" + p;
    return out.empty() ? "/" : out;
}

bool MockSftpClient::requireConnected(std::string &err) const {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    return true;
}

bool MockSftpClient::parentIsDir(const std::string &path) const {
    auto it = nodes_->find(remoteParentPath(path));
    return it != nodes_->end() && it->second.is_dir;
}

bool MockSftpClient::hasChildren(const std::string &dir) const {
    const std::string prefix = dir == "/" ? "/" : dir + "/";
    auto it = nodes_->upper_bound(prefix);
    return it != nodes_->end() && it->first.compare(0, prefix.size(), prefix) == 0;
}

bool MockSftpClient::connect(const SessionOptions &opt, std::string &err) {
    if (opt.host.empty() || opt.username.empty()) {
        err = "Host and user are required";
        return false;
    }
    if (failConnect_) {
        err = "Cannot connect to " + opt.host + ":" + std::to_string(opt.port);
        return false;
    }
    connected_ = true;
    lastOpt_ = opt;
    return true;
}

void MockSftpClient::disconnect() { connected_ = false; }

bool MockSftpClient::list(const std::string &remote_path,
                          std::vector<SftpEntry> &out, std::string &err) {
    if (!requireConnected(err))
        return false;
    const std::string dir = normalize(remote_path);
    auto self = nodes_->find(dir);
    if (self == nodes_->end() || !self->second.is_dir) {
        err = "Failed to read dir '" + dir + "': no such file or directory";
        return false;
    }
    out.clear();
    const std::string prefix = dir == "/" ? "/" : dir + "/";
    for (auto it = nodes_->lower_bound(prefix); it != nodes_->end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0)
            break;
        const std::string rest = it->first.substr(prefix.size());
        if (rest.empty() || rest.find('/') != std::string::npos)
            continue;
        SftpEntry e;
        e.name = rest;
        e.is_dir = it->second.is_dir;
        e.size = it->second.content.size();
        e.mtime = it->second.mtime;
        e.mode = it->second.mode;
        out.push_back(std::move(e));
    }
    return true;
}

bool MockSftpClient::stat(const std::string &remote_path, SftpEntry &info,
                          std::string &err) {
    if (!requireConnected(err))
        return false;
    const std::string p = normalize(remote_path);
    auto it = nodes_->find(p);
    if (it == nodes_->end()) {
        err.clear();
        return false;
    }
    info.name = remoteBaseName(p);
    info.is_dir = it->second.is_dir;
    info.is_symlink = false;
    info.size = it->second.content.size();
    info.mtime = it->second.mtime;
    info.mode = it->second.mode;
    return true;
}

bool MockSftpClient::realpath(const std::string &remote_path, std::string &out,
                              std::string &err) {
    if (!requireConnected(err))
        return false;
    const std::string p = normalize(remote_path.empty() || remote_path == "."
                                        ? "/home/" + lastOpt_.username
                                        : remote_path);
    if (!nodes_->count(p)) {
        err = "Failed to resolve '" + remote_path +
              "': no such file or directory";
        return false;
    }
    out = p;
    return true;
}

bool MockSftpClient::mkdir(const std::string &remote_dir, std::string &err,
                           unsigned int mode) {
    if (!requireConnected(err))
        return false;
    const std::string p = normalize(remote_dir);
    if (nodes_->count(p)) {
        err = "Failed to create directory '" + p + "': already exists";
        return false;
    }
    if (!parentIsDir(p)) {
        err = "Failed to create directory '" + p +
              "': no such file or directory";
        return false;
    }
    Node n;
    n.is_dir = true;
    n.mode = S_IFDIR | (mode & 07777);
    n.mtime = kMockMtime;
    (*nodes_)[p] = n;
    return true;
}

bool MockSftpClient::createFile(const std::string &remote_path,
                                std::string &err) {
    if (!requireConnected(err))
        return false;
    const std::string p = normalize(remote_path);
    if (nodes_->count(p)) {
        err = "Failed to create file '" + p + "': already exists";
        return false;
    }
    if (!parentIsDir(p)) {
        err = "Failed to create file '" + p + "': no such file or directory";
        return false;
    }
    Node n;
    n.mode = kFileMode;
    n.mtime = kMockMtime;
    (*nodes_)[p] = n;
    return true;
}

bool MockSftpClient::removeFile(const std::string &remote_path,
                                std::string &err) {
    if (!requireConnected(err))
        return false;
    const std::string p = normalize(remote_path);
    auto it = nodes_->find(p);
    if (it == nodes_->end() || it->second.is_dir) {
        err = "Failed to delete '" + p + "': no such file or directory";
        return false;
    }
    nodes_->erase(it);
    return true;
}

bool MockSftpClient::removeDir(const std::string &remote_dir,
                               std::string &err) {
    if (!requireConnected(err))
        return false;
    const std::string p = normalize(remote_dir);
    auto it = nodes_->find(p);
    if (it == nodes_->end() || !it->second.is_dir || p == "/") {
        err = "Failed to remove directory '" + p +
              "': no such file or directory";
        return false;
    }
    if (hasChildren(p)) {
        err = "Failed to remove directory '" + p + "': directory not empty";
        return false;
    }
    nodes_->erase(it);
    return true;
}

bool MockSftpClient::rename(const std::string &from, const std::string &to,
                            std::string &err) {
    if (!requireConnected(err))
        return false;
    const std::string src = normalize(from);
    const std::string dst = normalize(to);
    if (!nodes_->count(src)) {
        err = "Failed to rename '" + src + "': no such file or directory";
        return false;
    }
    if (nodes_->count(dst)) {
        err = "Failed to rename '" + src + "': already exists";
        return false;
    }
    if (!parentIsDir(dst)) {
        err = "Failed to rename '" + src + "': no such file or directory";
        return false;
    }
    std::map<std::string, Node> moved;
    const std::string prefix = src + "/";
    for (auto it = nodes_->begin(); it != nodes_->end();) {
        if (it->first == src || it->first.compare(0, prefix.size(), prefix) == 0) {
            moved[dst + it->first.substr(src.size())] = it->second;
            it = nodes_->erase(it);
        } else {
            ++it;
        }
    }
    nodes_->insert(moved.begin(), moved.end());
    return true;
}

bool MockSftpClient::get(const std::string &remote, const std::string &local,
                         std::string &err, ProgressCB progress,
                         CancelCB shouldCancel) {
    if (!requireConnected(err))
        return false;
    const std::string p = normalize(remote);
    auto it = nodes_->find(p);
    if (it == nodes_->end() || it->second.is_dir) {
        err = "Failed to open '" + p + "': no such file or directory";
        return false;
    }
    const std::string staged = downloadStagingPath(local);
    std::ofstream out(staged, std::ios::binary | std::ios::trunc);
    if (!out) {
        err = "Failed to open local '" + staged + "'";
        return false;
    }
    const std::string &data = it->second.content;
    const std::uint64_t total = data.size();
    std::uint64_t done = 0;
    while (done < total) {
        if (shouldCancel && shouldCancel()) {
            out.close();
            std::remove(staged.c_str());
            err = "Cancelled";
            return false;
        }
        const std::size_t n =
            std::min<std::size_t>(chunkSize_, static_cast<std::size_t>(total - done));
        out.write(data.data() + done, static_cast<std::streamsize>(n));
        done += n;
        if (progress)
            progress(done, total);
    }
    out.close();
    if (!out) {
        std::remove(staged.c_str());
        err = "Failed to write local '" + staged + "'";
        return false;
    }
    return commitDownload(staged, local, err);
}

bool MockSftpClient::put(const std::string &local, const std::string &remote,
                         std::string &err, ProgressCB progress,
                         CancelCB shouldCancel) {
    if (!requireConnected(err))
        return false;
    const std::string p = normalize(remote);
    if (!parentIsDir(p)) {
        err = "Failed to open for writing '" + p +
              "': no such file or directory";
        return false;
    }
    auto existing = nodes_->find(p);
    if (existing != nodes_->end() && existing->second.is_dir) {
        err = "Failed to open for writing '" + p + "': is a directory";
        return false;
    }
    std::ifstream in(local, std::ios::binary);
    if (!in) {
        err = "Failed to open local '" + local + "'";
        return false;
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    const std::string data = buf.str();
    const std::uint64_t total = data.size();

    std::string written;
    std::uint64_t done = 0;
    while (done < total) {
        if (shouldCancel && shouldCancel()) {
            err = "Cancelled";
            return false;
        }
        const std::size_t n =
            std::min<std::size_t>(chunkSize_, static_cast<std::size_t>(total - done));
        written.append(data, static_cast<std::size_t>(done), n);
        done += n;
        if (progress)
            progress(done, total);
    }
    Node node;
    node.mode = kFileMode;
    node.mtime = kMockMtime;
    node.content = std::move(written);
    (*nodes_)[p] = std::move(node);
    return true;
}

std::unique_ptr<MockSftpClient> MockSftpClient::sibling() const {
    auto other = std::make_unique<MockSftpClient>();
    other->nodes_ = nodes_;
    other->failConnect_ = failConnect_;
    other->chunkSize_ = chunkSize_;
    return other;
}

void MockSftpClient::addDirectory(const std::string &path) {
    const std::string p = normalize(path);
    if (p != "/")
        addDirectory(remoteParentPath(p));
    Node &n = (*nodes_)[p];
    n.is_dir = true;
    n.mode = kDirMode;
    n.mtime = kMockMtime;
}

void MockSftpClient::setFileContent(const std::string &path,
                                    const std::string &content) {
    const std::string p = normalize(path);
    addDirectory(remoteParentPath(p));
    Node &n = (*nodes_)[p];
    n.is_dir = false;
    n.mode = kFileMode;
    n.mtime = kMockMtime;
    n.content = content;
}

bool MockSftpClient::fileContent(const std::string &path,
                                 std::string &out) const {
    auto it = nodes_->find(normalize(path));
    if (it == nodes_->end() || it->second.is_dir)
        return false;
    out = it->second.content;
    return true;
}

bool MockSftpClient::hasPath(const std::string &path) const {
    return nodes_->count(normalize(path)) > 0;
}

} // namespace opendir

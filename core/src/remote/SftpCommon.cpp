// Backend-independent helpers on top of SftpClient.
#include "opendir/SftpClient.hpp"
#include "opendir/PathValidator.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>

namespace opendir {

std::string permissionString(std::uint32_t mode) {
    static const char kChars[] = "rwxrwxrwx";
    std::string out(9, '-');
    for (int i = 0; i < 9; ++i) {
        if (mode & (1u << (8 - i)))
            out[static_cast<std::size_t>(i)] = kChars[i];
    }
    return out;
}

SessionOptions sessionOptionsFor(const RemoteProfile &profile) {
    SessionOptions opt;
    opt.host = profile.host;
    opt.port = profile.port;
    opt.username = profile.user;
    if (profile.auth.kind == RemoteAuth::Kind::Password) {
        opt.password = profile.auth.password;
    } else {
        std::string key = profile.auth.key_path;
        if (key == "~" || key.rfind("~/", 0) == 0)
            key = homeDirectory().string() + key.substr(1);
        opt.private_key_path = key;
        opt.private_key_passphrase = profile.auth.passphrase;
    }
    return opt;
}

std::string joinRemotePath(const std::string &base, const std::string &name) {
    if (base.empty() || base == "/")
        return "/" + name;
    return base.back() == '/' ? base + name : base + "/" + name;
}

std::string remoteParentPath(const std::string &path) {
    if (path.empty() || path == "/")
        return "/";
    std::string p = path;
    while (p.size() > 1 && p.back() == '/')
        p.pop_back();
    const auto pos = p.rfind('/');
    if (pos == std::string::npos || pos == 0)
        return "/";
    return p.substr(0, pos);
}

std::string remoteBaseName(const std::string &path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/')
        p.pop_back();
    const auto pos = p.rfind('/');
    return pos == std::string::npos ? p : p.substr(pos + 1);
}

std::string downloadStagingPath(const std::string &local) {
    const std::filesystem::path p(local);
    return (p.parent_path() /
            ("." + p.filename().string() + ".opendir-part"))
        .string();
}

bool commitDownload(const std::string &staged, const std::string &local,
                    std::string &err) {
    if (std::rename(staged.c_str(), local.c_str()) == 0)
        return true;
    err = "Failed to move download into '" + local +
          "': " + std::strerror(errno);
    std::remove(staged.c_str());
    return false;
}

bool SftpClient::exists(const std::string &remote_path, bool &isDir,
                        std::string &err) {
    isDir = false;
    SftpEntry info;
    if (!stat(remote_path, info, err))
        return false;
    isDir = info.is_dir;
    return true;
}

bool SftpClient::remove(const std::string &remote_path, bool isDir,
                        std::string &err) {
    if (!isDir)
        return removeFile(remote_path, err);
    std::vector<SftpEntry> children;
    if (!list(remote_path, children, err))
        return false;
    for (const auto &child : children) {
        const std::string childPath = joinRemotePath(remote_path, child.name);
        // Symlinked directories are unlinked, not descended into.
        if (!remove(childPath, child.is_dir && !child.is_symlink, err))
            return false;
    }
    return removeDir(remote_path, err);
}

} // namespace opendir

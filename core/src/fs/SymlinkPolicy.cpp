// Symlink scan shared by copy/move (warning dialog) and tar (--exclude list).
#include "opendir/SymlinkPolicy.hpp"
#include "opendir/PathValidator.hpp"

#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace opendir {

const std::vector<std::string> &sensitivePrefixes() {
    static const std::vector<std::string> prefixes = {
        "/etc", "/sys",     "/proc", "/boot", "/root",
        "/dev", "/var/log", "/run",  "/var/run"};
    return prefixes;
}

static const std::vector<std::string> &sensitiveHomeEntries() {
    static const std::vector<std::string> entries = {
        ".ssh",  ".gnupg",  ".aws",     ".kube",
        ".netrc", ".pgpass", ".docker", ".config/gcloud"};
    return entries;
}

bool isSensitiveTarget(const fs::path &canonicalTarget) {
    for (const auto &prefix : sensitivePrefixes()) {
        if (isWithin(canonicalTarget, fs::path(prefix)))
            return true;
    }
    std::error_code ec;
    const fs::path home = fs::weakly_canonical(homeDirectory(), ec);
    if (ec || home == fs::path("/"))
        return false;
    for (const auto &entry : sensitiveHomeEntries()) {
        if (isWithin(canonicalTarget, home / entry))
            return true;
    }
    return false;
}

namespace {

struct Scanner {
    fs::path base;
    std::set<fs::path> visited;
    std::vector<FlaggedSymlink> out;

    void visit(const fs::path &path, const std::string &relative, int depth) {
        if (depth > kMaxScanDepth)
            return;
        std::error_code ec;
        const fs::file_status st = fs::symlink_status(path, ec);
        if (ec)
            return;
        if (fs::is_symlink(st)) {
            checkLink(path, relative);
            return;
        }
        if (!fs::is_directory(st))
            return;
        const fs::path canon = fs::canonical(path, ec);
        if (!ec && !visited.insert(canon).second)
            return;
        fs::directory_iterator it(path, ec);
        if (ec)
            return;
        for (const auto &entry : it) {
            const std::string child = entry.path().filename().string();
            visit(entry.path(), relative + "/" + child, depth + 1);
        }
    }

    void checkLink(const fs::path &path, const std::string &relative) {
        std::error_code ec;
        const fs::path target = fs::read_symlink(path, ec);
        if (ec) {
            out.push_back({relative, {}, "Unreadable symlink"});
            return;
        }
        const fs::path resolved =
            target.is_absolute() ? target : path.parent_path() / target;
        const fs::path canon = fs::canonical(resolved, ec);
        if (ec) {
            out.push_back({relative, target.string(), "Unresolvable target"});
            return;
        }
        if (isWithin(canon, base))
            return;
        if (isSensitiveTarget(canon)) {
            out.push_back({relative, canon.string(),
                           "Points to sensitive system path"});
            return;
        }
        out.push_back(
            {relative, canon.string(), "Points outside the selection root"});
    }
};

} // namespace

std::vector<FlaggedSymlink> scanFlaggedSymlinks(
    const fs::path &baseDir, const std::vector<std::string> &names) {
    Scanner s;
    std::error_code ec;
    s.base = fs::canonical(baseDir, ec);
    if (ec)
        s.base = baseDir.lexically_normal();
    for (const auto &name : names)
        s.visit(baseDir / name, name, 0);
    return s.out;
}

} // namespace opendir

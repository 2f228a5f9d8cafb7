// Exercises Libssh2SftpClient against a real SFTP server. Skipped (exit code
// 77) unless OPENDIR_IT_HOST, OPENDIR_IT_USER and OPENDIR_IT_PASSWORD or
// OPENDIR_IT_KEY are set.
#include "opendir/Libssh2SftpClient.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr int kSkipExitCode = 77;

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

std::optional<std::string> envValue(const char *key) {
    const char *raw = std::getenv(key);
    if (!raw || !*raw)
        return std::nullopt;
    return std::string(raw);
}

bool readFile(const fs::path &p, std::string &out) {
    std::ifstream in(p, std::ios::binary);
    if (!in.is_open())
        return false;
    out.assign(std::istreambuf_iterator<char>(in),
               std::istreambuf_iterator<char>());
    return true;
}

bool parsePort(const std::optional<std::string> &raw, std::uint16_t &out) {
    if (!raw) {
        out = opendir::kDefaultSshPort;
        return true;
    }
    char *end = nullptr;
    const long n = std::strtol(raw->c_str(), &end, 10);
    if (!end || *end != '\0' || n < 1 || n > 65535)
        return false;
    out = static_cast<std::uint16_t>(n);
    return true;
}

bool listed(const std::vector<opendir::SftpEntry> &entries,
            const std::string &name) {
    return std::any_of(entries.begin(), entries.end(),
                       [&name](const opendir::SftpEntry &e) {
                           return e.name == name;
                       });
}

} // namespace

int main() {
    const auto host = envValue("OPENDIR_IT_HOST");
    const auto user = envValue("OPENDIR_IT_USER");
    const auto pass = envValue("OPENDIR_IT_PASSWORD");
    const auto key = envValue("OPENDIR_IT_KEY");
    const std::string remoteBase =
        envValue("OPENDIR_IT_REMOTE_BASE").value_or("/tmp");

    if (!host || !user || (!pass && !key)) {
        std::cout << "[SKIP] opendir_libssh2_integration_tests needs "
                     "OPENDIR_IT_HOST, OPENDIR_IT_USER and OPENDIR_IT_PASSWORD "
                     "or OPENDIR_IT_KEY\n";
        return kSkipExitCode;
    }

    std::uint16_t port = opendir::kDefaultSshPort;
    if (!parsePort(envValue("OPENDIR_IT_PORT"), port)) {
        std::cerr << "[FAIL] OPENDIR_IT_PORT is invalid\n";
        return EXIT_FAILURE;
    }

    opendir::SessionOptions opt;
    opt.host = *host;
    opt.port = port;
    opt.username = *user;
    if (pass)
        opt.password = *pass;
    if (key)
        opt.private_key_path = *key;
    opt.known_hosts_policy = opendir::KnownHostsPolicy::Off;

    const std::string token = std::to_string(static_cast<long long>(
        std::chrono::steady_clock::now().time_since_epoch().count()));
    const std::string suiteDir =
        opendir::joinRemotePath(remoteBase, "opendir-it-" + token);
    const std::string remoteFile = opendir::joinRemotePath(suiteDir, "payload.txt");
    const std::string renamed = opendir::joinRemotePath(suiteDir, "renamed.txt");
    const std::string nestedDir = opendir::joinRemotePath(suiteDir, "nested");

    const fs::path localRoot = fs::temp_directory_path() / ("opendir-it-" + token);
    std::error_code ec;
    fs::create_directories(localRoot, ec);
    if (ec) {
        std::cerr << "[FAIL] could not create temp dir: " << ec.message() << "\n";
        return EXIT_FAILURE;
    }
    const fs::path localSrc = localRoot / "payload.txt";
    const fs::path localDst = localRoot / "downloaded.txt";
    const std::string payload = "opendir integration payload\nline-2\n";
    {
        std::ofstream out(localSrc, std::ios::binary | std::ios::trunc);
        out << payload;
    }

    TestContext t;
    opendir::Libssh2SftpClient client;
    std::string err;

    t.check(client.connect(opt, err), "connect: " + err);
    if (t.failures == 0) {
        err.clear();
        t.check(client.mkdir(suiteDir, err), "mkdir: " + err);
    }
    if (t.failures == 0) {
        std::uint64_t lastDone = 0;
        err.clear();
        t.check(client.put(localSrc.string(), remoteFile, err,
                           [&](std::uint64_t done, std::uint64_t) {
                               lastDone = done;
                           }),
                "put: " + err);
        t.check(lastDone == payload.size(), "put reports the full size");
    }
    if (t.failures == 0) {
        opendir::SftpEntry st;
        err.clear();
        t.check(client.stat(remoteFile, st, err), "stat: " + err);
        t.check(st.size == payload.size(), "stat size matches payload");
        t.check(!st.is_dir, "stat reports a file");
    }
    if (t.failures == 0) {
        std::vector<opendir::SftpEntry> entries;
        err.clear();
        t.check(client.list(suiteDir, entries, err), "list: " + err);
        t.check(listed(entries, "payload.txt"), "list shows payload.txt");
        t.check(!listed(entries, ".") && !listed(entries, ".."),
                "list drops dot entries");
    }
    if (t.failures == 0) {
        err.clear();
        t.check(client.get(remoteFile, localDst.string(), err), "get: " + err);
        std::string downloaded;
        t.check(readFile(localDst, downloaded) && downloaded == payload,
                "downloaded content matches");
    }
    if (t.failures == 0) {
        err.clear();
        t.check(client.rename(remoteFile, renamed, err), "rename: " + err);
        bool isDir = false;
        err.clear();
        t.check(!client.exists(remoteFile, isDir, err) && err.empty(),
                "old name is gone after rename");
    }
    if (t.failures == 0) {
        err.clear();
        t.check(client.mkdir(nestedDir, err), "mkdir nested: " + err);
        err.clear();
        t.check(client.createFile(opendir::joinRemotePath(nestedDir, "empty"), err),
                "createFile: " + err);
        err.clear();
        t.check(client.remove(suiteDir, true, err), "recursive remove: " + err);
        bool isDir = false;
        err.clear();
        t.check(!client.exists(suiteDir, isDir, err), "suite dir removed");
    }

    // Leftovers from a failed run.
    std::string cleanupErr;
    bool isDir = false;
    if (client.isConnected() && client.exists(suiteDir, isDir, cleanupErr) &&
        !client.remove(suiteDir, true, cleanupErr))
        std::cerr << "[WARN] cleanup failed: " << cleanupErr << "\n";
    client.disconnect();
    fs::remove_all(localRoot, ec);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] opendir_libssh2_integration_tests\n";
    return EXIT_SUCCESS;
}

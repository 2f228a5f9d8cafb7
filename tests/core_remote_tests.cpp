// Remote layer tests against the in-memory SFTP client (run via CTest).
#include "opendir/MockSftpClient.hpp"
#include "opendir/RemoteContext.hpp"
#include "opendir/RemoteTransfer.hpp"
#include "opendir/RemoteUri.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#include <sys/stat.h>

namespace fs = std::filesystem;
using namespace opendir;

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos,
              msg + " (got '" + haystack + "')");
    }
};

struct TempDir {
    fs::path root;

    explicit TempDir(const std::string &tag) {
        const auto now =
            std::chrono::steady_clock::now().time_since_epoch().count();
        root = fs::temp_directory_path() /
               ("opendir-remote-" + tag + "-" + std::to_string(now));
        fs::create_directories(root);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }
};

void writeFile(const fs::path &p, const std::string &content) {
    fs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << content;
}

std::string readFile(const fs::path &p) {
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
}

std::vector<ProgressMessage> drain(ProgressReceiver &rx) {
    std::vector<ProgressMessage> out;
    ProgressMessage m;
    while (rx.tryRecv(m) == RecvStatus::Ok)
        out.push_back(m);
    return out;
}

const ProgressMessage &last(const std::vector<ProgressMessage> &msgs) {
    static const ProgressMessage none;
    return msgs.empty() ? none : msgs.back();
}

std::string firstError(const std::vector<ProgressMessage> &msgs) {
    for (const auto &m : msgs) {
        if (m.kind == ProgressMessage::Kind::Error)
            return m.message;
    }
    return {};
}

RemoteProfile profileFor(const std::string &host) {
    RemoteProfile p;
    p.name = host;
    p.host = host;
    p.user = "alice";
    p.auth = RemoteAuth::withPassword("secret");
    return p;
}

SessionOptions validOptions() {
    SessionOptions opt;
    opt.host = "example.test";
    opt.username = "alice";
    return opt;
}

void test_session_defaults(TestContext &t) {
    SessionOptions o;
    t.check(o.port == 22, "default port is 22");
    t.check(o.known_hosts_policy == KnownHostsPolicy::AcceptNew,
            "unknown hosts are trusted on first use");
    t.check(!o.password && !o.private_key_path, "no credentials by default");

    RemoteProfile key = profileFor("h");
    key.auth = RemoteAuth::withKeyFile("~/.ssh/id_ed25519", std::string("pp"));
    const SessionOptions ko = sessionOptionsFor(key);
    t.check(ko.private_key_path && ko.private_key_path->find('~') == std::string::npos,
            "key path tilde expanded");
    t.check(ko.private_key_passphrase == std::optional<std::string>("pp"),
            "passphrase carried over");
    t.check(!ko.password, "key auth sets no password");
    const SessionOptions po = sessionOptionsFor(profileFor("h"));
    t.check(po.password == std::optional<std::string>("secret"),
            "password auth carried over");

    t.check(permissionString(S_IFREG | 0754) == "rwxr-xr--",
            "permission string from mode bits");
}

void test_mock_basics(TestContext &t) {
    MockSftpClient c;
    std::string err;
    SessionOptions bad;
    t.check(!c.connect(bad, err), "connect needs host and user");

    std::vector<SftpEntry> out;
    t.check(!c.list("/", out, err) && err == "Not connected",
            "list before connect reports Not connected");

    c.addDirectory("/home/alice/docs");
    c.setFileContent("/home/alice/b.txt", "bb");
    c.setFileContent("/home/alice/a.txt", "a");
    err.clear();
    t.check(c.connect(validOptions(), err), "connect: " + err);

    std::string real;
    t.check(c.realpath(".", real, err) && real == "/home/alice",
            "realpath of . is the login directory");
    t.check(c.list("/home/alice", out, err), "list: " + err);
    t.check(out.size() == 3 && out[0].name == "a.txt" && out[1].name == "b.txt" &&
                out[2].name == "docs",
            "list returns direct children only");
    t.check(out[2].is_dir && out[1].size == 2, "entry kinds and sizes");

    SftpEntry st;
    err.clear();
    t.check(!c.stat("/nope", st, err) && err.empty(),
            "stat of a missing path is false with empty err");

    err.clear();
    t.check(!c.mkdir("/home/alice/docs", err), "mkdir over existing fails");
    err.clear();
    t.check(!c.removeDir("/home/alice", err), "non-empty directory is kept");
    t.checkContains(err, "not empty", "non-empty message");

    err.clear();
    t.check(c.rename("/home/alice/docs", "/home/alice/papers", err),
            "rename directory: " + err);
    t.check(c.hasPath("/home/alice/papers") && !c.hasPath("/home/alice/docs"),
            "rename moved the node");

    c.setFileContent("/home/alice/papers/deep/x", "x");
    err.clear();
    t.check(c.remove("/home/alice/papers", true, err), "recursive remove: " + err);
    t.check(!c.hasPath("/home/alice/papers/deep/x") &&
                !c.hasPath("/home/alice/papers"),
            "recursive remove cleared the tree");

    c.disconnect();
    err.clear();
    t.check(!c.mkdir("/x", err) && err == "Not connected",
            "mutations need a connection");
}

void test_download_keeps_existing_file(TestContext &t) {
    MockSftpClient c;
    c.setFileContent("/srv/data.txt", "fresh remote content");
    c.setChunkSize(4);
    std::string err;
    t.check(c.connect(validOptions(), err), "connect: " + err);

    TempDir tmp("staging");
    const fs::path local = tmp.root / "data.txt";
    writeFile(local, "precious local copy");

    int chunks = 0;
    t.check(!c.get("/srv/data.txt", local.string(), err, {},
                   [&chunks] { return ++chunks > 2; }),
            "cancelled download fails");
    t.check(err == kCancelledMessage, "cancel reported");
    t.check(readFile(local) == "precious local copy",
            "cancelled download leaves the existing file intact");
    t.check(!fs::exists(downloadStagingPath(local.string())),
            "staging file removed");

    err.clear();
    t.check(c.get("/srv/data.txt", local.string(), err), "download: " + err);
    t.check(readFile(local) == "fresh remote content",
            "finished download replaces the file");
    t.check(!fs::exists(downloadStagingPath(local.string())),
            "staging file renamed away");
    t.check(downloadStagingPath("/a/b/report.pdf") == "/a/b/.report.pdf.opendir-part",
            "staging file sits beside the target");
}

void test_path_helpers(TestContext &t) {
    t.check(joinRemotePath("/", "a") == "/a", "join at root");
    t.check(joinRemotePath("/srv/", "a") == "/srv/a", "join trailing slash");
    t.check(joinRemotePath("/srv", "a") == "/srv/a", "join plain");
    t.check(remoteParentPath("/srv/a/") == "/srv", "parent strips trailing slash");
    t.check(remoteParentPath("/srv") == "/", "parent of top level is root");
    t.check(remoteParentPath("/") == "/", "parent of root is root");
    t.check(remoteBaseName("/srv/a.txt") == "a.txt", "base name");
}

void test_uri_parsing(TestContext &t) {
    RemoteUri uri;
    std::string err;
    t.check(parseRemoteUri("bob@host:/var/www", uri, err), "simple uri: " + err);
    t.check(uri.user == "bob" && uri.host == "host" && uri.port == 22 &&
                uri.path == "/var/www",
            "simple uri fields");
    t.check(parseRemoteUri("bob@host:2222:/data", uri, err), "port uri: " + err);
    t.check(uri.port == 2222 && uri.path == "/data", "port and path");
    t.check(parseRemoteUri("bob@host:", uri, err) && uri.path == "/",
            "empty path becomes /");
    t.check(parseRemoteUri("bob@host:rel/dir", uri, err) && uri.path == "/rel/dir",
            "leading slash added");

    t.check(!parseRemoteUri("host:/x", uri, err), "user required");
    t.check(!parseRemoteUri("@host:/x", uri, err), "empty user rejected");
    t.check(!parseRemoteUri("bob@:/x", uri, err), "empty host rejected");
    t.check(!parseRemoteUri("bob@host", uri, err), "colon required");
    t.check(!parseRemoteUri("bob@host:0:/x", uri, err), "port 0 rejected");
    t.check(!parseRemoteUri("bob@host:70000:/x", uri, err), "port too large");
    t.check(!parseRemoteUri("bob@host:ab:/x", uri, err), "non-numeric port");
    t.checkContains(err, "Invalid port", "port message");

    t.check(looksLikeRemoteUri("bob@host:/x"), "uri detected");
    t.check(!looksLikeRemoteUri("/home/bob@work:/x"), "absolute local path");
    t.check(!looksLikeRemoteUri("notes.txt"), "plain name");

    t.check(formatRemoteDisplay("bob", "host", 22, "/x") == "bob@host:/x",
            "default port omitted");
    t.check(formatRemoteDisplay("bob", "host", 2222, "/x") == "bob@host:2222:/x",
            "custom port shown");
}

void test_remote_context(TestContext &t) {
    std::string err;
    RemoteContext none(profileFor("h"), nullptr);
    t.check(!none.connect(err) && !none.isConnected(), "no backend, no connection");

    auto failing = std::make_unique<MockSftpClient>();
    failing->setFailConnect(true);
    RemoteContext bad(profileFor("down.test"), std::move(failing));
    err.clear();
    t.check(!bad.connect(err), "connect failure propagates");
    t.check(!bad.status().connected && bad.status().reason == err,
            "status carries the failure reason");

    RemoteContext ok(profileFor("up.test"), std::make_unique<MockSftpClient>());
    err.clear();
    t.check(ok.connect(err) && ok.isConnected(), "connect: " + err);
    ok.markDisconnected("Connection lost");
    t.check(!ok.isConnected() && ok.status().reason == "Connection lost",
            "markDisconnected records the reason");
}

void test_strategy_selection(TestContext &t) {
    const Endpoint local = Endpoint::local("/tmp");
    const Endpoint remote = Endpoint::onRemote(profileFor("h"), "/srv");
    t.check(selectStrategy(local, local) == TransferStrategy::LocalToLocal,
            "local to local");
    t.check(selectStrategy(local, remote) == TransferStrategy::Upload, "upload");
    t.check(selectStrategy(remote, local) == TransferStrategy::Download,
            "download");
    t.check(selectStrategy(remote, remote) == TransferStrategy::RemoteToRemote,
            "remote to remote");
    t.check(std::string(strategyName(TransferStrategy::Upload)) == "upload",
            "strategy name");

    const fs::path scratch = remoteScratchPath(profileFor("h"), "/srv/../x");
    t.check(scratch.filename() == "x", "scratch keeps the file name");
    t.check(scratch.string().find("..") == std::string::npos,
            "scratch path never climbs out");
    t.check(scratch.parent_path().parent_path().filename() == "alice@h",
            "scratch grouped by user@host");
}

void test_upload_and_download(TestContext &t) {
    TempDir tmp("updown");
    writeFile(tmp.root / "up" / "site" / "index.html", "<html/>");
    writeFile(tmp.root / "up" / "site" / "css" / "a.css", "body{}");
    writeFile(tmp.root / "up" / "notes.txt", "n");

    MockSftpClient server;
    server.addDirectory("/srv");
    server.setChunkSize(4);
    SftpClientFactory factory = [&server] { return server.sibling(); };

    RemoteTransferJob up;
    up.source = Endpoint::local((tmp.root / "up").string());
    up.target = Endpoint::onRemote(profileFor("h"), "/srv");
    up.names = {"site", "notes.txt"};
    {
        auto ch = makeChannel<ProgressMessage>();
        runTransferWithProgress(up, factory, makeCancelFlag(), ch.first);
        const auto msgs = drain(ch.second);
        t.check(last(msgs).kind == ProgressMessage::Kind::Completed &&
                    last(msgs).success_count == 2 && last(msgs).failure_count == 0,
                "upload succeeds: " + firstError(msgs));
        std::string content;
        t.check(server.fileContent("/srv/site/css/a.css", content) &&
                    content == "body{}",
                "nested file uploaded");
        std::uint64_t lastBytes = 0;
        for (const auto &m : msgs) {
            if (m.kind == ProgressMessage::Kind::TotalProgress)
                lastBytes = m.completed_bytes;
        }
        t.check(lastBytes == 7 + 6 + 1, "byte totals reach the full size");
    }

    RemoteTransferJob down;
    down.op = TransferOp::Move;
    down.source = Endpoint::onRemote(profileFor("h"), "/srv");
    down.target = Endpoint::local((tmp.root / "down").string());
    down.names = {"site"};
    fs::create_directories(tmp.root / "down" / "site");
    writeFile(tmp.root / "down" / "site" / "index.html", "stale");
    {
        auto ch = makeChannel<ProgressMessage>();
        runTransferWithProgress(down, factory, makeCancelFlag(), ch.first);
        const auto msgs = drain(ch.second);
        t.check(last(msgs).success_count == 1, "download move: " + firstError(msgs));
        t.check(readFile(tmp.root / "down" / "site" / "index.html") == "<html/>",
                "download overwrites local files");
        t.check(!server.hasPath("/srv/site"), "move deleted the remote source");
    }
}

void test_remote_to_remote(TestContext &t) {
    MockSftpClient server;
    server.setFileContent("/srv/a/report.txt", "quarterly");
    server.addDirectory("/backup");
    SftpClientFactory factory = [&server] { return server.sibling(); };

    RemoteTransferJob copy;
    copy.source = Endpoint::onRemote(profileFor("one.test"), "/srv");
    copy.target = Endpoint::onRemote(profileFor("two.test"), "/backup");
    copy.names = {"a"};
    {
        auto ch = makeChannel<ProgressMessage>();
        runTransferWithProgress(copy, factory, makeCancelFlag(), ch.first);
        const auto msgs = drain(ch.second);
        t.check(last(msgs).success_count == 1,
                "relay copy succeeds: " + firstError(msgs));
        std::string content;
        t.check(server.fileContent("/backup/a/report.txt", content) &&
                    content == "quarterly",
                "relayed content arrives");
        t.check(server.hasPath("/srv/a/report.txt"), "copy keeps the source");
    }

    RemoteTransferJob self;
    self.source = Endpoint::onRemote(profileFor("one.test"), "/srv");
    self.target = Endpoint::onRemote(profileFor("one.test"), "/srv/a");
    self.names = {"a"};
    {
        auto ch = makeChannel<ProgressMessage>();
        runTransferWithProgress(self, factory, makeCancelFlag(), ch.first);
        t.check(firstError(drain(ch.second)) ==
                    "Cannot copy a directory into itself",
                "same-host copy into itself refused");
    }

    RemoteTransferJob move;
    move.op = TransferOp::Move;
    move.source = Endpoint::onRemote(profileFor("one.test"), "/srv");
    move.target = Endpoint::onRemote(profileFor("one.test"), "/archive");
    move.names = {"a"};
    server.setFileContent("/srv/a/extra.txt", "x");
    server.addDirectory("/archive");
    {
        auto ch = makeChannel<ProgressMessage>();
        runTransferWithProgress(move, factory, makeCancelFlag(), ch.first);
        const auto msgs = drain(ch.second);
        t.check(last(msgs).success_count == 1,
                "same-host move succeeds: " + firstError(msgs));
        t.check(server.hasPath("/archive/a/extra.txt") && !server.hasPath("/srv/a"),
                "same-host move is a rename");
    }
}

std::size_t totalFilesOf(const std::vector<ProgressMessage> &msgs) {
    std::size_t total = 0;
    for (const auto &m : msgs) {
        if (m.kind == ProgressMessage::Kind::TotalProgress)
            total = m.total_files;
    }
    return total;
}

void test_transfer_failures(TestContext &t) {
    MockSftpClient server;
    server.setFailConnect(true);
    SftpClientFactory factory = [&server] { return server.sibling(); };

    RemoteTransferJob job;
    job.source = Endpoint::onRemote(profileFor("down.test"), "/srv");
    job.target = Endpoint::local(fs::temp_directory_path().string());
    job.names = {"a", "b"};
    {
        auto ch = makeChannel<ProgressMessage>();
        runTransferWithProgress(job, factory, makeCancelFlag(), ch.first);
        const auto msgs = drain(ch.second);
        t.checkContains(firstError(msgs), "Source connection failed",
                        "connection failure reported");
        t.check(last(msgs).failure_count == 2, "every item counted as failed");
    }

    MockSftpClient up;
    up.setFileContent("/srv/a", "a");
    SftpClientFactory upFactory = [&up] { return up.sibling(); };
    job.names = {"a"};
    CancelFlag cancel = makeCancelFlag();
    cancel->store(true);
    {
        auto ch = makeChannel<ProgressMessage>();
        runTransferWithProgress(job, upFactory, cancel, ch.first);
        const auto msgs = drain(ch.second);
        t.check(firstError(msgs) == kCancelledMessage, "cancel reported");
        t.check(last(msgs).kind == ProgressMessage::Kind::Completed &&
                    last(msgs).success_count == 0,
                "cancelled transfer completes without successes");
    }

    job.names = {"missing"};
    {
        auto ch = makeChannel<ProgressMessage>();
        runTransferWithProgress(job, upFactory, makeCancelFlag(), ch.first);
        const auto msgs = drain(ch.second);
        t.check(firstError(msgs) == "Source no longer exists",
                "missing remote source reported");
        t.check(totalFilesOf(msgs) >= 1 && last(msgs).failure_count == 1,
                "missing item still counted in the file total");
    }

    up.addDirectory("/srv/empty");
    TempDir dest("empty-dir");
    job.target = Endpoint::local(dest.root.string());
    job.names = {"empty", "a"};
    {
        auto ch = makeChannel<ProgressMessage>();
        runTransferWithProgress(job, upFactory, makeCancelFlag(), ch.first);
        const auto msgs = drain(ch.second);
        const ProgressMessage &done = last(msgs);
        t.check(done.success_count == 2, "empty directory and file downloaded");
        t.check(done.success_count + done.failure_count <= totalFilesOf(msgs),
                "completions stay within the file total");
        t.check(fs::is_directory(dest.root / "empty"), "empty directory created");
    }

    job.names = {"a", "b"};
    {
        auto ch = makeChannel<ProgressMessage>();
        runTransferWithProgress(job, factory, makeCancelFlag(), ch.first);
        const auto msgs = drain(ch.second);
        t.check(last(msgs).failure_count <= totalFilesOf(msgs),
                "connection failure reports totals first");
    }
}

} // namespace

int main() {
    TempDir config("config");
    ::setenv("OPENDIR_CONFIG_DIR", config.root.c_str(), 1);

    TestContext t;
    test_session_defaults(t);
    test_mock_basics(t);
    test_download_keeps_existing_file(t);
    test_path_helpers(t);
    test_uri_parsing(t);
    test_remote_context(t);
    test_strategy_selection(t);
    test_upload_and_download(t);
    test_remote_to_remote(t);
    test_transfer_failures(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] opendir_core_remote_tests\n";
    return EXIT_SUCCESS;
}

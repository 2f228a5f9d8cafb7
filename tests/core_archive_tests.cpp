// Archive engine tests. The end-to-end part exits with 77 when no tar binary
// is installed.
#include "opendir/ArchiveEngine.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace opendir;

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

struct TempDir {
    fs::path root;

    TempDir() {
        const auto now =
            std::chrono::steady_clock::now().time_since_epoch().count();
        root = fs::temp_directory_path() /
               ("opendir-archive-" + std::to_string(now));
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

const ProgressMessage *completedOf(const std::vector<ProgressMessage> &msgs) {
    for (const auto &m : msgs) {
        if (m.kind == ProgressMessage::Kind::Completed)
            return &m;
    }
    return nullptr;
}

std::string firstError(const std::vector<ProgressMessage> &msgs) {
    for (const auto &m : msgs) {
        if (m.kind == ProgressMessage::Kind::Error)
            return m.message;
    }
    return {};
}

void test_compression_selection(TestContext &t) {
    t.check(compressionForName("a.tar.gz") == Compression::Gzip, "tar.gz");
    t.check(compressionForName("A.TGZ") == Compression::Gzip, "tgz any case");
    t.check(compressionForName("a.tar.bz2") == Compression::Bzip2, "tar.bz2");
    t.check(compressionForName("a.tbz2") == Compression::Bzip2, "tbz2");
    t.check(compressionForName("a.tar.xz") == Compression::Xz, "tar.xz");
    t.check(compressionForName("a.txz") == Compression::Xz, "txz");
    t.check(compressionForName("a.tar") == Compression::None, "plain tar");
    t.check(compressionForName("a.zip") == Compression::None, "unknown");

    t.check(isArchiveName("backup.tar.xz"), "tar.xz is an archive");
    t.check(!isArchiveName("notes.txt"), "txt is not an archive");
    t.check(extractDirName("logs.tar.gz") == "logs", "extract dir strips suffix");
    t.check(extractDirName("Logs.TGZ") == "Logs", "suffix match ignores case");
    t.check(extractDirName("odd.bin") == "odd.bin_extracted",
            "unknown suffix gets _extracted");
}

void test_listing_lines(TestContext &t) {
    std::string name;
    std::uint64_t size = 0;
    t.check(parseVerboseListingLine(
                "-rw-r--r-- user/group      1234 2024-01-02 10:11 ./dir/my file.txt",
                name, size),
            "GNU line parses");
    t.check(name == "./dir/my file.txt" && size == 1234,
            "GNU name keeps inner spaces");

    t.check(parseVerboseListingLine(
                "-rw-r--r--  1 user  staff  42 Jan  2 10:11 ./a.txt", name, size),
            "BSD line parses");
    t.check(name == "./a.txt" && size == 42, "BSD name and size");

    t.check(parseVerboseListingLine(
                "lrwxrwxrwx user/group 0 2024-01-02 10:11 ./ln -> target",
                name, size),
            "symlink line parses");
    t.check(name == "./ln", "symlink arrow stripped");

    t.check(parseVerboseListingLine(
                "drwxr-xr-x user/group 0 2024-01-02 10:11 ./dir/", name, size),
            "directory line parses");
    t.check(name == "./dir", "trailing slash stripped");

    t.check(!parseVerboseListingLine("tar: Removing leading '/'", name, size),
            "diagnostics are not members");
    t.check(!parseVerboseListingLine("", name, size), "empty line");
    t.check(!parseVerboseListingLine("garbage", name, size), "short line");
}

void test_arguments(TestContext &t) {
    TarRequest req;
    req.tar_binary = "/usr/bin/tar";
    req.base_dir = "/data";
    req.names = {"a", "b c"};
    req.archive_name = "out.tar.gz";
    req.excludes = {"a/link"};
    const auto argv = buildTarArguments(req, false);
    const std::vector<std::string> expected = {
        "/usr/bin/tar", "-czvf", "/data/out.tar.gz", "-C", "/data",
        "--exclude=./a/link", "--", "./a", "./b c"};
    t.check(argv == expected, "tar argv with excludes and -- separator");
}

void test_scan_excludes(TestContext &t) {
    TempDir tmp;
    writeFile(tmp.root / "sel" / "one.txt", "12345");
    writeFile(tmp.root / "sel" / "skip" / "two.txt", "67");
    ArchiveScan scan;
    std::string err;
    t.check(scanSelectionForTar(tmp.root, {"sel"}, {"sel/skip"}, makeCancelFlag(),
                                scan, err),
            "scan: " + err);
    t.check(scan.total_bytes == 5, "excluded subtree not counted");
    t.check(scan.sizes.count("./sel/one.txt") == 1, "keys use ./ prefix");
    t.check(scan.sizes.count("./sel/skip") == 0, "excluded key absent");
}

void test_request_validation(TestContext &t) {
    TempDir tmp;
    writeFile(tmp.root / "exists.tar", "x");
    {
        TarRequest req;
        req.tar_binary = "tar";
        req.base_dir = tmp.root;
        req.names = {"../etc"};
        req.archive_name = "x.tar";
        auto ch = makeChannel<ProgressMessage>();
        createArchiveWithProgress(req, makeCancelFlag(), ch.first);
        const auto msgs = drain(ch.second);
        const ProgressMessage *done = completedOf(msgs);
        t.check(done && done->failure_count == 1, "traversal name rejected");
    }
    {
        TarRequest req;
        req.tar_binary = "";
        req.base_dir = tmp.root;
        req.names = {"exists.tar"};
        req.archive_name = "new.tar";
        auto ch = makeChannel<ProgressMessage>();
        createArchiveWithProgress(req, makeCancelFlag(), ch.first);
        t.check(firstError(drain(ch.second)) == "tar not found",
                "missing tar binary reported");
    }
    {
        TarRequest req;
        req.tar_binary = "tar";
        req.base_dir = tmp.root;
        req.names = {"exists.tar"};
        req.archive_name = "exists.tar";
        auto ch = makeChannel<ProgressMessage>();
        createArchiveWithProgress(req, makeCancelFlag(), ch.first);
        t.check(firstError(drain(ch.second)).find("Archive already exists") == 0,
                "existing archive is not overwritten");
    }
}

void test_round_trip(TestContext &t, const std::string &tar) {
    TempDir tmp;
    writeFile(tmp.root / "proj" / "readme.md", "hello");
    writeFile(tmp.root / "proj" / "src" / "main.cpp", "int main() {}");

    TarRequest req;
    req.tar_binary = tar;
    req.base_dir = tmp.root;
    req.names = {"proj"};
    req.archive_name = "proj.tar.gz";
    {
        auto ch = makeChannel<ProgressMessage>();
        createArchiveWithProgress(req, makeCancelFlag(), ch.first);
        const auto msgs = drain(ch.second);
        const ProgressMessage *done = completedOf(msgs);
        t.check(done && done->failure_count == 0,
                "tar succeeds: " + firstError(msgs));
        t.check(done && done->success_count >= 3, "one success per member");
        t.check(fs::exists(tmp.root / "proj.tar.gz"), "archive written");
    }

    UntarRequest un;
    un.tar_binary = tar;
    un.archive_path = tmp.root / "proj.tar.gz";
    un.extract_dir = tmp.root / (extractDirName("proj.tar.gz") + "_out");
    {
        auto ch = makeChannel<ProgressMessage>();
        extractArchiveWithProgress(un, makeCancelFlag(), ch.first);
        const auto msgs = drain(ch.second);
        const ProgressMessage *done = completedOf(msgs);
        t.check(done && done->failure_count == 0,
                "untar succeeds: " + firstError(msgs));
        t.check(readFile(un.extract_dir / "proj" / "src" / "main.cpp") ==
                    "int main() {}",
                "extracted content matches");
    }
    {
        auto ch = makeChannel<ProgressMessage>();
        extractArchiveWithProgress(un, makeCancelFlag(), ch.first);
        t.check(firstError(drain(ch.second)).find("already exists") !=
                    std::string::npos,
                "second extract refuses an existing directory");
    }
    {
        UntarRequest bad = un;
        bad.archive_path = tmp.root / "missing.tar";
        bad.extract_dir = tmp.root / "missing";
        auto ch = makeChannel<ProgressMessage>();
        extractArchiveWithProgress(bad, makeCancelFlag(), ch.first);
        t.check(firstError(drain(ch.second)).find("Archive not found") == 0,
                "missing archive reported");
    }
}

} // namespace

int main() {
    TestContext t;
    test_compression_selection(t);
    test_listing_lines(t);
    test_arguments(t);
    test_scan_excludes(t);
    test_request_validation(t);

    const std::string tar = findTarBinary(std::getenv("OPENDIR_TAR")
                                              ? std::optional<std::string>(
                                                    std::getenv("OPENDIR_TAR"))
                                              : std::nullopt);
    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    if (tar.empty()) {
        std::cout << "[SKIP] opendir_core_archive_tests: no tar binary\n";
        return kSkipExitCode;
    }
    test_round_trip(t, tar);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] opendir_core_archive_tests\n";
    return EXIT_SUCCESS;
}

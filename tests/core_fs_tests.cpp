// Local filesystem engine tests without external framework (run via CTest).
#include "opendir/ConflictResolver.hpp"
#include "opendir/LocalFsEngine.hpp"
#include "opendir/PathValidator.hpp"
#include "opendir/SymlinkPolicy.hpp"

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

// Unique scratch directory removed on destruction.
struct TempDir {
    fs::path root;

    explicit TempDir(const std::string &tag) {
        const auto now =
            std::chrono::steady_clock::now().time_since_epoch().count();
        root = fs::temp_directory_path() /
               ("opendir-fs-" + tag + "-" + std::to_string(now));
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

// Runs synchronously, so everything the engine sent is already queued.
std::vector<ProgressMessage> drain(ProgressReceiver &rx) {
    std::vector<ProgressMessage> out;
    ProgressMessage m;
    while (rx.tryRecv(m) == RecvStatus::Ok)
        out.push_back(m);
    return out;
}

const ProgressMessage *findKind(const std::vector<ProgressMessage> &msgs,
                                ProgressMessage::Kind kind) {
    for (const auto &m : msgs) {
        if (m.kind == kind)
            return &m;
    }
    return nullptr;
}

std::size_t countKind(const std::vector<ProgressMessage> &msgs,
                      ProgressMessage::Kind kind) {
    return static_cast<std::size_t>(
        std::count_if(msgs.begin(), msgs.end(),
                      [kind](const ProgressMessage &m) { return m.kind == kind; }));
}

void test_filename_rules(TestContext &t) {
    t.check(isValidFilename("report.txt"), "plain name is valid");
    t.check(isValidFilename(".hidden"), "dot file is valid");
    t.check(isValidFilename("a b"), "inner space is valid");

    t.check(validateFilename("") == NameError::Empty, "empty name");
    t.check(validateFilename("   ") == NameError::Empty, "blank name");
    t.check(validateFilename(".") == NameError::ReservedDot, "dot");
    t.check(validateFilename("..") == NameError::ReservedDot, "dot dot");
    t.check(validateFilename("a/b") == NameError::Separator, "slash");
    t.check(validateFilename("a\\b") == NameError::Separator, "backslash");
    t.check(validateFilename("a..b") == NameError::TraversalComponent,
            "embedded traversal");
    t.check(validateFilename(std::string("a\nb")) == NameError::ControlChar,
            "newline");
    t.check(validateFilename(std::string(256, 'x')) == NameError::TooLong,
            "256 characters");
    t.check(validateFilename(std::string(255, 'x')) == NameError::None,
            "255 characters");
    t.check(validateFilename(" a") == NameError::EdgeWhitespace,
            "leading space");
    t.check(validateFilename("-rf") == NameError::LeadingDash, "leading dash");

    std::string why;
    t.check(!isValidFilename("-x", &why), "isValidFilename rejects dash");
    t.check(why == "Filename cannot start with hyphen", "dash message");
}

void test_path_helpers(TestContext &t) {
    t.check(isWithin("/a/b/c", "/a/b"), "child inside parent");
    t.check(isWithin("/a/b", "/a/b"), "path inside itself");
    t.check(!isWithin("/ab", "/a"), "prefix string is not a parent");
    t.check(isWithin("/a/b", "/a/"), "trailing separator on parent");

    TempDir tmp("resolve");
    fs::path out;
    std::string err;
    t.check(resolveAndVerify(tmp.root, "new.txt", out, err),
            "fresh name resolves: " + err);
    t.check(out.filename() == "new.txt", "resolved name kept");

    TempDir outside("outside");
    fs::create_directory_symlink(outside.root, tmp.root / "escape");
    err.clear();
    t.check(!resolveAndVerify(tmp.root, "escape", out, err),
            "symlink leaving the parent is rejected");
    t.checkContains(err, "escapes parent", "escape message");

    const fs::path fallback = tmp.root;
    const fs::path resolved = resolvePath(
        (tmp.root / "missing" / "deeper").string(), [&] { return fallback; });
    t.check(resolved == fs::canonical(tmp.root),
            "missing path walks up to the nearest directory");
    t.check(resolvePath(std::string("relative/path"), [&] { return fallback; }) ==
                fallback,
            "relative path uses the fallback");
}

void test_copy_with_conflicts(TestContext &t) {
    TempDir tmp("copy");
    const fs::path src = tmp.root / "src";
    const fs::path dst = tmp.root / "dst";
    writeFile(src / "x.txt", "new-x");
    writeFile(src / "y.txt", "new-y");
    writeFile(src / "dir" / "inner.txt", "inner");
    writeFile(dst / "x.txt", "old-x");

    const auto conflicts = detectConflicts({"x.txt", "y.txt", "dir"}, src, dst);
    t.check(conflicts.size() == 1 && conflicts[0].display_name == "x.txt",
            "only x.txt conflicts");

    {
        auto ch = makeChannel<ProgressMessage>();
        copyFilesWithProgress({"x.txt", "y.txt", "dir"}, src, dst, {},
                              {(src / "x.txt").string()}, makeCancelFlag(),
                              ch.first);
        const auto msgs = drain(ch.second);
        const ProgressMessage *done = findKind(msgs, ProgressMessage::Kind::Completed);
        t.check(done && done->success_count == 2 && done->failure_count == 0,
                "skip set leaves two successes");
        t.check(countKind(msgs, ProgressMessage::Kind::Completed) == 1,
                "exactly one Completed");
        t.check(readFile(dst / "x.txt") == "old-x", "skipped file untouched");
        t.check(readFile(dst / "dir" / "inner.txt") == "inner",
                "directory copied recursively");
    }
    {
        auto ch = makeChannel<ProgressMessage>();
        copyFilesWithProgress({"x.txt"}, src, dst, {}, {}, makeCancelFlag(),
                              ch.first);
        const auto msgs = drain(ch.second);
        const ProgressMessage *e = findKind(msgs, ProgressMessage::Kind::Error);
        t.check(e && e->message == "Target already exists",
                "existing target without overwrite fails");
        t.check(readFile(dst / "x.txt") == "old-x", "failed copy kept target");
    }
    {
        auto ch = makeChannel<ProgressMessage>();
        copyFilesWithProgress({"x.txt"}, src, dst, {(src / "x.txt").string()},
                              {}, makeCancelFlag(), ch.first);
        const auto msgs = drain(ch.second);
        const ProgressMessage *done = findKind(msgs, ProgressMessage::Kind::Completed);
        t.check(done && done->success_count == 1, "overwrite succeeds");
        t.check(readFile(dst / "x.txt") == "new-x", "overwrite replaced content");
        t.check(readFile(src / "x.txt") == "new-x", "copy keeps the source");
    }
}

void test_totals_reach_full_size(TestContext &t) {
    TempDir tmp("totals");
    const std::string big(200 * 1024, 'z');
    writeFile(tmp.root / "src" / "big.bin", big);
    fs::create_directories(tmp.root / "dst");

    auto ch = makeChannel<ProgressMessage>();
    copyFilesWithProgress({"big.bin"}, tmp.root / "src", tmp.root / "dst", {},
                          {}, makeCancelFlag(), ch.first);
    const auto msgs = drain(ch.second);
    t.check(!msgs.empty() && msgs.front().kind == ProgressMessage::Kind::Preparing,
            "stream starts with Preparing");
    t.check(countKind(msgs, ProgressMessage::Kind::FileProgress) >= 3,
            "64 KiB chunks give several FileProgress messages");
    std::uint64_t last = 0;
    std::uint64_t total = 0;
    for (const auto &m : msgs) {
        if (m.kind == ProgressMessage::Kind::TotalProgress) {
            last = m.completed_bytes;
            total = m.total_bytes;
        }
    }
    t.check(total == big.size(), "total bytes from the pre-scan");
    t.check(last == big.size(), "completed bytes reach the total");
    t.check(msgs.back().kind == ProgressMessage::Kind::Completed,
            "stream ends with Completed");
}

// Completed(s, f) must never exceed the last reported file total.
void checkCompletionWithinTotals(TestContext &t,
                                 const std::vector<ProgressMessage> &msgs,
                                 const std::string &label) {
    std::size_t total = 0;
    for (const auto &m : msgs) {
        if (m.kind == ProgressMessage::Kind::TotalProgress)
            total = m.total_files;
    }
    const ProgressMessage *done = findKind(msgs, ProgressMessage::Kind::Completed);
    t.check(done != nullptr, label + ": Completed sent");
    if (done) {
        t.check(done->success_count + done->failure_count <= total,
                label + ": s+f=" +
                    std::to_string(done->success_count + done->failure_count) +
                    " total=" + std::to_string(total));
    }
}

void test_completion_within_totals(TestContext &t) {
    TempDir tmp("counts");
    const fs::path src = tmp.root / "src";
    const fs::path dst = tmp.root / "dst";
    fs::create_directories(src / "emptydir");
    fs::create_directories(src / "hollow" / "inner");
    writeFile(src / "one.txt", "1");
    fs::create_directories(dst);

    {
        auto ch = makeChannel<ProgressMessage>();
        copyFilesWithProgress({"emptydir"}, src, dst, {}, {}, makeCancelFlag(),
                              ch.first);
        const auto msgs = drain(ch.second);
        checkCompletionWithinTotals(t, msgs, "copy empty directory");
        t.check(fs::is_directory(dst / "emptydir"), "empty directory copied");
    }
    {
        auto ch = makeChannel<ProgressMessage>();
        copyFilesWithProgress({"hollow", "one.txt", "ghost"}, src, dst, {}, {},
                              makeCancelFlag(), ch.first);
        const auto msgs = drain(ch.second);
        checkCompletionWithinTotals(t, msgs, "mixed batch with a missing item");
        const ProgressMessage *done =
            findKind(msgs, ProgressMessage::Kind::Completed);
        t.check(done && done->success_count == 2 && done->failure_count == 1,
                "two copied, one missing");
    }
    {
        auto ch = makeChannel<ProgressMessage>();
        moveFilesWithProgress({"emptydir"}, src, tmp.root, {}, {},
                              makeCancelFlag(), ch.first);
        const auto msgs = drain(ch.second);
        checkCompletionWithinTotals(t, msgs, "move empty directory");
        t.check(!fs::exists(src / "emptydir"), "empty directory moved");
    }
    {
        CancelFlag cancel = makeCancelFlag();
        cancel->store(true);
        auto ch = makeChannel<ProgressMessage>();
        copyFilesWithProgress({"one.txt"}, src, dst / "nested", {}, {}, cancel,
                              ch.first);
        checkCompletionWithinTotals(t, drain(ch.second), "cancel during scan");
    }
}

void test_move_and_duplicate(TestContext &t) {
    TempDir tmp("move");
    const fs::path src = tmp.root / "src";
    const fs::path dst = tmp.root / "dst";
    writeFile(src / "a.txt", "A");
    writeFile(src / "folder" / "f.txt", "F");
    fs::create_directories(dst);

    auto ch = makeChannel<ProgressMessage>();
    moveFilesWithProgress({"a.txt", "folder"}, src, dst, {}, {},
                          makeCancelFlag(), ch.first);
    const auto msgs = drain(ch.second);
    const ProgressMessage *done = findKind(msgs, ProgressMessage::Kind::Completed);
    t.check(done && done->success_count == 2, "move succeeds for both");
    t.check(!fs::exists(src / "a.txt") && !fs::exists(src / "folder"),
            "move removed the sources");
    t.check(readFile(dst / "folder" / "f.txt") == "F", "moved tree intact");

    t.check(duplicateName(dst, "a.txt") == "a_dup.txt", "first duplicate name");
    writeFile(dst / "a_dup.txt", "x");
    t.check(duplicateName(dst, "a.txt") == "a_dup2.txt", "second duplicate name");
    t.check(duplicateName(dst, "folder") == "folder_dup",
            "directories keep dots in the stem");

    auto dup = makeChannel<ProgressMessage>();
    duplicateFilesWithProgress({"a.txt", "folder"}, dst, makeCancelFlag(),
                               dup.first);
    drain(dup.second);
    t.check(readFile(dst / "a_dup2.txt") == "A", "duplicate file created");
    t.check(readFile(dst / "folder_dup" / "f.txt") == "F",
            "duplicate directory created");
}

void test_copy_into_self(TestContext &t) {
    TempDir tmp("self");
    writeFile(tmp.root / "a" / "sub" / "f", "1");

    auto ch = makeChannel<ProgressMessage>();
    copyFilesWithProgress({"a"}, tmp.root, tmp.root / "a" / "sub", {}, {},
                          makeCancelFlag(), ch.first);
    const auto msgs = drain(ch.second);
    const ProgressMessage *e = findKind(msgs, ProgressMessage::Kind::Error);
    t.check(e && e->message == "Cannot copy a directory into itself",
            "copy into own subtree is refused");
    t.check(!fs::exists(tmp.root / "a" / "sub" / "a"), "nothing was created");
}

void test_cancellation(TestContext &t) {
    TempDir tmp("cancel");
    writeFile(tmp.root / "src" / "f.txt", "data");
    fs::create_directories(tmp.root / "dst");

    CancelFlag cancel = makeCancelFlag();
    cancel->store(true);
    auto ch = makeChannel<ProgressMessage>();
    copyFilesWithProgress({"f.txt"}, tmp.root / "src", tmp.root / "dst", {}, {},
                          cancel, ch.first);
    const auto msgs = drain(ch.second);
    const ProgressMessage *e = findKind(msgs, ProgressMessage::Kind::Error);
    t.check(e && e->message == kCancelledMessage, "cancel reports Cancelled");
    t.check(msgs.back().kind == ProgressMessage::Kind::Completed &&
                msgs.back().failure_count >= 1,
            "cancelled batch still completes");
    t.check(!fs::exists(tmp.root / "dst" / "f.txt"), "no partial file left");
}

void test_missing_source(TestContext &t) {
    TempDir tmp("missing");
    fs::create_directories(tmp.root / "dst");
    auto ch = makeChannel<ProgressMessage>();
    copyFilesWithProgress({"ghost"}, tmp.root, tmp.root / "dst", {}, {},
                          makeCancelFlag(), ch.first);
    const auto msgs = drain(ch.second);
    const ProgressMessage *e = findKind(msgs, ProgressMessage::Kind::Error);
    t.check(e != nullptr, "missing source is an error");
    if (e)
        t.checkContains(e->message, "Source not found", "missing source message");
}

void test_delete_and_dialog_ops(TestContext &t) {
    TempDir tmp("ops");
    std::string err;
    t.check(createDirectory(tmp.root, "made", err), "mkdir: " + err);
    err.clear();
    t.check(!createDirectory(tmp.root, "made", err), "mkdir twice fails");
    t.checkContains(err, "already exists", "mkdir exists message");
    err.clear();
    t.check(!createDirectory(tmp.root, "../evil", err), "mkdir with traversal");
    err.clear();
    t.check(createFile(tmp.root, "file.txt", err), "mkfile: " + err);
    err.clear();
    t.check(!createFile(tmp.root, "file.txt", err), "mkfile twice fails");
    err.clear();
    t.check(renameEntry(tmp.root, "file.txt", "renamed.txt", err),
            "rename: " + err);
    err.clear();
    t.check(!renameEntry(tmp.root, "renamed.txt", "made", err),
            "rename onto existing fails");
    err.clear();
    t.check(!renameEntry(tmp.root, "renamed.txt", "a/b", err),
            "rename with separator fails");

    writeFile(tmp.root / "target" / "keep.txt", "k");
    fs::create_directory_symlink(tmp.root / "target", tmp.root / "link");
    err.clear();
    t.check(deleteFile(tmp.root / "link", err), "delete symlink: " + err);
    t.check(fs::exists(tmp.root / "target" / "keep.txt"),
            "deleting a link keeps its target");
    err.clear();
    t.check(deleteFile(tmp.root / "target", err), "delete tree: " + err);
    t.check(!fs::exists(tmp.root / "target"), "tree removed");
    err.clear();
    t.check(!deleteFile(tmp.root / "nope", err), "delete missing fails");

    std::uint64_t bytes = 0;
    std::size_t files = 0;
    writeFile(tmp.root / "sized" / "a", "123");
    writeFile(tmp.root / "sized" / "b" / "c", "45");
    err.clear();
    t.check(calculateTotals({tmp.root / "sized"}, makeCancelFlag(), bytes,
                            files, err),
            "totals: " + err);
    t.check(bytes == 5 && files == 2, "totals count bytes and files");
}

void test_symlink_policy(TestContext &t) {
    TempDir tmp("links");
    TempDir outside("links-out");
    const fs::path sel = tmp.root / "sel";
    writeFile(sel / "inner.txt", "i");
    writeFile(outside.root / "secret.txt", "s");
    fs::create_symlink(sel / "inner.txt", sel / "ok_link");
    fs::create_symlink(outside.root / "secret.txt", sel / "out_link");
    fs::create_symlink("/etc/hostname", sel / "etc_link");
    fs::create_symlink(sel / "does-not-exist", sel / "dangling");

    const auto flagged = scanFlaggedSymlinks(tmp.root, {"sel"});
    auto reasonOf = [&](const std::string &rel) -> std::string {
        for (const auto &f : flagged) {
            if (f.relative_path == rel)
                return f.reason;
        }
        return {};
    };
    t.check(reasonOf("sel/ok_link").empty(), "link inside the root is fine");
    t.check(reasonOf("sel/out_link") == "Points outside the selection root",
            "outside link flagged");
    if (fs::exists("/etc/hostname"))
        t.check(reasonOf("sel/etc_link") == "Points to sensitive system path",
                "system link flagged");
    t.check(reasonOf("sel/dangling") == "Unresolvable target",
            "dangling link flagged");
    t.check(isSensitiveTarget("/proc/self"), "/proc is sensitive");
    t.check(!isSensitiveTarget("/usr/share"), "/usr/share is not sensitive");

    // Excluding the flagged link during a copy leaves it out of the result.
    fs::create_directories(tmp.root / "dst");
    PathSet excluded = {(sel / "out_link").string(), (sel / "etc_link").string(),
                        (sel / "dangling").string()};
    auto ch = makeChannel<ProgressMessage>();
    copyFilesWithProgress({"sel"}, tmp.root, tmp.root / "dst", {}, {},
                          makeCancelFlag(), ch.first, excluded);
    drain(ch.second);
    t.check(fs::is_symlink(fs::symlink_status(tmp.root / "dst" / "sel" / "ok_link")),
            "kept link copied as a link");
    t.check(!fs::exists(fs::symlink_status(tmp.root / "dst" / "sel" / "out_link")),
            "excluded link not copied");
}

void test_conflict_resolver(TestContext &t) {
    std::vector<ConflictItem> items = {
        {"/s/a", "/d/a", "a"}, {"/s/b", "/d/b", "b"}, {"/s/c", "/d/c", "c"}};
    ConflictResolver r(items);
    t.check(r.current() && r.current()->display_name == "a", "starts at a");
    r.apply(ConflictChoice::Overwrite);
    r.apply(ConflictChoice::SkipAll);
    t.check(r.finished() && r.current() == nullptr, "skip all finishes");
    t.check(r.overwriteSet().count("/s/a") == 1, "a overwritten");
    t.check(r.skipSet().count("/s/b") && r.skipSet().count("/s/c"),
            "b and c skipped");
    r.apply(ConflictChoice::Overwrite);
    t.check(r.overwriteSet().size() == 1, "apply after finish is a no-op");
}

} // namespace

int main() {
    TestContext t;
    test_filename_rules(t);
    test_path_helpers(t);
    test_copy_with_conflicts(t);
    test_totals_reach_full_size(t);
    test_completion_within_totals(t);
    test_move_and_duplicate(t);
    test_copy_into_self(t);
    test_cancellation(t);
    test_missing_source(t);
    test_delete_and_dialog_ops(t);
    test_symlink_policy(t);
    test_conflict_resolver(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] opendir_core_fs_tests\n";
    return EXIT_SUCCESS;
}

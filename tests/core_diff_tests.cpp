// Directory comparison tests (run via CTest).
#include "opendir/DirDiff.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
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
};

struct TempDir {
    fs::path root;

    TempDir() {
        const auto now =
            std::chrono::steady_clock::now().time_since_epoch().count();
        root = fs::temp_directory_path() /
               ("opendir-diff-" + std::to_string(now));
        fs::create_directories(root / "left");
        fs::create_directories(root / "right");
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    fs::path left() const { return root / "left"; }
    fs::path right() const { return root / "right"; }
};

void writeFile(const fs::path &p, const std::string &content) {
    fs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << content;
}

const DiffRow *findRow(const DiffReport &r, const std::string &rel) {
    for (const auto &row : r.rows) {
        if (row.rel_path == rel)
            return &row;
    }
    return nullptr;
}

bool hasStatus(const DiffReport &r, const std::string &rel, DiffStatus s) {
    const DiffRow *row = findRow(r, rel);
    return row && row->status == s;
}

void test_method_names(TestContext &t) {
    CompareMethod m = CompareMethod::Content;
    t.check(parseCompareMethod("modified_time", m) &&
                m == CompareMethod::ModifiedTime,
            "parse modified_time");
    t.check(parseCompareMethod("content_and_time", m) &&
                m == CompareMethod::ContentAndTime,
            "parse content_and_time");
    t.check(!parseCompareMethod("size", m), "unknown method rejected");
    t.check(std::string(compareMethodName(CompareMethod::Content)) == "content",
            "method name");
    t.check(std::string(diffStatusName(DiffStatus::RightOnly)) == "right-only",
            "status name");
}

void test_tree_classification(TestContext &t) {
    TempDir tmp;
    writeFile(tmp.left() / "same.txt", "hello");
    writeFile(tmp.right() / "same.txt", "hello");
    writeFile(tmp.left() / "changed.txt", "aaaa");
    writeFile(tmp.right() / "changed.txt", "aaab");
    writeFile(tmp.left() / "only-left.txt", "l");
    writeFile(tmp.right() / "only-right.txt", "r");
    writeFile(tmp.left() / "src" / "main.c", "int main;");
    writeFile(tmp.right() / "src" / "main.c", "int main;");
    writeFile(tmp.left() / "src" / "deep" / "util.c", "v1");
    writeFile(tmp.right() / "src" / "deep" / "util.c", "v2");
    writeFile(tmp.left() / "docs" / "a.md", "same");
    writeFile(tmp.right() / "docs" / "a.md", "same");

    DiffReport report;
    std::string err;
    const bool ok = compareDirectories(tmp.left(), tmp.right(),
                                       CompareMethod::Content,
                                       makeCancelFlag(), report, err);
    t.check(ok, "compare succeeds: " + err);
    t.check(hasStatus(report, "same.txt", DiffStatus::Same), "equal files");
    t.check(hasStatus(report, "changed.txt", DiffStatus::Modified),
            "same size, different bytes");
    t.check(hasStatus(report, "only-left.txt", DiffStatus::LeftOnly),
            "left only");
    t.check(hasStatus(report, "only-right.txt", DiffStatus::RightOnly),
            "right only");
    t.check(hasStatus(report, "src/deep/util.c", DiffStatus::Modified),
            "nested change found");
    t.check(hasStatus(report, "src/deep", DiffStatus::DirModified) &&
                hasStatus(report, "src", DiffStatus::DirModified),
            "changes roll up to every ancestor");
    t.check(hasStatus(report, "docs", DiffStatus::Same),
            "identical directory stays same");
    t.check(!report.identical(), "report not identical");
    t.check(report.count(DiffStatus::LeftOnly) == 1, "count by status");

    // Directories first at each level, children right after their parent.
    t.check(!report.rows.empty() && report.rows.front().is_dir,
            "directories listed first");
    std::size_t srcIdx = report.rows.size();
    for (std::size_t i = 0; i < report.rows.size(); ++i) {
        if (report.rows[i].rel_path == "src")
            srcIdx = i;
    }
    t.check(srcIdx + 1 < report.rows.size() &&
                report.rows[srcIdx + 1].rel_path.rfind("src/", 0) == 0 &&
                report.rows[srcIdx + 1].depth == 1,
            "pre-order flatten");
}

void test_type_mismatch_and_time(TestContext &t) {
    TempDir tmp;
    writeFile(tmp.left() / "thing", "file");
    fs::create_directories(tmp.right() / "thing");
    writeFile(tmp.left() / "stamp.txt", "x");
    writeFile(tmp.right() / "stamp.txt", "x");
    const auto now = fs::file_time_type::clock::now();
    fs::last_write_time(tmp.left() / "stamp.txt", now - std::chrono::hours(2));
    fs::last_write_time(tmp.right() / "stamp.txt", now);

    DiffReport content;
    std::string err;
    t.check(compareDirectories(tmp.left(), tmp.right(), CompareMethod::Content,
                               makeCancelFlag(), content, err),
            "content compare: " + err);
    t.check(hasStatus(content, "thing", DiffStatus::Modified),
            "file against directory is modified");
    t.check(hasStatus(content, "stamp.txt", DiffStatus::Same),
            "content mode ignores timestamps");

    DiffReport timed;
    t.check(compareDirectories(tmp.left(), tmp.right(),
                               CompareMethod::ModifiedTime, makeCancelFlag(),
                               timed, err),
            "time compare: " + err);
    t.check(hasStatus(timed, "stamp.txt", DiffStatus::Modified),
            "time mode sees the older copy");

    DiffReport both;
    t.check(compareDirectories(tmp.left(), tmp.right(),
                               CompareMethod::ContentAndTime, makeCancelFlag(),
                               both, err),
            "combined compare: " + err);
    t.check(hasStatus(both, "stamp.txt", DiffStatus::Modified),
            "combined mode requires equal times");
}

void test_errors_and_cancel(TestContext &t) {
    TempDir tmp;
    writeFile(tmp.left() / "a", "a");
    writeFile(tmp.right() / "a", "a");

    DiffReport report;
    std::string err;
    t.check(!compareDirectories(tmp.left() / "a", tmp.right(),
                                CompareMethod::Content, makeCancelFlag(),
                                report, err),
            "file root rejected");
    t.check(err.rfind("Not a directory", 0) == 0, "root error message");

    CancelFlag cancel = makeCancelFlag();
    cancel->store(true);
    err.clear();
    t.check(!compareDirectories(tmp.left(), tmp.right(), CompareMethod::Content,
                                cancel, report, err) &&
                err == kCancelledMessage,
            "cancel stops the comparison");
}

void test_worker_stream(TestContext &t) {
    TempDir tmp;
    writeFile(tmp.left() / "one", "1");
    writeFile(tmp.right() / "one", "1");
    writeFile(tmp.left() / "two", "2");

    auto progress = makeChannel<ProgressMessage>();
    auto result = makeChannel<DiffReport>();
    compareDirectoriesWithProgress(tmp.left(), tmp.right(),
                                   CompareMethod::Content, makeCancelFlag(),
                                   progress.first, result.first);

    DiffReport report;
    t.check(result.second.tryRecv(report) == RecvStatus::Ok,
            "report delivered");
    t.check(report.rows.size() == 2, "two rows reported");

    std::vector<ProgressMessage> msgs;
    ProgressMessage m;
    while (progress.second.tryRecv(m) == RecvStatus::Ok)
        msgs.push_back(m);
    std::size_t completed = 0;
    for (const auto &msg : msgs) {
        if (msg.kind == ProgressMessage::Kind::Completed)
            ++completed;
    }
    t.check(completed == 1 && !msgs.empty() &&
                msgs.back().kind == ProgressMessage::Kind::Completed,
            "exactly one trailing Completed");
    t.check(msgs.back().success_count == 2 && msgs.back().failure_count == 0,
            "every file compared");

    auto badProgress = makeChannel<ProgressMessage>();
    auto badResult = makeChannel<DiffReport>();
    compareDirectoriesWithProgress(tmp.root / "missing", tmp.right(),
                                   CompareMethod::Content, makeCancelFlag(),
                                   badProgress.first, badResult.first);
    t.check(badResult.second.tryRecv(report) != RecvStatus::Ok,
            "no report on failure");
    ProgressMessage first;
    t.check(badProgress.second.tryRecv(first) == RecvStatus::Ok &&
                first.kind == ProgressMessage::Kind::Error,
            "failure reported as error");
}

} // namespace

int main() {
    TestContext t;
    test_method_names(t);
    test_tree_classification(t);
    test_type_mismatch_and_time(t);
    test_errors_and_cancel(t);
    test_worker_stream(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] opendir_core_diff_tests\n";
    return EXIT_SUCCESS;
}

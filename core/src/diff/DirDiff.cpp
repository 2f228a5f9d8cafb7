// Breadth-first walk that pairs entries by name, a reverse pass that rolls
// child differences up into DirModified, and a pre-order flatten for display.
#include "opendir/DirDiff.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <deque>
#include <fstream>
#include <map>
#include <system_error>

namespace fs = std::filesystem;

namespace opendir {

namespace {

struct Side {
    bool present = false;
    bool is_dir = false;
    bool is_symlink = false;
    std::uint64_t size = 0;
    fs::file_time_type mtime{};
};

struct Node {
    std::string rel;
    std::string name;
    int depth = 0;
    Side left;
    Side right;
    DiffStatus status = DiffStatus::Same;
    std::vector<std::size_t> children;
};

Side inspect(const fs::path &p) {
    Side s;
    std::error_code ec;
    const fs::file_status st = fs::symlink_status(p, ec);
    if (ec || !fs::exists(st))
        return s;
    s.present = true;
    s.is_symlink = fs::is_symlink(st);
    s.is_dir = fs::is_directory(st);
    if (fs::is_regular_file(st)) {
        s.size = fs::file_size(p, ec);
        if (ec)
            s.size = 0;
    }
    s.mtime = fs::last_write_time(p, ec);
    return s;
}

// Entry names of dir; empty when it cannot be read.
std::vector<std::string> listNames(const fs::path &dir) {
    std::vector<std::string> names;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end;
         it.increment(ec))
        names.push_back(it->path().filename().string());
    return names;
}

bool sameMtime(const Side &a, const Side &b) {
    using std::chrono::duration_cast;
    using std::chrono::seconds;
    return duration_cast<seconds>(a.mtime.time_since_epoch()) ==
           duration_cast<seconds>(b.mtime.time_since_epoch());
}

enum class ContentResult { Equal, Different, Cancelled, ReadError };

ContentResult sameContent(const fs::path &a, const fs::path &b,
                          const CancelFlag &cancel, std::string &err) {
    std::ifstream fa(a, std::ios::binary);
    std::ifstream fb(b, std::ios::binary);
    if (!fa || !fb) {
        err = "Cannot open '" + (fa ? b : a).string() + "'";
        return ContentResult::ReadError;
    }
    std::vector<char> ba(kCopyBufferSize);
    std::vector<char> bb(kCopyBufferSize);
    while (true) {
        if (isCancelled(cancel))
            return ContentResult::Cancelled;
        fa.read(ba.data(), static_cast<std::streamsize>(ba.size()));
        fb.read(bb.data(), static_cast<std::streamsize>(bb.size()));
        const std::streamsize na = fa.gcount();
        const std::streamsize nb = fb.gcount();
        if (na != nb ||
            std::memcmp(ba.data(), bb.data(), static_cast<std::size_t>(na)) != 0)
            return ContentResult::Different;
        if (na == 0)
            return ContentResult::Equal;
        if (fa.bad() || fb.bad()) {
            err = "Read error comparing '" + a.string() + "'";
            return ContentResult::ReadError;
        }
    }
}

class DiffWalk {
public:
    DiffWalk(const fs::path &left, const fs::path &right, CompareMethod method,
             const CancelFlag &cancel, const ProgressSender *tx,
             std::size_t *readFailures)
        : left_(left), right_(right), method_(method), cancel_(cancel),
          tx_(tx), readFailures_(readFailures) {}

    bool run(std::vector<DiffRow> &rows, std::string &err) {
        if (tx_)
            tx_->send(ProgressMessage::preparing("Scanning directories..."));
        if (!walk(err))
            return false;
        if (tx_) {
            tx_->send(ProgressMessage::prepareComplete());
            reportTotals();
        }
        if (!compareFiles(err))
            return false;
        rollUp();
        for (std::size_t root : roots_)
            flatten(root, rows);
        return true;
    }

    std::size_t comparedFiles() const { return completedFiles_; }

private:
    fs::path left_;
    fs::path right_;
    CompareMethod method_;
    const CancelFlag &cancel_;
    const ProgressSender *tx_;
    std::size_t *readFailures_;

    std::vector<Node> nodes_;
    std::vector<std::size_t> roots_;
    std::vector<std::size_t> filePairs_;
    std::uint64_t totalBytes_ = 0;
    std::uint64_t completedBytes_ = 0;
    std::size_t completedFiles_ = 0;

    void reportTotals() const {
        if (tx_)
            tx_->send(ProgressMessage::totalProgress(
                completedFiles_, filePairs_.size(), completedBytes_,
                totalBytes_));
    }

    // Children sorted directories first, then by name.
    void addChildren(const std::string &rel, int depth,
                     std::vector<std::size_t> &into,
                     std::deque<std::size_t> &queue) {
        const fs::path l = rel.empty() ? left_ : left_ / rel;
        const fs::path r = rel.empty() ? right_ : right_ / rel;
        std::map<std::string, bool> names;
        for (const auto &n : listNames(l))
            names[n] = true;
        for (const auto &n : listNames(r))
            names[n] = true;

        std::vector<std::size_t> created;
        for (const auto &entry : names) {
            Node node;
            node.name = entry.first;
            node.rel = rel.empty() ? entry.first : rel + "/" + entry.first;
            node.depth = depth;
            node.left = inspect(left_ / node.rel);
            node.right = inspect(right_ / node.rel);
            nodes_.push_back(std::move(node));
            created.push_back(nodes_.size() - 1);
        }
        std::stable_sort(created.begin(), created.end(),
                         [this](std::size_t a, std::size_t b) {
                             return isDirNode(nodes_[a]) > isDirNode(nodes_[b]);
                         });
        for (std::size_t idx : created) {
            into.push_back(idx);
            classify(idx, queue);
        }
    }

    static bool isDirNode(const Node &n) {
        return (n.left.present ? n.left.is_dir : n.right.is_dir);
    }

    void classify(std::size_t idx, std::deque<std::size_t> &queue) {
        Node &n = nodes_[idx];
        if (!n.right.present) {
            n.status = DiffStatus::LeftOnly;
        } else if (!n.left.present) {
            n.status = DiffStatus::RightOnly;
        } else if (n.left.is_dir != n.right.is_dir ||
                   n.left.is_symlink != n.right.is_symlink) {
            n.status = DiffStatus::Modified;
        } else if (n.left.is_dir) {
            queue.push_back(idx);
        } else if (n.left.is_symlink) {
            std::error_code e1, e2;
            const auto t1 = fs::read_symlink(left_ / n.rel, e1);
            const auto t2 = fs::read_symlink(right_ / n.rel, e2);
            n.status = (!e1 && !e2 && t1 == t2) ? DiffStatus::Same
                                                : DiffStatus::Modified;
        } else {
            filePairs_.push_back(idx);
            if (method_ != CompareMethod::ModifiedTime)
                totalBytes_ += n.left.size;
        }
    }

    bool walk(std::string &err) {
        std::deque<std::size_t> queue;
        addChildren(std::string(), 0, roots_, queue);
        while (!queue.empty()) {
            if (isCancelled(cancel_)) {
                err = kCancelledMessage;
                return false;
            }
            const std::size_t idx = queue.front();
            queue.pop_front();
            std::vector<std::size_t> children;
            addChildren(nodes_[idx].rel, nodes_[idx].depth + 1, children,
                        queue);
            nodes_[idx].children = std::move(children);
        }
        return true;
    }

    bool compareFiles(std::string &err) {
        for (std::size_t idx : filePairs_) {
            if (isCancelled(cancel_)) {
                err = kCancelledMessage;
                return false;
            }
            Node &n = nodes_[idx];
            if (tx_)
                tx_->send(ProgressMessage::fileStarted(n.rel));

            bool same = true;
            if (method_ != CompareMethod::Content)
                same = sameMtime(n.left, n.right);
            if (same && method_ != CompareMethod::ModifiedTime) {
                if (n.left.size != n.right.size) {
                    same = false;
                } else {
                    std::string readErr;
                    switch (sameContent(left_ / n.rel, right_ / n.rel, cancel_,
                                        readErr)) {
                    case ContentResult::Equal:
                        break;
                    case ContentResult::Different:
                        same = false;
                        break;
                    case ContentResult::Cancelled:
                        err = kCancelledMessage;
                        return false;
                    case ContentResult::ReadError:
                        same = false;
                        if (readFailures_)
                            ++*readFailures_;
                        if (tx_)
                            tx_->send(ProgressMessage::error(n.rel, readErr));
                        break;
                    }
                }
            }
            n.status = same ? DiffStatus::Same : DiffStatus::Modified;

            ++completedFiles_;
            if (method_ != CompareMethod::ModifiedTime)
                completedBytes_ += n.left.size;
            if (tx_) {
                tx_->send(ProgressMessage::fileCompleted(n.rel));
                reportTotals();
            }
        }
        return true;
    }

    // Nodes were appended breadth-first, so walking backwards visits every
    // child before its parent.
    void rollUp() {
        for (std::size_t i = nodes_.size(); i-- > 0;) {
            Node &n = nodes_[i];
            if (!n.left.present || !n.right.present || !n.left.is_dir ||
                !n.right.is_dir)
                continue;
            const bool differs =
                std::any_of(n.children.begin(), n.children.end(),
                            [this](std::size_t c) {
                                return nodes_[c].status != DiffStatus::Same;
                            });
            n.status = differs ? DiffStatus::DirModified : DiffStatus::Same;
        }
    }

    void flatten(std::size_t idx, std::vector<DiffRow> &rows) const {
        const Node &n = nodes_[idx];
        DiffRow row;
        row.rel_path = n.rel;
        row.name = n.name;
        row.depth = n.depth;
        row.is_dir = isDirNode(n);
        row.status = n.status;
        row.left_size = n.left.size;
        row.right_size = n.right.size;
        rows.push_back(std::move(row));
        for (std::size_t c : n.children)
            flatten(c, rows);
    }
};

bool isReadableDir(const fs::path &p, std::string &err) {
    std::error_code ec;
    if (!fs::is_directory(p, ec)) {
        err = "Not a directory: " + p.string();
        return false;
    }
    fs::directory_iterator it(p, ec);
    if (ec) {
        err = "Cannot read '" + p.string() + "': " + ec.message();
        return false;
    }
    return true;
}

} // namespace

bool parseCompareMethod(const std::string &text, CompareMethod &out) {
    if (text == "content") {
        out = CompareMethod::Content;
    } else if (text == "modified_time") {
        out = CompareMethod::ModifiedTime;
    } else if (text == "content_and_time") {
        out = CompareMethod::ContentAndTime;
    } else {
        return false;
    }
    return true;
}

const char *compareMethodName(CompareMethod method) {
    switch (method) {
    case CompareMethod::Content:
        return "content";
    case CompareMethod::ModifiedTime:
        return "modified_time";
    case CompareMethod::ContentAndTime:
        return "content_and_time";
    }
    return "content";
}

const char *diffStatusName(DiffStatus status) {
    switch (status) {
    case DiffStatus::Same:
        return "same";
    case DiffStatus::Modified:
        return "modified";
    case DiffStatus::LeftOnly:
        return "left-only";
    case DiffStatus::RightOnly:
        return "right-only";
    case DiffStatus::DirModified:
        return "dir-modified";
    }
    return "same";
}

std::size_t DiffReport::count(DiffStatus status) const {
    return static_cast<std::size_t>(
        std::count_if(rows.begin(), rows.end(),
                      [status](const DiffRow &r) { return r.status == status; }));
}

bool DiffReport::identical() const {
    return std::all_of(rows.begin(), rows.end(), [](const DiffRow &r) {
        return r.status == DiffStatus::Same;
    });
}

bool compareDirectories(const fs::path &left, const fs::path &right,
                        CompareMethod method, const CancelFlag &cancel,
                        DiffReport &out, std::string &err,
                        const ProgressSender *tx, std::size_t *readFailures) {
    if (!isReadableDir(left, err) || !isReadableDir(right, err))
        return false;
    out = DiffReport{};
    out.left = left;
    out.right = right;
    out.method = method;
    DiffWalk walk(left, right, method, cancel, tx, readFailures);
    return walk.run(out.rows, err);
}

void compareDirectoriesWithProgress(const fs::path &left,
                                    const fs::path &right,
                                    CompareMethod method,
                                    const CancelFlag &cancel,
                                    const ProgressSender &tx,
                                    const DiffResultSender &result) {
    DiffReport report;
    std::string err;
    std::size_t readFailures = 0;
    if (!compareDirectories(left, right, method, cancel, report, err, &tx,
                            &readFailures)) {
        tx.send(ProgressMessage::error("", err));
        tx.send(ProgressMessage::completed(0, 1));
        return;
    }
    const std::size_t files = static_cast<std::size_t>(std::count_if(
        report.rows.begin(), report.rows.end(),
        [](const DiffRow &r) { return !r.is_dir; }));
    result.send(std::move(report));
    tx.send(ProgressMessage::completed(files - std::min(files, readFailures),
                                       readFailures));
}

} // namespace opendir

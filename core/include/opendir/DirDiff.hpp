// Recursive comparison of two local directory trees into aligned rows.
#pragma once

#include "ProgressTypes.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace opendir {

enum class CompareMethod { Content, ModifiedTime, ContentAndTime };

// "content", "modified_time", "content_and_time".
bool parseCompareMethod(const std::string &text, CompareMethod &out);
const char *compareMethodName(CompareMethod method);

enum class DiffStatus { Same, Modified, LeftOnly, RightOnly, DirModified };

const char *diffStatusName(DiffStatus status);

struct DiffRow {
    std::string rel_path; // "sub/name"
    std::string name;
    int depth = 0;
    bool is_dir = false;
    DiffStatus status = DiffStatus::Same;
    std::uint64_t left_size = 0;
    std::uint64_t right_size = 0;
};

struct DiffReport {
    std::filesystem::path left;
    std::filesystem::path right;
    CompareMethod method = CompareMethod::Content;
    std::vector<DiffRow> rows; // pre-order, directories first at each level

    std::size_t count(DiffStatus status) const;
    bool identical() const;
};

using DiffResultSender = Sender<DiffReport>;
using DiffResultReceiver = Receiver<DiffReport>;

// Synchronous core. Returns false on cancel (err "Cancelled") or when either
// root is not a readable directory. Per-file read errors mark the row
// Modified and are counted in readFailures.
bool compareDirectories(const std::filesystem::path &left,
                        const std::filesystem::path &right,
                        CompareMethod method, const CancelFlag &cancel,
                        DiffReport &out, std::string &err,
                        const ProgressSender *tx = nullptr,
                        std::size_t *readFailures = nullptr);

// Worker entry point: the report goes to `result` before Completed.
void compareDirectoriesWithProgress(const std::filesystem::path &left,
                                    const std::filesystem::path &right,
                                    CompareMethod method,
                                    const CancelFlag &cancel,
                                    const ProgressSender &tx,
                                    const DiffResultSender &result);

} // namespace opendir

// Local copy/move engine: size pre-scan, per-chunk progress, cooperative
// cancellation and per-entry error accounting.
#include "opendir/LocalFsEngine.hpp"
#include "opendir/PathValidator.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <set>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace opendir {

namespace {

enum class StepResult { Ok, Failed, Cancelled };

bool isSpecialFile(const fs::file_status &st) {
    return fs::is_block_file(st) || fs::is_character_file(st) ||
           fs::is_fifo(st) || fs::is_socket(st);
}

bool scanTotals(const fs::path &path, const CancelFlag &cancel, int depth,
                std::uint64_t &bytes, std::size_t &files, std::string &err) {
    if (isCancelled(cancel)) {
        err = kCancelledMessage;
        return false;
    }
    std::error_code ec;
    const fs::file_status st = fs::symlink_status(path, ec);
    if (ec)
        return true; // vanished entries are not counted
    if (fs::is_symlink(st)) {
        ++files;
        return true;
    }
    if (!fs::is_directory(st)) {
        const auto sz = fs::file_size(path, ec);
        if (!ec)
            bytes += sz;
        ++files;
        return true;
    }
    if (depth > kMaxCopyDepth) {
        err = "Maximum directory depth exceeded: " + path.string();
        return false;
    }
    fs::directory_iterator it(path, ec);
    if (ec)
        return true;
    for (const auto &entry : it) {
        if (!scanTotals(entry.path(), cancel, depth + 1, bytes, files, err))
            return false;
    }
    return true;
}

// Byte/file counters shared by all items of one batch.
class CopyJob {
public:
    CopyJob(const CancelFlag &cancel, const ProgressSender &tx,
            const PathSet &excluded)
        : cancel_(cancel), tx_(tx), excluded_(excluded) {}

    void setTotals(std::size_t files, std::uint64_t bytes) {
        totalFiles_ = files;
        totalBytes_ = bytes;
    }

    void reportTotals() const {
        tx_.send(ProgressMessage::totalProgress(completedFiles_, totalFiles_,
                                                completedBytes_, totalBytes_));
    }

    // Used when an entry moved by rename without streaming its bytes.
    void advance(std::size_t files, std::uint64_t bytes) {
        completedFiles_ += files;
        completedBytes_ += bytes;
        reportTotals();
    }

    StepResult copyEntry(const fs::path &src, const fs::path &dest,
                         std::string &err) {
        std::error_code ec;
        const fs::file_status st = fs::symlink_status(src, ec);
        if (ec) {
            err = "Cannot read '" + src.string() + "': " + ec.message();
            return StepResult::Failed;
        }
        if (fs::is_symlink(st))
            return copySymlink(src, dest, err);
        if (fs::is_directory(st)) {
            visited_.clear();
            return copyDir(src, dest, 0, err);
        }
        return copyFile(src, dest, err);
    }

private:
    StepResult copySymlink(const fs::path &src, const fs::path &dest,
                           std::string &err) {
        std::error_code ec;
        const fs::path target = fs::read_symlink(src, ec);
        if (!ec)
            fs::create_symlink(target, dest, ec);
        if (ec) {
            err = "Failed to copy symlink '" + src.string() +
                  "': " + ec.message();
            return StepResult::Failed;
        }
        ++completedFiles_;
        reportTotals();
        return StepResult::Ok;
    }

    StepResult copyFile(const fs::path &src, const fs::path &dest,
                        std::string &err) {
        std::error_code ec;
        const fs::file_status st = fs::status(src, ec);
        if (ec) {
            err = "Cannot read '" + src.string() + "': " + ec.message();
            return StepResult::Failed;
        }
        if (isSpecialFile(st)) {
            err = "Cannot copy special file (device, socket, or pipe)";
            return StepResult::Failed;
        }
        if (isCancelled(cancel_))
            return StepResult::Cancelled;

        const std::uint64_t total = fs::file_size(src, ec);
        FILE *in = std::fopen(src.c_str(), "rb");
        if (!in) {
            err = "Cannot open '" + src.string() +
                  "': " + std::strerror(errno);
            return StepResult::Failed;
        }
        // "x": create-new, never clobber an entry that appeared meanwhile.
        FILE *out = std::fopen(dest.c_str(), "wbx");
        if (!out) {
            err = "Cannot create '" + dest.string() +
                  "': " + std::strerror(errno);
            std::fclose(in);
            return StepResult::Failed;
        }

        std::vector<char> buf(kCopyBufferSize);
        std::uint64_t copied = 0;
        StepResult result = StepResult::Ok;
        while (true) {
            if (isCancelled(cancel_)) {
                result = StepResult::Cancelled;
                break;
            }
            const std::size_t n = std::fread(buf.data(), 1, buf.size(), in);
            if (n == 0) {
                if (std::ferror(in)) {
                    err = "Read failed for '" + src.string() + "'";
                    result = StepResult::Failed;
                }
                break;
            }
            if (std::fwrite(buf.data(), 1, n, out) != n) {
                err = "Write failed for '" + dest.string() +
                      "': " + std::strerror(errno);
                result = StepResult::Failed;
                break;
            }
            copied += n;
            tx_.send(ProgressMessage::fileProgress(copied, total));
            tx_.send(ProgressMessage::totalProgress(
                completedFiles_, totalFiles_, completedBytes_ + copied,
                totalBytes_));
        }
        std::fclose(in);
        if (std::fclose(out) != 0 && result == StepResult::Ok) {
            err = "Write failed for '" + dest.string() +
                  "': " + std::strerror(errno);
            result = StepResult::Failed;
        }
        if (result != StepResult::Ok) {
            fs::remove(dest, ec);
            return result;
        }

        fs::permissions(dest, st.permissions(), fs::perm_options::replace,
                        ec);
        if (ec) {
            err = "Failed to preserve permissions on '" + dest.string() +
                  "': " + ec.message();
            return StepResult::Failed;
        }
        completedBytes_ += copied;
        ++completedFiles_;
        return StepResult::Ok;
    }

    StepResult copyDir(const fs::path &src, const fs::path &dest, int depth,
                       std::string &err) {
        if (isCancelled(cancel_))
            return StepResult::Cancelled;
        if (depth > kMaxCopyDepth) {
            err = "Maximum directory depth exceeded: " + src.string();
            return StepResult::Failed;
        }
        std::error_code ec;
        const fs::path canon = fs::canonical(src, ec);
        if (!ec && !visited_.insert(canon).second) {
            err = "Directory loop detected at '" + src.string() + "'";
            return StepResult::Failed;
        }
        if (!fs::is_directory(dest, ec)) {
            fs::create_directory(dest, src, ec);
            if (ec) {
                err = "Cannot create directory '" + dest.string() +
                      "': " + ec.message();
                return StepResult::Failed;
            }
        }
        fs::directory_iterator it(src, ec);
        if (ec) {
            err = "Failed to read dir '" + src.string() + "': " + ec.message();
            return StepResult::Failed;
        }

        std::size_t innerFailures = 0;
        std::string lastInner;
        for (const auto &entry : it) {
            if (isCancelled(cancel_))
                return StepResult::Cancelled;
            const fs::path child = entry.path();
            if (excluded_.count(child.string()))
                continue;
            const fs::path childDest = dest / child.filename();
            const fs::file_status cst = fs::symlink_status(child, ec);
            if (ec) {
                ++innerFailures;
                lastInner = "Cannot read '" + child.string() +
                            "': " + ec.message();
                tx_.send(ProgressMessage::error(child.filename().string(),
                                                lastInner));
                continue;
            }

            StepResult r = StepResult::Ok;
            std::string childErr;
            if (fs::is_symlink(cst)) {
                r = copySymlink(child, childDest, childErr);
            } else if (fs::is_directory(cst)) {
                r = copyDir(child, childDest, depth + 1, childErr);
            } else {
                const std::string name = child.filename().string();
                tx_.send(ProgressMessage::fileStarted(name));
                r = copyFile(child, childDest, childErr);
                if (r == StepResult::Ok)
                    tx_.send(ProgressMessage::fileCompleted(name));
            }
            if (r == StepResult::Cancelled)
                return r;
            if (r == StepResult::Failed) {
                ++innerFailures;
                lastInner = childErr;
                tx_.send(ProgressMessage::error(child.filename().string(),
                                                childErr));
            }
        }
        if (innerFailures > 0) {
            err = std::to_string(innerFailures) +
                  " entries could not be copied; last error: " + lastInner;
            return StepResult::Failed;
        }
        return StepResult::Ok;
    }

    CancelFlag cancel_;
    const ProgressSender &tx_;
    const PathSet &excluded_;
    std::set<fs::path> visited_;
    std::size_t totalFiles_ = 0;
    std::uint64_t totalBytes_ = 0;
    std::size_t completedFiles_ = 0;
    std::uint64_t completedBytes_ = 0;
};

enum class BatchMode { Copy, Move, Duplicate };

struct Batch {
    const std::vector<std::string> &files;
    fs::path srcDir;
    fs::path dstDir;
    const PathSet &overwrite;
    const PathSet &skip;
    const PathSet &excluded;
    const CancelFlag &cancel;
    const ProgressSender &tx;
};

// Removes whatever a cancelled item left behind; returns the message for
// the terminal Error.
std::string cleanupCancelled(const fs::path &dest) {
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(dest, ec)))
        return kCancelledMessage;
    std::string err;
    if (!deleteFile(dest, err))
        return std::string(kCancelledMessage) + " (partial copy left at '" +
               dest.string() + "': " + err + ")";
    return kCancelledMessage;
}

bool isCopyIntoSelf(const fs::path &src, const fs::path &dstDir) {
    std::error_code ec;
    if (!fs::is_directory(fs::symlink_status(src, ec)))
        return false;
    const fs::path canonSrc = fs::canonical(src, ec);
    if (ec)
        return false;
    const fs::path canonDst = fs::weakly_canonical(dstDir, ec);
    if (ec)
        return false;
    return isWithin(canonDst, canonSrc);
}

void runBatch(const Batch &b, BatchMode mode) {
    const ProgressSender &tx = b.tx;
    std::size_t success = 0;
    std::size_t failure = 0;

    // Per-item totals so a rename can still advance the byte counter.
    std::vector<std::uint64_t> itemBytes(b.files.size(), 0);
    std::vector<std::size_t> itemFiles(b.files.size(), 0);
    std::uint64_t totalBytes = 0;
    std::size_t totalFiles = 0;

    tx.send(ProgressMessage::preparing("Calculating file sizes..."));
    for (std::size_t i = 0; i < b.files.size(); ++i) {
        const fs::path src = b.srcDir / b.files[i];
        if (b.skip.count(src.string()) || b.excluded.count(src.string()))
            continue;
        std::string err;
        if (!scanTotals(src, b.cancel, 0, itemBytes[i], itemFiles[i], err)) {
            tx.send(ProgressMessage::totalProgress(0, b.files.size(), 0, 0));
            if (isCancelled(b.cancel)) {
                tx.send(ProgressMessage::error("", kCancelledMessage));
                tx.send(ProgressMessage::completed(0, 1));
            } else {
                tx.send(ProgressMessage::error("", err));
                tx.send(ProgressMessage::completed(0, b.files.size()));
            }
            return;
        }
        // Completion is counted per top-level item, so an empty directory
        // still occupies one slot in the file total.
        itemFiles[i] = std::max<std::size_t>(itemFiles[i], 1);
        totalBytes += itemBytes[i];
        totalFiles += itemFiles[i];
    }
    tx.send(ProgressMessage::prepareComplete());

    CopyJob job(b.cancel, tx, b.excluded);
    job.setTotals(totalFiles, totalBytes);
    job.reportTotals();

    for (std::size_t i = 0; i < b.files.size(); ++i) {
        const std::string &name = b.files[i];
        const fs::path src = b.srcDir / name;
        const std::string key = src.string();
        if (isCancelled(b.cancel)) {
            tx.send(ProgressMessage::error(name, kCancelledMessage));
            ++failure;
            break;
        }
        if (b.skip.count(key) || b.excluded.count(key))
            continue;

        std::error_code ec;
        if (!fs::exists(fs::symlink_status(src, ec))) {
            ++failure;
            tx.send(ProgressMessage::error(
                name, "Source not found: " + src.string()));
            continue;
        }

        std::string destName = name;
        if (mode == BatchMode::Duplicate) {
            destName = duplicateName(b.dstDir, name);
        } else if (isCopyIntoSelf(src, b.dstDir)) {
            ++failure;
            tx.send(ProgressMessage::error(
                name, "Cannot copy a directory into itself"));
            continue;
        }
        const fs::path dest = b.dstDir / destName;

        if (fs::exists(fs::symlink_status(dest, ec))) {
            if (mode == BatchMode::Duplicate) {
                ++failure;
                tx.send(ProgressMessage::error(
                    name, "destination already exists"));
                continue;
            }
            if (!b.overwrite.count(key)) {
                ++failure;
                tx.send(ProgressMessage::error(name, "Target already exists"));
                continue;
            }
            std::string err;
            if (!deleteFile(dest, err)) {
                ++failure;
                tx.send(ProgressMessage::error(
                    name, "Failed to remove existing: " + err));
                continue;
            }
        }

        tx.send(ProgressMessage::fileStarted(destName));

        if (mode == BatchMode::Move) {
            fs::rename(src, dest, ec);
            if (!ec) {
                job.advance(itemFiles[i], itemBytes[i]);
                ++success;
                tx.send(ProgressMessage::fileCompleted(destName));
                continue;
            }
            if (ec != std::errc::cross_device_link) {
                ++failure;
                tx.send(ProgressMessage::error(
                    name, "Move failed: " + ec.message()));
                continue;
            }
            // Different filesystem: copy, then delete the source.
        }

        std::string err;
        const StepResult r = job.copyEntry(src, dest, err);
        if (r == StepResult::Cancelled) {
            tx.send(ProgressMessage::error(name, cleanupCancelled(dest)));
            ++failure;
            break;
        }
        if (r == StepResult::Failed) {
            ++failure;
            tx.send(ProgressMessage::error(name, err));
            continue;
        }
        if (mode == BatchMode::Move) {
            std::string delErr;
            if (!deleteFile(src, delErr)) {
                ++failure;
                tx.send(ProgressMessage::error(
                    name,
                    "Move failed: copied but could not delete source: " +
                        delErr));
                continue;
            }
        }
        ++success;
        tx.send(ProgressMessage::fileCompleted(destName));
    }

    tx.send(ProgressMessage::completed(success, failure));
}

} // namespace

void copyFilesWithProgress(const std::vector<std::string> &files,
                           const fs::path &srcDir, const fs::path &dstDir,
                           const PathSet &overwrite, const PathSet &skip,
                           const CancelFlag &cancel, const ProgressSender &tx,
                           const PathSet &excluded) {
    runBatch({files, srcDir, dstDir, overwrite, skip, excluded, cancel, tx},
             BatchMode::Copy);
}

void moveFilesWithProgress(const std::vector<std::string> &files,
                           const fs::path &srcDir, const fs::path &dstDir,
                           const PathSet &overwrite, const PathSet &skip,
                           const CancelFlag &cancel, const ProgressSender &tx,
                           const PathSet &excluded) {
    runBatch({files, srcDir, dstDir, overwrite, skip, excluded, cancel, tx},
             BatchMode::Move);
}

void duplicateFilesWithProgress(const std::vector<std::string> &files,
                                const fs::path &dir, const CancelFlag &cancel,
                                const ProgressSender &tx,
                                const PathSet &excluded) {
    const PathSet none;
    runBatch({files, dir, dir, none, none, excluded, cancel, tx},
             BatchMode::Duplicate);
}

std::string duplicateName(const fs::path &dir, const std::string &name) {
    std::error_code ec;
    std::string stem = name;
    std::string ext;
    if (!fs::is_directory(fs::symlink_status(dir / name, ec))) {
        const fs::path p(name);
        stem = p.stem().string();
        ext = p.extension().string();
    }
    std::string candidate = stem + "_dup" + ext;
    for (int n = 2; fs::exists(fs::symlink_status(dir / candidate, ec));
         ++n) {
        candidate = stem + "_dup" + std::to_string(n) + ext;
    }
    return candidate;
}

bool deleteFile(const fs::path &path, std::string &err) {
    std::error_code ec;
    const fs::file_status st = fs::symlink_status(path, ec);
    if (ec) {
        err = "Failed to stat '" + path.string() + "': " + ec.message();
        return false;
    }
    if (fs::is_directory(st))
        fs::remove_all(path, ec);
    else
        fs::remove(path, ec);
    if (ec) {
        err = "Failed to delete '" + path.string() + "': " + ec.message();
        return false;
    }
    return true;
}

bool calculateTotals(const std::vector<fs::path> &paths,
                     const CancelFlag &cancel, std::uint64_t &bytes,
                     std::size_t &files, std::string &err) {
    bytes = 0;
    files = 0;
    for (const auto &p : paths) {
        if (!scanTotals(p, cancel, 0, bytes, files, err))
            return false;
    }
    return true;
}

bool createDirectory(const fs::path &parent, const std::string &name,
                     std::string &err) {
    fs::path target;
    if (!resolveAndVerify(parent, name, target, err))
        return false;
    std::error_code ec;
    if (!fs::create_directory(target, ec)) {
        err = ec ? "Failed to create '" + name + "': " + ec.message()
                 : "'" + name + "' already exists";
        return false;
    }
    return true;
}

bool createFile(const fs::path &parent, const std::string &name,
                std::string &err) {
    fs::path target;
    if (!resolveAndVerify(parent, name, target, err))
        return false;
    FILE *f = std::fopen(target.c_str(), "wbx");
    if (!f) {
        err = errno == EEXIST
                  ? "'" + name + "' already exists"
                  : "Failed to create '" + name + "': " + std::strerror(errno);
        return false;
    }
    std::fclose(f);
    return true;
}

bool renameEntry(const fs::path &parent, const std::string &oldName,
                 const std::string &newName, std::string &err) {
    std::string why;
    if (!isValidFilename(newName, &why)) {
        err = why;
        return false;
    }
    const fs::path from = parent / oldName;
    fs::path to;
    if (!resolveAndVerify(parent, newName, to, err))
        return false;
    std::error_code ec;
    if (fs::exists(fs::symlink_status(to, ec))) {
        err = "'" + newName + "' already exists";
        return false;
    }
    fs::rename(from, to, ec);
    if (ec) {
        err = "Failed to rename '" + oldName + "': " + ec.message();
        return false;
    }
    return true;
}

} // namespace opendir

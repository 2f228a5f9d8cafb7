// Bookkeeping for the single in-flight file operation: drains the worker's
// channel each tick and exposes counters for the progress dialog.
#pragma once

#include "opendir/ProgressTypes.hpp"

#include <optional>
#include <string>

namespace opendir {

enum class OperationKind {
    Copy,
    Move,
    Duplicate,
    Tar,
    Untar,
    Upload,
    Download,
    RemoteTransfer,
    Diff,
    Encrypt,
    Decrypt
};

const char *operationTitle(OperationKind kind); // "Copying"
const char *operationVerb(OperationKind kind);  // "Copied"

struct FinalResult {
    std::size_t success_count = 0;
    std::size_t failure_count = 0;
    std::string last_error;
};

// "Copied 7 items." or "Copied 4/7. Error: ..."
std::string summarize(OperationKind kind, const FinalResult &result);

class ProgressState {
public:
    ProgressState(OperationKind kind, ProgressReceiver rx, CancelFlag cancel);

    // New state plus the sender to hand to the worker.
    static ProgressState start(OperationKind kind, ProgressSender &tx);

    // Drains every available message. True when anything changed.
    bool poll();
    void cancel();

    OperationKind kind() const { return kind_; }
    const CancelFlag &cancelFlag() const { return cancel_; }
    bool active() const { return active_; }
    bool cancelRequested() const { return isCancelled(cancel_); }
    bool preparing() const { return preparing_; }
    const std::string &preparingMessage() const { return preparingMessage_; }
    const std::string &currentFile() const { return currentFile_; }
    double fileFraction() const;

    std::size_t completedFiles() const { return completedFiles_; }
    std::size_t totalFiles() const { return totalFiles_; }
    std::uint64_t completedBytes() const { return completedBytes_; }
    std::uint64_t totalBytes() const { return totalBytes_; }

    // Bytes when known, else files plus the current file's fraction.
    double overallFraction() const;

    bool hasResult() const { return result_.has_value(); }
    // Readable exactly once after completion.
    std::optional<FinalResult> takeResult();

private:
    OperationKind kind_;
    ProgressReceiver rx_;
    CancelFlag cancel_;
    bool active_ = true;
    bool preparing_ = false;
    std::string preparingMessage_;
    std::string currentFile_;
    std::uint64_t fileCopied_ = 0;
    std::uint64_t fileTotal_ = 0;
    std::size_t completedFiles_ = 0;
    std::size_t totalFiles_ = 0;
    std::uint64_t completedBytes_ = 0;
    std::uint64_t totalBytes_ = 0;
    std::string lastError_;
    std::optional<FinalResult> result_;

    void apply(const ProgressMessage &msg);
    void finish(FinalResult result);
};

} // namespace opendir

#include "ProgressState.hpp"
#include "AppLogging.hpp"

#include <algorithm>

namespace opendir {

const char *operationTitle(OperationKind kind) {
    switch (kind) {
    case OperationKind::Copy:
        return "Copying";
    case OperationKind::Move:
        return "Moving";
    case OperationKind::Duplicate:
        return "Duplicating";
    case OperationKind::Tar:
        return "Archiving";
    case OperationKind::Untar:
        return "Extracting";
    case OperationKind::Upload:
        return "Uploading";
    case OperationKind::Download:
        return "Downloading";
    case OperationKind::RemoteTransfer:
        return "Transferring";
    case OperationKind::Diff:
        return "Comparing";
    case OperationKind::Encrypt:
        return "Encrypting";
    case OperationKind::Decrypt:
        return "Decrypting";
    }
    return "Working";
}

const char *operationVerb(OperationKind kind) {
    switch (kind) {
    case OperationKind::Copy:
        return "Copied";
    case OperationKind::Move:
        return "Moved";
    case OperationKind::Duplicate:
        return "Duplicated";
    case OperationKind::Tar:
        return "Archived";
    case OperationKind::Untar:
        return "Extracted";
    case OperationKind::Upload:
        return "Uploaded";
    case OperationKind::Download:
        return "Downloaded";
    case OperationKind::RemoteTransfer:
        return "Transferred";
    case OperationKind::Diff:
        return "Compared";
    case OperationKind::Encrypt:
        return "Encrypted";
    case OperationKind::Decrypt:
        return "Decrypted";
    }
    return "Processed";
}

std::string summarize(OperationKind kind, const FinalResult &result) {
    const std::string verb = operationVerb(kind);
    if (result.failure_count == 0) {
        return verb + " " + std::to_string(result.success_count) +
               (result.success_count == 1 ? " item." : " items.");
    }
    std::string out = verb + " " + std::to_string(result.success_count) + "/" +
                      std::to_string(result.success_count +
                                     result.failure_count) +
                      ".";
    if (!result.last_error.empty())
        out += " Error: " + result.last_error;
    return out;
}

ProgressState::ProgressState(OperationKind kind, ProgressReceiver rx,
                             CancelFlag cancel)
    : kind_(kind), rx_(std::move(rx)), cancel_(std::move(cancel)) {}

ProgressState ProgressState::start(OperationKind kind, ProgressSender &tx) {
    auto channel = makeChannel<ProgressMessage>();
    tx = channel.first;
    qCInfo(odXfer) << operationTitle(kind) << "started";
    return ProgressState(kind, std::move(channel.second), makeCancelFlag());
}

bool ProgressState::poll() {
    if (!active_)
        return false;
    bool changed = false;
    ProgressMessage msg;
    while (active_) {
        const RecvStatus st = rx_.tryRecv(msg);
        if (st == RecvStatus::Empty)
            break;
        changed = true;
        if (st == RecvStatus::Disconnected) {
            FinalResult r;
            r.success_count = completedFiles_;
            r.failure_count = 1;
            r.last_error = "Cancelled or failed";
            finish(std::move(r));
            break;
        }
        apply(msg);
    }
    return changed;
}

void ProgressState::apply(const ProgressMessage &msg) {
    using Kind = ProgressMessage::Kind;
    switch (msg.kind) {
    case Kind::Preparing:
        preparing_ = true;
        preparingMessage_ = msg.message;
        break;
    case Kind::PrepareComplete:
        preparing_ = false;
        preparingMessage_.clear();
        break;
    case Kind::FileStarted:
        currentFile_ = msg.name;
        fileCopied_ = 0;
        fileTotal_ = 0;
        break;
    case Kind::FileProgress:
        fileCopied_ = msg.copied;
        fileTotal_ = msg.total;
        break;
    case Kind::FileCompleted:
        fileCopied_ = fileTotal_;
        break;
    case Kind::TotalProgress:
        completedFiles_ = msg.completed_files;
        totalFiles_ = msg.total_files;
        completedBytes_ = msg.completed_bytes;
        totalBytes_ = msg.total_bytes;
        break;
    case Kind::Error:
        lastError_ = msg.name.empty() ? msg.message
                                      : msg.name + ": " + msg.message;
        qCWarning(odXfer) << operationTitle(kind_) << "error:"
                          << redacted(msg.name)
                          << QString::fromStdString(msg.message);
        break;
    case Kind::Completed: {
        FinalResult r;
        r.success_count = msg.success_count;
        r.failure_count = msg.failure_count;
        r.last_error = lastError_;
        finish(std::move(r));
        break;
    }
    }
}

void ProgressState::finish(FinalResult result) {
    active_ = false;
    preparing_ = false;
    rx_.close();
    qCInfo(odXfer) << operationTitle(kind_) << "finished:"
                   << "success=" << result.success_count
                   << "failure=" << result.failure_count;
    result_ = std::move(result);
}

void ProgressState::cancel() {
    if (!active_ || !cancel_)
        return;
    if (!cancel_->exchange(true))
        qCInfo(odXfer) << operationTitle(kind_) << "cancel requested";
}

double ProgressState::fileFraction() const {
    if (fileTotal_ == 0)
        return 0.0;
    return std::min(1.0, double(fileCopied_) / double(fileTotal_));
}

double ProgressState::overallFraction() const {
    if (totalBytes_ > 0)
        return std::min(1.0, double(completedBytes_) / double(totalBytes_));
    if (totalFiles_ == 0)
        return 0.0;
    return std::min(1.0, (double(completedFiles_) + fileFraction()) /
                             double(totalFiles_));
}

std::optional<FinalResult> ProgressState::takeResult() {
    std::optional<FinalResult> out;
    out.swap(result_);
    return out;
}

} // namespace opendir

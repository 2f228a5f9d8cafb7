// Progress vocabulary shared by every long-running engine (local, archive,
// remote transfer, directory diff) and the cancel flag they poll.
#pragma once

#include "Channel.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <set>
#include <string>

namespace opendir {

using CancelFlag = std::shared_ptr<std::atomic<bool>>;

inline CancelFlag makeCancelFlag() {
    return std::make_shared<std::atomic<bool>>(false);
}

inline bool isCancelled(const CancelFlag &flag) {
    return flag && flag->load();
}

// Absolute source paths (overwrite/skip/excluded sets).
using PathSet = std::set<std::string>;

constexpr std::size_t kCopyBufferSize = 64 * 1024;
constexpr const char *kCancelledMessage = "Cancelled";

struct ProgressMessage {
    enum class Kind {
        Preparing,
        PrepareComplete,
        FileStarted,
        FileProgress,
        FileCompleted,
        TotalProgress,
        Completed,
        Error
    };

    Kind kind = Kind::Preparing;
    std::string name;    // FileStarted/FileCompleted/Error
    std::string message; // Preparing text or Error reason

    std::uint64_t copied = 0; // FileProgress
    std::uint64_t total = 0;

    std::size_t completed_files = 0; // TotalProgress
    std::size_t total_files = 0;
    std::uint64_t completed_bytes = 0;
    std::uint64_t total_bytes = 0;

    std::size_t success_count = 0; // Completed
    std::size_t failure_count = 0;

    static ProgressMessage preparing(std::string text) {
        ProgressMessage m;
        m.kind = Kind::Preparing;
        m.message = std::move(text);
        return m;
    }
    static ProgressMessage prepareComplete() {
        ProgressMessage m;
        m.kind = Kind::PrepareComplete;
        return m;
    }
    static ProgressMessage fileStarted(std::string name) {
        ProgressMessage m;
        m.kind = Kind::FileStarted;
        m.name = std::move(name);
        return m;
    }
    static ProgressMessage fileProgress(std::uint64_t copied,
                                        std::uint64_t total) {
        ProgressMessage m;
        m.kind = Kind::FileProgress;
        m.copied = copied;
        m.total = total;
        return m;
    }
    static ProgressMessage fileCompleted(std::string name) {
        ProgressMessage m;
        m.kind = Kind::FileCompleted;
        m.name = std::move(name);
        return m;
    }
    static ProgressMessage totalProgress(std::size_t completedFiles,
                                         std::size_t totalFiles,
                                         std::uint64_t completedBytes,
                                         std::uint64_t totalBytes) {
        ProgressMessage m;
        m.kind = Kind::TotalProgress;
        m.completed_files = completedFiles;
        m.total_files = totalFiles;
        m.completed_bytes = completedBytes;
        m.total_bytes = totalBytes;
        return m;
    }
    static ProgressMessage completed(std::size_t success,
                                     std::size_t failure) {
        ProgressMessage m;
        m.kind = Kind::Completed;
        m.success_count = success;
        m.failure_count = failure;
        return m;
    }
    static ProgressMessage error(std::string name, std::string reason) {
        ProgressMessage m;
        m.kind = Kind::Error;
        m.name = std::move(name);
        m.message = std::move(reason);
        return m;
    }
};

using ProgressSender = Sender<ProgressMessage>;
using ProgressReceiver = Receiver<ProgressMessage>;

} // namespace opendir

// Single slot for background tasks that are not file transfers (remote
// listing and mutations, search, git scratch). A busy slot drops new
// intents instead of queueing them.
#pragma once

#include "opendir/Channel.hpp"
#include "opendir/DirDiff.hpp"
#include "opendir/ProgressTypes.hpp"
#include "opendir/RemoteContext.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace opendir {

struct PanelOutcome {
    enum class Kind { Simple, ListDir, DirExists };

    Kind kind = Kind::Simple;

    // Simple: ok plus a message (error text on failure).
    bool ok = true;
    std::string message;
    std::optional<std::string> pending_focus;
    bool reload = false;

    // ListDir
    std::vector<SftpEntry> entries;
    std::string path;
    std::optional<std::string> rollback_path;

    // DirExists
    bool exists = false;
    std::string target;
};

struct SpinnerResult {
    enum class Kind { Connected, PanelOp, LocalOp, SearchComplete, GitDiffComplete };

    Kind kind = Kind::LocalOp;
    std::size_t panel_idx = 0;
    // Borrowed (or freshly connected) context to reinstall into panel_idx.
    std::unique_ptr<RemoteContext> ctx;

    bool ok = true;
    std::string message;

    // Connected: initial listing of the default path.
    std::string path;
    std::vector<SftpEntry> entries;

    // PanelOp
    PanelOutcome outcome;

    // LocalOp
    bool reload = false;

    // SearchComplete
    std::string search_root;
    std::string pattern;
    std::vector<std::string> matches;
    bool truncated = false;

    // GitDiffComplete
    std::string revision;
    std::optional<DiffReport> diff;

    static SpinnerResult localOp(bool ok, std::string message, bool reload) {
        SpinnerResult r;
        r.kind = Kind::LocalOp;
        r.ok = ok;
        r.message = std::move(message);
        r.reload = reload;
        return r;
    }

    static SpinnerResult panelOp(std::size_t panel,
                                 std::unique_ptr<RemoteContext> ctx,
                                 PanelOutcome outcome) {
        SpinnerResult r;
        r.kind = Kind::PanelOp;
        r.panel_idx = panel;
        r.ctx = std::move(ctx);
        r.ok = outcome.ok;
        r.outcome = std::move(outcome);
        return r;
    }
};

class RemoteSpinner {
public:
    RemoteSpinner() = default;
    RemoteSpinner(const RemoteSpinner &) = delete;
    RemoteSpinner &operator=(const RemoteSpinner &) = delete;
    // Cancels a running task and waits for its worker.
    ~RemoteSpinner();

    bool busy() const { return active_.has_value(); }

    // Runs work(cancel) on a worker thread. False (and work is dropped)
    // when the slot is taken.
    template <typename Work> bool start(std::string message, Work work) {
        if (active_)
            return false;
        joinWorker();
        auto channel = makeChannel<SpinnerResult>();
        CancelFlag cancel = makeCancelFlag();
        active_.emplace(Active{std::move(message),
                               std::chrono::steady_clock::now(),
                               std::move(channel.second), cancel});
        worker_ = std::thread([work = std::move(work),
                               tx = std::move(channel.first),
                               cancel]() mutable { tx.send(work(cancel)); });
        return true;
    }

    // Blocks until the current worker, if any, has returned.
    void joinWorker();

    // Frees the slot once the worker has answered.
    std::optional<SpinnerResult> poll();

    // Asks the task to stop early; the slot stays busy until the worker
    // returns its result.
    void cancel();

    const std::string &message() const;
    double elapsedSeconds() const;
    char frame() const;

private:
    struct Active {
        std::string message;
        std::chrono::steady_clock::time_point started;
        Receiver<SpinnerResult> rx;
        CancelFlag cancel;
    };
    std::thread worker_;
    std::optional<Active> active_;
};

} // namespace opendir

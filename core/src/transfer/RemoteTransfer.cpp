// Local/remote transfer strategies. Each side of a transfer is wrapped in a
// Side so the batch loop is the same for upload, download and remote to
// remote; only the per-file byte mover differs.
#include "opendir/RemoteTransfer.hpp"
#include "opendir/ConfigPaths.hpp"
#include "opendir/LocalFsEngine.hpp"

#include <algorithm>
#include <memory>
#include <system_error>

namespace fs = std::filesystem;

namespace opendir {

namespace {

struct WalkEntry {
    std::string rel; // "sub/file", relative to the walked root
    bool is_dir = false;
    std::uint64_t size = 0;
};

class Side {
public:
    virtual ~Side() = default;

    // False with empty err when the path does not exist.
    virtual bool stat(const std::string &path, bool &isDir,
                      std::uint64_t &size, std::string &err) = 0;
    // Pre-order listing of everything below root. Symlinked directories are
    // listed but not descended into.
    virtual bool walk(const std::string &root, std::vector<WalkEntry> &out,
                      std::string &err) = 0;
    // Succeeds when the directory already exists.
    virtual bool makeDir(const std::string &path, std::string &err) = 0;
    virtual bool removeTree(const std::string &path, bool isDir,
                            std::string &err) = 0;
    virtual std::string join(const std::string &dir,
                             const std::string &name) const = 0;
};

class LocalSide : public Side {
public:
    bool stat(const std::string &path, bool &isDir, std::uint64_t &size,
              std::string &err) override {
        std::error_code ec;
        const fs::file_status st = fs::symlink_status(path, ec);
        if (ec || !fs::exists(st)) {
            err.clear();
            return false;
        }
        isDir = fs::is_directory(st);
        size = fs::is_regular_file(st) ? fs::file_size(path, ec) : 0;
        if (ec) {
            err = "Cannot read '" + path + "': " + ec.message();
            return false;
        }
        return true;
    }

    bool walk(const std::string &root, std::vector<WalkEntry> &out,
              std::string &err) override {
        std::error_code ec;
        fs::recursive_directory_iterator it(
            root, fs::directory_options::none, ec);
        if (ec) {
            err = "Cannot read '" + root + "': " + ec.message();
            return false;
        }
        const fs::recursive_directory_iterator end;
        while (it != end) {
            if (it.depth() >= kMaxCopyDepth) {
                err = "Maximum directory depth exceeded: " + root;
                return false;
            }
            WalkEntry e;
            e.rel = it->path().lexically_relative(root).generic_string();
            const fs::file_status st = it->symlink_status(ec);
            e.is_dir = fs::is_directory(st);
            if (fs::is_regular_file(st))
                e.size = it->file_size(ec);
            out.push_back(std::move(e));
            it.increment(ec);
            if (ec) {
                err = "Cannot read '" + root + "': " + ec.message();
                return false;
            }
        }
        return true;
    }

    bool makeDir(const std::string &path, std::string &err) override {
        std::error_code ec;
        if (fs::is_directory(path, ec))
            return true;
        if (!fs::create_directory(path, ec)) {
            err = "Failed to create directory '" + path +
                  "': " + (ec ? ec.message() : "already exists");
            return false;
        }
        return true;
    }

    bool removeTree(const std::string &path, bool, std::string &err) override {
        return deleteFile(path, err);
    }

    std::string join(const std::string &dir,
                     const std::string &name) const override {
        return (fs::path(dir) / name).string();
    }
};

class RemoteSide : public Side {
public:
    RemoteSide(RemoteProfile profile, std::unique_ptr<SftpClient> client)
        : profile_(std::move(profile)), client_(std::move(client)) {}

    bool connect(std::string &err) {
        if (!client_) {
            err = "Not connected";
            return false;
        }
        return client_->connect(sessionOptionsFor(profile_), err);
    }

    SftpClient &client() { return *client_; }
    const RemoteProfile &profile() const { return profile_; }

    bool stat(const std::string &path, bool &isDir, std::uint64_t &size,
              std::string &err) override {
        SftpEntry info;
        if (!client_->stat(path, info, err))
            return false;
        isDir = info.is_dir;
        size = info.is_dir ? 0 : info.size;
        return true;
    }

    bool walk(const std::string &root, std::vector<WalkEntry> &out,
              std::string &err) override {
        return walkInto(root, std::string(), 0, out, err);
    }

    bool makeDir(const std::string &path, std::string &err) override {
        bool isDir = false;
        std::string statErr;
        if (client_->exists(path, isDir, statErr)) {
            if (isDir)
                return true;
            err = "Failed to create directory '" + path +
                  "': a file with that name exists";
            return false;
        }
        if (!statErr.empty()) {
            err = statErr;
            return false;
        }
        return client_->mkdir(path, err);
    }

    bool removeTree(const std::string &path, bool isDir,
                    std::string &err) override {
        return client_->remove(path, isDir, err);
    }

    std::string join(const std::string &dir,
                     const std::string &name) const override {
        return joinRemotePath(dir, name);
    }

private:
    RemoteProfile profile_;
    std::unique_ptr<SftpClient> client_;

    bool walkInto(const std::string &dir, const std::string &prefix, int depth,
                  std::vector<WalkEntry> &out, std::string &err) {
        if (depth > kMaxCopyDepth) {
            err = "Maximum directory depth exceeded: " + dir;
            return false;
        }
        std::vector<SftpEntry> entries;
        if (!client_->list(dir, entries, err))
            return false;
        for (const auto &e : entries) {
            WalkEntry w;
            w.rel = prefix.empty() ? e.name : prefix + "/" + e.name;
            w.is_dir = e.is_dir && !e.is_symlink;
            w.size = e.is_dir ? 0 : e.size;
            out.push_back(w);
            if (w.is_dir &&
                !walkInto(joinRemotePath(dir, e.name), w.rel, depth + 1, out,
                          err))
                return false;
        }
        return true;
    }
};

struct PlannedItem {
    std::string name;
    std::string src;
    std::string dst;
    bool exists = false;
    bool is_dir = false;
    std::uint64_t size = 0;
    std::vector<WalkEntry> children;
    std::string scan_error;
    bool renamed = false;
};

enum class ItemResult { Ok, Failed, Cancelled };

class TransferRun {
public:
    TransferRun(const RemoteTransferJob &job, TransferStrategy strategy,
                Side &source, Side &target, RemoteSide *remoteSource,
                RemoteSide *remoteTarget, const CancelFlag &cancel,
                const ProgressSender &tx)
        : job_(job), strategy_(strategy), source_(source), target_(target),
          remoteSource_(remoteSource), remoteTarget_(remoteTarget),
          cancel_(cancel), tx_(tx) {}

    void run() {
        std::vector<PlannedItem> plan;
        if (!prepare(plan))
            return;

        std::size_t success = 0;
        std::size_t failure = 0;
        for (auto &item : plan) {
            if (isCancelled(cancel_)) {
                tx_.send(ProgressMessage::error(item.name, kCancelledMessage));
                tx_.send(ProgressMessage::completed(success, failure + 1));
                return;
            }
            if (job_.skip.count(item.src))
                continue;

            std::string err;
            const ItemResult r = transferItem(item, err);
            if (r == ItemResult::Cancelled) {
                tx_.send(ProgressMessage::error(item.name, kCancelledMessage));
                tx_.send(ProgressMessage::completed(success, failure + 1));
                return;
            }
            if (r == ItemResult::Failed) {
                tx_.send(ProgressMessage::error(item.name, err));
                ++failure;
                continue;
            }
            if (job_.op == TransferOp::Move && !item.renamed &&
                !source_.removeTree(item.src, item.is_dir, err)) {
                tx_.send(ProgressMessage::error(
                    item.name, "Copied but could not delete source: " + err));
                ++failure;
                continue;
            }
            ++success;
        }
        tx_.send(ProgressMessage::completed(success, failure));
    }

private:
    const RemoteTransferJob &job_;
    TransferStrategy strategy_;
    Side &source_;
    Side &target_;
    RemoteSide *remoteSource_;
    RemoteSide *remoteTarget_;
    const CancelFlag &cancel_;
    const ProgressSender &tx_;

    std::size_t totalFiles_ = 0;
    std::size_t completedFiles_ = 0;
    std::uint64_t totalBytes_ = 0;
    std::uint64_t completedBytes_ = 0;

    void reportTotals() const {
        tx_.send(ProgressMessage::totalProgress(completedFiles_, totalFiles_,
                                                completedBytes_, totalBytes_));
    }

    bool sameRemoteHost() const {
        return strategy_ == TransferStrategy::RemoteToRemote &&
               remoteSource_->profile().sameEndpoint(
                   remoteTarget_->profile().user, remoteTarget_->profile().host,
                   remoteTarget_->profile().port);
    }

    bool prepare(std::vector<PlannedItem> &plan) {
        tx_.send(ProgressMessage::preparing("Calculating file sizes..."));
        for (const auto &name : job_.names) {
            if (isCancelled(cancel_)) {
                tx_.send(ProgressMessage::totalProgress(
                    0, job_.names.size(), 0, 0));
                tx_.send(ProgressMessage::error("", kCancelledMessage));
                tx_.send(ProgressMessage::completed(0, 1));
                return false;
            }
            PlannedItem item;
            item.name = name;
            item.src = source_.join(job_.source.dir, name);
            item.dst = target_.join(job_.target.dir, name);
            std::string err;
            item.exists = source_.stat(item.src, item.is_dir, item.size, err);
            std::size_t files = 0;
            if (!item.exists) {
                item.scan_error =
                    err.empty() ? "Source no longer exists" : err;
            } else if (item.is_dir) {
                if (!source_.walk(item.src, item.children, err))
                    item.scan_error = err;
                for (const auto &c : item.children) {
                    if (c.is_dir)
                        continue;
                    ++files;
                    totalBytes_ += c.size;
                }
            } else {
                files = 1;
                totalBytes_ += item.size;
            }
            // Every named item is one completion slot, even when empty.
            totalFiles_ += std::max<std::size_t>(files, 1);
            plan.push_back(std::move(item));
        }
        tx_.send(ProgressMessage::prepareComplete());
        reportTotals();
        return true;
    }

    bool intoItself(const PlannedItem &item) const {
        if (!item.is_dir || !sameRemoteHost())
            return false;
        const std::string &t = job_.target.dir;
        return t == item.src || t.rfind(item.src + "/", 0) == 0;
    }

    ItemResult transferItem(PlannedItem &item, std::string &err) {
        if (!item.scan_error.empty()) {
            err = item.scan_error;
            return ItemResult::Failed;
        }
        if (intoItself(item)) {
            err = "Cannot copy a directory into itself";
            return ItemResult::Failed;
        }
        tx_.send(ProgressMessage::fileStarted(item.name));

        // Same server: a move is a single rename.
        if (job_.op == TransferOp::Move && sameRemoteHost()) {
            if (!remoteSource_->client().rename(item.src, item.dst, err))
                return ItemResult::Failed;
            std::size_t files = item.is_dir ? 0 : 1;
            std::uint64_t bytes = item.size;
            for (const auto &c : item.children) {
                if (!c.is_dir) {
                    ++files;
                    bytes += c.size;
                }
            }
            completedFiles_ += files;
            completedBytes_ += bytes;
            reportTotals();
            item.renamed = true;
            tx_.send(ProgressMessage::fileCompleted(item.name));
            return ItemResult::Ok;
        }

        if (!item.is_dir) {
            const ItemResult r = transferFile(item.src, item.dst, item.size, err);
            if (r == ItemResult::Ok)
                tx_.send(ProgressMessage::fileCompleted(item.name));
            return r;
        }

        if (!target_.makeDir(item.dst, err))
            return ItemResult::Failed;
        std::size_t innerFailures = 0;
        std::string lastError;
        for (const auto &child : item.children) {
            if (isCancelled(cancel_))
                return ItemResult::Cancelled;
            const std::string src = source_.join(item.src, child.rel);
            const std::string dst = target_.join(item.dst, child.rel);
            std::string childErr;
            if (child.is_dir) {
                if (!target_.makeDir(dst, childErr)) {
                    ++innerFailures;
                    lastError = childErr;
                }
                continue;
            }
            tx_.send(ProgressMessage::fileStarted(item.name + "/" + child.rel));
            const ItemResult r = transferFile(src, dst, child.size, childErr);
            if (r == ItemResult::Cancelled)
                return r;
            if (r == ItemResult::Failed) {
                ++innerFailures;
                lastError = childErr;
                tx_.send(ProgressMessage::error(item.name + "/" + child.rel,
                                                childErr));
                continue;
            }
            tx_.send(ProgressMessage::fileCompleted(item.name + "/" + child.rel));
        }
        if (innerFailures > 0) {
            err = std::to_string(innerFailures) +
                  " entries could not be copied; last error: " + lastError;
            return ItemResult::Failed;
        }
        tx_.send(ProgressMessage::fileCompleted(item.name));
        return ItemResult::Ok;
    }

    ItemResult transferFile(const std::string &src, const std::string &dst,
                            std::uint64_t size, std::string &err) {
        if (isCancelled(cancel_))
            return ItemResult::Cancelled;
        const std::uint64_t startBytes = completedBytes_;
        auto shouldCancel = [this] { return isCancelled(cancel_); };
        auto onProgress = [this, startBytes](std::uint64_t done,
                                             std::uint64_t total) {
            tx_.send(ProgressMessage::fileProgress(done, total));
            completedBytes_ = startBytes + done;
            reportTotals();
        };

        bool ok = false;
        switch (strategy_) {
        case TransferStrategy::Upload:
            ok = remoteTarget_->client().put(src, dst, err, onProgress,
                                             shouldCancel);
            break;
        case TransferStrategy::Download:
            ok = remoteSource_->client().get(src, dst, err, onProgress,
                                             shouldCancel);
            break;
        case TransferStrategy::RemoteToRemote:
            ok = relayThroughScratch(src, dst, err, onProgress, shouldCancel);
            break;
        case TransferStrategy::LocalToLocal:
            err = "Local transfers use the local engine";
            break;
        }
        if (!ok) {
            completedBytes_ = startBytes;
            return (err == kCancelledMessage || isCancelled(cancel_))
                       ? ItemResult::Cancelled
                       : ItemResult::Failed;
        }
        completedBytes_ = startBytes + size;
        ++completedFiles_;
        reportTotals();
        return ItemResult::Ok;
    }

    bool relayThroughScratch(const std::string &src, const std::string &dst,
                             std::string &err,
                             const SftpClient::ProgressCB &onProgress,
                             const SftpClient::CancelCB &shouldCancel) {
        const fs::path scratch = remoteScratchPath(remoteSource_->profile(), src);
        std::error_code ec;
        fs::create_directories(scratch.parent_path(), ec);
        if (ec) {
            err = "Cannot create scratch directory '" +
                  scratch.parent_path().string() + "': " + ec.message();
            return false;
        }
        // Download counts for the first half of the file, upload the second.
        auto firstHalf = [&](std::uint64_t done, std::uint64_t total) {
            onProgress(done / 2, total);
        };
        auto secondHalf = [&](std::uint64_t done, std::uint64_t total) {
            onProgress(total / 2 + (done - done / 2), total);
        };
        bool ok = remoteSource_->client().get(src, scratch.string(), err,
                                              firstHalf, shouldCancel) &&
                  remoteTarget_->client().put(scratch.string(), dst, err,
                                              secondHalf, shouldCancel);
        fs::remove(scratch, ec);
        return ok;
    }
};

} // namespace

TransferStrategy selectStrategy(const Endpoint &source,
                                const Endpoint &target) {
    if (!source.isRemote())
        return target.isRemote() ? TransferStrategy::Upload
                                 : TransferStrategy::LocalToLocal;
    return target.isRemote() ? TransferStrategy::RemoteToRemote
                             : TransferStrategy::Download;
}

const char *strategyName(TransferStrategy s) {
    switch (s) {
    case TransferStrategy::LocalToLocal:
        return "local-to-local";
    case TransferStrategy::Upload:
        return "upload";
    case TransferStrategy::Download:
        return "download";
    case TransferStrategy::RemoteToRemote:
        return "remote-to-remote";
    }
    return "unknown";
}

fs::path remoteScratchPath(const RemoteProfile &profile,
                           const std::string &remotePath) {
    fs::path out = scratchRoot() / (profile.user + "@" + profile.host);
    // Mirror the remote layout; ".." segments never leave the scratch root.
    std::string segment;
    for (std::size_t i = 0; i <= remotePath.size(); ++i) {
        if (i == remotePath.size() || remotePath[i] == '/') {
            if (!segment.empty() && segment != "." && segment != "..")
                out /= segment;
            segment.clear();
        } else {
            segment += remotePath[i];
        }
    }
    return out;
}

void runTransferWithProgress(const RemoteTransferJob &job,
                             const SftpClientFactory &factory,
                             const CancelFlag &cancel,
                             const ProgressSender &tx) {
    const TransferStrategy strategy = selectStrategy(job.source, job.target);
    if (strategy == TransferStrategy::LocalToLocal) {
        if (job.op == TransferOp::Move)
            moveFilesWithProgress(job.names, job.source.dir, job.target.dir,
                                  job.overwrite, job.skip, cancel, tx);
        else
            copyFilesWithProgress(job.names, job.source.dir, job.target.dir,
                                  job.overwrite, job.skip, cancel, tx);
        return;
    }

    LocalSide localSide;
    std::unique_ptr<RemoteSide> remoteSource;
    std::unique_ptr<RemoteSide> remoteTarget;
    std::string err;
    if (job.source.isRemote()) {
        remoteSource = std::make_unique<RemoteSide>(
            *job.source.remote, factory ? factory() : nullptr);
        if (!remoteSource->connect(err)) {
            tx.send(ProgressMessage::totalProgress(0, job.names.size(), 0, 0));
            tx.send(ProgressMessage::error("", "Source connection failed: " + err));
            tx.send(ProgressMessage::completed(0, job.names.size()));
            return;
        }
    }
    if (job.target.isRemote()) {
        remoteTarget = std::make_unique<RemoteSide>(
            *job.target.remote, factory ? factory() : nullptr);
        if (!remoteTarget->connect(err)) {
            tx.send(ProgressMessage::totalProgress(0, job.names.size(), 0, 0));
            tx.send(ProgressMessage::error("", "Target connection failed: " + err));
            tx.send(ProgressMessage::completed(0, job.names.size()));
            return;
        }
    }

    Side &source = remoteSource ? static_cast<Side &>(*remoteSource)
                                : static_cast<Side &>(localSide);
    Side &target = remoteTarget ? static_cast<Side &>(*remoteTarget)
                                : static_cast<Side &>(localSide);
    TransferRun run(job, strategy, source, target, remoteSource.get(),
                    remoteTarget.get(), cancel, tx);
    run.run();

    if (remoteSource)
        remoteSource->client().disconnect();
    if (remoteTarget)
        remoteTarget->client().disconnect();
}

} // namespace opendir

// Remote panel operations. Each one borrows the panel's RemoteContext,
// runs under the spinner and hands the context back with its outcome.
#include "App.hpp"
#include "AppLogging.hpp"
#include "opendir/ConfigPaths.hpp"
#include "opendir/RemoteTransfer.hpp"
#include "opendir/RemoteUri.hpp"

#include <algorithm>
#include <filesystem>
#include <iterator>

namespace opendir {

namespace fs = std::filesystem;

namespace {

bool isImageName(const std::string &name) {
    static const char *const kImageExt[] = {"png", "jpg", "jpeg", "gif",
                                            "bmp", "webp"};
    const std::string ext = extensionOf(name);
    return std::any_of(std::begin(kImageExt), std::end(kImageExt),
                       [&](const char *e) { return ext == e; });
}

// First line, capped, for the status line.
std::string shortRemoteError(const std::string &raw,
                             const std::string &fallback) {
    std::string msg = raw;
    const auto nl = msg.find('\n');
    if (nl != std::string::npos)
        msg.resize(nl);
    if (msg.empty())
        return fallback;
    if (msg.size() > 96)
        msg = msg.substr(0, 93) + "...";
    return msg;
}

} // namespace

bool App::takeSpinnerSlot() {
    if (spinner_.busy()) {
        showMessage("Busy: " + spinner_.message());
        return false;
    }
    return true;
}

void App::startRemoteList(std::size_t idx, const std::string &path,
                          std::optional<std::string> rollback) {
    if (idx >= panels_.size() || !takeSpinnerSlot())
        return;
    std::unique_ptr<RemoteContext> ctx = panels_[idx].takeRemote();
    if (!ctx) {
        showMessage("Not connected");
        return;
    }
    qCDebug(odRemote) << "Listing" << redacted(path);
    spinner_.start(
        "Loading " + path,
        [idx, path, rollback, ctx = std::move(ctx)](const CancelFlag &) mutable {
            PanelOutcome o;
            o.kind = PanelOutcome::Kind::ListDir;
            o.path = path;
            o.rollback_path = rollback;
            std::string err;
            if (!ctx->isConnected()) {
                o.ok = false;
                o.message = "Not connected";
            } else if (!ctx->client().list(path, o.entries, err)) {
                o.ok = false;
                o.message = err;
                ctx->markDisconnected(err);
            }
            return SpinnerResult::panelOp(idx, std::move(ctx), std::move(o));
        });
}

void App::startRemoteMutation(
    std::size_t idx, const std::string &message,
    std::function<bool(SftpClient &, std::string &)> op, std::string success,
    std::optional<std::string> focus) {
    if (idx >= panels_.size() || !takeSpinnerSlot())
        return;
    std::unique_ptr<RemoteContext> ctx = panels_[idx].takeRemote();
    if (!ctx) {
        showMessage("Not connected");
        return;
    }
    spinner_.start(message, [idx, op = std::move(op),
                             success = std::move(success),
                             focus = std::move(focus),
                             ctx = std::move(ctx)](const CancelFlag &) mutable {
        PanelOutcome o;
        o.kind = PanelOutcome::Kind::Simple;
        o.pending_focus = focus;
        std::string err;
        if (!ctx->isConnected()) {
            o.ok = false;
            o.message = "Not connected";
        } else if (!op(ctx->client(), err)) {
            o.ok = false;
            o.message = err;
            o.reload = true;
        } else {
            o.message = success;
            o.reload = true;
        }
        return SpinnerResult::panelOp(idx, std::move(ctx), std::move(o));
    });
}

void App::startRemoteGoto(std::size_t idx, const std::string &path) {
    if (idx >= panels_.size() || !takeSpinnerSlot())
        return;
    std::unique_ptr<RemoteContext> ctx = panels_[idx].takeRemote();
    if (!ctx) {
        showMessage("Not connected");
        return;
    }
    spinner_.start("Checking " + path, [idx, path, ctx = std::move(ctx)](
                                           const CancelFlag &) mutable {
        PanelOutcome o;
        o.kind = PanelOutcome::Kind::DirExists;
        o.target = path;
        std::string err;
        if (!ctx->isConnected()) {
            o.ok = false;
            o.message = "Not connected";
            return SpinnerResult::panelOp(idx, std::move(ctx), std::move(o));
        }
        bool isDir = false;
        o.exists = ctx->client().exists(path, isDir, err) && isDir;
        if (!err.empty()) {
            o.ok = false;
            o.message = err;
        }
        return SpinnerResult::panelOp(idx, std::move(ctx), std::move(o));
    });
}

void App::deleteRemote(std::size_t idx, const std::vector<std::string> &names) {
    PanelState &p = panels_[idx];
    std::vector<std::pair<std::string, bool>> targets;
    for (const auto &name : names) {
        const auto it = std::find_if(
            p.entries().begin(), p.entries().end(),
            [&](const FileItem &item) { return item.name == name; });
        const bool isDir =
            it != p.entries().end() && it->is_dir && !it->is_symlink;
        targets.emplace_back(joinRemotePath(p.path(), name), isDir);
    }
    p.clearMarks();
    const std::size_t total = targets.size();
    startRemoteMutation(
        idx, "Deleting " + std::to_string(total) + " item(s)",
        [targets, total](SftpClient &c, std::string &err) {
            std::size_t ok = 0;
            std::string lastErr;
            for (const auto &t : targets) {
                std::string e;
                if (c.remove(t.first, t.second, e))
                    ++ok;
                else
                    lastErr = e;
            }
            if (!lastErr.empty()) {
                err = "Deleted " + std::to_string(ok) + "/" +
                      std::to_string(total) + ". Error: " + lastErr;
                return false;
            }
            return true;
        },
        "Deleted " + std::to_string(total) + " item(s)", std::nullopt);
}

void App::openRemoteFile(std::size_t idx, const FileItem &item) {
    if (busy()) {
        showMessage("Another operation is in progress");
        return;
    }
    const PanelState &p = panels_[idx];
    const std::optional<RemoteProfile> profile = p.remoteProfile();
    if (!profile) {
        showMessage("Not connected");
        return;
    }
    const std::string remotePath = joinRemotePath(p.path(), item.name);
    const fs::path tmp = remoteScratchPath(*profile, remotePath);
    std::string err;
    if (!ensurePrivateDirectory(tmp.parent_path(), err)) {
        showMessage(err);
        return;
    }

    PendingRemoteOpen open;
    open.kind = isImageName(item.name) ? PendingRemoteOpen::Kind::ImageViewer
                                       : PendingRemoteOpen::Kind::Editor;
    open.tmp_path = tmp.string();
    open.panel_idx = idx;
    open.remote_path = remotePath;
    open.profile = *profile;
    pendingOpen_ = std::move(open);

    RemoteTransferJob job;
    job.op = TransferOp::Copy;
    job.source = Endpoint::onRemote(*profile, p.path());
    job.target = Endpoint::local(tmp.parent_path().string());
    job.names = {item.name};
    const SftpClientFactory factory = sftpFactory_;
    launchProgress(OperationKind::Download, {},
                   [job, factory](const CancelFlag &cancel,
                                  const ProgressSender &tx) {
                       runTransferWithProgress(job, factory, cancel, tx);
                   });
}

void App::pollSpinner() {
    std::optional<SpinnerResult> result = spinner_.poll();
    if (result)
        applySpinnerResult(std::move(*result));
}

void App::applySpinnerResult(SpinnerResult result) {
    const std::size_t idx = result.panel_idx;
    switch (result.kind) {
    case SpinnerResult::Kind::Connected: {
        if (!result.ok || !result.ctx) {
            qCWarning(odRemote) << "Connection failed:"
                                << redacted(result.message);
            showMessage("Connection failed: " +
                            shortRemoteError(result.message, "unknown error"),
                        5);
            return;
        }
        if (idx >= panels_.size())
            return;
        const RemoteProfile profile = result.ctx->profile();
        panels_[idx].attachRemote(std::move(result.ctx), result.entries,
                                  result.path);
        if (!settings_.findProfile(profile.user, profile.host, profile.port)) {
            settings_.upsertProfile(profile);
            persistSettings();
        }
        qCInfo(odRemote) << "Connected to" << redacted(profile.host);
        showMessage("Connected to " + profile.user + "@" + profile.host);
        return;
    }
    case SpinnerResult::Kind::PanelOp:
        if (idx >= panels_.size())
            return;
        if (result.ctx)
            panels_[idx].restoreRemote(std::move(result.ctx));
        applyPanelOutcome(idx, std::move(result.outcome));
        return;
    case SpinnerResult::Kind::LocalOp:
        showMessage(result.message, result.ok ? 3 : 5);
        if (result.reload)
            refreshPanel(idx);
        return;
    case SpinnerResult::Kind::SearchComplete:
        if (!result.ok) {
            showMessage(result.message);
            return;
        }
        if (result.matches.empty()) {
            showMessage("No matches for " + result.pattern);
            return;
        }
        searchResults_ = SearchResults{result.search_root, result.pattern,
                                       std::move(result.matches),
                                       result.truncated, 0};
        screen_ = Screen::SearchResults;
        return;
    case SpinnerResult::Kind::GitDiffComplete:
        if (!result.ok || !result.diff) {
            showMessage(result.message, 5);
            return;
        }
        diffView_ = DiffView{std::move(*result.diff),
                             result.revision + "  <>  working tree", false, 0};
        screen_ = Screen::Diff;
        return;
    }
}

void App::applyPanelOutcome(std::size_t idx, PanelOutcome outcome) {
    PanelState &p = panels_[idx];
    switch (outcome.kind) {
    case PanelOutcome::Kind::ListDir:
        if (outcome.ok) {
            p.applyRemoteEntries(outcome.entries, outcome.path);
            return;
        }
        qCWarning(odRemote) << "Listing failed:" << redacted(outcome.message);
        if (outcome.rollback_path)
            p.setPath(*outcome.rollback_path);
        p.clearPendingFocus();
        showMessage(shortRemoteError(outcome.message, "Failed to list"), 5);
        return;
    case PanelOutcome::Kind::Simple:
        showMessage(outcome.message, outcome.ok ? 3 : 5);
        if (outcome.ok && outcome.pending_focus)
            p.setPendingFocus(*outcome.pending_focus);
        if (outcome.reload)
            startRemoteList(idx, p.path(), std::nullopt);
        return;
    case PanelOutcome::Kind::DirExists:
        if (!outcome.ok) {
            showMessage(shortRemoteError(outcome.message, "Not found"), 5);
            return;
        }
        if (!outcome.exists) {
            showMessage("Directory not found: " + outcome.target);
            return;
        }
        startRemoteList(idx, outcome.target, p.path());
        return;
    }
}

void App::checkRemoteEdits() {
    for (auto it = remoteEdits_.begin(); it != remoteEdits_.end();) {
        std::error_code ec;
        const auto mtime = fs::last_write_time(it->tmp_path, ec);
        if (ec) {
            it = remoteEdits_.erase(it);
            continue;
        }
        if (mtime == it->mtime) {
            ++it;
            continue;
        }
        it->mtime = mtime;
        const RemoteEditOrigin origin = *it;
        const SftpClientFactory factory = sftpFactory_;
        const std::string name = remoteBaseName(origin.remote_path);
        spinner_.start("Uploading " + name,
                       [origin, factory, name](const CancelFlag &cancel) {
                           SpinnerResult r = SpinnerResult::localOp(
                               true, "Uploaded " + name, true);
                           r.panel_idx = origin.panel_idx;
                           std::unique_ptr<SftpClient> client =
                               factory ? factory() : nullptr;
                           std::string err;
                           if (!client) {
                               r.ok = false;
                               r.message = "No SFTP backend available";
                               return r;
                           }
                           const bool ok =
                               client->connect(sessionOptionsFor(origin.profile),
                                               err) &&
                               client->put(origin.tmp_path, origin.remote_path,
                                           err, {}, [&cancel]() {
                                               return isCancelled(cancel);
                                           });
                           client->disconnect();
                           if (!ok) {
                               r.ok = false;
                               r.message = "Upload of " + name +
                                           " failed: " + err;
                           }
                           return r;
                       });
        return;
    }
}

void App::processRemoteRefreshQueue() {
    while (!pendingRemoteRefresh_.empty() && !spinner_.busy()) {
        const std::size_t idx = pendingRemoteRefresh_.front();
        pendingRemoteRefresh_.erase(pendingRemoteRefresh_.begin());
        if (idx < panels_.size() && panels_[idx].remote()) {
            startRemoteList(idx, panels_[idx].path(), std::nullopt);
            return;
        }
    }
}

} // namespace opendir

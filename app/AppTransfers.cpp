// Progress-bearing operations: launch on a worker, drain each tick, and
// apply completion effects (refresh, pending open, diff screen).
#include "App.hpp"
#include "AppLogging.hpp"
#include "opendir/RemoteTransfer.hpp"

#include <algorithm>
#include <filesystem>
#include <thread>

namespace opendir {

namespace fs = std::filesystem;

void App::launchProgress(OperationKind kind, std::vector<std::size_t> refresh,
                         ProgressWork work) {
    ProgressSender tx;
    progress_.emplace(ProgressState::start(kind, tx));
    refreshAfterProgress_ = std::move(refresh);
    const CancelFlag cancel = progress_->cancelFlag();
    if (progressWorker_.joinable())
        progressWorker_.join();
    progressWorker_ =
        std::thread([work = std::move(work), tx = std::move(tx), cancel]() {
            work(cancel, tx);
        });
}

void App::stopWorkers() {
    if (progress_)
        progress_->cancel();
    spinner_.cancel();
    if (progressWorker_.joinable())
        progressWorker_.join();
    spinner_.joinWorker();
}

void App::launchRemoteTransfer(const Clipboard &clip, std::size_t targetPanel) {
    const PanelState &target = panels_[targetPanel];
    RemoteTransferJob job;
    job.op = clip.op == ClipOperation::Cut ? TransferOp::Move : TransferOp::Copy;
    job.source = clip.remote ? Endpoint::onRemote(*clip.remote, clip.source_path)
                             : Endpoint::local(clip.source_path);
    const std::optional<RemoteProfile> targetProfile = target.remoteProfile();
    job.target = targetProfile ? Endpoint::onRemote(*targetProfile, target.path())
                               : Endpoint::local(target.path());
    job.names = clip.names;

    OperationKind kind = OperationKind::RemoteTransfer;
    switch (selectStrategy(job.source, job.target)) {
    case TransferStrategy::Upload:
        kind = OperationKind::Upload;
        break;
    case TransferStrategy::Download:
        kind = OperationKind::Download;
        break;
    case TransferStrategy::LocalToLocal:
        kind = job.op == TransferOp::Move ? OperationKind::Move
                                          : OperationKind::Copy;
        break;
    case TransferStrategy::RemoteToRemote:
        break;
    }

    // Panels showing either end get reloaded.
    std::vector<std::size_t> refresh{targetPanel};
    for (std::size_t i = 0; i < panels_.size(); ++i) {
        if (i == targetPanel || panels_[i].path() != clip.source_path)
            continue;
        const std::optional<RemoteProfile> rp = panels_[i].remoteProfile();
        const bool same = clip.remote
                              ? rp && rp->sameEndpoint(clip.remote->user,
                                                       clip.remote->host,
                                                       clip.remote->port)
                              : !rp;
        if (same)
            refresh.push_back(i);
    }

    qCInfo(odXfer) << strategyName(selectStrategy(job.source, job.target))
                   << "of" << job.names.size() << "item(s)";
    const SftpClientFactory factory = sftpFactory_;
    launchProgress(kind, std::move(refresh),
                   [job, factory](const CancelFlag &cancel,
                                  const ProgressSender &tx) {
                       runTransferWithProgress(job, factory, cancel, tx);
                   });
}

void App::pollProgress() {
    if (!progress_)
        return;
    progress_->poll();
    if (progress_->active())
        return;
    const OperationKind kind = progress_->kind();
    const std::optional<FinalResult> result = progress_->takeResult();
    progress_.reset();
    if (progressWorker_.joinable())
        progressWorker_.join();
    finishProgress(kind, result ? *result
                                : FinalResult{0, 1, "Cancelled or failed"});
}

void App::finishProgress(OperationKind kind, const FinalResult &result) {
    const std::string summary = summarize(kind, result);
    lastSummary_ = summary;
    showMessage(summary, result.failure_count ? 6 : 3);

    if (kind == OperationKind::Diff) {
        DiffReport report;
        if (diffRx_ && diffRx_->tryRecv(report) == RecvStatus::Ok) {
            diffView_ = DiffView{std::move(report), diffTitle_, false, 0};
            screen_ = Screen::Diff;
        }
        diffRx_.reset();
    }
    if (kind == OperationKind::Download && pendingOpen_)
        applyPendingOpen(result);

    const std::vector<std::size_t> refresh = std::move(refreshAfterProgress_);
    refreshAfterProgress_.clear();
    for (std::size_t idx : refresh)
        refreshPanel(idx);
}

void App::applyPendingOpen(const FinalResult &result) {
    const PendingRemoteOpen open = std::move(*pendingOpen_);
    pendingOpen_.reset();
    std::error_code ec;
    if (result.failure_count > 0 || !fs::exists(open.tmp_path, ec)) {
        qCWarning(odRemote) << "Download for open failed:"
                            << redacted(result.last_error);
        return;
    }
    if (open.kind == PendingRemoteOpen::Kind::ImageViewer) {
        openLocalFile(open.tmp_path);
        return;
    }
    RemoteEditOrigin origin;
    origin.tmp_path = open.tmp_path;
    origin.panel_idx = open.panel_idx;
    origin.remote_path = open.remote_path;
    origin.profile = open.profile;
    origin.mtime = fs::last_write_time(open.tmp_path, ec);
    remoteEdits_.erase(std::remove_if(remoteEdits_.begin(), remoteEdits_.end(),
                                      [&](const RemoteEditOrigin &o) {
                                          return o.tmp_path == origin.tmp_path;
                                      }),
                       remoteEdits_.end());
    remoteEdits_.push_back(origin);
    openLocalFile(open.tmp_path);
}

} // namespace opendir

// Local-side intents: clipboard, paste with conflict and symlink prompts,
// tar/untar, encrypt/decrypt, mkdir/mkfile/rename/delete, diff, search and
// git diff.
#include "App.hpp"
#include "AppLogging.hpp"
#include "GitScratch.hpp"
#include "LocalSearch.hpp"
#include "opendir/ArchiveEngine.hpp"
#include "opendir/EncFormat.hpp"
#include "opendir/EncPack.hpp"
#include "opendir/LocalFsEngine.hpp"
#include "opendir/PathValidator.hpp"

#include <algorithm>
#include <filesystem>
#include <map>

namespace opendir {

namespace fs = std::filesystem;

namespace {

const char *const kFallbackEditor = "${EDITOR:-vi} {{FILEPATH}}";

std::string itemsLabel(std::size_t n) {
    return std::to_string(n) + (n == 1 ? " item" : " items");
}

} // namespace

bool App::navigateLocal(std::size_t idx, const std::string &path) {
    std::string err;
    if (!panels_[idx].navigate(path, err)) {
        showMessage(err);
        return false;
    }
    return true;
}

void App::goParent() {
    PanelState &p = activePanel();
    const std::optional<std::string> parent = p.parentForNavigation();
    if (!parent)
        return;
    if (p.isRemote())
        startRemoteList(active_, *parent, p.path());
    else
        navigateLocal(active_, *parent);
}

void App::openCurrent() {
    PanelState &p = activePanel();
    const FileItem *cur = p.current();
    if (!cur)
        return;
    if (cur->isParentLink()) {
        goParent();
        return;
    }
    if (p.isRemote()) {
        if (cur->is_dir)
            startRemoteList(active_, joinRemotePath(p.path(), cur->name),
                            p.path());
        else
            openRemoteFile(active_, *cur);
        return;
    }
    const fs::path target = fs::path(p.path()) / cur->name;
    if (cur->is_dir) {
        navigateLocal(active_, target.string());
        return;
    }
    openLocalFile(target.string());
    refreshPanel(active_);
}

void App::openLocalFile(const std::string &path) {
    HandlerLaunch launch;
    std::string err;
    bool ok = false;
    if (handlers_.hasHandler(path)) {
        ok = handlers_.open(path, frontend_, launch, err);
    } else {
        const ExtensionHandler fallback({{extensionOf(path), {kFallbackEditor}}},
                                        options_.self_exe);
        ok = fallback.open(path, frontend_, launch, err);
    }
    if (!ok)
        showMessage(err);
    else if (launch.background)
        showMessage("Opened " + fs::path(path).filename().string());
}

void App::copyToClipboard(ClipOperation op) {
    PanelState &p = activePanel();
    std::vector<std::string> names = p.selectedNames();
    if (names.empty()) {
        showMessage("Nothing selected");
        return;
    }
    Clipboard clip;
    clip.source_path = p.path();
    clip.names = std::move(names);
    clip.op = op;
    clip.remote = p.remoteProfile();
    const std::size_t n = clip.names.size();
    clipboard_ = std::move(clip);
    p.clearMarks();
    showMessage(itemsLabel(n) +
                (op == ClipOperation::Cut ? " cut" : " copied") +
                " to clipboard");
}

void App::paste() {
    if (!clipboard_) {
        showMessage("Clipboard is empty");
        return;
    }
    startPaste(PendingPaste{*clipboard_, active_, true});
}

void App::transferToNextPanel(ClipOperation op) {
    if (panels_.size() < 2) {
        showMessage("No other panel");
        return;
    }
    PanelState &p = activePanel();
    std::vector<std::string> names = p.selectedNames();
    if (names.empty()) {
        showMessage("Nothing selected");
        return;
    }
    Clipboard clip;
    clip.source_path = p.path();
    clip.names = std::move(names);
    clip.op = op;
    clip.remote = p.remoteProfile();
    p.clearMarks();
    startPaste(PendingPaste{std::move(clip), nextPanelIndex(), false});
}

void App::startPaste(PendingPaste pending) {
    if (busy()) {
        showMessage("Another operation is in progress");
        return;
    }
    const PanelState &target = panels_[pending.target_panel];
    const Clipboard &clip = pending.clipboard;
    const bool move = clip.op == ClipOperation::Cut;
    const std::optional<RemoteProfile> targetProfile = target.remoteProfile();

    bool sameEndpoint = clip.remote.has_value() == targetProfile.has_value();
    if (sameEndpoint && clip.remote)
        sameEndpoint = clip.remote->sameEndpoint(
            targetProfile->user, targetProfile->host, targetProfile->port);
    if (sameEndpoint && clip.source_path == target.path()) {
        if (move) {
            showMessage("Cannot move items into the same folder");
            return;
        }
        if (clip.remote) {
            showMessage("Duplicating in the same folder needs a local panel");
            return;
        }
    }

    if (clip.remote || targetProfile) {
        launchRemoteTransfer(clip, pending.target_panel);
        if (pending.from_clipboard && move)
            clipboard_.reset();
        return;
    }

    std::vector<FlaggedSymlink> flagged =
        scanFlaggedSymlinks(clip.source_path, clip.names);
    if (!flagged.empty()) {
        qCInfo(odXfer) << flagged.size() << "flagged symlinks in selection";
        symlinkWarning_ =
            SymlinkWarning{std::move(flagged), std::move(pending), std::nullopt};
        return;
    }
    continuePaste(std::move(pending), {});
}

void App::continuePaste(PendingPaste pending, const PathSet &excluded) {
    const Clipboard &clip = pending.clipboard;
    const bool move = clip.op == ClipOperation::Cut;
    const std::string dst = panels_[pending.target_panel].path();

    const bool allExcluded =
        !excluded.empty() &&
        std::all_of(clip.names.begin(), clip.names.end(),
                    [&](const std::string &name) {
                        return excluded.count(
                                   (fs::path(clip.source_path) / name)
                                       .string()) > 0;
                    });
    if (allExcluded) {
        showMessage("Nothing left to copy after excluding symlinks");
        return;
    }

    if (!move && clip.source_path == dst) {
        launchDuplicate(clip, pending.target_panel, excluded);
        return;
    }

    std::vector<ConflictItem> items =
        detectConflicts(clip.names, clip.source_path, dst);
    items.erase(std::remove_if(items.begin(), items.end(),
                               [&](const ConflictItem &item) {
                                   return excluded.count(item.source) > 0;
                               }),
                items.end());

    if (pending.from_clipboard && move)
        clipboard_.reset();

    if (!items.empty()) {
        conflictExcluded_ = excluded;
        conflictFromClipboard_ = pending.from_clipboard;
        conflict_.emplace(std::move(items), clip, move, dst,
                          pending.target_panel);
        return;
    }
    launchLocalTransfer(clip, dst, pending.target_panel, {}, {}, excluded);
}

void App::resolveConflict(ConflictChoice choice) {
    if (!conflict_)
        return;
    conflict_->resolver.apply(choice);
    if (!conflict_->resolver.finished())
        return;
    ConflictState state = std::move(*conflict_);
    conflict_.reset();
    const PathSet excluded = std::move(conflictExcluded_);
    conflictExcluded_.clear();
    launchLocalTransfer(state.clipboard, state.target_dir, state.target_panel,
                        state.resolver.overwriteSet(),
                        state.resolver.skipSet(), excluded);
}

void App::cancelConflict() {
    if (!conflict_)
        return;
    if (conflictFromClipboard_ &&
        conflict_->clipboard.op == ClipOperation::Cut)
        clipboard_ = conflict_->clipboard;
    conflict_.reset();
    conflictExcluded_.clear();
    showMessage("Cancelled");
}

void App::resolveSymlinkWarning(SymlinkDecision decision) {
    if (!symlinkWarning_)
        return;
    SymlinkWarning warning = std::move(*symlinkWarning_);
    symlinkWarning_.reset();
    if (decision == SymlinkDecision::Cancel) {
        showMessage("Cancelled");
        return;
    }
    const bool exclude = decision == SymlinkDecision::ExcludeFlagged;

    if (warning.paste) {
        PathSet excluded;
        if (exclude)
            for (const auto &f : warning.flagged)
                excluded.insert(
                    (fs::path(warning.paste->clipboard.source_path) /
                     f.relative_path)
                        .string());
        continuePaste(std::move(*warning.paste), excluded);
        return;
    }
    if (warning.tar) {
        std::vector<std::string> excludes;
        if (exclude)
            for (const auto &f : warning.flagged)
                excludes.push_back(f.relative_path);
        const auto &names = warning.tar->names;
        const bool allExcluded =
            exclude && std::all_of(names.begin(), names.end(),
                                   [&](const std::string &name) {
                                       return std::find(excludes.begin(),
                                                        excludes.end(),
                                                        name) != excludes.end();
                                   });
        if (allExcluded) {
            showMessage("Nothing left to archive after excluding symlinks");
            return;
        }
        launchTar(*warning.tar, std::move(excludes));
    }
}

void App::launchLocalTransfer(const Clipboard &clip, const std::string &dst,
                              std::size_t targetPanel,
                              const PathSet &overwrite, const PathSet &skip,
                              const PathSet &excluded) {
    const bool move = clip.op == ClipOperation::Cut;
    std::vector<std::size_t> refresh{targetPanel};
    for (std::size_t i = 0; i < panels_.size(); ++i)
        if (!panels_[i].isRemote() && panels_[i].path() == clip.source_path)
            refresh.push_back(i);

    const std::vector<std::string> names = clip.names;
    const fs::path src = clip.source_path;
    const fs::path to = dst;
    launchProgress(move ? OperationKind::Move : OperationKind::Copy,
                   std::move(refresh),
                   [names, src, to, overwrite, skip, excluded, move](
                       const CancelFlag &cancel, const ProgressSender &tx) {
                       if (move)
                           moveFilesWithProgress(names, src, to, overwrite,
                                                 skip, cancel, tx, excluded);
                       else
                           copyFilesWithProgress(names, src, to, overwrite,
                                                 skip, cancel, tx, excluded);
                   });
}

void App::launchDuplicate(const Clipboard &clip, std::size_t panel,
                          const PathSet &excluded) {
    const std::vector<std::string> names = clip.names;
    const fs::path dir = clip.source_path;
    std::vector<std::size_t> refresh;
    for (std::size_t i = 0; i < panels_.size(); ++i)
        if (!panels_[i].isRemote() && panels_[i].path() == clip.source_path)
            refresh.push_back(i);
    if (std::find(refresh.begin(), refresh.end(), panel) == refresh.end())
        refresh.push_back(panel);
    launchProgress(OperationKind::Duplicate, std::move(refresh),
                   [names, dir, excluded](const CancelFlag &cancel,
                                          const ProgressSender &tx) {
                       duplicateFilesWithProgress(names, dir, cancel, tx,
                                                  excluded);
                   });
}

std::string App::tarBinary() const {
    return findTarBinary(settings_.effectiveTarPath());
}

void App::startTar(const std::string &archiveName) {
    PanelState &p = activePanel();
    if (p.isRemote()) {
        showMessage("Archiving needs a local panel");
        return;
    }
    if (busy()) {
        showMessage("Another operation is in progress");
        return;
    }
    const std::vector<std::string> names = p.selectedNames();
    if (names.empty()) {
        showMessage("Nothing selected");
        return;
    }
    std::string why;
    if (!isValidFilename(archiveName, &why)) {
        showMessage(why);
        return;
    }
    PendingTar tar{p.path(), names, archiveName, active_};
    std::vector<FlaggedSymlink> flagged = scanFlaggedSymlinks(p.path(), names);
    if (!flagged.empty()) {
        symlinkWarning_ =
            SymlinkWarning{std::move(flagged), std::nullopt, std::move(tar)};
        return;
    }
    launchTar(tar, {});
}

void App::launchTar(const PendingTar &tar, std::vector<std::string> excludes) {
    const std::string binary = tarBinary();
    if (binary.empty()) {
        showMessage("tar was not found");
        return;
    }
    TarRequest req;
    req.tar_binary = binary;
    req.base_dir = tar.base_dir;
    req.names = tar.names;
    req.archive_name = tar.archive_name;
    req.excludes = std::move(excludes);
    if (tar.panel < panels_.size())
        panels_[tar.panel].setPendingFocus(tar.archive_name);
    launchProgress(OperationKind::Tar, {tar.panel},
                   [req](const CancelFlag &cancel, const ProgressSender &tx) {
                       createArchiveWithProgress(req, cancel, tx);
                   });
}

void App::startUntar() {
    PanelState &p = activePanel();
    const FileItem *cur = p.current();
    if (!cur || cur->is_dir || !isArchiveName(cur->name)) {
        showMessage("Not a tar archive");
        return;
    }
    if (p.isRemote()) {
        showMessage("Extracting needs a local panel");
        return;
    }
    if (busy()) {
        showMessage("Another operation is in progress");
        return;
    }
    const std::string binary = tarBinary();
    if (binary.empty()) {
        showMessage("tar was not found");
        return;
    }
    UntarRequest req;
    req.tar_binary = binary;
    req.archive_path = fs::path(p.path()) / cur->name;
    req.extract_dir = fs::path(p.path()) / extractDirName(cur->name);
    p.setPendingFocus(extractDirName(cur->name));
    launchProgress(OperationKind::Untar, {active_},
                   [req](const CancelFlag &cancel, const ProgressSender &tx) {
                       extractArchiveWithProgress(req, cancel, tx);
                   });
}

void App::askEncryptDirectory() {
    PanelState &p = activePanel();
    if (p.isRemote()) {
        showMessage("Encrypting needs a local panel");
        return;
    }
    std::vector<std::string> names;
    std::string err;
    if (!listPackableFiles(p.path(), names, err)) {
        showMessage(err);
        return;
    }
    if (names.empty()) {
        showMessage("No files to encrypt");
        return;
    }
    openDialog(Dialog::Kind::ConfirmEncrypt,
               "Encrypt " + itemsLabel(names.size()) +
                   "? Originals are deleted");
    dialog_.items = names;
}

void App::askDecryptDirectory() {
    PanelState &p = activePanel();
    if (p.isRemote()) {
        showMessage("Decrypting needs a local panel");
        return;
    }
    std::map<std::string, std::vector<EncFileInfo>> groups;
    std::string err;
    if (!groupEncFiles(p.path(), groups, err)) {
        showMessage(err);
        return;
    }
    if (groups.empty()) {
        showMessage("No encrypted files here");
        return;
    }
    openDialog(Dialog::Kind::ConfirmDecrypt,
               "Decrypt " + std::to_string(groups.size()) +
                   (groups.size() == 1 ? " file?" : " files?"));
    for (const auto &group : groups) {
        for (const EncFileInfo &chunk : group.second)
            dialog_.items.push_back(chunk.path.filename().string());
    }
}

void App::startEncrypt() {
    if (busy()) {
        showMessage("Another operation is in progress");
        return;
    }
    fs::path keyPath;
    std::string err;
    if (!ensureEncKey(keyPath, err)) {
        qCWarning(odConfig) << "encryption key unavailable:"
                            << QString::fromStdString(err);
        showMessage("Key file error: " + err);
        return;
    }
    const fs::path dir = activePanel().path();
    launchProgress(OperationKind::Encrypt, {active_},
                   [dir, keyPath](const CancelFlag &cancel,
                                  const ProgressSender &tx) {
                       packDirectoryWithProgress(dir, keyPath, cancel, tx);
                   });
}

void App::startDecrypt() {
    if (busy()) {
        showMessage("Another operation is in progress");
        return;
    }
    const fs::path keyPath = encKeyPath();
    const fs::path dir = activePanel().path();
    launchProgress(OperationKind::Decrypt, {active_},
                   [dir, keyPath](const CancelFlag &cancel,
                                  const ProgressSender &tx) {
                       unpackDirectoryWithProgress(dir, keyPath, cancel, tx);
                   });
}

void App::createDirectory(const std::string &name) {
    PanelState &p = activePanel();
    std::string why;
    if (!isValidFilename(name, &why)) {
        showMessage(why);
        return;
    }
    if (p.isRemote()) {
        const std::string target = joinRemotePath(p.path(), name);
        startRemoteMutation(
            active_, "Creating " + name,
            [target](SftpClient &c, std::string &err) {
                return c.mkdir(target, err);
            },
            "Created " + name, name);
        return;
    }
    std::string err;
    if (!opendir::createDirectory(p.path(), name, err)) {
        showMessage(err);
        return;
    }
    p.setPendingFocus(name);
    refreshPanel(active_);
    showMessage("Created " + name);
}

void App::createFile(const std::string &name) {
    PanelState &p = activePanel();
    std::string why;
    if (!isValidFilename(name, &why)) {
        showMessage(why);
        return;
    }
    if (p.isRemote()) {
        const std::string target = joinRemotePath(p.path(), name);
        startRemoteMutation(
            active_, "Creating " + name,
            [target](SftpClient &c, std::string &err) {
                return c.createFile(target, err);
            },
            "Created " + name, name);
        return;
    }
    std::string err;
    if (!opendir::createFile(p.path(), name, err)) {
        showMessage(err);
        return;
    }
    p.setPendingFocus(name);
    refreshPanel(active_);
    showMessage("Created " + name);
}

void App::renameCurrent(const std::string &newName) {
    PanelState &p = activePanel();
    const FileItem *cur = p.current();
    if (!cur || cur->isParentLink())
        return;
    const std::string oldName = cur->name;
    if (oldName == newName)
        return;
    std::string why;
    if (!isValidFilename(newName, &why)) {
        showMessage(why);
        return;
    }
    if (p.isRemote()) {
        const std::string from = joinRemotePath(p.path(), oldName);
        const std::string to = joinRemotePath(p.path(), newName);
        startRemoteMutation(
            active_, "Renaming " + oldName,
            [from, to](SftpClient &c, std::string &err) {
                return c.rename(from, to, err);
            },
            "Renamed to " + newName, newName);
        return;
    }
    std::string err;
    if (!renameEntry(p.path(), oldName, newName, err)) {
        showMessage(err);
        return;
    }
    p.setPendingFocus(newName);
    refreshPanel(active_);
    showMessage("Renamed to " + newName);
}

void App::deleteSelection() {
    const std::vector<std::string> names = activePanel().selectedNames();
    if (names.empty())
        return;
    const std::string title =
        names.size() == 1 ? "Delete " + names.front() + "?"
                          : "Delete " + itemsLabel(names.size()) + "?";
    openDialog(Dialog::Kind::ConfirmDelete, title);
    dialog_.items = names;
}

void App::deleteLocal(std::size_t idx, const std::vector<std::string> &names) {
    PanelState &p = panels_[idx];
    std::size_t ok = 0;
    std::string lastErr;
    for (const auto &name : names) {
        std::string err;
        if (deleteFile(fs::path(p.path()) / name, err))
            ++ok;
        else
            lastErr = err;
    }
    p.clearMarks();
    refreshPanel(idx);
    if (lastErr.empty())
        showMessage("Deleted " + itemsLabel(ok));
    else
        showMessage("Deleted " + std::to_string(ok) + "/" +
                        std::to_string(names.size()) + ". Error: " + lastErr,
                    5);
}

void App::startDiffWithNextPanel() {
    if (panels_.size() < 2) {
        showMessage("No other panel");
        return;
    }
    const PanelState &left = activePanel();
    const PanelState &right = panels_[nextPanelIndex()];
    if (left.isRemote() || right.isRemote()) {
        showMessage("Comparing needs two local panels");
        return;
    }
    if (busy()) {
        showMessage("Another operation is in progress");
        return;
    }
    const fs::path l = left.path();
    const fs::path r = right.path();
    const CompareMethod method = settings_.diff_compare_method;
    auto channel = makeChannel<DiffReport>();
    diffRx_.emplace(std::move(channel.second));
    diffTitle_ = left.path() + "  <>  " + right.path();
    DiffResultSender resultTx = std::move(channel.first);
    launchProgress(OperationKind::Diff, {},
                   [l, r, method, resultTx](const CancelFlag &cancel,
                                            const ProgressSender &tx) {
                       compareDirectoriesWithProgress(l, r, method, cancel, tx,
                                                      resultTx);
                   });
}

void App::startSearch(const std::string &pattern) {
    if (pattern.empty())
        return;
    if (activePanel().isRemote()) {
        showMessage("Search needs a local panel");
        return;
    }
    if (!takeSpinnerSlot())
        return;
    const std::string root = activePanel().path();
    spinner_.start("Searching for " + pattern,
                   [root, pattern](const CancelFlag &cancel) {
                       SpinnerResult r;
                       r.kind = SpinnerResult::Kind::SearchComplete;
                       r.search_root = root;
                       r.pattern = pattern;
                       SearchOutcome found;
                       std::string err;
                       if (!searchFiles(root, pattern, cancel, found, err)) {
                           r.ok = false;
                           r.message = err;
                           return r;
                       }
                       r.matches = std::move(found.matches);
                       r.truncated = found.truncated;
                       return r;
                   });
}

void App::startGitDiff(const std::string &revision) {
    if (activePanel().isRemote()) {
        showMessage("Git diff needs a local panel");
        return;
    }
    if (!isValidRevision(revision)) {
        showMessage("Invalid revision: " + revision);
        return;
    }
    const std::string binary = tarBinary();
    if (binary.empty()) {
        showMessage("tar was not found");
        return;
    }
    if (!takeSpinnerSlot())
        return;
    const fs::path dir = activePanel().path();
    const CompareMethod method = settings_.diff_compare_method;
    spinner_.start("Exporting " + revision,
                   [dir, revision, binary, method](const CancelFlag &cancel) {
                       SpinnerResult r;
                       r.kind = SpinnerResult::Kind::GitDiffComplete;
                       r.revision = revision;
                       DiffReport report;
                       std::string err;
                       if (!diffAgainstRevision(dir, revision, binary, method,
                                                cancel, report, err)) {
                           r.ok = false;
                           r.message = err;
                           return r;
                       }
                       r.diff = std::move(report);
                       return r;
                   });
}

} // namespace opendir

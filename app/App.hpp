// Orchestrator: owns the panels, clipboard, conflict walk, progress and
// spinner slots and the AI pane; routes keys to engines and polls every
// worker channel once per tick.
#pragma once

#include "AiSessionStore.hpp"
#include "AiStream.hpp"
#include "ClaudeCliProvider.hpp"
#include "Clipboard.hpp"
#include "ExtensionHandler.hpp"
#include "Frontend.hpp"
#include "PanelState.hpp"
#include "ProgressState.hpp"
#include "RemoteSpinner.hpp"
#include "Settings.hpp"
#include "Theme.hpp"
#include "opendir/DirDiff.hpp"
#include "opendir/SymlinkPolicy.hpp"

#include <QString>

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace opendir {

constexpr std::size_t kMaxPanels = 10;

constexpr int kPollProgressMs = 16;
constexpr int kPollBusyMs = 100;
constexpr int kPollIdleMs = 250;

enum class Screen { Panels, Ai, Diff, SearchResults };

struct Dialog {
    enum class Kind {
        None,
        Mkdir,
        Mkfile,
        Rename,
        TarName,
        Goto,
        Search,
        GitRevision,
        ConnectPassword,
        ConfirmDelete,
        ConfirmEncrypt,
        ConfirmDecrypt,
        Bookmarks
    };

    Kind kind = Kind::None;
    std::string title;
    std::string input;
    std::vector<std::string> items; // ConfirmDelete names, Bookmarks
    std::size_t selected = 0;

    bool open() const { return kind != Kind::None; }
    bool isConfirm() const {
        return kind == Kind::ConfirmDelete || kind == Kind::ConfirmEncrypt ||
               kind == Kind::ConfirmDecrypt;
    }
    bool isInput() const {
        return kind != Kind::None && !isConfirm() && kind != Kind::Bookmarks;
    }
};

// A paste waiting for the symlink warning or the conflict walk.
struct PendingPaste {
    Clipboard clipboard;
    std::size_t target_panel = 0;
    bool from_clipboard = false;
};

struct PendingTar {
    std::filesystem::path base_dir;
    std::vector<std::string> names;
    std::string archive_name;
    std::size_t panel = 0;
};

struct SymlinkWarning {
    std::vector<FlaggedSymlink> flagged;
    std::optional<PendingPaste> paste;
    std::optional<PendingTar> tar;
};

// After this download completes, open tmp_path.
struct PendingRemoteOpen {
    enum class Kind { Editor, ImageViewer };

    Kind kind = Kind::Editor;
    std::string tmp_path;
    std::size_t panel_idx = 0;
    std::string remote_path;
    RemoteProfile profile;
};

// A downloaded file being edited; a newer mtime is uploaded back.
struct RemoteEditOrigin {
    std::string tmp_path;
    std::size_t panel_idx = 0;
    std::string remote_path;
    RemoteProfile profile;
    std::filesystem::file_time_type mtime;
};

struct SearchResults {
    std::string root;
    std::string pattern;
    std::vector<std::string> matches;
    bool truncated = false;
    std::size_t cursor = 0;
};

struct DiffView {
    DiffReport report;
    std::string title;
    bool only_differences = false;
    std::size_t cursor = 0;

    std::vector<const DiffRow *> visibleRows() const;
};

struct AppOptions {
    bool design_mode = false;
    // Empty: settings are not written back.
    QString settings_path;
    // Executable used to decode handler commands (--base64).
    QString self_exe;
    bool write_lastdir = true;
};

class App {
public:
    App(Settings settings, std::vector<std::string> startPaths,
        Frontend *frontend, SftpClientFactory sftpFactory,
        std::unique_ptr<AiProvider> aiProvider, AppOptions options = {});
    ~App();

    App(const App &) = delete;
    App &operator=(const App &) = delete;

    // Draw, poll workers, read one key. False once the user quit.
    bool tick();
    void run();

    // Key routing: dialogs first, then the current screen.
    void handleKey(const Key &key);
    // Poll timeout for the current state.
    int pollTimeout() const;
    // Drains the AI, progress and spinner channels.
    void pollWorkers();

    // Intents (bound to keys, callable directly).
    void copyToClipboard(ClipOperation op);
    void paste();
    void transferToNextPanel(ClipOperation op);
    void deleteSelection();
    void openCurrent();
    void goParent();
    void goTo(const std::string &text);
    void startDiffWithNextPanel();
    void startSearch(const std::string &pattern);
    void startGitDiff(const std::string &revision);
    void startTar(const std::string &archiveName);
    void startUntar();
    // Every plain file of the active local directory, or every chunk group.
    void askEncryptDirectory();
    void askDecryptDirectory();
    void startEncrypt();
    void startDecrypt();
    void createDirectory(const std::string &name);
    void createFile(const std::string &name);
    void renameCurrent(const std::string &newName);
    void connectProfile(const RemoteProfile &profile, std::size_t panelIdx);
    void disconnectPanel(std::size_t panelIdx);
    void toggleBookmark();
    void openAi();
    void closeAi();
    void submitAi(const std::string &text);
    void cancelOperation();
    void quit();

    // Conflict and symlink prompts.
    void resolveConflict(ConflictChoice choice);
    void cancelConflict();
    void resolveSymlinkWarning(SymlinkDecision decision);

    // State for the frontend and tests.
    const std::vector<PanelState> &panels() const { return panels_; }
    PanelState &panel(std::size_t idx) { return panels_.at(idx); }
    std::size_t activePanelIndex() const { return active_; }
    void setActivePanel(std::size_t idx);
    PanelState &activePanel() { return panels_[active_]; }
    const PanelState &activePanel() const { return panels_[active_]; }
    std::size_t nextPanelIndex() const;

    Screen screen() const { return screen_; }
    const Dialog &dialog() const { return dialog_; }
    const std::optional<Clipboard> &clipboard() const { return clipboard_; }
    const std::optional<ConflictState> &conflict() const { return conflict_; }
    const std::optional<SymlinkWarning> &symlinkWarning() const {
        return symlinkWarning_;
    }
    const std::optional<ProgressState> &progress() const { return progress_; }
    const RemoteSpinner &spinner() const { return spinner_; }
    const AiStreamSink &ai() const { return ai_; }
    AiStreamSink &ai() { return ai_; }
    const std::string &aiInput() const { return aiInput_; }
    const std::optional<DiffView> &diffView() const { return diffView_; }
    const std::optional<SearchResults> &searchResults() const {
        return searchResults_;
    }
    const std::optional<PendingRemoteOpen> &pendingRemoteOpen() const {
        return pendingOpen_;
    }
    const std::vector<RemoteEditOrigin> &remoteEdits() const {
        return remoteEdits_;
    }
    const Settings &settings() const { return settings_; }
    const ThemeColors &theme() const { return theme_; }
    bool designMode() const { return options_.design_mode; }

    // Transient status line text; empty once expired.
    std::string statusMessage() const;
    std::optional<std::string> lastSummary() const { return lastSummary_; }

    bool busy() const { return progress_.has_value() || spinner_.busy(); }
    bool running() const { return !quit_; }

private:
    Settings settings_;
    Frontend *frontend_;
    SftpClientFactory sftpFactory_;
    std::unique_ptr<AiProvider> aiProvider_;
    AppOptions options_;
    ExtensionHandler handlers_;
    ThemeColors theme_;
    std::optional<ThemeWatcher> themeWatcher_;

    std::vector<PanelState> panels_;
    std::size_t active_ = 0;
    Screen screen_ = Screen::Panels;
    Dialog dialog_;
    bool quit_ = false;

    std::optional<Clipboard> clipboard_;
    std::optional<ConflictState> conflict_;
    PathSet conflictExcluded_;
    bool conflictFromClipboard_ = false;
    std::optional<SymlinkWarning> symlinkWarning_;

    std::optional<ProgressState> progress_;
    std::thread progressWorker_;
    std::vector<std::size_t> refreshAfterProgress_;
    std::optional<DiffResultReceiver> diffRx_;
    std::string diffTitle_;
    std::optional<PendingRemoteOpen> pendingOpen_;
    std::vector<RemoteEditOrigin> remoteEdits_;
    std::vector<std::size_t> pendingRemoteRefresh_;

    RemoteSpinner spinner_;
    std::optional<RemoteProfile> pendingConnect_;
    std::size_t pendingConnectPanel_ = 0;

    AiStreamSink ai_;
    AiSessionStore aiSessions_;
    CancelFlag aiCancel_;
    std::string aiInput_;
    std::string aiPath_;

    std::optional<DiffView> diffView_;
    std::optional<SearchResults> searchResults_;

    std::string status_;
    std::chrono::steady_clock::time_point statusUntil_;
    std::optional<std::string> lastSummary_;

    // App.cpp
    void showMessage(const std::string &text, int seconds = 3);
    void openDialog(Dialog::Kind kind, std::string title,
                    std::string input = {});
    void closeDialog() { dialog_ = Dialog{}; }
    void handleDialogKey(const Key &key);
    void confirmDialog();
    void handlePanelsKey(const Key &key);
    void handleProgressKey(const Key &key);
    void handleConflictKey(const Key &key);
    void handleSymlinkKey(const Key &key);
    void handleDiffKey(const Key &key);
    void handleSearchKey(const Key &key);
    void addPanel();
    void closeActivePanel();
    void cycleSort();
    void refreshPanel(std::size_t idx);
    void pollTheme();
    void persistSettings();
    void writeLastDir();

    // AppLocalOps.cpp
    bool navigateLocal(std::size_t idx, const std::string &path);
    void startPaste(PendingPaste pending);
    void continuePaste(PendingPaste pending, const PathSet &excluded);
    void launchLocalTransfer(const Clipboard &clip, const std::string &dst,
                             std::size_t targetPanel, const PathSet &overwrite,
                             const PathSet &skip, const PathSet &excluded);
    void launchDuplicate(const Clipboard &clip, std::size_t panel,
                         const PathSet &excluded);
    void launchTar(const PendingTar &tar, std::vector<std::string> excludes);
    void openLocalFile(const std::string &path);
    void deleteLocal(std::size_t idx, const std::vector<std::string> &names);
    std::string tarBinary() const;

    // AppRemoteOps.cpp
    bool takeSpinnerSlot();
    void startRemoteList(std::size_t idx, const std::string &path,
                         std::optional<std::string> rollback);
    void startRemoteMutation(std::size_t idx, const std::string &message,
                             std::function<bool(SftpClient &, std::string &)> op,
                             std::string success,
                             std::optional<std::string> focus);
    void startRemoteGoto(std::size_t idx, const std::string &path);
    void openRemoteFile(std::size_t idx, const FileItem &item);
    void deleteRemote(std::size_t idx, const std::vector<std::string> &names);
    void pollSpinner();
    void applySpinnerResult(SpinnerResult result);
    void applyPanelOutcome(std::size_t idx, PanelOutcome outcome);
    void checkRemoteEdits();
    void processRemoteRefreshQueue();

    // AppTransfers.cpp
    using ProgressWork =
        std::function<void(const CancelFlag &, const ProgressSender &)>;
    // Runs work on a detached worker; refresh lists the panels to reload
    // when it completes.
    void launchProgress(OperationKind kind, std::vector<std::size_t> refresh,
                        ProgressWork work);
    void launchRemoteTransfer(const Clipboard &clip, std::size_t targetPanel);
    void pollProgress();
    // Cancels whatever is still running and waits for the workers.
    void stopWorkers();
    void finishProgress(OperationKind kind, const FinalResult &result);
    void applyPendingOpen(const FinalResult &result);

    // AppConnection.cpp
    void goToRemoteUri(const std::string &text);
    void confirmConnectPassword(const std::string &secret);
    void openBookmarks();
    std::string bookmarkFor(const PanelState &panel) const;

    // AppAi.cpp
    void handleAiKey(const Key &key);
    void saveAiSession();
    void pollAi();
};

} // namespace opendir

// App construction, the tick loop, key routing and dialogs.
#include "App.hpp"
#include "AppLogging.hpp"
#include "opendir/ConfigPaths.hpp"
#include "opendir/PathValidator.hpp"

#include <QSaveFile>

#include <algorithm>
#include <filesystem>

namespace opendir {

namespace fs = std::filesystem;

namespace {

std::string currentDirectory() {
    std::error_code ec;
    const fs::path cwd = fs::current_path(ec);
    return ec ? homeDirectory().string() : cwd.string();
}

SortField nextSortField(SortField f) {
    switch (f) {
    case SortField::Name:
        return SortField::Type;
    case SortField::Type:
        return SortField::Size;
    case SortField::Size:
        return SortField::Modified;
    case SortField::Modified:
        break;
    }
    return SortField::Name;
}

bool isListMove(const Key &key) {
    switch (key.code) {
    case Key::Code::Up:
    case Key::Code::Down:
    case Key::Code::PageUp:
    case Key::Code::PageDown:
    case Key::Code::Home:
    case Key::Code::End:
        return true;
    default:
        return false;
    }
}

// New cursor for a list of size n after a navigation key.
std::size_t moveInList(std::size_t cursor, std::size_t n, const Key &key,
                       std::size_t page) {
    if (n == 0)
        return 0;
    switch (key.code) {
    case Key::Code::Up:
        return cursor > 0 ? cursor - 1 : 0;
    case Key::Code::Down:
        return std::min(cursor + 1, n - 1);
    case Key::Code::PageUp:
        return cursor > page ? cursor - page : 0;
    case Key::Code::PageDown:
        return std::min(cursor + page, n - 1);
    case Key::Code::Home:
        return 0;
    case Key::Code::End:
        return n - 1;
    default:
        return cursor;
    }
}

} // namespace

std::vector<const DiffRow *> DiffView::visibleRows() const {
    std::vector<const DiffRow *> rows;
    rows.reserve(report.rows.size());
    for (const auto &row : report.rows) {
        if (only_differences && row.status == DiffStatus::Same)
            continue;
        rows.push_back(&row);
    }
    return rows;
}

App::App(Settings settings, std::vector<std::string> startPaths,
         Frontend *frontend, SftpClientFactory sftpFactory,
         std::unique_ptr<AiProvider> aiProvider, AppOptions options)
    : settings_(std::move(settings)), frontend_(frontend),
      sftpFactory_(std::move(sftpFactory)),
      aiProvider_(std::move(aiProvider)), options_(std::move(options)),
      handlers_(settings_.extension_handler, options_.self_exe) {
    QString themeErr;
    if (!loadTheme(settings_.theme_name, theme_, themeErr)) {
        qCWarning(odConfig) << "Theme not loaded:" << themeErr;
        theme_ = builtinTheme(settings_.theme_name);
    }
    if (options_.design_mode)
        themeWatcher_.emplace(settings_.theme_name);

    const bool fromSettings = startPaths.empty();
    if (fromSettings) {
        for (const auto &ps : settings_.panels)
            startPaths.push_back(ps.start_path ? *ps.start_path
                                               : currentDirectory());
        if (startPaths.empty())
            startPaths.push_back(currentDirectory());
    }
    if (startPaths.size() > kMaxPanels)
        startPaths.resize(kMaxPanels);

    for (std::size_t i = 0; i < startPaths.size(); ++i) {
        panels_.emplace_back(startPaths[i]);
        PanelState &p = panels_.back();
        if (i < settings_.panels.size())
            p.setSort(settings_.panels[i].sort_by,
                      settings_.panels[i].sort_order);
        std::string err;
        if (!p.loadFiles(err))
            qCWarning(odConfig) << "Panel" << i << "not loaded:"
                                << redacted(err);
    }
    if (fromSettings && settings_.active_panel_index >= 0 &&
        std::size_t(settings_.active_panel_index) < panels_.size())
        active_ = std::size_t(settings_.active_panel_index);
}

App::~App() { stopWorkers(); }

void App::run() {
    while (tick()) {
    }
}

bool App::tick() {
    if (frontend_)
        frontend_->draw(*this);
    const int timeout = pollTimeout();
    pollWorkers();
    if (options_.design_mode)
        pollTheme();
    if (!frontend_ || quit_)
        return !quit_;

    const std::optional<Key> key = frontend_->pollKey(timeout);
    if (key) {
        // A running spinner owns the input; only cancel gets through.
        if (spinner_.busy()) {
            if (key->code == Key::Code::Escape)
                spinner_.cancel();
        } else {
            handleKey(*key);
        }
    }
    return !quit_;
}

int App::pollTimeout() const {
    if (progress_)
        return kPollProgressMs;
    if (spinner_.busy() || (screen_ == Screen::Ai && ai_.isProcessing()))
        return kPollBusyMs;
    return kPollIdleMs;
}

void App::pollWorkers() {
    pollAi();
    pollProgress();
    pollSpinner();
    if (!spinner_.busy()) {
        checkRemoteEdits();
        processRemoteRefreshQueue();
    }
}

void App::showMessage(const std::string &text, int seconds) {
    status_ = text;
    statusUntil_ =
        std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
}

std::string App::statusMessage() const {
    if (std::chrono::steady_clock::now() >= statusUntil_)
        return {};
    return status_;
}

void App::setActivePanel(std::size_t idx) {
    if (idx < panels_.size())
        active_ = idx;
}

std::size_t App::nextPanelIndex() const {
    return panels_.empty() ? 0 : (active_ + 1) % panels_.size();
}

void App::openDialog(Dialog::Kind kind, std::string title, std::string input) {
    dialog_ = Dialog{};
    dialog_.kind = kind;
    dialog_.title = std::move(title);
    dialog_.input = std::move(input);
}

void App::handleKey(const Key &key) {
    if (progress_) {
        handleProgressKey(key);
        return;
    }
    if (symlinkWarning_) {
        handleSymlinkKey(key);
        return;
    }
    if (conflict_) {
        handleConflictKey(key);
        return;
    }
    if (dialog_.open()) {
        handleDialogKey(key);
        return;
    }
    switch (screen_) {
    case Screen::Panels:
        handlePanelsKey(key);
        break;
    case Screen::Ai:
        handleAiKey(key);
        break;
    case Screen::Diff:
        handleDiffKey(key);
        break;
    case Screen::SearchResults:
        handleSearchKey(key);
        break;
    }
}

void App::handleProgressKey(const Key &key) {
    if (key.code == Key::Code::Escape)
        cancelOperation();
}

void App::handleConflictKey(const Key &key) {
    if (key.code == Key::Code::Escape) {
        cancelConflict();
        return;
    }
    if (key.is('o'))
        resolveConflict(ConflictChoice::Overwrite);
    else if (key.is('s'))
        resolveConflict(ConflictChoice::Skip);
    else if (key.is('a'))
        resolveConflict(ConflictChoice::OverwriteAll);
    else if (key.is('n'))
        resolveConflict(ConflictChoice::SkipAll);
}

void App::handleSymlinkKey(const Key &key) {
    if (key.code == Key::Code::Escape)
        resolveSymlinkWarning(SymlinkDecision::Cancel);
    else if (key.code == Key::Code::Enter || key.is('e'))
        resolveSymlinkWarning(SymlinkDecision::ExcludeFlagged);
    else if (key.is('i'))
        resolveSymlinkWarning(SymlinkDecision::IncludeAll);
}

void App::handleDialogKey(const Key &key) {
    if (dialog_.kind == Dialog::Kind::ConfirmDelete) {
        if (key.code == Key::Code::Enter || key.is('y')) {
            const std::vector<std::string> names = dialog_.items;
            closeDialog();
            if (activePanel().isRemote())
                deleteRemote(active_, names);
            else
                deleteLocal(active_, names);
        } else if (key.code == Key::Code::Escape || key.is('n')) {
            closeDialog();
        }
        return;
    }
    if (dialog_.kind == Dialog::Kind::ConfirmEncrypt ||
        dialog_.kind == Dialog::Kind::ConfirmDecrypt) {
        if (key.code == Key::Code::Enter || key.is('y')) {
            const bool encrypt = dialog_.kind == Dialog::Kind::ConfirmEncrypt;
            closeDialog();
            if (encrypt)
                startEncrypt();
            else
                startDecrypt();
        } else if (key.code == Key::Code::Escape || key.is('n')) {
            closeDialog();
        }
        return;
    }
    if (dialog_.kind == Dialog::Kind::Bookmarks) {
        if (key.code == Key::Code::Escape) {
            closeDialog();
        } else if (isListMove(key)) {
            dialog_.selected =
                moveInList(dialog_.selected, dialog_.items.size(), key, 10);
        } else if (key.code == Key::Code::Enter && !dialog_.items.empty()) {
            const std::string target = dialog_.items[dialog_.selected];
            closeDialog();
            goTo(target);
        } else if (key.code == Key::Code::Delete && !dialog_.items.empty()) {
            const std::string victim = dialog_.items[dialog_.selected];
            auto &marks = settings_.bookmarked_path;
            marks.erase(std::remove(marks.begin(), marks.end(), victim),
                        marks.end());
            persistSettings();
            dialog_.items = marks;
            if (dialog_.selected >= dialog_.items.size() &&
                dialog_.selected > 0)
                --dialog_.selected;
            if (dialog_.items.empty())
                closeDialog();
        }
        return;
    }

    switch (key.code) {
    case Key::Code::Escape:
        if (dialog_.kind == Dialog::Kind::ConnectPassword)
            pendingConnect_.reset();
        closeDialog();
        break;
    case Key::Code::Enter:
        confirmDialog();
        break;
    case Key::Code::Backspace:
        popUtf8(dialog_.input);
        break;
    case Key::Code::Char:
        if (!key.ctrl && key.ch >= 0x20)
            appendUtf8(dialog_.input, key.ch);
        break;
    default:
        break;
    }
}

void App::confirmDialog() {
    const Dialog::Kind kind = dialog_.kind;
    const std::string input = dialog_.input;
    closeDialog();
    switch (kind) {
    case Dialog::Kind::Mkdir:
        createDirectory(input);
        break;
    case Dialog::Kind::Mkfile:
        createFile(input);
        break;
    case Dialog::Kind::Rename:
        renameCurrent(input);
        break;
    case Dialog::Kind::TarName:
        startTar(input);
        break;
    case Dialog::Kind::Goto:
        goTo(input);
        break;
    case Dialog::Kind::Search:
        startSearch(input);
        break;
    case Dialog::Kind::GitRevision:
        startGitDiff(input);
        break;
    case Dialog::Kind::ConnectPassword:
        confirmConnectPassword(input);
        break;
    default:
        break;
    }
}

void App::handlePanelsKey(const Key &key) {
    PanelState &p = activePanel();
    const int rows = frontend_ ? std::max(1, frontend_->listRows()) : 20;

    switch (key.code) {
    case Key::Code::Up:
        p.moveCursor(-1);
        break;
    case Key::Code::Down:
        p.moveCursor(1);
        break;
    case Key::Code::PageUp:
        p.moveCursor(-rows);
        break;
    case Key::Code::PageDown:
        p.moveCursor(rows);
        break;
    case Key::Code::Home:
        p.setCursor(0);
        break;
    case Key::Code::End:
        if (!p.entries().empty())
            p.setCursor(p.entries().size() - 1);
        break;
    case Key::Code::Enter:
        openCurrent();
        break;
    case Key::Code::Backspace:
    case Key::Code::Left:
        goParent();
        break;
    case Key::Code::Tab:
        setActivePanel(nextPanelIndex());
        break;
    case Key::Code::Insert:
        p.toggleMark();
        break;
    case Key::Code::Delete:
        deleteSelection();
        break;
    case Key::Code::Escape:
        p.clearMarks();
        break;
    case Key::Code::Function:
        switch (key.fn) {
        case 2:
            if (const FileItem *cur = p.current(); cur && !cur->isParentLink())
                openDialog(Dialog::Kind::Rename, "Rename", cur->name);
            break;
        case 5:
            transferToNextPanel(ClipOperation::Copy);
            break;
        case 6:
            transferToNextPanel(ClipOperation::Cut);
            break;
        case 7:
            openDialog(Dialog::Kind::Mkdir, "New directory");
            break;
        case 8:
            deleteSelection();
            break;
        case 10:
            quit();
            break;
        default:
            break;
        }
        break;
    case Key::Code::Char:
        if (key.ctrl) {
            if (key.ch == 'r')
                refreshPanel(active_);
            break;
        }
        switch (key.ch) {
        case ' ':
            p.toggleMark();
            break;
        case '*':
            p.markAll();
            break;
        case 'c':
            copyToClipboard(ClipOperation::Copy);
            break;
        case 'x':
            copyToClipboard(ClipOperation::Cut);
            break;
        case 'v':
            paste();
            break;
        case 'k':
            openDialog(Dialog::Kind::Mkdir, "New directory");
            break;
        case 'm':
            openDialog(Dialog::Kind::Mkfile, "New file");
            break;
        case 'r':
            if (const FileItem *cur = p.current(); cur && !cur->isParentLink())
                openDialog(Dialog::Kind::Rename, "Rename", cur->name);
            break;
        case 't': {
            const auto names = p.selectedNames();
            const std::string base =
                names.size() == 1 ? names.front() : "archive";
            openDialog(Dialog::Kind::TarName, "Archive name",
                       base + ".tar.gz");
            break;
        }
        case 'u':
            startUntar();
            break;
        case 'e':
            askEncryptDirectory();
            break;
        case 'E':
            askDecryptDirectory();
            break;
        case 'g':
            openDialog(Dialog::Kind::Goto, "Go to");
            break;
        case '/':
        case 'f':
            openDialog(Dialog::Kind::Search, "Find files");
            break;
        case 'd':
            startDiffWithNextPanel();
            break;
        case 'G':
            openDialog(Dialog::Kind::GitRevision, "Compare with revision",
                       "HEAD");
            break;
        case 's':
            cycleSort();
            break;
        case 'S':
            p.setSort(p.sortField(), p.sortOrder() == SortOrder::Asc
                                         ? SortOrder::Desc
                                         : SortOrder::Asc);
            break;
        case 'b':
            toggleBookmark();
            break;
        case 'B':
        case '\'':
            openBookmarks();
            break;
        case '.':
            openAi();
            break;
        case '+':
            addPanel();
            break;
        case '-':
            closeActivePanel();
            break;
        case 'D':
            disconnectPanel(active_);
            break;
        case 'q':
            quit();
            break;
        default:
            break;
        }
        break;
    default:
        break;
    }
    // addPanel/closeActivePanel may have invalidated p.
    activePanel().ensureCursorVisible(std::size_t(rows));
}

void App::handleDiffKey(const Key &key) {
    if (!diffView_) {
        screen_ = Screen::Panels;
        return;
    }
    if (key.code == Key::Code::Escape || key.is('q')) {
        diffView_.reset();
        screen_ = Screen::Panels;
        return;
    }
    if (key.is('f')) {
        diffView_->only_differences = !diffView_->only_differences;
        diffView_->cursor = 0;
        return;
    }
    if (isListMove(key)) {
        const int rows = frontend_ ? std::max(1, frontend_->listRows()) : 20;
        diffView_->cursor =
            moveInList(diffView_->cursor, diffView_->visibleRows().size(), key,
                       std::size_t(rows));
    }
}

void App::handleSearchKey(const Key &key) {
    if (!searchResults_) {
        screen_ = Screen::Panels;
        return;
    }
    if (key.code == Key::Code::Escape || key.is('q')) {
        screen_ = Screen::Panels;
        return;
    }
    if (isListMove(key)) {
        const int rows = frontend_ ? std::max(1, frontend_->listRows()) : 20;
        searchResults_->cursor =
            moveInList(searchResults_->cursor, searchResults_->matches.size(),
                       key, std::size_t(rows));
        return;
    }
    if (key.code == Key::Code::Enter && !searchResults_->matches.empty()) {
        const fs::path hit = fs::path(searchResults_->root) /
                             searchResults_->matches[searchResults_->cursor];
        screen_ = Screen::Panels;
        activePanel().setPendingFocus(hit.filename().string());
        navigateLocal(active_, hit.parent_path().string());
    }
}

void App::addPanel() {
    if (panels_.size() >= kMaxPanels) {
        showMessage("At most " + std::to_string(kMaxPanels) + " panels");
        return;
    }
    const std::string start = activePanel().isRemote()
                                  ? homeDirectory().string()
                                  : activePanel().path();
    panels_.emplace_back(start);
    std::string err;
    if (!panels_.back().loadFiles(err))
        showMessage(err);
    active_ = panels_.size() - 1;
}

void App::closeActivePanel() {
    if (panels_.size() <= 1) {
        showMessage("Cannot close the last panel");
        return;
    }
    if (busy()) {
        showMessage("Cannot close a panel while an operation is running");
        return;
    }
    const std::size_t closed = active_;
    panels_.erase(panels_.begin() + long(closed));
    remoteEdits_.erase(std::remove_if(remoteEdits_.begin(), remoteEdits_.end(),
                                      [closed](const RemoteEditOrigin &o) {
                                          return o.panel_idx == closed;
                                      }),
                       remoteEdits_.end());
    for (auto &o : remoteEdits_)
        if (o.panel_idx > closed)
            --o.panel_idx;
    pendingRemoteRefresh_.clear();
    if (active_ >= panels_.size())
        active_ = panels_.size() - 1;
}

void App::cycleSort() {
    PanelState &p = activePanel();
    p.setSort(nextSortField(p.sortField()), p.sortOrder());
    showMessage(std::string("Sort by ") + sortFieldName(p.sortField()));
}

void App::refreshPanel(std::size_t idx) {
    if (idx >= panels_.size())
        return;
    PanelState &p = panels_[idx];
    if (p.isRemote()) {
        if (std::find(pendingRemoteRefresh_.begin(),
                      pendingRemoteRefresh_.end(),
                      idx) == pendingRemoteRefresh_.end())
            pendingRemoteRefresh_.push_back(idx);
        return;
    }
    std::string err;
    if (!p.loadFiles(err)) {
        showMessage(err);
        const std::string fallback =
            validDirectory(p.path(), homeDirectory()).string();
        if (!p.navigate(fallback, err))
            qCWarning(odConfig) << "Panel reload failed:" << redacted(err);
    }
}

void App::pollTheme() {
    if (!themeWatcher_)
        return;
    QString err;
    if (themeWatcher_->poll(theme_, err)) {
        qCInfo(odConfig) << "Theme reloaded";
        showMessage("Theme reloaded");
    } else if (!err.isEmpty()) {
        showMessage(err.toStdString());
    }
}

void App::cancelOperation() {
    if (progress_) {
        progress_->cancel();
        qCInfo(odXfer) << "Cancel requested";
    } else if (spinner_.busy()) {
        spinner_.cancel();
    }
}

void App::persistSettings() {
    if (options_.settings_path.isEmpty())
        return;
    settings_.panels.resize(panels_.size());
    for (std::size_t i = 0; i < panels_.size(); ++i) {
        settings_.panels[i].sort_by = panels_[i].sortField();
        settings_.panels[i].sort_order = panels_[i].sortOrder();
    }
    settings_.active_panel_index = int(active_);
    QString err;
    if (!saveSettings(options_.settings_path, settings_, err)) {
        qCWarning(odConfig) << "Settings not saved:" << err;
        showMessage(err.toStdString());
    }
}

void App::writeLastDir() {
    if (!options_.write_lastdir || activePanel().isRemote())
        return;
    std::string err;
    if (!ensurePrivateDirectory(configRoot(), err)) {
        qCWarning(odConfig) << "lastdir not written:" << redacted(err);
        return;
    }
    QSaveFile out(QString::fromStdString((configRoot() / "lastdir").string()));
    if (!out.open(QIODevice::WriteOnly)) {
        qCWarning(odConfig) << "lastdir not written:" << out.errorString();
        return;
    }
    out.write(QByteArray::fromStdString(activePanel().path()));
    if (!out.commit())
        qCWarning(odConfig) << "lastdir not written:" << out.errorString();
}

void App::quit() {
    // Cancelled copies clean up their partial destination before we exit.
    stopWorkers();
    if (ai_.isProcessing()) {
        if (aiCancel_)
            aiCancel_->store(true);
        ai_.cancel();
    }
    saveAiSession();
    persistSettings();
    writeLastDir();
    quit_ = true;
}

} // namespace opendir

// Goto, bookmarks and SSH connect/disconnect of panels.
#include "App.hpp"
#include "AppLogging.hpp"
#include "opendir/PathValidator.hpp"
#include "opendir/RemoteUri.hpp"

#include <algorithm>
#include <filesystem>

namespace opendir {

namespace fs = std::filesystem;

namespace {

std::string trimmed(const std::string &s) {
    const auto b = s.find_first_not_of(" \t");
    if (b == std::string::npos)
        return {};
    const auto e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

std::string defaultKeyPath() {
    std::error_code ec;
    const fs::path ed = homeDirectory() / ".ssh" / "id_ed25519";
    if (fs::exists(ed, ec))
        return "~/.ssh/id_ed25519";
    return "~/.ssh/id_rsa";
}

} // namespace

void App::goTo(const std::string &text) {
    std::string target = trimmed(text);
    if (target.empty())
        return;
    if (looksLikeRemoteUri(target)) {
        goToRemoteUri(target);
        return;
    }
    if (target.front() == '~')
        target = homeDirectory().string() + target.substr(1);

    PanelState &p = activePanel();
    if (p.isRemote()) {
        if (target.front() != '/')
            target = joinRemotePath(p.path(), target);
        startRemoteGoto(active_, target);
        return;
    }

    fs::path path(target);
    if (path.is_relative())
        path = fs::path(p.path()) / path;
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        navigateLocal(active_, path.lexically_normal().string());
        return;
    }
    if (fs::exists(path, ec)) {
        p.setPendingFocus(path.filename().string());
        navigateLocal(active_, path.parent_path().lexically_normal().string());
        return;
    }
    showMessage("Path not found: " + target);
}

void App::goToRemoteUri(const std::string &text) {
    RemoteUri uri;
    std::string err;
    if (!parseRemoteUri(text, uri, err)) {
        showMessage(err);
        return;
    }
    if (const RemoteProfile *saved =
            settings_.findProfile(uri.user, uri.host, uri.port)) {
        RemoteProfile profile = *saved;
        profile.default_path = uri.path;
        connectProfile(profile, active_);
        return;
    }
    RemoteProfile profile;
    profile.name = uri.user + "@" + uri.host;
    profile.host = uri.host;
    profile.port = uri.port;
    profile.user = uri.user;
    profile.default_path = uri.path;
    pendingConnect_ = std::move(profile);
    pendingConnectPanel_ = active_;
    openDialog(Dialog::Kind::ConnectPassword,
               "Password for " + uri.user + "@" + uri.host +
                   " (empty: SSH key)");
}

void App::confirmConnectPassword(const std::string &secret) {
    if (!pendingConnect_)
        return;
    RemoteProfile profile = std::move(*pendingConnect_);
    pendingConnect_.reset();
    profile.auth = secret.empty() ? RemoteAuth::withKeyFile(defaultKeyPath())
                                  : RemoteAuth::withPassword(secret);
    connectProfile(profile, pendingConnectPanel_);
}

void App::connectProfile(const RemoteProfile &profile, std::size_t panelIdx) {
    if (panelIdx >= panels_.size() || !takeSpinnerSlot())
        return;
    qCInfo(odRemote) << "Connecting to" << redacted(profile.host) << "port"
                     << profile.port;
    const SftpClientFactory factory = sftpFactory_;
    spinner_.start(
        "Connecting to " + profile.user + "@" + profile.host,
        [profile, panelIdx, factory](const CancelFlag &) {
            SpinnerResult r;
            r.kind = SpinnerResult::Kind::Connected;
            r.panel_idx = panelIdx;
            auto ctx = std::make_unique<RemoteContext>(
                profile, factory ? factory() : nullptr);
            std::string err;
            if (!ctx->connect(err)) {
                r.ok = false;
                r.message = err;
                return r;
            }
            const std::string start =
                profile.default_path.empty() ? "." : profile.default_path;
            std::string path;
            if (!ctx->client().realpath(start, path, err)) {
                // A stale default path falls back to the login directory.
                err.clear();
                if (!ctx->client().realpath(".", path, err)) {
                    r.ok = false;
                    r.message = err;
                    return r;
                }
            }
            if (!ctx->client().list(path, r.entries, err)) {
                r.ok = false;
                r.message = err;
                return r;
            }
            r.path = path;
            r.ctx = std::move(ctx);
            return r;
        });
}

void App::disconnectPanel(std::size_t panelIdx) {
    if (panelIdx >= panels_.size())
        return;
    PanelState &p = panels_[panelIdx];
    if (!p.isRemote()) {
        showMessage("Not a remote panel");
        return;
    }
    if (!p.remote() && spinner_.busy()) {
        showMessage("Busy: " + spinner_.message());
        return;
    }
    p.detachRemote(homeDirectory().string());
    pendingRemoteRefresh_.erase(std::remove(pendingRemoteRefresh_.begin(),
                                            pendingRemoteRefresh_.end(),
                                            panelIdx),
                                pendingRemoteRefresh_.end());
    qCInfo(odRemote) << "Panel" << panelIdx << "disconnected";
    showMessage("Disconnected");
}

std::string App::bookmarkFor(const PanelState &panel) const {
    if (const auto &d = panel.display())
        return formatRemoteDisplay(d->user, d->host, d->port, panel.path());
    return panel.path();
}

void App::toggleBookmark() {
    const std::string mark = bookmarkFor(activePanel());
    auto &marks = settings_.bookmarked_path;
    const auto it = std::find(marks.begin(), marks.end(), mark);
    if (it != marks.end()) {
        marks.erase(it);
        showMessage("Bookmark removed");
    } else {
        marks.push_back(mark);
        showMessage("Bookmarked " + mark);
    }
    persistSettings();
}

void App::openBookmarks() {
    if (settings_.bookmarked_path.empty()) {
        showMessage("No bookmarks");
        return;
    }
    openDialog(Dialog::Kind::Bookmarks, "Bookmarks");
    dialog_.items = settings_.bookmarked_path;
}

} // namespace opendir

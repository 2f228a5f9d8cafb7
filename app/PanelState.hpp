// Per-panel listing state: path, entries, cursor, marks, sort, and the
// remote context when the panel shows a remote host.
#pragma once

#include "FileItem.hpp"
#include "opendir/RemoteContext.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace opendir {

struct RemoteDisplay {
    std::string user;
    std::string host;
    std::uint16_t port = kDefaultSshPort;
};

class PanelState {
public:
    // Starts at the nearest readable directory of startPath, else home.
    explicit PanelState(const std::string &startPath);

    const std::string &path() const { return path_; }
    const std::vector<FileItem> &entries() const { return entries_; }

    std::size_t cursor() const { return cursor_; }
    void setCursor(std::size_t index);
    void moveCursor(long delta);
    const FileItem *current() const;

    std::size_t scroll() const { return scroll_; }
    void ensureCursorVisible(std::size_t visibleRows);

    const std::set<std::string> &marked() const { return marked_; }
    void toggleMark(); // on the cursor entry, then advance
    void markAll();
    void clearMarks();
    // Marked names, or the cursor entry when nothing is marked. Never "..".
    std::vector<std::string> selectedNames() const;

    SortField sortField() const { return sortField_; }
    SortOrder sortOrder() const { return sortOrder_; }
    void setSort(SortField field, SortOrder order);
    void toggleSort(SortField field);

    // Reads a local directory; a remote panel keeps its entries until
    // applyRemoteEntries is called from a finished listing.
    bool loadFiles(std::string &err);
    void applyRemoteEntries(const std::vector<SftpEntry> &entries,
                            const std::string &path);

    // Changes the path and reloads. Local only.
    bool navigate(const std::string &path, std::string &err);
    // Path of the parent; remembers the current basename as pending focus.
    std::optional<std::string> parentForNavigation();
    void setPendingFocus(std::string name) { pendingFocus_ = std::move(name); }
    void clearPendingFocus() { pendingFocus_.reset(); }
    const std::optional<std::string> &pendingFocus() const {
        return pendingFocus_;
    }
    void setPath(std::string path) { path_ = std::move(path); }

    // Remote identity.
    bool isRemote() const { return remote_ != nullptr || display_.has_value(); }
    RemoteContext *remote() { return remote_.get(); }
    const std::optional<RemoteDisplay> &display() const { return display_; }
    // Moves the context to a worker; the display triple stays behind.
    std::unique_ptr<RemoteContext> takeRemote();
    void restoreRemote(std::unique_ptr<RemoteContext> ctx);
    void attachRemote(std::unique_ptr<RemoteContext> ctx,
                      const std::vector<SftpEntry> &entries,
                      const std::string &path);
    // Back to local mode at localPath.
    void detachRemote(const std::string &localPath);
    std::optional<RemoteProfile> remoteProfile() const;

    std::uint64_t diskTotal() const { return diskTotal_; }
    std::uint64_t diskAvailable() const { return diskAvailable_; }

private:
    std::string path_;
    std::vector<FileItem> entries_;
    std::size_t cursor_ = 0;
    std::size_t scroll_ = 0;
    std::set<std::string> marked_;
    SortField sortField_ = SortField::Name;
    SortOrder sortOrder_ = SortOrder::Asc;
    std::optional<std::string> pendingFocus_;
    // Path the current entries were listed from; the cursor name is only
    // carried across a reload of the same directory.
    std::string listedPath_;

    std::unique_ptr<RemoteContext> remote_;
    std::optional<RemoteDisplay> display_;
    std::optional<RemoteProfile> cachedProfile_;

    std::uint64_t diskTotal_ = 0;
    std::uint64_t diskAvailable_ = 0;

    void setEntries(std::vector<FileItem> items, bool hasParent);
    void sortEntries();
    void refreshDiskTotals();
};

} // namespace opendir

#include "PanelState.hpp"
#include "opendir/PathValidator.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sys/stat.h>
#include <sys/statvfs.h>

namespace fs = std::filesystem;

namespace opendir {

namespace {

std::string folded(const std::string &s) {
    std::string out(s);
    for (char &c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

std::string extensionOf(const FileItem &item) {
    if (item.is_dir)
        return {};
    const auto dot = item.name.rfind('.');
    if (dot == std::string::npos || dot == 0)
        return {};
    return folded(item.name.substr(dot + 1));
}

// Negative, zero or positive like strcmp; directories are grouped by the
// caller.
int compareBy(SortField field, const FileItem &a, const FileItem &b) {
    switch (field) {
    case SortField::Type: {
        const int c = extensionOf(a).compare(extensionOf(b));
        if (c != 0)
            return c;
        break;
    }
    case SortField::Size:
        if (a.size != b.size)
            return a.size < b.size ? -1 : 1;
        break;
    case SortField::Modified:
        if (a.modified != b.modified)
            return a.modified < b.modified ? -1 : 1;
        break;
    case SortField::Name:
        break;
    }
    return folded(a.name).compare(folded(b.name));
}

bool parentExists(const std::string &path) { return path != "/"; }

} // namespace

bool parseSortField(const std::string &text, SortField &out) {
    if (text == "name")
        out = SortField::Name;
    else if (text == "type")
        out = SortField::Type;
    else if (text == "size")
        out = SortField::Size;
    else if (text == "modified")
        out = SortField::Modified;
    else
        return false;
    return true;
}

const char *sortFieldName(SortField field) {
    switch (field) {
    case SortField::Name:
        return "name";
    case SortField::Type:
        return "type";
    case SortField::Size:
        return "size";
    case SortField::Modified:
        return "modified";
    }
    return "name";
}

bool parseSortOrder(const std::string &text, SortOrder &out) {
    if (text == "asc")
        out = SortOrder::Asc;
    else if (text == "desc")
        out = SortOrder::Desc;
    else
        return false;
    return true;
}

const char *sortOrderName(SortOrder order) {
    return order == SortOrder::Desc ? "desc" : "asc";
}

PanelState::PanelState(const std::string &startPath) {
    path_ = validDirectory(fs::path(startPath), homeDirectory()).string();
    std::string err;
    if (!loadFiles(err))
        entries_.clear();
}

void PanelState::setCursor(std::size_t index) {
    if (entries_.empty()) {
        cursor_ = 0;
        return;
    }
    cursor_ = std::min(index, entries_.size() - 1);
}

void PanelState::moveCursor(long delta) {
    if (entries_.empty())
        return;
    const long last = static_cast<long>(entries_.size()) - 1;
    const long next = std::clamp(static_cast<long>(cursor_) + delta, 0L, last);
    cursor_ = static_cast<std::size_t>(next);
}

const FileItem *PanelState::current() const {
    return entries_.empty() ? nullptr : &entries_[cursor_];
}

void PanelState::ensureCursorVisible(std::size_t visibleRows) {
    if (visibleRows == 0)
        return;
    if (cursor_ < scroll_)
        scroll_ = cursor_;
    else if (cursor_ >= scroll_ + visibleRows)
        scroll_ = cursor_ - visibleRows + 1;
}

void PanelState::toggleMark() {
    const FileItem *item = current();
    if (!item)
        return;
    if (!item->isParentLink()) {
        if (!marked_.erase(item->name))
            marked_.insert(item->name);
    }
    moveCursor(1);
}

void PanelState::markAll() {
    for (const auto &e : entries_) {
        if (!e.isParentLink())
            marked_.insert(e.name);
    }
}

void PanelState::clearMarks() { marked_.clear(); }

std::vector<std::string> PanelState::selectedNames() const {
    std::vector<std::string> names;
    if (!marked_.empty()) {
        // Listing order, not set order.
        for (const auto &e : entries_) {
            if (marked_.count(e.name))
                names.push_back(e.name);
        }
        return names;
    }
    const FileItem *item = current();
    if (item && !item->isParentLink())
        names.push_back(item->name);
    return names;
}

void PanelState::setSort(SortField field, SortOrder order) {
    sortField_ = field;
    sortOrder_ = order;
    const std::string keep = current() ? current()->name : std::string();
    sortEntries();
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].name == keep) {
            cursor_ = i;
            break;
        }
    }
}

void PanelState::toggleSort(SortField field) {
    if (field == sortField_)
        setSort(field, sortOrder_ == SortOrder::Asc ? SortOrder::Desc
                                                    : SortOrder::Asc);
    else
        setSort(field, SortOrder::Asc);
}

void PanelState::sortEntries() {
    const SortField field = sortField_;
    const bool desc = sortOrder_ == SortOrder::Desc;
    std::stable_sort(entries_.begin(), entries_.end(),
                     [field, desc](const FileItem &a, const FileItem &b) {
                         if (a.isParentLink() != b.isParentLink())
                             return a.isParentLink();
                         if (a.is_dir != b.is_dir)
                             return a.is_dir;
                         const int c = compareBy(field, a, b);
                         return desc ? c > 0 : c < 0;
                     });
}

void PanelState::setEntries(std::vector<FileItem> items, bool hasParent) {
    const std::string keep = (listedPath_ == path_ && current())
                                 ? current()->name
                                 : std::string();
    listedPath_ = path_;
    entries_.clear();
    if (hasParent)
        entries_.push_back(FileItem::parentLink());
    for (auto &item : items)
        entries_.push_back(std::move(item));
    sortEntries();

    for (auto it = marked_.begin(); it != marked_.end();) {
        const std::string &name = *it;
        const bool present =
            std::any_of(entries_.begin(), entries_.end(),
                        [&name](const FileItem &e) { return e.name == name; });
        it = present ? std::next(it) : marked_.erase(it);
    }

    const std::string focus = pendingFocus_ ? *pendingFocus_ : keep;
    pendingFocus_.reset();
    cursor_ = 0;
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (!focus.empty() && entries_[i].name == focus) {
            cursor_ = i;
            break;
        }
    }
    if (scroll_ > cursor_)
        scroll_ = cursor_;
}

bool PanelState::loadFiles(std::string &err) {
    if (isRemote())
        return true;

    std::error_code ec;
    fs::directory_iterator it(path_, ec);
    if (ec) {
        err = "Cannot read '" + path_ + "': " + ec.message();
        return false;
    }
    std::vector<FileItem> items;
    const fs::directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        FileItem item;
        item.name = it->path().filename().string();
        struct stat lst {};
        if (::lstat(it->path().c_str(), &lst) != 0)
            continue; // vanished between readdir and lstat
        item.is_symlink = S_ISLNK(lst.st_mode);
        struct stat st = lst;
        if (item.is_symlink && ::stat(it->path().c_str(), &st) != 0)
            st = lst; // dangling link
        item.is_dir = S_ISDIR(st.st_mode);
        item.size = item.is_dir ? 0 : static_cast<std::uint64_t>(st.st_size);
        item.modified = static_cast<std::int64_t>(lst.st_mtime);
        item.permissions = permissionString(static_cast<std::uint32_t>(st.st_mode));
        items.push_back(std::move(item));
    }
    if (ec) {
        err = "Cannot read '" + path_ + "': " + ec.message();
        return false;
    }
    setEntries(std::move(items), parentExists(path_));
    refreshDiskTotals();
    return true;
}

void PanelState::applyRemoteEntries(const std::vector<SftpEntry> &entries,
                                    const std::string &path) {
    if (path != path_)
        marked_.clear();
    path_ = path;
    std::vector<FileItem> items;
    items.reserve(entries.size());
    for (const auto &e : entries) {
        FileItem item;
        item.name = e.name;
        item.is_dir = e.is_dir;
        item.is_symlink = e.is_symlink;
        item.size = e.is_dir ? 0 : e.size;
        item.modified = static_cast<std::int64_t>(e.mtime);
        item.permissions = permissionString(e.mode);
        items.push_back(std::move(item));
    }
    setEntries(std::move(items), parentExists(path_));
    diskTotal_ = 0;
    diskAvailable_ = 0;
}

bool PanelState::navigate(const std::string &path, std::string &err) {
    const std::string previous = path_;
    path_ = path;
    marked_.clear();
    if (!loadFiles(err)) {
        path_ = previous;
        pendingFocus_.reset();
        return false;
    }
    return true;
}

std::optional<std::string> PanelState::parentForNavigation() {
    if (!parentExists(path_))
        return std::nullopt;
    std::string parent;
    if (isRemote()) {
        parent = remoteParentPath(path_);
        pendingFocus_ = remoteBaseName(path_);
    } else {
        const fs::path p(path_);
        parent = p.parent_path().string();
        pendingFocus_ = p.filename().string();
    }
    return parent;
}

std::unique_ptr<RemoteContext> PanelState::takeRemote() {
    if (remote_) {
        const RemoteProfile &p = remote_->profile();
        display_ = RemoteDisplay{p.user, p.host, p.port};
        cachedProfile_ = p;
    }
    return std::move(remote_);
}

void PanelState::restoreRemote(std::unique_ptr<RemoteContext> ctx) {
    remote_ = std::move(ctx);
    if (remote_) {
        const RemoteProfile &p = remote_->profile();
        display_ = RemoteDisplay{p.user, p.host, p.port};
        cachedProfile_ = p;
    }
}

void PanelState::attachRemote(std::unique_ptr<RemoteContext> ctx,
                              const std::vector<SftpEntry> &entries,
                              const std::string &path) {
    restoreRemote(std::move(ctx));
    marked_.clear();
    applyRemoteEntries(entries, path);
}

void PanelState::detachRemote(const std::string &localPath) {
    if (remote_)
        remote_->disconnect();
    remote_.reset();
    display_.reset();
    cachedProfile_.reset();
    marked_.clear();
    path_ = validDirectory(fs::path(localPath), homeDirectory()).string();
    std::string err;
    if (!loadFiles(err))
        entries_.clear();
}

std::optional<RemoteProfile> PanelState::remoteProfile() const {
    if (remote_)
        return remote_->profile();
    return cachedProfile_;
}

void PanelState::refreshDiskTotals() {
    struct statvfs vfs {};
    if (::statvfs(path_.c_str(), &vfs) != 0) {
        diskTotal_ = 0;
        diskAvailable_ = 0;
        return;
    }
    diskTotal_ = static_cast<std::uint64_t>(vfs.f_blocks) * vfs.f_frsize;
    diskAvailable_ = static_cast<std::uint64_t>(vfs.f_bavail) * vfs.f_frsize;
}

} // namespace opendir

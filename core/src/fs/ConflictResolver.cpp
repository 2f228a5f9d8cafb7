#include "opendir/ConflictResolver.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace opendir {

std::vector<ConflictItem> detectConflicts(const std::vector<std::string> &names,
                                          const fs::path &srcDir,
                                          const fs::path &dstDir) {
    std::vector<ConflictItem> out;
    for (const auto &name : names) {
        const fs::path dest = dstDir / name;
        std::error_code ec;
        // symlink_status so a dangling link at the destination still counts.
        if (!fs::exists(fs::symlink_status(dest, ec)))
            continue;
        out.push_back({(srcDir / name).string(), dest.string(), name});
    }
    return out;
}

ConflictResolver::ConflictResolver(std::vector<ConflictItem> items)
    : items_(std::move(items)) {}

const ConflictItem *ConflictResolver::current() const {
    return finished() ? nullptr : &items_[index_];
}

void ConflictResolver::apply(ConflictChoice choice) {
    if (finished())
        return;
    switch (choice) {
    case ConflictChoice::Overwrite:
        overwrite_.insert(items_[index_].source);
        ++index_;
        break;
    case ConflictChoice::Skip:
        skip_.insert(items_[index_].source);
        ++index_;
        break;
    case ConflictChoice::OverwriteAll:
        for (; index_ < items_.size(); ++index_)
            overwrite_.insert(items_[index_].source);
        break;
    case ConflictChoice::SkipAll:
        for (; index_ < items_.size(); ++index_)
            skip_.insert(items_[index_].source);
        break;
    }
}

} // namespace opendir

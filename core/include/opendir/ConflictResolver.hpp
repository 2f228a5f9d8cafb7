// Pre-flight name collision detection and the per-item
// Overwrite/Skip/Overwrite All/Skip All walk over the result.
#pragma once

#include "ProgressTypes.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace opendir {

struct ConflictItem {
    std::string source;      // absolute source path
    std::string destination; // absolute destination path
    std::string display_name;
};

enum class ConflictChoice { Overwrite, Skip, OverwriteAll, SkipAll };

// Local targets only: names from srcDir that already exist in dstDir.
std::vector<ConflictItem> detectConflicts(const std::vector<std::string> &names,
                                          const std::filesystem::path &srcDir,
                                          const std::filesystem::path &dstDir);

class ConflictResolver {
public:
    explicit ConflictResolver(std::vector<ConflictItem> items);

    bool finished() const { return index_ >= items_.size(); }
    // nullptr once finished.
    const ConflictItem *current() const;
    std::size_t index() const { return index_; }
    std::size_t size() const { return items_.size(); }

    // No-op once finished.
    void apply(ConflictChoice choice);

    const PathSet &overwriteSet() const { return overwrite_; }
    const PathSet &skipSet() const { return skip_; }

private:
    std::vector<ConflictItem> items_;
    std::size_t index_ = 0;
    PathSet overwrite_;
    PathSet skip_;
};

} // namespace opendir

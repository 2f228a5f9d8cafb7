// Detection of symlinks in a selection that point outside the selection
// root or at sensitive system locations.
#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace opendir {

constexpr int kMaxScanDepth = 256;

struct FlaggedSymlink {
    std::string relative_path; // relative to the selection root
    std::string target;        // as read from the link
    std::string reason;
};

enum class SymlinkDecision { ExcludeFlagged, IncludeAll, Cancel };

const std::vector<std::string> &sensitivePrefixes();

// True for canonical targets under a system prefix or a sensitive file in
// the user's home (ssh keys, cloud credentials...).
bool isSensitiveTarget(const std::filesystem::path &canonicalTarget);

// Walks names under baseDir (symlinked directories are not followed).
std::vector<FlaggedSymlink>
scanFlaggedSymlinks(const std::filesystem::path &baseDir,
                    const std::vector<std::string> &names);

} // namespace opendir

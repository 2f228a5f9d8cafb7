// Recursive file name search under a local directory.
#pragma once

#include "opendir/ProgressTypes.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace opendir {

constexpr std::size_t kMaxSearchResults = 10000;

// Case-insensitive; '*' and '?' make it a wildcard match on the whole
// name, otherwise a substring match.
bool nameMatches(const std::string &pattern, const std::string &name);

struct SearchOutcome {
    std::vector<std::string> matches; // relative to the root
    bool truncated = false;
};

// Unreadable directories are skipped; symlinked directories are not
// entered. False on cancel or when root cannot be read.
bool searchFiles(const std::filesystem::path &root, const std::string &pattern,
                 const CancelFlag &cancel, SearchOutcome &out,
                 std::string &err);

} // namespace opendir

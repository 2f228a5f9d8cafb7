// Name and path validation used by every mutating operation before it
// touches the filesystem.
#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace opendir {

constexpr std::size_t kMaxFilenameLength = 255;

enum class NameError {
    None,
    Empty,
    TraversalComponent,
    Separator,
    ControlChar,
    ReservedDot,
    TooLong,
    EdgeWhitespace,
    LeadingDash
};

NameError validateFilename(const std::string &name);
const char *nameErrorMessage(NameError e);

// Convenience wrapper: true when valid, otherwise fills *why.
bool isValidFilename(const std::string &name, std::string *why = nullptr);

// Canonicalizes parent/name and checks that the result stays inside the
// canonical parent (a symlinked parent or name cannot escape it).
bool resolveAndVerify(const std::filesystem::path &parent,
                      const std::string &name, std::filesystem::path &out,
                      std::string &err);

// Accepts only absolute paths. Follows symlinks, walks up to the nearest
// existing directory, otherwise returns fallback().
std::filesystem::path
resolvePath(const std::optional<std::string> &raw,
            const std::function<std::filesystem::path()> &fallback);

// Nearest readable directory at or above target; fallback, then "/".
std::filesystem::path validDirectory(const std::filesystem::path &target,
                                     const std::filesystem::path &fallback);

// Component-wise prefix test (so "/ab" is not inside "/a").
bool isWithin(const std::filesystem::path &child,
              const std::filesystem::path &parent);

std::filesystem::path homeDirectory();

} // namespace opendir

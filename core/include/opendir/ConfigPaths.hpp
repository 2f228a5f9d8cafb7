// Locations under the per-user OPENDIR directory (~/.opendir by default,
// relocatable with OPENDIR_CONFIG_DIR).
#pragma once

#include <filesystem>
#include <string>

namespace opendir {

std::filesystem::path configRoot();
std::filesystem::path scratchRoot();     // <root>/tmp
std::filesystem::path aiSessionsDir();   // <root>/ai_sessions
std::filesystem::path themesDir();       // <root>/themes

// Creates dir (and parents) with mode 0700.
bool ensurePrivateDirectory(const std::filesystem::path &dir,
                            std::string &err);

} // namespace opendir

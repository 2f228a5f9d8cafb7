#include "opendir/ConfigPaths.hpp"
#include "opendir/PathValidator.hpp"

#include <cstdlib>
#include <system_error>

namespace fs = std::filesystem;

namespace opendir {

fs::path configRoot() {
    const char *custom = std::getenv("OPENDIR_CONFIG_DIR");
    if (custom && *custom)
        return fs::path(custom);
    return homeDirectory() / ".opendir";
}

fs::path scratchRoot() { return configRoot() / "tmp"; }

fs::path aiSessionsDir() { return configRoot() / "ai_sessions"; }

fs::path themesDir() { return configRoot() / "themes"; }

bool ensurePrivateDirectory(const fs::path &dir, std::string &err) {
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        fs::create_directories(dir, ec);
        if (ec) {
            err = "Cannot create '" + dir.string() + "': " + ec.message();
            return false;
        }
    } else if (!fs::is_directory(dir, ec)) {
        err = "'" + dir.string() + "' is not a directory";
        return false;
    }
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
        err = "Cannot restrict permissions of '" + dir.string() +
              "': " + ec.message();
        return false;
    }
    return true;
}

} // namespace opendir

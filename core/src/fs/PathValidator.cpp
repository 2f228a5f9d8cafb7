// Filename rules and canonical-path checks.
#include "opendir/PathValidator.hpp"

#include <cctype>
#include <cstdlib>
#include <system_error>

#include <pwd.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace opendir {

static bool isBlank(const std::string &s) {
    for (unsigned char c : s) {
        if (!std::isspace(c))
            return false;
    }
    return true;
}

NameError validateFilename(const std::string &name) {
    if (name.empty() || isBlank(name))
        return NameError::Empty;
    if (name == "." || name == "..")
        return NameError::ReservedDot;
    if (name.find('/') != std::string::npos ||
        name.find('\\') != std::string::npos)
        return NameError::Separator;
    if (name.find("..") != std::string::npos)
        return NameError::TraversalComponent;
    for (unsigned char c : name) {
        if (c < 0x20u || c == 0x7Fu) // includes NUL
            return NameError::ControlChar;
    }
    if (name.size() > kMaxFilenameLength)
        return NameError::TooLong;
    if (std::isspace(static_cast<unsigned char>(name.front())) ||
        std::isspace(static_cast<unsigned char>(name.back())))
        return NameError::EdgeWhitespace;
    if (name.front() == '-')
        return NameError::LeadingDash;
    return NameError::None;
}

const char *nameErrorMessage(NameError e) {
    switch (e) {
    case NameError::None:
        return "";
    case NameError::Empty:
        return "Filename cannot be empty";
    case NameError::TraversalComponent:
        return "Filename cannot contain '..'";
    case NameError::Separator:
        return "Filename cannot contain path separators";
    case NameError::ControlChar:
        return "Filename cannot contain control characters";
    case NameError::ReservedDot:
        return "Invalid filename: cannot be '.' or '..'";
    case NameError::TooLong:
        return "Filename too long (max 255 characters)";
    case NameError::EdgeWhitespace:
        return "Filename cannot start or end with whitespace";
    case NameError::LeadingDash:
        return "Filename cannot start with hyphen";
    }
    return "Invalid filename";
}

bool isValidFilename(const std::string &name, std::string *why) {
    const NameError e = validateFilename(name);
    if (e == NameError::None)
        return true;
    if (why)
        *why = nameErrorMessage(e);
    return false;
}

bool isWithin(const fs::path &child, const fs::path &parent) {
    auto c = child.begin();
    for (auto p = parent.begin(); p != parent.end(); ++p) {
        // Trailing separator yields an empty final component.
        if (p->empty())
            continue;
        if (c == child.end() || *c != *p)
            return false;
        ++c;
    }
    return true;
}

bool resolveAndVerify(const fs::path &parent, const std::string &name,
                      fs::path &out, std::string &err) {
    std::string why;
    if (!isValidFilename(name, &why)) {
        err = why;
        return false;
    }
    std::error_code ec;
    const fs::path canonParent = fs::canonical(parent, ec);
    if (ec) {
        err = "Cannot resolve '" + parent.string() + "': " + ec.message();
        return false;
    }
    const fs::path resolved = fs::weakly_canonical(canonParent / name, ec);
    if (ec) {
        err = "Cannot resolve '" + (canonParent / name).string() +
              "': " + ec.message();
        return false;
    }
    if (resolved == canonParent || !isWithin(resolved, canonParent)) {
        err = "Path escapes parent directory: " + resolved.string();
        return false;
    }
    out = resolved;
    return true;
}

fs::path resolvePath(const std::optional<std::string> &raw,
                     const std::function<fs::path()> &fallback) {
    if (raw.has_value() && !raw->empty()) {
        fs::path p(*raw);
        if (p.is_absolute()) {
            std::error_code ec;
            fs::path canon = fs::canonical(p, ec);
            if (!ec && fs::is_directory(canon, ec))
                return canon;
            // Walk up to the nearest existing directory.
            fs::path cur = p.lexically_normal();
            while (cur.has_parent_path() && cur != cur.parent_path()) {
                cur = cur.parent_path();
                canon = fs::canonical(cur, ec);
                if (!ec && fs::is_directory(canon, ec))
                    return canon;
            }
        }
    }
    return fallback ? fallback() : fs::path("/");
}

static bool isReadableDir(const fs::path &p) {
    std::error_code ec;
    if (!fs::is_directory(p, ec))
        return false;
    fs::directory_iterator it(p, ec);
    return !ec;
}

fs::path validDirectory(const fs::path &target, const fs::path &fallback) {
    fs::path cur = target;
    while (!cur.empty()) {
        if (isReadableDir(cur))
            return cur;
        const fs::path parent = cur.parent_path();
        if (parent == cur)
            break;
        cur = parent;
    }
    if (isReadableDir(fallback))
        return fallback;
    return fs::path("/");
}

fs::path homeDirectory() {
    const char *home = std::getenv("HOME");
    if (home && *home)
        return fs::path(home);
    if (const passwd *pw = ::getpwuid(::getuid())) {
        if (pw->pw_dir)
            return fs::path(pw->pw_dir);
    }
    return fs::path("/");
}

} // namespace opendir

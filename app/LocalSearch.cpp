#include "LocalSearch.hpp"

#include <cctype>
#include <system_error>

namespace opendir {

namespace fs = std::filesystem;

namespace {

std::string folded(const std::string &s) {
    std::string out(s);
    for (auto &c : out)
        c = char(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

bool wildcardMatch(const std::string &pat, const std::string &name) {
    std::size_t p = 0, n = 0;
    std::size_t star = std::string::npos, resume = 0;
    while (n < name.size()) {
        if (p < pat.size() && (pat[p] == '?' || pat[p] == name[n])) {
            ++p;
            ++n;
        } else if (p < pat.size() && pat[p] == '*') {
            star = p++;
            resume = n;
        } else if (star != std::string::npos) {
            p = star + 1;
            n = ++resume;
        } else {
            return false;
        }
    }
    while (p < pat.size() && pat[p] == '*')
        ++p;
    return p == pat.size();
}

} // namespace

bool nameMatches(const std::string &pattern, const std::string &name) {
    if (pattern.empty())
        return false;
    const std::string pat = folded(pattern);
    const std::string low = folded(name);
    if (pat.find_first_of("*?") != std::string::npos)
        return wildcardMatch(pat, low);
    return low.find(pat) != std::string::npos;
}

bool searchFiles(const fs::path &root, const std::string &pattern,
                 const CancelFlag &cancel, SearchOutcome &out,
                 std::string &err) {
    out = SearchOutcome{};
    std::error_code ec;
    fs::recursive_directory_iterator it(
        root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        err = "Failed to read dir '" + root.string() + "': " + ec.message();
        return false;
    }
    const fs::recursive_directory_iterator end;
    while (it != end) {
        if (isCancelled(cancel)) {
            err = kCancelledMessage;
            return false;
        }
        const fs::path &p = it->path();
        if (nameMatches(pattern, p.filename().string())) {
            if (out.matches.size() >= kMaxSearchResults) {
                out.truncated = true;
                break;
            }
            out.matches.push_back(p.lexically_relative(root).string());
        }
        it.increment(ec);
        // Permission errors are skipped by the iterator; anything else
        // ends the walk with what was found so far.
        if (ec)
            break;
    }
    return true;
}

} // namespace opendir

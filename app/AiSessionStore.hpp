// Persistence of AI conversations under <config root>/ai_sessions.
#pragma once

#include "AiStream.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace opendir {

struct AiSession {
    std::string session_id;
    std::string current_path;
    std::vector<HistoryItem> history;
};

class AiSessionStore {
public:
    AiSessionStore();
    explicit AiSessionStore(std::filesystem::path dir);

    // Writes <dir>/<session_id>.json; the id must pass isValidSessionId.
    bool save(const AiSession &session, std::string &err) const;

    // Most recently modified session whose current_path equals path.
    // False with empty err when there is none.
    bool restoreLatest(const std::string &path, AiSession &out,
                       std::string &err) const;

    const std::filesystem::path &directory() const { return dir_; }

private:
    std::filesystem::path dir_;

    bool load(const std::filesystem::path &file, AiSession &out,
              std::string &err) const;
};

} // namespace opendir

// Copy/Cut snapshot of a panel selection, and the conflict walk that may
// sit between a paste and the engine run.
#pragma once

#include "opendir/ConflictResolver.hpp"
#include "opendir/SftpTypes.hpp"

#include <optional>
#include <string>
#include <vector>

namespace opendir {

enum class ClipOperation { Copy, Cut };

struct Clipboard {
    std::string source_path;
    std::vector<std::string> names;
    ClipOperation op = ClipOperation::Copy;
    std::optional<RemoteProfile> remote; // set when the source is remote

    bool isRemote() const { return remote.has_value(); }
};

struct ConflictState {
    ConflictResolver resolver;
    Clipboard clipboard; // restored if the user cancels
    bool is_move = false;
    std::string target_dir;
    std::size_t target_panel = 0;

    ConflictState(std::vector<ConflictItem> items, Clipboard clip, bool move,
                  std::string target, std::size_t panel)
        : resolver(std::move(items)), clipboard(std::move(clip)),
          is_move(move), target_dir(std::move(target)), target_panel(panel) {}
};

} // namespace opendir

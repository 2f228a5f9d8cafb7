// Copy/move between any combination of local and remote directories, in the
// same progress vocabulary as the local engine.
#pragma once

#include "ProgressTypes.hpp"
#include "SftpClient.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace opendir {

enum class TransferOp { Copy, Move };

enum class TransferStrategy { LocalToLocal, Upload, Download, RemoteToRemote };

struct Endpoint {
    std::optional<RemoteProfile> remote; // empty: local filesystem
    std::string dir;

    bool isRemote() const { return remote.has_value(); }

    static Endpoint local(std::string d) { return {std::nullopt, std::move(d)}; }
    static Endpoint onRemote(RemoteProfile p, std::string d) {
        return {std::move(p), std::move(d)};
    }
};

struct RemoteTransferJob {
    TransferOp op = TransferOp::Copy;
    Endpoint source;
    Endpoint target;
    std::vector<std::string> names;
    PathSet overwrite; // only honored by LocalToLocal
    PathSet skip;
};

TransferStrategy selectStrategy(const Endpoint &source, const Endpoint &target);
const char *strategyName(TransferStrategy s);

// ~/.opendir/tmp/{user}@{host}/{remote path}
std::filesystem::path remoteScratchPath(const RemoteProfile &profile,
                                        const std::string &remotePath);

// Opens its own sessions through factory for each remote side. Worker-thread
// entry point; ends with exactly one Completed.
void runTransferWithProgress(const RemoteTransferJob &job,
                             const SftpClientFactory &factory,
                             const CancelFlag &cancel,
                             const ProgressSender &tx);

} // namespace opendir

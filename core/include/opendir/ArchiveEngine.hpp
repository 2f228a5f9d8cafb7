// Tar/untar by driving an external tar binary. Verbose output lines are
// turned into progress messages; sizes come from a pre-scan.
#pragma once

#include "ProgressTypes.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace opendir {

enum class Compression { None, Gzip, Bzip2, Xz };

Compression compressionForName(const std::string &archiveName);
bool isArchiveName(const std::string &name);
// "logs.tar.gz" -> "logs"
std::string extractDirName(const std::string &archiveName);

// Configured path first (if executable), then gtar, then tar on PATH.
// Empty when nothing usable exists.
std::string findTarBinary(const std::optional<std::string> &configured);

struct ArchiveScan {
    std::map<std::string, std::uint64_t> sizes; // "./rel/path" -> bytes
    std::size_t total_files = 0;
    std::uint64_t total_bytes = 0;
};

// excludes are paths relative to baseDir (as produced by the symlink scan).
bool scanSelectionForTar(const std::filesystem::path &baseDir,
                         const std::vector<std::string> &names,
                         const std::vector<std::string> &excludes,
                         const CancelFlag &cancel, ArchiveScan &out,
                         std::string &err);

// Parses one line of `tar -tv` output (GNU or BSD layout).
bool parseVerboseListingLine(const std::string &line, std::string &name,
                             std::uint64_t &size);

// Strips a trailing '/' and a " -> target" suffix.
std::string normalizeMemberName(const std::string &name);

struct TarRequest {
    std::string tar_binary;
    std::filesystem::path base_dir;
    std::vector<std::string> names;
    std::string archive_name;
    std::vector<std::string> excludes;
};

struct UntarRequest {
    std::string tar_binary;
    std::filesystem::path archive_path;
    std::filesystem::path extract_dir;
};

std::vector<std::string> buildTarArguments(const TarRequest &req,
                                           bool useStdbuf);

void createArchiveWithProgress(const TarRequest &req, const CancelFlag &cancel,
                               const ProgressSender &tx);

void extractArchiveWithProgress(const UntarRequest &req,
                                const CancelFlag &cancel,
                                const ProgressSender &tx);

} // namespace opendir

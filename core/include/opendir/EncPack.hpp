// Encrypt every plain file of a directory into split .cokacenc chunks, and
// merge chunk groups back into the original files.
#pragma once

#include "ProgressTypes.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace opendir {

constexpr std::uint64_t kDefaultSplitSizeMb = 1800;
constexpr std::uint64_t kDefaultSplitSize = kDefaultSplitSizeMb * 1024 * 1024;

// <config>/credential/cokacenc.key
std::filesystem::path encKeyPath();

// Creates the key (4096 random bytes, base64) on first use. The directory
// is 0700 and the file 0600.
bool ensureEncKey(std::filesystem::path &keyPath, std::string &err);

// Regular files not starting with '.' and not already chunks, by name.
bool listPackableFiles(const std::filesystem::path &dir,
                       std::vector<std::string> &names, std::string &err);

// Each file of listPackableFiles is replaced by its chunks once all of them
// are written.
void packDirectoryWithProgress(const std::filesystem::path &dir,
                               const std::filesystem::path &keyPath,
                               const CancelFlag &cancel,
                               const ProgressSender &tx,
                               std::uint64_t splitSize = kDefaultSplitSize);

// One item per chunk group. A group is restored only when every chunk
// decrypts, the metadata agrees and the MD5 and size match; its chunks are
// then deleted.
void unpackDirectoryWithProgress(const std::filesystem::path &dir,
                                 const std::filesystem::path &keyPath,
                                 const CancelFlag &cancel,
                                 const ProgressSender &tx);

} // namespace opendir

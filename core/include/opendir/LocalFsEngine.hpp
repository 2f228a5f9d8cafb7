// Local copy/move/delete engine. The *WithProgress entry points run on a
// worker thread and report through a ProgressSender; each stream ends with
// exactly one Completed message.
#pragma once

#include "ProgressTypes.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace opendir {

constexpr int kMaxCopyDepth = 256;

// overwrite/skip/excluded hold absolute source paths (srcDir / name for top
// level items). excluded may also name nested symlinks to leave out.
void copyFilesWithProgress(const std::vector<std::string> &files,
                           const std::filesystem::path &srcDir,
                           const std::filesystem::path &dstDir,
                           const PathSet &overwrite, const PathSet &skip,
                           const CancelFlag &cancel, const ProgressSender &tx,
                           const PathSet &excluded = {});

void moveFilesWithProgress(const std::vector<std::string> &files,
                           const std::filesystem::path &srcDir,
                           const std::filesystem::path &dstDir,
                           const PathSet &overwrite, const PathSet &skip,
                           const CancelFlag &cancel, const ProgressSender &tx,
                           const PathSet &excluded = {});

// Copy into the same directory under {stem}_dup{.ext}, {stem}_dup2{.ext}...
void duplicateFilesWithProgress(const std::vector<std::string> &files,
                                const std::filesystem::path &dir,
                                const CancelFlag &cancel,
                                const ProgressSender &tx,
                                const PathSet &excluded = {});

// First free duplicate name for `name` inside dir.
std::string duplicateName(const std::filesystem::path &dir,
                          const std::string &name);

// Symlink: unlink. Directory: remove recursively. Otherwise: remove.
bool deleteFile(const std::filesystem::path &path, std::string &err);

// Totals over paths (symlinks count as one file of size zero).
bool calculateTotals(const std::vector<std::filesystem::path> &paths,
                     const CancelFlag &cancel, std::uint64_t &bytes,
                     std::size_t &files, std::string &err);

// Validated single-entry mutations used by the panel dialogs.
bool createDirectory(const std::filesystem::path &parent,
                     const std::string &name, std::string &err);
bool createFile(const std::filesystem::path &parent, const std::string &name,
                std::string &err);
bool renameEntry(const std::filesystem::path &parent,
                 const std::string &oldName, const std::string &newName,
                 std::string &err);

} // namespace opendir

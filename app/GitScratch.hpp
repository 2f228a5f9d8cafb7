// Exports a git revision into scratch space so the diff engine can compare
// it against the working tree.
#pragma once

#include "opendir/DirDiff.hpp"
#include "opendir/ProgressTypes.hpp"

#include <filesystem>
#include <string>

namespace opendir {

// Walks up from dir to the directory holding .git.
bool findRepositoryRoot(const std::filesystem::path &dir,
                        std::filesystem::path &root, std::string &err);

// Refs, hashes and rev expressions such as HEAD~2; no leading '-'.
bool isValidRevision(const std::string &rev);

// <scratch>/git/<rev with '/' replaced>
std::filesystem::path gitScratchDir(const std::string &rev);

// `git archive <rev> | tar -x -C dest`; dest is recreated.
bool exportRevision(const std::filesystem::path &repoRoot,
                    const std::string &rev, const std::string &tarBinary,
                    const std::filesystem::path &dest, const CancelFlag &cancel,
                    std::string &err);

// Exports rev and compares it (left) with the working tree (right). The
// .git directory is left out of the rows.
bool diffAgainstRevision(const std::filesystem::path &panelDir,
                         const std::string &rev, const std::string &tarBinary,
                         CompareMethod method, const CancelFlag &cancel,
                         DiffReport &out, std::string &err);

} // namespace opendir

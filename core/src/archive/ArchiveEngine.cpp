// Tar/untar engine. The verbose member list on stdout drives progress; the
// last "tar:" line (or the first stderr line) becomes the error message.
#include "opendir/ArchiveEngine.hpp"
#include "opendir/LocalFsEngine.hpp"
#include "opendir/PathValidator.hpp"
#include "Subprocess.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace opendir {

namespace {

constexpr int kReadTimeoutMs = 100;

std::string toLower(std::string s) {
    for (char &c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

bool endsWith(const std::string &s, const std::string &suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

struct SuffixRule {
    const char *suffix;
    Compression compression;
};

const SuffixRule kSuffixes[] = {
    {".tar.gz", Compression::Gzip},   {".tgz", Compression::Gzip},
    {".tar.bz2", Compression::Bzip2}, {".tbz2", Compression::Bzip2},
    {".tar.xz", Compression::Xz},     {".txz", Compression::Xz},
    {".tar", Compression::None},
};

const char *compressionLetter(Compression c) {
    switch (c) {
    case Compression::Gzip:
        return "z";
    case Compression::Bzip2:
        return "j";
    case Compression::Xz:
        return "J";
    case Compression::None:
        break;
    }
    return "";
}

bool isTarDiagnostic(const std::string &line) {
    return line.rfind("tar:", 0) == 0 || line.rfind("gtar:", 0) == 0;
}

std::string trim(const std::string &s) {
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

std::vector<std::string> withStdbuf(std::vector<std::string> argv) {
    std::string stdbuf;
    if (!findExecutable("stdbuf", stdbuf))
        return argv;
    argv.insert(argv.begin(), {stdbuf, "-oL", "-eL"});
    return argv;
}

void fail(const ProgressSender &tx, const std::string &label,
          const std::string &reason) {
    tx.send(ProgressMessage::error(label, reason));
    tx.send(ProgressMessage::completed(0, 1));
}

// Best-effort cleanup; a failure is folded into the reported reason.
std::string withCleanup(const fs::path &leftover, const std::string &reason) {
    std::error_code ec;
    if (leftover.empty() || !fs::exists(fs::symlink_status(leftover, ec)))
        return reason;
    std::string err;
    if (!deleteFile(leftover, err))
        return reason + " (cleanup failed: " + err + ")";
    return reason;
}

struct TarRun {
    std::vector<std::string> argv;
    std::string workdir;
    std::string label;
    fs::path leftover; // removed on failure or cancel
    const ArchiveScan *scan = nullptr;
};

// Runs tar; each member line yields FileStarted/FileCompleted/TotalProgress.
void runTar(const TarRun &run, const CancelFlag &cancel,
            const ProgressSender &tx) {
    Subprocess proc;
    std::string err;
    if (!proc.start(run.argv, run.workdir, err)) {
        fail(tx, run.label, withCleanup(run.leftover, err));
        return;
    }

    std::size_t completed = 0;
    std::uint64_t bytes = 0;
    std::string lastTarError;
    std::string firstStderr;
    const std::size_t totalFiles = run.scan ? run.scan->total_files : 0;
    const std::uint64_t totalBytes = run.scan ? run.scan->total_bytes : 0;

    bool open = true;
    while (open) {
        if (isCancelled(cancel)) {
            proc.kill();
            proc.wait();
            fail(tx, run.label, withCleanup(run.leftover, kCancelledMessage));
            return;
        }
        std::vector<std::string> outLines, errLines;
        open = proc.readLines(kReadTimeoutMs, outLines, errLines);
        for (const auto &raw : outLines) {
            const std::string line = trim(raw);
            if (line.empty())
                continue;
            if (isTarDiagnostic(line)) {
                lastTarError = line;
                continue;
            }
            std::uint64_t size = 0;
            if (run.scan) {
                auto it = run.scan->sizes.find(normalizeMemberName(line));
                if (it != run.scan->sizes.end())
                    size = it->second;
            }
            tx.send(ProgressMessage::fileStarted(line));
            ++completed;
            bytes += size;
            tx.send(ProgressMessage::fileCompleted(line));
            tx.send(ProgressMessage::totalProgress(completed, totalFiles,
                                                   bytes, totalBytes));
        }
        for (const auto &raw : errLines) {
            const std::string line = trim(raw);
            if (line.empty())
                continue;
            if (isTarDiagnostic(line))
                lastTarError = line;
            if (firstStderr.empty())
                firstStderr = line;
        }
    }

    const int code = proc.wait();
    if (code == 0) {
        tx.send(ProgressMessage::completed(completed, 0));
        return;
    }
    std::string reason = !lastTarError.empty()  ? lastTarError
                         : !firstStderr.empty() ? firstStderr
                                                : "tar failed";
    fail(tx, run.label, withCleanup(run.leftover, reason));
}

void scanEntry(const fs::path &path, const std::string &key,
               const std::set<std::string> &excluded, const CancelFlag &cancel,
               int depth, ArchiveScan &out) {
    std::error_code ec;
    const fs::file_status st = fs::symlink_status(path, ec);
    if (ec)
        return;
    ++out.total_files;
    if (fs::is_symlink(st)) {
        out.sizes[key] = 0;
        return;
    }
    if (!fs::is_directory(st)) {
        const std::uint64_t sz = fs::file_size(path, ec);
        out.sizes[key] = ec ? 0 : sz;
        out.total_bytes += out.sizes[key];
        return;
    }
    out.sizes[key] = 0;
    if (depth > kMaxCopyDepth)
        return;
    fs::directory_iterator it(path, ec);
    if (ec)
        return;
    for (const auto &entry : it) {
        if (isCancelled(cancel))
            return;
        const std::string child = key + "/" + entry.path().filename().string();
        // excluded entries are stored without the leading "./"
        if (excluded.count(child.substr(2)))
            continue;
        scanEntry(entry.path(), child, excluded, cancel, depth + 1, out);
    }
}

} // namespace

Compression compressionForName(const std::string &archiveName) {
    const std::string lower = toLower(archiveName);
    for (const auto &rule : kSuffixes) {
        if (endsWith(lower, rule.suffix))
            return rule.compression;
    }
    return Compression::None;
}

bool isArchiveName(const std::string &name) {
    const std::string lower = toLower(name);
    for (const auto &rule : kSuffixes) {
        if (endsWith(lower, rule.suffix))
            return true;
    }
    return false;
}

std::string extractDirName(const std::string &archiveName) {
    const std::string lower = toLower(archiveName);
    for (const auto &rule : kSuffixes) {
        const std::string suffix = rule.suffix;
        if (endsWith(lower, suffix) && lower.size() > suffix.size())
            return archiveName.substr(0, archiveName.size() - suffix.size());
    }
    return archiveName + "_extracted";
}

std::string findTarBinary(const std::optional<std::string> &configured) {
    std::string found;
    if (configured.has_value() && !configured->empty() &&
        findExecutable(*configured, found))
        return found;
    if (findExecutable("gtar", found))
        return found;
    if (findExecutable("tar", found))
        return found;
    return {};
}

bool scanSelectionForTar(const fs::path &baseDir,
                         const std::vector<std::string> &names,
                         const std::vector<std::string> &excludes,
                         const CancelFlag &cancel, ArchiveScan &out,
                         std::string &err) {
    out = ArchiveScan{};
    const std::set<std::string> excluded(excludes.begin(), excludes.end());
    for (const auto &name : names) {
        if (isCancelled(cancel)) {
            err = kCancelledMessage;
            return false;
        }
        if (excluded.count(name))
            continue;
        scanEntry(baseDir / name, "./" + name, excluded, cancel, 0, out);
    }
    if (isCancelled(cancel)) {
        err = kCancelledMessage;
        return false;
    }
    return true;
}

std::string normalizeMemberName(const std::string &name) {
    std::string n = name;
    const auto arrow = n.find(" -> ");
    if (arrow != std::string::npos)
        n.erase(arrow);
    const auto link = n.find(" link to ");
    if (link != std::string::npos)
        n.erase(link);
    while (n.size() > 1 && n.back() == '/')
        n.pop_back();
    return n;
}

bool parseVerboseListingLine(const std::string &line, std::string &name,
                             std::uint64_t &size) {
    if (line.empty() || isTarDiagnostic(line))
        return false;

    // Token start offsets so the name keeps its inner spaces.
    std::vector<std::pair<std::size_t, std::string>> tokens;
    std::size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && line[i] == ' ')
            ++i;
        if (i >= line.size())
            break;
        const std::size_t start = i;
        while (i < line.size() && line[i] != ' ')
            ++i;
        tokens.emplace_back(start, line.substr(start, i - start));
    }

    auto isNumber = [](const std::string &s) {
        return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c));
        });
    };

    std::size_t sizeIdx = 0;
    std::size_t nameIdx = 0;
    if (tokens.size() >= 6 && tokens[1].second.find('/') != std::string::npos) {
        // GNU: perms owner/group size date time name
        sizeIdx = 2;
        nameIdx = 5;
    } else if (tokens.size() >= 9 && isNumber(tokens[1].second)) {
        // BSD: perms links owner group size month day time name
        sizeIdx = 4;
        nameIdx = 8;
    } else {
        return false;
    }
    if (!isNumber(tokens[sizeIdx].second))
        return false;
    try {
        size = std::stoull(tokens[sizeIdx].second);
    } catch (const std::exception &) {
        return false;
    }
    name = normalizeMemberName(line.substr(tokens[nameIdx].first));
    return !name.empty();
}

std::vector<std::string> buildTarArguments(const TarRequest &req,
                                           bool useStdbuf) {
    const Compression c = compressionForName(req.archive_name);
    const fs::path archivePath = req.base_dir / req.archive_name;
    std::vector<std::string> argv = {
        req.tar_binary, std::string("-c") + compressionLetter(c) + "vf",
        archivePath.string(), "-C", req.base_dir.string()};
    for (const auto &ex : req.excludes)
        argv.push_back("--exclude=./" + ex);
    argv.push_back("--");
    for (const auto &name : req.names)
        argv.push_back("./" + name);
    return useStdbuf ? withStdbuf(argv) : argv;
}

void createArchiveWithProgress(const TarRequest &req, const CancelFlag &cancel,
                               const ProgressSender &tx) {
    const std::string &label = req.archive_name;
    std::string why;
    if (!isValidFilename(req.archive_name, &why)) {
        fail(tx, label, why);
        return;
    }
    for (const auto &name : req.names) {
        if (!isValidFilename(name, &why)) {
            fail(tx, name, why);
            return;
        }
    }
    if (req.tar_binary.empty()) {
        fail(tx, label, "tar not found");
        return;
    }
    const fs::path archivePath = req.base_dir / req.archive_name;
    std::error_code ec;
    if (fs::exists(fs::symlink_status(archivePath, ec))) {
        fail(tx, label, "Archive already exists: " + archivePath.string());
        return;
    }

    ArchiveScan scan;
    std::string err;
    if (!scanSelectionForTar(req.base_dir, req.names, req.excludes, cancel,
                             scan, err)) {
        fail(tx, label, err);
        return;
    }

    TarRun run;
    run.argv = buildTarArguments(req, true);
    run.workdir = req.base_dir.string();
    run.label = label;
    run.leftover = archivePath;
    run.scan = &scan;
    runTar(run, cancel, tx);
}

void extractArchiveWithProgress(const UntarRequest &req,
                                const CancelFlag &cancel,
                                const ProgressSender &tx) {
    const std::string label = req.archive_path.filename().string();
    if (req.tar_binary.empty()) {
        fail(tx, label, "tar not found");
        return;
    }
    std::string why;
    if (!isValidFilename(req.extract_dir.filename().string(), &why)) {
        fail(tx, label, why);
        return;
    }
    std::error_code ec;
    if (!fs::is_regular_file(req.archive_path, ec)) {
        fail(tx, label, "Archive not found: " + req.archive_path.string());
        return;
    }
    if (fs::exists(fs::symlink_status(req.extract_dir, ec))) {
        fail(tx, label,
             "Extract directory already exists: " + req.extract_dir.string());
        return;
    }

    const std::string letter =
        compressionLetter(compressionForName(label));

    // Pre-scan: list members with sizes.
    tx.send(ProgressMessage::preparing("Reading archive contents..."));
    ArchiveScan scan;
    {
        Subprocess list;
        std::string err;
        const std::vector<std::string> argv = {
            req.tar_binary, "-t" + letter + "vf", req.archive_path.string()};
        if (!list.start(argv, {}, err)) {
            fail(tx, label, err);
            return;
        }
        std::string firstStderr;
        bool open = true;
        while (open) {
            if (isCancelled(cancel)) {
                list.kill();
                list.wait();
                fail(tx, label, kCancelledMessage);
                return;
            }
            std::vector<std::string> outLines, errLines;
            open = list.readLines(kReadTimeoutMs, outLines, errLines);
            for (const auto &line : outLines) {
                std::string name;
                std::uint64_t size = 0;
                if (!parseVerboseListingLine(line, name, size))
                    continue;
                scan.sizes[name] = size;
                ++scan.total_files;
                scan.total_bytes += size;
            }
            for (const auto &line : errLines) {
                if (firstStderr.empty() && !trim(line).empty())
                    firstStderr = trim(line);
            }
        }
        if (list.wait() != 0) {
            fail(tx, label,
                 firstStderr.empty() ? "Failed to read archive" : firstStderr);
            return;
        }
    }
    tx.send(ProgressMessage::prepareComplete());

    fs::create_directory(req.extract_dir, ec);
    if (ec) {
        fail(tx, label,
             "Cannot create '" + req.extract_dir.string() +
                 "': " + ec.message());
        return;
    }

    TarRun run;
    run.argv = withStdbuf({req.tar_binary, "-x" + letter + "vf",
                           req.archive_path.string(), "-C",
                           req.extract_dir.string()});
    run.label = label;
    run.leftover = req.extract_dir;
    run.scan = &scan;
    runTar(run, cancel, tx);
}

} // namespace opendir

#include "GitScratch.hpp"
#include "AppLogging.hpp"
#include "opendir/ConfigPaths.hpp"

#include <QProcess>

#include <algorithm>
#include <cctype>
#include <system_error>

namespace opendir {

namespace fs = std::filesystem;

namespace {

constexpr int kWaitSliceMs = 100;

std::string firstStderrLine(QProcess &proc) {
    const QString text = QString::fromUtf8(proc.readAllStandardError());
    for (const auto &line : text.split('\n', Qt::SkipEmptyParts)) {
        const QString t = line.trimmed();
        if (!t.isEmpty())
            return t.toStdString();
    }
    return {};
}

bool isGitPath(const std::string &rel) {
    return rel == ".git" || rel.rfind(".git/", 0) == 0;
}

} // namespace

bool findRepositoryRoot(const fs::path &dir, fs::path &root, std::string &err) {
    std::error_code ec;
    fs::path cur = fs::weakly_canonical(dir, ec);
    if (ec)
        cur = dir;
    for (;;) {
        if (fs::exists(cur / ".git", ec)) {
            root = cur;
            return true;
        }
        if (!cur.has_parent_path() || cur.parent_path() == cur)
            break;
        cur = cur.parent_path();
    }
    err = "Not a git repository: " + dir.string();
    return false;
}

bool isValidRevision(const std::string &rev) {
    if (rev.empty() || rev.size() > 200 || rev.front() == '-')
        return false;
    return std::all_of(rev.begin(), rev.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '.' ||
               c == '_' || c == '-' || c == '/' || c == '~' || c == '^' ||
               c == '@';
    });
}

fs::path gitScratchDir(const std::string &rev) {
    std::string safe = rev;
    std::replace(safe.begin(), safe.end(), '/', '_');
    return scratchRoot() / "git" / safe;
}

bool exportRevision(const fs::path &repoRoot, const std::string &rev,
                    const std::string &tarBinary, const fs::path &dest,
                    const CancelFlag &cancel, std::string &err) {
    if (!isValidRevision(rev)) {
        err = "Invalid revision: " + rev;
        return false;
    }
    std::error_code ec;
    fs::remove_all(dest, ec);
    if (ec) {
        err = "Failed to clear '" + dest.string() + "': " + ec.message();
        return false;
    }
    if (!ensurePrivateDirectory(dest, err))
        return false;

    QProcess git;
    QProcess tar;
    git.setWorkingDirectory(QString::fromStdString(repoRoot.string()));
    git.setStandardOutputProcess(&tar);
    tar.start(QString::fromStdString(tarBinary),
              {QStringLiteral("-x"), QStringLiteral("-C"),
               QString::fromStdString(dest.string())});
    git.start(QStringLiteral("git"),
              {QStringLiteral("archive"), QString::fromStdString(rev)});
    if (!git.waitForStarted()) {
        tar.kill();
        tar.waitForFinished();
        err = "Failed to start git: " + git.errorString().toStdString();
        return false;
    }
    if (!tar.waitForStarted()) {
        git.kill();
        git.waitForFinished();
        err = "Failed to start tar: " + tar.errorString().toStdString();
        return false;
    }

    while (git.state() != QProcess::NotRunning ||
           tar.state() != QProcess::NotRunning) {
        if (isCancelled(cancel)) {
            git.kill();
            tar.kill();
            git.waitForFinished();
            tar.waitForFinished();
            fs::remove_all(dest, ec);
            err = kCancelledMessage;
            return false;
        }
        if (git.state() != QProcess::NotRunning)
            git.waitForFinished(kWaitSliceMs);
        else
            tar.waitForFinished(kWaitSliceMs);
    }

    if (git.exitStatus() != QProcess::NormalExit || git.exitCode() != 0) {
        const std::string line = firstStderrLine(git);
        err = line.empty() ? "git archive failed for " + rev : line;
        return false;
    }
    if (tar.exitStatus() != QProcess::NormalExit || tar.exitCode() != 0) {
        const std::string line = firstStderrLine(tar);
        err = line.empty() ? "Extraction failed" : line;
        return false;
    }
    return true;
}

bool diffAgainstRevision(const fs::path &panelDir, const std::string &rev,
                         const std::string &tarBinary, CompareMethod method,
                         const CancelFlag &cancel, DiffReport &out,
                         std::string &err) {
    fs::path root;
    if (!findRepositoryRoot(panelDir, root, err))
        return false;
    const fs::path scratch = gitScratchDir(rev);
    if (!exportRevision(root, rev, tarBinary, scratch, cancel, err))
        return false;
    qCInfo(odXfer) << "Exported revision" << QString::fromStdString(rev);

    DiffReport report;
    if (!compareDirectories(scratch, root, method, cancel, report, err))
        return false;
    report.rows.erase(std::remove_if(report.rows.begin(), report.rows.end(),
                                     [](const DiffRow &row) {
                                         return isGitPath(row.rel_path);
                                     }),
                      report.rows.end());
    out = std::move(report);
    return true;
}

} // namespace opendir

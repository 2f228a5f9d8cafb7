// fork/exec with CLOEXEC pipes; exec failures are reported through a
// dedicated status pipe so start() can tell "not found" from a real run.
#include "Subprocess.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace opendir {

bool findExecutable(const std::string &name, std::string &out) {
    if (name.find('/') != std::string::npos) {
        if (::access(name.c_str(), X_OK) == 0) {
            out = name;
            return true;
        }
        return false;
    }
    const char *pathEnv = std::getenv("PATH");
    std::stringstream ss(pathEnv ? pathEnv : "/usr/bin:/bin");
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty())
            continue;
        const std::string candidate = dir + "/" + name;
        if (::access(candidate.c_str(), X_OK) == 0) {
            out = candidate;
            return true;
        }
    }
    return false;
}

Subprocess::~Subprocess() {
    if (pid_ > 0) {
        kill();
        wait();
    }
    if (outFd_ != -1)
        ::close(outFd_);
    if (errFd_ != -1)
        ::close(errFd_);
}

bool Subprocess::start(const std::vector<std::string> &argv,
                       const std::string &workdir, std::string &err) {
    if (argv.empty()) {
        err = "No command given";
        return false;
    }
    int outPipe[2], errPipe[2], statusPipe[2];
    if (::pipe2(outPipe, O_CLOEXEC) != 0) {
        err = std::string("pipe: ") + std::strerror(errno);
        return false;
    }
    if (::pipe2(errPipe, O_CLOEXEC) != 0) {
        err = std::string("pipe: ") + std::strerror(errno);
        ::close(outPipe[0]);
        ::close(outPipe[1]);
        return false;
    }
    if (::pipe2(statusPipe, O_CLOEXEC) != 0) {
        err = std::string("pipe: ") + std::strerror(errno);
        for (int fd : {outPipe[0], outPipe[1], errPipe[0], errPipe[1]})
            ::close(fd);
        return false;
    }

    std::vector<char *> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto &a : argv)
        cargv.push_back(const_cast<char *>(a.c_str()));
    cargv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        err = std::string("fork: ") + std::strerror(errno);
        for (int fd : {outPipe[0], outPipe[1], errPipe[0], errPipe[1],
                       statusPipe[0], statusPipe[1]})
            ::close(fd);
        return false;
    }
    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0)
            ::dup2(devnull, STDIN_FILENO);
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        if (!workdir.empty() && ::chdir(workdir.c_str()) != 0) {
            const int e = errno;
            (void)!::write(statusPipe[1], &e, sizeof(e));
            ::_exit(127);
        }
        ::execvp(cargv[0], cargv.data());
        const int e = errno;
        (void)!::write(statusPipe[1], &e, sizeof(e));
        ::_exit(127);
    }

    ::close(outPipe[1]);
    ::close(errPipe[1]);
    ::close(statusPipe[1]);
    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(statusPipe[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    ::close(statusPipe[0]);

    pid_ = pid;
    outFd_ = outPipe[0];
    errFd_ = errPipe[0];
    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        wait();
        err = "Failed to start '" + argv[0] + "': " + std::strerror(childErrno);
        return false;
    }
    return true;
}

static void splitLines(std::string &buf, std::vector<std::string> &lines,
                       bool flush) {
    std::size_t pos;
    while ((pos = buf.find('\n')) != std::string::npos) {
        std::string line = buf.substr(0, pos);
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        lines.push_back(std::move(line));
        buf.erase(0, pos + 1);
    }
    if (flush && !buf.empty()) {
        lines.push_back(buf);
        buf.clear();
    }
}

bool Subprocess::readLines(int timeoutMs, std::vector<std::string> &outLines,
                           std::vector<std::string> &errLines) {
    if (outFd_ == -1 && errFd_ == -1)
        return false;
    pollfd fds[2];
    int count = 0;
    if (outFd_ != -1)
        fds[count++] = {outFd_, POLLIN, 0};
    if (errFd_ != -1)
        fds[count++] = {errFd_, POLLIN, 0};
    const int rc = ::poll(fds, static_cast<nfds_t>(count), timeoutMs);
    if (rc <= 0)
        return true; // timeout or EINTR; caller re-checks cancel

    char chunk[4096];
    for (int i = 0; i < count; ++i) {
        if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR)))
            continue;
        const bool isOut = fds[i].fd == outFd_;
        const ssize_t n = ::read(fds[i].fd, chunk, sizeof(chunk));
        std::string &buf = isOut ? outBuf_ : errBuf_;
        std::vector<std::string> &lines = isOut ? outLines : errLines;
        if (n > 0) {
            buf.append(chunk, static_cast<std::size_t>(n));
            splitLines(buf, lines, false);
        } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
            splitLines(buf, lines, true);
            ::close(fds[i].fd);
            (isOut ? outFd_ : errFd_) = -1;
        }
    }
    return outFd_ != -1 || errFd_ != -1;
}

void Subprocess::kill() {
    if (pid_ > 0)
        ::kill(pid_, SIGTERM);
}

int Subprocess::wait() {
    if (pid_ <= 0)
        return -1;
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, 0);
    } while (r < 0 && errno == EINTR);
    pid_ = -1;
    if (r < 0 || !WIFEXITED(status))
        return -1;
    return WEXITSTATUS(status);
}

} // namespace opendir

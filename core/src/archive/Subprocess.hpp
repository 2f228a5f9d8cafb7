// Minimal fork/exec wrapper with line-oriented stdout/stderr pipes.
#pragma once

#include <string>
#include <vector>

#include <sys/types.h>

namespace opendir {

bool findExecutable(const std::string &name, std::string &out);

class Subprocess {
public:
    Subprocess() = default;
    Subprocess(const Subprocess &) = delete;
    Subprocess &operator=(const Subprocess &) = delete;
    ~Subprocess();

    bool start(const std::vector<std::string> &argv,
               const std::string &workdir, std::string &err);

    // Waits up to timeoutMs; appends complete lines. Returns false once both
    // streams reached EOF (remaining partial lines are flushed first).
    bool readLines(int timeoutMs, std::vector<std::string> &outLines,
                   std::vector<std::string> &errLines);

    void kill();
    // Exit code, or -1 when the child was signalled or never started.
    int wait();

private:
    pid_t pid_ = -1;
    int outFd_ = -1;
    int errFd_ = -1;
    std::string outBuf_;
    std::string errBuf_;
};

} // namespace opendir

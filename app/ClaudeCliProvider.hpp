// AI provider backed by the `claude` command line tool in stream-json mode.
#pragma once

#include "AiStream.hpp"
#include "opendir/ProgressTypes.hpp"

#include <QStringList>

#include <string>
#include <thread>
#include <vector>

namespace opendir {

struct AiRequest {
    std::string prompt;      // already sanitized and framed
    std::string working_dir;
    std::string session_id;  // empty: new session
};

class AiProvider {
public:
    virtual ~AiProvider() = default;
    virtual bool available() const = 0;
    // Streams into tx from a worker thread; returns immediately.
    virtual void start(const AiRequest &request, StreamSender tx,
                       CancelFlag cancel) = 0;
};

// Maps stream-json lines to StreamMessages. Text blocks of one assistant
// message accumulate so each Text carries the full text so far.
class StreamJsonParser {
public:
    void feed(const std::string &line, std::vector<StreamMessage> &out);
    bool sawResult() const { return sawResult_; }

private:
    std::string runningText_;
    bool sawResult_ = false;
};

// Frames the user's request for the provider.
std::string buildContextPrompt(const std::string &currentPath,
                               const std::string &userInput);

class ClaudeCliProvider : public AiProvider {
public:
    ClaudeCliProvider();
    ClaudeCliProvider(const ClaudeCliProvider &) = delete;
    ClaudeCliProvider &operator=(const ClaudeCliProvider &) = delete;
    // Stops a running request and waits for its worker.
    ~ClaudeCliProvider() override;

    bool available() const override { return !program_.isEmpty(); }
    void start(const AiRequest &request, StreamSender tx,
               CancelFlag cancel) override;

    QStringList arguments(const std::string &sessionId) const;

    // Blocking variant for --prompt: final text in out.
    bool runOnce(const AiRequest &request, std::string &out, std::string &err);

private:
    QString program_;
    CancelFlag running_;
    std::thread worker_;
};

} // namespace opendir

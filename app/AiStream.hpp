// Chat history fed by a streaming provider. Text events carry the full
// running text of the current assistant message and replace it in place.
#pragma once

#include "opendir/Channel.hpp"

#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace opendir {

constexpr std::size_t kMaxHistoryItems = 500;
constexpr std::size_t kMaxUserInputChars = 4000;
constexpr std::size_t kToolResultMaxChars = 1500;
constexpr std::size_t kMaxSessionIdLength = 64;
// Scroll offset meaning "stick to the bottom".
constexpr std::size_t kScrollToBottom = std::numeric_limits<std::size_t>::max();

enum class HistoryTag { User, Assistant, Error, System, ToolUse, ToolResult };

const char *historyTagName(HistoryTag tag);
bool parseHistoryTag(const std::string &text, HistoryTag &out);

struct HistoryItem {
    HistoryTag tag = HistoryTag::System;
    std::string content;
};

struct StreamMessage {
    enum class Kind { Init, Text, ToolUse, ToolResult, TaskNotification, Done, Error };

    Kind kind = Kind::Text;
    std::string session_id;  // Init, Done (optional)
    std::string content;     // Text, ToolResult, Error
    std::string tool_name;   // ToolUse
    std::string input_json;  // ToolUse
    bool is_error = false;   // ToolResult
    std::string task_id;     // TaskNotification
    std::string status;
    std::string summary;
    std::optional<std::string> result; // Done

    static StreamMessage init(std::string sid);
    static StreamMessage text(std::string content);
    static StreamMessage toolUse(std::string name, std::string inputJson);
    static StreamMessage toolResult(std::string content, bool isError);
    static StreamMessage taskNotification(std::string taskId,
                                          std::string status,
                                          std::string summary);
    static StreamMessage done(std::optional<std::string> result,
                              std::string sid = {});
    static StreamMessage error(std::string message);
};

using StreamSender = Sender<StreamMessage>;
using StreamReceiver = Receiver<StreamMessage>;

// Replaces known instruction-override phrases with "[filtered]" (any case)
// and truncates to kMaxUserInputChars.
std::string sanitizeUserInput(const std::string &input);

// Runs of whitespace-only lines collapse to one empty line.
std::string normalizeEmptyLines(const std::string &text);

// "Read: src/main.cpp", "Bash: ls -la", ... Unknown tools list their keys.
std::string summarizeToolUse(const std::string &name,
                             const std::string &inputJson);

// Cuts at maxChars characters and appends "... [N more chars]".
std::string truncateToolResult(const std::string &content,
                               std::size_t maxChars = kToolResultMaxChars);

// Non-empty, at most 64 of [A-Za-z0-9_-].
bool isValidSessionId(const std::string &sid);

class AiStreamSink {
public:
    void begin(StreamReceiver rx);
    // Drains the receiver. True when the history changed.
    bool poll();
    void cancel();

    void addUserMessage(const std::string &text);
    void addItem(HistoryTag tag, const std::string &content);
    void restore(std::vector<HistoryItem> history, std::string sessionId);

    const std::vector<HistoryItem> &history() const { return history_; }
    const std::string &sessionId() const { return sessionId_; }
    bool isProcessing() const { return processing_; }

    std::size_t scrollOffset() const { return scroll_; }
    void scrollUp(std::size_t lines);
    void scrollDown(std::size_t lines, std::size_t maxScroll);
    // Against the max-scroll of the last layout.
    void scrollDown(std::size_t lines) { scrollDown(lines, lastMaxScroll_); }
    void pinToBottom() { scroll_ = kScrollToBottom; }
    bool pinned() const { return scroll_ == kScrollToBottom; }
    // Called by the frontend after layout; clamps the offset and resolves
    // the bottom sentinel.
    std::size_t resolveScroll(std::size_t maxScroll) const;

private:
    std::vector<HistoryItem> history_;
    std::string sessionId_;
    bool processing_ = false;
    bool assistantOpen_ = false;
    std::size_t scroll_ = kScrollToBottom;
    StreamReceiver rx_;
    mutable std::size_t lastMaxScroll_ = 0;

    void push(HistoryItem item);
    void apply(const StreamMessage &msg);
    void finish();
};

} // namespace opendir

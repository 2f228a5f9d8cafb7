#include "AiStream.hpp"
#include "AppLogging.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QRegularExpression>

#include <algorithm>
#include <cctype>
#include <cstring>

namespace opendir {

namespace {

const char *const kOverridePhrases[] = {
    "ignore previous instructions",
    "ignore all previous",
    "disregard previous",
    "forget previous",
    "system prompt",
    "you are now",
    "act as if",
    "pretend you are",
    "new instructions:",
    "[system]",
    "[admin]",
    "---begin",
    "---end",
};

std::string lowerAscii(const std::string &s) {
    std::string out(s);
    for (char &c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

// Byte length of the first `chars` UTF-8 code points of s.
std::size_t utf8Prefix(const std::string &s, std::size_t chars) {
    std::size_t i = 0;
    std::size_t n = 0;
    while (i < s.size() && n < chars) {
        ++i;
        while (i < s.size() && (static_cast<unsigned char>(s[i]) & 0xC0) == 0x80)
            ++i;
        ++n;
    }
    return i;
}

std::size_t utf8Length(const std::string &s) {
    return static_cast<std::size_t>(std::count_if(s.begin(), s.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

std::string firstLine(const std::string &s, std::size_t maxChars) {
    const std::size_t nl = s.find('\n');
    std::string line = s.substr(0, nl);
    bool cut = nl != std::string::npos;
    if (utf8Length(line) > maxChars) {
        line.resize(utf8Prefix(line, maxChars));
        cut = true;
    }
    return cut ? line + " ..." : line;
}

bool isBlank(const std::string &line) {
    return std::all_of(line.begin(), line.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c));
    });
}

} // namespace

const char *historyTagName(HistoryTag tag) {
    switch (tag) {
    case HistoryTag::User:
        return "user";
    case HistoryTag::Assistant:
        return "assistant";
    case HistoryTag::Error:
        return "error";
    case HistoryTag::System:
        return "system";
    case HistoryTag::ToolUse:
        return "tool_use";
    case HistoryTag::ToolResult:
        return "tool_result";
    }
    return "system";
}

bool parseHistoryTag(const std::string &text, HistoryTag &out) {
    for (HistoryTag t : {HistoryTag::User, HistoryTag::Assistant,
                         HistoryTag::Error, HistoryTag::System,
                         HistoryTag::ToolUse, HistoryTag::ToolResult}) {
        if (text == historyTagName(t)) {
            out = t;
            return true;
        }
    }
    return false;
}

StreamMessage StreamMessage::init(std::string sid) {
    StreamMessage m;
    m.kind = Kind::Init;
    m.session_id = std::move(sid);
    return m;
}

StreamMessage StreamMessage::text(std::string content) {
    StreamMessage m;
    m.kind = Kind::Text;
    m.content = std::move(content);
    return m;
}

StreamMessage StreamMessage::toolUse(std::string name, std::string inputJson) {
    StreamMessage m;
    m.kind = Kind::ToolUse;
    m.tool_name = std::move(name);
    m.input_json = std::move(inputJson);
    return m;
}

StreamMessage StreamMessage::toolResult(std::string content, bool isError) {
    StreamMessage m;
    m.kind = Kind::ToolResult;
    m.content = std::move(content);
    m.is_error = isError;
    return m;
}

StreamMessage StreamMessage::taskNotification(std::string taskId,
                                              std::string status,
                                              std::string summary) {
    StreamMessage m;
    m.kind = Kind::TaskNotification;
    m.task_id = std::move(taskId);
    m.status = std::move(status);
    m.summary = std::move(summary);
    return m;
}

StreamMessage StreamMessage::done(std::optional<std::string> result,
                                  std::string sid) {
    StreamMessage m;
    m.kind = Kind::Done;
    m.result = std::move(result);
    m.session_id = std::move(sid);
    return m;
}

StreamMessage StreamMessage::error(std::string message) {
    StreamMessage m;
    m.kind = Kind::Error;
    m.content = std::move(message);
    return m;
}

std::string sanitizeUserInput(const std::string &input) {
    std::string out = input;
    for (const char *phrase : kOverridePhrases) {
        const std::string needle(phrase);
        std::string lowered = lowerAscii(out);
        std::size_t pos = lowered.find(needle);
        while (pos != std::string::npos) {
            out.replace(pos, needle.size(), "[filtered]");
            lowered.replace(pos, needle.size(), "[filtered]");
            pos = lowered.find(needle, pos + std::strlen("[filtered]"));
        }
    }
    if (utf8Length(out) > kMaxUserInputChars) {
        out.resize(utf8Prefix(out, kMaxUserInputChars));
        out += "... [truncated]";
    }
    return out;
}

std::string normalizeEmptyLines(const std::string &text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string::npos)
            end = text.size();
        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        lines.push_back(std::move(line));
        start = end + 1;
    }

    std::string out;
    bool prevBlank = false;
    bool first = true;
    for (const auto &line : lines) {
        const bool blank = isBlank(line);
        if (blank && prevBlank)
            continue;
        if (!first)
            out += '\n';
        out += blank ? std::string() : line;
        first = false;
        prevBlank = blank;
    }
    return out;
}

std::string summarizeToolUse(const std::string &name,
                             const std::string &inputJson) {
    const QJsonObject in =
        QJsonDocument::fromJson(QByteArray::fromStdString(inputJson)).object();
    auto field = [&in](const char *key) {
        return in.value(QLatin1String(key)).toString().toStdString();
    };

    std::string detail;
    if (name == "Read" || name == "Write" || name == "Edit" ||
        name == "MultiEdit" || name == "NotebookEdit") {
        detail = field("file_path");
        if (detail.empty())
            detail = field("notebook_path");
    } else if (name == "Bash") {
        detail = firstLine(field("command"), 80);
        const std::string desc = field("description");
        if (!desc.empty())
            detail += "  (" + desc + ")";
    } else if (name == "Glob" || name == "Grep") {
        detail = field("pattern");
        const std::string where = field("path");
        if (!where.empty())
            detail += " in " + where;
    } else if (name == "LS") {
        detail = field("path");
    } else if (name == "WebFetch") {
        detail = field("url");
    } else if (name == "WebSearch") {
        detail = field("query");
    } else if (name == "Task") {
        detail = field("description");
    } else if (name == "TodoWrite") {
        const int n = in.value("todos").toArray().size();
        detail = std::to_string(n) + (n == 1 ? " item" : " items");
    } else {
        std::string keys;
        for (const QString &k : in.keys())
            keys += (keys.empty() ? "" : ", ") + k.toStdString();
        return keys.empty() ? name : name + "(" + keys + ")";
    }
    return detail.empty() ? name : name + ": " + firstLine(detail, 160);
}

std::string truncateToolResult(const std::string &content,
                               std::size_t maxChars) {
    const std::size_t total = utf8Length(content);
    if (total <= maxChars)
        return content;
    return content.substr(0, utf8Prefix(content, maxChars)) + "... [" +
           std::to_string(total - maxChars) + " more chars]";
}

bool isValidSessionId(const std::string &sid) {
    static const QRegularExpression re(QStringLiteral("^[a-zA-Z0-9_-]+$"));
    return !sid.empty() && sid.size() <= kMaxSessionIdLength &&
           re.match(QString::fromStdString(sid)).hasMatch();
}

void AiStreamSink::begin(StreamReceiver rx) {
    rx_ = std::move(rx);
    processing_ = true;
    assistantOpen_ = false;
}

bool AiStreamSink::poll() {
    if (!processing_)
        return false;
    bool changed = false;
    StreamMessage msg;
    while (processing_) {
        const RecvStatus st = rx_.tryRecv(msg);
        if (st == RecvStatus::Empty)
            break;
        changed = true;
        if (st == RecvStatus::Disconnected) {
            push({HistoryTag::Error, "Request was cancelled or failed."});
            finish();
            break;
        }
        apply(msg);
    }
    return changed;
}

void AiStreamSink::apply(const StreamMessage &msg) {
    switch (msg.kind) {
    case StreamMessage::Kind::Init:
        if (isValidSessionId(msg.session_id))
            sessionId_ = msg.session_id;
        break;
    case StreamMessage::Kind::Text:
        if (assistantOpen_ && !history_.empty() &&
            history_.back().tag == HistoryTag::Assistant) {
            history_.back().content = normalizeEmptyLines(msg.content);
        } else {
            push({HistoryTag::Assistant, msg.content});
            assistantOpen_ = true;
        }
        break;
    case StreamMessage::Kind::ToolUse:
        push({HistoryTag::ToolUse, summarizeToolUse(msg.tool_name, msg.input_json)});
        assistantOpen_ = false;
        break;
    case StreamMessage::Kind::ToolResult:
        push({msg.is_error ? HistoryTag::Error : HistoryTag::ToolResult,
              truncateToolResult(msg.content)});
        assistantOpen_ = false;
        break;
    case StreamMessage::Kind::TaskNotification: {
        std::string text = "Task " + msg.task_id + " " + msg.status;
        if (!msg.summary.empty())
            text += ": " + msg.summary;
        push({HistoryTag::System, text});
        assistantOpen_ = false;
        break;
    }
    case StreamMessage::Kind::Done:
        if (isValidSessionId(msg.session_id))
            sessionId_ = msg.session_id;
        if (msg.result && !msg.result->empty()) {
            if (assistantOpen_ && !history_.empty() &&
                history_.back().tag == HistoryTag::Assistant)
                history_.back().content = normalizeEmptyLines(*msg.result);
            else
                push({HistoryTag::Assistant, *msg.result});
        }
        finish();
        break;
    case StreamMessage::Kind::Error:
        qCWarning(odAi) << "Provider error:" << QString::fromStdString(msg.content);
        push({HistoryTag::Error, msg.content});
        finish();
        break;
    }
}

void AiStreamSink::finish() {
    processing_ = false;
    assistantOpen_ = false;
    rx_.close();
}

void AiStreamSink::cancel() {
    if (!processing_)
        return;
    finish();
    push({HistoryTag::System, "Cancelled."});
}

void AiStreamSink::addUserMessage(const std::string &text) {
    push({HistoryTag::User, text});
    pinToBottom();
}

void AiStreamSink::addItem(HistoryTag tag, const std::string &content) {
    push({tag, content});
}

void AiStreamSink::restore(std::vector<HistoryItem> history,
                           std::string sessionId) {
    history_.clear();
    for (auto &item : history)
        push(std::move(item));
    sessionId_ = isValidSessionId(sessionId) ? std::move(sessionId)
                                             : std::string();
    scroll_ = kScrollToBottom;
}

void AiStreamSink::push(HistoryItem item) {
    while (history_.size() >= kMaxHistoryItems)
        history_.erase(history_.begin());
    item.content = normalizeEmptyLines(item.content);
    history_.push_back(std::move(item));
}

void AiStreamSink::scrollUp(std::size_t lines) {
    const std::size_t base = pinned() ? lastMaxScroll_ : scroll_;
    scroll_ = base > lines ? base - lines : 0;
}

void AiStreamSink::scrollDown(std::size_t lines, std::size_t maxScroll) {
    if (pinned())
        return;
    scroll_ += lines;
    if (scroll_ >= maxScroll)
        scroll_ = kScrollToBottom;
}

std::size_t AiStreamSink::resolveScroll(std::size_t maxScroll) const {
    lastMaxScroll_ = maxScroll;
    return std::min(scroll_, maxScroll);
}

} // namespace opendir

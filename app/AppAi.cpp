// AI pane: session restore and save, prompt submission and key handling.
#include "App.hpp"
#include "AppLogging.hpp"

namespace opendir {

namespace {

const char *const kAiWarning =
    "⚠ Warning: AI commands may execute real operations on your system. "
    "Please use with caution.";
const char *const kAiMissing =
    "Claude CLI not found. Run 'which claude' to verify installation.";

} // namespace

void App::openAi() {
    if (activePanel().isRemote()) {
        showMessage("AI needs a local panel");
        return;
    }
    const std::string path = activePanel().path();
    if (path != aiPath_ || ai_.history().empty()) {
        if (!aiPath_.empty() && path != aiPath_)
            saveAiSession();
        ai_ = AiStreamSink();
        aiPath_ = path;
        AiSession session;
        std::string err;
        if (aiSessions_.restoreLatest(path, session, err)) {
            ai_.restore(std::move(session.history),
                        std::move(session.session_id));
        } else {
            if (!err.empty())
                qCWarning(odAi) << "Session not restored:" << redacted(err);
            ai_.addItem(HistoryTag::System, kAiWarning);
        }
    }
    if (!aiProvider_ || !aiProvider_->available())
        ai_.addItem(HistoryTag::Error, kAiMissing);
    ai_.pinToBottom();
    screen_ = Screen::Ai;
}

void App::closeAi() {
    if (ai_.isProcessing()) {
        if (aiCancel_)
            aiCancel_->store(true);
        ai_.cancel();
    }
    saveAiSession();
    screen_ = Screen::Panels;
}

void App::submitAi(const std::string &text) {
    if (text.find_first_not_of(" \t\n") == std::string::npos)
        return;
    if (ai_.isProcessing()) {
        showMessage("Still waiting for the previous answer");
        return;
    }
    if (!aiProvider_ || !aiProvider_->available()) {
        ai_.addItem(HistoryTag::Error, kAiMissing);
        return;
    }
    ai_.addUserMessage(text);
    auto channel = makeChannel<StreamMessage>();
    aiCancel_ = makeCancelFlag();
    ai_.begin(std::move(channel.second));

    AiRequest request;
    request.prompt = buildContextPrompt(aiPath_, text);
    request.working_dir = aiPath_;
    request.session_id = ai_.sessionId();
    aiProvider_->start(request, std::move(channel.first), aiCancel_);
    aiInput_.clear();
}

void App::saveAiSession() {
    if (ai_.sessionId().empty())
        return;
    AiSession session{ai_.sessionId(), aiPath_, ai_.history()};
    std::string err;
    if (!aiSessions_.save(session, err))
        qCWarning(odAi) << "Session not saved:" << redacted(err);
}

void App::pollAi() {
    if (!ai_.isProcessing())
        return;
    ai_.poll();
    if (!ai_.isProcessing())
        saveAiSession();
}

void App::handleAiKey(const Key &key) {
    switch (key.code) {
    case Key::Code::Escape:
        if (ai_.isProcessing()) {
            if (aiCancel_)
                aiCancel_->store(true);
            ai_.cancel();
        } else {
            closeAi();
        }
        break;
    case Key::Code::Enter:
        submitAi(aiInput_);
        break;
    case Key::Code::Backspace:
        popUtf8(aiInput_);
        break;
    case Key::Code::Up:
        ai_.scrollUp(1);
        break;
    case Key::Code::Down:
        ai_.scrollDown(1);
        break;
    case Key::Code::PageUp:
        ai_.scrollUp(10);
        break;
    case Key::Code::PageDown:
        ai_.scrollDown(10);
        break;
    case Key::Code::End:
        ai_.pinToBottom();
        break;
    case Key::Code::Char:
        if (!key.ctrl && key.ch >= 0x20)
            appendUtf8(aiInput_, key.ch);
        break;
    default:
        break;
    }
}

} // namespace opendir

#include "RemoteSpinner.hpp"
#include "AppLogging.hpp"

namespace opendir {

RemoteSpinner::~RemoteSpinner() {
    cancel();
    joinWorker();
}

void RemoteSpinner::joinWorker() {
    if (worker_.joinable())
        worker_.join();
}

std::optional<SpinnerResult> RemoteSpinner::poll() {
    if (!active_)
        return std::nullopt;
    SpinnerResult result;
    switch (active_->rx.tryRecv(result)) {
    case RecvStatus::Empty:
        return std::nullopt;
    case RecvStatus::Ok:
        qCDebug(odRemote) << "Spinner task finished after"
                          << elapsedSeconds() << "s";
        active_.reset();
        joinWorker();
        return result;
    case RecvStatus::Disconnected:
        break;
    }
    qCWarning(odRemote) << "Spinner worker exited without a result";
    active_.reset();
    joinWorker();
    return SpinnerResult::localOp(false, "Background task failed", false);
}

void RemoteSpinner::cancel() {
    if (active_ && active_->cancel)
        active_->cancel->store(true);
}

const std::string &RemoteSpinner::message() const {
    static const std::string empty;
    return active_ ? active_->message : empty;
}

double RemoteSpinner::elapsedSeconds() const {
    if (!active_)
        return 0.0;
    return std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                         active_->started)
        .count();
}

char RemoteSpinner::frame() const {
    static const char kFrames[] = {'|', '/', '-', '\\'};
    const auto tick = static_cast<std::size_t>(elapsedSeconds() * 8.0);
    return kFrames[tick % 4];
}

} // namespace opendir

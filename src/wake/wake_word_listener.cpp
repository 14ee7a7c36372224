#include "wake/wake_word_listener.h"
#include "logger.h"

namespace taco {
namespace wake {

WakeWordListener::WakeWordListener(audio::AudioDevice& device,
                                   std::unique_ptr<IWakeWordDetector> detector)
    : device_(device), detector_(std::move(detector)) {}

WakeWordListener::~WakeWordListener() {
    stop();
}

Result<void> WakeWordListener::start() {
    if (listening_) return Result<void>();

    auto lease = device_.acquire("wake_listener");
    if (lease.is_error()) {
        return lease.error();
    }

    auto input = lease.value().open_input(detector_->sample_rate(), detector_->frame_length());
    if (input.is_error()) {
        return input.error();
    }

    lease_ = std::move(lease.value());
    input_ = std::move(input.value());
    listening_ = true;
    LOG_EVENT("WAKE_WORD_START", "Started continuous wake word detection");
    return Result<void>();
}

std::optional<std::string> WakeWordListener::poll() {
    if (!listening_) {
        auto started = start();
        if (started.is_error()) {
            LOG_EVENT("WAKE_WORD_ERROR", started.error().message);
            return std::nullopt;
        }
    }

    if (!input_->read_frame(frame_)) {
        LOG_EVENT("WAKE_WORD_ERROR", "Microphone read failed; reopening on next poll");
        stop();
        return std::nullopt;
    }

    auto result = detector_->process(frame_);
    if (result.is_error()) {
        LOG_EVENT("WAKE_WORD_ERROR", "Porcupine detection failed: " + result.error().message);
        return std::nullopt;
    }

    int index = result.value();
    if (index < 0) {
        return std::nullopt;
    }

    std::string keyword = detector_->keyword_name(index);
    LOG_EVENT("WAKE_WORD_DETECTED", "Porcupine detected: '" + keyword + "'");
    stop();
    return keyword;
}

void WakeWordListener::stop() {
    if (!listening_) return;
    listening_ = false;
    if (input_) {
        input_->close();
        input_.reset();
    }
    lease_.release();
    LOG_EVENT("WAKE_WORD_STOP", "Stopped wake word detection");
}

} // namespace wake
} // namespace taco

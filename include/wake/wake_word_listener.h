#pragma once

#include "audio/audio_device.h"
#include "wake/wake_word_detector.h"
#include <memory>
#include <optional>
#include <string>

namespace taco {
namespace wake {

/**
 * @brief Passive keyword listening on the shared audio device
 *
 * While listening the listener holds the device lease; a detection stops
 * listening (and releases the device) before poll() returns, so the caller
 * can immediately hand the device to the next consumer.
 *
 * Driven from a single thread (the orchestrator loop).
 */
class WakeWordListener {
public:
    WakeWordListener(audio::AudioDevice& device, std::unique_ptr<IWakeWordDetector> detector);
    ~WakeWordListener();

    WakeWordListener(const WakeWordListener&) = delete;
    WakeWordListener& operator=(const WakeWordListener&) = delete;

    /**
     * @brief Acquire the device and open the microphone at the detector's format
     */
    Result<void> start();

    /**
     * @brief Read and score one frame, starting the listener if needed
     * @return Detected keyword name, or nullopt (no keyword, or a logged failure)
     */
    std::optional<std::string> poll();

    /**
     * @brief Close the microphone and release the device (idempotent)
     */
    void stop();

    bool is_listening() const { return listening_; }

private:
    audio::AudioDevice& device_;
    std::unique_ptr<IWakeWordDetector> detector_;
    audio::AudioDevice::Lease lease_;
    audio::AudioInputPtr input_;
    AudioFrame frame_;
    bool listening_ = false;
};

} // namespace wake
} // namespace taco

#pragma once

/**
 * @file audio_interface.h
 * @brief Audio stream interfaces
 *
 * Components never talk to PortAudio directly: they open streams through an
 * IAudioBackend so tests can substitute scripted microphones and recording
 * speakers.
 */

#include "common.h"
#include "errors.h"
#include <memory>

namespace taco {
namespace audio {

/**
 * @brief Blocking microphone stream
 *
 * read_frame() and close() may be called from different threads; close()
 * makes any subsequent read_frame() return false.
 */
class IAudioInput {
public:
    virtual ~IAudioInput() = default;

    /**
     * @brief Read one frame (blocking)
     * @param frame Resized to frame_samples()
     * @return False when the stream is closed or failed
     */
    virtual bool read_frame(AudioFrame& frame) = 0;

    virtual void close() = 0;

    virtual int sample_rate() const = 0;
    virtual int frame_samples() const = 0;
};

/**
 * @brief Blocking speaker stream (interleaved PCM16)
 */
class IAudioOutput {
public:
    virtual ~IAudioOutput() = default;

    /**
     * @brief Write interleaved samples; blocks until accepted by the device
     * @return False when the stream is closed or failed
     */
    virtual bool write(const Sample* samples, size_t sample_count) = 0;

    bool write(const AudioBuffer& buffer) {
        return write(buffer.data(), buffer.size());
    }

    virtual void close() = 0;

    virtual int sample_rate() const = 0;
    virtual int channels() const = 0;
};

using AudioInputPtr = std::unique_ptr<IAudioInput>;
using AudioOutputPtr = std::unique_ptr<IAudioOutput>;

/**
 * @brief Stream factory for the physical device
 */
class IAudioBackend {
public:
    virtual ~IAudioBackend() = default;

    virtual Result<AudioInputPtr> open_input(int sample_rate, int frame_samples) = 0;
    virtual Result<AudioOutputPtr> open_output(int sample_rate, int channels) = 0;
};

} // namespace audio
} // namespace taco

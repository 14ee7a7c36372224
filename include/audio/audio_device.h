#pragma once

#include "audio/audio_interface.h"
#include <memory>
#include <mutex>
#include <string>

namespace taco {
namespace audio {

/**
 * @brief Exclusive arbiter of the microphone/speaker pair
 *
 * Exactly one consumer (wake listener, acknowledgment cue, dialogue session)
 * holds the device at a time. acquire() never blocks: a busy device is an
 * error the caller reports. Streams for leased consumers are opened through
 * the lease so they cannot be created without holding the device.
 *
 * Music playback is not a lease holder; it opens its own output via
 * open_music_output() and is paused around conversations instead.
 *
 * The device must outlive every Lease it hands out.
 */
class AudioDevice {
public:
    /**
     * @brief Move-only handle proving ownership; releases on destruction
     */
    class Lease {
    public:
        Lease() = default;
        ~Lease();

        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        bool valid() const { return device_ != nullptr; }
        const std::string& owner() const { return owner_; }

        Result<AudioInputPtr> open_input(int sample_rate, int frame_samples) const;
        Result<AudioOutputPtr> open_output(int sample_rate, int channels) const;

        /**
         * @brief Give the device back early (idempotent)
         */
        void release();

    private:
        friend class AudioDevice;
        Lease(AudioDevice* device, std::string owner);

        AudioDevice* device_ = nullptr;
        std::string owner_;
    };

    explicit AudioDevice(std::shared_ptr<IAudioBackend> backend);
    ~AudioDevice();

    AudioDevice(const AudioDevice&) = delete;
    AudioDevice& operator=(const AudioDevice&) = delete;

    /**
     * @brief Take exclusive ownership
     * @param owner Name used in logs and in the busy error
     * @return Lease, or DeviceError naming the current holder
     */
    Result<Lease> acquire(const std::string& owner);

    bool is_held() const;

    /**
     * @brief Current holder's name (empty when free)
     */
    std::string holder() const;

    Result<AudioOutputPtr> open_music_output(int sample_rate, int channels);

private:
    void release(const std::string& owner);

    std::shared_ptr<IAudioBackend> backend_;
    mutable std::mutex mutex_;
    bool held_ = false;
    std::string holder_;
};

} // namespace audio
} // namespace taco

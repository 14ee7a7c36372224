#include "audio/audio_device.h"
#include "logger.h"

namespace taco {
namespace audio {

AudioDevice::Lease::Lease(AudioDevice* device, std::string owner)
    : device_(device), owner_(std::move(owner)) {}

AudioDevice::Lease::~Lease() {
    release();
}

AudioDevice::Lease::Lease(Lease&& other) noexcept
    : device_(other.device_), owner_(std::move(other.owner_)) {
    other.device_ = nullptr;
}

AudioDevice::Lease& AudioDevice::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        release();
        device_ = other.device_;
        owner_ = std::move(other.owner_);
        other.device_ = nullptr;
    }
    return *this;
}

Result<AudioInputPtr> AudioDevice::Lease::open_input(int sample_rate, int frame_samples) const {
    if (!device_) {
        return make_device_error("Cannot open input without holding the audio device");
    }
    return device_->backend_->open_input(sample_rate, frame_samples);
}

Result<AudioOutputPtr> AudioDevice::Lease::open_output(int sample_rate, int channels) const {
    if (!device_) {
        return make_device_error("Cannot open output without holding the audio device");
    }
    return device_->backend_->open_output(sample_rate, channels);
}

void AudioDevice::Lease::release() {
    if (device_) {
        device_->release(owner_);
        device_ = nullptr;
    }
}

AudioDevice::AudioDevice(std::shared_ptr<IAudioBackend> backend)
    : backend_(std::move(backend)) {}

AudioDevice::~AudioDevice() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (held_) {
        Logger::warn("Audio device destroyed while held by " + holder_);
    }
}

Result<AudioDevice::Lease> AudioDevice::acquire(const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (held_) {
        return make_device_error("Audio device busy (held by " + holder_ + ")");
    }
    held_ = true;
    holder_ = owner;
    LOG_AUDIO("Device acquired by " + owner);
    return Lease(this, owner);
}

bool AudioDevice::is_held() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_;
}

std::string AudioDevice::holder() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return holder_;
}

Result<AudioOutputPtr> AudioDevice::open_music_output(int sample_rate, int channels) {
    return backend_->open_output(sample_rate, channels);
}

void AudioDevice::release(const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (held_ && holder_ == owner) {
        held_ = false;
        holder_.clear();
        LOG_AUDIO("Device released by " + owner);
    }
}

} // namespace audio
} // namespace taco

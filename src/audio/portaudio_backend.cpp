#include "audio/portaudio_backend.h"
#include "logger.h"
#include <portaudio.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <mutex>
#include <sstream>

namespace taco {
namespace audio {

namespace {

class PortAudioInput : public IAudioInput {
public:
    PortAudioInput(PaStream* stream, int sample_rate, int frame_samples)
        : stream_(stream), sample_rate_(sample_rate), frame_samples_(frame_samples) {}

    ~PortAudioInput() override { close(); }

    bool read_frame(AudioFrame& frame) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stream_) return false;

        frame.resize(frame_samples_);
        PaError err = Pa_ReadStream(stream_, frame.data(), frame_samples_);
        if (err == paInputOverflowed) {
            LOG_AUDIO("Input overflow");
        } else if (err != paNoError) {
            Logger::warn("Input read failed: " + std::string(Pa_GetErrorText(err)));
            return false;
        }
        return true;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stream_) {
            Pa_StopStream(stream_);
            Pa_CloseStream(stream_);
            stream_ = nullptr;
            LOG_AUDIO("Input stream closed");
        }
    }

    int sample_rate() const override { return sample_rate_; }
    int frame_samples() const override { return frame_samples_; }

private:
    std::mutex mutex_;
    PaStream* stream_;
    int sample_rate_;
    int frame_samples_;
};

class PortAudioOutput : public IAudioOutput {
public:
    PortAudioOutput(PaStream* stream, int sample_rate, int channels)
        : stream_(stream), sample_rate_(sample_rate), channels_(channels) {}

    ~PortAudioOutput() override { close(); }

    bool write(const Sample* samples, size_t sample_count) override {
        // Written in slices so close() never waits behind a long buffer
        size_t total_frames = sample_count / channels_;
        size_t offset = 0;
        while (offset < total_frames) {
            size_t n = std::min<size_t>(WRITE_SLICE_FRAMES, total_frames - offset);
            std::lock_guard<std::mutex> lock(mutex_);
            if (!stream_) return false;
            PaError err = Pa_WriteStream(stream_, samples + offset * channels_, n);
            if (err == paOutputUnderflowed) {
                LOG_AUDIO("Output underflow");
            } else if (err != paNoError) {
                Logger::warn("Output write failed: " + std::string(Pa_GetErrorText(err)));
                return false;
            }
            offset += n;
        }
        return true;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stream_) {
            Pa_StopStream(stream_);
            Pa_CloseStream(stream_);
            stream_ = nullptr;
            LOG_AUDIO("Output stream closed");
        }
    }

    int sample_rate() const override { return sample_rate_; }
    int channels() const override { return channels_; }

private:
    static constexpr size_t WRITE_SLICE_FRAMES = 1024;

    std::mutex mutex_;
    PaStream* stream_;
    int sample_rate_;
    int channels_;
};

std::string pa_error(const std::string& what, PaError err) {
    return what + ": " + std::string(Pa_GetErrorText(err));
}

} // namespace

PortAudioBackend::PortAudioBackend(const std::string& input_device, const std::string& output_device)
    : input_name_(input_device), output_name_(output_device) {}

PortAudioBackend::~PortAudioBackend() {
    shutdown();
}

Result<void> PortAudioBackend::initialize() {
    if (initialized_) return Result<void>();

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        return make_device_error(pa_error("PortAudio init error", err));
    }
    initialized_ = true;

    input_idx_ = find_device(input_name_, true);
    if (input_idx_ < 0) {
        shutdown();
        return make_device_error("Input device not found: " + input_name_);
    }
    output_idx_ = find_device(output_name_, false);
    if (output_idx_ < 0) {
        shutdown();
        return make_device_error("Output device not found: " + output_name_);
    }

    std::ostringstream oss;
    oss << "Using input device: [" << input_idx_ << "] " << Pa_GetDeviceInfo(input_idx_)->name
        << ", output device: [" << output_idx_ << "] " << Pa_GetDeviceInfo(output_idx_)->name;
    Logger::info(oss.str());
    return Result<void>();
}

void PortAudioBackend::shutdown() {
    if (initialized_) {
        Pa_Terminate();
        initialized_ = false;
    }
}

Result<AudioInputPtr> PortAudioBackend::open_input(int sample_rate, int frame_samples) {
    if (!initialized_) {
        return make_device_error("Audio backend not initialized");
    }

    const PaDeviceInfo* info = Pa_GetDeviceInfo(input_idx_);
    PaStreamParameters params;
    params.device = input_idx_;
    params.channelCount = 1;
    params.sampleFormat = paInt16;
    params.suggestedLatency = info ? info->defaultLowInputLatency : 0.05;
    params.hostApiSpecificStreamInfo = nullptr;

    PaStream* stream = nullptr;
    PaError err = Pa_OpenStream(&stream, &params, nullptr, sample_rate,
                                frame_samples, paClipOff, nullptr, nullptr);
    if (err != paNoError) {
        return make_device_error(pa_error("Failed to open input stream", err));
    }
    err = Pa_StartStream(stream);
    if (err != paNoError) {
        Pa_CloseStream(stream);
        return make_device_error(pa_error("Failed to start input stream", err));
    }

    LOG_AUDIO("Input stream opened at " + std::to_string(sample_rate) + " Hz, " +
              std::to_string(frame_samples) + " samples/frame");
    return AudioInputPtr(new PortAudioInput(stream, sample_rate, frame_samples));
}

Result<AudioOutputPtr> PortAudioBackend::open_output(int sample_rate, int channels) {
    if (!initialized_) {
        return make_device_error("Audio backend not initialized");
    }

    const PaDeviceInfo* info = Pa_GetDeviceInfo(output_idx_);
    PaStreamParameters params;
    params.device = output_idx_;
    params.channelCount = channels;
    params.sampleFormat = paInt16;
    params.suggestedLatency = info ? info->defaultHighOutputLatency : 0.1;
    params.hostApiSpecificStreamInfo = nullptr;

    PaStream* stream = nullptr;
    PaError err = Pa_OpenStream(&stream, nullptr, &params, sample_rate,
                                paFramesPerBufferUnspecified, paClipOff, nullptr, nullptr);
    if (err != paNoError) {
        return make_device_error(pa_error("Failed to open output stream", err));
    }
    err = Pa_StartStream(stream);
    if (err != paNoError) {
        Pa_CloseStream(stream);
        return make_device_error(pa_error("Failed to start output stream", err));
    }

    LOG_AUDIO("Output stream opened at " + std::to_string(sample_rate) + " Hz, " +
              std::to_string(channels) + " ch");
    return AudioOutputPtr(new PortAudioOutput(stream, sample_rate, channels));
}

void PortAudioBackend::list_devices() {
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        Logger::error(pa_error("PortAudio init error", err));
        return;
    }

    int num_devices = Pa_GetDeviceCount();
    Logger::info("Available audio devices:");
    for (int i = 0; i < num_devices; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info) continue;
        std::ostringstream oss;
        oss << "  [" << i << "] " << info->name;
        if (info->maxInputChannels > 0) oss << " (IN:" << info->maxInputChannels << ")";
        if (info->maxOutputChannels > 0) oss << " (OUT:" << info->maxOutputChannels << ")";
        if (info->maxInputChannels == 0 && info->maxOutputChannels == 0) oss << " (no I/O)";
        Logger::info(oss.str());
    }

    Pa_Terminate();
}

int PortAudioBackend::find_device(const std::string& name, bool is_input) {
    int num_devices = Pa_GetDeviceCount();
    auto has_direction = [is_input](const PaDeviceInfo* info) {
        return info && (is_input ? info->maxInputChannels > 0 : info->maxOutputChannels > 0);
    };

    if (name == "default" || name.empty()) {
        int default_idx = is_input ? Pa_GetDefaultInputDevice() : Pa_GetDefaultOutputDevice();
        return default_idx == paNoDevice ? -1 : default_idx;
    }

    // Numeric device index
    if (std::all_of(name.begin(), name.end(), ::isdigit)) {
        try {
            int device_idx = std::stoi(name);
            if (device_idx < num_devices && has_direction(Pa_GetDeviceInfo(device_idx))) {
                return device_idx;
            }
        } catch (const std::out_of_range&) {
            Logger::warn("Device index out of range: " + name);
        }
        return -1;
    }

    for (int i = 0; i < num_devices; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (has_direction(info) && name == info->name) {
            return i;
        }
    }
    return -1;
}

} // namespace audio
} // namespace taco

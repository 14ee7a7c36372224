#pragma once

#include "audio/audio_interface.h"
#include <string>

namespace taco {
namespace audio {

/**
 * @brief PortAudio implementation of IAudioBackend
 *
 * Opens blocking-mode streams (Pa_ReadStream / Pa_WriteStream) on the
 * configured devices. Devices are selected by "default", numeric index or
 * exact name.
 *
 * Thread Safety:
 * - Each stream serializes read/write against close() with its own mutex,
 *   so a session's stop() may close streams its loops are using.
 */
class PortAudioBackend : public IAudioBackend {
public:
    PortAudioBackend(const std::string& input_device, const std::string& output_device);
    ~PortAudioBackend() override;

    PortAudioBackend(const PortAudioBackend&) = delete;
    PortAudioBackend& operator=(const PortAudioBackend&) = delete;

    /**
     * @brief Initialize PortAudio and resolve both devices
     */
    Result<void> initialize();

    /**
     * @brief Terminate PortAudio (all streams must be closed first)
     */
    void shutdown();

    Result<AudioInputPtr> open_input(int sample_rate, int frame_samples) override;
    Result<AudioOutputPtr> open_output(int sample_rate, int channels) override;

    /**
     * @brief List all available audio devices to the log
     */
    static void list_devices();

private:
    static int find_device(const std::string& name, bool is_input);

    std::string input_name_;
    std::string output_name_;
    int input_idx_ = -1;
    int output_idx_ = -1;
    bool initialized_ = false;
};

} // namespace audio
} // namespace taco

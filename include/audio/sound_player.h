#pragma once

#include "audio/audio_device.h"
#include <string>

namespace taco {
namespace audio {

/**
 * @brief Decoded PCM16 WAV file
 */
struct WavData {
    int sample_rate = 0;
    int channels = 0;
    AudioBuffer samples;  ///< Interleaved
};

/**
 * @brief Plays short WAV cues (acknowledgment, transition) on the shared device
 *
 * Each cue takes the device lease for its duration, so a cue can never
 * overlap the wake listener or a dialogue session.
 */
class SoundPlayer {
public:
    explicit SoundPlayer(AudioDevice& device);

    /**
     * @brief Play a cue to completion (blocking)
     * @param path WAV file (PCM16)
     * @param cue_name Used as lease owner and in logs
     * @return False when the file is missing/unreadable or the device is busy;
     *         never fatal to the caller
     */
    bool play(const std::string& path, const std::string& cue_name);

    /**
     * @brief Read a PCM16 WAV file, walking RIFF chunks to find "fmt " and "data"
     */
    static Result<WavData> read_wav(const std::string& path);

private:
    AudioDevice& device_;
};

} // namespace audio
} // namespace taco

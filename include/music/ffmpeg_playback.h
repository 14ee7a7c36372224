#pragma once

#include "audio/audio_device.h"
#include "music/music_backends.h"
#include <string>

namespace taco {
namespace music {

/**
 * @brief Decodes a cached file with ffmpeg (s16le, 44.1 kHz stereo) and
 * streams it to a dedicated output stream, honoring PlaybackControl between
 * chunks.
 */
class FfmpegPlaybackBackend : public IPlaybackBackend {
public:
    FfmpegPlaybackBackend(const std::string& ffmpeg_path, audio::AudioDevice& device);

    Result<void> play(const std::string& file_path, PlaybackControl& control) override;

private:
    std::string ffmpeg_path_;
    audio::AudioDevice& device_;
};

} // namespace music
} // namespace taco

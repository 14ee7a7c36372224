#include "music/ffmpeg_playback.h"
#include "logger.h"
#include "process.h"
#include "utils.h"
#include <vector>

namespace taco {
namespace music {

FfmpegPlaybackBackend::FfmpegPlaybackBackend(const std::string& ffmpeg_path, audio::AudioDevice& device)
    : ffmpeg_path_(ffmpeg_path), device_(device) {}

Result<void> FfmpegPlaybackBackend::play(const std::string& file_path, PlaybackControl& control) {
    auto output = device_.open_music_output(MUSIC_SAMPLE_RATE, MUSIC_CHANNELS);
    if (output.is_error()) {
        return output.error();
    }
    audio::AudioOutputPtr speaker = std::move(output.value());

    std::string cmd = utils::join_command({
        ffmpeg_path_, "-loglevel", "error", "-i", file_path,
        "-f", "s16le", "-acodec", "pcm_s16le",
        "-ac", std::to_string(MUSIC_CHANNELS), "-ar", std::to_string(MUSIC_SAMPLE_RATE), "-"
    }) + " 2>/dev/null";

    PipeReader decoder;
    if (!decoder.open(cmd)) {
        speaker->close();
        return make_process_error("Failed to start ffmpeg decoder for " + file_path);
    }

    std::vector<Sample> chunk(static_cast<size_t>(MUSIC_CHUNK_FRAMES) * MUSIC_CHANNELS);
    bool write_failed = false;
    while (control.checkpoint()) {
        size_t bytes = decoder.read(chunk.data(), chunk.size() * sizeof(Sample));
        size_t samples = bytes / sizeof(Sample);
        samples -= samples % MUSIC_CHANNELS;
        if (samples == 0) break;
        if (!speaker->write(chunk.data(), samples)) {
            write_failed = true;
            break;
        }
    }

    bool stopped = control.stop_requested();
    int code = decoder.close();
    speaker->close();

    if (write_failed) {
        return make_device_error("Speaker write failed during music playback");
    }
    // A stopped decoder dies of SIGPIPE; only a natural end reports its status
    if (!stopped && code != 0) {
        return make_process_error("ffmpeg decoder exited with code " + std::to_string(code));
    }
    return Result<void>();
}

} // namespace music
} // namespace taco

#include "audio/sound_player.h"
#include "logger.h"
#include <cstring>
#include <fstream>
#include <sstream>

namespace taco {
namespace audio {

namespace {

uint16_t read_u16(const char* p) {
    return static_cast<uint8_t>(p[0]) |
           (static_cast<uint8_t>(p[1]) << 8);
}

uint32_t read_u32(const char* p) {
    return static_cast<uint32_t>(static_cast<uint8_t>(p[0])) |
           (static_cast<uint32_t>(static_cast<uint8_t>(p[1])) << 8) |
           (static_cast<uint32_t>(static_cast<uint8_t>(p[2])) << 16) |
           (static_cast<uint32_t>(static_cast<uint8_t>(p[3])) << 24);
}

} // namespace

SoundPlayer::SoundPlayer(AudioDevice& device) : device_(device) {}

Result<WavData> SoundPlayer::read_wav(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return make_io_error("Failed to open WAV file: " + path);
    }

    char riff[12];
    file.read(riff, sizeof(riff));
    if (file.gcount() < 12 || std::memcmp(riff, "RIFF", 4) != 0 || std::memcmp(riff + 8, "WAVE", 4) != 0) {
        return make_io_error("Not a RIFF/WAVE file: " + path);
    }

    WavData wav;
    int bits_per_sample = 0;
    bool have_fmt = false;

    char chunk_header[8];
    while (file.read(chunk_header, sizeof(chunk_header))) {
        uint32_t chunk_size = read_u32(chunk_header + 4);

        if (std::memcmp(chunk_header, "fmt ", 4) == 0) {
            char fmt[16];
            if (chunk_size < sizeof(fmt) || !file.read(fmt, sizeof(fmt))) {
                return make_io_error("Truncated fmt chunk: " + path);
            }
            uint16_t format = read_u16(fmt);
            wav.channels = read_u16(fmt + 2);
            wav.sample_rate = static_cast<int>(read_u32(fmt + 4));
            bits_per_sample = read_u16(fmt + 14);
            if (format != 1 || bits_per_sample != 16) {
                return make_io_error("Only PCM16 WAV is supported: " + path);
            }
            have_fmt = true;
            file.seekg(chunk_size - sizeof(fmt) + (chunk_size & 1), std::ios::cur);
        } else if (std::memcmp(chunk_header, "data", 4) == 0) {
            if (!have_fmt) {
                return make_io_error("WAV data chunk before fmt chunk: " + path);
            }
            wav.samples.resize(chunk_size / sizeof(Sample));
            file.read(reinterpret_cast<char*>(wav.samples.data()),
                      static_cast<std::streamsize>(wav.samples.size() * sizeof(Sample)));
            wav.samples.resize(static_cast<size_t>(file.gcount()) / sizeof(Sample));

            std::ostringstream info;
            info << "WAV: " << wav.sample_rate << "Hz, " << wav.channels << "ch, "
                 << wav.samples.size() << " samples";
            LOG_AUDIO(info.str());
            return wav;
        } else {
            file.seekg(chunk_size + (chunk_size & 1), std::ios::cur);
        }
    }

    return make_io_error("WAV file has no data chunk: " + path);
}

bool SoundPlayer::play(const std::string& path, const std::string& cue_name) {
    auto wav = read_wav(path);
    if (wav.is_error()) {
        Logger::warn("Cue '" + cue_name + "' skipped: " + wav.error().message);
        return false;
    }
    const WavData& data = wav.value();
    if (data.samples.empty() || data.channels <= 0) {
        Logger::warn("Cue '" + cue_name + "' is empty: " + path);
        return false;
    }

    auto lease = device_.acquire(cue_name);
    if (lease.is_error()) {
        Logger::warn("Cue '" + cue_name + "' skipped: " + lease.error().message);
        return false;
    }

    auto output = lease.value().open_output(data.sample_rate, data.channels);
    if (output.is_error()) {
        Logger::warn("Cue '" + cue_name + "' skipped: " + output.error().message);
        return false;
    }

    bool ok = output.value()->write(data.samples);
    output.value()->close();
    LOG_AUDIO("Played cue '" + cue_name + "'");
    return ok;
}

} // namespace audio
} // namespace taco

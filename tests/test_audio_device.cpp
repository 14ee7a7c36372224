/**
 * Audio device arbitration and cue playback.
 * Asserts:
 * - Only one lease at a time; the busy error names the holder.
 * - Leases release on destruction, on release(), and transfer on move.
 * - Cues take the device for their duration and are skipped (not fatal)
 *   when the file is missing or the device is busy.
 *
 * Run from build dir: ./test_audio_device
 */

#include "audio/audio_device.h"
#include "audio/sound_player.h"
#include "test_fakes.h"
#include <cstdint>
#include <cstdio>
#include <fstream>

using namespace taco;
using namespace taco::audio;

static void put_u16(std::ofstream& out, uint16_t v) {
    out.put(static_cast<char>(v & 0xff));
    out.put(static_cast<char>((v >> 8) & 0xff));
}

static void put_u32(std::ofstream& out, uint32_t v) {
    put_u16(out, static_cast<uint16_t>(v & 0xffff));
    put_u16(out, static_cast<uint16_t>(v >> 16));
}

// PCM16 WAV with an extra LIST chunk before "data"
static void write_wav(const std::string& path, int sample_rate, int channels, size_t samples) {
    std::ofstream out(path, std::ios::binary);
    const uint32_t data_bytes = static_cast<uint32_t>(samples * 2);
    const char list_payload[] = "INFOtest";
    const uint32_t list_bytes = sizeof(list_payload) - 1;
    out.write("RIFF", 4);
    put_u32(out, 4 + (8 + 16) + (8 + list_bytes) + (8 + data_bytes));
    out.write("WAVE", 4);
    out.write("fmt ", 4);
    put_u32(out, 16);
    put_u16(out, 1);
    put_u16(out, static_cast<uint16_t>(channels));
    put_u32(out, static_cast<uint32_t>(sample_rate));
    put_u32(out, static_cast<uint32_t>(sample_rate * channels * 2));
    put_u16(out, static_cast<uint16_t>(channels * 2));
    put_u16(out, 16);
    out.write("LIST", 4);
    put_u32(out, list_bytes);
    out.write(list_payload, list_bytes);
    out.write("data", 4);
    put_u32(out, data_bytes);
    for (size_t i = 0; i < samples; ++i) {
        put_u16(out, static_cast<uint16_t>(i & 0x7fff));
    }
}

int main() {
    auto backend = std::make_shared<test::FakeAudioBackend>();
    AudioDevice device(backend);

    // --- exclusive acquisition ---
    ASSERT(!device.is_held());
    {
        auto first = device.acquire("wake_listener");
        ASSERT(first.is_ok());
        ASSERT(device.is_held());
        ASSERT(device.holder() == "wake_listener");

        auto second = device.acquire("dialogue_session");
        ASSERT(second.is_error());
        ASSERT(second.is_error() && second.error().type == ErrorType::DeviceError);
        ASSERT(second.is_error() && second.error().message.find("wake_listener") != std::string::npos);
    }
    ASSERT(!device.is_held());  // released by the Lease destructor

    // --- explicit release is idempotent ---
    {
        auto lease = device.acquire("cue");
        ASSERT(lease.is_ok());
        lease.value().release();
        ASSERT(!device.is_held());
        lease.value().release();
        ASSERT(!lease.value().valid());

        auto again = device.acquire("dialogue_session");
        ASSERT(again.is_ok());
        // The stale lease must not free the new holder
        lease.value().release();
        ASSERT(device.holder() == "dialogue_session");
    }
    ASSERT(!device.is_held());

    // --- move transfers ownership ---
    {
        AudioDevice::Lease outer;
        ASSERT(!outer.valid());
        {
            auto lease = device.acquire("dialogue_session");
            ASSERT(lease.is_ok());
            outer = std::move(lease.value());
        }
        ASSERT(outer.valid());
        ASSERT(device.is_held());
        ASSERT(outer.owner() == "dialogue_session");

        // --- streams only through a valid lease ---
        auto input = outer.open_input(24000, 1024);
        ASSERT(input.is_ok());
        ASSERT(input.is_ok() && input.value()->frame_samples() == 1024);
        AudioFrame frame;
        ASSERT(input.is_ok() && input.value()->read_frame(frame));
        ASSERT(frame.size() == 1024);
        if (input.is_ok()) {
            input.value()->close();
            ASSERT(!input.value()->read_frame(frame));
        }

        AudioDevice::Lease empty;
        ASSERT(empty.open_output(24000, 1).is_error());

        // Music output is not a lease holder
        auto music_out = device.open_music_output(44100, 2);
        ASSERT(music_out.is_ok());
        ASSERT(music_out.is_ok() && music_out.value()->channels() == 2);
    }
    ASSERT(!device.is_held());

    // --- backend failures surface as errors ---
    backend->state->fail_open_input = true;
    {
        auto lease = device.acquire("wake_listener");
        ASSERT(lease.is_ok());
        ASSERT(lease.value().open_input(16000, 512).is_error());
    }
    backend->state->fail_open_input = false;

    // --- WAV parsing ---
    std::string dir = test::make_temp_dir();
    std::string wav_path = dir + "/hi_there.wav";
    write_wav(wav_path, 22050, 1, 2205);

    auto wav = SoundPlayer::read_wav(wav_path);
    ASSERT(wav.is_ok());
    if (wav.is_ok()) {
        ASSERT(wav.value().sample_rate == 22050);
        ASSERT(wav.value().channels == 1);
        ASSERT(wav.value().samples.size() == 2205);
        ASSERT(wav.value().samples[10] == 10);
    }
    ASSERT(SoundPlayer::read_wav(dir + "/missing.wav").is_error());
    {
        std::ofstream junk(dir + "/junk.wav", std::ios::binary);
        junk << "not a wave file at all";
    }
    ASSERT(SoundPlayer::read_wav(dir + "/junk.wav").is_error());

    // --- cue playback ---
    SoundPlayer player(device);
    size_t before = backend->state->samples_written;
    ASSERT(player.play(wav_path, "acknowledgment"));
    ASSERT(backend->state->samples_written == before + 2205);
    ASSERT(!device.is_held());

    ASSERT(!player.play(dir + "/missing.wav", "acknowledgment"));

    {
        auto held = device.acquire("dialogue_session");
        ASSERT(held.is_ok());
        ASSERT(!player.play(wav_path, "transition"));
        ASSERT(device.holder() == "dialogue_session");
    }

    std::remove(wav_path.c_str());
    std::remove((dir + "/junk.wav").c_str());
    std::remove(dir.c_str());

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All audio device tests passed.\n";
    return 0;
}

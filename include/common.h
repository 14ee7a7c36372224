#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>

namespace taco {

// Audio types
using Sample = int16_t;
using AudioFrame = std::vector<Sample>;
using AudioBuffer = std::vector<Sample>;

// Timing
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

inline int64_t ms_since(TimePoint start) {
    return std::chrono::duration_cast<Duration>(Clock::now() - start).count();
}

inline int64_t ms_between(TimePoint from, TimePoint to) {
    return std::chrono::duration_cast<Duration>(to - from).count();
}

// Dialogue transport audio format (pcm16 mono)
constexpr int DIALOGUE_SAMPLE_RATE = 24000;
constexpr int DIALOGUE_FRAME_SAMPLES = 1024;  // ~43ms @ 24kHz
constexpr int DIALOGUE_CHANNELS = 1;

// Music playback format produced by the decoder
constexpr int MUSIC_SAMPLE_RATE = 44100;
constexpr int MUSIC_CHANNELS = 2;
constexpr int MUSIC_CHUNK_FRAMES = 1024;

// Uplink activity detection: RMS above this (int16 scale) counts as user activity
constexpr float ACTIVITY_RMS_THRESHOLD = 100.0f;

// Session timing defaults
constexpr int DEFAULT_SILENCE_TIMEOUT_MS = 5000;
constexpr int DEFAULT_SILENCE_GRACE_MS = 3000;
constexpr int DEFAULT_WATCHDOG_TICK_MS = 250;
constexpr int DEFAULT_CONVERSATION_TIMEOUT_MS = 30000;
constexpr int DOWNLINK_POLL_MS = 100;

// Music defaults
constexpr int DEFAULT_SEARCH_LIMIT = 5;
constexpr int PLAYBACK_JOIN_TIMEOUT_MS = 2000;

// Pause after a cue so the speaker drains before the next consumer opens the device
constexpr int POST_CUE_DELAY_MS = 300;

/// Root-mean-square level of a PCM16 frame, in raw sample units.
float frame_rms(const AudioFrame& frame);

} // namespace taco

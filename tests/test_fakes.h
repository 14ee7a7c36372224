#pragma once

/**
 * Test doubles for the audio device, dialogue transport, music tools and
 * wake-word detector, plus small helpers shared by the test executables.
 */

#include "audio/audio_interface.h"
#include "dialogue/realtime_protocol.h"
#include "dialogue/realtime_transport.h"
#include "logger.h"
#include "music/music_backends.h"
#include "wake/wake_word_detector.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <deque>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace taco {
namespace test {

inline bool wait_until(const std::function<bool()>& pred, int timeout_ms = 2000) {
    auto deadline = Clock::now() + Duration(timeout_ms);
    while (Clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

inline std::string make_temp_dir() {
    char tmpl[] = "/tmp/taco_test_XXXXXX";
    char* dir = mkdtemp(tmpl);
    return dir ? std::string(dir) : std::string("/tmp");
}

/// Collects log entries through Logger::set_listener for the lifetime of the object
class LogCapture {
public:
    LogCapture() {
        Logger::set_listener([this](LogLevel, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_.push_back(message);
        });
    }

    ~LogCapture() {
        Logger::set_listener(nullptr);
    }

    size_t count(const std::string& needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& e : entries_) {
            if (e.find(needle) != std::string::npos) n++;
        }
        return n;
    }

    bool contains(const std::string& needle) const {
        return count(needle) > 0;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> entries_;
};

// ---------------------------------------------------------------------------
// Audio
// ---------------------------------------------------------------------------

/// Shared between a FakeAudioBackend and the streams it opens
struct FakeAudioState {
    std::atomic<int> input_amplitude{0};   ///< Peak of generated microphone frames
    std::atomic<bool> fail_reads{false};
    std::atomic<bool> fail_open_input{false};
    std::atomic<bool> fail_open_output{false};
    std::atomic<bool> throw_on_close{false};   ///< Output close() throws after closing
    std::atomic<int> inputs_opened{0};
    std::atomic<int> inputs_closed{0};
    std::atomic<int> outputs_opened{0};
    std::atomic<int> outputs_closed{0};
    std::atomic<size_t> samples_written{0};
};

class FakeAudioInput : public audio::IAudioInput {
public:
    FakeAudioInput(std::shared_ptr<FakeAudioState> state, int sample_rate, int frame_samples)
        : state_(std::move(state)), sample_rate_(sample_rate), frame_samples_(frame_samples) {}

    bool read_frame(AudioFrame& frame) override {
        if (closed_) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        if (closed_ || state_->fail_reads) return false;
        frame.resize(static_cast<size_t>(frame_samples_));
        int amplitude = state_->input_amplitude;
        for (size_t i = 0; i < frame.size(); ++i) {
            frame[i] = static_cast<Sample>((i % 2 == 0) ? amplitude : -amplitude);
        }
        return true;
    }

    void close() override {
        if (!closed_.exchange(true)) {
            state_->inputs_closed++;
        }
    }

    int sample_rate() const override { return sample_rate_; }
    int frame_samples() const override { return frame_samples_; }

private:
    std::shared_ptr<FakeAudioState> state_;
    int sample_rate_;
    int frame_samples_;
    std::atomic<bool> closed_{false};
};

class FakeAudioOutput : public audio::IAudioOutput {
public:
    FakeAudioOutput(std::shared_ptr<FakeAudioState> state, int sample_rate, int channels)
        : state_(std::move(state)), sample_rate_(sample_rate), channels_(channels) {}

    using audio::IAudioOutput::write;

    bool write(const Sample*, size_t sample_count) override {
        if (closed_) return false;
        state_->samples_written += sample_count;
        return true;
    }

    void close() override {
        if (!closed_.exchange(true)) {
            state_->outputs_closed++;
        }
        if (state_->throw_on_close) {
            throw std::runtime_error("fake speaker close failed");
        }
    }

    int sample_rate() const override { return sample_rate_; }
    int channels() const override { return channels_; }

private:
    std::shared_ptr<FakeAudioState> state_;
    int sample_rate_;
    int channels_;
    std::atomic<bool> closed_{false};
};

class FakeAudioBackend : public audio::IAudioBackend {
public:
    FakeAudioBackend() : state(std::make_shared<FakeAudioState>()) {}

    Result<audio::AudioInputPtr> open_input(int sample_rate, int frame_samples) override {
        if (state->fail_open_input) {
            return make_device_error("fake input unavailable");
        }
        state->inputs_opened++;
        return audio::AudioInputPtr(new FakeAudioInput(state, sample_rate, frame_samples));
    }

    Result<audio::AudioOutputPtr> open_output(int sample_rate, int channels) override {
        if (state->fail_open_output) {
            return make_device_error("fake output unavailable");
        }
        state->outputs_opened++;
        return audio::AudioOutputPtr(new FakeAudioOutput(state, sample_rate, channels));
    }

    std::shared_ptr<FakeAudioState> state;
};

// ---------------------------------------------------------------------------
// Dialogue transport
// ---------------------------------------------------------------------------

/// Observable side of a FakeTransport; the session owns the transport itself
struct FakeTransportState {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::string> inbox;
    std::vector<std::string> sent;
    bool open = false;
    bool fail_connect = false;
    int connect_calls = 0;
    int close_calls = 0;

    void push(const std::string& message) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            inbox.push_back(message);
        }
        cv.notify_all();
    }

    /// Simulate the server hanging up
    void remote_close() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            open = false;
        }
        cv.notify_all();
    }

    size_t sent_count(const std::string& type) {
        std::lock_guard<std::mutex> lock(mutex);
        size_t n = 0;
        for (const auto& m : sent) {
            if (m.find("\"type\":\"" + type + "\"") != std::string::npos) n++;
        }
        return n;
    }

    bool is_open() {
        std::lock_guard<std::mutex> lock(mutex);
        return open;
    }

    int closes() {
        std::lock_guard<std::mutex> lock(mutex);
        return close_calls;
    }
};

class FakeTransport : public dialogue::IRealtimeTransport {
public:
    explicit FakeTransport(std::shared_ptr<FakeTransportState> state) : state_(std::move(state)) {}

    Result<void> connect() override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->connect_calls++;
        if (state_->fail_connect) {
            return make_network_error("fake connect refused");
        }
        state_->open = true;
        return Result<void>();
    }

    Result<void> send(const std::string& message) override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->open) {
            return make_network_error("fake transport closed");
        }
        state_->sent.push_back(message);
        return Result<void>();
    }

    dialogue::Received receive(int timeout_ms) override {
        dialogue::Received out;
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->cv.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] {
            return !state_->inbox.empty() || !state_->open;
        });
        if (!state_->inbox.empty()) {
            out.status = dialogue::Received::Status::Message;
            out.text = state_->inbox.front();
            state_->inbox.pop_front();
        } else if (!state_->open) {
            out.status = dialogue::Received::Status::Closed;
        }
        return out;
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->close_calls++;
            state_->open = false;
        }
        state_->cv.notify_all();
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->open;
    }

private:
    std::shared_ptr<FakeTransportState> state_;
};

/// Inbound server messages
namespace events {

inline std::string transcript(const std::string& text) {
    return nlohmann::json{{"type", "conversation.item.input_audio_transcription.completed"},
                          {"transcript", text}}.dump();
}

inline std::string audio_delta(size_t samples) {
    std::vector<uint8_t> bytes = dialogue::protocol::pcm16le_encode(AudioFrame(samples, 1000));
    return nlohmann::json{{"type", "response.audio.delta"},
                          {"delta", dialogue::protocol::base64_encode(bytes.data(), bytes.size())}}.dump();
}

inline std::string text_delta(const std::string& text) {
    return nlohmann::json{{"type", "response.audio_transcript.delta"}, {"delta", text}}.dump();
}

inline std::string response_done() {
    return R"({"type":"response.done"})";
}

inline std::string speech_started() {
    return R"({"type":"input_audio_buffer.speech_started"})";
}

inline std::string error(const std::string& message) {
    return nlohmann::json{{"type", "error"}, {"error", {{"message", message}}}}.dump();
}

} // namespace events

// ---------------------------------------------------------------------------
// Music
// ---------------------------------------------------------------------------

class FakeCatalog : public music::ISongCatalog {
public:
    Result<std::vector<music::SongCandidate>> search(const std::string& query, int limit) override {
        search_calls++;
        last_query = query;
        last_limit = limit;
        if (fail) {
            return make_process_error("fake search failed");
        }
        std::vector<music::SongCandidate> out = results;
        if (limit >= 0 && out.size() > static_cast<size_t>(limit)) {
            out.resize(static_cast<size_t>(limit));
        }
        return out;
    }

    static music::SongCandidate candidate(const std::string& video_id, const std::string& title,
                                          const std::string& artist) {
        music::SongCandidate c;
        c.video_id = video_id;
        c.title = title;
        c.artist = artist;
        return c;
    }

    std::vector<music::SongCandidate> results;
    bool fail = false;
    std::atomic<int> search_calls{0};
    std::string last_query;
    int last_limit = 0;
};

class FakeExtractor : public music::IAudioExtractor {
public:
    Result<std::string> resolve_stream_url(const std::string& video_id) override {
        resolve_calls++;
        if (fail_resolve) {
            return make_process_error("fake resolve failed");
        }
        return "https://stream.example/" + video_id;
    }

    Result<void> download(const std::string&, const std::string& dest_path) override {
        download_calls++;
        std::ofstream out(dest_path, std::ios::binary);
        if (fail_download) {
            out << "partial";
            return make_process_error("fake ffmpeg exited with 1");
        }
        out << "ID3 fake mp3 payload";
        return Result<void>();
    }

    bool fail_resolve = false;
    bool fail_download = false;
    std::atomic<int> resolve_calls{0};
    std::atomic<int> download_calls{0};
};

/// Plays "silently" until stopped, or until end_track() is called
class FakePlayback : public music::IPlaybackBackend {
public:
    Result<void> play(const std::string& file_path, music::PlaybackControl& control) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_file_ = file_path;
        }
        end_requested = false;
        plays++;
        while (control.checkpoint()) {
            if (end_requested) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            chunks++;
        }
        return Result<void>();
    }

    void end_track() { end_requested = true; }

    std::string last_file() {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_file_;
    }

    std::atomic<int> plays{0};
    std::atomic<long> chunks{0};
    std::atomic<bool> end_requested{false};

private:
    std::mutex mutex_;
    std::string last_file_;
};

// ---------------------------------------------------------------------------
// Wake word
// ---------------------------------------------------------------------------

/// Fires on the detect_on-th frame (1-based; 0 = never)
class FakeDetector : public wake::IWakeWordDetector {
public:
    explicit FakeDetector(int detect_on = 0) : detect_on_(detect_on) {}

    int sample_rate() const override { return 16000; }
    int frame_length() const override { return 512; }

    Result<int> process(const AudioFrame& frame) override {
        if (static_cast<int>(frame.size()) != frame_length()) {
            return make_error(ErrorType::InvalidState, "unexpected frame size");
        }
        frames++;
        if (fail) {
            return make_error(ErrorType::ModelError, "fake detector failure");
        }
        if (detect_on_ > 0 && frames == detect_on_) {
            return 0;
        }
        return -1;
    }

    std::string keyword_name(int) const override { return "Hi Taco"; }

    std::atomic<int> frames{0};
    std::atomic<bool> fail{false};

private:
    int detect_on_;
};

} // namespace test
} // namespace taco

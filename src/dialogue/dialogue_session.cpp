#include "dialogue/dialogue_session.h"
#include "dialogue/realtime_protocol.h"
#include "dialogue/transcript_classifier.h"
#include "logger.h"
#include "utils.h"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace taco {
namespace dialogue {

class DialogueSession::Impl {
public:
    Impl(audio::AudioDevice& device,
         std::unique_ptr<IRealtimeTransport> transport,
         music::MusicCommandHandler& music,
         const RealtimeConfig& realtime_config,
         const ConversationConfig& conversation_config)
        : device_(device), transport_(std::move(transport)), music_(music),
          realtime_config_(realtime_config), conversation_config_(conversation_config) {}

    ~Impl() {
        stop();
    }

    Result<void> start() {
        {
            std::lock_guard<std::mutex> lock(resource_mutex_);
            if (state_.get_state() != SessionState::Init || closing_) {
                return make_error(ErrorType::InvalidState, "Dialogue session already started");
            }
        }

        LOG_EVENT("SESSION_START", "Starting conversation session");
        pause_music();

        auto setup = open_resources();
        if (setup.is_error()) {
            LOG_ERROR("Session setup failed: " + setup.error().message);
            finish();
            return setup;
        }

        if (!state_.begin_streaming(Clock::now())) {
            // stop() won the race during setup
            finish();
            return Result<void>();
        }
        LOG_SESSION("Streaming (full duplex, barge-in enabled)");

        std::thread uplink(&Impl::uplink_loop, this);
        std::thread downlink(&Impl::downlink_loop, this);
        std::thread watchdog(&Impl::watchdog_loop, this);
        uplink.join();
        downlink.join();
        watchdog.join();

        finish();
        return Result<void>();
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(resource_mutex_);
            if (closing_) return;
            closing_ = true;
        }

        state_.request_end(EndReason::Stopped);
        wake_watchdog();
        LOG_SESSION(std::string("Stopping session (") + end_reason_name(state_.end_reason()) + ")");

        cleanup_step("microphone", [this] { if (input_) input_->close(); });
        cleanup_step("speaker", [this] { if (output_) output_->close(); });
        cleanup_step("transport", [this] { transport_->close(); });
        cleanup_step("device lease", [this] { lease_.release(); });
        cleanup_step("music resume", [this] { resume_music(); });
    }

    SessionState state() const { return state_.get_state(); }
    EndReason end_reason() const { return state_.end_reason(); }
    bool assistant_speaking() const { return state_.assistant_speaking(); }
    bool paused_music() const { return paused_music_; }

private:
    void pause_music() {
        try {
            music::MusicStatus status = music_.engine().get_status();
            if (status.state == music::PlaybackState::Playing &&
                music_.engine().pause_for_conversation()) {
                paused_music_ = true;
                LOG_EVENT("MUSIC_AUTO_PAUSE", "Paused music for conversation");
            }
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("Failed to pause music for conversation: ") + e.what());
        }
    }

    void resume_music() {
        if (!paused_music_) return;
        if (music_.engine().resume_after_conversation()) {
            LOG_EVENT("MUSIC_AUTO_RESUME", "Resumed music after conversation");
        } else {
            LOG_MUSIC("Music not resumed (stopped, replaced or paused by the user)");
        }
    }

    Result<void> open_resources() {
        auto lease = device_.acquire("dialogue_session");
        if (lease.is_error()) {
            state_.request_end(EndReason::DeviceFailed);
            return lease.error();
        }

        auto input = lease.value().open_input(DIALOGUE_SAMPLE_RATE, DIALOGUE_FRAME_SAMPLES);
        if (input.is_error()) {
            state_.request_end(EndReason::DeviceFailed);
            return input.error();
        }
        auto output = lease.value().open_output(DIALOGUE_SAMPLE_RATE, DIALOGUE_CHANNELS);
        if (output.is_error()) {
            input.value()->close();
            state_.request_end(EndReason::DeviceFailed);
            return output.error();
        }

        {
            std::lock_guard<std::mutex> lock(resource_mutex_);
            if (closing_) {
                input.value()->close();
                output.value()->close();
                return Result<void>();
            }
            lease_ = std::move(lease.value());
            input_ = std::move(input.value());
            output_ = std::move(output.value());
        }

        auto connected = transport_->connect();
        if (connected.is_error()) {
            state_.request_end(EndReason::TransportClosed);
            return connected;
        }
        {
            std::lock_guard<std::mutex> lock(resource_mutex_);
            if (closing_) {
                transport_->close();
                return Result<void>();
            }
        }

        auto configured = transport_->send(protocol::session_update(realtime_config_).dump());
        if (configured.is_error()) {
            state_.request_end(EndReason::TransportClosed);
            return configured;
        }
        LOG_SESSION("Session configured (model " + realtime_config_.model + ", voice " +
                    realtime_config_.voice + ")");

        if (!realtime_config_.greeting.empty()) {
            auto greeted = transport_->send(protocol::user_text_item(realtime_config_.greeting).dump());
            if (greeted.is_ok()) {
                greeted = transport_->send(protocol::response_create().dump());
            }
            if (greeted.is_error()) {
                state_.request_end(EndReason::TransportClosed);
                return greeted;
            }
            LOG_SESSION("Greeting sent");
        }
        return Result<void>();
    }

    void finish() {
        stop();
        if (state_.mark_closed()) {
            LOG_EVENT("SESSION_CLOSED", std::string("Conversation ended: ") +
                      end_reason_name(state_.end_reason()));
        }
    }

    /// Record the reason and release resources; later reasons are ignored
    void end_session(EndReason reason) {
        state_.request_end(reason);
        stop();
    }

    void uplink_loop() {
        AudioFrame frame;
        while (!state_.should_end()) {
            if (!input_->read_frame(frame)) {
                if (!state_.should_end()) {
                    LOG_ERROR("Microphone read failed");
                    end_session(EndReason::DeviceFailed);
                }
                break;
            }

            if (frame_rms(frame) > ACTIVITY_RMS_THRESHOLD) {
                state_.on_user_activity(Clock::now());
            }

            auto sent = transport_->send(protocol::audio_append(frame).dump());
            if (sent.is_error()) {
                if (!state_.should_end()) {
                    LOG_WARN("Audio send failed: " + sent.error().message);
                    end_session(EndReason::TransportClosed);
                }
                break;
            }
        }
        LOG_DEBUG("Uplink loop exited");
    }

    void downlink_loop() {
        while (!state_.should_end()) {
            Received received = transport_->receive(DOWNLINK_POLL_MS);
            if (received.status == Received::Status::Timeout) continue;
            if (received.status == Received::Status::Closed) {
                if (!state_.should_end()) {
                    LOG_SESSION("Realtime connection closed");
                    end_session(EndReason::TransportClosed);
                }
                break;
            }

            auto event = parse_event(received.text);
            if (event.is_error()) {
                LOG_WARN(event.error().message);
                continue;
            }
            dispatch(event.value());
        }
        LOG_DEBUG("Downlink loop exited");
    }

    void dispatch(const RealtimeEvent& event) {
        if (auto* transcript = std::get_if<TranscriptCompleted>(&event)) {
            handle_transcript(transcript->transcript);
        } else if (auto* chunk = std::get_if<AudioDelta>(&event)) {
            state_.on_assistant_audio(Clock::now());
            if (!chunk->pcm.empty() && !output_->write(chunk->pcm) && !state_.should_end()) {
                LOG_ERROR("Speaker write failed");
                end_session(EndReason::DeviceFailed);
            }
        } else if (auto* text = std::get_if<TextDelta>(&event)) {
            state_.on_assistant_text(text->text);
        } else if (std::holds_alternative<ResponseDone>(event)) {
            std::string reply = state_.on_turn_complete(Clock::now());
            if (!utils::is_empty_or_whitespace(reply)) {
                LOG_EVENT("ASSISTANT_TEXT", reply);
            }
        } else if (std::holds_alternative<SpeechStarted>(event)) {
            if (state_.on_speech_started()) {
                LOG_EVENT("BARGE_IN", "User interrupted the assistant");
            } else {
                LOG_DEBUG("User speech started");
            }
        } else if (auto* error = std::get_if<ErrorEvent>(&event)) {
            LOG_EVENT("REALTIME_ERROR", error->message);
        } else if (auto* other = std::get_if<OtherEvent>(&event)) {
            LOG_DEBUG("Realtime event: " + other->type);
        }
    }

    void handle_transcript(const std::string& raw) {
        std::string transcript = utils::trim_copy(raw);
        if (transcript.empty()) return;
        LOG_EVENT("USER_TRANSCRIPT", transcript);

        TranscriptIntent intent = classify_transcript(transcript, conversation_config_.end_phrases);
        if (auto* requested = std::get_if<MusicIntent>(&intent)) {
            LOG_EVENT("MUSIC_COMMAND", music::describe(requested->command));
            music::CommandResult result = music_.execute(requested->command);
            LOG_EVENT("MUSIC_COMMAND_RESULT", result.action + ": " + result.response);
            if (result.success && result.action == "play") {
                end_session(EndReason::MusicStarted);
            }
        } else if (auto* end = std::get_if<EndIntent>(&intent)) {
            LOG_EVENT("CONVERSATION_END_DETECTED", "'" + end->phrase + "' in: " + transcript);
            end_session(EndReason::EndPhrase);
        }
    }

    void watchdog_loop() {
        const int64_t base_ms = conversation_config_.silence_timeout_ms;
        const int64_t grace_ms = conversation_config_.silence_grace_ms;

        while (true) {
            {
                std::unique_lock<std::mutex> lock(wake_mutex_);
                wake_cv_.wait_for(lock, Duration(conversation_config_.watchdog_tick_ms),
                                  [this] { return state_.should_end(); });
            }
            if (state_.should_end()) break;

            TimePoint now = Clock::now();
            int64_t silent_ms = ms_between(state_.last_activity(), now);
            int64_t limit_ms = effective_silence_timeout_ms(base_ms, grace_ms,
                                                            state_.assistant_finished_at(), now);
            if (silent_ms > limit_ms) {
                LOG_EVENT("SILENCE_TIMEOUT", "No activity for " + std::to_string(silent_ms) +
                          "ms (limit " + std::to_string(limit_ms) + "ms)");
                end_session(EndReason::SilenceTimeout);
                break;
            }
        }
        LOG_DEBUG("Watchdog loop exited");
    }

    void wake_watchdog() {
        { std::lock_guard<std::mutex> lock(wake_mutex_); }
        wake_cv_.notify_all();
    }

    template<typename Step>
    void cleanup_step(const char* what, Step step) {
        try {
            step();
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("Session cleanup (") + what + ") failed: " + e.what());
        }
    }

    audio::AudioDevice& device_;
    std::unique_ptr<IRealtimeTransport> transport_;
    music::MusicCommandHandler& music_;
    RealtimeConfig realtime_config_;
    ConversationConfig conversation_config_;

    ConversationState state_;

    std::mutex resource_mutex_;
    bool closing_ = false;
    audio::AudioDevice::Lease lease_;
    audio::AudioInputPtr input_;
    audio::AudioOutputPtr output_;

    std::atomic<bool> paused_music_{false};

    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
};

DialogueSession::DialogueSession(audio::AudioDevice& device,
                                 std::unique_ptr<IRealtimeTransport> transport,
                                 music::MusicCommandHandler& music,
                                 const RealtimeConfig& realtime_config,
                                 const ConversationConfig& conversation_config)
    : pimpl_(std::make_unique<Impl>(device, std::move(transport), music,
                                    realtime_config, conversation_config)) {}

DialogueSession::~DialogueSession() = default;

Result<void> DialogueSession::start() {
    return pimpl_->start();
}

void DialogueSession::stop() {
    pimpl_->stop();
}

SessionState DialogueSession::state() const {
    return pimpl_->state();
}

EndReason DialogueSession::end_reason() const {
    return pimpl_->end_reason();
}

bool DialogueSession::assistant_speaking() const {
    return pimpl_->assistant_speaking();
}

bool DialogueSession::paused_music() const {
    return pimpl_->paused_music();
}

} // namespace dialogue
} // namespace taco

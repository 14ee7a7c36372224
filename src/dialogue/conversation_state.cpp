#include "dialogue/conversation_state.h"
#include <mutex>

namespace taco {
namespace dialogue {

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Init: return "Init";
        case SessionState::Streaming: return "Streaming";
        case SessionState::Ending: return "Ending";
        case SessionState::Closed: return "Closed";
        default: return "Unknown";
    }
}

const char* end_reason_name(EndReason reason) {
    switch (reason) {
        case EndReason::None: return "none";
        case EndReason::EndPhrase: return "end_phrase";
        case EndReason::MusicStarted: return "music_started";
        case EndReason::SilenceTimeout: return "silence_timeout";
        case EndReason::TransportClosed: return "transport_closed";
        case EndReason::DeviceFailed: return "device_failed";
        case EndReason::Stopped: return "stopped";
        default: return "unknown";
    }
}

class ConversationState::Impl {
public:
    SessionState get_state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    bool begin_streaming(TimePoint now) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Init) return false;
        state_ = SessionState::Streaming;
        last_activity_ = now;
        return true;
    }

    bool request_end(EndReason reason) {
        std::lock_guard<std::mutex> lock(mutex_);
        should_end_ = true;
        if (state_ == SessionState::Init || state_ == SessionState::Streaming) {
            state_ = SessionState::Ending;
        }
        if (end_reason_ != EndReason::None) return false;
        end_reason_ = reason;
        return true;
    }

    bool mark_closed() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::Closed) return false;
        state_ = SessionState::Closed;
        should_end_ = true;
        assistant_speaking_ = false;
        return true;
    }

    bool should_end() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return should_end_;
    }

    EndReason end_reason() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return end_reason_;
    }

    void on_user_activity(TimePoint now) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_activity_ = now;
    }

    void on_assistant_audio(TimePoint now) {
        std::lock_guard<std::mutex> lock(mutex_);
        assistant_speaking_ = true;
        last_activity_ = now;
    }

    void on_assistant_text(const std::string& delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        assistant_speaking_ = true;
        turn_text_ += delta;
    }

    std::string on_turn_complete(TimePoint now) {
        std::lock_guard<std::mutex> lock(mutex_);
        assistant_speaking_ = false;
        assistant_finished_at_ = now;
        std::string text;
        text.swap(turn_text_);
        return text;
    }

    bool on_speech_started() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!assistant_speaking_) return false;
        assistant_speaking_ = false;
        return true;
    }

    bool assistant_speaking() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return assistant_speaking_;
    }

    TimePoint last_activity() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_activity_;
    }

    std::optional<TimePoint> assistant_finished_at() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return assistant_finished_at_;
    }

private:
    mutable std::mutex mutex_;
    SessionState state_ = SessionState::Init;
    EndReason end_reason_ = EndReason::None;
    bool should_end_ = false;
    bool assistant_speaking_ = false;
    TimePoint last_activity_ = Clock::now();
    std::optional<TimePoint> assistant_finished_at_;
    std::string turn_text_;
};

ConversationState::ConversationState() : pimpl_(std::make_unique<Impl>()) {}
ConversationState::~ConversationState() = default;

SessionState ConversationState::get_state() const { return pimpl_->get_state(); }
bool ConversationState::begin_streaming(TimePoint now) { return pimpl_->begin_streaming(now); }
bool ConversationState::request_end(EndReason reason) { return pimpl_->request_end(reason); }
bool ConversationState::mark_closed() { return pimpl_->mark_closed(); }
bool ConversationState::should_end() const { return pimpl_->should_end(); }
EndReason ConversationState::end_reason() const { return pimpl_->end_reason(); }
void ConversationState::on_user_activity(TimePoint now) { pimpl_->on_user_activity(now); }
void ConversationState::on_assistant_audio(TimePoint now) { pimpl_->on_assistant_audio(now); }
void ConversationState::on_assistant_text(const std::string& delta) { pimpl_->on_assistant_text(delta); }
std::string ConversationState::on_turn_complete(TimePoint now) { return pimpl_->on_turn_complete(now); }
bool ConversationState::on_speech_started() { return pimpl_->on_speech_started(); }
bool ConversationState::assistant_speaking() const { return pimpl_->assistant_speaking(); }
TimePoint ConversationState::last_activity() const { return pimpl_->last_activity(); }
std::optional<TimePoint> ConversationState::assistant_finished_at() const { return pimpl_->assistant_finished_at(); }

int64_t effective_silence_timeout_ms(int64_t base_ms, int64_t grace_ms,
                                     const std::optional<TimePoint>& finished_at,
                                     TimePoint now) {
    if (grace_ms <= 0 || !finished_at) {
        return base_ms;
    }
    int64_t since_finish = ms_between(*finished_at, now);
    if (since_finish >= 0 && since_finish < base_ms + grace_ms) {
        return base_ms + grace_ms;
    }
    return base_ms;
}

} // namespace dialogue
} // namespace taco

#pragma once

#include "common.h"
#include <memory>
#include <optional>
#include <string>

namespace taco {
namespace dialogue {

/**
 * @brief Session lifecycle
 */
enum class SessionState {
    Init,       ///< Created, transport not yet configured
    Streaming,  ///< Loops running
    Ending,     ///< End requested; loops draining
    Closed      ///< All loops exited and every resource released
};

/**
 * @brief Why a session ended (first reason recorded wins)
 */
enum class EndReason {
    None,
    EndPhrase,       ///< User said goodbye
    MusicStarted,    ///< A play command started music; conversation yields
    SilenceTimeout,  ///< Watchdog policy
    TransportClosed, ///< Remote closed or the connection failed
    DeviceFailed,    ///< Microphone or speaker stopped working
    Stopped          ///< External stop() (shutdown, conversation timeout)
};

const char* session_state_name(SessionState state);
const char* end_reason_name(EndReason reason);

/**
 * @brief Shared state of one conversation
 *
 * Read and written by the uplink, downlink and watchdog loops and by stop();
 * every transition happens under one internal mutex.
 *
 * Transitions:
 * - Init -> Streaming (begin_streaming)
 * - Init | Streaming -> Ending (request_end)
 * - any -> Closed (mark_closed), exactly once
 */
class ConversationState {
public:
    ConversationState();
    ~ConversationState();

    SessionState get_state() const;

    /**
     * @brief Init -> Streaming, resetting the activity clock
     * @return False if the session already left Init
     */
    bool begin_streaming(TimePoint now);

    /**
     * @brief Ask all loops to exit
     * @return True only for the call that recorded the reason
     */
    bool request_end(EndReason reason);

    /**
     * @brief Final transition
     * @return True only the first time
     */
    bool mark_closed();

    bool should_end() const;
    EndReason end_reason() const;

    void on_user_activity(TimePoint now);

    /**
     * @brief Assistant audio chunk arrived: speaking, and counts as activity
     */
    void on_assistant_audio(TimePoint now);

    /**
     * @brief Assistant text chunk arrived: speaking; text kept for the end-of-turn log
     */
    void on_assistant_text(const std::string& delta);

    /**
     * @brief Turn complete: clears speaking and records the finish time
     * @return Accumulated assistant text of the turn (returned once, then cleared)
     */
    std::string on_turn_complete(TimePoint now);

    /**
     * @brief User started speaking
     * @return True if this interrupted the assistant (barge-in); speaking is cleared
     */
    bool on_speech_started();

    bool assistant_speaking() const;
    TimePoint last_activity() const;
    std::optional<TimePoint> assistant_finished_at() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief Silence allowed before the watchdog ends the session
 *
 * base_ms + grace_ms while now is within (base_ms + grace_ms) of the last
 * turn completion, base_ms otherwise. Never less than base_ms.
 */
int64_t effective_silence_timeout_ms(int64_t base_ms, int64_t grace_ms,
                                     const std::optional<TimePoint>& finished_at,
                                     TimePoint now);

} // namespace dialogue
} // namespace taco

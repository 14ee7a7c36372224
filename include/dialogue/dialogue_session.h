#pragma once

#include "audio/audio_device.h"
#include "config.h"
#include "dialogue/conversation_state.h"
#include "dialogue/realtime_transport.h"
#include "music/music_commands.h"
#include <memory>

namespace taco {
namespace dialogue {

/**
 * @brief One duplex conversation with the cloud dialogue engine
 *
 * start() pauses playing music, takes the audio device, configures the
 * transport and runs three loops until one of them (or stop()) ends the
 * session:
 * - uplink: microphone frames -> transport, never muted (barge-in)
 * - downlink: transport events -> speaker, transcript classification
 * - watchdog: silence timeout with a grace window after each assistant turn
 *
 * Whichever loop ends the session calls stop(); stop() is idempotent and
 * releases every resource even when an earlier release step fails. Music
 * paused by this session is resumed exactly once.
 *
 * A session is single-use: construct a new one per conversation.
 */
class DialogueSession {
public:
    DialogueSession(audio::AudioDevice& device,
                    std::unique_ptr<IRealtimeTransport> transport,
                    music::MusicCommandHandler& music,
                    const RealtimeConfig& realtime_config,
                    const ConversationConfig& conversation_config);
    ~DialogueSession();

    DialogueSession(const DialogueSession&) = delete;
    DialogueSession& operator=(const DialogueSession&) = delete;

    /**
     * @brief Run the conversation (blocking join point)
     * @return Ok once the session ran and closed; DeviceError / NetworkError
     *         when setup failed (resources are released either way)
     */
    Result<void> start();

    /**
     * @brief End the session and release everything (thread-safe, idempotent)
     */
    void stop();

    SessionState state() const;
    EndReason end_reason() const;
    bool assistant_speaking() const;

    /// True if start() paused music for this conversation
    bool paused_music() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace dialogue
} // namespace taco

#pragma once

#include "audio/sound_player.h"
#include "config.h"
#include "dialogue/dialogue_session.h"
#include "music/music_engine.h"
#include "wake/wake_word_listener.h"
#include <functional>
#include <memory>

namespace taco {

/// Builds a fresh DialogueSession for each conversation
using SessionFactory = std::function<std::unique_ptr<dialogue::DialogueSession>()>;

/**
 * @brief Top-level assistant loop
 *
 * Each cycle:
 * - wait for the wake word
 * - play the acknowledgment cue
 * - run one DialogueSession, force-stopped after the conversation timeout
 * - play the transition cue unless music is audibly playing
 *
 * The components are owned by the caller; the orchestrator only sequences
 * them and cleans them up in reverse construction order on shutdown.
 */
class Orchestrator {
public:
    Orchestrator(const Config& config,
                 wake::WakeWordListener& listener,
                 music::MusicEngine& music,
                 audio::SoundPlayer& sounds,
                 SessionFactory session_factory);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * @brief Run cycles until request_stop()
     * @return Exit code (0 for a clean shutdown)
     */
    int run();

    /**
     * @brief Poll the wake listener once and, on a detection, run one full cycle
     * @return True if a conversation took place
     */
    bool run_cycle();

    /**
     * @brief Ask the loop to exit (thread-safe; also stops a running session)
     */
    void request_stop();

    bool is_running() const;

    /**
     * @brief Stop the active session, the wake listener and music (idempotent)
     */
    void cleanup();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace taco

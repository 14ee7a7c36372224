#pragma once

#include "music/music_engine.h"
#include <optional>
#include <string>
#include <variant>

namespace taco {
namespace music {

struct PlayCommand { std::string query; };
struct PauseCommand {};
struct ResumeCommand {};
struct StopCommand {};
struct StatusCommand {};
struct SkipCommand {};

/**
 * @brief A recognized music request
 */
using MusicCommand = std::variant<PlayCommand, PauseCommand, ResumeCommand,
                                  StopCommand, StatusCommand, SkipCommand>;

/**
 * @brief Match a user transcript against the music grammar
 *
 * Recognized forms (case and punctuation insensitive, after polite lead-ins
 * such as "please", "can you", "hey taco"):
 *   play <query> | put on <query> | i want to hear <query>   -> Play
 *   play | play music                                         -> Resume
 *   pause [the music|it|...]                                  -> Pause
 *   resume|unpause|continue [the music|playing|...]           -> Resume
 *   stop|turn off the music / music / playing / the song      -> Stop
 *   skip [this song] | next song | next track                 -> Skip
 *   what's playing | what song is this | music status         -> Status
 * A bare "stop" is not a music command (it ends the conversation).
 */
std::optional<MusicCommand> parse_music_command(const std::string& transcript);

/**
 * @brief Short name for logs, e.g. "play_music(bohemian rhapsody)"
 */
std::string describe(const MusicCommand& command);

/**
 * @brief Outcome of a music command, spoken/logged by the caller
 */
struct CommandResult {
    bool success = false;
    std::string response;  ///< Short natural-language message
    std::string action;    ///< Machine-readable tag: "play", "pause_no_music", ...
    std::string query;     ///< Play query, when relevant
};

/**
 * @brief Executes parsed music commands against a MusicEngine
 *
 * No exception ever escapes execute(); failures come back as a result with
 * success == false and an action tag.
 */
class MusicCommandHandler {
public:
    explicit MusicCommandHandler(MusicEngine& engine);

    CommandResult execute(const MusicCommand& command);

    /**
     * @brief Parse and execute in one step
     * @return nullopt when the transcript is not a music command
     */
    std::optional<CommandResult> handle_transcript(const std::string& transcript);

    MusicEngine& engine() { return engine_; }

private:
    CommandResult handle(const PlayCommand& cmd);
    CommandResult handle(const PauseCommand& cmd);
    CommandResult handle(const ResumeCommand& cmd);
    CommandResult handle(const StopCommand& cmd);
    CommandResult handle(const StatusCommand& cmd);
    CommandResult handle(const SkipCommand& cmd);

    MusicEngine& engine_;
};

} // namespace music
} // namespace taco

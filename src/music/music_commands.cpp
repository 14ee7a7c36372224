#include "music/music_commands.h"
#include "logger.h"
#include "utils.h"
#include <set>
#include <vector>

namespace taco {
namespace music {

namespace {

const std::vector<std::string> LEAD_INS = {
    "hey taco", "hi taco", "taco", "okay", "ok", "please", "can you", "could you",
    "would you", "will you", "i'd like you to", "go ahead and", "now"
};

// What may follow a control verb ("pause the music", "skip this song")
const std::set<std::string> CONTROL_OBJECTS = {
    "", "it", "that", "music", "the music", "my music", "song", "the song", "this song",
    "track", "the track", "this track", "this one", "playback", "the playback", "playing",
    "the music please", "it please"
};

const std::set<std::string> RESUME_PLAY_OBJECTS = { "", "music", "the music", "my music", "it" };

std::string strip_lead_ins(std::string text) {
    bool changed = true;
    while (changed) {
        changed = false;
        for (const auto& lead : LEAD_INS) {
            if (utils::starts_with_words(text, lead)) {
                text = utils::trim_copy(text.substr(lead.size()));
                changed = true;
            }
        }
    }
    const std::string tail = " please";
    if (text.size() > tail.size() && text.compare(text.size() - tail.size(), tail.size(), tail) == 0) {
        text.erase(text.size() - tail.size());
    }
    return text;
}

// Remainder after a leading verb phrase, or nullopt if text does not start with it
std::optional<std::string> after(const std::string& text, const std::string& verb) {
    if (!utils::starts_with_words(text, verb)) return std::nullopt;
    return utils::trim_copy(text.substr(verb.size()));
}

bool verb_with_object(const std::string& text, const std::string& verb, bool object_required) {
    auto rest = after(text, verb);
    if (!rest) return false;
    if (object_required && rest->empty()) return false;
    return CONTROL_OBJECTS.count(*rest) > 0;
}

} // namespace

std::optional<MusicCommand> parse_music_command(const std::string& transcript) {
    const std::string text = strip_lead_ins(utils::simplify_utterance(transcript));
    if (text.empty()) return std::nullopt;

    if (text == "what's playing" || text == "what is playing" || text == "what song is this" ||
        text == "what's this song" || text == "what is this song" || text == "music status" ||
        text == "what song is playing") {
        return MusicCommand(StatusCommand{});
    }

    if (text == "next" || text == "next song" || text == "next track" || text == "play the next song" ||
        verb_with_object(text, "skip", false)) {
        return MusicCommand(SkipCommand{});
    }

    if (verb_with_object(text, "pause", false)) {
        return MusicCommand(PauseCommand{});
    }

    if (verb_with_object(text, "resume", false) || verb_with_object(text, "unpause", false) ||
        verb_with_object(text, "continue", false)) {
        return MusicCommand(ResumeCommand{});
    }

    if (verb_with_object(text, "stop", true) || verb_with_object(text, "turn off", true)) {
        return MusicCommand(StopCommand{});
    }

    for (const char* verb : {"play me", "play", "put on", "i want to hear", "i wanna hear"}) {
        auto rest = after(text, verb);
        if (!rest) continue;
        if (RESUME_PLAY_OBJECTS.count(*rest) > 0) {
            return MusicCommand(ResumeCommand{});
        }
        return MusicCommand(PlayCommand{*rest});
    }

    return std::nullopt;
}

std::string describe(const MusicCommand& command) {
    struct Visitor {
        std::string operator()(const PlayCommand& c) const { return "play_music(" + c.query + ")"; }
        std::string operator()(const PauseCommand&) const { return "pause_music()"; }
        std::string operator()(const ResumeCommand&) const { return "resume_music()"; }
        std::string operator()(const StopCommand&) const { return "stop_music()"; }
        std::string operator()(const StatusCommand&) const { return "get_music_status()"; }
        std::string operator()(const SkipCommand&) const { return "skip_song()"; }
    };
    return std::visit(Visitor{}, command);
}

MusicCommandHandler::MusicCommandHandler(MusicEngine& engine) : engine_(engine) {}

CommandResult MusicCommandHandler::execute(const MusicCommand& command) {
    LOG_EVENT("MUSIC_FUNCTION_CALL", describe(command));
    try {
        return std::visit([this](const auto& cmd) { return handle(cmd); }, command);
    } catch (const std::exception& e) {
        LOG_EVENT("MUSIC_ERROR", "Error executing " + describe(command) + ": " + e.what());
        CommandResult result;
        result.response = "Sorry, I had trouble with that music request.";
        result.action = std::holds_alternative<PlayCommand>(command) ? "play_error" : "error";
        if (auto* play = std::get_if<PlayCommand>(&command)) {
            result.query = play->query;
        }
        return result;
    }
}

std::optional<CommandResult> MusicCommandHandler::handle_transcript(const std::string& transcript) {
    auto command = parse_music_command(transcript);
    if (!command) return std::nullopt;
    return execute(*command);
}

CommandResult MusicCommandHandler::handle(const PlayCommand& cmd) {
    LOG_EVENT("MUSIC_PLAY_CMD", "Playing: " + cmd.query);
    CommandResult result;
    result.query = cmd.query;
    if (engine_.play_search_result(cmd.query)) {
        result.success = true;
        result.response = "Now playing " + cmd.query + ".";
        result.action = "play";
    } else {
        result.response = "Sorry, I couldn't find or play '" + cmd.query + "'. Please try a different song.";
        result.action = "play_failed";
    }
    return result;
}

CommandResult MusicCommandHandler::handle(const PauseCommand&) {
    MusicStatus status = engine_.get_status();
    if (!status.is_playing) {
        return {false, "There's no music currently playing to pause.", "pause_no_music", ""};
    }
    if (status.is_paused) {
        // Still routed through the engine: a conversation pause becomes the user's
        engine_.pause();
        return {false, "The music is already paused.", "pause_already_paused", ""};
    }
    if (engine_.pause()) {
        std::string title = status.current_song ? status.current_song->title : "the music";
        return {true, "Paused " + title + ".", "pause", ""};
    }
    return {false, "Sorry, I couldn't pause the music.", "pause_failed", ""};
}

CommandResult MusicCommandHandler::handle(const ResumeCommand&) {
    MusicStatus status = engine_.get_status();
    if (!status.is_playing) {
        return {false, "There's no music to resume. Try asking me to play a song.", "resume_no_music", ""};
    }
    if (!status.is_paused) {
        return {false, "The music is already playing.", "resume_not_paused", ""};
    }
    if (engine_.resume()) {
        std::string title = status.current_song ? status.current_song->title : "the music";
        return {true, "Resumed " + title + ".", "resume", ""};
    }
    return {false, "Sorry, I couldn't resume the music.", "resume_failed", ""};
}

CommandResult MusicCommandHandler::handle(const StopCommand&) {
    MusicStatus status = engine_.get_status();
    if (!status.is_playing) {
        return {false, "There's no music currently playing to stop.", "stop_no_music", ""};
    }
    std::string title = status.current_song ? status.current_song->title : "the music";
    if (engine_.stop()) {
        return {true, "Stopped " + title + ".", "stop", ""};
    }
    return {false, "Sorry, I couldn't stop the music.", "stop_failed", ""};
}

CommandResult MusicCommandHandler::handle(const StatusCommand&) {
    MusicStatus status = engine_.get_status();
    if (!status.is_playing) {
        return {true, "No music is currently playing.", "status", ""};
    }
    if (!status.current_song) {
        return {true, "Music is playing but I can't identify the current song.", "status", ""};
    }
    const std::string& title = status.current_song->title;
    return {true, (status.is_paused ? "Currently paused: " : "Currently playing: ") + title, "status", ""};
}

CommandResult MusicCommandHandler::handle(const SkipCommand&) {
    MusicStatus status = engine_.get_status();
    if (!status.is_playing) {
        return {false, "No music is currently playing to skip.", "next_no_music", ""};
    }
    // Single-track player: skipping ends the current song
    engine_.stop();
    return {true, "Skipped. Ask me to play another song.", "next", ""};
}

} // namespace music
} // namespace taco

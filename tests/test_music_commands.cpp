/**
 * Music command grammar and handler.
 * Asserts:
 * - Transcripts map to exactly one command variant; non-music speech does not match.
 * - A bare "stop" is left to the conversation (end phrase), "stop the music" is not.
 * - Every handler outcome carries a response and a machine-readable action tag.
 *
 * Run from build dir: ./test_music_commands
 */

#include "music/music_commands.h"
#include "test_fakes.h"
#include <filesystem>

using namespace taco;
using namespace taco::music;

template<typename T>
static bool parses_as(const std::string& transcript) {
    auto cmd = parse_music_command(transcript);
    return cmd.has_value() && std::holds_alternative<T>(*cmd);
}

static std::string play_query(const std::string& transcript) {
    auto cmd = parse_music_command(transcript);
    if (!cmd) return "<none>";
    auto* play = std::get_if<PlayCommand>(&*cmd);
    return play ? play->query : "<not play>";
}

int main() {
    // --- grammar ---
    ASSERT(play_query("Play Bohemian Rhapsody") == "bohemian rhapsody");
    ASSERT(play_query("Can you play Bohemian Rhapsody by Queen, please?") == "bohemian rhapsody by queen");
    ASSERT(play_query("hey taco put on some jazz") == "some jazz");
    ASSERT(play_query("I want to hear Yesterday") == "yesterday");
    ASSERT(play_query("play me don't stop me now") == "don't stop me now");

    ASSERT(parses_as<ResumeCommand>("play"));
    ASSERT(parses_as<ResumeCommand>("Play music."));
    ASSERT(parses_as<ResumeCommand>("resume"));
    ASSERT(parses_as<ResumeCommand>("continue the music"));
    ASSERT(parses_as<ResumeCommand>("unpause it"));

    ASSERT(parses_as<PauseCommand>("Pause."));
    ASSERT(parses_as<PauseCommand>("please pause the music"));

    ASSERT(parses_as<StopCommand>("stop the music"));
    ASSERT(parses_as<StopCommand>("Stop playing!"));
    ASSERT(parses_as<StopCommand>("turn off the music"));
    ASSERT(!parse_music_command("stop").has_value());

    ASSERT(parses_as<SkipCommand>("skip this song"));
    ASSERT(parses_as<SkipCommand>("next song"));
    ASSERT(parses_as<SkipCommand>("Next track, please"));

    ASSERT(parses_as<StatusCommand>("What's playing?"));
    ASSERT(parses_as<StatusCommand>("what song is this"));

    ASSERT(!parse_music_command("").has_value());
    ASSERT(!parse_music_command("what's the weather like").has_value());
    ASSERT(!parse_music_command("the player was great").has_value());
    ASSERT(!parse_music_command("pause for a second, I need to think about it").has_value());

    ASSERT(describe(MusicCommand(PlayCommand{"abba"})) == "play_music(abba)");
    ASSERT(describe(MusicCommand(SkipCommand{})) == "skip_song()");

    // --- handler ---
    std::string root = test::make_temp_dir();
    MusicConfig config;
    config.cache_dir = root + "/cache";
    auto catalog = std::make_shared<test::FakeCatalog>();
    auto extractor = std::make_shared<test::FakeExtractor>();
    auto playback = std::make_shared<test::FakePlayback>();
    {
        MusicEngine engine(config, catalog, extractor, playback);
        ASSERT(engine.initialize().is_ok());
        MusicCommandHandler handler(engine);

        // Nothing loaded
        ASSERT(handler.execute(PauseCommand{}).action == "pause_no_music");
        ASSERT(handler.execute(ResumeCommand{}).action == "resume_no_music");
        ASSERT(handler.execute(StopCommand{}).action == "stop_no_music");
        ASSERT(handler.execute(SkipCommand{}).action == "next_no_music");
        CommandResult idle = handler.execute(StatusCommand{});
        ASSERT(idle.success && idle.action == "status");
        ASSERT(idle.response == "No music is currently playing.");

        // Play with no results
        CommandResult missing = handler.execute(PlayCommand{"nothing"});
        ASSERT(!missing.success);
        ASSERT(missing.action == "play_failed");
        ASSERT(missing.query == "nothing");
        ASSERT(!missing.response.empty());

        // Play
        catalog->results = {test::FakeCatalog::candidate("v1", "Dancing Queen", "ABBA")};
        auto played = handler.handle_transcript("play dancing queen");
        ASSERT(played.has_value());
        ASSERT(played && played->success && played->action == "play");
        ASSERT(played && played->response == "Now playing dancing queen.");
        ASSERT(test::wait_until([&] { return playback->plays == 1; }));

        ASSERT(handler.execute(ResumeCommand{}).action == "resume_not_paused");
        CommandResult paused = handler.execute(PauseCommand{});
        ASSERT(paused.success && paused.action == "pause");
        ASSERT(paused.response == "Paused Dancing Queen.");
        ASSERT(handler.execute(PauseCommand{}).action == "pause_already_paused");
        ASSERT(handler.execute(StatusCommand{}).response == "Currently paused: Dancing Queen");
        CommandResult resumed = handler.execute(ResumeCommand{});
        ASSERT(resumed.success && resumed.action == "resume");

        // "pause" during a conversation auto-pause makes the pause the user's
        ASSERT(engine.pause_for_conversation());
        ASSERT(handler.execute(PauseCommand{}).action == "pause_already_paused");
        ASSERT(!engine.resume_after_conversation());
        ASSERT(engine.resume());

        ASSERT(handler.execute(StatusCommand{}).response == "Currently playing: Dancing Queen");
        CommandResult skipped = handler.execute(SkipCommand{});
        ASSERT(skipped.success && skipped.action == "next");
        ASSERT(!engine.get_status().is_playing);

        ASSERT(handler.handle_transcript("play dancing queen")->success);
        CommandResult stopped = handler.execute(StopCommand{});
        ASSERT(stopped.success && stopped.action == "stop");
        ASSERT(stopped.response == "Stopped Dancing Queen.");

        ASSERT(!handler.handle_transcript("tell me a joke").has_value());

        // Search failure is a failed result, never an exception
        catalog->fail = true;
        CommandResult failed_play = handler.execute(PlayCommand{"anything"});
        ASSERT(!failed_play.success && failed_play.action == "play_failed");
    }

    std::error_code ec;
    std::filesystem::remove_all(root, ec);

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All music command tests passed.\n";
    return 0;
}

/**
 * Dialogue session state machine and its three loops.
 * Asserts:
 * - Barge-in clears assistant speech and is logged without closing the transport.
 * - End phrases, a successful play command, silence, remote close and device
 *   failure each end the session with the matching reason.
 * - The watchdog's effective timeout is never below base and exceeds it only
 *   inside the grace window after a turn.
 * - stop() is idempotent, finishes every release step even when one throws,
 *   and resumes auto-paused music once.
 *
 * Run from build dir: ./test_dialogue_session
 */

#include "dialogue/conversation_state.h"
#include "dialogue/dialogue_session.h"
#include "test_fakes.h"
#include <filesystem>
#include <future>

using namespace taco;
using namespace taco::dialogue;
namespace fs = std::filesystem;

static MusicConfig music_config_for(const std::string& root) {
    MusicConfig cfg;
    cfg.cache_dir = root + "/cache";
    cfg.stop_join_timeout_ms = 1000;
    return cfg;
}

struct Harness {
    std::shared_ptr<test::FakeAudioBackend> backend = std::make_shared<test::FakeAudioBackend>();
    audio::AudioDevice device{backend};
    std::shared_ptr<test::FakeCatalog> catalog = std::make_shared<test::FakeCatalog>();
    std::shared_ptr<test::FakeExtractor> extractor = std::make_shared<test::FakeExtractor>();
    std::shared_ptr<test::FakePlayback> playback = std::make_shared<test::FakePlayback>();
    music::MusicEngine engine;
    music::MusicCommandHandler handler;
    RealtimeConfig realtime;
    ConversationConfig conversation;

    explicit Harness(const std::string& root)
        : engine(music_config_for(root), catalog, extractor, playback), handler(engine) {
        ASSERT(engine.initialize().is_ok());
        conversation.watchdog_tick_ms = 20;
        conversation.silence_timeout_ms = 5000;
        conversation.silence_grace_ms = 0;
    }

    std::unique_ptr<DialogueSession> make_session(const std::shared_ptr<test::FakeTransportState>& transport) {
        return std::make_unique<DialogueSession>(device, std::make_unique<test::FakeTransport>(transport),
                                                 handler, realtime, conversation);
    }

    void start_music(const std::string& title) {
        catalog->results = {test::FakeCatalog::candidate("vid-" + title, title, "Artist")};
        int before = playback->plays;
        engine.play_search_result(title);
        test::wait_until([&] { return playback->plays == before + 1; });
    }
};

static bool is_streaming(DialogueSession& session) {
    return session.state() == SessionState::Streaming;
}

static void test_conversation_state() {
    ConversationState state;
    ASSERT(state.get_state() == SessionState::Init);
    ASSERT(!state.should_end());
    ASSERT(state.begin_streaming(Clock::now()));
    ASSERT(!state.begin_streaming(Clock::now()));
    ASSERT(state.get_state() == SessionState::Streaming);

    // Barge-in only counts while the assistant speaks
    ASSERT(!state.on_speech_started());
    state.on_assistant_text("Hello ");
    state.on_assistant_text("there");
    ASSERT(state.assistant_speaking());
    ASSERT(state.on_speech_started());
    ASSERT(!state.assistant_speaking());

    TimePoint done_at = Clock::now();
    ASSERT(state.on_turn_complete(done_at) == "Hello there");
    ASSERT(state.on_turn_complete(done_at).empty());
    ASSERT(state.assistant_finished_at().has_value());

    // First end reason wins
    ASSERT(state.request_end(EndReason::SilenceTimeout));
    ASSERT(!state.request_end(EndReason::Stopped));
    ASSERT(state.end_reason() == EndReason::SilenceTimeout);
    ASSERT(state.get_state() == SessionState::Ending);
    ASSERT(state.should_end());

    ASSERT(state.mark_closed());
    ASSERT(!state.mark_closed());
    ASSERT(state.get_state() == SessionState::Closed);
}

static void test_effective_timeout() {
    const int64_t base = 5000;
    const int64_t grace = 3000;
    TimePoint finished = Clock::now();

    ASSERT(effective_silence_timeout_ms(base, grace, std::nullopt, finished) == base);
    for (int64_t offset = 0; offset <= 20000; offset += 250) {
        TimePoint now = finished + Duration(offset);
        int64_t effective = effective_silence_timeout_ms(base, grace, finished, now);
        ASSERT(effective >= base);
        bool in_window = offset < base + grace;
        ASSERT(in_window ? effective > base : effective == base);
    }
    ASSERT(effective_silence_timeout_ms(base, 0, finished, finished) == base);
}

int main() {
    test_conversation_state();
    test_effective_timeout();

    std::string root = test::make_temp_dir();
    Harness h(root);

    // --- setup messages, barge-in, end phrase ---
    {
        test::LogCapture logs;
        auto transport = std::make_shared<test::FakeTransportState>();
        auto session = h.make_session(transport);
        auto done = std::async(std::launch::async, [&] { return session->start(); });

        ASSERT(test::wait_until([&] { return is_streaming(*session); }));
        ASSERT(h.device.holder() == "dialogue_session");
        ASSERT(transport->sent_count("session.update") == 1);
        ASSERT(transport->sent_count("conversation.item.create") == 1);
        ASSERT(transport->sent_count("response.create") == 1);
        ASSERT(test::wait_until([&] { return transport->sent_count("input_audio_buffer.append") >= 3; }));

        size_t written = h.backend->state->samples_written;
        transport->push(test::events::audio_delta(480));
        ASSERT(test::wait_until([&] { return session->assistant_speaking(); }));
        ASSERT(h.backend->state->samples_written >= written + 480);

        // Microphone keeps streaming while the assistant talks
        size_t appended = transport->sent_count("input_audio_buffer.append");
        ASSERT(test::wait_until([&] { return transport->sent_count("input_audio_buffer.append") > appended; }));

        transport->push(test::events::speech_started());
        ASSERT(test::wait_until([&] { return !session->assistant_speaking(); }));
        ASSERT(test::wait_until([&] { return logs.contains("BARGE_IN"); }));
        ASSERT(transport->is_open());
        ASSERT(transport->closes() == 0);
        ASSERT(is_streaming(*session));

        // Text deltas are flushed once per turn
        transport->push(test::events::text_delta("It is "));
        transport->push(test::events::text_delta("sunny."));
        transport->push(test::events::response_done());
        ASSERT(test::wait_until([&] { return logs.contains("ASSISTANT_TEXT: It is sunny."); }));
        ASSERT(logs.count("ASSISTANT_TEXT") == 1);

        // Ordinary turns and engine errors keep the conversation going
        transport->push(test::events::transcript("What's the weather like?"));
        transport->push(test::events::error("rate limited"));
        transport->push("garbage {");
        ASSERT(test::wait_until([&] { return logs.contains("REALTIME_ERROR: rate limited"); }));
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        ASSERT(is_streaming(*session));

        transport->push(test::events::transcript("ok thanks, bye"));
        ASSERT(done.wait_for(std::chrono::seconds(3)) == std::future_status::ready);
        Result<void> result = done.get();
        ASSERT(result.is_ok());
        ASSERT(session->end_reason() == EndReason::EndPhrase);
        ASSERT(session->state() == SessionState::Closed);
        ASSERT(logs.contains("CONVERSATION_END_DETECTED"));

        ASSERT(!h.device.is_held());
        ASSERT(!transport->is_open());
        ASSERT(h.backend->state->inputs_closed == h.backend->state->inputs_opened);
        ASSERT(h.backend->state->outputs_closed == h.backend->state->outputs_opened);

        int closes = transport->closes();
        session->stop();
        session->stop();
        ASSERT(transport->closes() == closes);
        ASSERT(session->start().is_error());
    }

    // --- auto-paused music resumes exactly once ---
    {
        h.start_music("Song A");
        ASSERT(h.engine.get_status().state == music::PlaybackState::Playing);

        test::LogCapture logs;
        auto transport = std::make_shared<test::FakeTransportState>();
        auto session = h.make_session(transport);
        auto done = std::async(std::launch::async, [&] { return session->start(); });

        ASSERT(test::wait_until([&] { return is_streaming(*session); }));
        ASSERT(session->paused_music());
        ASSERT(h.engine.get_status().state == music::PlaybackState::PausedForConversation);

        session->stop();
        ASSERT(done.wait_for(std::chrono::seconds(3)) == std::future_status::ready);
        ASSERT(done.get().is_ok());
        session->stop();

        ASSERT(session->end_reason() == EndReason::Stopped);
        ASSERT(h.engine.get_status().state == music::PlaybackState::Playing);
        ASSERT(logs.count("MUSIC_AUTO_RESUME") == 1);
    }

    // --- a failing speaker close does not skip the remaining cleanup ---
    {
        h.start_music("Song D");
        test::LogCapture logs;
        auto transport = std::make_shared<test::FakeTransportState>();
        auto session = h.make_session(transport);
        auto done = std::async(std::launch::async, [&] { return session->start(); });
        ASSERT(test::wait_until([&] { return is_streaming(*session); }));
        ASSERT(session->paused_music());

        h.backend->state->throw_on_close = true;
        session->stop();
        ASSERT(done.wait_for(std::chrono::seconds(3)) == std::future_status::ready);
        ASSERT(done.get().is_ok());
        session->stop();
        h.backend->state->throw_on_close = false;

        ASSERT(logs.contains("Session cleanup (speaker) failed"));
        ASSERT(!transport->is_open());
        ASSERT(transport->closes() == 1);
        ASSERT(!h.device.is_held());
        ASSERT(h.backend->state->inputs_closed == h.backend->state->inputs_opened);
        ASSERT(h.engine.get_status().state == music::PlaybackState::Playing);
        ASSERT(logs.count("MUSIC_AUTO_RESUME") == 1);
        ASSERT(session->state() == SessionState::Closed);
    }

    // --- a user pause is left alone ---
    {
        ASSERT(h.engine.pause());
        auto transport = std::make_shared<test::FakeTransportState>();
        auto session = h.make_session(transport);
        auto done = std::async(std::launch::async, [&] { return session->start(); });
        ASSERT(test::wait_until([&] { return is_streaming(*session); }));
        ASSERT(!session->paused_music());

        // "pause" said during the conversation keeps the music paused
        transport->push(test::events::transcript("pause the music"));
        transport->push(test::events::transcript("goodbye"));
        ASSERT(done.wait_for(std::chrono::seconds(3)) == std::future_status::ready);
        done.get();
        ASSERT(h.engine.get_status().state == music::PlaybackState::Paused);
        h.engine.stop();
    }

    // --- play command ends the conversation; music keeps playing ---
    {
        h.start_music("Song B");
        test::LogCapture logs;
        auto transport = std::make_shared<test::FakeTransportState>();
        auto session = h.make_session(transport);
        auto done = std::async(std::launch::async, [&] { return session->start(); });
        ASSERT(test::wait_until([&] { return is_streaming(*session); }));
        ASSERT(session->paused_music());

        h.catalog->results = {test::FakeCatalog::candidate("vid-q", "Dancing Queen", "ABBA")};
        transport->push(test::events::transcript("Play Dancing Queen"));
        ASSERT(done.wait_for(std::chrono::seconds(3)) == std::future_status::ready);
        ASSERT(done.get().is_ok());
        ASSERT(session->end_reason() == EndReason::MusicStarted);
        ASSERT(logs.contains("MUSIC_COMMAND_RESULT: play"));

        music::MusicStatus status = h.engine.get_status();
        ASSERT(status.is_playing && !status.is_paused);
        ASSERT(status.current_song && status.current_song->title == "Dancing Queen");
        // The auto-paused track was replaced, so nothing is resumed
        ASSERT(logs.count("MUSIC_AUTO_RESUME") == 0);
        h.engine.stop();
    }

    // --- a failed play keeps the conversation going ---
    {
        auto transport = std::make_shared<test::FakeTransportState>();
        auto session = h.make_session(transport);
        auto done = std::async(std::launch::async, [&] { return session->start(); });
        ASSERT(test::wait_until([&] { return is_streaming(*session); }));
        h.catalog->results.clear();
        transport->push(test::events::transcript("play something that does not exist"));
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        ASSERT(is_streaming(*session));
        session->stop();
        done.get();
    }

    // --- silence timeout ---
    {
        test::LogCapture logs;
        h.conversation.silence_timeout_ms = 100;
        TimePoint started = Clock::now();
        auto transport = std::make_shared<test::FakeTransportState>();
        auto session = h.make_session(transport);
        auto done = std::async(std::launch::async, [&] { return session->start(); });
        ASSERT(done.wait_for(std::chrono::seconds(3)) == std::future_status::ready);
        done.get();
        ASSERT(session->end_reason() == EndReason::SilenceTimeout);
        ASSERT(ms_since(started) >= 100);
        ASSERT(logs.contains("SILENCE_TIMEOUT"));
        ASSERT(!h.device.is_held());
    }

    // --- microphone activity keeps the session alive ---
    {
        h.backend->state->input_amplitude = 500;
        auto transport = std::make_shared<test::FakeTransportState>();
        auto session = h.make_session(transport);
        auto done = std::async(std::launch::async, [&] { return session->start(); });
        ASSERT(test::wait_until([&] { return is_streaming(*session); }));
        std::this_thread::sleep_for(std::chrono::milliseconds(400));
        ASSERT(is_streaming(*session));
        session->stop();
        done.get();
        ASSERT(session->end_reason() == EndReason::Stopped);
        h.backend->state->input_amplitude = 0;
    }

    // --- grace window after an assistant turn ---
    {
        h.conversation.silence_timeout_ms = 200;
        h.conversation.silence_grace_ms = 500;
        auto transport = std::make_shared<test::FakeTransportState>();
        auto session = h.make_session(transport);
        auto done = std::async(std::launch::async, [&] { return session->start(); });
        ASSERT(test::wait_until([&] { return is_streaming(*session); }));

        transport->push(test::events::audio_delta(240));
        transport->push(test::events::response_done());
        TimePoint turn_done = Clock::now();
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        ASSERT(is_streaming(*session));

        ASSERT(done.wait_for(std::chrono::seconds(3)) == std::future_status::ready);
        done.get();
        ASSERT(session->end_reason() == EndReason::SilenceTimeout);
        ASSERT(ms_since(turn_done) >= 550);

        h.conversation.silence_timeout_ms = 5000;
        h.conversation.silence_grace_ms = 0;
    }

    // --- remote close ---
    {
        auto transport = std::make_shared<test::FakeTransportState>();
        auto session = h.make_session(transport);
        auto done = std::async(std::launch::async, [&] { return session->start(); });
        ASSERT(test::wait_until([&] { return is_streaming(*session); }));
        transport->remote_close();
        ASSERT(done.wait_for(std::chrono::seconds(3)) == std::future_status::ready);
        ASSERT(done.get().is_ok());
        ASSERT(session->end_reason() == EndReason::TransportClosed);
        ASSERT(!h.device.is_held());
    }

    // --- microphone failure ---
    {
        auto transport = std::make_shared<test::FakeTransportState>();
        auto session = h.make_session(transport);
        auto done = std::async(std::launch::async, [&] { return session->start(); });
        ASSERT(test::wait_until([&] { return is_streaming(*session); }));
        h.backend->state->fail_reads = true;
        ASSERT(done.wait_for(std::chrono::seconds(3)) == std::future_status::ready);
        done.get();
        ASSERT(session->end_reason() == EndReason::DeviceFailed);
        ASSERT(!transport->is_open());
        h.backend->state->fail_reads = false;
    }

    // --- connect failure: error returned, everything released, music resumed ---
    {
        h.start_music("Song C");
        auto transport = std::make_shared<test::FakeTransportState>();
        transport->fail_connect = true;
        auto session = h.make_session(transport);
        Result<void> result = session->start();
        ASSERT(result.is_error());
        ASSERT(result.is_error() && result.error().type == ErrorType::NetworkError);
        ASSERT(session->state() == SessionState::Closed);
        ASSERT(session->end_reason() == EndReason::TransportClosed);
        ASSERT(!h.device.is_held());
        ASSERT(h.engine.get_status().state == music::PlaybackState::Playing);
        h.engine.stop();
    }

    // --- device busy ---
    {
        auto held = h.device.acquire("acknowledgment");
        ASSERT(held.is_ok());
        auto transport = std::make_shared<test::FakeTransportState>();
        auto session = h.make_session(transport);
        Result<void> result = session->start();
        ASSERT(result.is_error() && result.error().type == ErrorType::DeviceError);
        ASSERT(transport->connect_calls == 0);
        ASSERT(h.device.holder() == "acknowledgment");
        ASSERT(session->end_reason() == EndReason::DeviceFailed);
    }

    // --- stop before start ---
    {
        auto transport = std::make_shared<test::FakeTransportState>();
        auto session = h.make_session(transport);
        session->stop();
        ASSERT(session->start().is_error());
        ASSERT(transport->connect_calls == 0);
        ASSERT(!h.device.is_held());
    }

    h.engine.cleanup();
    std::error_code ec;
    fs::remove_all(root, ec);

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All dialogue session tests passed.\n";
    return 0;
}

#include "audio/audio_device.h"
#include "audio/portaudio_backend.h"
#include "audio/sound_player.h"
#include "config.h"
#include "dialogue/curl_realtime_transport.h"
#include "dialogue/dialogue_session.h"
#include "logger.h"
#include "music/ffmpeg_playback.h"
#include "music/music_commands.h"
#include "music/music_engine.h"
#include "music/ytdlp_sources.h"
#include "orchestrator.h"
#include "path_utils.h"
#include "wake/porcupine_detector.h"
#include "wake/wake_word_listener.h"
#include <curl/curl.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>

namespace taco {

static std::atomic<bool> g_stop_requested{false};

void signal_handler(int) {
    g_stop_requested = true;
}

struct Options {
    std::string config_path;
    std::string log_level;
    bool list_devices = false;
    bool help = false;
};

static void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [--config <file>] [--log-level debug|info|warn|error] [--list-devices]\n";
}

static Options parse_args(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--list-devices") {
            opts.list_devices = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--config" && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            opts.log_level = argv[++i];
        } else if (!arg.empty() && arg[0] != '-') {
            opts.config_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            opts.help = true;
        }
    }

    if (opts.config_path.empty()) {
        // Prefer config/ next to the build directory (e.g. build/../config)
        std::string candidate = executable_dir() + "/../config/config.json";
        std::ifstream test(candidate);
        opts.config_path = test.good() ? candidate : "config/config.json";
    }
    return opts;
}

static int fail(const Error& error) {
    Logger::error(std::string(error_type_name(error.type)) + ": " + error.message);
    Logger::shutdown();
    return 1;
}

} // namespace taco

int main(int argc, char* argv[]) {
    using namespace taco;

    Logger::initialize(LogLevel::INFO);

    Options opts = parse_args(argc, argv);
    if (opts.help) {
        print_usage(argv[0]);
        Logger::shutdown();
        return 0;
    }

    if (opts.list_devices) {
        audio::PortAudioBackend::list_devices();
        Logger::shutdown();
        return 0;
    }

    Config config = Config::load_from_file(opts.config_path);
    std::string level = opts.log_level.empty() ? config.logging.level : opts.log_level;
    if (!config.logging.file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(std::filesystem::path(config.logging.file).parent_path(), ec);
    }
    Logger::shutdown();
    Logger::initialize(Logger::parse_level(level), config.logging.file);

    auto valid = config.validate();
    if (valid.is_error()) {
        return fail(valid.error());
    }

    std::signal(SIGPIPE, SIG_IGN);
    curl_global_init(CURL_GLOBAL_DEFAULT);

    // Construction order: device, music, wake listener, cues, orchestrator.
    // Cleanup runs in reverse (Orchestrator::cleanup, then destructors).
    auto backend = std::make_shared<audio::PortAudioBackend>(config.audio.input_device, config.audio.output_device);
    auto audio_ready = backend->initialize();
    if (audio_ready.is_error()) {
        curl_global_cleanup();
        return fail(audio_ready.error());
    }
    audio::AudioDevice device(backend);

    music::MusicEngine music_engine(config.music,
                                    std::make_shared<music::YtDlpCatalog>(config.music),
                                    std::make_shared<music::YtDlpExtractor>(config.music),
                                    std::make_shared<music::FfmpegPlaybackBackend>(config.music.ffmpeg_path, device));
    auto music_ready = music_engine.initialize();
    if (music_ready.is_error()) {
        Logger::warn("Music cache unavailable: " + music_ready.error().message);
    }
    music::MusicCommandHandler music_commands(music_engine);

    auto detector = wake::PorcupineDetector::create(config.wake_word);
    if (detector.is_error()) {
        backend->shutdown();
        curl_global_cleanup();
        return fail(detector.error());
    }
    wake::WakeWordListener listener(device, std::move(detector.value()));

    audio::SoundPlayer sounds(device);

    SessionFactory make_session = [&]() {
        return std::make_unique<dialogue::DialogueSession>(
            device,
            std::make_unique<dialogue::CurlRealtimeTransport>(config.realtime),
            music_commands,
            config.realtime,
            config.conversation);
    };

    int result = 0;
    {
        Orchestrator orchestrator(config, listener, music_engine, sounds, make_session);

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::atomic<bool> finished{false};
        std::thread stop_watcher([&]() {
            while (!finished) {
                if (g_stop_requested) {
                    Logger::info("Shutting down...");
                    orchestrator.request_stop();
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });

        result = orchestrator.run();
        finished = true;
        stop_watcher.join();
    }

    backend->shutdown();
    curl_global_cleanup();
    Logger::shutdown();
    return result;
}

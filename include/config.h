#pragma once

#include "common.h"
#include "errors.h"
#include <string>
#include <vector>

namespace taco {

struct AudioConfig {
    std::string input_device = "default";
    std::string output_device = "default";
};

/// Cloud dialogue engine (realtime duplex transport)
struct RealtimeConfig {
    std::string api_key;  ///< Overridden by OPENAI_API_KEY when set
    std::string endpoint = "wss://api.openai.com/v1/realtime";
    std::string model = "gpt-4o-realtime-preview-2024-10-01";
    std::string voice = "alloy";
    std::string transcription_model = "whisper-1";
    std::string instructions =
        "You are a helpful voice assistant with full music capabilities. I have a built-in music "
        "player that can play songs from YouTube Music. When users ask about music, tell them about "
        "available music features like 'play [song name]', 'pause', 'resume', 'stop music', "
        "'next song', etc. Never say you cannot play music - I can play any song they request. "
        "The music system handles all music commands automatically, so just acknowledge their "
        "requests and be encouraging about the music features.";
    /// Sent as a programmatic user turn right after the session opens (empty = wait for the user)
    std::string greeting = "Hello! I heard you call me. How can I help you?";
    int connect_timeout_ms = 10000;
};

struct ConversationConfig {
    int silence_timeout_ms = DEFAULT_SILENCE_TIMEOUT_MS;
    /// Extra silence allowed right after the assistant finishes a turn
    int silence_grace_ms = DEFAULT_SILENCE_GRACE_MS;
    int watchdog_tick_ms = DEFAULT_WATCHDOG_TICK_MS;
    /// Overall bound on one conversation, enforced by the orchestrator
    int conversation_timeout_ms = DEFAULT_CONVERSATION_TIMEOUT_MS;
    std::vector<std::string> end_phrases = {
        "goodbye", "bye", "see you later", "talk to you later",
        "that's all", "thanks", "thank you", "stop", "end conversation",
        "quit", "exit", "done", "finished"
    };
};

struct WakeWordConfig {
    std::string access_key;    ///< Overridden by PORCUPINE_ACCESS_KEY when set
    std::string keyword_name = "Hi Taco";
    std::string keyword_path;  ///< Empty = resolve Hi-Taco_en_<platform>_v3_0_0.ppn in keyword_dir
    std::string keyword_dir = ".";
    std::string model_path = "porcupine_params.pv";
    float sensitivity = 0.6f;
};

struct MusicConfig {
    std::string cache_dir = "music_cache";
    int search_limit = DEFAULT_SEARCH_LIMIT;
    std::string ytdlp_path = "yt-dlp";
    std::string ffmpeg_path = "ffmpeg";
    std::string audio_bitrate = "192k";
    int stop_join_timeout_ms = PLAYBACK_JOIN_TIMEOUT_MS;
};

struct SoundsConfig {
    std::string acknowledgment = "audio/hi_there.wav";
    std::string transition = "audio/bye_bye.wav";
    int post_cue_delay_ms = POST_CUE_DELAY_MS;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file = "logs/taco_assistant.log";  ///< Empty = console only
};

struct Config {
    AudioConfig audio;
    RealtimeConfig realtime;
    ConversationConfig conversation;
    WakeWordConfig wake_word;
    MusicConfig music;
    SoundsConfig sounds;
    LoggingConfig logging;

    /// Directory relative paths are resolved against (directory of the loaded file)
    std::string base_dir = ".";

    /**
     * @brief Load configuration from a JSON file, then apply environment overrides.
     * A missing or unparsable file yields defaults (with a warning); relative paths are
     * resolved against the file's directory (its parent when the file sits in config/).
     * A .env file in that directory is loaded first.
     */
    static Config load_from_file(const std::string& path);

    /**
     * @brief Parse configuration from JSON text (no environment overrides, no path resolution)
     */
    static Result<Config> parse(const std::string& json_text);

    /**
     * @brief Apply OPENAI_API_KEY / PORCUPINE_ACCESS_KEY from the environment when set
     */
    void apply_environment();

    /**
     * @brief Export KEY=VALUE lines from a dotenv file into the environment.
     * Variables already set in the environment win; blank lines and # comments are skipped.
     * @return Number of variables exported (0 when the file is absent)
     */
    static int load_env_file(const std::string& path);

    /**
     * @brief Check startup requirements (credentials, positive timeouts)
     */
    Result<void> validate() const;
};

} // namespace taco

#include "config.h"
#include "logger.h"
#include "path_utils.h"
#include "utils.h"
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <filesystem>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace taco {

namespace {

template<typename T>
T get_or_default(const json& j, const std::string& key, const T& default_val) {
    if (j.contains(key) && !j[key].is_null()) {
        return j[key].get<T>();
    }
    return default_val;
}

template<typename T>
std::vector<T> get_array_or_default(const json& j, const std::string& key,
                                    const std::vector<T>& default_val) {
    if (j.contains(key) && j[key].is_array()) {
        return j[key].get<std::vector<T>>();
    }
    return default_val;
}

/// Accepts either "<name>_ms" or legacy "<name>" in seconds (e.g. "silence_timeout": 5)
int get_ms_or_seconds(const json& j, const std::string& name, int default_ms) {
    if (j.contains(name + "_ms") && j[name + "_ms"].is_number()) {
        return j[name + "_ms"].get<int>();
    }
    if (j.contains(name) && j[name].is_number()) {
        return static_cast<int>(j[name].get<double>() * 1000.0);
    }
    return default_ms;
}

void apply_json_to_config(Config& cfg, const json& j) {
    if (j.contains("audio")) {
        const auto& a = j["audio"];
        cfg.audio.input_device = get_or_default(a, "input_device", cfg.audio.input_device);
        cfg.audio.output_device = get_or_default(a, "output_device", cfg.audio.output_device);
    }

    if (j.contains("realtime")) {
        const auto& r = j["realtime"];
        cfg.realtime.api_key = get_or_default(r, "api_key", cfg.realtime.api_key);
        cfg.realtime.endpoint = get_or_default(r, "endpoint", cfg.realtime.endpoint);
        cfg.realtime.model = get_or_default(r, "model", cfg.realtime.model);
        cfg.realtime.voice = get_or_default(r, "voice", cfg.realtime.voice);
        cfg.realtime.transcription_model = get_or_default(r, "transcription_model", cfg.realtime.transcription_model);
        cfg.realtime.instructions = get_or_default(r, "instructions", cfg.realtime.instructions);
        cfg.realtime.greeting = get_or_default(r, "greeting", cfg.realtime.greeting);
        cfg.realtime.connect_timeout_ms = get_or_default(r, "connect_timeout_ms", cfg.realtime.connect_timeout_ms);
    }
    // Flat keys used by older config files
    cfg.realtime.api_key = get_or_default(j, "openai_api_key", cfg.realtime.api_key);
    cfg.realtime.model = get_or_default(j, "realtime_model", cfg.realtime.model);

    if (j.contains("conversation")) {
        const auto& c = j["conversation"];
        cfg.conversation.silence_timeout_ms = get_ms_or_seconds(c, "silence_timeout", cfg.conversation.silence_timeout_ms);
        cfg.conversation.silence_grace_ms = get_ms_or_seconds(c, "silence_grace", cfg.conversation.silence_grace_ms);
        cfg.conversation.watchdog_tick_ms = get_or_default(c, "watchdog_tick_ms", cfg.conversation.watchdog_tick_ms);
        cfg.conversation.conversation_timeout_ms = get_ms_or_seconds(c, "conversation_timeout", cfg.conversation.conversation_timeout_ms);
        cfg.conversation.end_phrases = get_array_or_default(c, "end_phrases", cfg.conversation.end_phrases);
    }
    cfg.conversation.silence_timeout_ms = get_ms_or_seconds(j, "silence_timeout", cfg.conversation.silence_timeout_ms);
    cfg.conversation.conversation_timeout_ms = get_ms_or_seconds(j, "conversation_timeout", cfg.conversation.conversation_timeout_ms);

    if (j.contains("wake_word")) {
        const auto& w = j["wake_word"];
        cfg.wake_word.access_key = get_or_default(w, "access_key", cfg.wake_word.access_key);
        cfg.wake_word.keyword_name = get_or_default(w, "keyword_name", cfg.wake_word.keyword_name);
        cfg.wake_word.keyword_path = get_or_default(w, "keyword_path", cfg.wake_word.keyword_path);
        cfg.wake_word.keyword_dir = get_or_default(w, "keyword_dir", cfg.wake_word.keyword_dir);
        cfg.wake_word.model_path = get_or_default(w, "model_path", cfg.wake_word.model_path);
        cfg.wake_word.sensitivity = get_or_default(w, "sensitivity", cfg.wake_word.sensitivity);
    }
    cfg.wake_word.access_key = get_or_default(j, "porcupine_access_key", cfg.wake_word.access_key);

    if (j.contains("music")) {
        const auto& m = j["music"];
        cfg.music.cache_dir = get_or_default(m, "cache_dir", cfg.music.cache_dir);
        cfg.music.search_limit = get_or_default(m, "search_limit", cfg.music.search_limit);
        cfg.music.ytdlp_path = get_or_default(m, "ytdlp_path", cfg.music.ytdlp_path);
        cfg.music.ffmpeg_path = get_or_default(m, "ffmpeg_path", cfg.music.ffmpeg_path);
        cfg.music.audio_bitrate = get_or_default(m, "audio_bitrate", cfg.music.audio_bitrate);
        cfg.music.stop_join_timeout_ms = get_or_default(m, "stop_join_timeout_ms", cfg.music.stop_join_timeout_ms);
    }

    if (j.contains("sounds")) {
        const auto& s = j["sounds"];
        cfg.sounds.acknowledgment = get_or_default(s, "acknowledgment", cfg.sounds.acknowledgment);
        cfg.sounds.transition = get_or_default(s, "transition", cfg.sounds.transition);
        cfg.sounds.post_cue_delay_ms = get_or_default(s, "post_cue_delay_ms", cfg.sounds.post_cue_delay_ms);
    }

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        cfg.logging.level = get_or_default(l, "level", cfg.logging.level);
        cfg.logging.file = get_or_default(l, "file", cfg.logging.file);
    }
}

void resolve_relative_paths(Config& cfg) {
    const std::string& base = cfg.base_dir;
    cfg.wake_word.keyword_dir = resolve_path(cfg.wake_word.keyword_dir, base);
    if (!cfg.wake_word.keyword_path.empty()) {
        cfg.wake_word.keyword_path = resolve_path(cfg.wake_word.keyword_path, base);
    }
    cfg.wake_word.model_path = resolve_path(cfg.wake_word.model_path, base);
    cfg.music.cache_dir = resolve_path(cfg.music.cache_dir, base);
    cfg.sounds.acknowledgment = resolve_path(cfg.sounds.acknowledgment, base);
    cfg.sounds.transition = resolve_path(cfg.sounds.transition, base);
    if (!cfg.logging.file.empty()) {
        cfg.logging.file = resolve_path(cfg.logging.file, base);
    }
}

} // namespace

Result<Config> Config::parse(const std::string& json_text) {
    Config cfg;
    try {
        json j = json::parse(json_text);
        if (!j.is_object()) {
            return make_config_error("Config root must be a JSON object");
        }
        apply_json_to_config(cfg, j);
    } catch (const json::exception& e) {
        return make_config_error(std::string("Config parse error: ") + e.what());
    }
    return cfg;
}

Config Config::load_from_file(const std::string& path) {
    Config cfg;
    std::string expanded = expand_path(path);
    fs::path file_path(expanded);
    std::string parent = file_path.parent_path().string();
    // Config files live in <root>/config/; relative asset paths resolve against <root>
    if (file_path.parent_path().filename() == "config") {
        parent = file_path.parent_path().parent_path().string();
    }

    std::ifstream file(expanded);
    if (!file.is_open()) {
        Logger::warn("Config file not found: " + expanded + "; using defaults");
    } else {
        std::stringstream buffer;
        buffer << file.rdbuf();
        auto parsed = parse(buffer.str());
        if (parsed.is_ok()) {
            cfg = parsed.value();
            Logger::info("Loaded config: " + expanded);
        } else {
            Logger::warn(parsed.error().message + " (" + expanded + "); using defaults");
        }
    }

    cfg.base_dir = parent.empty() ? "." : parent;
    resolve_relative_paths(cfg);

    int exported = load_env_file((fs::path(cfg.base_dir) / ".env").string());
    if (exported > 0) {
        Logger::info("Loaded " + std::to_string(exported) + " variable(s) from .env");
    }
    cfg.apply_environment();
    return cfg;
}

void Config::apply_environment() {
    if (const char* key = std::getenv("OPENAI_API_KEY")) {
        if (*key) realtime.api_key = key;
    }
    if (const char* key = std::getenv("PORCUPINE_ACCESS_KEY")) {
        if (*key) wake_word.access_key = key;
    }
}

int Config::load_env_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return 0;
    }

    int exported = 0;
    std::string line;
    while (std::getline(file, line)) {
        utils::trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.compare(0, 7, "export ") == 0) {
            line = utils::trim_copy(line.substr(7));
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        std::string key = utils::trim_copy(line.substr(0, eq));
        std::string value = utils::trim_copy(line.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
            value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }

        if (std::getenv(key.c_str()) == nullptr && setenv(key.c_str(), value.c_str(), 1) == 0) {
            ++exported;
        }
    }
    return exported;
}

Result<void> Config::validate() const {
    if (realtime.api_key.empty()) {
        return make_credential_error(
            "OpenAI API key is required: set OPENAI_API_KEY or realtime.api_key in config");
    }
    if (wake_word.access_key.empty()) {
        return make_credential_error(
            "Porcupine access key is required: set PORCUPINE_ACCESS_KEY or wake_word.access_key in config "
            "(free key at https://console.picovoice.ai/)");
    }
    if (conversation.silence_timeout_ms <= 0 || conversation.conversation_timeout_ms <= 0) {
        return make_config_error("Silence and conversation timeouts must be positive");
    }
    if (conversation.watchdog_tick_ms <= 0) {
        return make_config_error("conversation.watchdog_tick_ms must be positive");
    }
    if (wake_word.sensitivity < 0.0f || wake_word.sensitivity > 1.0f) {
        return make_config_error("wake_word.sensitivity must be within [0, 1]");
    }
    return Result<void>();
}

} // namespace taco

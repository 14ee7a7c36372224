#include "music/ytdlp_sources.h"
#include "logger.h"
#include "process.h"
#include "utils.h"
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdio>
#include <sstream>

using json = nlohmann::json;

namespace taco {
namespace music {

namespace {

std::string string_field(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return "";
}

} // namespace

YtDlpCatalog::YtDlpCatalog(const MusicConfig& config)
    : ytdlp_path_(config.ytdlp_path) {}

Result<std::vector<SongCandidate>> YtDlpCatalog::search(const std::string& query, int limit) {
    if (limit <= 0) {
        return std::vector<SongCandidate>{};
    }

    std::string cmd = utils::join_command({
        ytdlp_path_, "--flat-playlist", "--dump-single-json", "--no-warnings", "--quiet",
        "ytsearch" + std::to_string(limit) + ":" + query
    }) + " 2>/dev/null";

    auto output = run_capture(cmd);
    if (output.is_error()) {
        return make_process_error("yt-dlp search failed: " + output.error().message);
    }
    return parse_search_results(output.value(), limit);
}

Result<std::vector<SongCandidate>> YtDlpCatalog::parse_search_results(const std::string& json_text, int limit) {
    std::vector<SongCandidate> songs;
    try {
        json j = json::parse(json_text);
        if (!j.contains("entries") || !j["entries"].is_array()) {
            return songs;
        }

        for (const auto& entry : j["entries"]) {
            if (limit >= 0 && static_cast<int>(songs.size()) >= limit) break;
            if (!entry.is_object()) continue;

            SongCandidate song;
            song.video_id = string_field(entry, "id");
            if (song.video_id.empty()) continue;

            std::string title = string_field(entry, "title");
            if (!title.empty()) song.title = title;

            std::string artist = string_field(entry, "artist");
            if (artist.empty()) artist = string_field(entry, "channel");
            if (artist.empty()) artist = string_field(entry, "uploader");
            if (!artist.empty()) song.artist = artist;

            if (entry.contains("duration") && entry["duration"].is_number()) {
                song.duration = format_duration(entry["duration"].get<double>());
            }
            songs.push_back(std::move(song));
        }
    } catch (const json::exception& e) {
        return make_error(ErrorType::ProtocolError, std::string("Bad yt-dlp output: ") + e.what());
    }
    return songs;
}

std::string YtDlpCatalog::format_duration(double seconds) {
    if (seconds < 0) return "Unknown";
    long total = std::lround(seconds);
    long h = total / 3600;
    long m = (total % 3600) / 60;
    long s = total % 60;
    char buf[32];
    if (h > 0) {
        std::snprintf(buf, sizeof(buf), "%ld:%02ld:%02ld", h, m, s);
    } else {
        std::snprintf(buf, sizeof(buf), "%ld:%02ld", m, s);
    }
    return buf;
}

YtDlpExtractor::YtDlpExtractor(const MusicConfig& config)
    : ytdlp_path_(config.ytdlp_path),
      ffmpeg_path_(config.ffmpeg_path),
      bitrate_(config.audio_bitrate) {}

Result<std::string> YtDlpExtractor::resolve_stream_url(const std::string& video_id) {
    std::string cmd = utils::join_command({
        ytdlp_path_, "-f", "bestaudio/best", "-g", "--no-warnings", "--quiet",
        "https://www.youtube.com/watch?v=" + video_id
    }) + " 2>/dev/null";

    auto output = run_capture(cmd);
    if (output.is_error()) {
        return make_process_error("yt-dlp could not resolve " + video_id + ": " + output.error().message);
    }

    std::istringstream lines(output.value());
    std::string url;
    while (std::getline(lines, url)) {
        utils::trim(url);
        if (!url.empty()) {
            return url;
        }
    }
    return make_process_error("yt-dlp returned no stream URL for " + video_id);
}

Result<void> YtDlpExtractor::download(const std::string& stream_url, const std::string& dest_path) {
    std::string cmd = utils::join_command({
        ffmpeg_path_, "-y", "-loglevel", "error", "-i", stream_url,
        "-vn", "-acodec", "libmp3lame", "-ab", bitrate_, dest_path
    }) + " </dev/null >/dev/null 2>&1";

    int code = run_command(cmd);
    if (code != 0) {
        return make_process_error("ffmpeg exited with code " + std::to_string(code));
    }
    return Result<void>();
}

} // namespace music
} // namespace taco

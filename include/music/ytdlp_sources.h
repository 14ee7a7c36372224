#pragma once

#include "config.h"
#include "music/music_backends.h"
#include <string>
#include <vector>

namespace taco {
namespace music {

/**
 * @brief Catalog search through yt-dlp ("ytsearchN:<query>", flat JSON dump)
 */
class YtDlpCatalog : public ISongCatalog {
public:
    explicit YtDlpCatalog(const MusicConfig& config);

    Result<std::vector<SongCandidate>> search(const std::string& query, int limit) override;

    /**
     * @brief Parse yt-dlp --dump-single-json output into candidates (exposed for tests)
     */
    static Result<std::vector<SongCandidate>> parse_search_results(const std::string& json_text, int limit);

    /**
     * @brief Format seconds as m:ss / h:mm:ss
     */
    static std::string format_duration(double seconds);

private:
    std::string ytdlp_path_;
};

/**
 * @brief Stream URL via yt-dlp, download/transcode to MP3 via ffmpeg
 */
class YtDlpExtractor : public IAudioExtractor {
public:
    explicit YtDlpExtractor(const MusicConfig& config);

    Result<std::string> resolve_stream_url(const std::string& video_id) override;
    Result<void> download(const std::string& stream_url, const std::string& dest_path) override;

private:
    std::string ytdlp_path_;
    std::string ffmpeg_path_;
    std::string bitrate_;
};

} // namespace music
} // namespace taco

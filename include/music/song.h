#pragma once

#include <optional>
#include <string>

namespace taco {
namespace music {

/**
 * @brief One catalog search hit, in the catalog's ranking order
 */
struct SongCandidate {
    std::string video_id;
    std::string title = "Unknown Title";
    std::string artist = "Unknown Artist";
    std::string duration = "Unknown";
};

/**
 * @brief A track known to the engine (cached or being played)
 */
struct Song {
    std::string id;           ///< Content address, see make_song_id()
    std::string video_id;
    std::string title;
    std::string artist;
    std::string cached_file_path;
    int play_count = 0;
    std::string last_played;  ///< "YYYY-MM-DD HH:MM:SS", local time
};

/**
 * @brief Content address of a track: first 12 hex chars of
 * MD5(lowercase(video_id + "_" + title + "_" + artist)).
 * Same triple always yields the same id.
 */
std::string make_song_id(const std::string& video_id,
                         const std::string& title,
                         const std::string& artist);

/**
 * @brief Current local time as "YYYY-MM-DD HH:MM:SS"
 */
std::string local_timestamp();

} // namespace music
} // namespace taco

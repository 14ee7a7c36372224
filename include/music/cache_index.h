#pragma once

#include "errors.h"
#include "music/song.h"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace taco {
namespace music {

/**
 * @brief Persisted metadata for one cached track (metadata.json value)
 */
struct CacheEntry {
    std::string video_id;
    std::string title;
    std::string artist;
    std::string cached_at;          ///< "YYYY-MM-DD HH:MM:SS"
    double cached_timestamp = 0.0;  ///< Seconds since epoch
    int play_count = 0;
    std::string last_played;
};

/**
 * @brief Summary returned by MusicEngine::get_cache_info()
 */
struct CacheInfo {
    size_t total_songs = 0;
    double total_size_mb = 0.0;   ///< Rounded to 2 decimals
    std::string cache_dir;
    std::vector<Song> most_played;  ///< Up to 5, highest play_count first
};

/**
 * @brief Content-addressable song cache index
 *
 * Maps song id to CacheEntry, persisted as <cache_dir>/metadata.json; the
 * audio for id lives at <cache_dir>/<id>.mp3. A song counts as cached only
 * when it is indexed AND its file exists AND the file is non-empty, so a file
 * deleted behind our back simply reads as a miss.
 *
 * All methods are thread-safe.
 */
class CacheIndex {
public:
    explicit CacheIndex(std::string cache_dir);

    /**
     * @brief Create the cache directory and load metadata.json if present.
     * A corrupt index is logged and treated as empty.
     */
    Result<void> open();

    const std::string& cache_dir() const { return cache_dir_; }
    std::string file_path_for(const std::string& song_id) const;

    bool is_cached(const std::string& song_id) const;

    std::optional<CacheEntry> entry(const std::string& song_id) const;

    /**
     * @brief Index a freshly downloaded file (counts as a play)
     */
    void record_download(const std::string& song_id, const std::string& video_id,
                         const std::string& title, const std::string& artist);

    /**
     * @brief Bump play_count / last_played on a cache hit
     */
    void record_play(const std::string& song_id);

    CacheInfo info() const;

    size_t size() const;

private:
    void load_locked();
    void save_locked() const;

    std::string cache_dir_;
    std::string metadata_path_;
    mutable std::mutex mutex_;
    std::map<std::string, CacheEntry> entries_;
};

} // namespace music
} // namespace taco

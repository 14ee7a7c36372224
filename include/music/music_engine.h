#pragma once

#include "config.h"
#include "music/cache_index.h"
#include "music/music_backends.h"
#include "music/song.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace taco {
namespace music {

/**
 * @brief Playback state machine
 *
 * Stopped -> Playing (play)
 * Playing -> Paused (pause) | PausedForConversation (pause_for_conversation)
 * Paused | PausedForConversation -> Playing (resume)
 * PausedForConversation -> Playing (resume_after_conversation)
 * any -> Stopped (stop, or the track ends)
 */
enum class PlaybackState {
    Stopped,
    Playing,
    Paused,                 ///< Paused by the user; never auto-resumed
    PausedForConversation   ///< Paused automatically while a conversation runs
};

const char* playback_state_name(PlaybackState state);

/**
 * @brief Snapshot returned by get_status()
 */
struct MusicStatus {
    PlaybackState state = PlaybackState::Stopped;
    bool is_playing = false;  ///< A track is loaded (playing or paused)
    bool is_paused = false;
    std::optional<Song> current_song;
};

/**
 * @brief Music search, cache and single-track playback
 *
 * Playback runs on a dedicated worker thread; the engine talks to it only
 * through a PlaybackControl handle, so status reads and pause/resume from the
 * orchestration loop or a dialogue loop never race with the worker.
 *
 * Thread Safety:
 * - All public methods may be called from any thread
 * - Track changes (play/stop/cleanup) are serialized
 */
class MusicEngine {
public:
    MusicEngine(const MusicConfig& config,
                std::shared_ptr<ISongCatalog> catalog,
                std::shared_ptr<IAudioExtractor> extractor,
                std::shared_ptr<IPlaybackBackend> playback);
    ~MusicEngine();

    MusicEngine(const MusicEngine&) = delete;
    MusicEngine& operator=(const MusicEngine&) = delete;

    /**
     * @brief Prepare the cache directory and load the index
     */
    Result<void> initialize();

    /**
     * @brief Search the catalog
     * @return Up to limit candidates, best first; empty on no results or failure (logged)
     */
    std::vector<SongCandidate> search(const std::string& query, int limit = DEFAULT_SEARCH_LIMIT);

    /**
     * @brief Search and play the candidate at index
     * @return False when nothing was found, index is out of range or play() fails
     */
    bool play_search_result(const std::string& query, size_t index = 0);

    /**
     * @brief Play a track, replacing any current one
     *
     * Cache hit: reuse the file and bump its play count. Miss: resolve the
     * stream URL and download into the cache; any failure removes the partial
     * file and leaves the index untouched.
     * @return True once playback has started
     */
    bool play(const SongCandidate& song);

    /**
     * @brief Playing -> Paused
     * @return False from any other state. A PausedForConversation track is
     *         already paused: it becomes a user pause (never auto-resumed) and
     *         false is returned.
     */
    bool pause();

    /// Paused or PausedForConversation -> Playing; clears the auto-pause flag.
    bool resume();

    /// Playing -> PausedForConversation.
    bool pause_for_conversation();

    /// PausedForConversation -> Playing. False for a user pause.
    bool resume_after_conversation();

    /**
     * @brief Halt playback and join the worker (bounded wait)
     * @return True if a track was loaded
     */
    bool stop();

    MusicStatus get_status() const;

    CacheInfo get_cache_info() const;

    /**
     * @brief Stop playback; call before destruction during shutdown
     */
    void cleanup();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace music
} // namespace taco

#pragma once

/**
 * @file music_backends.h
 * @brief External collaborators of the music engine
 *
 * Search, stream extraction and decoding are done by external tools; the
 * engine only sees these interfaces. Test doubles live in tests/test_fakes.h.
 */

#include "common.h"
#include "errors.h"
#include "music/song.h"
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

namespace taco {
namespace music {

/**
 * @brief Song search/metadata lookup
 */
class ISongCatalog {
public:
    virtual ~ISongCatalog() = default;

    /**
     * @brief Search the catalog
     * @return Candidates in the catalog's ranking order (best first), at most limit
     */
    virtual Result<std::vector<SongCandidate>> search(const std::string& query, int limit) = 0;
};

/**
 * @brief Audio extraction: video id -> stream URL -> local audio file
 */
class IAudioExtractor {
public:
    virtual ~IAudioExtractor() = default;

    virtual Result<std::string> resolve_stream_url(const std::string& video_id) = 0;

    /**
     * @brief Download/transcode the stream into dest_path.
     * May leave a partial file behind on failure; the caller removes it.
     */
    virtual Result<void> download(const std::string& stream_url, const std::string& dest_path) = 0;
};

/**
 * @brief Synchronized handle shared by the engine and its playback worker
 *
 * The engine flips pause/stop; the worker calls checkpoint() between audio
 * chunks, which blocks while paused and reports whether to keep going.
 */
class PlaybackControl {
public:
    void pause();
    void resume();
    void request_stop();

    /**
     * @brief Block while paused
     * @return False once stop has been requested
     */
    bool checkpoint();

    bool is_paused() const;
    bool stop_requested() const;

    /// Called by the worker when it returns, whatever the reason
    void mark_finished();
    bool finished() const;

    /**
     * @brief Wait for the worker to finish
     * @return False if timeout_ms elapsed first
     */
    bool wait_finished(int timeout_ms);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool paused_ = false;
    bool stop_ = false;
    bool finished_ = false;
};

/**
 * @brief Plays a local audio file, blocking until it ends or control stops it
 *
 * Runs on the engine's playback thread, never on the orchestration loop.
 */
class IPlaybackBackend {
public:
    virtual ~IPlaybackBackend() = default;

    virtual Result<void> play(const std::string& file_path, PlaybackControl& control) = 0;
};

} // namespace music
} // namespace taco

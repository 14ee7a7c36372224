#include "music/music_engine.h"
#include "logger.h"
#include "path_utils.h"
#include <algorithm>
#include <limits>
#include <filesystem>
#include <mutex>
#include <thread>

namespace fs = std::filesystem;

namespace taco {
namespace music {

const char* playback_state_name(PlaybackState state) {
    switch (state) {
        case PlaybackState::Stopped: return "Stopped";
        case PlaybackState::Playing: return "Playing";
        case PlaybackState::Paused: return "Paused";
        case PlaybackState::PausedForConversation: return "PausedForConversation";
        default: return "Unknown";
    }
}

class MusicEngine::Impl {
public:
    Impl(const MusicConfig& config,
         std::shared_ptr<ISongCatalog> catalog,
         std::shared_ptr<IAudioExtractor> extractor,
         std::shared_ptr<IPlaybackBackend> playback)
        : config_(config),
          catalog_(std::move(catalog)),
          extractor_(std::move(extractor)),
          playback_(std::move(playback)),
          cache_(config.cache_dir) {}

    ~Impl() {
        cleanup();
    }

    Result<void> initialize() {
        auto opened = cache_.open();
        if (opened.is_error()) {
            return opened;
        }
        LOG_EVENT("MUSIC_INIT", "Music engine initialized (cache: " + cache_.cache_dir() + ")");
        return Result<void>();
    }

    std::vector<SongCandidate> search(const std::string& query, int limit) {
        LOG_EVENT("MUSIC_SEARCH", "Searching for: " + query);
        std::vector<SongCandidate> songs;
        try {
            auto result = catalog_->search(query, limit);
            if (result.is_error()) {
                LOG_EVENT("MUSIC_ERROR", "Error searching songs: " + result.error().message);
                return {};
            }
            songs = std::move(result.value());
        } catch (const std::exception& e) {
            LOG_EVENT("MUSIC_ERROR", std::string("Error searching songs: ") + e.what());
            return {};
        }

        if (limit >= 0 && songs.size() > static_cast<size_t>(limit)) {
            songs.resize(static_cast<size_t>(limit));
        }
        LOG_EVENT("MUSIC_SEARCH_RESULT", "Found " + std::to_string(songs.size()) + " songs for '" + query + "'");
        return songs;
    }

    bool play_search_result(const std::string& query, size_t index) {
        const size_t max_limit = static_cast<size_t>(std::numeric_limits<int>::max());
        size_t wanted = std::max<size_t>(DEFAULT_SEARCH_LIMIT, index < max_limit ? index + 1 : max_limit);
        int limit = static_cast<int>(std::min(wanted, max_limit));
        auto songs = search(query, limit);
        if (songs.empty()) {
            LOG_EVENT("MUSIC_ERROR", "No songs found for: " + query);
            return false;
        }
        if (index >= songs.size()) {
            LOG_EVENT("MUSIC_ERROR", "Search result index " + std::to_string(index) +
                      " out of range (found " + std::to_string(songs.size()) + " songs)");
            return false;
        }
        return play(songs[index]);
    }

    bool play(const SongCandidate& candidate) {
        std::lock_guard<std::mutex> track_lock(track_mutex_);
        stop_locked();

        Song song;
        song.id = make_song_id(candidate.video_id, candidate.title, candidate.artist);
        song.video_id = candidate.video_id;
        song.title = candidate.title;
        song.artist = candidate.artist;
        song.cached_file_path = cache_.file_path_for(song.id);

        LOG_EVENT("MUSIC_PLAY", "Starting playback: " + song.title + " by " + song.artist);

        if (cache_.is_cached(song.id)) {
            LOG_EVENT("CACHE_HIT", "Playing cached version: " + song.title);
            cache_.record_play(song.id);
        } else {
            LOG_EVENT("CACHE_MISS", "Downloading: " + song.title);
            if (!download_to_cache(song)) {
                LOG_EVENT("MUSIC_ERROR", "Failed to download: " + song.title);
                return false;
            }
        }

        if (auto entry = cache_.entry(song.id)) {
            song.play_count = entry->play_count;
            song.last_played = entry->last_played;
        }

        start_worker(song);
        return true;
    }

    bool pause() {
        std::lock_guard<std::mutex> lock(mutex_);
        settle_locked();
        if (state_ == PlaybackState::Playing) {
            control_->pause();
            state_ = PlaybackState::Paused;
            LOG_EVENT("MUSIC_PAUSE", "Paused: " + current_title_locked());
            return true;
        }
        if (state_ == PlaybackState::PausedForConversation) {
            // Already silent; the user's request makes the pause theirs
            state_ = PlaybackState::Paused;
            LOG_EVENT("MUSIC_PAUSE", "Conversation pause converted to user pause: " + current_title_locked());
        }
        return false;
    }

    bool resume() {
        std::lock_guard<std::mutex> lock(mutex_);
        settle_locked();
        if (state_ == PlaybackState::Paused || state_ == PlaybackState::PausedForConversation) {
            control_->resume();
            state_ = PlaybackState::Playing;
            LOG_EVENT("MUSIC_RESUME", "Resumed: " + current_title_locked());
            return true;
        }
        return false;
    }

    bool pause_for_conversation() {
        std::lock_guard<std::mutex> lock(mutex_);
        settle_locked();
        if (state_ == PlaybackState::Playing) {
            control_->pause();
            state_ = PlaybackState::PausedForConversation;
            LOG_EVENT("MUSIC_CONV_PAUSE", "Paused for conversation: " + current_title_locked());
            return true;
        }
        return false;
    }

    bool resume_after_conversation() {
        std::lock_guard<std::mutex> lock(mutex_);
        settle_locked();
        if (state_ == PlaybackState::PausedForConversation) {
            control_->resume();
            state_ = PlaybackState::Playing;
            LOG_EVENT("MUSIC_CONV_RESUME", "Resumed after conversation: " + current_title_locked());
            return true;
        }
        return false;
    }

    bool stop() {
        std::lock_guard<std::mutex> track_lock(track_mutex_);
        return stop_locked();
    }

    MusicStatus get_status() const {
        std::lock_guard<std::mutex> lock(mutex_);
        MusicStatus status;
        if (track_ended_locked()) {
            return status;
        }
        status.state = state_;
        status.is_playing = state_ != PlaybackState::Stopped;
        status.is_paused = state_ == PlaybackState::Paused || state_ == PlaybackState::PausedForConversation;
        status.current_song = current_song_;
        return status;
    }

    CacheInfo get_cache_info() const {
        return cache_.info();
    }

    void cleanup() {
        std::lock_guard<std::mutex> track_lock(track_mutex_);
        if (stop_locked()) {
            LOG_EVENT("MUSIC_CLEANUP", "Music engine cleaned up");
        }
    }

private:
    bool download_to_cache(const Song& song) {
        const std::string& dest = song.cached_file_path;

        auto url = extractor_->resolve_stream_url(song.video_id);
        if (url.is_error()) {
            LOG_EVENT("MUSIC_ERROR", "Failed to get audio stream for " + song.title + ": " + url.error().message);
            return false;
        }

        auto downloaded = extractor_->download(url.value(), dest);
        if (downloaded.is_error() || file_size_or_zero(dest) == 0) {
            std::string reason = downloaded.is_error() ? downloaded.error().message : "empty output file";
            LOG_EVENT("CACHE_ERROR", "Error downloading " + song.title + ": " + reason);
            remove_partial(dest);
            return false;
        }

        cache_.record_download(song.id, song.video_id, song.title, song.artist);
        LOG_EVENT("CACHE_DOWNLOAD", "Cached: " + song.title + " (" + song.id + ")");
        return true;
    }

    static void remove_partial(const std::string& path) {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            LOG_EVENT("CACHE_ERROR", "Error cleaning up failed download: " + ec.message());
        }
    }

    void start_worker(const Song& song) {
        auto control = std::make_shared<PlaybackControl>();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            control_ = control;
            current_song_ = song;
            state_ = PlaybackState::Playing;
        }

        std::string label = song.artist + " - " + song.title;
        worker_ = std::thread([backend = playback_, control, file = song.cached_file_path, label]() {
            LOG_EVENT("MUSIC_PLAYBACK", "Playing cached audio: " + label);
            try {
                auto result = backend->play(file, *control);
                if (result.is_error()) {
                    LOG_EVENT("MUSIC_ERROR", "Error in cached audio playback: " + result.error().message);
                } else if (!control->stop_requested()) {
                    LOG_EVENT("MUSIC_FINISHED", "Finished playing: " + label);
                }
            } catch (const std::exception& e) {
                LOG_EVENT("MUSIC_ERROR", std::string("Error in cached audio playback: ") + e.what());
            }
            control->mark_finished();
        });
    }

    // Caller holds track_mutex_
    bool stop_locked() {
        std::shared_ptr<PlaybackControl> control;
        bool was_loaded = false;
        std::string title;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            was_loaded = state_ != PlaybackState::Stopped && !track_ended_locked();
            title = current_title_locked();
            control = std::move(control_);
            state_ = PlaybackState::Stopped;
            current_song_.reset();
        }

        if (control) {
            control->request_stop();
        }
        if (worker_.joinable()) {
            if (control && !control->wait_finished(config_.stop_join_timeout_ms)) {
                LOG_WARN("[Music] Playback thread did not stop within " +
                         std::to_string(config_.stop_join_timeout_ms) + "ms; detaching");
                worker_.detach();
            } else {
                worker_.join();
            }
        }

        if (was_loaded) {
            LOG_EVENT("MUSIC_STOP", "Stopped: " + title);
        }
        return was_loaded;
    }

    // A worker that returned on its own means the track ended
    bool track_ended_locked() const {
        return state_ != PlaybackState::Stopped && control_ && control_->finished();
    }

    void settle_locked() {
        if (track_ended_locked()) {
            state_ = PlaybackState::Stopped;
            current_song_.reset();
        }
    }

    std::string current_title_locked() const {
        return current_song_ ? current_song_->title : "Unknown";
    }

    MusicConfig config_;
    std::shared_ptr<ISongCatalog> catalog_;
    std::shared_ptr<IAudioExtractor> extractor_;
    std::shared_ptr<IPlaybackBackend> playback_;
    CacheIndex cache_;

    std::mutex track_mutex_;
    mutable std::mutex mutex_;
    PlaybackState state_ = PlaybackState::Stopped;
    std::optional<Song> current_song_;
    std::shared_ptr<PlaybackControl> control_;
    std::thread worker_;
};

MusicEngine::MusicEngine(const MusicConfig& config,
                         std::shared_ptr<ISongCatalog> catalog,
                         std::shared_ptr<IAudioExtractor> extractor,
                         std::shared_ptr<IPlaybackBackend> playback)
    : pimpl_(std::make_unique<Impl>(config, std::move(catalog), std::move(extractor), std::move(playback))) {}

MusicEngine::~MusicEngine() = default;

Result<void> MusicEngine::initialize() {
    return pimpl_->initialize();
}

std::vector<SongCandidate> MusicEngine::search(const std::string& query, int limit) {
    return pimpl_->search(query, limit);
}

bool MusicEngine::play_search_result(const std::string& query, size_t index) {
    return pimpl_->play_search_result(query, index);
}

bool MusicEngine::play(const SongCandidate& song) {
    return pimpl_->play(song);
}

bool MusicEngine::pause() {
    return pimpl_->pause();
}

bool MusicEngine::resume() {
    return pimpl_->resume();
}

bool MusicEngine::pause_for_conversation() {
    return pimpl_->pause_for_conversation();
}

bool MusicEngine::resume_after_conversation() {
    return pimpl_->resume_after_conversation();
}

bool MusicEngine::stop() {
    return pimpl_->stop();
}

MusicStatus MusicEngine::get_status() const {
    return pimpl_->get_status();
}

CacheInfo MusicEngine::get_cache_info() const {
    return pimpl_->get_cache_info();
}

void MusicEngine::cleanup() {
    pimpl_->cleanup();
}

} // namespace music
} // namespace taco

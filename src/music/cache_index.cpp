#include "music/cache_index.h"
#include "logger.h"
#include "path_utils.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <ctime>
#include <filesystem>
#include <fstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace taco {
namespace music {

namespace {

json entry_to_json(const CacheEntry& e) {
    return json{
        {"video_id", e.video_id},
        {"title", e.title},
        {"artist", e.artist},
        {"cached_at", e.cached_at},
        {"cached_timestamp", e.cached_timestamp},
        {"play_count", e.play_count},
        {"last_played", e.last_played}
    };
}

CacheEntry entry_from_json(const json& j) {
    CacheEntry e;
    e.video_id = j.value("video_id", "");
    e.title = j.value("title", "");
    e.artist = j.value("artist", "");
    e.cached_at = j.value("cached_at", "");
    e.cached_timestamp = j.value("cached_timestamp", 0.0);
    e.play_count = j.value("play_count", 0);
    e.last_played = j.value("last_played", "");
    return e;
}

} // namespace

CacheIndex::CacheIndex(std::string cache_dir)
    : cache_dir_(std::move(cache_dir)),
      metadata_path_((fs::path(cache_dir_) / "metadata.json").string()) {}

Result<void> CacheIndex::open() {
    std::error_code ec;
    fs::create_directories(cache_dir_, ec);
    if (ec) {
        LOG_EVENT("CACHE_ERROR", "Failed to create cache directory: " + ec.message());
        return make_io_error("Failed to create cache directory " + cache_dir_ + ": " + ec.message());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    load_locked();
    LOG_EVENT("CACHE_INIT", "Cache directory ready: " + cache_dir_ + " (" +
              std::to_string(entries_.size()) + " songs)");
    return Result<void>();
}

std::string CacheIndex::file_path_for(const std::string& song_id) const {
    return (fs::path(cache_dir_) / (song_id + ".mp3")).string();
}

bool CacheIndex::is_cached(const std::string& song_id) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (entries_.find(song_id) == entries_.end()) {
            return false;
        }
    }
    return file_size_or_zero(file_path_for(song_id)) > 0;
}

std::optional<CacheEntry> CacheIndex::entry(const std::string& song_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(song_id);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

void CacheIndex::record_download(const std::string& song_id, const std::string& video_id,
                                 const std::string& title, const std::string& artist) {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheEntry& e = entries_[song_id];
    std::string now = local_timestamp();
    e.video_id = video_id;
    e.title = title;
    e.artist = artist;
    e.cached_at = now;
    e.cached_timestamp = static_cast<double>(std::time(nullptr));
    e.play_count += 1;
    e.last_played = now;
    save_locked();
}

void CacheIndex::record_play(const std::string& song_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(song_id);
    if (it == entries_.end()) return;
    it->second.play_count += 1;
    it->second.last_played = local_timestamp();
    save_locked();
}

CacheInfo CacheIndex::info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheInfo info;
    info.total_songs = entries_.size();
    info.cache_dir = cache_dir_;

    uint64_t total_bytes = 0;
    for (const auto& kv : entries_) {
        total_bytes += file_size_or_zero(file_path_for(kv.first));

        Song song;
        song.id = kv.first;
        song.video_id = kv.second.video_id;
        song.title = kv.second.title;
        song.artist = kv.second.artist;
        song.cached_file_path = file_path_for(kv.first);
        song.play_count = kv.second.play_count;
        song.last_played = kv.second.last_played;
        info.most_played.push_back(std::move(song));
    }
    info.total_size_mb = std::round(static_cast<double>(total_bytes) / (1024.0 * 1024.0) * 100.0) / 100.0;

    std::stable_sort(info.most_played.begin(), info.most_played.end(),
                     [](const Song& a, const Song& b) { return a.play_count > b.play_count; });
    if (info.most_played.size() > 5) {
        info.most_played.resize(5);
    }
    return info;
}

size_t CacheIndex::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void CacheIndex::load_locked() {
    entries_.clear();
    std::ifstream file(metadata_path_);
    if (!file.is_open()) {
        return;
    }

    try {
        json j = json::parse(file);
        if (!j.is_object()) {
            LOG_EVENT("CACHE_ERROR", "Ignoring malformed metadata (not an object): " + metadata_path_);
            return;
        }
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (it.value().is_object()) {
                entries_[it.key()] = entry_from_json(it.value());
            }
        }
    } catch (const json::exception& e) {
        LOG_EVENT("CACHE_ERROR", std::string("Error loading metadata: ") + e.what());
        entries_.clear();
    }
}

void CacheIndex::save_locked() const {
    json j = json::object();
    for (const auto& kv : entries_) {
        j[kv.first] = entry_to_json(kv.second);
    }

    // Readers never observe a partially written index
    const std::string tmp_path = metadata_path_ + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out.is_open()) {
            LOG_EVENT("CACHE_ERROR", "Error saving metadata: cannot write " + tmp_path);
            return;
        }
        out << j.dump(2, ' ', false, json::error_handler_t::replace);
        if (!out.good()) {
            LOG_EVENT("CACHE_ERROR", "Error saving metadata: write failed");
            return;
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, metadata_path_, ec);
    if (ec) {
        LOG_EVENT("CACHE_ERROR", "Error saving metadata: " + ec.message());
    }
}

} // namespace music
} // namespace taco

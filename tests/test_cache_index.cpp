/**
 * Content-addressable song cache.
 * Asserts:
 * - Song ids are derived from (video id, title, artist) and stable.
 * - A song is cached only when indexed, present on disk and non-empty.
 * - The index persists across reopen; a corrupt index reads as empty.
 *
 * Run from build dir: ./test_cache_index
 */

#include "music/cache_index.h"
#include "music/song.h"
#include "test_fakes.h"
#include <cctype>
#include <filesystem>
#include <fstream>

using namespace taco;
using namespace taco::music;
namespace fs = std::filesystem;

static void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

static bool is_hex(const std::string& s) {
    for (char c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c)) || std::isupper(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

int main() {
    // --- song identity ---
    std::string id = make_song_id("dQw4w9WgXcQ", "Never Gonna Give You Up", "Rick Astley");
    ASSERT(id.size() == 12);
    ASSERT(is_hex(id));
    ASSERT(id == make_song_id("dQw4w9WgXcQ", "Never Gonna Give You Up", "Rick Astley"));
    ASSERT(id == make_song_id("DQW4W9WGXCQ", "never gonna give you up", "RICK ASTLEY"));
    ASSERT(id != make_song_id("dQw4w9WgXcQ", "Never Gonna Give You Up (Live)", "Rick Astley"));
    ASSERT(id != make_song_id("other", "Never Gonna Give You Up", "Rick Astley"));
    ASSERT(local_timestamp().size() == 19);

    std::string dir = test::make_temp_dir() + "/music_cache";

    // --- empty cache ---
    {
        CacheIndex index(dir);
        ASSERT(index.open().is_ok());
        ASSERT(fs::is_directory(dir));
        ASSERT(index.size() == 0);
        ASSERT(!index.is_cached(id));
        ASSERT(index.file_path_for(id) == dir + "/" + id + ".mp3");
    }

    // --- download then hit ---
    {
        CacheIndex index(dir);
        ASSERT(index.open().is_ok());

        // Indexed but no file: not cached
        index.record_download(id, "dQw4w9WgXcQ", "Never Gonna Give You Up", "Rick Astley");
        ASSERT(!index.is_cached(id));

        // Empty file: not cached
        write_file(index.file_path_for(id), "");
        ASSERT(!index.is_cached(id));

        write_file(index.file_path_for(id), "ID3 data");
        ASSERT(index.is_cached(id));

        auto entry = index.entry(id);
        ASSERT(entry.has_value());
        ASSERT(entry && entry->play_count == 1);
        ASSERT(entry && entry->title == "Never Gonna Give You Up");
        ASSERT(entry && entry->cached_at.size() == 19);
        ASSERT(entry && entry->cached_timestamp > 0.0);

        index.record_play(id);
        index.record_play(id);
        ASSERT(index.entry(id)->play_count == 3);
        ASSERT(!index.entry(id)->last_played.empty());

        index.record_play("unknown");
        ASSERT(index.size() == 1);
    }

    // --- persistence ---
    std::string other = make_song_id("abc123", "Bohemian Rhapsody", "Queen");
    {
        CacheIndex index(dir);
        ASSERT(index.open().is_ok());
        ASSERT(index.size() == 1);
        ASSERT(index.is_cached(id));
        ASSERT(index.entry(id)->play_count == 3);

        index.record_download(other, "abc123", "Bohemian Rhapsody", "Queen");
        write_file(index.file_path_for(other), std::string(2048, 'x'));

        CacheInfo info = index.info();
        ASSERT(info.total_songs == 2);
        ASSERT(info.cache_dir == dir);
        ASSERT(info.most_played.size() == 2);
        ASSERT(info.most_played.size() == 2 && info.most_played[0].id == id);
        ASSERT(info.most_played.size() == 2 && info.most_played[1].play_count == 1);
        ASSERT(info.total_size_mb >= 0.0 && info.total_size_mb < 0.01);
    }

    // --- file deleted behind our back ---
    {
        fs::remove(dir + "/" + other + ".mp3");
        CacheIndex index(dir);
        ASSERT(index.open().is_ok());
        ASSERT(index.size() == 2);
        ASSERT(!index.is_cached(other));
        ASSERT(index.is_cached(id));
    }

    // --- corrupt metadata ---
    {
        write_file(dir + "/metadata.json", "{ truncated");
        test::LogCapture logs;
        CacheIndex index(dir);
        ASSERT(index.open().is_ok());
        ASSERT(index.size() == 0);
        ASSERT(!index.is_cached(id));
        ASSERT(logs.contains("CACHE_ERROR"));
    }

    std::error_code ec;
    fs::remove_all(fs::path(dir).parent_path(), ec);

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All cache index tests passed.\n";
    return 0;
}

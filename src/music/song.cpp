#include "music/song.h"
#include "utils.h"
#include <openssl/evp.h>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace taco {
namespace music {

std::string make_song_id(const std::string& video_id,
                         const std::string& title,
                         const std::string& artist) {
    const std::string key = utils::normalize_copy(video_id + "_" + title + "_" + artist);

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    EVP_Digest(key.data(), key.size(), digest, &digest_len, EVP_md5(), nullptr);

    std::ostringstream hex;
    hex << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_len && i < 6; ++i) {
        hex << std::setw(2) << static_cast<int>(digest[i]);
    }
    return hex.str();
}

std::string local_timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm_buf;
    localtime_r(&now, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return buf;
}

} // namespace music
} // namespace taco

#include "wake/wake_word_detector.h"
#include "logger.h"
#include "path_utils.h"
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace taco {
namespace wake {

Result<std::string> resolve_keyword_path(const WakeWordConfig& config) {
    if (!config.keyword_path.empty()) {
        std::error_code ec;
        if (fs::is_regular_file(config.keyword_path, ec)) {
            return config.keyword_path;
        }
        return make_error(ErrorType::ModelError, "Keyword file not found: " + config.keyword_path);
    }

    const std::string platform = keyword_platform_suffix();
    std::vector<std::string> candidates = {
        "Hi-Taco_en_" + platform + "_v3_0_0.ppn",
        "Hi-Taco_en_raspberry-pi_v3_0_0.ppn"
    };

    std::string tried;
    for (const auto& name : candidates) {
        fs::path candidate = fs::path(config.keyword_dir) / name;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) {
            LOG_WAKE("Using keyword file: " + name);
            return candidate.string();
        }
        if (!tried.empty()) tried += ", ";
        tried += name;
    }

    return make_error(ErrorType::ModelError,
                      "Hi Taco keyword file not found for platform " + platform +
                      " in " + config.keyword_dir + " (tried: " + tried + ")");
}

} // namespace wake
} // namespace taco

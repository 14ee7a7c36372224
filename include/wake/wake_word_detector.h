#pragma once

#include "common.h"
#include "config.h"
#include "errors.h"
#include <string>

namespace taco {
namespace wake {

/**
 * @brief Abstract keyword spotter
 *
 * The detector dictates the microphone format: the listener opens its input
 * stream at sample_rate() with frame_length() samples per frame.
 */
class IWakeWordDetector {
public:
    virtual ~IWakeWordDetector() = default;

    virtual int sample_rate() const = 0;
    virtual int frame_length() const = 0;

    /**
     * @brief Submit one frame
     * @return Index of the detected keyword, -1 for none, or an error
     */
    virtual Result<int> process(const AudioFrame& frame) = 0;

    virtual std::string keyword_name(int index) const = 0;
};

/**
 * @brief Locate the keyword model file
 *
 * Uses wake_word.keyword_path when set; otherwise searches keyword_dir for
 * Hi-Taco_en_<platform>_v3_0_0.ppn, falling back to the raspberry-pi build.
 * @return Path, or ModelError listing the names tried
 */
Result<std::string> resolve_keyword_path(const WakeWordConfig& config);

} // namespace wake
} // namespace taco

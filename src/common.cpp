#include "common.h"
#include <cmath>

namespace taco {

float frame_rms(const AudioFrame& frame) {
    if (frame.empty()) {
        return 0.0f;
    }
    double sum_sq = 0.0;
    for (auto s : frame) {
        double v = static_cast<double>(s);
        sum_sq += v * v;
    }
    return static_cast<float>(std::sqrt(sum_sq / static_cast<double>(frame.size())));
}

} // namespace taco

#pragma once

#include "wake/wake_word_detector.h"
#include <memory>
#include <string>

struct pv_porcupine;

namespace taco {
namespace wake {

/**
 * @brief Picovoice Porcupine keyword spotter (single keyword)
 */
class PorcupineDetector : public IWakeWordDetector {
public:
    ~PorcupineDetector() override;

    PorcupineDetector(const PorcupineDetector&) = delete;
    PorcupineDetector& operator=(const PorcupineDetector&) = delete;

    /**
     * @brief Initialize Porcupine from config
     * @return Detector, or CredentialError (no access key) / ModelError (keyword or model unusable)
     */
    static Result<std::unique_ptr<PorcupineDetector>> create(const WakeWordConfig& config);

    int sample_rate() const override;
    int frame_length() const override;
    Result<int> process(const AudioFrame& frame) override;
    std::string keyword_name(int index) const override;

private:
    PorcupineDetector(pv_porcupine* handle, std::string keyword);

    pv_porcupine* handle_;
    std::string keyword_;
};

} // namespace wake
} // namespace taco

#include "wake/porcupine_detector.h"
#include "logger.h"
#include <pv_porcupine.h>
#include <sstream>

namespace taco {
namespace wake {

PorcupineDetector::PorcupineDetector(pv_porcupine* handle, std::string keyword)
    : handle_(handle), keyword_(std::move(keyword)) {}

PorcupineDetector::~PorcupineDetector() {
    if (handle_ != nullptr) {
        pv_porcupine_delete(handle_);
        handle_ = nullptr;
    }
}

Result<std::unique_ptr<PorcupineDetector>> PorcupineDetector::create(const WakeWordConfig& config) {
    if (config.access_key.empty()) {
        return make_credential_error(
            "Porcupine access key is required for wake word detection. "
            "Get a free key from https://console.picovoice.ai/ and set PORCUPINE_ACCESS_KEY.");
    }

    auto keyword_path = resolve_keyword_path(config);
    if (keyword_path.is_error()) {
        return keyword_path.error();
    }

    const char* keyword_paths[] = { keyword_path.value().c_str() };
    float sensitivities[] = { config.sensitivity };

    pv_porcupine* handle = nullptr;
    pv_status_t status = pv_porcupine_init(
        config.access_key.c_str(),
        config.model_path.c_str(),
        1,
        keyword_paths,
        sensitivities,
        &handle);

    if (status != PV_STATUS_SUCCESS) {
        std::string reason = pv_status_to_string(status);
        if (status == PV_STATUS_INVALID_ARGUMENT || status == PV_STATUS_ACTIVATION_ERROR ||
            status == PV_STATUS_ACTIVATION_REFUSED || status == PV_STATUS_ACTIVATION_LIMIT_REACHED) {
            return make_credential_error("Porcupine initialization failed: " + reason);
        }
        return make_error(ErrorType::ModelError, "Porcupine initialization failed: " + reason);
    }

    std::ostringstream oss;
    oss << "Porcupine initialized with keyword '" << config.keyword_name << "' (sample rate "
        << pv_sample_rate() << ", frame length " << pv_porcupine_frame_length()
        << ", sensitivity " << config.sensitivity << ")";
    LOG_WAKE(oss.str());

    return std::unique_ptr<PorcupineDetector>(new PorcupineDetector(handle, config.keyword_name));
}

int PorcupineDetector::sample_rate() const {
    return pv_sample_rate();
}

int PorcupineDetector::frame_length() const {
    return pv_porcupine_frame_length();
}

Result<int> PorcupineDetector::process(const AudioFrame& frame) {
    if (static_cast<int>(frame.size()) != frame_length()) {
        return make_error(ErrorType::InvalidState,
                          "Frame has " + std::to_string(frame.size()) + " samples, expected " +
                          std::to_string(frame_length()));
    }

    int32_t keyword_index = -1;
    pv_status_t status = pv_porcupine_process(handle_, frame.data(), &keyword_index);
    if (status != PV_STATUS_SUCCESS) {
        return make_error(ErrorType::ModelError, pv_status_to_string(status));
    }
    return static_cast<int>(keyword_index);
}

std::string PorcupineDetector::keyword_name(int index) const {
    return index == 0 ? keyword_ : std::string();
}

} // namespace wake
} // namespace taco

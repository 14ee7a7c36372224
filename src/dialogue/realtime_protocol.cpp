#include "dialogue/realtime_protocol.h"
#include <openssl/evp.h>

using json = nlohmann::json;

namespace taco {
namespace dialogue {

namespace protocol {

json session_update(const RealtimeConfig& config) {
    return json{
        {"type", "session.update"},
        {"session", {
            {"modalities", {"text", "audio"}},
            {"instructions", config.instructions},
            {"voice", config.voice},
            {"input_audio_format", "pcm16"},
            {"output_audio_format", "pcm16"},
            {"input_audio_transcription", {{"model", config.transcription_model}}}
        }}
    };
}

json audio_append(const AudioFrame& frame) {
    std::vector<uint8_t> bytes = pcm16le_encode(frame);
    return json{
        {"type", "input_audio_buffer.append"},
        {"audio", base64_encode(bytes.data(), bytes.size())}
    };
}

json user_text_item(const std::string& text) {
    return json{
        {"type", "conversation.item.create"},
        {"item", {
            {"type", "message"},
            {"role", "user"},
            {"content", json::array({{{"type", "input_text"}, {"text", text}}})}
        }}
    };
}

json response_create() {
    return json{{"type", "response.create"}};
}

std::string session_url(const RealtimeConfig& config) {
    std::string url = config.endpoint;
    url += (url.find('?') == std::string::npos) ? "?model=" : "&model=";
    url += config.model;
    return url;
}

std::string base64_encode(const uint8_t* data, size_t size) {
    if (size == 0) return "";
    std::string out(4 * ((size + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data, static_cast<int>(size));
    out.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return out;
}

Result<std::vector<uint8_t>> base64_decode(const std::string& text) {
    if (text.empty()) return std::vector<uint8_t>{};
    if (text.size() % 4 != 0) {
        return make_error(ErrorType::ProtocolError, "Invalid base64 length");
    }

    std::vector<uint8_t> out(3 * (text.size() / 4));
    int written = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if (written < 0) {
        return make_error(ErrorType::ProtocolError, "Invalid base64 payload");
    }

    // EVP_DecodeBlock counts padding as zero bytes
    size_t padding = 0;
    if (text[text.size() - 1] == '=') padding++;
    if (text[text.size() - 2] == '=') padding++;
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

std::vector<uint8_t> pcm16le_encode(const AudioFrame& samples) {
    std::vector<uint8_t> bytes;
    bytes.reserve(samples.size() * 2);
    for (Sample s : samples) {
        uint16_t u = static_cast<uint16_t>(s);
        bytes.push_back(static_cast<uint8_t>(u & 0xff));
        bytes.push_back(static_cast<uint8_t>(u >> 8));
    }
    return bytes;
}

AudioBuffer pcm16le_decode(const std::vector<uint8_t>& bytes) {
    AudioBuffer samples(bytes.size() / 2);
    for (size_t i = 0; i < samples.size(); ++i) {
        uint16_t u = static_cast<uint16_t>(bytes[2 * i] | (bytes[2 * i + 1] << 8));
        samples[i] = static_cast<Sample>(u);
    }
    return samples;
}

} // namespace protocol

namespace {

Result<RealtimeEvent> event_from_json(const json& j) {
    const std::string type = j.value("type", "");

    if (type == "conversation.item.input_audio_transcription.completed") {
        return RealtimeEvent(TranscriptCompleted{j.value("transcript", "")});
    }

    if (type == "response.audio.delta") {
        auto decoded = protocol::base64_decode(j.value("delta", ""));
        if (decoded.is_error()) {
            return decoded.error();
        }
        AudioDelta delta;
        delta.pcm = protocol::pcm16le_decode(decoded.value());
        return RealtimeEvent(std::move(delta));
    }

    if (type == "response.text.delta" || type == "response.audio_transcript.delta") {
        return RealtimeEvent(TextDelta{j.value("delta", "")});
    }

    if (type == "response.done") {
        return RealtimeEvent(ResponseDone{});
    }

    if (type == "input_audio_buffer.speech_started") {
        return RealtimeEvent(SpeechStarted{});
    }

    if (type == "error") {
        std::string msg;
        if (j.contains("error") && j["error"].is_object()) {
            msg = j["error"].value("message", j["error"].dump());
        } else if (j.contains("error")) {
            msg = j["error"].dump();
        }
        return RealtimeEvent(ErrorEvent{msg});
    }

    return RealtimeEvent(OtherEvent{type});
}

} // namespace

Result<RealtimeEvent> parse_event(const std::string& message) {
    try {
        json j = json::parse(message);
        if (!j.is_object()) {
            return make_error(ErrorType::ProtocolError, "Server message is not an object");
        }
        return event_from_json(j);
    } catch (const json::exception& e) {
        return make_error(ErrorType::ProtocolError, std::string("Malformed server message: ") + e.what());
    }
}

} // namespace dialogue
} // namespace taco

#pragma once

/**
 * @file realtime_protocol.h
 * @brief Realtime dialogue wire format: inbound event parsing, outbound builders
 */

#include "common.h"
#include "config.h"
#include "errors.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace taco {
namespace dialogue {

/// conversation.item.input_audio_transcription.completed
struct TranscriptCompleted { std::string transcript; };

/// response.audio.delta, payload already decoded to PCM16 @ 24 kHz mono
struct AudioDelta { AudioBuffer pcm; };

/// response.text.delta / response.audio_transcript.delta
struct TextDelta { std::string text; };

/// response.done
struct ResponseDone {};

/// input_audio_buffer.speech_started
struct SpeechStarted {};

/// error envelope
struct ErrorEvent { std::string message; };

/// Anything else the engine sends (session.created, rate_limits.updated, ...)
struct OtherEvent { std::string type; };

using RealtimeEvent = std::variant<TranscriptCompleted, AudioDelta, TextDelta, ResponseDone,
                                   SpeechStarted, ErrorEvent, OtherEvent>;

/**
 * @brief Parse one inbound message
 * @return Event, or ProtocolError for malformed JSON / payloads
 */
Result<RealtimeEvent> parse_event(const std::string& message);

namespace protocol {

/**
 * @brief session.update: text+audio, voice, pcm16 both ways, input transcription
 */
nlohmann::json session_update(const RealtimeConfig& config);

/**
 * @brief input_audio_buffer.append carrying base64 PCM16
 */
nlohmann::json audio_append(const AudioFrame& frame);

/**
 * @brief conversation.item.create for a user text turn
 */
nlohmann::json user_text_item(const std::string& text);

nlohmann::json response_create();

/**
 * @brief wss URL with the model query parameter
 */
std::string session_url(const RealtimeConfig& config);

std::string base64_encode(const uint8_t* data, size_t size);

/**
 * @brief Decode standard base64 (padding required, whitespace not allowed)
 */
Result<std::vector<uint8_t>> base64_decode(const std::string& text);

/**
 * @brief Serialize samples in wire order (PCM16 little-endian) regardless of host byte order
 */
std::vector<uint8_t> pcm16le_encode(const AudioFrame& samples);

/**
 * @brief Assemble PCM16 little-endian bytes into samples; a trailing odd byte is dropped
 */
AudioBuffer pcm16le_decode(const std::vector<uint8_t>& bytes);

} // namespace protocol

} // namespace dialogue
} // namespace taco

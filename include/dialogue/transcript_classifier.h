#pragma once

#include "music/music_commands.h"
#include <string>
#include <variant>
#include <vector>

namespace taco {
namespace dialogue {

/// Utterance is a music request
struct MusicIntent { music::MusicCommand command; };

/// Utterance contains an end-of-conversation phrase
struct EndIntent { std::string phrase; };

/// Anything else: the dialogue engine answers it
struct OrdinaryIntent {};

using TranscriptIntent = std::variant<MusicIntent, EndIntent, OrdinaryIntent>;

/**
 * @brief Classify a completed user transcript
 *
 * Music grammar is checked first, so "stop the music" is a music command
 * while a bare "stop" ends the conversation. End phrases match as
 * case-insensitive substrings ("ok thanks, bye" ends the session).
 */
TranscriptIntent classify_transcript(const std::string& transcript,
                                     const std::vector<std::string>& end_phrases);

/**
 * @brief First end phrase contained in transcript (case-insensitive), or empty
 */
std::string find_end_phrase(const std::string& transcript,
                            const std::vector<std::string>& end_phrases);

} // namespace dialogue
} // namespace taco

#include "dialogue/transcript_classifier.h"
#include "utils.h"

namespace taco {
namespace dialogue {

std::string find_end_phrase(const std::string& transcript,
                            const std::vector<std::string>& end_phrases) {
    std::string lowered = utils::normalize_copy(transcript);
    for (const auto& phrase : end_phrases) {
        std::string needle = utils::normalize_copy(utils::trim_copy(phrase));
        if (needle.empty()) continue;
        if (lowered.find(needle) != std::string::npos) {
            return needle;
        }
    }
    return "";
}

TranscriptIntent classify_transcript(const std::string& transcript,
                                     const std::vector<std::string>& end_phrases) {
    if (auto command = music::parse_music_command(transcript)) {
        return MusicIntent{*command};
    }

    std::string phrase = find_end_phrase(transcript, end_phrases);
    if (!phrase.empty()) {
        return EndIntent{phrase};
    }
    return OrdinaryIntent{};
}

} // namespace dialogue
} // namespace taco

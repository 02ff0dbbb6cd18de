#include "translate/translator.hpp"
#include "stt/stt_error.hpp"

#include <map>

std::string languageName(const std::string& code) {
    static const std::map<std::string, std::string> kNames = {
        {"en", "English"}, {"es", "Spanish"}, {"fr", "French"}, {"de", "German"},
        {"ar", "Arabic"},  {"ru", "Russian"}, {"zh", "Chinese"},
    };
    auto it = kNames.find(code);
    return it != kNames.end() ? it->second : code;
}

SegmentList translateSegments(Translator& translator, const SegmentList& segments,
                              const std::string& targetLang,
                              const ProgressSink& onProgress, const SegmentSink& onSegment) {
    SegmentList out;
    out.reserve(segments.size());

    for (std::size_t i = 0; i < segments.size(); ++i) {
        const Segment& source = segments[i];
        const std::string position = std::to_string(i + 1) + "/" + std::to_string(segments.size());
        if (onProgress) onProgress("Translating segment " + position + "...");

        std::string translated;
        try {
            translated = translator.translate(source.text, targetLang);
        } catch (const std::exception& e) {
            throw SttError(SttErrorKind::TranslationFailure,
                           "failed to translate segment " + std::to_string(i + 1) + ": " + e.what());
        }

        Segment segment;
        segment.start = source.start;
        segment.end = source.end;
        segment.speaker = source.speaker;
        segment.original = source.text;
        segment.translation = translated;
        segment.text = translated;
        out.push_back(segment);

        if (onSegment) onSegment(out.back());
    }
    return out;
}

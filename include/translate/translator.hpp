#ifndef TRANSLATOR_HPP
#define TRANSLATOR_HPP

#include "stt/segment.hpp"

#include <string>

// Remote text translation service
class Translator {
public:
    virtual ~Translator() = default;

    // Throws SttError TranslationFailure
    virtual std::string translate(const std::string& text, const std::string& targetLang) = 0;
};

// Translates segments one by one, in order. Each result keeps the timing
// and speaker of its source, carries the source text in `original` and the
// translated text in both `text` and `translation`. The first failure
// aborts the whole list.
SegmentList translateSegments(Translator& translator, const SegmentList& segments,
                              const std::string& targetLang,
                              const ProgressSink& onProgress = nullptr,
                              const SegmentSink& onSegment = nullptr);

// "en" -> "English"; unknown codes are returned as given
std::string languageName(const std::string& code);

#endif

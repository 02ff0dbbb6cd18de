/**
 * @file test_translator.cpp
 * @brief Tests for segment translation and the Ollama request/response codec
 */

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <cctype>
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "stt/stt_error.hpp"
#include "translate/ollama_translator.hpp"
#include "translate/translator.hpp"

namespace {

// Upper-cases its input; fails on a configured text
class FakeTranslator : public Translator {
public:
    std::string translate(const std::string& text, const std::string& targetLang) override {
        calls.push_back(text + "|" + targetLang);
        if (text == failOn) throw std::runtime_error("service unavailable");
        std::string out = text;
        for (auto& c : out) c = (char)std::toupper((unsigned char)c);
        return out;
    }

    std::string failOn;
    std::vector<std::string> calls;
};

Segment seg(double start, double end, const std::string& text, int speaker) {
    Segment s;
    s.start = start;
    s.end = end;
    s.text = text;
    s.speaker = speaker;
    return s;
}

}  // namespace

// =============================================================================
// SEGMENT TRANSLATION
// =============================================================================

TEST(TranslateSegments, KeepsTimingAndSpeaker) {
    FakeTranslator translator;
    SegmentList source = {seg(0, 1.5, "shalom", 0), seg(1.5, 3, "toda", 2)};

    auto out = translateSegments(translator, source, "en");

    ASSERT_EQ(out.size(), 2u);
    EXPECT_DOUBLE_EQ(out[1].start, 1.5);
    EXPECT_DOUBLE_EQ(out[1].end, 3.0);
    EXPECT_EQ(out[1].speaker, 2);
    EXPECT_EQ(out[1].original, "toda");
    EXPECT_EQ(out[1].translation, "TODA");
    EXPECT_EQ(out[1].text, "TODA");
    EXPECT_EQ(translator.calls, (std::vector<std::string>{"shalom|en", "toda|en"}));
}

TEST(TranslateSegments, ReportsProgressAndStreams) {
    FakeTranslator translator;
    SegmentList source = {seg(0, 1, "a", 0), seg(1, 2, "b", 0)};

    std::vector<std::string> messages;
    SegmentList streamed;
    auto out = translateSegments(translator, source, "fr",
                                 [&](const std::string& m) { messages.push_back(m); },
                                 [&](const Segment& s) { streamed.push_back(s); });

    EXPECT_EQ(messages, (std::vector<std::string>{"Translating segment 1/2...", "Translating segment 2/2..."}));
    EXPECT_EQ(streamed, out);
}

TEST(TranslateSegments, FirstFailureAbortsTheList) {
    FakeTranslator translator;
    translator.failOn = "b";
    SegmentList source = {seg(0, 1, "a", 0), seg(1, 2, "b", 0), seg(2, 3, "c", 0)};

    try {
        translateSegments(translator, source, "en");
        FAIL() << "expected SttError";
    } catch (const SttError& e) {
        EXPECT_EQ(e.kind(), SttErrorKind::TranslationFailure);
        EXPECT_NE(std::string(e.what()).find("segment 2"), std::string::npos);
    }
    EXPECT_EQ(translator.calls.size(), 2u);
}

TEST(TranslateSegments, EmptyInput) {
    FakeTranslator translator;
    EXPECT_TRUE(translateSegments(translator, {}, "en").empty());
    EXPECT_TRUE(translator.calls.empty());
}

TEST(Translator, LanguageNames) {
    EXPECT_EQ(languageName("en"), "English");
    EXPECT_EQ(languageName("de"), "German");
    EXPECT_EQ(languageName("xx"), "xx");
}

// =============================================================================
// OLLAMA CODEC
// =============================================================================

TEST(OllamaTranslator, PromptNamesTargetLanguage) {
    const std::string prompt = OllamaTranslator::buildPrompt("shalom", "es");
    EXPECT_NE(prompt.find("to Spanish."), std::string::npos);
    EXPECT_NE(prompt.find("Hebrew text: shalom"), std::string::npos);
    EXPECT_EQ(prompt.substr(prompt.size() - 20), "Spanish translation:");
}

TEST(OllamaTranslator, RequestBody) {
    OllamaTranslator::Config config;
    config.model = "llama3:8b";
    OllamaTranslator translator(config);

    auto body = nlohmann::json::parse(translator.buildRequest("shalom", "en"));
    EXPECT_EQ(body["model"], "llama3:8b");
    EXPECT_EQ(body["stream"], false);
    EXPECT_EQ(body["prompt"], OllamaTranslator::buildPrompt("shalom", "en"));
}

TEST(OllamaTranslator, ParsesTrimmedResponse) {
    EXPECT_EQ(OllamaTranslator::parseResponse(R"({"model":"m","response":"  Hello there \n","done":true})"),
              "Hello there");
}

TEST(OllamaTranslator, BadResponsesAreTranslationFailures) {
    for (const std::string body : {"not json", "[]", R"({"done":true})", R"({"response":42})"}) {
        try {
            OllamaTranslator::parseResponse(body);
            ADD_FAILURE() << "expected SttError for " << body;
        } catch (const SttError& e) {
            EXPECT_EQ(e.kind(), SttErrorKind::TranslationFailure) << body;
        }
    }
}

TEST(OllamaTranslator, EmptyTextSkipsTheService) {
    OllamaTranslator::Config config;
    config.host = "service.invalid";
    OllamaTranslator translator(config);
    EXPECT_EQ(translator.translate("", "en"), "");
}

TEST(OllamaTranslator, UnreachableServiceIsTranslationFailure) {
    OllamaTranslator::Config config;
    config.host = "127.0.0.1";
    config.port = 1;
    config.timeout = std::chrono::milliseconds(500);
    OllamaTranslator translator(config);

    try {
        translator.translate("shalom", "en");
        FAIL() << "expected SttError";
    } catch (const SttError& e) {
        EXPECT_EQ(e.kind(), SttErrorKind::TranslationFailure);
    }
}

/**
 * @file test_pipeline.cpp
 * @brief Tests for the transcribe -> translate pipeline
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>

#include "fake_engine.hpp"
#include "pipeline/transcription_pipeline.hpp"
#include "stt/stt_error.hpp"
#include "stt/stt_runtime.hpp"

using namespace std::chrono_literals;

namespace {

class FakeTranslator : public Translator {
public:
    std::string translate(const std::string& text, const std::string& targetLang) override {
        ++calls;
        if (fail) throw std::runtime_error("service unavailable");
        return text + "@" + targetLang;
    }

    bool fail = false;
    int calls = 0;
};

TranscriptionEngine::Config fastConfig() {
    TranscriptionEngine::Config config;
    config.pollInterval = 5ms;
    return config;
}

}  // namespace

class PipelineTest : public ::testing::Test {
protected:
    PipelineTest()
        : dir_({"turbo"}),
          catalog_(dir_.catalog()),
          runtime_(engine_),
          transcriber_(runtime_, preparer_, catalog_, fastConfig()),
          pipeline_(transcriber_, &translator_) {
        FakeScript script;
        script.segments = {rawSegment(0, 100, "shalom", true), rawSegment(100, 250, "toda")};
        engine_.setScript(dir_.modelPath("turbo"), script);
    }

    TranscriptionJob job(const std::string& translateTo = "") {
        TranscriptionJob j;
        j.inputPath = "a.wav";
        j.modelId = "turbo";
        j.translateTo = translateTo;
        return j;
    }

    SttErrorKind failureKind(const TranscriptionJob& j, const std::atomic<bool>* stop = nullptr) {
        try {
            pipeline_.run(j, nullptr, nullptr, stop);
        } catch (const SttError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "expected SttError";
        return SttErrorKind::InferenceFailure;
    }

    ModelDir dir_;
    FakeEngine engine_;
    FakeAudioPreparer preparer_;
    FakeTranslator translator_;
    ModelCatalog catalog_;
    SttRuntime runtime_;
    TranscriptionEngine transcriber_;
    TranscriptionPipeline pipeline_;
};

// =============================================================================
// TRANSCRIPTION ONLY
// =============================================================================

TEST_F(PipelineTest, PlainJobStreamsAndReturnsSegments) {
    SegmentList streamed;
    auto out = pipeline_.run(job(), nullptr, [&](const Segment& s) { streamed.push_back(s); });

    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].text, "shalom");
    EXPECT_EQ(out[1].speaker, 1);
    EXPECT_EQ(streamed, out);
    EXPECT_EQ(translator_.calls, 0);
}

// =============================================================================
// TEXT TRANSLATION
// =============================================================================

TEST_F(PipelineTest, TextTranslationKeepsOriginal) {
    std::vector<std::string> messages;
    SegmentList streamed;
    auto out = pipeline_.run(job("en"), [&](const std::string& m) { messages.push_back(m); },
                             [&](const Segment& s) { streamed.push_back(s); });

    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].original, "shalom");
    EXPECT_EQ(out[0].translation, "shalom@en");
    EXPECT_EQ(out[0].text, "shalom@en");
    EXPECT_EQ(out[1].speaker, 1);
    EXPECT_EQ(translator_.calls, 2);

    // Only translated segments reach the caller
    EXPECT_EQ(streamed, out);

    EXPECT_FALSE(engine_.lastParams().translate);
    EXPECT_NE(std::find(messages.begin(), messages.end(), "Translating to English..."), messages.end());
    EXPECT_EQ(messages.back(), "Translation complete");
}

TEST_F(PipelineTest, TextTranslationReusesCachedTranscription) {
    pipeline_.run(job());
    pipeline_.run(job("fr"));

    EXPECT_EQ(engine_.runCount(), 1);
    EXPECT_EQ(translator_.calls, 2);
}

TEST_F(PipelineTest, DropOriginalWhenNotKept) {
    auto j = job("en");
    j.keepOriginal = false;

    SegmentList streamed;
    auto out = pipeline_.run(j, nullptr, [&](const Segment& s) { streamed.push_back(s); });

    ASSERT_EQ(out.size(), 2u);
    EXPECT_TRUE(out[0].original.empty());
    EXPECT_EQ(out[0].text, "shalom@en");
    EXPECT_EQ(streamed, out);
}

TEST_F(PipelineTest, TranslationFailureFailsTheJob) {
    translator_.fail = true;
    EXPECT_EQ(failureKind(job("en")), SttErrorKind::TranslationFailure);
    EXPECT_EQ(engine_.runCount(), 1);
}

TEST_F(PipelineTest, MissingTranslatorIsTranslationFailure) {
    TranscriptionPipeline bare(transcriber_, nullptr);
    try {
        bare.run(job("en"));
        FAIL() << "expected SttError";
    } catch (const SttError& e) {
        EXPECT_EQ(e.kind(), SttErrorKind::TranslationFailure);
    }
}

// =============================================================================
// NATIVE TRANSLATION
// =============================================================================

TEST_F(PipelineTest, NativeTranslationUsesTheEngine) {
    auto j = job("en");
    j.nativeTranslation = true;
    auto out = pipeline_.run(j);

    EXPECT_TRUE(engine_.lastParams().translate);
    EXPECT_EQ(translator_.calls, 0);
    EXPECT_EQ(out.size(), 2u);
    EXPECT_TRUE(out[0].original.empty());
    EXPECT_FALSE(runtime_.transcriptions().contains({"a.wav", "turbo"}));
}

TEST_F(PipelineTest, NativeTranslationFallsBackForOtherTargets) {
    auto j = job("de");
    j.nativeTranslation = true;
    auto out = pipeline_.run(j);

    EXPECT_FALSE(engine_.lastParams().translate);
    EXPECT_EQ(translator_.calls, 2);
    EXPECT_EQ(out[0].text, "shalom@de");
}

// =============================================================================
// CANCELLATION
// =============================================================================

TEST_F(PipelineTest, StopBeforeStart) {
    std::atomic<bool> stop{true};
    EXPECT_EQ(failureKind(job(), &stop), SttErrorKind::Cancelled);
    EXPECT_EQ(engine_.runCount(), 0);
    EXPECT_EQ(preparer_.calls(), 0);
}

TEST_F(PipelineTest, StopAfterTranscriptionSkipsTranslation) {
    std::atomic<bool> stop{false};
    auto onProgress = [&](const std::string& m) {
        if (m.rfind("Transcription complete", 0) == 0) stop = true;
    };

    try {
        pipeline_.run(job("en"), onProgress, nullptr, &stop);
        FAIL() << "expected SttError";
    } catch (const SttError& e) {
        EXPECT_EQ(e.kind(), SttErrorKind::Cancelled);
    }
    EXPECT_EQ(engine_.runCount(), 1);
    EXPECT_EQ(translator_.calls, 0);
}

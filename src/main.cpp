#include "audio/audio_preparer.hpp"
#include "config/model_catalog.hpp"
#include "output/output_format.hpp"
#include "pipeline/transcription_pipeline.hpp"
#include "stt/stt_error.hpp"
#include "stt/stt_runtime.hpp"
#include "stt/transcription_engine.hpp"
#include "stt/whisper_engine.hpp"
#include "translate/ollama_translator.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>

static std::atomic<bool> g_stop{false};

static void on_sigint(int) { g_stop.store(true); }

struct CliOptions {
    std::string input;
    std::string output;
    std::string model = "turbo";
    std::string format = "text";
    int threads = 0;  // 0: auto
    bool translate = false;
    std::string lang = "en";
    bool keepOriginal = true;
    bool nativeTranslate = false;

    std::string ffmpeg = "ffmpeg";
    std::string ollamaHost = "localhost";
    int ollamaPort = 11434;
    std::string ollamaModel = "mistral:latest";
};

static void print_usage(const char* prog) {
    std::cerr << "\n"
              << "usage: " << prog << " -i <audio-file> [options]\n\n"
              << "Hebrew speech transcription with whisper.cpp\n\n"
              << "options:\n"
              << "  -h,  --help               show this help message and exit\n"
              << "  -i,  --input PATH         input audio or video file (required)\n"
              << "  -o,  --output PATH        output file (default: <input>_transcription.<ext>)\n"
              << "  -m,  --model ID           model id: large-v3, turbo or base (default: turbo)\n"
              << "  -f,  --format NAME        text, json, srt or vtt (default: text)\n"
              << "  -t,  --threads N          CPU threads, 0 = auto (default: 0)\n"
              << "       --translate          translate the transcription\n"
              << "  -l,  --lang CODE          translation target: en, es, fr, de, ... (default: en)\n"
              << "       --no-original        drop the Hebrew text when translating\n"
              << "       --native-translate   translate to English inside whisper.cpp\n"
              << "       --ffmpeg PATH        ffmpeg binary (default: ffmpeg)\n"
              << "       --ollama-host HOST   translation service host (default: localhost)\n"
              << "       --ollama-port PORT   translation service port (default: 11434)\n"
              << "       --ollama-model NAME  translation model (default: mistral:latest)\n"
              << "\nexamples:\n"
              << "  " << prog << " -i recording.m4a\n"
              << "  " << prog << " -i video.mp4 -m large-v3 -f srt -o subtitles.srt\n"
              << "  " << prog << " -i audio.wav --translate -l en --no-original\n\n";
}

// Returns false on a malformed command line
static bool parse_args(int argc, char** argv, CliOptions& opts, bool& help) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto value = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "error: " << arg << " requires a value\n";
                return false;
            }
            out = argv[++i];
            return true;
        };
        auto number = [&](int& out) {
            std::string s;
            if (!value(s)) return false;
            try {
                out = std::stoi(s);
            } catch (const std::exception&) {
                std::cerr << "error: " << arg << " expects a number, got '" << s << "'\n";
                return false;
            }
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            help = true;
        } else if (arg == "-i" || arg == "--input") {
            if (!value(opts.input)) return false;
        } else if (arg == "-o" || arg == "--output") {
            if (!value(opts.output)) return false;
        } else if (arg == "-m" || arg == "--model") {
            if (!value(opts.model)) return false;
        } else if (arg == "-f" || arg == "--format") {
            if (!value(opts.format)) return false;
        } else if (arg == "-t" || arg == "--threads") {
            if (!number(opts.threads)) return false;
        } else if (arg == "--translate") {
            opts.translate = true;
        } else if (arg == "-l" || arg == "--lang") {
            if (!value(opts.lang)) return false;
        } else if (arg == "--no-original") {
            opts.keepOriginal = false;
        } else if (arg == "--native-translate") {
            opts.nativeTranslate = true;
        } else if (arg == "--ffmpeg") {
            if (!value(opts.ffmpeg)) return false;
        } else if (arg == "--ollama-host") {
            if (!value(opts.ollamaHost)) return false;
        } else if (arg == "--ollama-port") {
            if (!number(opts.ollamaPort)) return false;
        } else if (arg == "--ollama-model") {
            if (!value(opts.ollamaModel)) return false;
        } else {
            std::cerr << "error: unknown argument: " << arg << "\n";
            return false;
        }
    }
    return true;
}

int main(int argc, char** argv) {
    CliOptions opts;
    bool help = false;
    if (!parse_args(argc, argv, opts, help)) {
        print_usage(argv[0]);
        return 1;
    }
    if (help || opts.input.empty()) {
        print_usage(argv[0]);
        return help ? 0 : 1;
    }

    std::error_code ec;
    if (!std::filesystem::exists(opts.input, ec)) {
        std::cerr << "[Transcriber] [ERROR] Input file does not exist: " << opts.input << std::endl;
        return 1;
    }

    const auto format = parseOutputFormat(opts.format);
    if (!format) {
        std::cerr << "[Transcriber] [ERROR] Invalid format '" << opts.format
                  << "'. Valid options: text, json, srt, vtt" << std::endl;
        return 1;
    }

    ModelCatalog catalog = ModelCatalog::load();
    if (!catalog.contains(opts.model)) {
        std::cerr << "[Transcriber] [ERROR] Invalid model '" << opts.model << "'. Valid options:";
        for (const auto& id : catalog.ids()) std::cerr << " " << id;
        std::cerr << std::endl;
        return 1;
    }

    if (opts.output.empty()) {
        const std::filesystem::path in(opts.input);
        opts.output = (in.parent_path() / (in.stem().string() + "_transcription." + fileExtension(*format))).string();
    }

    const int threads = opts.threads > 0 ? opts.threads : optimalThreadCount();

    std::cout << "Starting transcription...\n"
              << "  Input:   " << opts.input << "\n"
              << "  Output:  " << opts.output << "\n"
              << "  Model:   " << opts.model << "\n"
              << "  Format:  " << opts.format << "\n"
              << "  Threads: " << threads << "\n";
    if (opts.translate) {
        std::cout << "  Translation: enabled (target: " << opts.lang
                  << ", keep original: " << (opts.keepOriginal ? "yes" : "no") << ")\n";
    }
    std::cout << std::endl;

    std::signal(SIGINT, on_sigint);

    WhisperEngine whisper;
    SttRuntime runtime(whisper);

    FfmpegAudioPreparer::Config prepConfig;
    prepConfig.ffmpegPath = opts.ffmpeg;
    FfmpegAudioPreparer preparer(prepConfig);

    OllamaTranslator::Config ollamaConfig;
    ollamaConfig.host = opts.ollamaHost;
    ollamaConfig.port = opts.ollamaPort;
    ollamaConfig.model = opts.ollamaModel;
    OllamaTranslator translator(ollamaConfig);

    TranscriptionEngine engine(runtime, preparer, catalog);
    TranscriptionPipeline pipeline(engine, &translator);

    TranscriptionJob job;
    job.inputPath = opts.input;
    job.modelId = opts.model;
    job.threads = threads;
    if (opts.translate) job.translateTo = opts.lang;
    job.keepOriginal = opts.keepOriginal;
    job.nativeTranslation = opts.nativeTranslate;

    SegmentList segments;
    std::string failure;

    // Inference blocks its thread for the whole run
    std::thread worker([&] {
        try {
            segments = pipeline.run(job, [](const std::string& msg) { std::cout << consoleStatusLine(msg) << std::flush; },
                                    nullptr, &g_stop);
        } catch (const SttError& e) {
            failure = std::string(toString(e.kind())) + ": " + e.what();
        } catch (const std::exception& e) {
            failure = e.what();
        }
    });
    worker.join();

    runtime.shutdown();

    if (!failure.empty()) {
        std::cerr << "\n[Transcriber] [ERROR] " << failure << std::endl;
        return 1;
    }

    std::cout << "\nTranscription complete (" << segments.size() << " segments)" << std::endl;

    std::ofstream out(opts.output, std::ios::binary);
    if (!out) {
        std::cerr << "[Transcriber] [ERROR] Cannot write output file: " << opts.output << std::endl;
        return 1;
    }
    out << formatOutput(segments, *format);
    if (!out) {
        std::cerr << "[Transcriber] [ERROR] Failed writing output file: " << opts.output << std::endl;
        return 1;
    }

    std::cout << "Saved to: " << opts.output << std::endl;
    return 0;
}

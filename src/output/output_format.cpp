#include "output/output_format.hpp"
#include "util/utf8.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdio>

// Right-to-left embedding / pop directional formatting
static const char kRle[] = "\xE2\x80\xAB";
static const char kPdf[] = "\xE2\x80\xAC";

static bool isBilingual(const Segment& seg) {
    return !seg.original.empty() && !seg.translation.empty();
}

static std::string rtl(const std::string& text) {
    return kRle + text + kPdf;
}

static double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

std::optional<OutputFormat> parseOutputFormat(const std::string& name) {
    if (name == "text" || name == "txt") return OutputFormat::Text;
    if (name == "json") return OutputFormat::Json;
    if (name == "srt") return OutputFormat::Srt;
    if (name == "vtt") return OutputFormat::Vtt;
    return std::nullopt;
}

const char* fileExtension(OutputFormat format) {
    switch (format) {
        case OutputFormat::Text: return "txt";
        case OutputFormat::Json: return "json";
        case OutputFormat::Srt: return "srt";
        case OutputFormat::Vtt: return "vtt";
    }
    return "txt";
}

std::string formatTimestamp(double seconds, bool vtt) {
    if (seconds < 0) seconds = 0;
    const long long totalMs = std::llround(seconds * 1000.0);

    const long long hours = totalMs / 3600000;
    const long long minutes = (totalMs / 60000) % 60;
    const long long secs = (totalMs / 1000) % 60;
    const long long millis = totalMs % 1000;

    char buff[32];
    std::snprintf(buff, sizeof(buff), "%02lld:%02lld:%02lld%c%03lld",
                  hours, minutes, secs, vtt ? '.' : ',', millis);
    return buff;
}

static std::string formatText(const SegmentList& segments) {
    std::string out;
    int lastSpeaker = -1;
    for (const auto& seg : segments) {
        std::string prefix;
        if (seg.speaker != lastSpeaker) {
            prefix = "Speaker " + std::to_string(seg.speaker + 1) + ": ";
            lastSpeaker = seg.speaker;
        }

        if (isBilingual(seg)) {
            out += prefix + rtl(seg.original) + "\n";
            if (!prefix.empty()) out += std::string(prefix.size(), ' ');
            out += seg.translation + "\n\n";
        } else {
            out += prefix + (containsHebrew(seg.text) ? rtl(seg.text) : seg.text) + "\n";
        }
    }
    return out;
}

static std::string formatJson(const SegmentList& segments) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& seg : segments) {
        nlohmann::json obj;
        obj["start"] = round2(seg.start);
        obj["end"] = round2(seg.end);
        obj["speaker"] = seg.speaker + 1;
        if (isBilingual(seg)) {
            obj["original"] = seg.original;
            obj["translation"] = seg.translation;
        } else {
            obj["text"] = seg.text;
        }
        arr.push_back(obj);
    }
    return arr.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

static std::string formatSrt(const SegmentList& segments) {
    std::string out;
    int lastSpeaker = -1;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        const Segment& seg = segments[i];

        std::string label;
        if (seg.speaker != lastSpeaker) {
            label = "[Speaker " + std::to_string(seg.speaker + 1) + "] ";
            lastSpeaker = seg.speaker;
        }

        out += std::to_string(i + 1) + "\n";
        out += formatTimestamp(seg.start, false) + " --> " + formatTimestamp(seg.end, false) + "\n";
        if (isBilingual(seg)) {
            out += label + seg.original + "\n" + seg.translation + "\n\n";
        } else {
            out += label + seg.text + "\n\n";
        }
    }
    return out;
}

static std::string formatVtt(const SegmentList& segments) {
    std::string out = "WEBVTT\n\n";
    int lastSpeaker = -1;
    for (const auto& seg : segments) {
        std::string label;
        if (seg.speaker != lastSpeaker) {
            label = "<v Speaker " + std::to_string(seg.speaker + 1) + ">";
            lastSpeaker = seg.speaker;
        }

        out += formatTimestamp(seg.start, true) + " --> " + formatTimestamp(seg.end, true) + "\n";
        if (isBilingual(seg)) {
            out += label + seg.original + "\n" + seg.translation + "\n\n";
        } else {
            out += label + seg.text + "\n\n";
        }
    }
    return out;
}

std::string consoleStatusLine(const std::string& message) {
    return "\r" + message + "\033[K";
}

std::string formatOutput(const SegmentList& segments, OutputFormat format) {
    switch (format) {
        case OutputFormat::Text: return formatText(segments);
        case OutputFormat::Json: return formatJson(segments);
        case OutputFormat::Srt: return formatSrt(segments);
        case OutputFormat::Vtt: return formatVtt(segments);
    }
    return {};
}

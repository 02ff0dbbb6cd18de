#ifndef OUTPUT_FORMAT_HPP
#define OUTPUT_FORMAT_HPP

#include "stt/segment.hpp"

#include <optional>
#include <string>

enum class OutputFormat { Text, Json, Srt, Vtt };

std::optional<OutputFormat> parseOutputFormat(const std::string& name);

// "txt", "json", "srt", "vtt"
const char* fileExtension(OutputFormat format);

// HH:MM:SS,mmm (SRT) or HH:MM:SS.mmm (VTT)
std::string formatTimestamp(double seconds, bool vtt);

// Speaker numbers are printed 1-based. Segments carrying both an original
// and a translation print both.
std::string formatOutput(const SegmentList& segments, OutputFormat format);

// Carriage return, message, then erase to end of line, so a shorter
// message fully replaces the previous one on a terminal
std::string consoleStatusLine(const std::string& message);

#endif

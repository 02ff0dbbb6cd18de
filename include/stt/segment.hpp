#ifndef SEGMENT_HPP
#define SEGMENT_HPP

#include <functional>
#include <string>
#include <vector>

// One timed span of transcribed audio. Times are seconds.
struct Segment {
    double start = 0.0;
    double end = 0.0;
    std::string text;
    int speaker = 0;

    // Set only when the segment went through a translation step
    std::string original;
    std::string translation;
};

inline bool operator==(const Segment& a, const Segment& b) {
    return a.start == b.start && a.end == b.end && a.text == b.text &&
           a.speaker == b.speaker && a.original == b.original &&
           a.translation == b.translation;
}

inline bool operator!=(const Segment& a, const Segment& b) { return !(a == b); }

using SegmentList = std::vector<Segment>;

using ProgressSink = std::function<void(const std::string& message)>;
using SegmentSink = std::function<void(const Segment& segment)>;

// The engine reports timestamps in centiseconds
inline double centisToSeconds(long long centis) { return (double)centis / 100.0; }

#endif

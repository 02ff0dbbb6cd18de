#include "stt/stt_error.hpp"

const char* toString(SttErrorKind kind) {
    switch (kind) {
        case SttErrorKind::NotFound: return "NotFound";
        case SttErrorKind::LoadFailure: return "LoadFailure";
        case SttErrorKind::InvalidAudio: return "InvalidAudio";
        case SttErrorKind::ExternalToolFailure: return "ExternalToolFailure";
        case SttErrorKind::InferenceFailure: return "InferenceFailure";
        case SttErrorKind::TranslationFailure: return "TranslationFailure";
        case SttErrorKind::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

SttError::SttError(SttErrorKind kind, const std::string& message, int code)
    : std::runtime_error(message), kind_(kind), code_(code) {}

#ifndef STT_ERROR_HPP
#define STT_ERROR_HPP

#include <stdexcept>
#include <string>

enum class SttErrorKind {
    NotFound,
    LoadFailure,
    InvalidAudio,
    ExternalToolFailure,
    InferenceFailure,
    TranslationFailure,
    Cancelled
};

const char* toString(SttErrorKind kind);

class SttError : public std::runtime_error {
public:
    SttError(SttErrorKind kind, const std::string& message, int code = 0);

    SttErrorKind kind() const { return kind_; }

    // Native status for InferenceFailure, 0 otherwise
    int code() const { return code_; }

private:
    SttErrorKind kind_;
    int code_;
};

#endif

#ifndef OLLAMA_TRANSLATOR_HPP
#define OLLAMA_TRANSLATOR_HPP

#include "translate/translator.hpp"

#include <chrono>
#include <string>

// Hebrew -> target language through an Ollama /api/generate endpoint
class OllamaTranslator : public Translator {
public:
    struct Config {
        std::string host = "localhost";
        int port = 11434;
        std::string path = "/api/generate";
        std::string model = "mistral:latest";
        std::chrono::milliseconds timeout{120000};
    };

    OllamaTranslator();
    explicit OllamaTranslator(Config config);

    std::string translate(const std::string& text, const std::string& targetLang) override;

    static std::string buildPrompt(const std::string& text, const std::string& targetLang);
    std::string buildRequest(const std::string& text, const std::string& targetLang) const;

    // Extracts the trimmed "response" field. Throws SttError TranslationFailure.
    static std::string parseResponse(const std::string& body);

private:
    Config config_;
};

#endif

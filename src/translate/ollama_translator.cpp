#include "translate/ollama_translator.hpp"
#include "net/http_client.hpp"
#include "stt/stt_error.hpp"

#include <nlohmann/json.hpp>

#include <utility>

static std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// Constructors
OllamaTranslator::OllamaTranslator() : OllamaTranslator(Config{}) {}

OllamaTranslator::OllamaTranslator(Config config) : config_(std::move(config)) {}

std::string OllamaTranslator::buildPrompt(const std::string& text, const std::string& targetLang) {
    const std::string lang = languageName(targetLang);
    return "Translate the following Hebrew text to " + lang +
           ". Only output the translation, nothing else. Keep the formatting the same including timecodes.\n\n"
           "Hebrew text: " + text + "\n\n" + lang + " translation:";
}

std::string OllamaTranslator::buildRequest(const std::string& text, const std::string& targetLang) const {
    nlohmann::json req = {
        {"model", config_.model},
        {"prompt", buildPrompt(text, targetLang)},
        {"stream", false},
    };
    return req.dump();
}

std::string OllamaTranslator::parseResponse(const std::string& body) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw SttError(SttErrorKind::TranslationFailure, std::string("failed to parse response: ") + e.what());
    }

    if (!doc.is_object() || !doc.contains("response") || !doc["response"].is_string()) {
        throw SttError(SttErrorKind::TranslationFailure, "response has no \"response\" field");
    }
    return trim(doc["response"].get<std::string>());
}

std::string OllamaTranslator::translate(const std::string& text, const std::string& targetLang) {
    if (text.empty()) return {};

    HttpResponse resp;
    try {
        HttpClient client(config_.host, config_.port, config_.timeout);
        resp = client.post(config_.path, buildRequest(text, targetLang));
    } catch (const std::runtime_error& e) {
        throw SttError(SttErrorKind::TranslationFailure,
                       std::string("failed to connect to ollama: ") + e.what() + " (is ollama running?)");
    }

    if (resp.status != 200) {
        throw SttError(SttErrorKind::TranslationFailure,
                       "ollama returned status " + std::to_string(resp.status) + ": " + resp.body);
    }
    return parseResponse(resp.body);
}

#include "config/model_catalog.hpp"
#include "stt/stt_error.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

static std::string homeDir() {
    const char* home = std::getenv("HOME");
    return home ? std::string(home) : std::string();
}

// Constructors
ModelCatalog::ModelCatalog() : ModelCatalog(builtinModels()) {}

ModelCatalog::ModelCatalog(std::map<std::string, ModelInfo> models, std::vector<std::string> searchDirs)
    : models_(std::move(models)), searchDirs_(std::move(searchDirs)) {}

std::map<std::string, ModelInfo> ModelCatalog::builtinModels() {
    return {
        {"large-v3", {"ivrit-ai/whisper-large-v3-ggml", "ggml-model.bin",
                      "ggml-large-v3-ivrit.bin", "Ivrit.ai Large v3 - Best quality for Hebrew"}},
        {"turbo", {"ivrit-ai/whisper-large-v3-turbo-ggml", "ggml-model.bin",
                   "ggml-large-v3-turbo-ivrit.bin", "Ivrit.ai Turbo - Faster with good quality"}},
        {"base", {"ggerganov/whisper.cpp", "ggml-base.bin",
                  "ggml-base.bin", "Base model - Fast but lower quality"}},
    };
}

std::vector<std::string> ModelCatalog::defaultSearchDirs() {
    std::vector<std::string> dirs;
    const std::string home = homeDir();
    if (!home.empty()) {
        dirs.push_back((fs::path(home) / ".cache" / "whisper").string());
        dirs.push_back((fs::path(home) / ".local" / "share" / "whisper").string());
    }
    dirs.push_back("/usr/local/share/whisper");
    dirs.push_back("models");
    dirs.push_back(".");
    return dirs;
}

std::vector<std::string> ModelCatalog::defaultConfigPaths() {
    std::vector<std::string> paths = {"models.json", (fs::path("..") / "models.json").string()};
    const std::string home = homeDir();
    if (!home.empty()) {
        paths.push_back((fs::path(home) / ".config" / "ivrit-ai" / "models.json").string());
    }
    return paths;
}

std::map<std::string, ModelInfo> ModelCatalog::parseConfig(const std::string& json) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(json);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::string("invalid models.json: ") + e.what());
    }

    if (!doc.is_object() || !doc.contains("models") || !doc["models"].is_object()) {
        throw std::runtime_error("invalid models.json: missing \"models\" object");
    }

    std::map<std::string, ModelInfo> models;
    for (auto it = doc["models"].begin(); it != doc["models"].end(); ++it) {
        const nlohmann::json& entry = it.value();
        if (!entry.is_object()) continue;

        ModelInfo info;
        info.repoId = entry.value("id", "");
        info.file = entry.value("file", "");
        info.localFileName = entry.value("localFileName", "");
        info.description = entry.value("description", "");
        if (info.repoId.empty()) continue;

        models[it.key()] = info;
    }
    return models;
}

ModelCatalog ModelCatalog::load() {
    for (const auto& path : defaultConfigPaths()) {
        std::ifstream in(path);
        if (!in) continue;

        std::stringstream ss;
        ss << in.rdbuf();
        try {
            auto models = parseConfig(ss.str());
            if (!models.empty()) {
                std::cout << "[Model Catalog] Using " << path << std::endl;
                return ModelCatalog(std::move(models));
            }
        } catch (const std::exception& e) {
            std::cerr << "[Model Catalog] [WARN] Ignoring " << path << ": " << e.what() << std::endl;
        }
    }
    return ModelCatalog();
}

bool ModelCatalog::contains(const std::string& modelId) const {
    return models_.count(modelId) != 0;
}

std::vector<std::string> ModelCatalog::ids() const {
    std::vector<std::string> out;
    for (const auto& entry : models_) out.push_back(entry.first);
    return out;
}

std::optional<ModelInfo> ModelCatalog::info(const std::string& modelId) const {
    auto it = models_.find(modelId);
    if (it == models_.end()) return std::nullopt;
    return it->second;
}

std::string ModelCatalog::resolve(const std::string& modelId) const {
    auto it = models_.find(modelId);
    if (it == models_.end()) {
        throw SttError(SttErrorKind::NotFound, "unsupported model: " + modelId);
    }

    const ModelInfo& info = it->second;
    const std::string fileName = info.localFileName.empty() ? info.file : info.localFileName;

    std::vector<fs::path> candidates;
    for (const auto& dir : searchDirs_) {
        candidates.push_back(fs::path(dir) / fileName);
        candidates.push_back(fs::path(dir) / (modelId + ".bin"));
    }

    std::error_code ec;
    for (const auto& candidate : candidates) {
        if (fs::is_regular_file(candidate, ec)) return candidate.string();
    }

    throw SttError(SttErrorKind::NotFound, "model file for '" + modelId + "' not found (" + fileName + ")");
}

int optimalThreadCount() {
    const unsigned n = std::thread::hardware_concurrency();
    if (n == 0) return 4;
    return n < 8 ? (int)n : 8;
}

#ifndef MODEL_CATALOG_HPP
#define MODEL_CATALOG_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

struct ModelInfo {
    std::string repoId;         // e.g. ivrit-ai/whisper-large-v3-turbo-ggml
    std::string file;           // file name inside the repository
    std::string localFileName;  // file name on disk; falls back to file
    std::string description;
};

// Maps model ids ("turbo", "base", ...) to model files on disk
class ModelCatalog {
public:
    // Built-in large-v3, turbo and base entries
    ModelCatalog();
    explicit ModelCatalog(std::map<std::string, ModelInfo> models,
                          std::vector<std::string> searchDirs = defaultSearchDirs());

    // First readable models.json among the standard locations, else built-ins
    static ModelCatalog load();

    // Throws std::runtime_error on unreadable or malformed input
    static std::map<std::string, ModelInfo> parseConfig(const std::string& json);

    static std::map<std::string, ModelInfo> builtinModels();
    static std::vector<std::string> defaultSearchDirs();
    static std::vector<std::string> defaultConfigPaths();

    bool contains(const std::string& modelId) const;
    std::vector<std::string> ids() const;
    std::optional<ModelInfo> info(const std::string& modelId) const;

    // Path of the model file on disk. Throws SttError NotFound.
    std::string resolve(const std::string& modelId) const;

private:
    std::map<std::string, ModelInfo> models_;
    std::vector<std::string> searchDirs_;
};

// Hardware concurrency capped at 8
int optimalThreadCount();

#endif

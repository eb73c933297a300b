#pragma once

#include "tile_segment/model/model_config.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace tile_segment::model {

namespace fs = std::filesystem;

// Model configs indexed by name and revision. Revisions are date strings,
// so the latest is the lexicographic maximum.
class ModelRegistry {
public:
    ModelRegistry() = default;

    // Loads every *.json in dir. Throws IOError when dir is missing and
    // ConfigError when a file does not parse.
    static ModelRegistry from_config_dir(const fs::path& dir);

    // Replaces an existing entry with the same name and revision.
    void register_model(const ModelConfig& cfg);

    std::vector<std::pair<std::string, std::string>> list_models() const;
    std::vector<std::string> list_model_names() const;
    std::vector<std::string> revisions(const std::string& name) const;
    std::string get_latest_revision(const std::string& name) const;

    const ModelConfig& get(const std::string& name) const;
    const ModelConfig& get(const std::string& name, const std::string& revision) const;

    bool contains(const std::string& name) const;
    bool contains(const std::string& name, const std::string& revision) const;

    size_t size() const;

private:
    std::map<std::string, std::map<std::string, ModelConfig>> models_;
};

} // namespace tile_segment::model

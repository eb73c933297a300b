#include "tile_segment/model/model_registry.hpp"
#include "tile_segment/core/errors.hpp"
#include "tile_segment/core/utils.hpp"

#include <algorithm>

namespace tile_segment::model {

ModelRegistry ModelRegistry::from_config_dir(const fs::path& dir) {
    if (!fs::is_directory(dir)) {
        throw IOError("Model config directory not found: " + dir.string());
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file() && core::to_lower(entry.path().extension().string()) == ".json") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    ModelRegistry reg;
    for (const auto& file : files) {
        reg.register_model(ModelConfig::load(file));
    }
    return reg;
}

void ModelRegistry::register_model(const ModelConfig& cfg) {
    cfg.validate();
    models_[cfg.name][cfg.revision] = cfg;
}

std::vector<std::pair<std::string, std::string>> ModelRegistry::list_models() const {
    std::vector<std::pair<std::string, std::string>> out;
    for (const auto& [name, revs] : models_) {
        for (const auto& [rev, cfg] : revs) {
            out.emplace_back(name, rev);
        }
    }
    return out;
}

std::vector<std::string> ModelRegistry::list_model_names() const {
    std::vector<std::string> out;
    out.reserve(models_.size());
    for (const auto& [name, revs] : models_) {
        out.push_back(name);
    }
    return out;
}

std::vector<std::string> ModelRegistry::revisions(const std::string& name) const {
    auto it = models_.find(name);
    if (it == models_.end()) {
        throw ModelError("model '" + name + "' is not registered; available models: " +
                         core::join(list_model_names(), ", "));
    }
    std::vector<std::string> out;
    for (const auto& [rev, cfg] : it->second) {
        out.push_back(rev);
    }
    return out;
}

std::string ModelRegistry::get_latest_revision(const std::string& name) const {
    // std::map keeps revisions sorted, so the last one is the maximum.
    return revisions(name).back();
}

const ModelConfig& ModelRegistry::get(const std::string& name) const {
    return get(name, get_latest_revision(name));
}

const ModelConfig& ModelRegistry::get(const std::string& name, const std::string& revision) const {
    auto revs = revisions(name);
    const auto& by_rev = models_.at(name);
    auto it = by_rev.find(revision);
    if (it == by_rev.end()) {
        throw ModelError("revision '" + revision + "' of model '" + name +
                         "' is not registered; available revisions: " + core::join(revs, ", "));
    }
    return it->second;
}

bool ModelRegistry::contains(const std::string& name) const {
    return models_.count(name) > 0;
}

bool ModelRegistry::contains(const std::string& name, const std::string& revision) const {
    auto it = models_.find(name);
    return it != models_.end() && it->second.count(revision) > 0;
}

size_t ModelRegistry::size() const {
    size_t n = 0;
    for (const auto& [name, revs] : models_) {
        n += revs.size();
    }
    return n;
}

} // namespace tile_segment::model

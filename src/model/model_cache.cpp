#include "tile_segment/model/model_cache.hpp"
#include "tile_segment/core/errors.hpp"
#include "tile_segment/core/utils.hpp"

#include <vector>

namespace tile_segment::model {

namespace {

std::string dependency_filename(const std::string& dependency) {
    return core::is_url(dependency) ? core::url_filename(dependency)
                                    : fs::path(dependency).filename().string();
}

} // namespace

std::string cache_status_to_string(CacheStatus status) {
    switch (status) {
        case CacheStatus::CACHED: return "cached";
        case CacheStatus::AVAILABLE: return "available";
        case CacheStatus::LOCAL: return "local";
        case CacheStatus::MISSING: return "missing";
    }
    return "missing";
}

ModelCache::ModelCache(fs::path cache_dir, std::shared_ptr<ModelFetcher> fetcher)
    : cache_dir_(std::move(cache_dir)), fetcher_(std::move(fetcher)) {}

fs::path ModelCache::local_path(const ModelConfig& cfg, const std::string& dependency) const {
    if (core::is_url(dependency)) {
        return cache_dir_ / cfg.name / cfg.revision / core::url_filename(dependency);
    }
    return fs::absolute(core::expand_user(dependency)).lexically_normal();
}

fs::path ModelCache::model_path(const ModelConfig& cfg) const {
    return local_path(cfg, cfg.model_dependency());
}

CacheStatus ModelCache::status(const ModelConfig& cfg) const {
    bool any_remote = false;
    bool all_cached = true;
    for (const auto& dep : cfg.dependencies) {
        const bool present = fs::exists(local_path(cfg, dep));
        if (core::is_url(dep)) {
            any_remote = true;
            all_cached = all_cached && present;
        } else if (!present) {
            return CacheStatus::MISSING;
        }
    }
    if (!any_remote) {
        return CacheStatus::LOCAL;
    }
    return all_cached ? CacheStatus::CACHED : CacheStatus::AVAILABLE;
}

fs::path ModelCache::ensure(const ModelConfig& cfg, const DownloadProgress& progress) {
    for (const auto& dep : cfg.dependencies) {
        const fs::path path = local_path(cfg, dep);
        const bool remote = core::is_url(dep);

        if (!fs::exists(path)) {
            if (!remote) {
                throw IOError("Model dependency not found: " + path.string());
            }
            if (!fetcher_) {
                throw IOError("Model dependency " + dep + " is not cached and no downloader is configured");
            }
            fetcher_->fetch(dep, path, progress);
        }

        auto digest = cfg.sha256.find(dependency_filename(dep));
        if (digest != cfg.sha256.end()) {
            const std::string actual = core::sha256_file(path);
            if (core::to_lower(actual) != core::to_lower(digest->second)) {
                if (remote) {
                    std::error_code ec;
                    fs::remove(path, ec);
                }
                throw IOError("sha256 mismatch for " + path.string() + ": expected " + digest->second +
                              ", got " + actual);
            }
        }
    }

    fs::path model = model_path(cfg);
    if (!fs::exists(model)) {
        throw IOError("Model file not found after download: " + model.string());
    }
    return model;
}

uint64_t ModelCache::cache_size() const {
    if (!fs::exists(cache_dir_)) {
        return 0;
    }
    uint64_t total = 0;
    for (const auto& entry : fs::recursive_directory_iterator(cache_dir_)) {
        if (entry.is_regular_file()) {
            total += static_cast<uint64_t>(entry.file_size());
        }
    }
    return total;
}

uint64_t ModelCache::clean() {
    const uint64_t freed = cache_size();
    if (!fs::exists(cache_dir_)) {
        return 0;
    }
    std::vector<fs::path> children;
    for (const auto& entry : fs::directory_iterator(cache_dir_)) {
        children.push_back(entry.path());
    }
    for (const auto& child : children) {
        std::error_code ec;
        fs::remove_all(child, ec);
        if (ec) {
            throw IOError("Cannot remove " + child.string() + ": " + ec.message());
        }
    }
    return freed;
}

} // namespace tile_segment::model

#pragma once

#include "tile_segment/model/model_config.hpp"
#include "tile_segment/model/model_fetcher.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace tile_segment::model {

namespace fs = std::filesystem;

enum class CacheStatus {
    CACHED,      // every remote dependency is downloaded
    AVAILABLE,   // some remote dependency still needs downloading
    LOCAL,       // only local files, all present
    MISSING      // a local dependency does not exist
};

std::string cache_status_to_string(CacheStatus status);

// Remote dependencies live under cache_dir/<name>/<revision>/<file>.
class ModelCache {
public:
    explicit ModelCache(fs::path cache_dir, std::shared_ptr<ModelFetcher> fetcher = nullptr);

    const fs::path& cache_dir() const { return cache_dir_; }

    fs::path local_path(const ModelConfig& cfg, const std::string& dependency) const;
    fs::path model_path(const ModelConfig& cfg) const;

    CacheStatus status(const ModelConfig& cfg) const;

    // Downloads missing remote dependencies, checks sha256 digests and
    // returns the local ONNX file. Throws IOError.
    fs::path ensure(const ModelConfig& cfg, const DownloadProgress& progress = {});

    uint64_t cache_size() const;

    // Deletes everything under cache_dir and returns the bytes freed.
    uint64_t clean();

private:
    fs::path cache_dir_;
    std::shared_ptr<ModelFetcher> fetcher_;
};

} // namespace tile_segment::model

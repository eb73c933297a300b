#include "tile_segment/core/errors.hpp"
#include "tile_segment/core/utils.hpp"
#include "tile_segment/model/model_cache.hpp"

#include <fstream>
#include <map>
#include <memory>

#include <catch2/catch_test_macros.hpp>

using tile_segment::IOError;
using tile_segment::model::CacheStatus;
using tile_segment::model::ModelCache;
using tile_segment::model::ModelConfig;
using tile_segment::model::ModelFetcher;
namespace core = tile_segment::core;
namespace fs = std::filesystem;

namespace {

// Serves fixed payloads by URL.
class FakeFetcher : public ModelFetcher {
public:
    std::map<std::string, std::string> payloads;
    int fetches = 0;

    void fetch(const std::string& url, const fs::path& dest,
               const tile_segment::model::DownloadProgress& progress) override {
        ++fetches;
        auto it = payloads.find(url);
        if (it == payloads.end()) {
            throw IOError("404 " + url);
        }
        fs::create_directories(dest.parent_path());
        std::ofstream out(dest, std::ios::binary);
        out << it->second;
        if (progress) {
            const auto size = static_cast<int64_t>(it->second.size());
            progress(size, size);
        }
    }
};

struct TempDir {
    fs::path path;
    TempDir() : path(fs::temp_directory_path() / ("tile_segment_cache_" + core::get_run_id())) {
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

const char* kModelUrl = "https://example.org/kelp/model.onnx?x=1";
const char* kLabelsUrl = "https://example.org/kelp/labels.txt";

ModelConfig remote_config() {
    ModelConfig cfg;
    cfg.name = "kelp-rgb";
    cfg.revision = "20240722";
    cfg.dependencies = {kModelUrl, kLabelsUrl};
    cfg.model_filename = "model.onnx";
    return cfg;
}

std::string sha256_of(const std::string& text) {
    return core::sha256_bytes(std::vector<uint8_t>(text.begin(), text.end()));
}

} // namespace

TEST_CASE("cache_local_path_layout") {
    ModelCache cache("/cache");
    auto cfg = remote_config();
    REQUIRE(cache.local_path(cfg, kModelUrl) == fs::path("/cache/kelp-rgb/20240722/model.onnx"));
    REQUIRE(cache.local_path(cfg, kLabelsUrl) == fs::path("/cache/kelp-rgb/20240722/labels.txt"));
    REQUIRE(cache.model_path(cfg) == fs::path("/cache/kelp-rgb/20240722/model.onnx"));
    REQUIRE(cache.local_path(cfg, "/opt/m/../m/w.onnx") == fs::path("/opt/m/w.onnx"));
}

TEST_CASE("cache_downloads_missing_files_once") {
    TempDir dir;
    auto fetcher = std::make_shared<FakeFetcher>();
    fetcher->payloads[kModelUrl] = "onnx-bytes";
    fetcher->payloads[kLabelsUrl] = "kelp\n";

    ModelCache cache(dir.path / "cache", fetcher);
    auto cfg = remote_config();
    REQUIRE(cache.status(cfg) == CacheStatus::AVAILABLE);
    REQUIRE(cache.cache_size() == 0);

    int64_t last_received = 0;
    fs::path model = cache.ensure(cfg, [&](int64_t received, int64_t) { last_received = received; });
    REQUIRE(model == dir.path / "cache" / "kelp-rgb" / "20240722" / "model.onnx");
    REQUIRE(core::read_text(model) == "onnx-bytes");
    REQUIRE(fetcher->fetches == 2);
    REQUIRE(last_received > 0);
    REQUIRE(cache.status(cfg) == CacheStatus::CACHED);
    REQUIRE(tile_segment::model::cache_status_to_string(cache.status(cfg)) == "cached");

    cache.ensure(cfg);
    REQUIRE(fetcher->fetches == 2);

    REQUIRE(cache.cache_size() == 15);
    REQUIRE(cache.clean() == 15);
    REQUIRE(cache.cache_size() == 0);
    REQUIRE(fs::exists(cache.cache_dir()));
    REQUIRE(cache.status(cfg) == CacheStatus::AVAILABLE);
}

TEST_CASE("cache_without_fetcher_cannot_download") {
    TempDir dir;
    ModelCache cache(dir.path);
    REQUIRE_THROWS_AS(cache.ensure(remote_config()), IOError);
}

TEST_CASE("cache_fetch_failure_propagates") {
    TempDir dir;
    auto fetcher = std::make_shared<FakeFetcher>();
    fetcher->payloads[kModelUrl] = "onnx-bytes";
    ModelCache cache(dir.path, fetcher);
    REQUIRE_THROWS_AS(cache.ensure(remote_config()), IOError);
}

TEST_CASE("cache_sha256_mismatch_removes_download") {
    TempDir dir;
    auto fetcher = std::make_shared<FakeFetcher>();
    fetcher->payloads[kModelUrl] = "tampered";
    fetcher->payloads[kLabelsUrl] = "kelp\n";

    auto cfg = remote_config();
    cfg.sha256["model.onnx"] = sha256_of("onnx-bytes");
    cfg.sha256["labels.txt"] = sha256_of("kelp\n");

    ModelCache cache(dir.path, fetcher);
    REQUIRE_THROWS_AS(cache.ensure(cfg), IOError);
    REQUIRE_FALSE(fs::exists(cache.model_path(cfg)));

    fetcher->payloads[kModelUrl] = "onnx-bytes";
    cfg.sha256["model.onnx"] = core::to_lower(sha256_of("onnx-bytes"));
    REQUIRE_NOTHROW(cache.ensure(cfg));
}

TEST_CASE("cache_local_dependencies") {
    TempDir dir;
    auto weights = dir.path / "weights.onnx";

    ModelConfig cfg;
    cfg.name = "local-model";
    cfg.revision = "1";
    cfg.dependencies = {weights.string()};
    cfg.model_filename = "weights.onnx";

    ModelCache cache(dir.path / "cache");
    REQUIRE(cache.status(cfg) == CacheStatus::MISSING);
    REQUIRE_THROWS_AS(cache.ensure(cfg), IOError);

    core::write_text(weights, "local");
    REQUIRE(cache.status(cfg) == CacheStatus::LOCAL);
    REQUIRE(cache.ensure(cfg) == weights.lexically_normal());

    // A local file is never deleted on a digest mismatch.
    cfg.sha256["weights.onnx"] = sha256_of("other");
    REQUIRE_THROWS_AS(cache.ensure(cfg), IOError);
    REQUIRE(fs::exists(weights));
}

TEST_CASE("cache_clean_on_missing_dir_frees_nothing") {
    ModelCache cache(fs::temp_directory_path() / ("tile_segment_none_" + core::get_run_id()));
    REQUIRE(cache.cache_size() == 0);
    REQUIRE(cache.clean() == 0);
}

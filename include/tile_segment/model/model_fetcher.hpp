#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace tile_segment::model {

namespace fs = std::filesystem;

using DownloadProgress = std::function<void(int64_t received, int64_t total)>;

class ModelFetcher {
public:
    virtual ~ModelFetcher() = default;

    // Downloads url to dest. dest exists only after a complete download.
    // Throws IOError on failure.
    virtual void fetch(const std::string& url, const fs::path& dest,
                       const DownloadProgress& progress = {}) = 0;
};

// HTTP(S) downloads through Qt6::Network. Blocks in a local QEventLoop, so
// a QCoreApplication must exist on the calling thread.
class HttpModelFetcher : public ModelFetcher {
public:
    explicit HttpModelFetcher(int timeout_ms = 0);

    void fetch(const std::string& url, const fs::path& dest,
               const DownloadProgress& progress = {}) override;

private:
    int timeout_ms_;
};

} // namespace tile_segment::model

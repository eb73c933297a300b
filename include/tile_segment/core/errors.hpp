#pragma once

#include <stdexcept>
#include <string>

namespace tile_segment {

class TileSegmentError : public std::runtime_error {
public:
    explicit TileSegmentError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public TileSegmentError {
public:
    explicit ConfigError(const std::string& message)
        : TileSegmentError("Config error: " + message) {}
};

class ValidationError : public TileSegmentError {
public:
    explicit ValidationError(const std::string& message)
        : TileSegmentError("Validation error: " + message) {}
};

class IOError : public TileSegmentError {
public:
    explicit IOError(const std::string& message)
        : TileSegmentError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

class ModelError : public TileSegmentError {
public:
    explicit ModelError(const std::string& message)
        : TileSegmentError("Model error: " + message) {}
};

class PipelineError : public TileSegmentError {
public:
    explicit PipelineError(const std::string& message)
        : TileSegmentError("Pipeline error: " + message) {}
};

} // namespace tile_segment

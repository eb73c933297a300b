#pragma once

#include "tile_segment/core/types.hpp"

#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tile_segment::io {

// Free-form header cards carried from input to output untouched.
struct RasterMetadata {
    std::map<std::string, std::string> string_values;
    std::map<std::string, double> numeric_values;
    std::map<std::string, int> int_values;
    std::map<std::string, bool> bool_values;

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;
    std::optional<int> get_int(const std::string& key) const;
    std::optional<bool> get_bool(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, double value);
    void set(const std::string& key, int value);
    void set(const std::string& key, bool value);
};

// Affine pixel-to-world transform (a, b, c, d, e, f) in GDAL order.
using GeoTransform = std::array<double, 6>;

struct RasterInfo {
    int height = 0;
    int width = 0;
    int band_count = 0;
    PixelType pixel_type = PixelType::UNSUPPORTED;
    std::optional<std::string> crs;
    std::optional<GeoTransform> transform;
    RasterMetadata metadata;
};

class RasterReader {
public:
    virtual ~RasterReader() = default;

    virtual const RasterInfo& info() const = 0;

    // Returns one plane per entry of band_order (1-based band indices; empty
    // means every band in file order), each window.height x window.width.
    // With boundless, pixels outside the raster read as fill_value; without
    // it an out-of-range window is an IOError.
    virtual BandStack read_window(const Window& window,
                                  const std::vector<int>& band_order = {},
                                  bool boundless = true,
                                  float fill_value = 0.0f) = 0;
};

struct WriterOptions {
    int height = 0;
    int width = 0;
    uint8_t nodata = 0;
    std::optional<std::string> crs;
    std::optional<GeoTransform> transform;
    RasterMetadata metadata;
};

// Single band uint8 label raster.
class RasterWriter {
public:
    virtual ~RasterWriter() = default;

    virtual int height() const = 0;
    virtual int width() const = 0;

    // data must be window.height x window.width and inside the raster.
    virtual void write(const LabelMap& data, const Window& window) = 0;

    // Reads back labels already written (the post-process pass edits in place).
    virtual LabelMap read_window(const Window& window) = 0;

    virtual void close() = 0;
};

// Throws IOError unless window lies within height x width.
void require_window_in_bounds(const Window& window, int height, int width, const std::string& what);

} // namespace tile_segment::io

#include "tile_segment/io/raster_io.hpp"
#include "tile_segment/core/errors.hpp"

namespace tile_segment::io {

std::optional<std::string> RasterMetadata::get_string(const std::string& key) const {
    auto it = string_values.find(key);
    if (it != string_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<double> RasterMetadata::get_double(const std::string& key) const {
    auto it = numeric_values.find(key);
    if (it != numeric_values.end()) {
        return it->second;
    }
    auto it_int = int_values.find(key);
    if (it_int != int_values.end()) {
        return static_cast<double>(it_int->second);
    }
    return std::nullopt;
}

std::optional<int> RasterMetadata::get_int(const std::string& key) const {
    auto it = int_values.find(key);
    if (it != int_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<bool> RasterMetadata::get_bool(const std::string& key) const {
    auto it = bool_values.find(key);
    if (it != bool_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

void RasterMetadata::set(const std::string& key, const std::string& value) {
    string_values[key] = value;
}

void RasterMetadata::set(const std::string& key, double value) {
    numeric_values[key] = value;
}

void RasterMetadata::set(const std::string& key, int value) {
    int_values[key] = value;
}

void RasterMetadata::set(const std::string& key, bool value) {
    bool_values[key] = value;
}

void require_window_in_bounds(const Window& window, int height, int width, const std::string& what) {
    if (window.row_off < 0 || window.col_off < 0 || window.height < 1 || window.width < 1 ||
        window.row_off + window.height > height || window.col_off + window.width > width) {
        throw IOError(what + ": window (row " + std::to_string(window.row_off) + ", col " +
                      std::to_string(window.col_off) + ", " + std::to_string(window.height) + "x" +
                      std::to_string(window.width) + ") outside raster " + std::to_string(height) +
                      "x" + std::to_string(width));
    }
}

} // namespace tile_segment::io

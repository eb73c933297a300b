#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace tile_segment {

namespace fs = std::filesystem;

// Matrix types (row-major, matches raster scanline order)
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using LabelMap = Eigen::Matrix<uint8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using VectorXf = Eigen::VectorXf;

// C x H x W stacks: one matrix per band or per class
using BandStack = std::vector<Matrix2Df>;
using ScoreMap = std::vector<Matrix2Df>;

// Rectangular region in full-image pixel coordinates
struct Window {
    int row_off = 0;
    int col_off = 0;
    int height = 0;
    int width = 0;

    bool operator==(const Window& other) const {
        return row_off == other.row_off && col_off == other.col_off &&
               height == other.height && width == other.width;
    }
    bool operator!=(const Window& other) const { return !(*this == other); }
};

// Which image borders a (clipped) window touches
struct EdgeFlags {
    bool top = false;
    bool bottom = false;
    bool left = false;
    bool right = false;
};

// Source raster sample type
enum class PixelType {
    UINT8,
    UINT16,
    FLOAT32,
    UNSUPPORTED
};

inline std::string pixel_type_to_string(PixelType type) {
    switch (type) {
        case PixelType::UINT8: return "uint8";
        case PixelType::UINT16: return "uint16";
        case PixelType::FLOAT32: return "float32";
        default: return "unsupported";
    }
}

// Pipeline phase enumeration
enum class Phase {
    PLAN = 0,
    SEGMENT = 1,
    POSTPROCESS = 2
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::PLAN: return "PLAN";
        case Phase::SEGMENT: return "SEGMENT";
        case Phase::POSTPROCESS: return "POSTPROCESS";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace tile_segment

#include "tile_segment/tiling/weight_kernel.hpp"
#include "tile_segment/core/errors.hpp"
#include "tile_segment/core/utils.hpp"

#include <cmath>

namespace tile_segment::tiling {

namespace {

constexpr double kPi = 3.14159265358979323846;

double profile_value(KernelFamily family, int i, int n) {
    const double x = static_cast<double>(i);
    const double s = static_cast<double>(n);
    switch (family) {
        case KernelFamily::BARTLETT_HANN: {
            // Ha & Pearce (1989)
            const double d = std::abs(x / s - 0.5);
            return 0.62 - 0.48 * d + 0.38 * std::cos(2.0 * kPi * d);
        }
        case KernelFamily::TRIANGULAR:
            return 1.0 - std::abs(2.0 * x / s - 1.0);
        case KernelFamily::UNIFORM:
        default:
            return 1.0;
    }
}

} // namespace

std::string kernel_family_to_string(KernelFamily family) {
    switch (family) {
        case KernelFamily::BARTLETT_HANN: return "bartlett_hann";
        case KernelFamily::TRIANGULAR: return "triangular";
        case KernelFamily::UNIFORM: return "uniform";
        default: return "unknown";
    }
}

KernelFamily string_to_kernel_family(const std::string& name) {
    const std::string n = core::to_lower(core::trim(name));
    if (n == "bartlett_hann" || n == "bartlett-hann") return KernelFamily::BARTLETT_HANN;
    if (n == "triangular") return KernelFamily::TRIANGULAR;
    throw ConfigError("unknown stitching kernel '" + name + "' (expected bartlett_hann or triangular)");
}

std::vector<float> make_weight_profile(KernelFamily family, int size) {
    if (size < 1) {
        throw ValidationError("weight kernel size must be >= 1");
    }
    std::vector<float> w(static_cast<size_t>(size));
    for (int i = 0; i < size; ++i) {
        w[static_cast<size_t>(i)] = static_cast<float>(profile_value(family, i, size));
    }
    return w;
}

Matrix2Df make_weight_kernel(KernelFamily family, int size, const EdgeFlags& edges) {
    return WeightKernel(family, size).get(edges);
}

WeightKernel::WeightKernel(KernelFamily family, int size)
    : family_(family), size_(size), profile_(make_weight_profile(family, size)) {}

Matrix2Df WeightKernel::get(const EdgeFlags& edges) const {
    VectorXf wi = Eigen::Map<const VectorXf>(profile_.data(), size_);
    VectorXf wj = wi;
    const int half = size_ / 2;

    if (edges.top) wi.head(half).setOnes();
    if (edges.bottom) wi.tail(size_ - half).setOnes();
    if (edges.left) wj.head(half).setOnes();
    if (edges.right) wj.tail(size_ - half).setOnes();

    return wi * wj.transpose();
}

void WeightKernel::apply(ScoreMap& scores, const EdgeFlags& edges) const {
    const Matrix2Df k = get(edges);
    for (auto& plane : scores) {
        if (plane.rows() != size_ || plane.cols() != size_) {
            throw PipelineError("score map plane is " + std::to_string(plane.rows()) + "x" +
                                std::to_string(plane.cols()) + ", expected " +
                                std::to_string(size_) + "x" + std::to_string(size_));
        }
        plane.array() *= k.array();
    }
}

} // namespace tile_segment::tiling

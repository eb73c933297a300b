#pragma once

#include "tile_segment/core/types.hpp"

#include <string>
#include <vector>

namespace tile_segment::tiling {

// BARTLETT_HANN and TRIANGULAR satisfy w[i] + w[i + S/2] == 1, so tiles at
// stride S/2 stitch to normalized scores. UNIFORM does not and is only
// reachable from code, never by name.
enum class KernelFamily {
    BARTLETT_HANN,
    TRIANGULAR,
    UNIFORM
};

std::string kernel_family_to_string(KernelFamily family);

// Accepts the stitching kernels only. Throws ConfigError otherwise.
KernelFamily string_to_kernel_family(const std::string& name);

// 1D profile w[i], i in [0, size).
std::vector<float> make_weight_profile(KernelFamily family, int size);

// Separable size x size kernel outer(wi, wj). A flagged edge forces the
// corresponding half of wi (top/bottom) or wj (left/right) to 1.
Matrix2Df make_weight_kernel(KernelFamily family, int size, const EdgeFlags& edges);

class WeightKernel {
public:
    WeightKernel(KernelFamily family, int size);

    int size() const { return size_; }
    KernelFamily family() const { return family_; }
    const std::vector<float>& profile() const { return profile_; }

    Matrix2Df get(const EdgeFlags& edges) const;

    // Multiplies every class plane of a size x size score map by get(edges).
    void apply(ScoreMap& scores, const EdgeFlags& edges) const;

private:
    KernelFamily family_;
    int size_;
    std::vector<float> profile_;
};

} // namespace tile_segment::tiling

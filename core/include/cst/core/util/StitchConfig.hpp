#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace cst {

// Acceptance of a transported pair (a, b): cost <= max_cost and the mass is at
// least min_mass_fraction of area(a) or of area(b).
struct MatchParams {
    double max_cost = 0.9;
    double min_mass_fraction = 0.5;
};

// A split is a discontinuity when |fragments / predecessor - 1| > sensitivity.
struct SplitParams {
    double sensitivity = 0.25;
};

// Orthogonal stitching votes (see AxisStitcher).
struct VoteParams {
    bool enabled = false;
    double p_stitching_votes = 0.75;
};

struct FusionParams {
    double overlap_threshold = 0.5;
    int min_agreeing_axes = 2;
};

struct PostprocessParams {
    int min_size = 15;                  // <= 0 disables small-mask removal
    bool fill_holes = false;
    bool correct_oversegmentation = true;
};

enum class StitchMethod { Transport, IoU };

StitchMethod parseStitchMethod(const std::string& name);
const char* stitchMethodName(StitchMethod method);

struct StitchConfig {
    MatchParams match;
    SplitParams split;
    VoteParams votes;
    FusionParams fusion;
    PostprocessParams postprocess;

    StitchMethod method = StitchMethod::Transport;
    double iou_threshold = 0.25;
    int threads = 0;                    // 0 = OpenMP default
    bool keep_axis_volumes = false;

    // Throws std::invalid_argument naming the first out-of-range value.
    void validate() const;

    // Missing keys keep their defaults; the result is validated.
    static StitchConfig fromJson(const nlohmann::json& j);
    static StitchConfig load(const std::filesystem::path& path);

    nlohmann::json toJson() const;
};

} // namespace cst

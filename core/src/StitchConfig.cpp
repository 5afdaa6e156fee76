#include "cst/core/util/StitchConfig.hpp"

#include <cmath>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "cst/core/util/LoadJson.hpp"

namespace cst {

StitchMethod parseStitchMethod(const std::string& name)
{
    if (name == "transport" || name == "cellstitch")
        return StitchMethod::Transport;
    if (name == "iou")
        return StitchMethod::IoU;
    throw std::invalid_argument("Unknown stitch method '" + name +
                                "' (expected \"transport\" or \"iou\")");
}

const char* stitchMethodName(StitchMethod method)
{
    switch (method) {
        case StitchMethod::Transport: return "transport";
        case StitchMethod::IoU: return "iou";
    }
    return "?";
}

static void requireRange(double v, double lo, double hi, const char* name)
{
    if (!std::isfinite(v) || v < lo || v > hi) {
        throw std::invalid_argument(std::string(name) + " must be in [" +
                                    std::to_string(lo) + ", " + std::to_string(hi) +
                                    "], got " + std::to_string(v));
    }
}

void StitchConfig::validate() const
{
    requireRange(match.max_cost, 0.0, 1.0, "match.max_cost");
    requireRange(match.min_mass_fraction, 0.0, 1.0, "match.min_mass_fraction");
    if (!std::isfinite(split.sensitivity) || split.sensitivity < 0.0)
        throw std::invalid_argument("split.sensitivity must be >= 0");
    requireRange(votes.p_stitching_votes, 0.0, 1.0, "votes.p_stitching_votes");
    requireRange(fusion.overlap_threshold, 0.0, 1.0, "fusion.overlap_threshold");
    if (fusion.min_agreeing_axes < 1 || fusion.min_agreeing_axes > 3)
        throw std::invalid_argument("fusion.min_agreeing_axes must be 1, 2 or 3");
    requireRange(iou_threshold, 0.0, 1.0, "iou_threshold");
    if (iou_threshold <= 0.0)
        throw std::invalid_argument("iou_threshold must be > 0");
    if (threads < 0)
        throw std::invalid_argument("threads must be >= 0");
}

StitchConfig StitchConfig::fromJson(const nlohmann::json& j)
{
    using namespace cst::json;

    if (!j.is_object())
        throw std::runtime_error("stitch config must be a JSON object");

    StitchConfig cfg;
    const nlohmann::json* root = &j;

    cfg.method = parseStitchMethod(string_or(root, "method", stitchMethodName(cfg.method)));
    cfg.iou_threshold = number_or(root, "iou_threshold", cfg.iou_threshold);
    cfg.threads = static_cast<int>(number_or(root, "threads", cfg.threads));
    cfg.keep_axis_volumes = bool_or(root, "keep_axis_volumes", cfg.keep_axis_volumes);

    if (auto* m = object_or_null(root, "match")) {
        cfg.match.max_cost = number_or(m, "max_cost", cfg.match.max_cost);
        cfg.match.min_mass_fraction = number_or(m, "min_mass_fraction", cfg.match.min_mass_fraction);
    }
    if (auto* s = object_or_null(root, "split")) {
        cfg.split.sensitivity = number_or(s, "sensitivity", cfg.split.sensitivity);
    }
    if (auto* v = object_or_null(root, "votes")) {
        cfg.votes.enabled = bool_or(v, "enabled", cfg.votes.enabled);
        cfg.votes.p_stitching_votes = number_or(v, "p_stitching_votes", cfg.votes.p_stitching_votes);
    }
    if (auto* f = object_or_null(root, "fusion")) {
        cfg.fusion.overlap_threshold = number_or(f, "overlap_threshold", cfg.fusion.overlap_threshold);
        cfg.fusion.min_agreeing_axes = static_cast<int>(
            number_or(f, "min_agreeing_axes", cfg.fusion.min_agreeing_axes));
    }
    if (auto* p = object_or_null(root, "postprocess")) {
        cfg.postprocess.min_size = static_cast<int>(number_or(p, "min_size", cfg.postprocess.min_size));
        cfg.postprocess.fill_holes = bool_or(p, "fill_holes", cfg.postprocess.fill_holes);
        cfg.postprocess.correct_oversegmentation =
            bool_or(p, "correct_oversegmentation", cfg.postprocess.correct_oversegmentation);
    }

    cfg.validate();
    return cfg;
}

StitchConfig StitchConfig::load(const std::filesystem::path& path)
{
    return fromJson(json::load_json_file(path));
}

nlohmann::json StitchConfig::toJson() const
{
    nlohmann::json j;
    j["method"] = stitchMethodName(method);
    j["iou_threshold"] = iou_threshold;
    j["threads"] = threads;
    j["keep_axis_volumes"] = keep_axis_volumes;
    j["match"] = {{"max_cost", match.max_cost},
                  {"min_mass_fraction", match.min_mass_fraction}};
    j["split"] = {{"sensitivity", split.sensitivity}};
    j["votes"] = {{"enabled", votes.enabled},
                  {"p_stitching_votes", votes.p_stitching_votes}};
    j["fusion"] = {{"overlap_threshold", fusion.overlap_threshold},
                   {"min_agreeing_axes", fusion.min_agreeing_axes}};
    j["postprocess"] = {{"min_size", postprocess.min_size},
                        {"fill_holes", postprocess.fill_holes},
                        {"correct_oversegmentation", postprocess.correct_oversegmentation}};
    return j;
}

} // namespace cst

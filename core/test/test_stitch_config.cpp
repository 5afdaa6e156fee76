#include "test.hpp"

#include "cst/core/util/StitchConfig.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace cst;

TEST(StitchConfig, DefaultsAreValid)
{
    StitchConfig cfg;
    EXPECT_NO_THROW(cfg.validate());
    EXPECT_NEAR(cfg.match.max_cost, 0.9, 1e-12);
    EXPECT_NEAR(cfg.match.min_mass_fraction, 0.5, 1e-12);
    EXPECT_NEAR(cfg.split.sensitivity, 0.25, 1e-12);
    EXPECT_FALSE(cfg.votes.enabled);
    EXPECT_EQ(cfg.fusion.min_agreeing_axes, 2);
    EXPECT_EQ(cfg.postprocess.min_size, 15);
    EXPECT_TRUE(cfg.method == StitchMethod::Transport);
}

TEST(StitchConfig, JsonOverridesOnlyGivenKeys)
{
    auto j = nlohmann::json::parse(R"({
        "method": "iou",
        "iou_threshold": 0.4,
        "match": {"max_cost": 0.8},
        "votes": {"enabled": true},
        "postprocess": {"min_size": 0, "fill_holes": 1}
    })");
    StitchConfig cfg = StitchConfig::fromJson(j);
    EXPECT_TRUE(cfg.method == StitchMethod::IoU);
    EXPECT_NEAR(cfg.iou_threshold, 0.4, 1e-12);
    EXPECT_NEAR(cfg.match.max_cost, 0.8, 1e-12);
    EXPECT_NEAR(cfg.match.min_mass_fraction, 0.5, 1e-12);
    EXPECT_TRUE(cfg.votes.enabled);
    EXPECT_EQ(cfg.postprocess.min_size, 0);
    EXPECT_TRUE(cfg.postprocess.fill_holes);
    EXPECT_TRUE(cfg.postprocess.correct_oversegmentation);
}

TEST(StitchConfig, ToJsonIsReadBack)
{
    StitchConfig cfg;
    cfg.fusion.overlap_threshold = 0.6;
    cfg.threads = 3;
    StitchConfig back = StitchConfig::fromJson(cfg.toJson());
    EXPECT_NEAR(back.fusion.overlap_threshold, 0.6, 1e-12);
    EXPECT_EQ(back.threads, 3);
}

TEST(StitchConfig, RejectsOutOfRangeValues)
{
    StitchConfig cfg;
    cfg.match.max_cost = 1.5;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);

    cfg = StitchConfig{};
    cfg.fusion.min_agreeing_axes = 4;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);

    cfg = StitchConfig{};
    cfg.iou_threshold = 0.0;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);

    auto j = nlohmann::json::parse(R"({"split": {"sensitivity": -1}})");
    EXPECT_THROW(StitchConfig::fromJson(j), std::invalid_argument);
}

TEST(StitchConfig, UnknownMethodIsRejected)
{
    EXPECT_THROW(parseStitchMethod("nearest"), std::invalid_argument);
    EXPECT_TRUE(parseStitchMethod("cellstitch") == StitchMethod::Transport);
}

TEST(StitchConfig, BadTypesAndFilesAreRuntimeErrors)
{
    EXPECT_THROW(StitchConfig::fromJson(nlohmann::json::array()), std::runtime_error);
    auto j = nlohmann::json::parse(R"({"match": {"max_cost": "high"}})");
    EXPECT_THROW(StitchConfig::fromJson(j), std::runtime_error);
    EXPECT_THROW(StitchConfig::load("/nonexistent/cellstitch.json"), std::runtime_error);
}

TEST(StitchConfig, LoadsFromFile)
{
    auto path = std::filesystem::temp_directory_path() / "cst_test_config.json";
    {
        std::ofstream f(path);
        f << R"({"fusion": {"min_agreeing_axes": 3}, "threads": 2})";
    }
    StitchConfig cfg = StitchConfig::load(path);
    EXPECT_EQ(cfg.fusion.min_agreeing_axes, 3);
    EXPECT_EQ(cfg.threads, 2);
    std::filesystem::remove(path);
}

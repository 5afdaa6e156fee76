// Stitch three orthogonal 2D instance segmentations of one volume into a
// single 3D instance segmentation.
//
// Usage:
//   cst_stitch --xy xy.tif --yz yz.tif --xz xz.tif -o out.tif [options]
//
// Each input is a multi-page TIFF label stack. By default all three are in
// the volume frame [z, y, x]; with --slice-major the yz and xz stacks are
// given one page per slice along their own axis and are transposed first.

#include "cst/core/Version.hpp"
#include "cst/core/util/Logging.hpp"
#include "cst/core/util/Pipeline.hpp"
#include "cst/core/util/StitchConfig.hpp"
#include "cst/core/util/Tiff.hpp"

#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>

#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace po = boost::program_options;
namespace fs = std::filesystem;

using namespace cst;

static LabelVolume loadStack(const fs::path& path, Axis axis, bool sliceMajor)
{
    LabelVolume stack = tiff::readLabelStack(path);
    return sliceMajor ? toVolumeFrame(stack, axis) : stack;
}

static fs::path siblingPath(const fs::path& out, const std::string& suffix)
{
    return out.parent_path() / (out.stem().string() + "_" + suffix + out.extension().string());
}

int main(int argc, char* argv[])
{
    po::options_description required("Required arguments");
    required.add_options()
        ("xy", po::value<std::string>()->required(), "XY label stack (multi-page TIFF)")
        ("yz", po::value<std::string>()->required(), "YZ label stack (multi-page TIFF)")
        ("xz", po::value<std::string>()->required(), "XZ label stack (multi-page TIFF)")
        ("output,o", po::value<std::string>()->required(), "Output label stack (multi-page TIFF)");

    po::options_description options("Options");
    options.add_options()
        ("help,h", "Show help")
        ("version", "Show version")
        ("nuclei", po::value<std::string>(), "Nuclei label stack; cells without a nucleus are removed")
        ("config,c", po::value<std::string>(), "JSON stitching configuration")
        ("method", po::value<std::string>(), "Stitching method: transport (default) or iou")
        ("slice-major", po::bool_switch()->default_value(false),
            "yz and xz inputs are stored one page per slice of their own axis")
        ("iou-threshold", po::value<double>(), "IoU threshold for --method iou")
        ("votes", po::bool_switch()->default_value(false),
            "Use the orthogonal stacks as stitching votes")
        ("min-size", po::value<int>(), "Remove masks smaller than this many voxels (<= 0 disables)")
        ("fill-holes", po::bool_switch()->default_value(false), "Fill holes per z-slice")
        ("no-overseg-correction", po::bool_switch()->default_value(false),
            "Keep labels that exist in a single z-slice")
        ("threads,j", po::value<int>(), "Number of OpenMP threads (0 = default)")
        ("write-axis-volumes", po::bool_switch()->default_value(false),
            "Also write the stitched per-axis volumes next to the output")
        ("log-level", po::value<std::string>()->default_value("info"),
            "Log level: debug, info, warn, error, off")
        ("log-file", po::value<std::string>(), "Append log output to this file");

    po::options_description all("cst_stitch options");
    all.add(required).add(options);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(all).run(), vm);
        if (vm.count("help")) {
            std::cout << ProjectInfo::NameAndVersion() << "\n\n" << all << "\n";
            return 0;
        }
        if (vm.count("version")) {
            std::cout << ProjectInfo::NameAndVersion() << " (" << ProjectInfo::RepositoryShortHash() << ")\n";
            return 0;
        }
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\nUse --help for usage\n";
        return 1;
    }

    try {
        SetLogLevel(vm["log-level"].as<std::string>());
        if (vm.count("log-file"))
            AddLogFile(vm["log-file"].as<std::string>());

        StitchConfig config;
        if (vm.count("config")) {
            config = StitchConfig::load(vm["config"].as<std::string>());
            Logger()->info("loaded config {}", vm["config"].as<std::string>());
        }

        // Command line overrides the config file
        if (vm.count("method"))
            config.method = parseStitchMethod(vm["method"].as<std::string>());
        if (vm.count("iou-threshold"))
            config.iou_threshold = vm["iou-threshold"].as<double>();
        if (vm["votes"].as<bool>())
            config.votes.enabled = true;
        if (vm.count("min-size"))
            config.postprocess.min_size = vm["min-size"].as<int>();
        if (vm["fill-holes"].as<bool>())
            config.postprocess.fill_holes = true;
        if (vm["no-overseg-correction"].as<bool>())
            config.postprocess.correct_oversegmentation = false;
        if (vm.count("threads"))
            config.threads = vm["threads"].as<int>();

        const bool writeAxes = vm["write-axis-volumes"].as<bool>();
        if (writeAxes)
            config.keep_axis_volumes = true;

        Pipeline pipeline(config);
        Logger()->debug("config: {}", config.toJson().dump());

        const bool sliceMajor = vm["slice-major"].as<bool>();
        const LabelVolume xy = loadStack(vm["xy"].as<std::string>(), Axis::XY, sliceMajor);
        const LabelVolume yz = loadStack(vm["yz"].as<std::string>(), Axis::YZ, sliceMajor);
        const LabelVolume xz = loadStack(vm["xz"].as<std::string>(), Axis::XZ, sliceMajor);

        std::optional<LabelVolume> nuclei;
        if (vm.count("nuclei"))
            nuclei = tiff::readLabelStack(vm["nuclei"].as<std::string>());

        PipelineResult result = pipeline.run(xy, yz, xz, nuclei ? &*nuclei : nullptr);

        const fs::path out = vm["output"].as<std::string>();
        if (out.has_parent_path())
            fs::create_directories(out.parent_path());
        tiff::writeLabelStack(out, result.volume);

        if (writeAxes && result.axisVolumes) {
            for (std::size_t a = 0; a < kAllAxes.size(); ++a)
                tiff::writeLabelStack(siblingPath(out, axisName(kAllAxes[a])), (*result.axisVolumes)[a]);
        } else if (writeAxes) {
            Logger()->warn("--write-axis-volumes has no effect with method {}",
                           stitchMethodName(config.method));
        }

        Logger()->info("wrote {} instances to {}", result.stats.instances, out.string());
    } catch (const std::exception& e) {
        Logger()->error("{}", e.what());
        return 1;
    }

    return 0;
}

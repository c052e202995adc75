#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include <boost/program_options.hpp>

#include "tile_timeline/configuration.hpp"
#include "tile_timeline/logging.hpp"
#include "tile_timeline/region_batch_driver.hpp"
#include "tile_timeline/vector_layer_converter.hpp"
#include "tile_timeline/version.hpp"

namespace po = boost::program_options;

namespace {

po::options_description make_options() {
    po::options_description desc("Allowed options");
    desc.add_options()
        ("help,h", "print usage")
        ("region,r", po::value<std::string>(), "process a single region, e.g. hudson_yards")
        ("all,a", po::bool_switch(), "process every region listed in TIMELINE_REGIONS")
        ("base-dir", po::value<std::string>(), "override TIMELINE_BASE_DIR")
        ("output-dir", po::value<std::string>(), "override TIMELINE_OUTPUT_DIR")
        ("log-level", po::value<std::string>(), "trace, debug, info, warn, error");
    return desc;
}

void print_usage(const po::options_description& desc) {
    std::cout << "timeline_builder " << tile_timeline::k_version << "\n"
              << "Usage:\n"
              << "  timeline_builder --region <id> [--base-dir DIR] [--output-dir DIR]\n"
              << "  timeline_builder --all [--base-dir DIR] [--output-dir DIR]\n\n"
              << desc << "\n";
}

}  // namespace

int main(int argc, char** argv) {
    using namespace tile_timeline;

    const po::options_description desc = make_options();
    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& exc) {
        std::cerr << exc.what() << "\n";
        print_usage(desc);
        return EXIT_FAILURE;
    }

    const bool run_all = vm["all"].as<bool>();
    if (vm.count("help") != 0 || (!run_all && vm.count("region") == 0)) {
        print_usage(desc);
        return EXIT_SUCCESS;
    }

    try {
        Configuration configuration = ConfigurationLoader::load();

        if (vm.count("log-level") != 0) {
            set_log_level(vm["log-level"].as<std::string>());
        } else if (const char* desired_level = std::getenv("TIMELINE_LOG_LEVEL"); desired_level != nullptr) {
            set_log_level(desired_level);
        }
        if (vm.count("base-dir") != 0) {
            configuration.batch.base_dir = vm["base-dir"].as<std::string>();
        }
        if (vm.count("output-dir") != 0) {
            configuration.batch.output_dir = vm["output-dir"].as<std::string>();
        }

        const RegionList regions = run_all
            ? configuration.batch.regions
            : RegionList{find_region(vm["region"].as<std::string>())};

        auto logger = get_logger();
        logger->info("timeline_builder {} processing {} region(s)", k_version, regions.size());

        const YearList configured_years = configuration.batch.years;
        RegionBatchDriver driver{std::move(configuration.batch), std::make_unique<OgrVectorLayerConverter>()};
        const BatchReport report = driver.run(regions);
        summarize(report, configured_years);
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

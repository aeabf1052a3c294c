/**
 * @file kikuchi_sim.cc
 * @brief Simulate kinematical master patterns and geometrical Kikuchi
 * patterns from a JSON configuration.
 *
 * The configuration holds a "phase", "reflectors" ({"hkl": [...],
 * optional "symmetrise" and "voltage" in V}), and for geometrical
 * simulations a "detector" and "rotations".
 */
#include <fmt/core.h>

#include <chrono>
#include <exception>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

#include "common.hpp"
#include "ebsd_detector.hpp"
#include "fkp_logger.hpp"
#include "kikuchi_pattern_simulator.hpp"
#include "kikuchi_sim_args.hpp"
#include "overlays.hpp"
#include "phase.hpp"
#include "reflectors.hpp"
#include "rotations.hpp"
#include "zone_axes.hpp"

using json = nlohmann::json;

namespace {
constexpr double DEFAULT_VOLTAGE = 20e3;

/**
 * @brief Reflectors of the configured phase with structure factors and
 * Bragg angles calculated.
 */
Reflectors reflectors_from_json(const json &config) {
    for (const auto &key : {"phase", "reflectors"}) {
        if (config.find(key) == config.end()) {
            throw std::invalid_argument(fmt::format(
              "Key {} is missing from the input configuration JSON", key));
        }
    }
    Phase phase(config["phase"]);
    const json &reflector_data = config["reflectors"];
    if (reflector_data.find("hkl") == reflector_data.end()) {
        throw std::invalid_argument("Key hkl is missing from the input reflectors JSON");
    }
    Reflectors reflectors(phase, reflector_data["hkl"].get<std::vector<Miller>>());
    if (reflector_data.value("symmetrise", true)) {
        reflectors = reflectors.symmetrise();
    }
    reflectors.calculate_structure_factor();
    reflectors.calculate_theta(reflector_data.value("voltage", DEFAULT_VOLTAGE));
    logger.info("{} reflectors of phase {} ({})",
                reflectors.size(),
                phase.name(),
                phase.point_group());
    return reflectors;
}

NavigationIndex index_from_arguments(const SimulationArgumentParser &parser) {
    if (!parser.is_used("--index")) return {};
    auto index = parser.get<std::vector<size_t>>("--index");
    return index.size() == 1 ? NavigationIndex(index[0])
                             : NavigationIndex(index[0], index[1]);
}

void run_geometrical(const SimulationArgumentParser &parser,
                     const json &config,
                     const KikuchiPatternSimulator &simulator) {
    for (const auto &key : {"detector", "rotations"}) {
        if (config.find(key) == config.end()) {
            throw std::invalid_argument(fmt::format(
              "Key {} is missing from the input configuration JSON", key));
        }
    }
    EBSDDetector detector(config["detector"]);
    Rotations rotations(config["rotations"]);
    logger.info("{}", detector.to_string());

    GeometricalKikuchiPatternSimulation sim = simulator.on_detector(detector, rotations);
    logger.debug("{}", sim.to_string());

    NavigationIndex index = index_from_arguments(parser);
    CoordinateSpace coordinates = parser.coordinates();
    OverlayOptions options;
    options.zone_axes = parser.get<bool>("--zone-axes");
    options.zone_axes_labels = options.zone_axes;
    options.pc = parser.get<bool>("--pc");
    options.coordinates = coordinates;

    json output;
    output["navigation_shape"] = sim.navigation_shape().to_string();
    output["index"] = index.to_string();
    output["coordinates"] = to_string(coordinates);
    output["reflectors"] = rows_to_json(sim.reflectors().hkl());
    output["zone_axes"] = rows_to_json(sim.zone_axes().uvw());
    output["lines_coordinates"] = rows_to_json(sim.lines_coordinates(index, coordinates));
    output["zone_axes_coordinates"] =
      rows_to_json(sim.zone_axes_coordinates(index, coordinates));
    output["zone_axes_labels"] = sim.zone_axes_labels(index);
    output["pc_xy_offsets"] = rows_to_json(sim.pc_xy_offsets());
    output["collections"] = sim.as_collections(index, options).to_json();
    json markers = json::array();
    for (const auto &marker : sim.as_markers(options)) {
        markers.push_back(marker.to_json());
    }
    output["markers"] = markers;

    std::string path = parser.get<std::string>("--geometrical");
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error(fmt::format("Could not open {} for writing", path));
    }
    out << output.dump(2) << '\n';
    logger.info("Saved {} lines and {} zone axes in pattern {} to {}",
                output["lines_coordinates"].size(),
                output["zone_axes_coordinates"].size(),
                index.to_string(),
                path);
}

void run_master_pattern(const SimulationArgumentParser &parser,
                        const KikuchiPatternSimulator &simulator) {
    MasterPattern master_pattern = simulator.calculate_master_pattern(
      parser.get<size_t>("--half-size"), parser.hemisphere(), parser.scaling());
    logger.info("Master pattern maximum intensity {:.4f}", master_pattern.max());
    if (parser.is_used("--master-pattern")) {
        master_pattern.write_h5(parser.get<std::string>("--master-pattern"));
    }
    if (parser.is_used("--png")) {
        master_pattern.write_png(parser.get<std::string>("--png"));
    }
}
}  // namespace

int main(int argc, char **argv) {
    auto t1 = std::chrono::system_clock::now();
    SimulationArgumentParser parser("0.1.0");
    FKPArguments args = parser.parse_args(argc, argv);

    std::ifstream f(args.config);
    if (!f) {
        logger.error("Unable to open configuration file {}", args.config);
        return 1;
    }
    json config;
    try {
        config = json::parse(f);
    } catch (json::parse_error &ex) {
        logger.error(
          "Unable to read {}; json parse error at byte {}", args.config, ex.byte);
        return 1;
    }

    try {
        KikuchiPatternSimulator simulator(reflectors_from_json(config), parser.nthreads());
        if (parser.is_used("--geometrical")) {
            run_geometrical(parser, config, simulator);
        }
        if (parser.is_used("--master-pattern") || parser.is_used("--png")) {
            run_master_pattern(parser, simulator);
        }
    } catch (const std::invalid_argument &ex) {
        logger.error("Invalid configuration: {}", ex.what());
        return 1;
    } catch (const std::exception &ex) {
        logger.error("{}", ex.what());
        return 1;
    }

    auto t2 = std::chrono::system_clock::now();
    std::chrono::duration<double> elapsed_time = t2 - t1;
    logger.info("Total time for simulation: {}", format_seconds(elapsed_time.count()));
    spdlog::shutdown();
    return 0;
}

/**
 * @file arg_parser.cc
 * @brief Implementation of the base argument parser for the Kikuchi
 * pattern command-line tools.
 *
 * Key features include:
 * - Automatic loading of additional arguments from 'common.args' file
 * - Debug logging with -v, HDF5 error stack printing only then
 * - Post-parsing hooks for derived class customization
 * - Formatted error reporting with usage information
 */
#include "arg_parser.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <argparse/argparse.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "common.hpp"
#include "fkp_logger.hpp"

#ifdef HAS_HDF5
#include <hdf5.h>
#endif

FKPArgumentParser::FKPArgumentParser(std::string program_name, std::string version)
    : ArgumentParser(program_name, version, argparse::default_arguments::help) {
    add_argument("--version")
      .help("Print version information and exit")
      .action([=](const auto &) {
          fmt::print("{}\n", version);
          std::exit(0);
      })
      .default_value(false)
      .implicit_value(true)
      .nargs(0);

    add_argument("-v", "--verbose")
      .help("Verbose output")
      .implicit_value(false)
      .action([&](const std::string &) { _arguments.verbose = true; });

    add_argument("config")
      .metavar("CONFIG.json")
      .help("Simulation configuration with phase, reflectors, detector and rotations")
      .action([&](const std::string &val) { _arguments.config = val; });
}

auto FKPArgumentParser::parse_args(int argc, char **argv) -> FKPArguments {
    // Convert command line arguments to vector for easier manipulation
    std::vector<std::string> args{argv, argv + argc};

    // Load additional arguments from common.args file if it exists
    std::filesystem::path argfile{"common.args"};
    if (std::filesystem::exists(argfile)) {
        std::ifstream f(argfile);
        std::string arg;
        // Read each line as a separate argument
        while (std::getline(f, arg)) {
            // Only add non-empty arguments that aren't already present
            if (!arg.empty() && std::find(args.begin(), args.end(), arg) == args.end()) {
                args.push_back(arg);
            }
        }
    }

    try {
        ArgumentParser::parse_args(args);
    } catch (const std::runtime_error &e) {
        fmt::print("{}: {}\n{}\n", bold(red("Error")), red(e.what()), usage());
        std::exit(1);
    }

    if (_arguments.verbose) {
        FKPLogger::setLevel(spdlog::level::debug);
    }
#ifdef HAS_HDF5
    // Suppress HDF5 error stack printing unless verbose mode is enabled
    if (!_arguments.verbose) {
        H5Eset_auto2(H5E_DEFAULT, nullptr, nullptr);
    }
#endif

    // Call post-parsing hook for derived classes
    post_parse();

    return _arguments;
}

void FKPArgumentParser::post_parse() {
    // Default implementation does nothing
}

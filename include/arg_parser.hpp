/**
 * @file arg_parser.hpp
 * @brief Base argument parser class and structures for the Kikuchi
 * pattern command-line tools.
 *
 * Provides the arguments every tool shares: verbose output, a version
 * flag and the JSON configuration file to simulate. Derived parsers add
 * their own options and validate them in a post-parsing hook.
 *
 * Extra arguments are read from a 'common.args' file in the working
 * directory, one per line, when it exists.
 */
#pragma once

#include <argparse/argparse.hpp>
#include <string>

/**
 * @brief Structure containing the parsed command-line arguments shared
 * by all tools.
 */
struct FKPArguments {
    bool verbose = false;  ///< Enable debug logging output
    std::string config;    ///< Path to the JSON simulation configuration
};

/**
 * @brief Base argument parser class for the command-line tools.
 *
 * Extends argparse::ArgumentParser with the shared arguments and a
 * unified parsing workflow. Parse errors are printed with the usage and
 * exit with status 1.
 */
class FKPArgumentParser : public argparse::ArgumentParser {
  public:
    explicit FKPArgumentParser(std::string program_name, std::string version = "0.1.0");
    virtual ~FKPArgumentParser() = default;

    /**
     * @brief Parses command-line arguments and returns structured
     * argument data.
     *
     * Runs the post-parsing hook of the derived class before returning.
     *
     * @param argc Number of command-line arguments
     * @param argv Array of command-line argument strings
     * @return FKPArguments Structure containing parsed argument values
     */
    auto parse_args(int argc, char **argv) -> FKPArguments;

  protected:
    /**
     * @brief Post-parsing hook for derived classes to perform
     * additional setup.
     *
     * The base implementation is empty and safe to override.
     */
    virtual void post_parse();

    FKPArguments _arguments{};  ///< Internal storage for parsed arguments
};

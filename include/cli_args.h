// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for raspap-touchd
 */

#include <string>

namespace raspap {

/**
 * @brief Parsed command-line arguments
 *
 * Empty strings mean "not given on the command line"; the config file or
 * built-in defaults apply instead.
 */
struct CliArgs {
    std::string config_path;  // -c/--config
    std::string hostapd_conf; // --hostapd-conf: overrides paths/hostapd_conf

    // Logging
    int verbosity = 0;    // -v count
    std::string log_dest; // --log-dest
    std::string log_file; // --log-file

    bool once = false; // --once: single poll, print JSON snapshot, exit

    // Set when parsing stopped without an error (--help, --version)
    bool exit_requested = false;
};

/**
 * @brief Parse command-line arguments
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 * @return true to continue; false if help/version was shown
 *         (args.exit_requested set) or an argument was invalid
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

/**
 * @brief Version string baked in at build time
 */
const char* version_string();

} // namespace raspap

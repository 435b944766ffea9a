// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include <cstdio>
#include <cstring>

#ifndef RASPAP_TOUCH_VERSION
#define RASPAP_TOUCH_VERSION "dev"
#endif

namespace raspap {

const char* version_string() {
    return RASPAP_TOUCH_VERSION;
}

static void print_help(const char* program_name) {
    printf("Usage: %s [options]\n", program_name);
    printf("Options:\n");
    printf("  -c, --config <path>    Config file (default: config.json beside the binary)\n");
    printf("  --hostapd-conf <path>  hostapd.conf used to find the AP interface\n");
    printf("  --once                 Poll once, print the snapshot as JSON and exit\n");
    printf("  -v, --verbose          Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-dest <dest>      Log destination: auto, journal, syslog, file, console\n");
    printf("  --log-file <path>      Log file path (when --log-dest=file)\n");
    printf("  -h, --help             Show this help message\n");
    printf("  -V, --version          Show version information\n");
    printf("\nEnvironment:\n");
    printf("  LOG_LEVEL              trace, debug, info, warn, error, critical, off\n");
    printf("  RASPAP_API_KEY         Key for the RaspAP REST API (client count)\n");
    printf("  RASPAP_API_BASE_URL    RaspAP REST API base (default http://localhost:8081)\n");
}

/// Value of "--name <v>" or "--name=<v>"; nullptr (after printing) when missing
static const char* option_value(int argc, char** argv, int& i, const char* name) {
    size_t len = strlen(name);
    if (strncmp(argv[i], name, len) == 0 && argv[i][len] == '=') {
        return argv[i] + len + 1;
    }
    if (i + 1 < argc) {
        return argv[++i];
    }
    printf("Error: %s requires an argument\n", name);
    return nullptr;
}

static bool matches(const char* arg, const char* name) {
    size_t len = strlen(name);
    return strncmp(arg, name, len) == 0 && (arg[len] == '\0' || arg[len] == '=');
}

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        // Config file
        if (strcmp(argv[i], "-c") == 0 || matches(argv[i], "--config")) {
            const char* value = option_value(argc, argv, i, "--config");
            if (!value)
                return false;
            args.config_path = value;
        } else if (matches(argv[i], "--hostapd-conf")) {
            const char* value = option_value(argc, argv, i, "--hostapd-conf");
            if (!value)
                return false;
            args.hostapd_conf = value;
        } else if (strcmp(argv[i], "--once") == 0) {
            args.once = true;
        }
        // Verbosity
        else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "-vv") == 0 ||
                 strcmp(argv[i], "-vvv") == 0) {
            const char* p = argv[i];
            while (*p == '-')
                p++;
            while (*p == 'v') {
                args.verbosity++;
                p++;
            }
        } else if (strcmp(argv[i], "--verbose") == 0) {
            args.verbosity++;
        }
        // Log destination
        else if (matches(argv[i], "--log-dest")) {
            const char* value = option_value(argc, argv, i, "--log-dest");
            if (!value)
                return false;
            args.log_dest = value;
            if (args.log_dest != "auto" && args.log_dest != "journal" &&
                args.log_dest != "syslog" && args.log_dest != "file" &&
                args.log_dest != "console") {
                printf("Error: invalid --log-dest value: %s\n", args.log_dest.c_str());
                printf("Valid values: auto, journal, syslog, file, console\n");
                return false;
            }
        } else if (matches(argv[i], "--log-file")) {
            const char* value = option_value(argc, argv, i, "--log-file");
            if (!value)
                return false;
            args.log_file = value;
        }
        // Help
        else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_help(argv[0]);
            args.exit_requested = true;
            return false;
        }
        // Version
        else if (strcmp(argv[i], "-V") == 0 || strcmp(argv[i], "--version") == 0) {
            printf("raspap-touchd %s\n", version_string());
            args.exit_requested = true;
            return false;
        }
        // Unknown argument
        else {
            printf("Unknown argument: %s\n", argv[i]);
            printf("Use --help for usage information\n");
            return false;
        }
    }

    return true;
}

} // namespace raspap

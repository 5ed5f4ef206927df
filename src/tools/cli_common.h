/*
 * Copyright (c) 2026 The csvsplit authors
 *
 * This file is part of the csvsplit tool.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

/**
 * @file cli_common.h
 * @brief Command-line front end of csvSplit
 *
 * Provides:
 *   - CliOptions     : parsed command line (run Config + help/version flags)
 *   - parseArgs()    : argv → CliOptions, std::runtime_error on bad input
 *   - printUsage()   : help text
 *   - formatDuration(): elapsed milliseconds → "850 ms" / "12.3 s" / "2m 5s"
 *   - runCli()       : the whole tool; returns the process exit code
 *
 * Kept in a header so the tool can be unit tested.
 */

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <csvsplit/csvsplit.h>

namespace csvsplit_cli {

struct CliOptions {
    csvsplit::Config config;
    bool help    = false;
    bool version = false;
};

inline void printUsage(const char* program_name, std::ostream& os = std::cout) {
    os << "Usage: " << program_name << " -p INPUT_FILE -c COLUMN -o OUTPUT_DIR [OPTIONS]\n\n";
    os << "Split a CSV file into one file per value of a column.\n";
    os << "Output files are '|'-delimited, named <value>.csv and start with the input header.\n";
    os << "Rows with an empty value go to " << csvsplit::UNKNOWN_GROUP_KEY << ".csv.\n\n";
    os << "Required:\n";
    os << "  -p, --path FILE         Input CSV file\n";
    os << "  -c, --column NAME       Column to split by (exact header name)\n";
    os << "  -o, --dir DIR           Output directory (created if missing)\n\n";
    os << "Options:\n";
    os << "  -d, --delimiter CHAR    Input field delimiter (default: ','; use '\\t' or 'tab' for tabs)\n";
    os << "  -r, --create-dir        Write each group to DIR/<value>/<value>.csv\n";
    os << "  -a, --append            Append to existing output files instead of replacing them\n";
    os << "  -x, --drop-column       Leave the split column out of the output files\n";
    os << "  --skip-malformed        Skip rows with a wrong field count instead of aborting\n";
    os << "  -v, --verbose           Enable verbose output\n";
    os << "  --version               Print version and exit\n";
    os << "  -h, --help              Show this help message\n\n";
    os << "Examples:\n";
    os << "  " << program_name << " -p city.csv -c State -o by_state\n";
    os << "  " << program_name << " -p city.tsv -d tab -c State -o by_state -r\n";
    os << "  " << program_name << " -p sales.csv -d ';' -c Region -o out --drop-column\n";
}

/// Parse argv. Does not touch the filesystem; call config.validate() afterwards.
inline CliOptions parseArgs(int argc, const char* const argv[]) {
    CliOptions opts;
    auto& config = opts.config;

    auto requireValue = [&](int& i, const std::string& arg) -> std::string {
        if (i + 1 >= argc) {
            throw std::runtime_error("Option " + arg + " requires an argument");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            opts.help = true;
            return opts;
        } else if (arg == "--version") {
            opts.version = true;
            return opts;
        } else if (arg == "-p" || arg == "--path") {
            config.input_path = requireValue(i, arg);
        } else if (arg == "-d" || arg == "--delimiter") {
            config.input_delimiter = csvsplit::parseDelimiter(requireValue(i, arg));
        } else if (arg == "-c" || arg == "--column") {
            config.group_column = requireValue(i, arg);
        } else if (arg == "-o" || arg == "--dir") {
            config.output_dir = requireValue(i, arg);
        } else if (arg == "-r" || arg == "--create-dir") {
            config.split_into_subdirs = true;
        } else if (arg == "-a" || arg == "--append") {
            config.append = true;
        } else if (arg == "-x" || arg == "--drop-column") {
            config.drop_group_column = true;
        } else if (arg == "--skip-malformed") {
            config.malformed_policy = csvsplit::MalformedRowPolicy::SKIP_ROW;
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (arg.starts_with("-")) {
            throw std::runtime_error("Unknown option: " + arg);
        } else {
            throw std::runtime_error("Unexpected argument: " + arg);
        }
    }

    if (config.input_path.empty()) {
        throw std::runtime_error("Input file is required (-p, --path)");
    }
    if (config.group_column.empty()) {
        throw std::runtime_error("Column to split by is required (-c, --column)");
    }
    if (config.output_dir.empty()) {
        throw std::runtime_error("Output directory is required (-o, --dir)");
    }

    return opts;
}

/// Format elapsed milliseconds for log output.
inline std::string formatDuration(int64_t ms) {
    if (ms < 0) ms = 0;
    if (ms < 1000) {
        return std::to_string(ms) + " ms";
    }
    const int64_t total_seconds = ms / 1000;
    if (total_seconds < 60) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1) << (static_cast<double>(ms) / 1000.0) << " s";
        return oss.str();
    }
    return std::to_string(total_seconds / 60) + "m " + std::to_string(total_seconds % 60) + "s";
}

/**
 * @brief Run csvSplit with the given command line.
 *
 * Usage, version and the one-line summary go to out/err; failures are
 * reported as "Error: <kind>: <message>" on err.
 * @return 0 on success, 1 on any error.
 */
inline int runCli(int argc, const char* const argv[], std::ostream& out = std::cout, std::ostream& err = std::cerr) {
    try {
        CliOptions opts = parseArgs(argc, argv);

        if (opts.help) {
            printUsage(argv[0], out);
            return 0;
        }
        if (opts.version) {
            out << "csvSplit " << csvsplit::getVersion() << std::endl;
            return 0;
        }

        const csvsplit::Config& config = opts.config;
        config.validate();

        if (config.verbose) {
            err << "Input: " << config.input_path.string() << std::endl;
            err << "Column: '" << config.group_column << "'" << std::endl;
            err << "Output directory: " << config.output_dir.string() << std::endl;
            err << "Delimiter: '" << csvsplit::delimiterStr(config.input_delimiter)
                << "' -> '" << csvsplit::delimiterStr(config.output_delimiter) << "'" << std::endl;
            err << "Layout: " << (config.split_into_subdirs ? "<value>/<value>.csv" : "<value>.csv") << std::endl;
            err << "Append: " << (config.append ? "yes" : "no") << std::endl;
            err << "Drop column: " << (config.drop_group_column ? "yes" : "no") << std::endl;
            err << "Malformed rows: "
                << (config.malformed_policy == csvsplit::MalformedRowPolicy::SKIP_ROW ? "skip" : "abort")
                << std::endl;
        }

        auto start = std::chrono::steady_clock::now();

        csvsplit::RowRouter router(config);
        csvsplit::SplitSummary summary = router.run();

        auto end = std::chrono::steady_clock::now();
        auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();

        err << "Successfully split " << summary.rows_routed << " rows into "
            << summary.groups << " files in " << config.output_dir.string();
        if (summary.rows_skipped > 0) {
            err << " (" << summary.rows_skipped << " malformed rows skipped)";
        }
        err << std::endl;

        if (config.verbose) {
            err << "Elapsed: " << formatDuration(elapsed_ms) << std::endl;
        }

        return 0;

    } catch (const csvsplit::SplitError& e) {
        err << "Error: " << e.kindStr() << ": " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << std::endl;
        return 1;
    }
}

} // namespace csvsplit_cli

/*
 * Copyright (c) 2026 The csvsplit authors
 *
 * This file is part of the csvsplit tool.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

/* This file holds all constants and definitions used throughout csvsplit */
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace csvsplit {

    // Version information
    constexpr int VERSION_MAJOR = 0;
    constexpr int VERSION_MINOR = 1;
    constexpr int VERSION_PATCH = 0;

    inline std::string getVersion() {
        return std::to_string(VERSION_MAJOR) + "." +
               std::to_string(VERSION_MINOR) + "." +
               std::to_string(VERSION_PATCH);
    }

    // Library-internal diagnostics on std::cerr
    constexpr bool DEBUG_OUTPUTS = false;

    constexpr char   DEFAULT_INPUT_DELIMITER = ',';
    constexpr char   OUTPUT_DELIMITER        = '|';   // fixed, not user-configurable
    constexpr char   QUOTE_CHAR              = '"';
    constexpr size_t MAX_COLUMN_COUNT        = 65535-1;

    inline constexpr const char* UNKNOWN_GROUP_KEY = "unknown";  // substituted for empty group values
    inline constexpr const char* OUTPUT_EXTENSION  = ".csv";
    inline constexpr const char* WHITESPACE        = " \t\v\r\n";

    /// One parsed row: fields in column order.
    using Record = std::vector<std::string>;

    /// What to do with a row whose field count differs from the header
    enum class MalformedRowPolicy : uint8_t {
        THROW,      // Abort the run with SplitError(MALFORMED_ROW)
        SKIP_ROW,   // Skip the row, remember a warning, keep going
    };

} // namespace csvsplit

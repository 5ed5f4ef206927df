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
 * @file config.h
 * @brief Config: the settings of one split run.
 *
 * Built once (usually by the command-line front end), validated, then
 * handed to RowRouter which keeps its own copy for the whole run.
 */

#include <filesystem>
#include <string>

#include "definitions.h"

namespace csvsplit {

    struct Config {
        std::filesystem::path   input_path;
        char                    input_delimiter     = DEFAULT_INPUT_DELIMITER;
        char                    output_delimiter    = OUTPUT_DELIMITER;
        std::string             group_column;
        std::filesystem::path   output_dir;
        bool                    split_into_subdirs  = false;    // <dir>/<key>/<key>.csv instead of <dir>/<key>.csv

        MalformedRowPolicy      malformed_policy    = MalformedRowPolicy::THROW;
        bool                    append              = false;    // keep existing output content
        bool                    drop_group_column   = false;    // omit the group column from the output
        bool                    verbose             = false;    // progress diagnostics on std::cerr

        /**
         * @brief Check that the run can start.
         *
         * Verifies required fields, delimiters, that the input is a readable
         * regular file and that the output directory exists as a writable
         * directory or can be created. Nothing is created on disk.
         * @throws SplitError(CONFIGURATION)
         */
        void validate() const;
    };

    /**
     * @brief Parse a delimiter argument.
     *
     * Accepts a single character, or "\t" / "tab" for a tab. Quotes and line
     * breaks are rejected.
     * @throws SplitError(CONFIGURATION)
     */
    char parseDelimiter(const std::string& text);

    /// Printable form of a delimiter for diagnostics ("\t" for tab).
    std::string delimiterStr(char delimiter);

} // namespace csvsplit

/*
 * Copyright (c) 2026 The csvsplit authors
 *
 * This file is part of the csvsplit tool.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

#include "config.h"
#include "split_error.h"

#include <filesystem>
#include <system_error>

namespace csvsplit {

    namespace detail {

        inline bool isValidDelimiter(char c) {
            return c != QUOTE_CHAR && c != '\n' && c != '\r' && c != '\0';
        }

        inline bool hasOwnerPermission(const std::filesystem::path& p, std::filesystem::perms perm) {
            std::error_code ec;
            auto perms = std::filesystem::status(p, ec).permissions();
            return !ec && (perms & perm) != std::filesystem::perms::none;
        }

    } // namespace detail

    inline char parseDelimiter(const std::string& text) {
        if (text == "\\t" || text == "tab" || text == "TAB") {
            return '\t';
        }
        if (text.size() != 1) {
            throw SplitError(ErrorKind::CONFIGURATION,
                             "Delimiter must be a single character: '" + text + "'");
        }
        if (!detail::isValidDelimiter(text[0])) {
            throw SplitError(ErrorKind::CONFIGURATION,
                             "Delimiter cannot be a quote or line break character");
        }
        return text[0];
    }

    inline std::string delimiterStr(char delimiter) {
        if (delimiter == '\t') return "\\t";
        return std::string(1, delimiter);
    }

    inline void Config::validate() const {
        namespace fs = std::filesystem;

        if (input_path.empty()) {
            throw SplitError(ErrorKind::CONFIGURATION, "Input file is required (-p, --path)");
        }
        if (group_column.empty()) {
            throw SplitError(ErrorKind::CONFIGURATION, "Group column is required (-c, --column)");
        }
        if (output_dir.empty()) {
            throw SplitError(ErrorKind::CONFIGURATION, "Output directory is required (-o, --dir)");
        }
        if (!detail::isValidDelimiter(input_delimiter)) {
            throw SplitError(ErrorKind::CONFIGURATION, "Invalid input delimiter '" + delimiterStr(input_delimiter) + "'");
        }
        if (!detail::isValidDelimiter(output_delimiter)) {
            throw SplitError(ErrorKind::CONFIGURATION, "Invalid output delimiter '" + delimiterStr(output_delimiter) + "'");
        }

        std::error_code ec;
        if (!fs::exists(input_path, ec)) {
            throw SplitError(ErrorKind::CONFIGURATION, "Input file does not exist: " + input_path.string());
        }
        if (!fs::is_regular_file(input_path, ec)) {
            throw SplitError(ErrorKind::CONFIGURATION, "Input path is not a regular file: " + input_path.string());
        }
        if (!detail::hasOwnerPermission(input_path, fs::perms::owner_read)) {
            throw SplitError(ErrorKind::CONFIGURATION, "No read permission for input file: " + input_path.string());
        }

        if (fs::exists(output_dir, ec)) {
            if (!fs::is_directory(output_dir, ec)) {
                throw SplitError(ErrorKind::CONFIGURATION,
                                 "Output path exists but is not a directory: " + output_dir.string());
            }
            if (!detail::hasOwnerPermission(output_dir, fs::perms::owner_write)) {
                throw SplitError(ErrorKind::CONFIGURATION,
                                 "No write permission for output directory: " + output_dir.string());
            }
            return;
        }

        // Directory will be created on first write; its nearest existing ancestor must allow that
        fs::path ancestor = fs::absolute(output_dir, ec).parent_path();
        while (!ancestor.empty() && !fs::exists(ancestor, ec)) {
            if (ancestor == ancestor.parent_path()) break;
            ancestor = ancestor.parent_path();
        }
        if (ancestor.empty() || !fs::is_directory(ancestor, ec)) {
            throw SplitError(ErrorKind::CONFIGURATION,
                             "Cannot create output directory: " + output_dir.string());
        }
        if (!detail::hasOwnerPermission(ancestor, fs::perms::owner_write)) {
            throw SplitError(ErrorKind::CONFIGURATION,
                             "Cannot create output directory " + output_dir.string() +
                             ": no write permission for " + ancestor.string());
        }
    }

} // namespace csvsplit

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
 * @file split_error.h
 * @brief SplitError: fatal error raised while splitting a CSV file.
 *
 * Every failure that aborts a run is reported as a SplitError. The kind
 * tells callers (and the exit message) which stage failed; what() carries
 * the offending value (column name, file path, line number).
 */

#include <cstdint>
#include <stdexcept>
#include <string>

namespace csvsplit {

    enum class ErrorKind : uint8_t {
        CONFIGURATION,      // missing/invalid arguments, unusable input or output path
        COLUMN_NOT_FOUND,   // group column absent from the header
        MALFORMED_ROW,      // field count differs from the header
        INVALID_GROUP_KEY,  // group value is not a usable path segment
        IO,                 // read/write/flush failure while splitting
    };

    inline std::string errorKindStr(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::CONFIGURATION:      return "configuration error";
            case ErrorKind::COLUMN_NOT_FOUND:   return "schema error";
            case ErrorKind::MALFORMED_ROW:      return "malformed row";
            case ErrorKind::INVALID_GROUP_KEY:  return "invalid group key";
            case ErrorKind::IO:                 return "I/O error";
            default:                            return "unknown error";
        }
    }

    class SplitError : public std::runtime_error {
    public:
        SplitError(ErrorKind kind, const std::string& msg)
            : std::runtime_error(msg)
            , kind_(kind)
        {}

        ErrorKind   kind() const        { return kind_; }
        std::string kindStr() const     { return errorKindStr(kind_); }

    private:
        ErrorKind kind_;
    };

} // namespace csvsplit

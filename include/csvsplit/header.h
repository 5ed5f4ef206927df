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
 * @file header.h
 * @brief Header: column names of a CSV file and name → index lookup.
 */

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "definitions.h"

namespace csvsplit {

    class Header {
        std::vector<std::string>                names_;
        std::unordered_map<std::string, size_t> index_;    // name -> first column with that name

    public:
        Header() = default;
        explicit Header(std::vector<std::string> names);

        void                            clear();
        size_t                          columnCount() const         { return names_.size(); }
        const std::string&              columnName(size_t index) const;
        bool                            empty() const               { return names_.empty(); }
        bool                            hasColumn(const std::string& name) const;
        const std::vector<std::string>& names() const               { return names_; }

        /**
         * @brief Retrieves the column index for a given name.
         *
         * Exact, case-sensitive match. Duplicate names resolve to the first column.
         * @return The column index, or MAX_COLUMN_COUNT if not found.
         */
        size_t                          columnIndex(const std::string& name) const;
    };

    /**
     * @brief Resolve the group column to a zero-based index.
     * @throws SplitError(COLUMN_NOT_FOUND) naming the column if absent.
     */
    size_t resolveColumnIndex(const Header& header, const std::string& columnName);

} // namespace csvsplit

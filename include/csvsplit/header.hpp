/*
 * Copyright (c) 2026 The csvsplit authors
 *
 * This file is part of the csvsplit tool.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

#include "header.h"
#include "split_error.h"

#include <stdexcept>
#include <utility>

namespace csvsplit {

    inline Header::Header(std::vector<std::string> names)
        : names_(std::move(names))
    {
        index_.reserve(names_.size());
        for (size_t i = 0; i < names_.size(); ++i) {
            index_.emplace(names_[i], i);   // keeps the first occurrence
        }
    }

    inline void Header::clear() {
        names_.clear();
        index_.clear();
    }

    inline const std::string& Header::columnName(size_t index) const {
        if (index >= names_.size()) {
            throw std::out_of_range("Header::columnName: index " + std::to_string(index) +
                                    " out of range (" + std::to_string(names_.size()) + " columns)");
        }
        return names_[index];
    }

    inline bool Header::hasColumn(const std::string& name) const {
        return index_.find(name) != index_.end();
    }

    inline size_t Header::columnIndex(const std::string& name) const {
        auto it = index_.find(name);
        return it == index_.end() ? MAX_COLUMN_COUNT : it->second;
    }

    inline size_t resolveColumnIndex(const Header& header, const std::string& columnName) {
        size_t index = header.columnIndex(columnName);
        if (index == MAX_COLUMN_COUNT) {
            std::string available;
            for (size_t i = 0; i < header.columnCount(); ++i) {
                if (i > 0) available += ", ";
                available += "'" + header.columnName(i) + "'";
            }
            throw SplitError(ErrorKind::COLUMN_NOT_FOUND,
                             "Column '" + columnName + "' not found in header (available: " +
                             (available.empty() ? std::string("none") : available) + ")");
        }
        return index;
    }

} // namespace csvsplit

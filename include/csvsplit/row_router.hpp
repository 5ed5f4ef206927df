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
 * @file row_router.hpp
 * @brief RowRouter implementations.
 */

#include "row_router.h"
#include "csv_reader.hpp"
#include "csv_writer.hpp"
#include "header.hpp"
#include "split_error.h"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace csvsplit {

    // ── Constructor / Destructor ────────────────────────────────────────

    inline RowRouter::RowRouter(Config config)
        : config_(std::move(config))
    {}

    inline RowRouter::~RowRouter() {
        if (!writers_.empty()) {
            closeAll(nullptr);
        }
    }

    // ── Run ─────────────────────────────────────────────────────────────

    inline SplitSummary RowRouter::run() {
        CsvRecordReader reader(config_.input_delimiter, config_.malformed_policy);

        if (config_.verbose) {
            std::cerr << "Reading file: " << config_.input_path.string() << std::endl;
        }
        if (!reader.open(config_.input_path)) {
            throw SplitError(ErrorKind::CONFIGURATION,
                             "Cannot open input file " + config_.input_path.string() + ": " + reader.getErrorMsg());
        }

        SplitSummary summary;
        try {
            begin(reader.header());

            if (config_.verbose) {
                std::cerr << "Header contains " << header_.columnCount() << " columns, grouping by '"
                          << config_.group_column << "' (column " << group_index_ << ")" << std::endl;
                std::cerr << "Writing records to " << config_.output_dir.string()
                          << (config_.split_into_subdirs ? " (one directory per group)" : "") << std::endl;
            }

            while (true) {
                const bool more = reader.readNext();
                if (config_.verbose) {
                    for (const auto& warning : reader.warnings()) {
                        std::cerr << warning << std::endl;
                    }
                }
                if (!more) {
                    break;
                }
                route(reader.record());

                if (config_.verbose && (reader.rowPos() & 0xFFFF) == 0) {
                    logProgress(reader);
                }
            }

            finalize();

            summary.rows_read    = reader.rowPos();
            summary.rows_routed  = rows_routed_;
            summary.rows_skipped = reader.skippedRows();
            summary.groups       = groupCount();

        } catch (const std::exception&) {
            closeAll(nullptr);
            finalized_ = true;
            throw;
        }

        reader.close();

        if (config_.verbose) {
            std::cerr << "Finished writing records: " << summary.rows_routed << " rows into "
                      << summary.groups << " files" << std::endl;
        }
        return summary;
    }

    inline void RowRouter::begin(const Header& header) {
        if (!writers_.empty()) {
            throw std::logic_error("RowRouter::begin: writers are already open");
        }

        group_index_ = resolveColumnIndex(header, config_.group_column);
        header_ = header;
        output_header_ = project(header_.names());
        rows_routed_ = 0;
        group_order_.clear();
        finalized_ = false;
    }

    // ── Routing ─────────────────────────────────────────────────────────

    inline void RowRouter::route(const Record& record) {
        if (group_index_ == MAX_COLUMN_COUNT) {
            throw std::logic_error("RowRouter::route: begin() has not been called");
        }
        if (finalized_) {
            throw std::logic_error("RowRouter::route: router has been finalized");
        }

        const std::string key = computeGroupKey(record, group_index_);
        writerFor(key).writeRecord(project(record));
        rows_routed_++;
    }

    inline CsvRecordWriter& RowRouter::writerFor(const std::string& groupKey) {
        auto it = writers_.find(groupKey);
        if (it != writers_.end()) {
            return *it->second;
        }

        if (!isValidGroupKey(groupKey)) {
            throw SplitError(ErrorKind::INVALID_GROUP_KEY,
                             "Value '" + groupKey + "' of column '" + config_.group_column +
                             "' cannot be used as a file name");
        }

        FilePath path = outputPath(groupKey);
        if (isInputFile(path)) {
            throw SplitError(ErrorKind::CONFIGURATION,
                             "Output file " + path.string() + " for value '" + groupKey +
                             "' is the input file " + config_.input_path.string());
        }
        auto writer = std::make_unique<CsvRecordWriter>(config_.output_delimiter);
        if (!writer->open(path, !config_.append, &output_header_, config_.append)) {
            throw SplitError(ErrorKind::IO,
                             "Cannot create output file " + path.string() + ": " + writer->getErrorMsg());
        }

        if (config_.verbose) {
            std::cerr << "New group '" << groupKey << "' -> " << path.string() << std::endl;
        }

        CsvRecordWriter& ref = *writer;
        writers_.emplace(groupKey, std::move(writer));
        group_order_.push_back(groupKey);
        return ref;
    }

    inline std::string RowRouter::computeGroupKey(const Record& record, size_t index) {
        if (index >= record.size()) {
            throw std::out_of_range("RowRouter::computeGroupKey: column " + std::to_string(index) +
                                    " out of range (" + std::to_string(record.size()) + " fields)");
        }
        const std::string& value = record[index];
        if (value.find_first_not_of(WHITESPACE) == std::string::npos) {
            return UNKNOWN_GROUP_KEY;
        }
        return value;
    }

    inline bool RowRouter::isValidGroupKey(const std::string& key) {
        if (key.empty() || key == "." || key == "..") {
            return false;
        }
        return key.find_first_of(std::string("/\\\0", 3)) == std::string::npos;
    }

    inline RowRouter::FilePath RowRouter::outputPath(const std::string& groupKey) const {
        const std::string fileName = groupKey + OUTPUT_EXTENSION;
        if (config_.split_into_subdirs) {
            return config_.output_dir / groupKey / fileName;
        }
        return config_.output_dir / fileName;
    }

    inline bool RowRouter::isInputFile(const FilePath& path) const {
        namespace fs = std::filesystem;
        std::error_code ec;
        FilePath input = fs::weakly_canonical(config_.input_path, ec);
        if (ec) {
            return false;
        }
        FilePath output = fs::weakly_canonical(path, ec);
        if (ec) {
            return false;
        }
        if (input == output) {
            return true;
        }
        // Hard links and other aliases of an existing file
        return fs::exists(output, ec) && fs::equivalent(input, output, ec);
    }

    inline bool RowRouter::hasWriter(const std::string& groupKey) const {
        return writers_.find(groupKey) != writers_.end();
    }

    // ── Finalization ────────────────────────────────────────────────────

    inline void RowRouter::finalize() {
        if (finalized_) {
            return;
        }
        std::string firstError;
        closeAll(&firstError);
        finalized_ = true;
        if (!firstError.empty()) {
            throw SplitError(ErrorKind::IO, firstError);
        }
    }

    // ── Private helpers ─────────────────────────────────────────────────

    /// Close writers in creation order. Failures go to firstError, or to std::cerr when null.
    inline void RowRouter::closeAll(std::string* firstError) {
        for (const auto& key : group_order_) {
            auto it = writers_.find(key);
            if (it == writers_.end()) {
                continue;
            }
            if (!it->second->close()) {
                if (firstError == nullptr) {
                    std::cerr << "Warning: " << it->second->getErrorMsg() << std::endl;
                } else if (firstError->empty()) {
                    *firstError = it->second->getErrorMsg();
                }
            }
        }
        writers_.clear();
    }

    /// Record as written: unchanged, or without the group column
    inline const Record& RowRouter::project(const Record& record) {
        if (!config_.drop_group_column) {
            return record;
        }
        projected_.clear();
        for (size_t i = 0; i < record.size(); ++i) {
            if (i != group_index_) {
                projected_.push_back(record[i]);
            }
        }
        return projected_;
    }

    inline void RowRouter::logProgress(const CsvRecordReader& reader) const {
        std::cerr << "Processed " << reader.rowPos() << " rows (file line " << reader.fileLine()
                  << "), " << groupCount() << " groups..." << std::endl;
    }

} // namespace csvsplit

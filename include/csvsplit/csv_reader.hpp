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
 * @file csv_reader.hpp
 * @brief CsvRecordReader implementations.
 */

#include "csv_reader.h"
#include "header.hpp"
#include "split_error.h"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace csvsplit {

    // ── Constructor / Destructor ────────────────────────────────────────

    inline CsvRecordReader::CsvRecordReader(char delimiter, MalformedRowPolicy policy)
        : delimiter_(delimiter)
        , policy_(policy)
    {
        line_buf_.reserve(4096);
        raw_line_.reserve(4096);
    }

    inline CsvRecordReader::~CsvRecordReader() {
        if (isOpen()) {
            close();
        }
    }

    // ── Lifecycle ───────────────────────────────────────────────────────

    inline void CsvRecordReader::close() {
        if (!stream_.is_open()) {
            return;
        }
        stream_.close();
        file_path_.clear();
        header_.clear();
        record_.clear();
        row_pos_ = 0;
        file_line_ = 0;
        skipped_ = 0;
        record_line_ = 0;
        unterminated_ = false;
        warnings_.clear();
    }

    inline bool CsvRecordReader::open(const FilePath& filepath, bool hasHeader) {
        err_msg_.clear();

        if (isOpen()) {
            err_msg_ = "Warning: File is already open: " + file_path_.string();
            if constexpr (DEBUG_OUTPUTS) {
                std::cerr << err_msg_ << std::endl;
            }
            return false;
        }

        try {
            FilePath absolutePath = std::filesystem::absolute(filepath);

            if (!std::filesystem::exists(absolutePath)) {
                throw std::runtime_error("Error: File does not exist: " + absolutePath.string());
            }

            if (!std::filesystem::is_regular_file(absolutePath)) {
                throw std::runtime_error("Error: Path is not a regular file: " + absolutePath.string());
            }

            std::error_code ec;
            auto perms = std::filesystem::status(absolutePath, ec).permissions();
            if (ec || (perms & std::filesystem::perms::owner_read) == std::filesystem::perms::none) {
                throw std::runtime_error("Error: No read permission for file: " + absolutePath.string());
            }

            // Binary mode: '\r' is stripped explicitly so CRLF input behaves the same everywhere
            stream_.open(absolutePath, std::ios::in | std::ios::binary);
            if (!stream_.is_open()) {
                throw std::runtime_error("Error: Cannot open file for reading: " + absolutePath.string());
            }

            file_path_ = absolutePath;
            row_pos_ = 0;
            file_line_ = 0;
            skipped_ = 0;
            record_line_ = 0;
            unterminated_ = false;
            warnings_.clear();
            header_.clear();
            record_.clear();

            if (hasHeader) {
                if (!readHeader()) {
                    throw std::runtime_error("Failed to read CSV header: " + err_msg_);
                }
            }

            return true;

        } catch (const std::exception& ex) {
            err_msg_ = ex.what();
            if (stream_.is_open()) {
                stream_.close();
            }
            file_path_.clear();
            return false;
        }
    }

    // ── Reading ─────────────────────────────────────────────────────────

    inline bool CsvRecordReader::readNext() {
        warnings_.clear();
        if (!isOpen()) {
            return false;
        }

        // Iterative loop, blank and skipped lines never recurse
        while (readLogicalLine()) {
            if (unterminated_) {
                rejectRecord("Record starting at file line " + std::to_string(record_line_) +
                             " has an unterminated quoted field");
                continue;
            }
            if (line_buf_.empty()) {
                continue;
            }

            splitLine(line_buf_);

            if (!header_.empty() && cells_.size() != header_.columnCount()) {
                rejectRecord("Record at file line " + std::to_string(file_line_) + " has " +
                             std::to_string(cells_.size()) + " fields, header has " +
                             std::to_string(header_.columnCount()));
                continue;
            }

            record_.resize(cells_.size());
            for (size_t i = 0; i < cells_.size(); ++i) {
                record_[i] = unquote(cells_[i]);
            }

            row_pos_++;
            return true;
        }
        return false;
    }

    // ── Private helpers ─────────────────────────────────────────────────

    /// Throw under THROW, otherwise count the record as skipped and keep a warning
    inline void CsvRecordReader::rejectRecord(const std::string& reason) {
        if (policy_ == MalformedRowPolicy::THROW) {
            err_msg_ = reason;
            throw SplitError(ErrorKind::MALFORMED_ROW, reason + " (" + file_path_.string() + ")");
        }
        err_msg_ = "Warning: " + reason + ", skipped";
        if constexpr (DEBUG_OUTPUTS) {
            std::cerr << err_msg_ << std::endl;
        }
        warnings_.push_back(err_msg_);
        skipped_++;
    }

    /// Read the header line and keep the (unquoted) column names
    inline bool CsvRecordReader::readHeader() {
        if (!readLogicalLine()) {
            err_msg_ = "Error: CSV file is empty (no header line)";
            return false;
        }
        if (unterminated_) {
            err_msg_ = "Error: CSV header has an unterminated quoted field";
            return false;
        }

        // Strip BOM if present (UTF-8 BOM: EF BB BF)
        if (line_buf_.size() >= 3 &&
            static_cast<unsigned char>(line_buf_[0]) == 0xEF &&
            static_cast<unsigned char>(line_buf_[1]) == 0xBB &&
            static_cast<unsigned char>(line_buf_[2]) == 0xBF) {
            line_buf_.erase(0, 3);
        }

        if (line_buf_.empty()) {
            err_msg_ = "Error: CSV header line is empty";
            return false;
        }

        splitLine(line_buf_);

        if (cells_.size() > MAX_COLUMN_COUNT) {
            err_msg_ = "Error: CSV header has too many columns (" + std::to_string(cells_.size()) + ")";
            return false;
        }

        std::vector<std::string> names;
        names.reserve(cells_.size());
        for (auto cell : cells_) {
            names.push_back(unquote(cell));
        }
        header_ = Header(std::move(names));
        return true;
    }

    /**
     * Read one logical line into line_buf_ (a quoted field may span physical lines).
     * Returns false at clean EOF. Sets unterminated_ when EOF cuts a quoted field short.
     *
     * Quote state follows the same rules as splitLine(): a quote opens a field
     * only at field start, "" inside a quoted field is an escaped quote.
     */
    inline bool CsvRecordReader::readLogicalLine() {
        line_buf_.clear();
        unterminated_ = false;
        bool inQuotes = false;
        bool fieldStart = true;
        bool gotData = false;

        while (true) {
            if (!std::getline(stream_, raw_line_)) {
                if (stream_.bad()) {
                    throw SplitError(ErrorKind::IO, "Read failure at file line " +
                                     std::to_string(file_line_ + 1) + " (" + file_path_.string() + ")");
                }
                unterminated_ = gotData && inQuotes;
                return gotData;
            }
            file_line_++;

            if (!raw_line_.empty() && raw_line_.back() == '\r') {
                raw_line_.pop_back();
            }

            if (gotData) {
                line_buf_.push_back('\n');   // newline was inside a quoted field
            } else {
                record_line_ = file_line_;
            }
            line_buf_ += raw_line_;
            gotData = true;

            const size_t len = raw_line_.size();
            for (size_t i = 0; i < len; ++i) {
                const char c = raw_line_[i];
                if (inQuotes) {
                    if (c == QUOTE_CHAR) {
                        if (i + 1 < len && raw_line_[i + 1] == QUOTE_CHAR) {
                            ++i;
                        } else {
                            inQuotes = false;
                        }
                    }
                } else if (c == delimiter_) {
                    fieldStart = true;
                } else {
                    inQuotes = fieldStart && c == QUOTE_CHAR;
                    fieldStart = false;
                }
            }

            if (!inQuotes) {
                return true;
            }
        }
    }

    /// Split a logical line into cells; delimiters inside a quoted field are kept
    inline void CsvRecordReader::splitLine(const std::string& line) {
        cells_.clear();
        const char* data = line.data();
        const size_t len = line.size();
        size_t start = 0;
        bool inQuotes = false;

        for (size_t i = 0; i <= len; ++i) {
            if (i == len) {
                cells_.emplace_back(data + start, i - start);
            } else if (inQuotes) {
                if (data[i] == QUOTE_CHAR) {
                    if (i + 1 < len && data[i + 1] == QUOTE_CHAR) {
                        ++i;
                    } else {
                        inQuotes = false;
                    }
                }
            } else if (data[i] == delimiter_) {
                cells_.emplace_back(data + start, i - start);
                start = i + 1;
            } else if (data[i] == QUOTE_CHAR && i == start) {
                inQuotes = true;
            }
        }
    }

    /**
     * Unquote a CSV field. Unquoted fields are returned as-is. A field opened
     * with '"' loses its enclosing quotes and has "" unescaped; any text after
     * the closing quote is kept literally ("ab"c -> abc).
     */
    inline std::string CsvRecordReader::unquote(std::string_view cell) {
        if (cell.empty() || cell.front() != QUOTE_CHAR) {
            return std::string(cell);
        }
        std::string result;
        result.reserve(cell.size());
        bool inQuotes = true;
        for (size_t i = 1; i < cell.size(); ++i) {
            const char c = cell[i];
            if (inQuotes && c == QUOTE_CHAR) {
                if (i + 1 < cell.size() && cell[i + 1] == QUOTE_CHAR) {
                    result.push_back(QUOTE_CHAR);
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                result.push_back(c);
            }
        }
        return result;
    }

} // namespace csvsplit

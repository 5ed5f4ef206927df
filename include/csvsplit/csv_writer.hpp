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
 * @file csv_writer.hpp
 * @brief CsvRecordWriter implementations.
 */

#include "csv_writer.h"
#include "split_error.h"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace csvsplit {

    // ── Constructor / Destructor ────────────────────────────────────────

    inline CsvRecordWriter::CsvRecordWriter(char delimiter)
        : delimiter_(delimiter)
    {
        buf_.reserve(4096);
    }

    inline CsvRecordWriter::~CsvRecordWriter() {
        if (isOpen() && !close()) {
            if constexpr (DEBUG_OUTPUTS) {
                std::cerr << err_msg_ << std::endl;
            }
        }
    }

    // ── Lifecycle ───────────────────────────────────────────────────────

    inline bool CsvRecordWriter::close() {
        if (!stream_.is_open()) {
            return true;
        }
        stream_.flush();
        bool ok = stream_.good();
        stream_.close();
        ok = ok && !stream_.fail();
        if (!ok) {
            err_msg_ = "Error: Failed to flush output file: " + file_path_.string();
        }
        file_path_.clear();
        row_cnt_ = 0;
        return ok;
    }

    inline bool CsvRecordWriter::open(const FilePath& filepath, bool overwrite,
                                      const Record* header, bool append) {
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

            // Create parent directory if needed
            FilePath parentDir = absolutePath.parent_path();
            if (!parentDir.empty() && !std::filesystem::exists(parentDir)) {
                std::error_code ec;
                if (!std::filesystem::create_directories(parentDir, ec)) {
                    err_msg_ = "Error: Cannot create directory: " + parentDir.string() +
                              " (Error: " + ec.message() + ")";
                    throw std::runtime_error(err_msg_);
                }
            }

            bool hasContent = false;
            if (std::filesystem::exists(absolutePath)) {
                if (!std::filesystem::is_regular_file(absolutePath)) {
                    err_msg_ = "Error: Output path exists and is not a regular file: " + absolutePath.string();
                    throw std::runtime_error(err_msg_);
                }
                if (!overwrite && !append) {
                    err_msg_ = "Warning: File already exists: " + absolutePath.string() +
                              ". Use overwrite=true to replace it.";
                    throw std::runtime_error(err_msg_);
                }
                hasContent = append && std::filesystem::file_size(absolutePath) > 0;
            }

            // Check write permissions
            std::error_code ec;
            auto perms = std::filesystem::status(parentDir, ec).permissions();
            if (ec || (perms & std::filesystem::perms::owner_write) == std::filesystem::perms::none) {
                err_msg_ = "Error: No write permission for directory: " + parentDir.string();
                throw std::runtime_error(err_msg_);
            }

            // Binary mode: records always end in '\n'
            auto mode = std::ios::out | std::ios::binary | (append ? std::ios::app : std::ios::trunc);
            stream_.open(absolutePath, mode);
            if (!stream_.good()) {
                err_msg_ = "Error: Cannot open file for writing: " + absolutePath.string();
                throw std::runtime_error(err_msg_);
            }

            file_path_ = absolutePath;
            row_cnt_ = 0;

            if (header != nullptr && !hasContent) {
                writeLine(*header);
                if (!stream_.good()) {
                    err_msg_ = "Error: Cannot write header to: " + absolutePath.string();
                    throw std::runtime_error(err_msg_);
                }
            }

            return true;

        } catch (const std::filesystem::filesystem_error& ex) {
            if (err_msg_.empty()) {
                err_msg_ = std::string("Filesystem error: ") + ex.what();
            }
        } catch (const std::exception& ex) {
            if (err_msg_.empty()) {
                err_msg_ = std::string("Error opening file: ") + ex.what();
            }
        }

        if constexpr (DEBUG_OUTPUTS) {
            std::cerr << err_msg_ << std::endl;
        }
        if (stream_.is_open()) {
            stream_.close();
        }
        file_path_.clear();
        return false;
    }

    // ── Writing ─────────────────────────────────────────────────────────

    inline void CsvRecordWriter::writeRecord(const Record& record) {
        if (!stream_.is_open()) {
            throw SplitError(ErrorKind::IO, "Error: Writer is not open");
        }

        writeLine(record);
        if (!stream_.good()) {
            throw SplitError(ErrorKind::IO, "Error: Write failed for " + file_path_.string() +
                             " after " + std::to_string(row_cnt_) + " records");
        }
        row_cnt_++;
    }

    inline void CsvRecordWriter::appendField(std::vector<char>& out, const std::string& value, char delimiter) {
        bool needsQuoting = false;
        for (char c : value) {
            if (c == delimiter || c == QUOTE_CHAR || c == '\n' || c == '\r') {
                needsQuoting = true;
                break;
            }
        }

        if (!needsQuoting) {
            out.insert(out.end(), value.begin(), value.end());
            return;
        }

        out.push_back(QUOTE_CHAR);
        for (char c : value) {
            if (c == QUOTE_CHAR) out.push_back(QUOTE_CHAR);   // escape quotes by doubling
            out.push_back(c);
        }
        out.push_back(QUOTE_CHAR);
    }

    // ── Private helpers ─────────────────────────────────────────────────

    inline void CsvRecordWriter::writeLine(const Record& fields) {
        buf_.clear();
        for (size_t i = 0; i < fields.size(); ++i) {
            if (i > 0) buf_.push_back(delimiter_);
            appendField(buf_, fields[i], delimiter_);
        }
        buf_.push_back('\n');
        stream_.write(buf_.data(), static_cast<std::streamsize>(buf_.size()));
    }

} // namespace csvsplit

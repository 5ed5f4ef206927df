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
 * @file csv_reader.h
 * @brief CsvRecordReader: stream a delimited text file record by record.
 *
 * Fields are kept as text; no type conversion is attempted. The first line
 * is the header and defines the expected field count of every record.
 *
 * Design:
 *   - State-machine line splitter (handles quoted fields, embedded delimiters)
 *   - A '"' opens a quoted field only as the first character of a field;
 *     anywhere else it is an ordinary character (O"Brien stays O"Brien)
 *   - Quoted fields may span multiple physical lines
 *   - Configurable delimiter (default ',')
 *   - Strips UTF-8 BOM from the header and trailing '\r' from every line
 *   - Blank lines are ignored
 *   - Field count mismatch handled per MalformedRowPolicy
 *
 * Usage:
 *     csvsplit::CsvRecordReader reader(';');
 *     if (!reader.open("input.csv")) {
 *         std::cerr << reader.getErrorMsg() << std::endl;
 *     }
 *     while (reader.readNext()) {
 *         const auto& fields = reader.record();
 *     }
 *     reader.close();
 */

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

#include "definitions.h"
#include "header.h"

namespace csvsplit {

    class CsvRecordReader {
    public:
        using FilePath          = std::filesystem::path;

    private:
        std::string             err_msg_;             // last error message description
        FilePath                file_path_;           // path to the input file
        std::ifstream           stream_;              // text input stream

        Header                  header_;              // column names from the first line
        Record                  record_;              // current record, unquoted fields
        size_t                  row_pos_ = 0;         // number of data records returned so far
        size_t                  file_line_ = 0;       // 1-based raw line counter (including header, blanks)
        size_t                  skipped_ = 0;         // malformed records dropped under SKIP_ROW
        size_t                  record_line_ = 0;     // first physical line of the current logical line
        bool                    unterminated_ = false; // EOF reached inside a quoted field
        std::vector<std::string> warnings_;           // skip warnings raised by the last readNext()

        char                    delimiter_ = DEFAULT_INPUT_DELIMITER;
        MalformedRowPolicy      policy_ = MalformedRowPolicy::THROW;

        // Reusable buffers to minimize allocations
        std::string             line_buf_;            // current logical line being parsed
        std::string             raw_line_;            // one physical line
        std::vector<std::string_view> cells_;         // split cells (views into line_buf_)

    public:
        explicit CsvRecordReader(char delimiter = DEFAULT_INPUT_DELIMITER,
                                 MalformedRowPolicy policy = MalformedRowPolicy::THROW);
        ~CsvRecordReader();

        CsvRecordReader(const CsvRecordReader&) = delete;
        CsvRecordReader& operator=(const CsvRecordReader&) = delete;

        void                    close();
        const std::string&      getErrorMsg() const             { return err_msg_; }
        const FilePath&         filePath() const                { return file_path_; }
        const Header&           header() const                  { return header_; }
        bool                    isOpen() const                  { return stream_.is_open(); }
        bool                    open(const FilePath& filepath, bool hasHeader = true);

        /**
         * @brief Advance to the next record.
         * @return false at end of input.
         * @throws SplitError(MALFORMED_ROW) if the field count differs from the
         *         header, or a quoted field is still open at end of input, and
         *         the policy is THROW.
         * @throws SplitError(IO) if the stream fails for a reason other than EOF.
         */
        bool                    readNext();
        const Record&           record() const                  { return record_; }
        size_t                  rowPos() const                  { return row_pos_; }
        size_t                  fileLine() const                { return file_line_; }
        size_t                  skippedRows() const             { return skipped_; }

        /// One message per record skipped by the last readNext() (SKIP_ROW only).
        const std::vector<std::string>& warnings() const        { return warnings_; }

        char                    delimiter() const               { return delimiter_; }
        MalformedRowPolicy      malformedRowPolicy() const      { return policy_; }

    private:
        bool                    readHeader();
        bool                    readLogicalLine();
        void                    rejectRecord(const std::string& reason);
        void                    splitLine(const std::string& line);
        static std::string      unquote(std::string_view cell);
    };

} // namespace csvsplit

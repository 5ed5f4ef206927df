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
 * @file csv_writer.h
 * @brief CsvRecordWriter: write text records to one delimited output file.
 *
 * Design:
 *   - Single os.write() per record (buffered in a reusable char vector)
 *   - Stream buffering only; nothing is flushed before close()
 *   - Configurable delimiter (default '|')
 *   - A field is quoted iff it contains the delimiter, a quote or a line break;
 *     embedded quotes are doubled
 *   - Creates the parent directory tree on open()
 *
 * Usage:
 *     csvsplit::Record header{"id", "State"};
 *     csvsplit::CsvRecordWriter writer('|');
 *     writer.open("out/CA.csv", true, &header);
 *     writer.writeRecord({"1", "CA"});
 *     writer.close();
 */

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "definitions.h"

namespace csvsplit {

    class CsvRecordWriter {
    public:
        using FilePath          = std::filesystem::path;

    private:
        std::string             err_msg_;           // last error message description
        FilePath                file_path_;         // path to the output file
        std::ofstream           stream_;            // text output stream

        uint64_t                row_cnt_ = 0;       // data records written (header excluded)
        char                    delimiter_ = OUTPUT_DELIMITER;

        std::vector<char>       buf_;               // reusable per-record serialization buffer

    public:
        explicit CsvRecordWriter(char delimiter = OUTPUT_DELIMITER);
        ~CsvRecordWriter();

        CsvRecordWriter(const CsvRecordWriter&) = delete;
        CsvRecordWriter& operator=(const CsvRecordWriter&) = delete;

        /// Flush and close. Returns false (see getErrorMsg()) if buffered data could not be written.
        bool                    close();
        const std::string&      getErrorMsg() const             { return err_msg_; }
        const FilePath&         filePath() const                { return file_path_; }
        bool                    isOpen() const                  { return stream_.is_open(); }

        /**
         * @brief Open the output file.
         * @param filepath  Destination; missing parent directories are created.
         * @param overwrite Replace an existing file. Without it (and without append)
         *                  an existing file is an error.
         * @param header    Written as the first line unless null, or unless appending
         *                  to a file that already has content.
         * @param append    Keep existing content and add records at the end.
         */
        bool                    open(const FilePath& filepath, bool overwrite = false,
                                     const Record* header = nullptr, bool append = false);
        size_t                  rowCount() const                { return row_cnt_; }

        /// @throws SplitError(IO) if the writer is closed or the stream has failed.
        void                    writeRecord(const Record& record);

        char                    delimiter() const               { return delimiter_; }

        /// Append one field to out, quoted when it contains delimiter, quote or line break.
        static void             appendField(std::vector<char>& out, const std::string& value, char delimiter);

    private:
        void                    writeLine(const Record& fields);
    };

} // namespace csvsplit

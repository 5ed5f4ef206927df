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
 * @file row_router.h
 * @brief RowRouter: partition a CSV file into one output file per group value.
 *
 * A single forward pass over the input. For every record the value of the
 * group column selects the output file; the first record of a group opens
 * that file (writing the header), later records reuse the open writer.
 * Every writer stays open until finalize(), so no file is reopened and
 * truncated mid-run.
 *
 * Output layout:
 *   split_into_subdirs == false   <output_dir>/<key>.csv
 *   split_into_subdirs == true    <output_dir>/<key>/<key>.csv
 *
 * Empty (or whitespace-only) group values map to UNKNOWN_GROUP_KEY.
 *
 * Usage:
 *     csvsplit::Config config;
 *     config.input_path   = "city.csv";
 *     config.group_column = "State";
 *     config.output_dir   = "out";
 *     config.validate();
 *
 *     csvsplit::RowRouter router(config);
 *     auto summary = router.run();
 */

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "config.h"
#include "csv_writer.h"
#include "definitions.h"
#include "header.h"

namespace csvsplit {

    class CsvRecordReader;

    struct SplitSummary {
        size_t  rows_read       = 0;    // data records accepted by the reader
        size_t  rows_routed     = 0;    // records written to an output file
        size_t  rows_skipped    = 0;    // malformed records dropped under SKIP_ROW
        size_t  groups          = 0;    // distinct group keys (= output files)
    };

    class RowRouter {
    public:
        using FilePath          = std::filesystem::path;
        using WriterRegistry    = std::unordered_map<std::string, std::unique_ptr<CsvRecordWriter>>;

    private:
        const Config            config_;
        Header                  header_;                    // input header, set by begin()
        Record                  output_header_;             // header as written to each file
        size_t                  group_index_ = MAX_COLUMN_COUNT;
        WriterRegistry          writers_;                   // one open writer per group key
        std::vector<std::string> group_order_;              // keys in first-seen order
        Record                  projected_;                 // scratch record for drop_group_column
        size_t                  rows_routed_ = 0;
        bool                    finalized_ = false;

    public:
        explicit RowRouter(Config config);
        ~RowRouter();

        RowRouter(const RowRouter&) = delete;
        RowRouter& operator=(const RowRouter&) = delete;

        /**
         * @brief Split the configured input file.
         *
         * Opens the input, resolves the group column, routes every record and
         * finalizes. On any error all open writers are closed before the
         * exception propagates; rows already written stay on disk.
         * @throws SplitError
         */
        SplitSummary            run();

        /**
         * @brief Bind the router to an input header.
         *
         * Resolves the group column; nothing is written before this succeeds.
         * @throws SplitError(COLUMN_NOT_FOUND)
         */
        void                    begin(const Header& header);

        /// Route one data record to its group's file. begin() must have been called.
        void                    route(const Record& record);

        /**
         * @brief Flush and close every writer. Safe to call more than once.
         * @throws SplitError(IO) naming the first file that failed; all writers
         *         are closed regardless.
         */
        void                    finalize();

        /**
         * @brief Writer for a group key, opened (and given a header) on first use.
         * @throws SplitError(INVALID_GROUP_KEY) if the key is not a single path segment.
         * @throws SplitError(IO) if the output file cannot be opened.
         */
        CsvRecordWriter&        writerFor(const std::string& groupKey);

        /// Group key of a record: the group column value, or UNKNOWN_GROUP_KEY if blank.
        static std::string      computeGroupKey(const Record& record, size_t index);

        /// True if key can be used as a file/directory name on its own.
        static bool             isValidGroupKey(const std::string& key);

        FilePath                outputPath(const std::string& groupKey) const;

        const Config&           config() const                  { return config_; }
        size_t                  groupCount() const              { return group_order_.size(); }
        const std::vector<std::string>& groups() const          { return group_order_; }
        size_t                  groupIndex() const              { return group_index_; }
        bool                    hasWriter(const std::string& groupKey) const;

        /// True if path names the input file (compared after resolving symlinks and "..").
        bool                    isInputFile(const FilePath& path) const;
        const Header&           header() const                  { return header_; }
        size_t                  rowsRouted() const              { return rows_routed_; }

    private:
        void                    closeAll(std::string* firstError);
        const Record&           project(const Record& record);
        void                    logProgress(const CsvRecordReader& reader) const;
    };

} // namespace csvsplit

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
 * @file csvsplit.h
 * @brief csvsplit - Main Header with Declarations
 *
 * A C++20 header-only library that partitions a delimited text file into
 * one output file per value of a chosen column.
 *
 * This header includes all component declarations:
 * - Config: settings of one run and their validation
 * - Header: column names and name lookup
 * - CsvRecordReader: streaming delimited text reader
 * - CsvRecordWriter: delimited text writer for one output file
 * - RowRouter: group key computation and writer registry
 */

// Core definitions first
#include "definitions.h"
#include "split_error.h"

// Component declarations
#include "config.h"
#include "csv_reader.h"
#include "csv_writer.h"
#include "header.h"
#include "row_router.h"

// Include implementations
#include "config.hpp"
#include "csv_reader.hpp"
#include "csv_writer.hpp"
#include "header.hpp"
#include "row_router.hpp"

/*
 * Copyright (c) 2026 The csvsplit authors
 *
 * This file is part of the csvsplit tool.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file csvSplit.cpp
 * @brief CLI tool to split a CSV file into one file per value of a column
 *
 * Reads the input once, routing each row to <dir>/<value>.csv (or
 * <dir>/<value>/<value>.csv with --create-dir). Output is '|'-delimited and
 * every file starts with the input header. See cli_common.h for the options.
 */

#include "cli_common.h"

int main(int argc, char* argv[]) {
    return csvsplit_cli::runCli(argc, argv);
}

/*
 * Copyright (c) 2026 The csvsplit authors
 *
 * This file is part of the csvsplit tool.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file csv_writer_test.cpp
 * @brief Tests for CsvRecordWriter: header, quoting rule, directories, overwrite/append
 */

#include <gtest/gtest.h>
#include <csvsplit/csvsplit.h>

#include "test_common.hpp"

using csvsplit::CsvRecordReader;
using csvsplit::CsvRecordWriter;
using csvsplit::Record;

class CsvWriterTest : public csvsplit_test::TempDirTest {};

TEST_F(CsvWriterTest, WritesHeaderAndRecords) {
    auto path = tmpFile("out.csv");
    Record header{"id", "State"};

    CsvRecordWriter writer;
    ASSERT_TRUE(writer.open(path, false, &header)) << writer.getErrorMsg();
    EXPECT_EQ(writer.delimiter(), '|');
    writer.writeRecord({"1", "CA"});
    writer.writeRecord({"4", "CA"});
    EXPECT_EQ(writer.rowCount(), 2u);
    EXPECT_TRUE(writer.close());
    EXPECT_FALSE(writer.isOpen());

    EXPECT_EQ(readFile(path), "id|State\n1|CA\n4|CA\n");
}

TEST_F(CsvWriterTest, NoHeaderWhenNull) {
    auto path = tmpFile("noheader.csv");

    CsvRecordWriter writer;
    ASSERT_TRUE(writer.open(path));
    writer.writeRecord({"a", "b"});
    ASSERT_TRUE(writer.close());

    EXPECT_EQ(readFile(path), "a|b\n");
}

TEST_F(CsvWriterTest, Quoting_OnlyWhenNeeded) {
    auto path = tmpFile("quoting.csv");

    CsvRecordWriter writer('|');
    ASSERT_TRUE(writer.open(path));
    writer.writeRecord({"plain", "with,comma", " padded "});
    writer.writeRecord({"a|b", "say \"hi\"", "line1\nline2"});
    writer.writeRecord({"", "cr\rhere", "x"});
    ASSERT_TRUE(writer.close());

    EXPECT_EQ(readFile(path),
              "plain|with,comma| padded \n"
              "\"a|b\"|\"say \"\"hi\"\"\"|\"line1\nline2\"\n"
              "|\"cr\rhere\"|x\n");
}

TEST_F(CsvWriterTest, AppendFieldQuotesDelimiter) {
    std::vector<char> out;
    CsvRecordWriter::appendField(out, "x;y", ';');
    EXPECT_EQ(std::string(out.begin(), out.end()), "\"x;y\"");

    out.clear();
    CsvRecordWriter::appendField(out, "x;y", '|');
    EXPECT_EQ(std::string(out.begin(), out.end()), "x;y");
}

TEST_F(CsvWriterTest, OutputReadsBackThroughReader) {
    auto path = tmpFile("roundtrip.csv");
    Record header{"id", "note"};

    {
        CsvRecordWriter writer;
        ASSERT_TRUE(writer.open(path, false, &header));
        writer.writeRecord({"1", "pipe|inside"});
        writer.writeRecord({"2", "multi\nline \"quoted\""});
        ASSERT_TRUE(writer.close());
    }

    CsvRecordReader reader('|');
    ASSERT_TRUE(reader.open(path)) << reader.getErrorMsg();
    EXPECT_EQ(reader.header().names(), header);
    ASSERT_TRUE(reader.readNext());
    EXPECT_EQ(reader.record(), (Record{"1", "pipe|inside"}));
    ASSERT_TRUE(reader.readNext());
    EXPECT_EQ(reader.record(), (Record{"2", "multi\nline \"quoted\""}));
    EXPECT_FALSE(reader.readNext());
}

TEST_F(CsvWriterTest, CreatesParentDirectories) {
    auto path = tmpDir_ / "a" / "b" / "c.csv";

    CsvRecordWriter writer;
    ASSERT_TRUE(writer.open(path)) << writer.getErrorMsg();
    writer.writeRecord({"1"});
    ASSERT_TRUE(writer.close());

    EXPECT_TRUE(fs::is_directory(tmpDir_ / "a" / "b"));
    EXPECT_EQ(readFile(path), "1\n");
}

TEST_F(CsvWriterTest, OverwriteProtection) {
    auto path = writeFile("existing.csv", "old content\n");

    CsvRecordWriter writer;
    EXPECT_FALSE(writer.open(path));
    EXPECT_NE(writer.getErrorMsg().find("already exists"), std::string::npos) << writer.getErrorMsg();
    EXPECT_EQ(readFile(path), "old content\n");

    Record header{"h"};
    ASSERT_TRUE(writer.open(path, true, &header));
    writer.writeRecord({"new"});
    ASSERT_TRUE(writer.close());
    EXPECT_EQ(readFile(path), "h\nnew\n");
}

TEST_F(CsvWriterTest, AppendKeepsContentAndSkipsHeader) {
    auto path = writeFile("append.csv", "h\nfirst\n");
    Record header{"h"};

    CsvRecordWriter writer;
    ASSERT_TRUE(writer.open(path, false, &header, true));
    writer.writeRecord({"second"});
    ASSERT_TRUE(writer.close());

    EXPECT_EQ(readFile(path), "h\nfirst\nsecond\n");
}

TEST_F(CsvWriterTest, AppendToEmptyFileWritesHeader) {
    auto path = writeFile("append_empty.csv", "");
    Record header{"h"};

    CsvRecordWriter writer;
    ASSERT_TRUE(writer.open(path, false, &header, true));
    writer.writeRecord({"v"});
    ASSERT_TRUE(writer.close());

    EXPECT_EQ(readFile(path), "h\nv\n");
}

TEST_F(CsvWriterTest, OpenDirectoryPathFails) {
    fs::create_directories(tmpDir_ / "dir.csv");

    CsvRecordWriter writer;
    EXPECT_FALSE(writer.open(tmpDir_ / "dir.csv", true));
    EXPECT_NE(writer.getErrorMsg().find("not a regular file"), std::string::npos) << writer.getErrorMsg();
    EXPECT_FALSE(writer.isOpen());
}

TEST_F(CsvWriterTest, OpenAlreadyOpenWriter) {
    CsvRecordWriter writer;
    ASSERT_TRUE(writer.open(tmpFile("one.csv")));
    EXPECT_FALSE(writer.open(tmpFile("two.csv")));
    EXPECT_NE(writer.getErrorMsg().find("already open"), std::string::npos);
    EXPECT_TRUE(writer.close());
    EXPECT_FALSE(fs::exists(tmpFile("two.csv")));
}

TEST_F(CsvWriterTest, WriteOnClosedWriterThrows) {
    CsvRecordWriter writer;
    try {
        writer.writeRecord({"x"});
        FAIL() << "Expected SplitError";
    } catch (const csvsplit::SplitError& e) {
        EXPECT_EQ(e.kind(), csvsplit::ErrorKind::IO);
    }
}

TEST_F(CsvWriterTest, CloseIsIdempotent) {
    CsvRecordWriter writer;
    EXPECT_TRUE(writer.close());
    ASSERT_TRUE(writer.open(tmpFile("c.csv")));
    EXPECT_TRUE(writer.close());
    EXPECT_TRUE(writer.close());
}

TEST_F(CsvWriterTest, DestructorFlushesBufferedRecords) {
    auto path = tmpFile("dtor.csv");
    {
        CsvRecordWriter writer;
        ASSERT_TRUE(writer.open(path));
        for (int i = 0; i < 1000; ++i) {
            writer.writeRecord({std::to_string(i)});
        }
    }
    auto lines = readLines(path);
    ASSERT_EQ(lines.size(), 1000u);
    EXPECT_EQ(lines.back(), "999");
}

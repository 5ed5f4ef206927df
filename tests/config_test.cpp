/*
 * Copyright (c) 2026 The csvsplit authors
 *
 * This file is part of the csvsplit tool.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file config_test.cpp
 * @brief Tests for command-line parsing, delimiter parsing, Config::validate()
 *        and the exit behaviour of the csvSplit tool
 */

#include <gtest/gtest.h>
#include <csvsplit/csvsplit.h>

#include <initializer_list>

#include "cli_common.h"
#include "test_common.hpp"

using csvsplit::Config;
using csvsplit::ErrorKind;
using csvsplit::SplitError;

namespace {

// argv builder; keeps the strings alive for the duration of the call
csvsplit_cli::CliOptions parse(std::initializer_list<std::string> args) {
    std::vector<std::string> storage{"csvSplit"};
    storage.insert(storage.end(), args.begin(), args.end());
    std::vector<const char*> argv;
    for (const auto& s : storage) {
        argv.push_back(s.c_str());
    }
    return csvsplit_cli::parseArgs(static_cast<int>(argv.size()), argv.data());
}

struct CliRun {
    int         exit_code;
    std::string out;
    std::string err;
};

CliRun runTool(std::initializer_list<std::string> args) {
    std::vector<std::string> storage{"csvSplit"};
    storage.insert(storage.end(), args.begin(), args.end());
    std::vector<const char*> argv;
    for (const auto& s : storage) {
        argv.push_back(s.c_str());
    }
    std::ostringstream out;
    std::ostringstream err;
    int code = csvsplit_cli::runCli(static_cast<int>(argv.size()), argv.data(), out, err);
    return {code, out.str(), err.str()};
}

std::string parseError(std::initializer_list<std::string> args) {
    try {
        parse(args);
    } catch (const std::exception& e) {
        return e.what();
    }
    return {};
}

} // namespace

// ============================================================================
// Command line
// ============================================================================

TEST(CliArgsTest, RequiredOptionsAndDefaults) {
    auto opts = parse({"-p", "city.csv", "-c", "State", "-o", "out"});
    const Config& config = opts.config;

    EXPECT_FALSE(opts.help);
    EXPECT_FALSE(opts.version);
    EXPECT_EQ(config.input_path.string(), "city.csv");
    EXPECT_EQ(config.group_column, "State");
    EXPECT_EQ(config.output_dir.string(), "out");
    EXPECT_EQ(config.input_delimiter, ',');
    EXPECT_EQ(config.output_delimiter, '|');
    EXPECT_FALSE(config.split_into_subdirs);
    EXPECT_FALSE(config.append);
    EXPECT_FALSE(config.drop_group_column);
    EXPECT_FALSE(config.verbose);
    EXPECT_EQ(config.malformed_policy, csvsplit::MalformedRowPolicy::THROW);
}

TEST(CliArgsTest, LongOptionsAndFlags) {
    auto opts = parse({"--path", "in.tsv", "--delimiter", "tab", "--column", "Region",
                       "--dir", "by_region", "--create-dir", "--append", "--drop-column",
                       "--skip-malformed", "--verbose"});
    const Config& config = opts.config;

    EXPECT_EQ(config.input_path.string(), "in.tsv");
    EXPECT_EQ(config.input_delimiter, '\t');
    EXPECT_EQ(config.group_column, "Region");
    EXPECT_EQ(config.output_dir.string(), "by_region");
    EXPECT_TRUE(config.split_into_subdirs);
    EXPECT_TRUE(config.append);
    EXPECT_TRUE(config.drop_group_column);
    EXPECT_TRUE(config.verbose);
    EXPECT_EQ(config.malformed_policy, csvsplit::MalformedRowPolicy::SKIP_ROW);
}

TEST(CliArgsTest, ShortFlags) {
    auto opts = parse({"-r", "-a", "-x", "-v", "-d", ";", "-p", "a.csv", "-c", "k", "-o", "o"});
    EXPECT_TRUE(opts.config.split_into_subdirs);
    EXPECT_TRUE(opts.config.append);
    EXPECT_TRUE(opts.config.drop_group_column);
    EXPECT_TRUE(opts.config.verbose);
    EXPECT_EQ(opts.config.input_delimiter, ';');
}

TEST(CliArgsTest, ColumnNameKeptVerbatim) {
    auto opts = parse({"-p", "a.csv", "-c", "Postal Code", "-o", "o"});
    EXPECT_EQ(opts.config.group_column, "Postal Code");
}

TEST(CliArgsTest, HelpAndVersionShortCircuit) {
    EXPECT_TRUE(parse({"-h"}).help);
    EXPECT_TRUE(parse({"--help", "--bogus"}).help);
    EXPECT_TRUE(parse({"--version"}).version);
}

TEST(CliArgsTest, MissingRequiredOptions) {
    EXPECT_NE(parseError({"-c", "State", "-o", "out"}).find("Input file is required"), std::string::npos);
    EXPECT_NE(parseError({"-p", "a.csv", "-o", "out"}).find("Column to split by is required"), std::string::npos);
    EXPECT_NE(parseError({"-p", "a.csv", "-c", "State"}).find("Output directory is required"), std::string::npos);
}

TEST(CliArgsTest, MissingOptionValue) {
    EXPECT_EQ(parseError({"-p", "a.csv", "-o", "out", "-c"}), "Option -c requires an argument");
}

TEST(CliArgsTest, UnknownOptionAndStrayArgument) {
    EXPECT_EQ(parseError({"-p", "a.csv", "-c", "k", "-o", "o", "--bogus"}), "Unknown option: --bogus");
    EXPECT_EQ(parseError({"-p", "a.csv", "-c", "k", "-o", "o", "extra"}), "Unexpected argument: extra");
}

TEST(CliArgsTest, InvalidDelimiter) {
    EXPECT_THROW(parse({"-d", "ab", "-p", "a.csv", "-c", "k", "-o", "o"}), SplitError);
}

TEST(CliArgsTest, UsageMentionsAllOptions) {
    std::ostringstream oss;
    csvsplit_cli::printUsage("csvSplit", oss);
    const std::string usage = oss.str();
    for (const char* opt : {"--path", "--delimiter", "--column", "--dir", "--create-dir",
                            "--append", "--drop-column", "--skip-malformed", "--verbose", "--help"}) {
        EXPECT_NE(usage.find(opt), std::string::npos) << opt;
    }
}

TEST(CliArgsTest, FormatDuration) {
    EXPECT_EQ(csvsplit_cli::formatDuration(850), "850 ms");
    EXPECT_EQ(csvsplit_cli::formatDuration(12345), "12.3 s");
    EXPECT_EQ(csvsplit_cli::formatDuration(125000), "2m 5s");
    EXPECT_EQ(csvsplit_cli::formatDuration(-5), "0 ms");
}

// ============================================================================
// Delimiters
// ============================================================================

TEST(DelimiterTest, ParseDelimiter) {
    EXPECT_EQ(csvsplit::parseDelimiter(","), ',');
    EXPECT_EQ(csvsplit::parseDelimiter(";"), ';');
    EXPECT_EQ(csvsplit::parseDelimiter("|"), '|');
    EXPECT_EQ(csvsplit::parseDelimiter("\t"), '\t');
    EXPECT_EQ(csvsplit::parseDelimiter("\\t"), '\t');
    EXPECT_EQ(csvsplit::parseDelimiter("tab"), '\t');
    EXPECT_EQ(csvsplit::parseDelimiter("TAB"), '\t');
}

TEST(DelimiterTest, RejectsInvalidDelimiters) {
    for (const std::string text : {"", ",,", "\"", "\n", "\r"}) {
        try {
            csvsplit::parseDelimiter(text);
            FAIL() << "Expected SplitError for '" << text << "'";
        } catch (const SplitError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::CONFIGURATION);
        }
    }
}

TEST(DelimiterTest, DelimiterStr) {
    EXPECT_EQ(csvsplit::delimiterStr('\t'), "\\t");
    EXPECT_EQ(csvsplit::delimiterStr(';'), ";");
}

// ============================================================================
// Config::validate()
// ============================================================================

class ConfigValidateTest : public csvsplit_test::TempDirTest {
protected:
    Config validConfig() const {
        Config config;
        config.input_path = writeFile("in.csv", "id,State\n1,CA\n");
        config.group_column = "State";
        config.output_dir = tmpDir_ / "out";
        return config;
    }

    static std::string validateError(const Config& config) {
        try {
            config.validate();
        } catch (const SplitError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::CONFIGURATION);
            return e.what();
        }
        return {};
    }
};

TEST_F(ConfigValidateTest, ValidConfigPasses) {
    Config config = validConfig();
    EXPECT_NO_THROW(config.validate());
    EXPECT_FALSE(fs::exists(config.output_dir)) << "validate() must not create the output directory";
}

TEST_F(ConfigValidateTest, ExistingOutputDirectoryPasses) {
    Config config = validConfig();
    fs::create_directories(config.output_dir);
    EXPECT_NO_THROW(config.validate());
}

TEST_F(ConfigValidateTest, NestedMissingOutputDirectoryPasses) {
    Config config = validConfig();
    config.output_dir = tmpDir_ / "a" / "b" / "c";
    EXPECT_NO_THROW(config.validate());
}

TEST_F(ConfigValidateTest, MissingFields) {
    Config config = validConfig();
    config.input_path.clear();
    EXPECT_NE(validateError(config).find("Input file is required"), std::string::npos);

    config = validConfig();
    config.group_column.clear();
    EXPECT_NE(validateError(config).find("Group column is required"), std::string::npos);

    config = validConfig();
    config.output_dir.clear();
    EXPECT_NE(validateError(config).find("Output directory is required"), std::string::npos);
}

TEST_F(ConfigValidateTest, InputMustBeExistingRegularFile) {
    Config config = validConfig();
    config.input_path = tmpDir_ / "missing.csv";
    EXPECT_NE(validateError(config).find("does not exist"), std::string::npos);

    config.input_path = tmpDir_;
    EXPECT_NE(validateError(config).find("not a regular file"), std::string::npos);
}

TEST_F(ConfigValidateTest, OutputPathIsAFile) {
    Config config = validConfig();
    config.output_dir = writeFile("not_a_dir", "x");
    EXPECT_NE(validateError(config).find("not a directory"), std::string::npos);
}

TEST_F(ConfigValidateTest, OutputBelowAFile) {
    Config config = validConfig();
    config.output_dir = writeFile("blocker", "x") / "sub";
    EXPECT_NE(validateError(config).find("Cannot create output directory"), std::string::npos);
}

TEST_F(ConfigValidateTest, InvalidDelimiterInConfig) {
    Config config = validConfig();
    config.input_delimiter = '"';
    EXPECT_NE(validateError(config).find("Invalid input delimiter"), std::string::npos);

    config = validConfig();
    config.output_delimiter = '\n';
    EXPECT_NE(validateError(config).find("Invalid output delimiter"), std::string::npos);
}

// ============================================================================
// csvSplit exit behaviour
// ============================================================================

class CliRunTest : public csvsplit_test::TempDirTest {
protected:
    std::string input_;
    std::string outDir_;

    void SetUp() override {
        TempDirTest::SetUp();
        input_ = writeFile("states.csv", "id,State\n1,CA\n2,NY\n3,\n4,CA\n").string();
        outDir_ = (tmpDir_ / "out").string();
    }
};

TEST_F(CliRunTest, SuccessExitsZero) {
    auto run = runTool({"-p", input_, "-c", "State", "-o", outDir_});
    EXPECT_EQ(run.exit_code, 0) << run.err;
    EXPECT_NE(run.err.find("Successfully split 4 rows into 3 files"), std::string::npos) << run.err;
    EXPECT_EQ(listFiles(outDir_), (std::vector<std::string>{"CA.csv", "NY.csv", "unknown.csv"}));
}

TEST_F(CliRunTest, ColumnNotFoundReportsSchemaError) {
    auto run = runTool({"-p", input_, "-c", "Nope", "-o", outDir_});
    EXPECT_EQ(run.exit_code, 1);
    EXPECT_EQ(run.err.rfind("Error: schema error: Column 'Nope' not found", 0), 0u) << run.err;
    EXPECT_FALSE(fs::exists(outDir_));
}

TEST_F(CliRunTest, MalformedRowReportsKind) {
    auto bad = writeFile("bad.csv", "id,State\n1,CA\n2\n").string();
    auto run = runTool({"-p", bad, "-c", "State", "-o", outDir_});
    EXPECT_EQ(run.exit_code, 1);
    EXPECT_EQ(run.err.rfind("Error: malformed row: ", 0), 0u) << run.err;
    EXPECT_NE(run.err.find("file line 3"), std::string::npos) << run.err;
}

TEST_F(CliRunTest, SkipMalformedExitsZero) {
    auto bad = writeFile("bad.csv", "id,State\n1,CA\n2\n").string();
    auto run = runTool({"-p", bad, "-c", "State", "-o", outDir_, "--skip-malformed"});
    EXPECT_EQ(run.exit_code, 0) << run.err;
    EXPECT_NE(run.err.find("(1 malformed rows skipped)"), std::string::npos) << run.err;
}

TEST_F(CliRunTest, MissingInputReportsConfigurationError) {
    auto run = runTool({"-p", (tmpDir_ / "missing.csv").string(), "-c", "State", "-o", outDir_});
    EXPECT_EQ(run.exit_code, 1);
    EXPECT_EQ(run.err.rfind("Error: configuration error: Input file does not exist", 0), 0u) << run.err;
}

TEST_F(CliRunTest, UsageErrorExitsOne) {
    auto run = runTool({"-c", "State"});
    EXPECT_EQ(run.exit_code, 1);
    EXPECT_EQ(run.err, "Error: Input file is required (-p, --path)\n");
}

TEST_F(CliRunTest, HelpAndVersionExitZero) {
    auto help = runTool({"--help"});
    EXPECT_EQ(help.exit_code, 0);
    EXPECT_NE(help.out.find("Usage: csvSplit"), std::string::npos);

    auto version = runTool({"--version"});
    EXPECT_EQ(version.exit_code, 0);
    EXPECT_EQ(version.out, "csvSplit " + csvsplit::getVersion() + "\n");
}

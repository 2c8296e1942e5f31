// VERISCORE - Configuration Tests
// Copyright (c) 2024 VERISCORE Developers
// MIT License

#include <gtest/gtest.h>

#include "veriscore/util/config.h"
#include "veriscore/util/fs.h"

#include <cstdlib>
#include <string>

namespace veriscore {
namespace util {
namespace test {

class ConfigTest : public ::testing::Test {
protected:
    std::string WriteConf(const std::string& content) {
        const std::string path = fs::JoinPath(dir_.GetPath(), "veriscore.conf");
        EXPECT_TRUE(fs::WriteFileAtomic(path, content));
        return path;
    }

    fs::TempDirectory dir_;
    ConfigManager config_;
};

// ============================================================================
// File Syntax
// ============================================================================

TEST_F(ConfigTest, CommentsAndBlankLines) {
    EXPECT_FALSE(config_.ParseString("\n# builddir=/tmp\n; threads=2\n   \n"));
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, KeyValueWithSpaces) {
    ASSERT_FALSE(config_.ParseString("  threads   =   4  \nbuilddir=build/circuits"));
    EXPECT_EQ(config_.GetUInt("threads", 0), 4u);
    EXPECT_EQ(config_.GetString("builddir", ""), "build/circuits");
}

TEST_F(ConfigTest, QuotedValues) {
    ASSERT_FALSE(config_.ParseString(R"(outdir="/tmp/with space"
salt="a\tb\"c\\")"));
    EXPECT_EQ(config_.GetString("outdir", ""), "/tmp/with space");
    EXPECT_EQ(config_.GetString("salt", ""), "a\tb\"c\\");
}

TEST_F(ConfigTest, UnterminatedQuoteIsError) {
    auto error = config_.ParseString("threads=1\noutdir=\"/tmp\n", "test.conf");
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->line, 2);
    EXPECT_EQ(error->ToString().rfind("test.conf:2: ", 0), 0u);
}

TEST_F(ConfigTest, BareAndNegatedFlags) {
    ASSERT_FALSE(config_.ParseString("autosetup\nnoprinttoconsole"));
    EXPECT_TRUE(config_.GetBool("autosetup", false));
    EXPECT_TRUE(config_.HasKey("printtoconsole"));
    EXPECT_FALSE(config_.GetBool("printtoconsole", true));
}

TEST_F(ConfigTest, SectionsAreRejected) {
    auto error = config_.ParseString("threads=2\n[prover]\n");
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->line, 2);
}

TEST_F(ConfigTest, InvalidKeyIsError) {
    EXPECT_TRUE(config_.ParseString("bad key!=1").has_value());
    EXPECT_TRUE(config_.ParseString("BuildDir=/x").has_value());
    EXPECT_TRUE(config_.ParseString("=x").has_value());
}

TEST_F(ConfigTest, EnvironmentExpansion) {
    setenv("VERISCORE_TEST_ROOT", "/srv", 1);
    unsetenv("VERISCORE_UNSET_VAR");
    ASSERT_FALSE(config_.ParseString(
        "builddir=${VERISCORE_TEST_ROOT}/circuits\noutdir=a${VERISCORE_UNSET_VAR}b"));
    EXPECT_EQ(config_.GetString("builddir", ""), "/srv/circuits");
    EXPECT_EQ(config_.GetString("outdir", ""), "ab");
    unsetenv("VERISCORE_TEST_ROOT");
}

// ============================================================================
// Typed Getters
// ============================================================================

TEST_F(ConfigTest, UnsignedValues) {
    ASSERT_FALSE(config_.ParseString("a=42\nb=-1\nc=12abc\nd="));
    EXPECT_EQ(config_.GetUInt("a", 0), 42u);
    EXPECT_FALSE(config_.TryGetUInt("b").has_value());
    EXPECT_FALSE(config_.TryGetUInt("c").has_value());
    EXPECT_FALSE(config_.TryGetUInt("d").has_value());
    EXPECT_EQ(config_.GetUInt("missing", 5), 5u);
}

TEST_F(ConfigTest, BooleanSpellings) {
    ASSERT_FALSE(config_.ParseString("a=yes\nb=off\nc=TRUE\nd=maybe"));
    EXPECT_TRUE(config_.GetBool("a", false));
    EXPECT_FALSE(config_.GetBool("b", true));
    EXPECT_TRUE(config_.GetBool("c", false));
    EXPECT_FALSE(config_.TryGetBool("d").has_value());
    EXPECT_TRUE(config_.GetBool("d", true));
}

TEST_F(ConfigTest, RepeatedKeyBuildsList) {
    ASSERT_FALSE(config_.ParseString("debug=prover, keys\ndebug=codec"));
    const auto list = config_.GetList("debug");
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[0], "prover");
    EXPECT_EQ(list[1], "keys");
    EXPECT_EQ(list[2], "codec");
    EXPECT_EQ(config_.GetString("debug", ""), "codec");
    EXPECT_TRUE(config_.GetList("missing").empty());
}

TEST_F(ConfigTest, ExpandPath) {
    setenv("HOME", "/home/tester", 1);
    EXPECT_EQ(ConfigManager::ExpandPath("~/keys"), "/home/tester/keys");
    EXPECT_EQ(ConfigManager::ExpandPath("~"), "/home/tester");
    EXPECT_EQ(ConfigManager::ExpandPath("a/~/b"), "a/~/b");
    EXPECT_EQ(ConfigManager::ExpandPath("${HOME}/x"), "/home/tester/x");

    ASSERT_FALSE(config_.ParseString("builddir=~/circuits"));
    EXPECT_EQ(config_.GetPath("builddir"), "/home/tester/circuits");
    EXPECT_EQ(config_.GetPath("outdir", "out"), "out");
}

// ============================================================================
// Files and Layers
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    ASSERT_FALSE(config_.ParseFile(WriteConf("builddir=/var/keys\nthreads=3\n")));
    EXPECT_EQ(config_.GetString("builddir", ""), "/var/keys");
    EXPECT_EQ(config_.GetUInt("threads", 0), 3u);
}

TEST_F(ConfigTest, MissingFileIsError) {
    auto error = config_.ParseFile(fs::JoinPath(dir_.GetPath(), "absent.conf"));
    ASSERT_TRUE(error.has_value());
    EXPECT_FALSE(error->message.empty());
}

TEST_F(ConfigTest, OversizedFileIsError) {
    const std::string big(MAX_CONFIG_SIZE + 1, '#');
    EXPECT_TRUE(config_.ParseFile(WriteConf(big)).has_value());
}

TEST_F(ConfigTest, CommandLineOptionsAndPositional) {
    const char* argv[] = {"veriscore-cli", "-builddir=/keys", "--autosetup", "-noprinttoconsole",
                          "prove", "threshold", "8500", "7000", "-"};
    ASSERT_FALSE(config_.ParseCommandLine(9, argv));

    EXPECT_EQ(config_.GetString("builddir", ""), "/keys");
    EXPECT_TRUE(config_.GetBool("autosetup", false));
    EXPECT_FALSE(config_.GetBool("printtoconsole", true));

    const auto& positional = config_.Positional();
    ASSERT_EQ(positional.size(), 5u);
    EXPECT_EQ(positional[0], "prove");
    EXPECT_EQ(positional[3], "7000");
    EXPECT_EQ(positional[4], "-");
}

TEST_F(ConfigTest, CommandLineValuesAreLiteral) {
    const char* argv[] = {"veriscore-cli", "-salt=\"${HOME}\""};
    ASSERT_FALSE(config_.ParseCommandLine(2, argv));
    EXPECT_EQ(config_.GetString("salt", ""), "\"${HOME}\"");
}

TEST_F(ConfigTest, InvalidOption) {
    const char* argv[] = {"veriscore-cli", "-bad key=1"};
    auto error = config_.ParseCommandLine(2, argv);
    ASSERT_TRUE(error.has_value());
    EXPECT_NE(error->message.find("-bad key=1"), std::string::npos);
}

TEST_F(ConfigTest, LayerPrecedence) {
    config_.SetDefault("threads", "1");
    config_.SetDefault("outdir", "out");
    config_.SetDefault("loglevel", "warn");

    const char* argv[] = {"veriscore-cli", "-threads=8", "-debug=prover"};
    ASSERT_FALSE(config_.ParseCommandLine(3, argv));
    ASSERT_FALSE(config_.ParseFile(WriteConf("threads=2\noutdir=/out\ndebug=keys\n")));

    EXPECT_EQ(config_.GetUInt("threads", 0), 8u);
    EXPECT_EQ(config_.GetString("outdir", ""), "/out");
    EXPECT_EQ(config_.GetString("loglevel", ""), "warn");
    EXPECT_EQ(config_.GetList("debug"), std::vector<std::string>{"prover"});

    config_.Set("threads", "6");
    config_.Set("threads", "5");
    EXPECT_EQ(config_.GetUInt("threads", 0), 5u);
    EXPECT_EQ(config_.GetList("threads").size(), 1u);
}

TEST_F(ConfigTest, ValidateReportsUnknownKeys) {
    AllowStandardKeys(config_);
    ASSERT_FALSE(config_.ParseString("builddir=/keys\nbuildir=/typo\n", "node.conf"));
    const auto warnings = config_.Validate();
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("buildir"), std::string::npos);
    EXPECT_NE(warnings[0].find("node.conf:2"), std::string::npos);
}

TEST_F(ConfigTest, ValidateWithoutAllowListIsSilent) {
    ASSERT_FALSE(config_.ParseString("anything=1"));
    EXPECT_TRUE(config_.Validate().empty());
}

// ============================================================================
// Log Options
// ============================================================================

TEST_F(ConfigTest, LogOptionsFromConfig) {
    ASSERT_FALSE(config_.ParseString("loglevel=warn\nlogfile=/tmp/veriscore.log\nnoprinttoconsole"));
    const LogOptions options = GetLogOptions(config_);
    EXPECT_EQ(options.level, LogLevel::Warn);
    EXPECT_EQ(options.file, "/tmp/veriscore.log");
    EXPECT_FALSE(options.printToConsole);
    EXPECT_TRUE(options.categories.empty());
}

TEST_F(ConfigTest, LogOptionsDebugCategories) {
    ASSERT_FALSE(config_.ParseString("loglevel=error\ndebug=prover,keys"));
    const LogOptions options = GetLogOptions(config_);
    EXPECT_EQ(options.level, LogLevel::Debug);
    ASSERT_EQ(options.categories.size(), 2u);
    EXPECT_EQ(options.categories[0], "prover");
    EXPECT_EQ(options.categories[1], "keys");
}

TEST_F(ConfigTest, LogOptionsDebugAllAndOff) {
    ASSERT_FALSE(config_.ParseString("debug=1"));
    LogOptions options = GetLogOptions(config_);
    EXPECT_EQ(options.level, LogLevel::Debug);
    EXPECT_TRUE(options.categories.empty());

    ConfigManager quiet;
    ASSERT_FALSE(quiet.ParseString("nodebug"));
    options = GetLogOptions(quiet);
    EXPECT_EQ(options.level, LogLevel::Info);
    EXPECT_TRUE(options.categories.empty());
}

} // namespace test
} // namespace util
} // namespace veriscore

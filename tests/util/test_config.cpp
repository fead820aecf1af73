// NeuroShield - Configuration File Parser Tests
// Copyright (c) 2024 NeuroShield Developers
// MIT License

#include <gtest/gtest.h>

#include "neuroshield/util/config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <unistd.h>

namespace neuroshield {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.Clear();
    }

    void TearDown() override {
        for (const auto& file : tempFiles_) {
            std::remove(file.c_str());
        }
        tempFiles_.clear();
    }

    std::string CreateTempFile(const std::string& content) {
        char filename[] = "/tmp/neuroshield_config_test_XXXXXX";
        int fd = mkstemp(filename);
        if (fd < 0) {
            throw std::runtime_error("Failed to create temp file");
        }
        close(fd);

        std::ofstream file(filename);
        file << content;
        file.close();

        tempFiles_.push_back(filename);
        return filename;
    }

    ConfigManager config_;
    std::vector<std::string> tempFiles_;
};

// ============================================================================
// Basic Parsing Tests
// ============================================================================

TEST_F(ConfigTest, ParseEmptyString) {
    auto result = config_.ParseString("");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseComments) {
    std::string content = R"(
# a comment
; also a comment
# votingperiod=5
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseKeyValuePairs) {
    std::string content = R"(
votingperiod = 3600
  fusionpolicy=layered
mlfallback = Fraud
)";
    ASSERT_TRUE(config_.ParseString(content).success);
    EXPECT_EQ(config_.Size(), 3u);
    EXPECT_EQ(config_.GetInt(ConfigKeys::VOTINGPERIOD, 0), 3600);
    EXPECT_EQ(config_.GetString(ConfigKeys::FUSIONPOLICY, ""), "layered");
    EXPECT_EQ(config_.GetString(ConfigKeys::MLFALLBACK, ""), "Fraud");
}

TEST_F(ConfigTest, BareKeyIsTrueAndNoPrefixIsFalse) {
    ASSERT_TRUE(config_.ParseString("regtest\nnoprinttoconsole\n").success);
    EXPECT_TRUE(config_.GetBool("regtest", false));
    EXPECT_FALSE(config_.GetBool("printtoconsole", true));
    EXPECT_FALSE(config_.HasKey("noprinttoconsole"));
}

TEST_F(ConfigTest, SectionsPrefixKeys) {
    std::string content = R"(
db=memory
[risk]
policy=layered
)";
    ASSERT_TRUE(config_.ParseString(content).success);
    EXPECT_EQ(config_.GetString("db", ""), "memory");
    EXPECT_EQ(config_.GetString("risk.policy", ""), "layered");
    EXPECT_FALSE(config_.HasKey("policy"));
}

TEST_F(ConfigTest, QuotedValuesAreUnescaped) {
    ASSERT_TRUE(config_.ParseString("a=\"x\\ty\"\nb='raw\\n'\n").success);
    EXPECT_EQ(config_.GetString("a", ""), "x\ty");
    EXPECT_EQ(config_.GetString("b", ""), "raw\\n");
}

TEST_F(ConfigTest, InvalidKeyReportsLine) {
    auto result = config_.ParseString("ok=1\nbad key=2\n", "test.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 2);
    EXPECT_EQ(result.errorFile, "test.conf");
    EXPECT_NE(result.ToString().find("test.conf:2"), std::string::npos);
}

TEST_F(ConfigTest, UnclosedSectionIsError) {
    auto result = config_.ParseString("[risk\n");
    EXPECT_FALSE(result.success);
}

// ============================================================================
// Typed Getters
// ============================================================================

TEST_F(ConfigTest, IntegerParsingIsStrict) {
    config_.Set("a", "42");
    config_.Set("b", "42abc");
    config_.Set("c", "");
    config_.Set("d", "-7");

    EXPECT_EQ(config_.TryGetInt("a"), std::optional<int64_t>(42));
    EXPECT_FALSE(config_.TryGetInt("b").has_value());
    EXPECT_FALSE(config_.TryGetInt("c").has_value());
    EXPECT_EQ(config_.GetInt("d", 0), -7);
    EXPECT_EQ(config_.GetInt("missing", 9), 9);
}

TEST_F(ConfigTest, BooleanSpellings) {
    EXPECT_EQ(ConfigManager::ParseBool("YES"), std::optional<bool>(true));
    EXPECT_EQ(ConfigManager::ParseBool("on"), std::optional<bool>(true));
    EXPECT_EQ(ConfigManager::ParseBool("off"), std::optional<bool>(false));
    EXPECT_EQ(ConfigManager::ParseBool("0"), std::optional<bool>(false));
    EXPECT_FALSE(ConfigManager::ParseBool("maybe").has_value());
}

TEST_F(ConfigTest, ListCollectsEveryValue) {
    std::string content = R"(
allowlist=0x1111111111111111111111111111111111111111, 0x2222222222222222222222222222222222222222
allowlist=0x3333333333333333333333333333333333333333
)";
    ASSERT_TRUE(config_.ParseString(content).success);
    auto list = config_.GetList(ConfigKeys::ALLOWLIST);
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[1], "0x2222222222222222222222222222222222222222");
    EXPECT_TRUE(config_.GetList("nothing").empty());
}

TEST_F(ConfigTest, TildeExpansion) {
    const char* home = std::getenv("HOME");
    if (!home) {
        GTEST_SKIP() << "HOME not set";
    }
    config_.Set("datadir", "~/shield");
    EXPECT_EQ(config_.GetPath("datadir"), std::string(home) + "/shield");
    EXPECT_EQ(ConfigManager::ExpandTilde("~user/x"), "~user/x");
    EXPECT_EQ(ConfigManager::ExpandTilde("/abs"), "/abs");
}

// ============================================================================
// Sources and Priority
// ============================================================================

TEST_F(ConfigTest, DefaultReplacedByFirstValue) {
    config_.SetDefault("fusionpolicy", "additive");
    EXPECT_EQ(config_.GetSource("fusionpolicy"), "<default>");

    ASSERT_TRUE(config_.ParseString("fusionpolicy=layered", "file").success);
    EXPECT_EQ(config_.GetList("fusionpolicy").size(), 1u);
    EXPECT_EQ(config_.GetSource("fusionpolicy"), "file");

    config_.SetDefault("fusionpolicy", "additive");
    EXPECT_EQ(config_.GetString("fusionpolicy", ""), "layered");
}

TEST_F(ConfigTest, CommandLineOverridesFile) {
    ASSERT_TRUE(config_.ParseString("votingperiod=100\nallowlist=a\nallowlist=b\n").success);

    const char* argv[] = {"neuroshieldd", "-votingperiod=5", "--allowlist=c",
                          "-allowlist=d", "-noregtest", "script.txt"};
    ASSERT_TRUE(config_.ParseCommandLine(6, argv).success);

    EXPECT_EQ(config_.GetInt("votingperiod", 0), 5);
    EXPECT_EQ(config_.GetSource("votingperiod"), "<command-line>");
    EXPECT_EQ(config_.GetList("allowlist"), (std::vector<std::string>{"c", "d"}));
    EXPECT_FALSE(config_.GetBool("regtest", true));
    ASSERT_EQ(config_.GetPositionalArgs().size(), 1u);
    EXPECT_EQ(config_.GetPositionalArgs()[0], "script.txt");
}

TEST_F(ConfigTest, CommandLineRejectsBadOptions) {
    const char* dashes[] = {"neuroshieldd", "--"};
    EXPECT_FALSE(config_.ParseCommandLine(2, dashes).success);

    const char* badKey[] = {"neuroshieldd", "-bad!key=1"};
    EXPECT_FALSE(config_.ParseCommandLine(2, badKey).success);
}

// ============================================================================
// File Parsing
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("db=memory\nregtest=1\n");
    auto result = config_.ParseFile(path);
    ASSERT_TRUE(result.success) << result.ToString();
    EXPECT_EQ(config_.GetString(ConfigKeys::DB, ""), "memory");
    EXPECT_EQ(config_.GetSource(ConfigKeys::DB), path);
    EXPECT_TRUE(config_.GetBool(ConfigKeys::REGTEST, false));
}

TEST_F(ConfigTest, ParseMissingFileFails) {
    auto result = config_.ParseFile("/nonexistent/neuroshield.conf");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Cannot open"), std::string::npos);
}

TEST_F(ConfigTest, DumpListsEntries) {
    config_.Set("db", "memory");
    EXPECT_EQ(config_.Dump(), "db=memory\n");
}

} // namespace test
} // namespace util
} // namespace neuroshield

// FIXEDRATE - Configuration File Parser Tests
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License

#include <gtest/gtest.h>

#include "fixedrate/core/errors.h"
#include "fixedrate/util/config.h"
#include "fixedrate/vault/params.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <unistd.h>

namespace fixedrate {
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
        char filename[] = "/tmp/fixedrate_config_test_XXXXXX";
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
# This is a comment
; This is also a comment
# harvestdelay=1h
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseKeyValuePair) {
    auto result = config_.ParseString("loglevel=debug");
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(config_.HasKey("loglevel"));
    EXPECT_EQ(config_.GetString("loglevel", "info"), "debug");
}

TEST_F(ConfigTest, ParseKeyWithSpaces) {
    std::string content = R"(
  key1  =  value1
key2 = value2
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("key1", "default"), "value1");
    EXPECT_EQ(config_.GetString("key2", "default"), "value2");
}

TEST_F(ConfigTest, ParseQuotedValue) {
    std::string content = R"(
key1="value with spaces"
key2='single quoted'
key3="with \"escaped\" quotes"
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("key1", "default"), "value with spaces");
    EXPECT_EQ(config_.GetString("key2", "default"), "single quoted");
    EXPECT_EQ(config_.GetString("key3", "default"), "with \"escaped\" quotes");
}

TEST_F(ConfigTest, ParseBooleanFlags) {
    std::string content = R"(
printtoconsole
nodebug
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(config_.GetBool("printtoconsole", false));
    EXPECT_FALSE(config_.GetBool("debug", true));
}

TEST_F(ConfigTest, MissingBracketIsAnError) {
    auto result = config_.ParseString("[vault\nharvestdelay=1h", "test.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorFile, "test.conf");
    EXPECT_EQ(result.errorLine, 1);
}

TEST_F(ConfigTest, InvalidKeyIsAnError) {
    auto result = config_.ParseString("bad key=1");
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.errorMessage.empty());
}

// ============================================================================
// Section Tests
// ============================================================================

TEST_F(ConfigTest, ParseSections) {
    std::string content = R"(
datadir=/var/lib/fixedrate

[vault]
harvestdelay=6h
fixedrate=1000000000

[sim]
asset=DAI
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);

    EXPECT_EQ(config_.GetString("datadir", ""), "/var/lib/fixedrate");
    EXPECT_EQ(config_.GetString("harvestdelay", "", "vault"), "6h");
    EXPECT_EQ(config_.GetString("asset", "", "sim"), "DAI");
    EXPECT_FALSE(config_.HasKey("harvestdelay"));

    auto sections = config_.GetSections();
    EXPECT_EQ(sections.size(), 2u);
    EXPECT_TRUE(std::find(sections.begin(), sections.end(), "vault") != sections.end());
    EXPECT_EQ(config_.GetKeys("vault").size(), 2u);
}

// ============================================================================
// Type Conversion Tests
// ============================================================================

TEST_F(ConfigTest, GetInt) {
    std::string content = R"(
positive=42
negative=-100
garbage=12abc
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);

    EXPECT_EQ(config_.GetInt("positive", 0), 42);
    EXPECT_EQ(config_.GetInt("negative", 0), -100);
    EXPECT_EQ(config_.GetInt("garbage", 7), 7);
    EXPECT_EQ(config_.GetInt("missing", 999), 999);
}

TEST_F(ConfigTest, GetUInt) {
    std::string content = R"(
positive=42
negative=-100
huge=18446744073709551615
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);

    auto positiveOpt = config_.TryGetUInt("positive");
    ASSERT_TRUE(positiveOpt.has_value());
    EXPECT_EQ(*positiveOpt, 42u);

    EXPECT_FALSE(config_.TryGetUInt("negative").has_value());
    EXPECT_EQ(config_.GetUInt("huge", 0), 18446744073709551615ULL);
    EXPECT_EQ(config_.GetUInt("missing", 999), 999u);
}

TEST_F(ConfigTest, GetBool) {
    std::string content = R"(
true1=true
true2=yes
true3=on
false1=false
false2=no
false3=0
maybe=perhaps
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);

    EXPECT_TRUE(config_.GetBool("true1", false));
    EXPECT_TRUE(config_.GetBool("true2", false));
    EXPECT_TRUE(config_.GetBool("true3", false));
    EXPECT_FALSE(config_.GetBool("false1", true));
    EXPECT_FALSE(config_.GetBool("false2", true));
    EXPECT_FALSE(config_.GetBool("false3", true));
    EXPECT_FALSE(config_.TryGetBool("maybe").has_value());
    EXPECT_TRUE(config_.GetBool("missing", true));
}

TEST_F(ConfigTest, GetDuration) {
    std::string content = R"(
[vault]
plain=90
minutes=15m
hours=6h
days=7d
bad=6 hours
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);

    EXPECT_EQ(config_.TryGetDuration("plain", "vault").value_or(-1), 90);
    EXPECT_EQ(config_.TryGetDuration("minutes", "vault").value_or(-1), 15 * 60);
    EXPECT_EQ(config_.TryGetDuration("hours", "vault").value_or(-1), 6 * 3600);
    EXPECT_EQ(config_.TryGetDuration("days", "vault").value_or(-1), 7 * 86400);
    EXPECT_FALSE(config_.TryGetDuration("bad", "vault").has_value());
    EXPECT_FALSE(config_.TryGetDuration("missing", "vault").has_value());
}

TEST_F(ConfigTest, GetList) {
    std::string content = R"(
[sim]
mint=alice:1000
mint=bob:500
csv=a, b,c
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);

    auto mints = config_.GetList("mint", "sim");
    ASSERT_EQ(mints.size(), 2u);
    EXPECT_EQ(mints[0], "alice:1000");
    EXPECT_EQ(mints[1], "bob:500");

    auto csv = config_.GetList("csv", "sim");
    ASSERT_EQ(csv.size(), 3u);
    EXPECT_EQ(csv[1], "b");
}

// ============================================================================
// Expansion Tests
// ============================================================================

TEST_F(ConfigTest, ExpandEnvVars) {
    setenv("FIXEDRATE_TEST_VAR", "test_value", 1);
    EXPECT_EQ(ConfigManager::ExpandEnvVars("prefix_${FIXEDRATE_TEST_VAR}_suffix"),
              "prefix_test_value_suffix");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("$FIXEDRATE_TEST_VAR/x"), "test_value/x");
    unsetenv("FIXEDRATE_TEST_VAR");

    EXPECT_EQ(ConfigManager::ExpandEnvVars("a_${FIXEDRATE_TEST_VAR}_b"), "a__b");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("cost $"), "cost $");
}

TEST_F(ConfigTest, ExpandEnvVarsInConfig) {
    setenv("FIXEDRATE_DATA", "/custom/data", 1);
    auto result = config_.ParseString("datadir=${FIXEDRATE_DATA}/vaults");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("datadir", ""), "/custom/data/vaults");
    unsetenv("FIXEDRATE_DATA");
}

TEST_F(ConfigTest, ExpandTilde) {
    std::string home = std::getenv("HOME") ? std::getenv("HOME") : "";
    if (!home.empty()) {
        EXPECT_EQ(ConfigManager::ExpandTilde("~/fixedrate.log"), home + "/fixedrate.log");
        EXPECT_EQ(ConfigManager::ExpandTilde("~"), home);

        config_.Set("logfile", "~/logs/fixedrate.log");
        EXPECT_EQ(config_.GetPath("logfile"), home + "/logs/fixedrate.log");
    }
    EXPECT_EQ(ConfigManager::ExpandTilde("/path/to/~something"), "/path/to/~something");
    EXPECT_EQ(ConfigManager::ExpandTilde("~user/x"), "~user/x");
}

TEST_F(ConfigTest, LineContinuation) {
    auto result = config_.ParseString("mint=alice:1,\\\nbob:2");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("mint", ""), "alice:1,bob:2");
}

// ============================================================================
// File Parsing Tests
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    std::string content = R"(
# Simulator configuration
loglevel=warn
[vault]
withdrawaldelay=30m
)";
    std::string filename = CreateTempFile(content);

    auto result = config_.ParseFile(filename);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("loglevel", ""), "warn");
    EXPECT_EQ(config_.TryGetDuration("withdrawaldelay", "vault").value_or(-1), 1800);
}

TEST_F(ConfigTest, ParseNonexistentFile) {
    auto result = config_.ParseFile("/nonexistent/path/fixedrate.conf");
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.errorMessage.empty());
}

TEST_F(ConfigTest, IncludeFile) {
    std::string includedFile = CreateTempFile("[vault]\nfixedrate=42");
    std::string mainFile = CreateTempFile("loglevel=info\ninclude " + includedFile);

    auto result = config_.ParseFile(mainFile);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("loglevel", ""), "info");
    EXPECT_EQ(config_.GetUInt("fixedrate", 0, "vault"), 42u);
}

TEST_F(ConfigTest, IncludeMissingFileFails) {
    auto result = config_.ParseString("include /nonexistent/fixedrate.conf");
    EXPECT_FALSE(result.success);
}

// ============================================================================
// Command Line Parsing Tests
// ============================================================================

TEST_F(ConfigTest, ParseCommandLine) {
    char* argv[] = {
        const_cast<char*>("fixedrate-sim"),
        const_cast<char*>("-events"),
        const_cast<char*>("-loglevel=debug"),
        const_cast<char*>("--datadir=/tmp/fr"),
        const_cast<char*>("-nostrict"),
        const_cast<char*>("script.txt"),
        nullptr
    };
    std::vector<std::string> positional;

    auto result = config_.ParseCommandLine(6, argv, &positional);
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(config_.GetBool("events", false));
    EXPECT_EQ(config_.GetString("loglevel", ""), "debug");
    EXPECT_EQ(config_.GetString("datadir", ""), "/tmp/fr");
    EXPECT_FALSE(config_.GetBool("strict", true));
    ASSERT_EQ(positional.size(), 1u);
    EXPECT_EQ(positional[0], "script.txt");
}

TEST_F(ConfigTest, CommandLineTargetsSection) {
    char* argv[] = {
        const_cast<char*>("fixedrate-sim"),
        const_cast<char*>("-vault.harvestdelay=2h"),
        nullptr
    };

    auto result = config_.ParseCommandLine(2, argv);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.TryGetDuration("harvestdelay", "vault").value_or(-1), 7200);
    EXPECT_FALSE(config_.HasKey("vault.harvestdelay"));
}

TEST_F(ConfigTest, CommandLineOverridesFile) {
    config_.ParseString("[vault]\nharvestdelay=6h");
    char* argv[] = {
        const_cast<char*>("fixedrate-sim"),
        const_cast<char*>("-vault.harvestdelay=1h"),
        nullptr
    };
    config_.ParseCommandLine(2, argv);
    EXPECT_EQ(config_.TryGetDuration("harvestdelay", "vault").value_or(-1), 3600);
}

// ============================================================================
// Value Setting and Validation Tests
// ============================================================================

TEST_F(ConfigTest, SetDefaultDoesNotOverwrite) {
    config_.Set("loglevel", "warn");
    config_.SetDefault("loglevel", "info");
    config_.SetDefault("datadir", "/tmp");

    EXPECT_EQ(config_.GetString("loglevel", ""), "warn");
    EXPECT_EQ(config_.GetString("datadir", ""), "/tmp");
}

TEST_F(ConfigTest, ValidateRequiredAndAllowed) {
    config_.RequireKey("harvestdelay", "vault");
    config_.AllowKey("loglevel");
    config_.ParseString("loglevel=info\nunknown=1");

    auto errors = config_.Validate();
    ASSERT_EQ(errors.size(), 2u);

    bool missing = false;
    bool unknown = false;
    for (const auto& error : errors) {
        missing = missing || error.find("vault:harvestdelay") != std::string::npos;
        unknown = unknown || error.find("unknown") != std::string::npos;
    }
    EXPECT_TRUE(missing);
    EXPECT_TRUE(unknown);
}

TEST_F(ConfigTest, SampleConfigParses) {
    std::string sample = ConfigManager::GenerateSampleConfig();
    EXPECT_NE(sample.find("[vault]"), std::string::npos);
    EXPECT_NE(sample.find("harvestdelay"), std::string::npos);

    auto result = config_.ParseString(sample);
    EXPECT_TRUE(result.success);
}

TEST_F(ConfigTest, DumpListsEntries) {
    config_.ParseString("loglevel=info\n[vault]\nfixedrate=5", "dump.conf");
    std::string dump = config_.Dump();
    EXPECT_NE(dump.find("[vault]"), std::string::npos);
    EXPECT_NE(dump.find("fixedrate=5"), std::string::npos);
    EXPECT_NE(dump.find("dump.conf:3"), std::string::npos);
}

// ============================================================================
// Vault Parameters
// ============================================================================

TEST_F(ConfigTest, VaultParamDefaults) {
    vault::VaultParams params = vault::LoadVaultParams(config_);
    EXPECT_EQ(params.withdrawalDelay, 0u);
    EXPECT_EQ(params.harvestDelay, vault::DEFAULT_HARVEST_DELAY);
    EXPECT_EQ(params.fixedRatePerSecond, 0u);
}

TEST_F(ConfigTest, VaultParamsFromSection) {
    config_.ParseString("[vault]\nwithdrawaldelay=1d\nharvestdelay=30m\nfixedrate=317097919");
    vault::VaultParams params = vault::LoadVaultParams(config_);
    EXPECT_EQ(params.withdrawalDelay, 86400u);
    EXPECT_EQ(params.harvestDelay, 1800u);
    EXPECT_EQ(params.fixedRatePerSecond, 317097919u);
    EXPECT_NE(params.ToString().find("harvestdelay=30m"), std::string::npos);
}

TEST_F(ConfigTest, VaultParamsRejectBadValues) {
    config_.Set("harvestdelay", "soon", "vault");
    EXPECT_THROW(vault::LoadVaultParams(config_), std::invalid_argument);

    config_.Set("harvestdelay", "0", "vault");
    EXPECT_THROW(vault::LoadVaultParams(config_), ZeroDelayError);

    config_.Set("harvestdelay", "400d", "vault");
    EXPECT_THROW(vault::LoadVaultParams(config_), DelayTooLongError);

    config_.Set("harvestdelay", "1h", "vault");
    config_.Set("fixedrate", "-1", "vault");
    EXPECT_THROW(vault::LoadVaultParams(config_), std::invalid_argument);
}

} // namespace test
} // namespace util
} // namespace fixedrate

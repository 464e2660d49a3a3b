/**
 * @file test_config.cpp
 * @brief Unit tests for layered settings (GoogleTest)
 */

#include <gtest/gtest.h>
#include "treepatch/Config.hpp"
#include "treepatch/Errors.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace treepatch;

// ============================================================================
// Test fixtures and helpers
// ============================================================================

/**
 * @brief RAII helper for setting/restoring environment variables.
 */
class ScopedEnvVar {
public:
    ScopedEnvVar(const std::string& name, const std::string& value)
        : name_(name), had_original_(false) {
        const char* original = std::getenv(name.c_str());
        if (original) {
            had_original_ = true;
            original_value_ = original;
        }
#ifdef _WIN32
        _putenv_s(name.c_str(), value.c_str());
#else
        setenv(name.c_str(), value.c_str(), 1);
#endif
    }

    ~ScopedEnvVar() {
#ifdef _WIN32
        _putenv_s(name_.c_str(), had_original_ ? original_value_.c_str() : "");
#else
        if (had_original_) {
            setenv(name_.c_str(), original_value_.c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
#endif
    }

private:
    std::string name_;
    std::string original_value_;
    bool had_original_;
};

/**
 * @brief RAII wrapper for temporary files
 */
class TempFile {
public:
    TempFile(const std::string& filename, const std::string& content)
        : path_(fs::temp_directory_path() / filename) {
        std::ofstream f(path_);
        f << content;
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

/// Options with the environment layer pointed at a prefix no real variable uses
LoadOptions isolated() {
    LoadOptions opts;
    opts.prefix = std::string("TPTEST");
    return opts;
}

// ============================================================================
// parse_value
// ============================================================================

TEST(ParseValueTest, Booleans) {
    EXPECT_EQ(parse_value("true"), true);
    EXPECT_EQ(parse_value("FALSE"), false);
}

TEST(ParseValueTest, Null) {
    EXPECT_TRUE(parse_value("null").is_null());
}

TEST(ParseValueTest, Numbers) {
    EXPECT_EQ(parse_value("42"), 42);
    EXPECT_EQ(parse_value("-7"), -7);
    EXPECT_DOUBLE_EQ(parse_value("3.5").get<double>(), 3.5);
    EXPECT_TRUE(parse_value("1e5").is_string());
}

TEST(ParseValueTest, HugeIntegerStaysString) {
    EXPECT_EQ(parse_value("123456789012345678901234567890"), "123456789012345678901234567890");
}

TEST(ParseValueTest, JsonCompound) {
    EXPECT_EQ(parse_value(R"({"a":1})"), Value::parse(R"({"a":1})"));
    EXPECT_EQ(parse_value("[1,2]"), Value::parse("[1,2]"));
    EXPECT_EQ(parse_value("[not json"), "[not json");
}

TEST(ParseValueTest, QuotedAndRawStrings) {
    EXPECT_EQ(parse_value(R"("42")"), "42");
    EXPECT_EQ(parse_value("toml"), "toml");
    EXPECT_EQ(parse_value(""), "");
}

// ============================================================================
// env_key
// ============================================================================

TEST(EnvKeyTest, StripsPrefixAndMapsUnderscores) {
    EXPECT_EQ(env_key("TREEPATCH_OUTPUT_INDENT", "TREEPATCH"), "output.indent");
    EXPECT_EQ(env_key("treepatch_log_verbosity", "TREEPATCH"), "log.verbosity");
    EXPECT_EQ(env_key("TREEPATCH_APPLY_CHECK__ROUND__TRIP", "TREEPATCH"),
              "apply.check_round_trip");
}

TEST(EnvKeyTest, TrailingUnderscoreInPrefixIsNormalised) {
    EXPECT_EQ(env_key("TREEPATCH_OUTPUT_FORMAT", "TREEPATCH_"), "output.format");
}

TEST(EnvKeyTest, OtherVariablesIgnored) {
    EXPECT_EQ(env_key("HOME", "TREEPATCH"), "");
    EXPECT_EQ(env_key("TREEPATCHOUTPUT", "TREEPATCH"), "");
    EXPECT_EQ(env_key("TREEPATCH_", "TREEPATCH"), "");
}

// ============================================================================
// Layering
// ============================================================================

TEST(LoadSettingsTest, Defaults) {
    Settings s = load_settings(isolated());
    EXPECT_EQ(s.indent, 2);
    EXPECT_EQ(s.format, "json");
    EXPECT_EQ(s.verbosity, 0);
    EXPECT_FALSE(s.check_round_trip);
}

TEST(LoadSettingsTest, JsonFileOverridesDefaults) {
    TempFile file("treepatch_settings_test.json",
                  R"({"output": {"indent": 4}, "apply": {"check_round_trip": true}})");
    LoadOptions opts = isolated();
    opts.file_path = file.path();
    Settings s = load_settings(opts);
    EXPECT_EQ(s.indent, 4);
    EXPECT_EQ(s.format, "json");
    EXPECT_TRUE(s.check_round_trip);
}

TEST(LoadSettingsTest, TomlFile) {
    TempFile file("treepatch_settings_test.toml",
                  "[output]\nformat = \"toml\"\n\n[log]\nverbosity = 2\n");
    LoadOptions opts = isolated();
    opts.file_path = file.path();
    Settings s = load_settings(opts);
    EXPECT_EQ(s.format, "toml");
    EXPECT_EQ(s.verbosity, 2);
    EXPECT_EQ(s.indent, 2);
}

TEST(LoadSettingsTest, FileKeepsSiblingDefaults) {
    TempFile file("treepatch_settings_sibling.json", R"({"output": {"format": "toml"}})");
    LoadOptions opts = isolated();
    opts.file_path = file.path();
    Value tree = load_settings_tree(opts);
    EXPECT_EQ(tree["output"]["indent"], 2);
    EXPECT_EQ(tree["output"]["format"], "toml");
}

TEST(LoadSettingsTest, EnvOverridesFile) {
    TempFile file("treepatch_settings_env.json", R"({"output": {"indent": 4}})");
    ScopedEnvVar indent("TPTEST_OUTPUT_INDENT", "8");
    LoadOptions opts = isolated();
    opts.file_path = file.path();
    EXPECT_EQ(load_settings(opts).indent, 8);
}

TEST(LoadSettingsTest, OverridesWin) {
    ScopedEnvVar indent("TPTEST_OUTPUT_INDENT", "8");
    LoadOptions opts = isolated();
    opts.overrides["output.indent"] = "-1";
    EXPECT_EQ(load_settings(opts).indent, -1);
}

TEST(LoadSettingsTest, EnvLayerCanBeDisabled) {
    ScopedEnvVar indent("TPTEST_OUTPUT_INDENT", "8");
    LoadOptions opts = isolated();
    opts.prefix.reset();
    EXPECT_EQ(load_settings(opts).indent, 2);
}

TEST(LoadSettingsTest, UnknownKeysAreKept) {
    LoadOptions opts = isolated();
    opts.overrides["plugins.extra.enabled"] = "true";
    Value tree = load_settings_tree(opts);
    EXPECT_EQ(tree["plugins"]["extra"]["enabled"], true);
    EXPECT_NO_THROW(settings_from_tree(tree));
}

// ============================================================================
// Errors
// ============================================================================

TEST(LoadSettingsTest, MissingFileThrows) {
    LoadOptions opts = isolated();
    opts.file_path = (fs::temp_directory_path() / "treepatch_no_such_settings.json").string();
    EXPECT_THROW(load_settings(opts), FileNotFoundError);
}

TEST(LoadSettingsTest, WrongTypeThrows) {
    LoadOptions opts = isolated();
    opts.overrides["output.indent"] = "wide";
    EXPECT_THROW(load_settings(opts), SettingsError);
}

TEST(LoadSettingsTest, UnknownFormatThrows) {
    LoadOptions opts = isolated();
    opts.overrides["output.format"] = "yaml";
    try {
        load_settings(opts);
        FAIL() << "Expected SettingsError";
    } catch (const SettingsError& e) {
        EXPECT_EQ(e.key(), "output.format");
    }
}

TEST(LoadSettingsTest, KeyBelowScalarThrows) {
    LoadOptions opts = isolated();
    opts.overrides["output.indent.width"] = "3";
    EXPECT_THROW(load_settings_tree(opts), SettingsError);
}

TEST(LoadSettingsTest, NegativeVerbosityThrows) {
    LoadOptions opts = isolated();
    opts.overrides["log.verbosity"] = "-2";
    EXPECT_THROW(load_settings(opts), SettingsError);
}

// =============================================================================
// Configuration and Logging Tests
// =============================================================================

#include <gtest/gtest.h>
#include "clam/config.hpp"
#include "clam/logging.hpp"
#include "clam/metric_space.hpp"
#include "clam/search/search_engine.hpp"
#include "clam/tree.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace clam;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::getInstance().clear();
    }

    void TearDown() override {
        Config::getInstance().clear();
        set_log_level(LogLevel::INFO);
        set_log_output(std::clog);
    }
};

TEST_F(ConfigTest, TypedAccess) {
    Config& config = Config::getInstance();
    config.set("tree.min_cardinality", "8");
    config.set("tree.min_radius", "0.25");
    config.set("log.file", "/tmp/clam.log");

    EXPECT_EQ(config.get<size_t>("tree.min_cardinality"), 8u);
    EXPECT_DOUBLE_EQ(config.get<double>("tree.min_radius"), 0.25);
    EXPECT_EQ(config.get<std::string>("log.file"), "/tmp/clam.log");
    EXPECT_EQ(config.get<int>("missing.key", 17), 17);
    EXPECT_TRUE(config.contains("tree.min_radius"));
    EXPECT_FALSE(config.contains("missing.key"));
}

TEST_F(ConfigTest, BooleanSpellings) {
    Config& config = Config::getInstance();
    for (const char* yes : {"true", "TRUE", "1", "yes", "on"}) {
        config.set("cache.enabled", yes);
        EXPECT_TRUE(config.get<bool>("cache.enabled", false)) << yes;
    }
    for (const char* no : {"false", "0", "off", "nope"}) {
        config.set("cache.enabled", no);
        EXPECT_FALSE(config.get<bool>("cache.enabled", true)) << no;
    }
}

TEST_F(ConfigTest, UnparsableValueFallsBackToDefault) {
    std::ostringstream sink;
    set_log_output(sink);

    Config& config = Config::getInstance();
    config.set("tree.max_depth", "deep");
    config.set("tree.min_cardinality", "-3");

    EXPECT_EQ(config.get<size_t>("tree.max_depth", 5), 5u);
    EXPECT_EQ(config.get<size_t>("tree.min_cardinality", 1), 1u);
    EXPECT_NE(sink.str().find("tree.max_depth"), std::string::npos);
}

TEST_F(ConfigTest, LoadFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "clam_config_test.conf";
    {
        std::ofstream out(path);
        out << "# tree settings\n"
            << "tree.min_cardinality = 16\n"
            << "; search settings\n"
            << "  search.tolerance=0.2  \n"
            << "\n"
            << "not a key value line\n";
    }

    Config& config = Config::getInstance();
    EXPECT_TRUE(config.load(path.string()));
    EXPECT_EQ(config.get<size_t>("tree.min_cardinality"), 16u);
    EXPECT_DOUBLE_EQ(config.get<double>("search.tolerance"), 0.2);

    // Environment defaults fill the rest
    EXPECT_TRUE(config.contains("cache.enabled"));

    std::filesystem::remove(path);
}

TEST_F(ConfigTest, ValidateRejectsBadValues) {
    std::ostringstream sink;
    set_log_output(sink);

    Config& config = Config::getInstance();
    EXPECT_TRUE(config.validate());

    config.set("search.tolerance", "-1");
    EXPECT_FALSE(config.validate());
    config.set("search.tolerance", "0.1");

    config.set("tree.min_cardinality", "0");
    EXPECT_FALSE(config.validate());
    config.set("tree.min_cardinality", "4");

    config.set("log.level", "shouty");
    EXPECT_TRUE(config.validate());
    EXPECT_EQ(config.get<std::string>("log.level"), "info");
}

TEST_F(ConfigTest, SectionsFromConfig) {
    Config& config = Config::getInstance();
    config.set("tree.min_cardinality", "10");
    config.set("tree.max_depth", "6");
    config.set("tree.seed", "7");
    config.set("search.tolerance", "0.3");
    config.set("cache.enabled", "off");
    config.set("cache.max_entries", "1000");

    BuildConfig build = BuildConfig::from_config(config);
    EXPECT_EQ(build.min_cardinality, 10u);
    EXPECT_EQ(build.max_depth, 6u);
    EXPECT_EQ(build.seed, 7u);
    EXPECT_NO_THROW(build.validate());

    SearchConfig search = SearchConfig::from_config(config);
    EXPECT_DOUBLE_EQ(search.tolerance, 0.3);
    EXPECT_NO_THROW(search.validate());

    CacheConfig cache = CacheConfig::from_config(config);
    EXPECT_FALSE(cache.enabled);
    EXPECT_EQ(cache.max_entries, 1000u);
}

TEST_F(ConfigTest, SectionValidation) {
    BuildConfig build;
    build.min_cardinality = 0;
    EXPECT_THROW(build.validate(), InvalidConfigError);

    build = BuildConfig();
    build.min_radius = -0.5;
    EXPECT_THROW(build.validate(), InvalidConfigError);

    SearchConfig search;
    search.tolerance = -0.01;
    EXPECT_THROW(search.validate(), InvalidConfigError);
}

// =============================================================================
// Logging
// =============================================================================

TEST_F(ConfigTest, LogLevelFiltering) {
    std::ostringstream sink;
    set_log_output(sink);
    set_log_level(LogLevel::WARN);

    LOG_INFO("hidden message");
    LOG_WARN("visible ", 42);

    const std::string output = sink.str();
    EXPECT_EQ(output.find("hidden message"), std::string::npos);
    EXPECT_NE(output.find("visible 42"), std::string::npos);
    EXPECT_NE(output.find("WARN"), std::string::npos);
    EXPECT_NE(output.find("test_config.cpp"), std::string::npos);
}

TEST_F(ConfigTest, LogLevelNames) {
    EXPECT_EQ(parse_log_level("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::WARN);
    EXPECT_FALSE(parse_log_level("loud").has_value());

    EXPECT_TRUE(set_log_level(std::string("error")));
    EXPECT_EQ(Logger::getInstance().level(), LogLevel::ERROR);
    EXPECT_FALSE(set_log_level(std::string("loud")));
    EXPECT_EQ(Logger::getInstance().level(), LogLevel::ERROR);
}

// =============================================================================
// Check macros
// =============================================================================

TEST(ErrorMacrosTest, CheckArgumentCarriesCallerContext) {
    EXPECT_NO_THROW(CLAM_CHECK_ARGUMENT(true, "unused"));
    try {
        CLAM_CHECK_ARGUMENT(1 + 1 == 3, "arithmetic is broken");
        FAIL() << "expected InvalidArgumentError";
    } catch (const InvalidArgumentError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_ARGUMENT);
        EXPECT_NE(std::string(e.what()).find("arithmetic is broken"), std::string::npos);
        EXPECT_FALSE(e.context().empty());
    }
}

TEST(ErrorMacrosTest, CheckPointerNamesTheArgument) {
    int value = 0;
    EXPECT_NO_THROW(CLAM_CHECK_POINTER(&value, "value"));
    try {
        CLAM_CHECK_POINTER(nullptr, "dataset");
        FAIL() << "expected InvalidArgumentError";
    } catch (const InvalidArgumentError& e) {
        EXPECT_NE(std::string(e.what()).find("dataset"), std::string::npos);
    }
    EXPECT_THROW(DistanceCache(0), InvalidArgumentError);
}

/**
 * @file config_loader_tests.cpp
 * @brief Unit tests for XML configuration loading
 */

#include <gtest/gtest.h>
#include "medstock/interface/config.h"
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace medstock;
using namespace medstock::config;

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigLoaderTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir;

    void SetUp() override {
        temp_dir = std::filesystem::temp_directory_path() /
                   ("medstock_config_test_" +
                    std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::create_directories(temp_dir);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(temp_dir, ec);
    }

    void write_file(const std::filesystem::path& path, const std::string& content) {
        std::ofstream file(path);
        file << content;
    }
};

// ============================================================================
// Parsing Tests
// ============================================================================

TEST_F(ConfigLoaderTest, DefaultsMatchForecastDefaults) {
    auto config = MedStockConfig::defaults();

    EXPECT_EQ(config.forecast.reservoir_size, 50u);
    EXPECT_DOUBLE_EQ(config.forecast.spectral_radius, 0.95);
    EXPECT_DOUBLE_EQ(config.forecast.input_scaling, 0.3);
    EXPECT_DOUBLE_EQ(config.forecast.leaking_rate, 0.3);
    EXPECT_DOUBLE_EQ(config.forecast.safety_stock_multiplier, 1.5);
    EXPECT_EQ(config.forecast.forecast_horizon, 30u);
    EXPECT_DOUBLE_EQ(config.forecast.retrain_threshold, 0.5);
    EXPECT_EQ(config.forecast.lead_time_days, 7u);
    EXPECT_DOUBLE_EQ(config.forecast.service_level, 0.95);
    EXPECT_EQ(config.top_at_risk, 6u);
    EXPECT_FALSE(config.as_of.has_value());
}

TEST_F(ConfigLoaderTest, EmptyRootKeepsDefaults) {
    auto config = MedStockConfig::load_from_string("<medstock_config/>");
    EXPECT_EQ(config.forecast.reservoir_size, 50u);
    EXPECT_EQ(config.top_at_risk, 6u);
}

TEST_F(ConfigLoaderTest, OverridesFromXml) {
    auto config = MedStockConfig::load_from_string(R"(<?xml version="1.0" encoding="UTF-8"?>
<medstock_config>
    <forecast>
        <reservoir_size>80</reservoir_size>
        <leaking_rate>0.5</leaking_rate>
        <forecast_horizon>60</forecast_horizon>
        <lead_time_days>10</lead_time_days>
        <service_level>0.9</service_level>
        <seed>1234</seed>
    </forecast>
    <report>
        <top_at_risk>3</top_at_risk>
        <as_of>2025-03-01</as_of>
    </report>
</medstock_config>)");

    EXPECT_EQ(config.forecast.reservoir_size, 80u);
    EXPECT_DOUBLE_EQ(config.forecast.leaking_rate, 0.5);
    EXPECT_EQ(config.forecast.forecast_horizon, 60u);
    EXPECT_EQ(config.forecast.lead_time_days, 10u);
    EXPECT_DOUBLE_EQ(config.forecast.service_level, 0.9);
    EXPECT_EQ(config.forecast.seed, 1234u);
    EXPECT_DOUBLE_EQ(config.forecast.spectral_radius, 0.95);
    EXPECT_EQ(config.top_at_risk, 3u);
    ASSERT_TRUE(config.as_of.has_value());
    EXPECT_EQ(*config.as_of, CalendarDate::from_ymd(2025, 3, 1));
}

TEST_F(ConfigLoaderTest, PresetAttribute) {
    auto config = MedStockConfig::load_from_string(
        R"(<medstock_config><forecast preset="conservative"><lead_time_days>21</lead_time_days></forecast></medstock_config>)");

    EXPECT_DOUBLE_EQ(config.forecast.safety_stock_multiplier, 2.0);
    EXPECT_DOUBLE_EQ(config.forecast.service_level, 0.99);
    EXPECT_EQ(config.forecast.lead_time_days, 21u);
}

TEST_F(ConfigLoaderTest, RejectsMalformedXml) {
    EXPECT_THROW(MedStockConfig::load_from_string("<medstock_config><forecast>"), std::runtime_error);
    EXPECT_THROW(MedStockConfig::load_from_string("<other/>"), std::runtime_error);
}

TEST_F(ConfigLoaderTest, RejectsOutOfRangeValues) {
    EXPECT_THROW(MedStockConfig::load_from_string(
        "<medstock_config><forecast><leaking_rate>0</leaking_rate></forecast></medstock_config>"),
        std::runtime_error);
    EXPECT_THROW(MedStockConfig::load_from_string(
        "<medstock_config><forecast><service_level>1.5</service_level></forecast></medstock_config>"),
        std::runtime_error);
    EXPECT_THROW(MedStockConfig::load_from_string(
        R"(<medstock_config><forecast preset="aggressive"/></medstock_config>)"),
        std::runtime_error);
}

TEST_F(ConfigLoaderTest, RejectsBadAsOfDate) {
    EXPECT_THROW(MedStockConfig::load_from_string(
        "<medstock_config><report><as_of>2025-02-30</as_of></report></medstock_config>"),
        std::runtime_error);
}

// ============================================================================
// File Tests
// ============================================================================

TEST_F(ConfigLoaderTest, SaveAndReload) {
    auto config = MedStockConfig::defaults();
    config.forecast.reservoir_size = 64;
    config.forecast.seed = 99;
    config.top_at_risk = 10;
    config.as_of = CalendarDate::from_ymd(2025, 7, 4);

    auto path = (temp_dir / "saved.xml").string();
    ASSERT_TRUE(config.save(path));

    auto loaded = MedStockConfig::load(path);
    EXPECT_EQ(loaded.forecast.reservoir_size, 64u);
    EXPECT_EQ(loaded.forecast.seed, 99u);
    EXPECT_EQ(loaded.top_at_risk, 10u);
    EXPECT_EQ(loaded.as_of, config.as_of);
    EXPECT_DOUBLE_EQ(loaded.forecast.spectral_radius, config.forecast.spectral_radius);
}

TEST_F(ConfigLoaderTest, MissingFileThrows) {
    EXPECT_THROW(MedStockConfig::load((temp_dir / "absent.xml").string()), std::runtime_error);

    ConfigLoader loader;
    EXPECT_THROW(loader.load_config("medstock_absent_config.xml"), std::runtime_error);
}

TEST_F(ConfigLoaderTest, DefaultSearchPaths) {
    ConfigLoader loader;
    const auto& paths = loader.get_search_paths();
    ASSERT_EQ(paths.size(), 3u);
    EXPECT_EQ(paths[0], ".");
    EXPECT_EQ(paths[1], "./data");
    EXPECT_EQ(paths[2], "./config");
}

TEST_F(ConfigLoaderTest, FindsFileInSearchPath) {
    write_file(temp_dir / "clinic.xml",
               "<medstock_config><report><top_at_risk>2</top_at_risk></report></medstock_config>");

    ConfigLoader loader;
    EXPECT_EQ(loader.find_file("clinic_not_here.xml"), "");

    loader.add_search_path(temp_dir.string());
    EXPECT_EQ(loader.find_file("clinic.xml"), (temp_dir / "clinic.xml").string());

    auto config = loader.load_config("clinic.xml");
    EXPECT_EQ(config.top_at_risk, 2u);
}

/**
 * @file config_loader.cpp
 * @brief XML configuration loading implementation
 *
 * Reads and writes MedStock configuration documents using pugixml. Elements
 * that are absent keep their default values.
 */

#include "medstock/interface/config.h"
#include <pugixml.hpp>
#include <filesystem>
#include <stdexcept>

namespace medstock::config {

namespace {

/**
 * @brief Start from a named preset when <forecast preset="..."> is given
 */
forecast::ForecastConfig preset_config(const std::string& preset) {
    if (preset.empty() || preset == "default") return forecast::ForecastConfig::default_config();
    if (preset == "low_data") return forecast::ForecastConfig::low_data();
    if (preset == "conservative") return forecast::ForecastConfig::conservative();
    if (preset == "long_horizon") return forecast::ForecastConfig::long_horizon();
    throw std::runtime_error("Unknown forecast preset: " + preset);
}

MedStockConfig parse_document(const pugi::xml_document& doc) {
    auto root = doc.child("medstock_config");
    if (!root) {
        root = doc.child("config");
    }
    if (!root) {
        throw std::runtime_error("Invalid MedStock config XML: no root element");
    }

    MedStockConfig config = MedStockConfig::defaults();

    // Forecast settings
    if (auto fc = root.child("forecast")) {
        auto& f = config.forecast;
        f = preset_config(fc.attribute("preset").as_string(""));

        f.reservoir_size = static_cast<SizeT>(fc.child("reservoir_size").text().as_uint(
            static_cast<unsigned int>(f.reservoir_size)));
        f.spectral_radius = fc.child("spectral_radius").text().as_double(f.spectral_radius);
        f.input_scaling = fc.child("input_scaling").text().as_double(f.input_scaling);
        f.leaking_rate = fc.child("leaking_rate").text().as_double(f.leaking_rate);
        f.safety_stock_multiplier = fc.child("safety_stock_multiplier").text().as_double(
            f.safety_stock_multiplier);
        f.forecast_horizon = fc.child("forecast_horizon").text().as_uint(f.forecast_horizon);
        f.retrain_threshold = fc.child("retrain_threshold").text().as_double(f.retrain_threshold);
        f.ridge_regularization = fc.child("ridge_regularization").text().as_double(
            f.ridge_regularization);
        f.lead_time_days = fc.child("lead_time_days").text().as_uint(f.lead_time_days);
        f.service_level = fc.child("service_level").text().as_double(f.service_level);
        f.seed = static_cast<UInt64>(fc.child("seed").text().as_ullong(f.seed));
    }

    if (!forecast::validate_forecast_config(config.forecast)) {
        throw std::runtime_error("Invalid MedStock config XML: forecast settings out of range");
    }

    // Report settings
    if (auto report = root.child("report")) {
        config.top_at_risk = static_cast<SizeT>(report.child("top_at_risk").text().as_uint(
            static_cast<unsigned int>(config.top_at_risk)));

        if (auto as_of_node = report.child("as_of")) {
            std::string text = as_of_node.text().as_string();
            if (!text.empty()) {
                config.as_of = CalendarDate::parse(text);
                if (!config.as_of) {
                    throw std::runtime_error("Invalid MedStock config XML: bad as_of date '" + text + "'");
                }
            }
        }
    }

    return config;
}

} // anonymous namespace

// ============================================================================
// MedStockConfig Implementation
// ============================================================================

MedStockConfig MedStockConfig::load(const std::string& path) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());

    if (!result) {
        throw std::runtime_error("Failed to load config: " + std::string(result.description()));
    }

    return parse_document(doc);
}

MedStockConfig MedStockConfig::load_from_string(const std::string& xml) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_string(xml.c_str());

    if (!result) {
        throw std::runtime_error("Failed to parse config: " + std::string(result.description()));
    }

    return parse_document(doc);
}

MedStockConfig MedStockConfig::defaults() {
    return MedStockConfig{};
}

bool MedStockConfig::save(const std::string& path) const {
    pugi::xml_document doc;

    auto decl = doc.prepend_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    auto root = doc.append_child("medstock_config");

    // Forecast settings
    auto fc = root.append_child("forecast");
    fc.append_child("reservoir_size").text().set(static_cast<unsigned int>(forecast.reservoir_size));
    fc.append_child("spectral_radius").text().set(forecast.spectral_radius);
    fc.append_child("input_scaling").text().set(forecast.input_scaling);
    fc.append_child("leaking_rate").text().set(forecast.leaking_rate);
    fc.append_child("safety_stock_multiplier").text().set(forecast.safety_stock_multiplier);
    fc.append_child("forecast_horizon").text().set(forecast.forecast_horizon);
    fc.append_child("retrain_threshold").text().set(forecast.retrain_threshold);
    fc.append_child("ridge_regularization").text().set(forecast.ridge_regularization);
    fc.append_child("lead_time_days").text().set(forecast.lead_time_days);
    fc.append_child("service_level").text().set(forecast.service_level);
    fc.append_child("seed").text().set(static_cast<unsigned long long>(forecast.seed));

    // Report settings
    auto report = root.append_child("report");
    report.append_child("top_at_risk").text().set(static_cast<unsigned int>(top_at_risk));
    if (as_of) {
        report.append_child("as_of").text().set(as_of->to_iso_string().c_str());
    }

    return doc.save_file(path.c_str());
}

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::ConfigLoader() {
    // Add default search paths
    search_paths_.push_back(".");
    search_paths_.push_back("./data");
    search_paths_.push_back("./config");
}

ConfigLoader::~ConfigLoader() = default;

MedStockConfig ConfigLoader::load_config(const std::string& path) {
    std::string resolved = find_file(path);
    if (resolved.empty()) {
        throw std::runtime_error("MedStock config file not found: " + path);
    }
    return MedStockConfig::load(resolved);
}

void ConfigLoader::add_search_path(const std::string& path) {
    search_paths_.push_back(path);
}

std::string ConfigLoader::find_file(const std::string& filename) const {
    if (std::filesystem::exists(filename)) {
        return filename;
    }

    for (const auto& search_path : search_paths_) {
        std::filesystem::path full_path = std::filesystem::path(search_path) / filename;
        if (std::filesystem::exists(full_path)) {
            return full_path.string();
        }
    }

    return "";
}

} // namespace medstock::config

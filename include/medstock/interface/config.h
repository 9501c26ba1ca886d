#pragma once
/**
 * @file config.h
 * @brief Configuration loading and management
 */

#include "medstock/core/types.h"
#include "medstock/core/date.h"
#include "medstock/forecast/forecast_types.h"
#include <optional>
#include <string>
#include <vector>

namespace medstock::config {

/**
 * @brief Library configuration loaded from XML
 *
 * @code{.xml}
 * <medstock_config>
 *   <forecast>
 *     <reservoir_size>50</reservoir_size>
 *     <forecast_horizon>30</forecast_horizon>
 *     <seed>42</seed>
 *   </forecast>
 *   <report>
 *     <top_at_risk>6</top_at_risk>
 *     <as_of>2025-03-01</as_of>
 *   </report>
 * </medstock_config>
 * @endcode
 */
struct MedStockConfig {
    // Forecasting
    forecast::ForecastConfig forecast;

    // Reporting
    SizeT top_at_risk{6};
    std::optional<CalendarDate> as_of;  // unset = today

    /**
     * @brief Load configuration from XML file
     * @throws std::runtime_error if the file cannot be parsed or holds invalid values
     */
    static MedStockConfig load(const std::string& path);

    /**
     * @brief Load configuration from XML text
     * @throws std::runtime_error if the text cannot be parsed or holds invalid values
     */
    static MedStockConfig load_from_string(const std::string& xml);

    /**
     * @brief Create default configuration
     */
    static MedStockConfig defaults();

    /**
     * @brief Save configuration to XML file
     */
    bool save(const std::string& path) const;
};

/**
 * @brief Configuration loader service
 */
class ConfigLoader {
public:
    ConfigLoader();
    ~ConfigLoader();

    /**
     * @brief Load library configuration
     * @throws std::runtime_error if the file is not found or invalid
     */
    MedStockConfig load_config(const std::string& path);

    /**
     * @brief Add search path for configuration files
     */
    void add_search_path(const std::string& path);

    /**
     * @brief Find file in search paths
     * @return Resolved path, or empty string if not found
     */
    std::string find_file(const std::string& filename) const;

    const std::vector<std::string>& get_search_paths() const { return search_paths_; }

private:
    std::vector<std::string> search_paths_;
};

} // namespace medstock::config

#pragma once
/**
 * @file medstock.h
 * @brief Main include file for MedStock
 *
 * MedStock - Pharmaceutical inventory allocation and demand forecasting core
 *
 * Include this single header to access all public MedStock APIs.
 */

#include "medstock/core/types.h"
#include "medstock/core/date.h"

#include "medstock/inventory/inventory_types.h"
#include "medstock/inventory/drug_grouping.h"
#include "medstock/inventory/fefo_allocator.h"

#include "medstock/forecast/forecast_types.h"
#include "medstock/forecast/demand_history.h"
#include "medstock/forecast/regime_classifier.h"
#include "medstock/forecast/reservoir.h"
#include "medstock/forecast/risk_calculator.h"
#include "medstock/forecast/demand_forecaster.h"

#include "medstock/interface/config.h"
#include "medstock/interface/xml_inventory_loader.h"

/**
 * @namespace medstock
 * @brief Root namespace for all MedStock components
 */
namespace medstock {

/**
 * @brief Library version information
 */
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/**
 * @brief Get version string
 * @return Version string in format "major.minor.patch"
 */
constexpr const char* GetVersionString() noexcept {
    return "0.1.0";
}

} // namespace medstock

#pragma once
/**
 * @file types.h
 * @brief Core type definitions for MedStock
 *
 * This file defines the fundamental numeric and identifier types used
 * throughout the inventory and forecasting modules.
 */

#include <cstdint>
#include <cstddef>
#include <limits>
#include <string>

namespace medstock {

// ============================================================================
// Numeric Types
// ============================================================================

/**
 * @brief Primary floating-point type for forecasting calculations
 */
using Real = double;

// Integer types
using Int32  = std::int32_t;
using Int64  = std::int64_t;
using UInt8  = std::uint8_t;
using UInt32 = std::uint32_t;
using UInt64 = std::uint64_t;
using SizeT  = std::size_t;

// ============================================================================
// Inventory Identifiers & Quantities
// ============================================================================

/**
 * @brief Identifier of an inventory batch (one physical lot)
 */
using BatchId = std::string;

/**
 * @brief Whole dispensable units (tablets, vials, bottles)
 */
using Quantity = Int64;

/**
 * @brief Reorder level applied when a batch does not carry one
 */
constexpr Quantity DEFAULT_REORDER_LEVEL = 10;

/**
 * @brief Shelf life assumed for stock without an expiry date (days)
 */
constexpr Int32 DEFAULT_SHELF_LIFE_DAYS = 365;

} // namespace medstock

#pragma once
/**
 * @file inventory_types.h
 * @brief Inventory records shared by allocation and forecasting
 *
 * The host application owns these collections; MedStock only reads them and
 * returns derived value objects.
 */

#include "medstock/core/types.h"
#include "medstock/core/date.h"
#include <optional>
#include <string>
#include <vector>

namespace medstock::inventory {

// ============================================================================
// Drug Profile
// ============================================================================

/**
 * @brief Identity uniting all batches of the same medicine
 */
struct DrugProfile {
    std::string generic_name;   ///< INN / generic name
    std::string brand_name;     ///< Trade name
    std::string strength;       ///< Dosage strength, e.g. "500mg"

    /**
     * @brief Grouping key "generic|brand|strength"
     */
    std::string key() const {
        return generic_name + "|" + brand_name + "|" + strength;
    }

    bool operator==(const DrugProfile&) const = default;
};

// ============================================================================
// Inventory Batch
// ============================================================================

/**
 * @brief One physical lot of a drug held in stock
 */
struct InventoryBatch {
    BatchId id;
    DrugProfile profile;
    std::string batch_number;
    Quantity quantity{0};                       ///< Units on hand (>= 0)
    std::optional<CalendarDate> expiry_date;    ///< Missing = never sorted ahead of dated stock
    std::optional<CalendarDate> date_received;
    std::string storage_location;
    std::string drug_class;
    Quantity reorder_level{0};                  ///< 0 = unset

    bool matches(const DrugProfile& other) const { return profile == other; }

    /**
     * @brief Reorder level with the default applied
     */
    Quantity effective_reorder_level() const {
        return reorder_level > 0 ? reorder_level : DEFAULT_REORDER_LEVEL;
    }
};

// ============================================================================
// Stock Movement
// ============================================================================

/**
 * @brief Direction of a stock movement
 */
enum class MovementType : UInt8 {
    In,     ///< Stock received
    Out     ///< Stock dispensed or written off
};

/**
 * @brief Convert MovementType to string
 */
inline const char* movement_type_to_string(MovementType type) {
    switch (type) {
        case MovementType::In: return "IN";
        case MovementType::Out: return "OUT";
        default: return "Unknown";
    }
}

/**
 * @brief Historical stock movement against a single batch
 */
struct StockMovement {
    std::string id;
    BatchId inventory_item_id;
    MovementType type{MovementType::Out};
    Quantity quantity{0};
    CalendarDate date;
    std::string batch_number;
    std::string reason;
    std::string reference;      ///< Linked clinic transaction, if any
};

// ============================================================================
// Allocation & Grouping Results
// ============================================================================

/**
 * @brief Quantity drawn from one specific batch
 */
struct BatchAllocation {
    BatchId inventory_item_id;
    std::string batch_number;
    DrugProfile profile;
    Quantity quantity{0};
    std::optional<CalendarDate> expiry_date;
};

/**
 * @brief Per-batch summary held by a drug group
 */
struct BatchSummary {
    BatchId id;
    std::string batch_number;
    Quantity quantity{0};
    std::optional<CalendarDate> expiry_date;
    std::optional<CalendarDate> date_received;
};

/**
 * @brief All batches of one drug profile, in FEFO order
 */
struct DrugGroup {
    DrugProfile profile;
    Quantity total_quantity{0};
    Quantity reorder_level{DEFAULT_REORDER_LEVEL};
    std::vector<BatchSummary> batches;
};

} // namespace medstock::inventory

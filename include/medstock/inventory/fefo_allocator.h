#pragma once
/**
 * @file fefo_allocator.h
 * @brief First-Expiry-First-Out batch allocation
 *
 * Decides which physical lots satisfy a dispensing request. Allocation either
 * succeeds in full or returns no allocation at all; callers never see a
 * partial allocation on failure.
 *
 * Key features:
 * - Greedy FEFO allocation across all batches of a drug profile
 * - Explicit single-batch allocation that bypasses FEFO
 * - Pure application of allocations to a batch list
 * - Generation of the OUT movements that record a dispense
 */

#include "medstock/inventory/inventory_types.h"
#include <string>
#include <vector>

namespace medstock::inventory {

// ============================================================================
// Allocation Result Enum
// ============================================================================

/**
 * @brief Result codes for allocation operations
 */
enum class AllocationResult : UInt8 {
    Success = 0,

    InsufficientStock,  ///< Requested more than the profile or batch holds
    BatchNotFound,      ///< No batch with the requested id
    InvalidQuantity     ///< Negative request
};

/**
 * @brief Convert AllocationResult to string
 */
inline const char* allocation_result_to_string(AllocationResult result) {
    switch (result) {
        case AllocationResult::Success: return "Success";
        case AllocationResult::InsufficientStock: return "InsufficientStock";
        case AllocationResult::BatchNotFound: return "BatchNotFound";
        case AllocationResult::InvalidQuantity: return "InvalidQuantity";
        default: return "Unknown";
    }
}

// ============================================================================
// Allocation Operations
// ============================================================================

/**
 * @brief Allocate a quantity of a drug across batches, earliest expiry first
 *
 * A batch with a later expiry is only drawn from once every earlier-expiring
 * batch of the profile is exhausted. Batches with zero quantity are skipped.
 *
 * @param batches All inventory batches
 * @param profile Drug to dispense
 * @param requested_quantity Units requested
 * @param allocations Receives one allocation per batch touched; cleared on failure
 * @return Success, InsufficientStock or InvalidQuantity
 */
AllocationResult allocate_fefo(const std::vector<InventoryBatch>& batches,
                               const DrugProfile& profile,
                               Quantity requested_quantity,
                               std::vector<BatchAllocation>& allocations);

/**
 * @brief Allocate from one named batch, bypassing FEFO
 *
 * The caller takes responsibility for not violating the FEFO policy.
 *
 * @param batches All inventory batches
 * @param batch_id Batch to draw from
 * @param requested_quantity Units requested
 * @param allocation Receives the allocation on success
 * @return Success, InsufficientStock, BatchNotFound or InvalidQuantity
 */
AllocationResult allocate_specific_batch(const std::vector<InventoryBatch>& batches,
                                         const BatchId& batch_id,
                                         Quantity requested_quantity,
                                         BatchAllocation& allocation);

/**
 * @brief Copy of @p batches with allocated quantities subtracted
 *
 * Quantities are floored at zero. Allocations naming unknown batches are
 * ignored.
 */
std::vector<InventoryBatch> apply_allocations(const std::vector<InventoryBatch>& batches,
                                              const std::vector<BatchAllocation>& allocations);

/**
 * @brief OUT movements recording a dispense
 * @param allocations Allocations that were dispensed
 * @param date Dispense date
 * @param reference Linked clinic transaction (may be empty)
 * @return One movement per allocation, ids "<reference>-<n>" or "OUT-<n>"
 */
std::vector<StockMovement> make_stock_out_movements(const std::vector<BatchAllocation>& allocations,
                                                    const CalendarDate& date,
                                                    const std::string& reference = {});

/**
 * @brief Sum of allocated units
 */
inline Quantity total_allocated(const std::vector<BatchAllocation>& allocations) {
    Quantity total = 0;
    for (const auto& allocation : allocations) {
        total += allocation.quantity;
    }
    return total;
}

} // namespace medstock::inventory

#pragma once
/**
 * @file drug_grouping.h
 * @brief Grouping of inventory batches by drug profile
 *
 * Batches of the same generic name, brand name and strength form one drug
 * group. Within a group batches are kept in First-Expiry-First-Out order;
 * batches without an expiry date sort last and ties keep their input order.
 */

#include "medstock/inventory/inventory_types.h"
#include <optional>
#include <vector>

namespace medstock::inventory {

/**
 * @brief Partition a flat batch list into drug groups
 * @param batches Inventory batches in any order
 * @return Groups in first-seen order, each with FEFO-sorted batch summaries
 */
std::vector<DrugGroup> group_inventory_by_drug(const std::vector<InventoryBatch>& batches);

/**
 * @brief Find the group for a profile
 */
std::optional<DrugGroup> find_drug_group(const std::vector<DrugGroup>& groups,
                                         const DrugProfile& profile);

/**
 * @brief All batches of a profile, in input order
 */
std::vector<InventoryBatch> batches_for_profile(const std::vector<InventoryBatch>& batches,
                                                const DrugProfile& profile);

/**
 * @brief Stable FEFO sort of a batch list (undated batches last)
 */
void sort_batches_fefo(std::vector<InventoryBatch>& batches);

// ============================================================================
// Inline Helper Functions
// ============================================================================

/**
 * @brief Total on-hand quantity of a profile
 */
inline Quantity total_quantity_for_profile(const std::vector<InventoryBatch>& batches,
                                           const DrugProfile& profile) {
    Quantity total = 0;
    for (const auto& batch : batches) {
        if (batch.matches(profile)) {
            total += batch.quantity;
        }
    }
    return total;
}

/**
 * @brief Distinct profiles in first-seen order
 */
inline std::vector<DrugProfile> distinct_profiles(const std::vector<DrugGroup>& groups) {
    std::vector<DrugProfile> profiles;
    profiles.reserve(groups.size());
    for (const auto& group : groups) {
        profiles.push_back(group.profile);
    }
    return profiles;
}

} // namespace medstock::inventory

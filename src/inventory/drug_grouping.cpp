/**
 * @file drug_grouping.cpp
 * @brief Implementation of drug profile grouping
 */

#include "medstock/inventory/drug_grouping.h"
#include <algorithm>
#include <unordered_map>

namespace medstock::inventory {

std::vector<DrugGroup> group_inventory_by_drug(const std::vector<InventoryBatch>& batches) {
    std::vector<DrugGroup> groups;
    std::unordered_map<std::string, SizeT> index_by_key;

    for (const auto& batch : batches) {
        auto key = batch.profile.key();
        auto it = index_by_key.find(key);
        if (it == index_by_key.end()) {
            DrugGroup group;
            group.profile = batch.profile;
            group.reorder_level = batch.effective_reorder_level();
            it = index_by_key.emplace(std::move(key), groups.size()).first;
            groups.push_back(std::move(group));
        }

        DrugGroup& group = groups[it->second];
        group.total_quantity += batch.quantity;
        group.batches.push_back(BatchSummary{
            batch.id,
            batch.batch_number,
            batch.quantity,
            batch.expiry_date,
            batch.date_received
        });
    }

    for (auto& group : groups) {
        std::stable_sort(group.batches.begin(), group.batches.end(),
            [](const BatchSummary& a, const BatchSummary& b) {
                return expires_before(a.expiry_date, b.expiry_date);
            });
    }

    return groups;
}

std::optional<DrugGroup> find_drug_group(const std::vector<DrugGroup>& groups,
                                         const DrugProfile& profile) {
    auto it = std::find_if(groups.begin(), groups.end(),
        [&](const DrugGroup& group) { return group.profile == profile; });
    if (it == groups.end()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<InventoryBatch> batches_for_profile(const std::vector<InventoryBatch>& batches,
                                                const DrugProfile& profile) {
    std::vector<InventoryBatch> matching;
    for (const auto& batch : batches) {
        if (batch.matches(profile)) {
            matching.push_back(batch);
        }
    }
    return matching;
}

void sort_batches_fefo(std::vector<InventoryBatch>& batches) {
    std::stable_sort(batches.begin(), batches.end(),
        [](const InventoryBatch& a, const InventoryBatch& b) {
            return expires_before(a.expiry_date, b.expiry_date);
        });
}

} // namespace medstock::inventory

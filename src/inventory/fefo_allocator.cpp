/**
 * @file fefo_allocator.cpp
 * @brief Implementation of First-Expiry-First-Out batch allocation
 */

#include "medstock/inventory/fefo_allocator.h"
#include "medstock/inventory/drug_grouping.h"
#include <algorithm>
#include <unordered_map>

namespace medstock::inventory {

namespace {

BatchAllocation make_allocation(const InventoryBatch& batch, Quantity quantity) {
    BatchAllocation allocation;
    allocation.inventory_item_id = batch.id;
    allocation.batch_number = batch.batch_number;
    allocation.profile = batch.profile;
    allocation.quantity = quantity;
    allocation.expiry_date = batch.expiry_date;
    return allocation;
}

} // anonymous namespace

AllocationResult allocate_fefo(const std::vector<InventoryBatch>& batches,
                               const DrugProfile& profile,
                               Quantity requested_quantity,
                               std::vector<BatchAllocation>& allocations) {
    allocations.clear();

    if (requested_quantity < 0) {
        return AllocationResult::InvalidQuantity;
    }

    std::vector<InventoryBatch> available;
    for (const auto& batch : batches) {
        if (batch.matches(profile) && batch.quantity > 0) {
            available.push_back(batch);
        }
    }
    sort_batches_fefo(available);

    Quantity total_available = 0;
    for (const auto& batch : available) {
        total_available += batch.quantity;
    }
    if (total_available < requested_quantity) {
        return AllocationResult::InsufficientStock;
    }

    Quantity remaining = requested_quantity;
    for (const auto& batch : available) {
        if (remaining <= 0) {
            break;
        }
        Quantity drawn = std::min(batch.quantity, remaining);
        allocations.push_back(make_allocation(batch, drawn));
        remaining -= drawn;
    }

    return AllocationResult::Success;
}

AllocationResult allocate_specific_batch(const std::vector<InventoryBatch>& batches,
                                         const BatchId& batch_id,
                                         Quantity requested_quantity,
                                         BatchAllocation& allocation) {
    if (requested_quantity < 0) {
        return AllocationResult::InvalidQuantity;
    }

    auto it = std::find_if(batches.begin(), batches.end(),
        [&](const InventoryBatch& batch) { return batch.id == batch_id; });
    if (it == batches.end()) {
        return AllocationResult::BatchNotFound;
    }
    if (it->quantity < requested_quantity) {
        return AllocationResult::InsufficientStock;
    }

    allocation = make_allocation(*it, requested_quantity);
    return AllocationResult::Success;
}

std::vector<InventoryBatch> apply_allocations(const std::vector<InventoryBatch>& batches,
                                              const std::vector<BatchAllocation>& allocations) {
    std::unordered_map<BatchId, Quantity> drawn_by_batch;
    for (const auto& allocation : allocations) {
        drawn_by_batch[allocation.inventory_item_id] += allocation.quantity;
    }

    std::vector<InventoryBatch> updated = batches;
    for (auto& batch : updated) {
        auto it = drawn_by_batch.find(batch.id);
        if (it != drawn_by_batch.end()) {
            batch.quantity = std::max<Quantity>(0, batch.quantity - it->second);
            // Only the first batch with a given id absorbs the draw
            drawn_by_batch.erase(it);
        }
    }
    return updated;
}

std::vector<StockMovement> make_stock_out_movements(const std::vector<BatchAllocation>& allocations,
                                                    const CalendarDate& date,
                                                    const std::string& reference) {
    std::vector<StockMovement> movements;
    movements.reserve(allocations.size());

    const std::string prefix = reference.empty() ? std::string("OUT") : reference;
    SizeT sequence = 0;
    for (const auto& allocation : allocations) {
        StockMovement movement;
        movement.id = prefix + "-" + std::to_string(++sequence);
        movement.inventory_item_id = allocation.inventory_item_id;
        movement.type = MovementType::Out;
        movement.quantity = allocation.quantity;
        movement.date = date;
        movement.batch_number = allocation.batch_number;
        movement.reason = "Dispensed";
        movement.reference = reference;
        movements.push_back(std::move(movement));
    }
    return movements;
}

} // namespace medstock::inventory

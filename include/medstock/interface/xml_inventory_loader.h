#pragma once
/**
 * @file xml_inventory_loader.h
 * @brief XML inventory snapshot loader
 *
 * Reads batches and stock movements exported by the host application:
 *
 * @code{.xml}
 * <inventory>
 *   <batch id="B1" generic="Amoxicillin" brand="Amoxil" strength="500mg"
 *          batch_number="LOT-001" quantity="50" expiry="2025-01-01"
 *          received="2024-06-01" location="Shelf A" class="Antibiotic"
 *          reorder_level="20"/>
 *   <movement id="M1" item="B1" type="OUT" quantity="3"
 *             date="2024-12-01T09:30:00Z" batch_number="LOT-001"/>
 * </inventory>
 * @endcode
 */

#include "medstock/inventory/inventory_types.h"
#include <string>
#include <vector>

namespace medstock::interface {

/**
 * @brief Batches and movements read from one document
 */
struct InventorySnapshot {
    std::vector<inventory::InventoryBatch> batches;
    std::vector<inventory::StockMovement> movements;
};

/**
 * @brief XML inventory snapshot loader
 */
class XmlInventoryLoader {
public:
    XmlInventoryLoader() = default;
    ~XmlInventoryLoader() = default;

    /**
     * @brief Load snapshot from XML file
     * @param path Path to XML file
     * @return Parsed snapshot
     * @throws std::runtime_error on I/O or parse failure
     */
    InventorySnapshot load(const std::string& path);

    /**
     * @brief Load snapshot from XML string
     * @throws std::runtime_error on parse failure
     */
    InventorySnapshot load_from_string(const std::string& xml);

    /**
     * @brief Get last error message
     */
    const std::string& get_error() const { return error_message_; }

private:
    [[noreturn]] void fail(const std::string& message);

    std::string error_message_;
};

} // namespace medstock::interface

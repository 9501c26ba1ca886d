/**
 * @file xml_inventory_loader.cpp
 * @brief XML inventory snapshot loader implementation
 */

#include "medstock/interface/xml_inventory_loader.h"
#include <pugixml.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace medstock::interface {

namespace {

/// Empty attribute means "no date"; anything else must parse
bool read_optional_date(const pugi::xml_node& node, const char* name,
                        std::optional<CalendarDate>& out) {
    std::string text = node.attribute(name).as_string("");
    if (text.empty()) {
        out.reset();
        return true;
    }
    out = CalendarDate::parse(text);
    return out.has_value();
}

bool parse_movement_type(const std::string& text, inventory::MovementType& out) {
    if (text == "IN" || text == "in") {
        out = inventory::MovementType::In;
        return true;
    }
    if (text == "OUT" || text == "out") {
        out = inventory::MovementType::Out;
        return true;
    }
    return false;
}

} // anonymous namespace

void XmlInventoryLoader::fail(const std::string& message) {
    error_message_ = message;
    throw std::runtime_error(error_message_);
}

InventorySnapshot XmlInventoryLoader::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        fail("Failed to open file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str());
}

InventorySnapshot XmlInventoryLoader::load_from_string(const std::string& xml) {
    error_message_.clear();
    InventorySnapshot snapshot;

    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_string(xml.c_str());

    if (!result) {
        fail(std::string("XML parse error: ") + result.description());
    }

    pugi::xml_node root = doc.child("inventory");
    if (!root) {
        fail("Missing <inventory> root element");
    }

    // Batches
    for (auto node : root.children("batch")) {
        inventory::InventoryBatch batch;
        batch.id = node.attribute("id").as_string("");
        batch.profile.generic_name = node.attribute("generic").as_string("");
        batch.profile.brand_name = node.attribute("brand").as_string("");
        batch.profile.strength = node.attribute("strength").as_string("");
        batch.batch_number = node.attribute("batch_number").as_string("");
        batch.quantity = node.attribute("quantity").as_llong(0);
        batch.storage_location = node.attribute("location").as_string("");
        batch.drug_class = node.attribute("class").as_string("");
        batch.reorder_level = node.attribute("reorder_level").as_llong(0);

        if (batch.id.empty()) {
            fail("Batch without id attribute");
        }
        if (batch.quantity < 0) {
            fail("Batch " + batch.id + " has negative quantity");
        }
        if (!read_optional_date(node, "expiry", batch.expiry_date)) {
            fail("Batch " + batch.id + " has invalid expiry date");
        }
        if (!read_optional_date(node, "received", batch.date_received)) {
            fail("Batch " + batch.id + " has invalid received date");
        }

        snapshot.batches.push_back(std::move(batch));
    }

    // Movements
    for (auto node : root.children("movement")) {
        inventory::StockMovement movement;
        movement.id = node.attribute("id").as_string("");
        movement.inventory_item_id = node.attribute("item").as_string("");
        movement.quantity = node.attribute("quantity").as_llong(0);
        movement.batch_number = node.attribute("batch_number").as_string("");
        movement.reason = node.attribute("reason").as_string("");
        movement.reference = node.attribute("reference").as_string("");

        if (!parse_movement_type(node.attribute("type").as_string(""), movement.type)) {
            fail("Movement " + movement.id + " has unknown type");
        }
        if (movement.quantity < 0) {
            fail("Movement " + movement.id + " has negative quantity");
        }

        auto date = CalendarDate::parse(node.attribute("date").as_string(""));
        if (!date) {
            fail("Movement " + movement.id + " has invalid date");
        }
        movement.date = *date;

        snapshot.movements.push_back(std::move(movement));
    }

    return snapshot;
}

} // namespace medstock::interface

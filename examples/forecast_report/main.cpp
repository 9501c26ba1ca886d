/**
 * @file main.cpp
 * @brief Inventory forecast report example
 *
 * Usage: medstock_forecast_report <config.xml> <inventory.xml> [drug generic name]
 */

#include "medstock/medstock.h"
#include <algorithm>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_forecast(const medstock::forecast::ForecastResult& result) {
    using namespace medstock::forecast;

    std::cout << result.profile.generic_name << " (" << result.profile.brand_name << ", "
              << result.profile.strength << ")\n";
    std::cout << "  Stock on hand:   " << result.current_stock << "\n";
    std::cout << "  Method:          " << forecast_method_to_string(result.method)
              << " (" << result.history_days << " days of history)\n";
    std::cout << "  Regime:          " << activity_regime_to_string(result.markov_state.current)
              << " for " << result.markov_state.consecutive_days << " run(s)\n";
    std::cout << "  Safety stock:    " << result.safety_stock << "\n";
    std::cout << "  Reorder point:   " << result.reorder_point << "\n";
    std::cout << "  Next restock:    "
              << (result.next_restock_date ? result.next_restock_date->to_iso_string() : "-") << "\n";
    std::cout << "  Risk:            " << risk_level_to_string(result.risk_level) << "\n";
    std::cout << "  Confidence:      " << result.model_confidence << "%";
    if (auto days = days_until_better_accuracy(result.model_confidence)) {
        std::cout << " (full accuracy in " << *days << " days)";
    }
    std::cout << "\n";

    for (const auto& warning : result.expiry_warnings) {
        std::cout << "  Expiry warning:  batch " << warning.batch_number << ", "
                  << warning.quantity << " units expire " << warning.expiry_date.to_iso_string()
                  << " (" << warning.days_until_expiry << " days)\n";
    }

    std::cout << "\n  Date        Demand   Lower    Upper    Stock\n";
    std::cout << "  ----------  -------  -------  -------  -------\n";
    const std::size_t shown = std::min<std::size_t>(result.predictions.size(), 7);
    for (std::size_t i = 0; i < shown; ++i) {
        const auto& p = result.predictions[i];
        std::cout << "  " << p.date.to_iso_string() << "  "
                  << std::setw(7) << p.predicted_demand << "  "
                  << std::setw(7) << p.confidence_lower << "  "
                  << std::setw(7) << p.confidence_upper << "  "
                  << std::setw(7) << p.stock_level << "\n";
    }
    std::cout << "\n";
}

} // anonymous namespace

int main(int argc, char** argv) {
    std::cout << "MedStock Forecast Report\n";
    std::cout << "Version: " << medstock::GetVersionString() << "\n\n";

    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <config.xml> <inventory.xml> [generic name]\n";
        return 1;
    }

    medstock::config::MedStockConfig config;
    medstock::interface::InventorySnapshot snapshot;
    try {
        medstock::config::ConfigLoader config_loader;
        config = config_loader.load_config(argv[1]);

        medstock::interface::XmlInventoryLoader inventory_loader;
        snapshot = inventory_loader.load(argv[2]);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load input: " << e.what() << "\n";
        return 1;
    }

    const medstock::CalendarDate as_of = config.as_of.value_or(medstock::CalendarDate::today());
    std::cout << "As of " << as_of.to_iso_string() << ": "
              << snapshot.batches.size() << " batches, "
              << snapshot.movements.size() << " movements\n\n";

    medstock::forecast::DemandForecaster forecaster(config.forecast);
    auto forecasts = forecaster.forecast_all(snapshot.batches, snapshot.movements, as_of);

    std::cout << std::fixed << std::setprecision(1);
    for (const auto& result : forecasts) {
        if (argc > 3 && result.profile.generic_name != argv[3]) {
            continue;
        }
        print_forecast(result);
    }

    auto ranked = medstock::forecast::rank_at_risk(forecasts, snapshot.batches, as_of,
                                                   config.top_at_risk);
    std::cout << "Most at-risk drugs\n";
    std::cout << "------------------\n";
    for (const auto& assessment : ranked) {
        const auto& f = assessment.forecast;
        std::cout << std::setw(3) << assessment.risk_score << "  "
                  << f.profile.generic_name << " " << f.profile.strength
                  << " [" << medstock::forecast::risk_level_to_string(f.risk_level) << "]";
        if (assessment.most_critical_batch) {
            std::cout << " earliest batch " << assessment.most_critical_batch->batch_number;
            if (assessment.most_critical_batch->expiry_date) {
                std::cout << " expires " << assessment.most_critical_batch->expiry_date->to_iso_string();
            }
        }
        std::cout << "\n";
    }
    if (ranked.empty()) {
        std::cout << "(none)\n";
    }

    // Demonstrate a FEFO dispense against the first drug group
    auto groups = medstock::inventory::group_inventory_by_drug(snapshot.batches);
    if (!groups.empty()) {
        std::vector<medstock::inventory::BatchAllocation> allocations;
        const auto& group = groups.front();
        const medstock::Quantity request = std::min<medstock::Quantity>(group.total_quantity, 10);
        auto status = medstock::inventory::allocate_fefo(snapshot.batches, group.profile,
                                                         request, allocations);
        std::cout << "\nDispense " << request << " x " << group.profile.generic_name << ": "
                  << medstock::inventory::allocation_result_to_string(status) << "\n";
        for (const auto& allocation : allocations) {
            std::cout << "  " << allocation.quantity << " from batch " << allocation.batch_number
                      << " (expires " << medstock::to_iso_string(allocation.expiry_date) << ")\n";
        }
    }

    return 0;
}

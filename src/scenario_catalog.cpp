#include "scenario_catalog.hpp"
#include <stdexcept>
#include <unordered_set>

ScenarioCatalog::ScenarioCatalog() : ScenarioCatalog(defaultScenarios()) {}

ScenarioCatalog::ScenarioCatalog(std::vector<ScenarioDefinition> entries)
    : scenarios(std::move(entries)) {
    std::unordered_set<std::string> seen;
    for (const auto& s : scenarios) {
        if (s.name.empty()) {
            throw std::invalid_argument("Scenario name must not be empty");
        }
        if (!seen.insert(s.name).second) {
            throw std::invalid_argument("Duplicate scenario: " + s.name);
        }
        if (s.spin_minutes < 0.0 || s.spins_per_day < 0.0) {
            throw std::invalid_argument("Negative duration or frequency in scenario: " + s.name);
        }
        if (s.intensity <= 0.0 || s.intensity > 1.0) {
            throw std::invalid_argument("Scenario intensity must be in (0, 1]: " + s.name);
        }
    }
}

std::vector<ScenarioDefinition> ScenarioCatalog::defaultScenarios() {
    return {
        {"Peak Demand", 15.0, 4.0, 1.0},
        {"Base Load", 30.0, 2.0, 0.75},
        {"Emergency", 60.0, 1.0, 1.0},
        {"Storage Fill", 120.0, 2.0 / 7.0, 0.5}, // twice a week
    };
}

Outcome<ScenarioDefinition> ScenarioCatalog::find(const std::string& name) const {
    for (const auto& s : scenarios) {
        if (s.name == name) {
            return Outcome<ScenarioDefinition>::success(s);
        }
    }
    return Outcome<ScenarioDefinition>::failure(SimError::UnknownScenario);
}

Outcome<ScenarioDefinition> ScenarioCatalog::at(size_t index) const {
    if (index >= scenarios.size()) {
        return Outcome<ScenarioDefinition>::failure(SimError::UnknownScenario);
    }
    return Outcome<ScenarioDefinition>::success(scenarios[index]);
}

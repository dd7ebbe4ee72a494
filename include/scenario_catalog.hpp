#ifndef SCENARIO_CATALOG_H
#define SCENARIO_CATALOG_H

#include "spin_core.hpp"
#include <cstddef>
#include <string>
#include <vector>

/**
 * @class ScenarioCatalog
 * @brief Immutable, enumerable table of operating scenarios.
 *
 * Entries keep the order they were supplied in. The catalog is built once at
 * process start and only read afterwards, so it needs no locking.
 */
class ScenarioCatalog {
public:
    /// @brief Builds the catalog from the four built-in scenarios.
    ScenarioCatalog();

    /**
     * @brief Builds the catalog from an explicit list, e.g. from the profile.
     * @throw std::invalid_argument on duplicate names or invalid entries.
     */
    explicit ScenarioCatalog(std::vector<ScenarioDefinition> entries);

    /// @brief The built-in Peak Demand / Base Load / Emergency / Storage Fill set.
    static std::vector<ScenarioDefinition> defaultScenarios();

    /**
     * @brief Looks up a scenario by name.
     * @return The entry, or SimError::UnknownScenario.
     */
    Outcome<ScenarioDefinition> find(const std::string& name) const;

    /// @brief Looks up a scenario by its position in the catalog.
    Outcome<ScenarioDefinition> at(size_t index) const;

    const std::vector<ScenarioDefinition>& entries() const { return scenarios; }
    size_t size() const { return scenarios.size(); }

private:
    std::vector<ScenarioDefinition> scenarios;
};

#endif // SCENARIO_CATALOG_H

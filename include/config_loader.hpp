#ifndef CONFIG_LOADER_H
#define CONFIG_LOADER_H

#include "spin_core.hpp"
#include <string>

/**
 * @class ConfigLoader
 * @brief Parses the YAML plant profile to populate the Config structure.
 *
 * This class uses the yaml-cpp library to read the server endpoint, core
 * constants, scheduler cadence, conduit network and scenario catalog. Keys
 * that are absent keep their compiled-in defaults.
 */
class ConfigLoader {
public:
    /**
     * @brief Loads and parses the YAML profile.
     * @param filename The path to the YAML profile.
     * @return A validated Config object.
     * @throw std::runtime_error if the file cannot be opened, parsed or validated.
     */
    static Config loadConfig(const std::string& filename);

    /**
     * @brief Parses a profile held in memory.
     * @throw std::runtime_error on malformed or invalid content.
     */
    static Config parseConfig(const std::string& yaml_text);

    /// @throw std::runtime_error describing the first violated constraint.
    static void validate(const Config& config);
};

#endif // CONFIG_LOADER_H

/**
 * @file scenario_manager.hpp
 * @brief Lookup of the built-in scenarios by name.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "planar/core/i_scenario.hpp"

class ScenarioManager {
public:
    /** @brief Names accepted by createScenario(), in display order */
    static const std::vector<std::string>& getScenarioNames();

    /**
     * @brief Builds a scenario from its name
     * @throws Errors::InvalidArgument for an unknown name
     */
    static std::unique_ptr<IScenario> createScenario(const std::string& name);
};

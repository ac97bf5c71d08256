/**
 * @fileoverview main.cpp
 * @brief Headless demo: runs a built-in scenario and prints where bodies end up.
 *
 * Usage: planar_demo [scenario] [steps]
 */

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

#include "planar/components/basic.hpp"
#include "planar/core/profile.hpp"
#include "planar/core/scenario_manager.hpp"
#include "planar/core/simulator.hpp"
#include "planar/kinematics/constrained_body.hpp"
#include "planar/scenarios/colliding_boxes.hpp"

static void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [scenario] [steps]\n  scenarios:";
    for (const auto& name : ScenarioManager::getScenarioNames()) {
        std::cerr << " " << name;
    }
    std::cerr << "\n";
}

static void printSummary(const Simulator& sim) {
    const auto& registry = sim.getRegistry();

    std::cout << "\nAfter " << sim.getTickCount() << " ticks (" << sim.getSimulatedTime() << "s):\n";

    auto bodies = registry.view<const Components::Position, const Components::Velocity, const Components::Mass>();
    for (auto entity : bodies) {
        std::cout << "  body " << entt::to_integral(entity)
                  << " m=" << bodies.get<const Components::Mass>(entity).value
                  << " pos=" << bodies.get<const Components::Position>(entity)
                  << " vel=" << bodies.get<const Components::Velocity>(entity) << "\n";
    }

    auto counters = registry.view<const ContactCounter>();
    for (auto entity : counters) {
        std::cout << "  sensor " << entt::to_integral(entity)
                  << " contacts=" << counters.get<const ContactCounter>(entity).count << "\n";
    }

    auto chains = registry.view<const Kinematics::ConstrainedBody>();
    for (auto entity : chains) {
        const auto& chain = chains.get<const Kinematics::ConstrainedBody>(entity);
        auto nodes = chain.nodesInOrder();
        std::cout << "  chain of " << nodes.size() << " nodes, head=" << nodes.front()->position
                  << " tail=" << nodes.back()->position << "\n";
    }

    const auto& stats = sim.getCollisionStats();
    std::cout << "  collisions: pairs=" << stats.candidatePairs << " contacts=" << stats.contacts
              << " resolved=" << stats.resolved << " failures=" << stats.failures << "\n";
}

int main(int argc, char** argv) {
    std::string scenarioName = "colliding_boxes";
    long steps = 600;

    if (argc > 1) {
        scenarioName = argv[1];
        if (scenarioName == "-h" || scenarioName == "--help") {
            printUsage(argv[0]);
            return EXIT_SUCCESS;
        }
    }
    if (argc > 2) {
        char* end = nullptr;
        steps = std::strtol(argv[2], &end, 10);
        if (end == argv[2] || *end != '\0' || steps < 0) {
            std::cerr << "[main] Error: steps must be a non-negative integer, got '" << argv[2] << "'\n";
            printUsage(argv[0]);
            return EXIT_FAILURE;
        }
    }

    try {
        Simulator sim;
        sim.loadScenario(ScenarioManager::createScenario(scenarioName));

        std::cout << "Running '" << scenarioName << "' for " << steps << " steps\n";
        for (long i = 0; i < steps; ++i) {
            sim.tick();
        }

        printSummary(sim);
        Profiling::Profiler::printStats();
    } catch (const std::exception& e) {
        std::cerr << "[main] Error: " << e.what() << "\n";
        printUsage(argv[0]);
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

/**
 * @file profile.hpp
 * @brief Scope timing for the simulation loop
 *
 * Named scopes nest (parent-child) following the order in which they are
 * entered. Every system update and every simulator tick opens a scope, so
 * printStats() shows where a tick spends its time.
 *
 * Example usage:
 * @code
 * void CollisionSystem::update(entt::registry& registry, double dt) {
 *     PROFILE_SCOPE("CollisionSystem::update");
 *     // ... code ...
 * }
 *
 * Profiling::Profiler::printStats();
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stack>
#include <string>
#include <unordered_map>
#include <vector>

namespace Profiling {

/**
 * @brief Process-wide timing registry (singleton, static interface)
 */
class Profiler {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = std::chrono::nanoseconds;

    /**
     * @brief Aggregated timings of one named scope
     */
    struct ProfileData {
        Duration total_time{0};        ///< Accumulated time inside the scope
        Duration self_time{0};         ///< Time excluding nested scopes
        uint64_t call_count{0};
        Duration min_time{Duration::max()};
        Duration max_time{0};

        std::string parent_name;       ///< Empty for a root scope
        std::vector<std::string> children;
    };

    /**
     * @brief Enters a named scope
     */
    static void startSection(const std::string& name);

    /**
     * @brief Leaves a named scope; must match the innermost open scope
     *
     * A mismatched name is reported on std::cerr and ignored.
     */
    static void endSection(const std::string& name);

    /**
     * @brief Snapshot of a scope's timings, or nullopt if it never ran
     */
    static std::optional<ProfileData> getStats(const std::string& name);

    /**
     * @brief Prints the scope tree with call counts and time shares to stdout
     */
    static void printStats();

    /**
     * @brief Forgets all recorded scopes
     */
    static void reset();

private:
    struct SectionData {
        TimePoint start_time;
        ProfileData profile_data;
    };

    std::unordered_map<std::string, SectionData> sections;
    std::stack<std::string> scope_stack;

    Profiler() = default;

    static Profiler& getInstance();

    static void attachToParent(Profiler& instance, const std::string& name);

    static void printNode(const std::string& name,
                          const std::string& prefix,
                          bool is_last,
                          Duration total_program_time);
};

/**
 * @brief RAII guard: starts a section on construction, ends it on destruction
 */
class ScopedProfiler {
public:
    explicit ScopedProfiler(std::string name);
    ~ScopedProfiler();

    ScopedProfiler(const ScopedProfiler&) = delete;
    ScopedProfiler& operator=(const ScopedProfiler&) = delete;

private:
    std::string section_name;
};

} // namespace Profiling

#define PLANAR_PROFILE_CONCAT_INNER(a, b) a##b
#define PLANAR_PROFILE_CONCAT(a, b) PLANAR_PROFILE_CONCAT_INNER(a, b)

/**
 * @brief Times the enclosing scope under the given name
 */
#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler PLANAR_PROFILE_CONCAT(_scopedProfiler, __LINE__) { name }

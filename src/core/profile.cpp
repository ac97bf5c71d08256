/**
 * @file profile.cpp
 * @brief Scope timing tree used by PROFILE_SCOPE
 */

#include "planar/core/profile.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <utility>

namespace Profiling {

Profiler& Profiler::getInstance() {
    static Profiler instance;
    return instance;
}

void Profiler::attachToParent(Profiler& instance, const std::string& name) {
    auto& data = instance.sections[name].profile_data;

    if (instance.scope_stack.empty()) {
        data.parent_name.clear();
        return;
    }

    const std::string parentName = instance.scope_stack.top();
    if (data.parent_name == parentName) {
        return;
    }

    // a scope entered from a new parent moves under it
    if (!data.parent_name.empty()) {
        auto& oldSiblings = instance.sections[data.parent_name].profile_data.children;
        oldSiblings.erase(std::remove(oldSiblings.begin(), oldSiblings.end(), name),
                          oldSiblings.end());
    }
    data.parent_name = parentName;

    auto& siblings = instance.sections[parentName].profile_data.children;
    if (std::find(siblings.begin(), siblings.end(), name) == siblings.end()) {
        siblings.push_back(name);
    }
}

void Profiler::startSection(const std::string& name) {
    auto& instance = getInstance();
    attachToParent(instance, name);
    instance.scope_stack.push(name);
    instance.sections[name].start_time = Clock::now();
}

void Profiler::endSection(const std::string& name) {
    auto const endTime = Clock::now();
    auto& instance = getInstance();

    if (instance.scope_stack.empty()) {
        std::cerr << "[Profiler] Warning: endSection(\"" << name << "\") with no open scope.\n";
        return;
    }
    if (instance.scope_stack.top() != name) {
        std::cerr << "[Profiler] Warning: endSection(\"" << name
                  << "\") but innermost scope is \"" << instance.scope_stack.top() << "\".\n";
        return;
    }
    instance.scope_stack.pop();

    auto& data = instance.sections[name].profile_data;
    Duration const elapsed = std::chrono::duration_cast<Duration>(endTime - instance.sections[name].start_time);

    data.total_time += elapsed;
    data.self_time  += elapsed;
    data.call_count += 1;
    data.min_time = std::min(data.min_time, elapsed);
    data.max_time = std::max(data.max_time, elapsed);

    if (!data.parent_name.empty()) {
        instance.sections[data.parent_name].profile_data.self_time -= elapsed;
    }
}

std::optional<Profiler::ProfileData> Profiler::getStats(const std::string& name) {
    const auto& instance = getInstance();
    auto it = instance.sections.find(name);
    if (it == instance.sections.end() || it->second.profile_data.call_count == 0) {
        return std::nullopt;
    }
    return it->second.profile_data;
}

void Profiler::printStats() {
    auto& instance = getInstance();
    std::cout << "\nProfiling Statistics:\n";

    std::vector<std::string> roots;
    Duration totalTime{0};
    for (const auto& [name, section] : instance.sections) {
        if (section.profile_data.parent_name.empty()) {
            roots.push_back(name);
            totalTime += section.profile_data.total_time;
        }
    }
    std::sort(roots.begin(), roots.end());

    for (size_t i = 0; i < roots.size(); ++i) {
        printNode(roots[i], "", i + 1 == roots.size(), totalTime);
    }
}

void Profiler::printNode(const std::string& name,
                         const std::string& prefix,
                         bool isLast,
                         Duration totalProgramTime)
{
    const auto& pd = getInstance().sections.at(name).profile_data;

    double totalPercent = 0.0;
    double selfPercent = 0.0;
    if (totalProgramTime.count() > 0) {
        totalPercent = (pd.total_time.count() * 100.0) / totalProgramTime.count();
        selfPercent  = (pd.self_time.count()  * 100.0) / totalProgramTime.count();
    }
    double const totalMs = std::chrono::duration<double, std::milli>(pd.total_time).count();

    auto const flags = std::cout.flags();
    std::cout << prefix << (isLast ? "└── " : "├── ")
              << name << " [" << pd.call_count << " calls] "
              << std::fixed << std::setprecision(3) << totalMs << "ms (total: "
              << std::setprecision(2) << totalPercent << "%, "
              << "self: " << selfPercent << "%)\n";
    std::cout.flags(flags);

    std::string const childPrefix = prefix + (isLast ? "    " : "│   ");
    for (size_t i = 0; i < pd.children.size(); ++i) {
        printNode(pd.children[i], childPrefix, i + 1 == pd.children.size(), totalProgramTime);
    }
}

void Profiler::reset() {
    auto& instance = getInstance();
    instance.sections.clear();
    instance.scope_stack = {};
}

ScopedProfiler::ScopedProfiler(std::string name)
    : section_name(std::move(name))
{
    Profiler::startSection(section_name);
}

ScopedProfiler::~ScopedProfiler() {
    Profiler::endSection(section_name);
}

} // namespace Profiling

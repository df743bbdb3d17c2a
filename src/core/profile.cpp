/**
 * @file profile.cpp
 * @brief Implementation of the profiling system described in profile.hpp
 */

#include "accretion/core/profile.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <utility>

namespace Profiling {

Profiler& Profiler::getInstance() {
    static Profiler instance;
    return instance;
}

void Profiler::startSection(const std::string& name) {
    auto& instance = getInstance();
    auto& section  = instance.sections[name];

    section.start_time = Clock::now();

    if (!instance.scope_stack.empty()) {
        const std::string parentName = instance.scope_stack.back();

        // Scope re-entered under a different parent: move it
        if (!section.profile_data.parent_name.empty() &&
            section.profile_data.parent_name != parentName)
        {
            auto& oldParentChildren =
                instance.sections[section.profile_data.parent_name].profile_data.children;
            oldParentChildren.erase(
                std::remove(oldParentChildren.begin(), oldParentChildren.end(), name),
                oldParentChildren.end()
            );
        }

        section.profile_data.parent_name = parentName;

        auto& parentKids = instance.sections[parentName].profile_data.children;
        if (std::find(parentKids.begin(), parentKids.end(), name) == parentKids.end()) {
            parentKids.push_back(name);
        }
    } else {
        section.profile_data.parent_name.clear();
    }

    instance.scope_stack.push_back(name);
}

void Profiler::endSection(const std::string& name) {
    auto& instance = getInstance();

    if (instance.scope_stack.empty()) {
        std::cerr << "[Profiler] Warning: endSection(\"" << name << "\") but scope stack empty.\n";
        return;
    }
    if (instance.scope_stack.back() != name) {
        std::cerr << "[Profiler] Warning: endSection(\"" << name
                  << "\") but top of stack is \"" << instance.scope_stack.back() << "\".\n";
        return;
    }

    auto endTime = Clock::now();
    auto& section = instance.sections[name];

    Duration const duration = endTime - section.start_time;

    section.profile_data.total_time += duration;
    section.profile_data.self_time  += duration;
    section.profile_data.call_count += 1;
    section.profile_data.min_time = std::min(section.profile_data.min_time, duration);
    section.profile_data.max_time = std::max(section.profile_data.max_time, duration);

    if (!section.profile_data.parent_name.empty()) {
        auto& parentData = instance.sections[section.profile_data.parent_name].profile_data;
        parentData.self_time -= duration;
    }

    instance.scope_stack.pop_back();
}

void Profiler::printStats(std::ostream& out) {
    auto& instance = getInstance();
    out << "\nProfiling Statistics:\n";

    std::vector<std::string> roots;
    for (auto& [name, sdata] : instance.sections) {
        if (sdata.profile_data.parent_name.empty()) {
            roots.push_back(name);
        }
    }
    std::sort(roots.begin(), roots.end());

    Duration totalTime{0};
    for (auto& r : roots) {
        totalTime += instance.sections[r].profile_data.total_time;
    }

    for (size_t i = 0; i < roots.size(); ++i) {
        bool const isLast = (i == roots.size() - 1);
        printNode(out, roots[i], "", isLast, totalTime);
    }
}

void Profiler::printNode(std::ostream& out,
                         const std::string& name,
                         const std::string& prefix,
                         bool isLast,
                         Duration totalProgramTime)
{
    const auto& instance = getInstance();
    const auto& pd       = instance.sections.at(name).profile_data;

    double totalPercent = 0.0;
    double selfPercent = 0.0;
    if (totalProgramTime.count() > 0) {
        totalPercent = (pd.total_time.count() * 100.0) / totalProgramTime.count();
        selfPercent  = (pd.self_time.count()  * 100.0) / totalProgramTime.count();
    }

    auto totalMs = std::chrono::duration_cast<std::chrono::milliseconds>(pd.total_time).count();
    auto maxUs = pd.call_count > 0
        ? std::chrono::duration_cast<std::chrono::microseconds>(pd.max_time).count()
        : 0;

    out << prefix << (isLast ? "└── " : "├── ")
        << name << " [" << pd.call_count << " calls] "
        << totalMs << "ms (total: "
        << std::fixed << std::setprecision(2) << totalPercent << "%, "
        << "self: " << selfPercent << "%, max: " << maxUs << "us)\n";

    for (size_t i = 0; i < pd.children.size(); ++i) {
        bool const childLast = (i == pd.children.size() - 1);
        std::string const childPrefix = prefix + (isLast ? "    " : "│   ");
        printNode(out, pd.children[i], childPrefix, childLast, totalProgramTime);
    }
}

void Profiler::reset() {
    auto& instance = getInstance();
    instance.sections.clear();
    instance.scope_stack.clear();
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

/**
 * @file profile.hpp
 * @brief Scope timing for the simulation pipeline
 *
 * Measures execution time of code sections in a hierarchical manner
 * (parent-child scopes):
 * - RAII guards track scope durations
 * - Aggregates total time, self time, call count, min/max per scope
 * - Prints a tree-structured summary with percentages of total time
 *
 * Only the thread that drives ticks may open scopes; force solver worker
 * tasks are never profiled individually.
 *
 * Example usage:
 * @code
 * void tick() {
 *     PROFILE_SCOPE("ECSSimulator::tick");
 *     // ... code ...
 * }
 *
 * Profiling::Profiler::printStats(std::cout);
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace Profiling {

/**
 * @brief Process-wide collection of timing data.
 */
class Profiler {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;
    using Duration  = std::chrono::nanoseconds;

    /**
     * @brief Stores aggregated timing statistics for a named scope
     */
    struct ProfileData {
        Duration total_time{0};        ///< Accumulated total time for this scope
        Duration self_time{0};         ///< Time excluding children's time
        uint64_t call_count{0};        ///< Number of times this scope was entered
        Duration min_time{Duration::max()};
        Duration max_time{0};

        std::string parent_name;       ///< Parent scope in the tree
        std::vector<std::string> children; ///< Child scope names
    };

    static void startSection(const std::string& name);
    static void endSection(const std::string& name);

    /**
     * @brief Prints the scope tree with total/self percentages.
     */
    static void printStats(std::ostream& out);

    static void reset();

private:
    struct SectionData {
        TimePoint start_time;
        ProfileData profile_data;
    };

    std::unordered_map<std::string, SectionData> sections;
    std::vector<std::string> scope_stack;

    Profiler() = default;

    static Profiler& getInstance();

    static void printNode(std::ostream& out,
                          const std::string& name,
                          const std::string& prefix,
                          bool is_last,
                          Duration total_program_time);
};

/**
 * @brief RAII guard that starts timing in the constructor and ends it in the destructor.
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

#define ACCRETION_PROFILE_CONCAT_INNER(a, b) a##b
#define ACCRETION_PROFILE_CONCAT(a, b) ACCRETION_PROFILE_CONCAT_INNER(a, b)

/**
 * @brief Times the enclosing scope under the given name.
 */
#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler ACCRETION_PROFILE_CONCAT(_scopedProfiler, __LINE__) { name }

/**
 * @file profile.hpp
 * @brief Scope timing for the simulation loop
 *
 * Each named section accumulates total time, self time (excluding nested
 * sections), call count and min/max duration. Sections opened while another
 * is active become its children, so printStats() can show a tree such as
 *
 * @code
 * └── ECSSimulator::tick [600 calls] 12ms (total: 100.00%, self: 4.10%)
 *     ├── IntegratorSystem [600 calls] ...
 *     ├── CollisionSystem [600 calls] ...
 *     └── BoundarySystem [600 calls] ...
 * @endcode
 *
 * Use the PROFILE_SCOPE macro rather than calling start/end by hand.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <stack>
#include <string>
#include <unordered_map>
#include <vector>

namespace Profiling {

/**
 * @brief Process-wide collector of section timings.
 */
class Profiler {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = std::chrono::nanoseconds;

    struct ProfileData {
        Duration total_time{0};
        Duration self_time{0};
        uint64_t call_count{0};
        Duration min_time{Duration::max()};
        Duration max_time{0};

        std::string parent_name;
        std::vector<std::string> children;
    };

    static void startSection(const std::string& name);

    /**
     * @brief Closes the innermost section.
     *
     * A name that does not match the innermost open section is reported on
     * stderr and ignored.
     */
    static void endSection(const std::string& name);

    /** @brief Prints the section tree to stdout. */
    static void printStats();

    /** @brief Drops all recorded data. */
    static void reset();

    /** @brief Number of completed calls for a section, 0 if never seen. */
    static uint64_t getCallCount(const std::string& name);

    /** @brief Parent of a section, empty for roots or unknown names. */
    static std::string getParent(const std::string& name);

private:
    struct Section {
        TimePoint started;
        ProfileData data;
    };

    std::unordered_map<std::string, Section> sections;
    std::stack<std::string> open;

    Profiler() = default;
    static Profiler& instance();

    void attachToParent(const std::string& name, Section& section);
    void printNode(const std::string& name, const std::string& prefix,
                   bool last, Duration programTime) const;
};

/**
 * @brief RAII guard: opens a section on construction, closes it on destruction.
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

#define PROFILE_CONCAT_INNER(a, b) a##b
#define PROFILE_CONCAT(a, b) PROFILE_CONCAT_INNER(a, b)

#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler PROFILE_CONCAT(_scopedProfiler, __LINE__) { name }

#ifndef IVSEL_UTILITY_STATS_GUARD_HPP
#define IVSEL_UTILITY_STATS_GUARD_HPP

#include "ivsel/common.hpp"

#include <fmt/format.h>

#include <chrono>
#include <string>
#include <utility>

namespace ivsel {

#ifdef IVSEL_DEBUG_STATS
    // Define a stats guard instance with the given variable name and
    // a format specifier. Example: STATS_GUARD(guard, "Hello {}", "World");
    #define STATS_GUARD(Name, ...) ::ivsel::stats_guard Name(fmt::format(__VA_ARGS__))
    #define STATS_PRINT(Name, ...) (Name).print(__VA_ARGS__)
#else
    #define STATS_GUARD(Name, ...) ::ivsel::unused(__VA_ARGS__)
    #define STATS_PRINT(Name, ...) ::ivsel::unused(__VA_ARGS__)
#endif

/// Traces entering and leaving a named phase of the computation.
/// Messages are indented according to the nesting depth of the active guards
/// in the current thread. On destruction, the elapsed time is reported.
class stats_guard {
    using clock = std::chrono::steady_clock;
    using time_point = clock::time_point;
    using double_seconds = std::chrono::duration<double>;

    static thread_local int t_indent;

    static void print_indented(int indent, const std::string& message);

    static void print_impl(const std::string& result);

public:
    explicit stats_guard(std::string name)
        : m_indent(t_indent)
        , m_name(std::move(name))
        , m_time(clock::now())
    {
        print("Entering \"{}\".", m_name);
        ++t_indent;
    }

    ~stats_guard() {
        --t_indent;

        double duration = std::chrono::duration_cast<double_seconds>(
                    clock::now() - m_time).count();
        print("Leaving \"{}\".\n"
              "  * Duration: {:.4f} s",
              m_name,
              duration);
    }

    stats_guard(const stats_guard&) = delete;

    stats_guard& operator=(const stats_guard&) = delete;

    template<typename... Args>
    void print(const char* format, Args&&... args) {
        print_indented(m_indent, fmt::format(format, std::forward<Args>(args)...));
    }

private:
    int m_indent;
    std::string m_name;
    time_point m_time;
};

} // namespace ivsel

#endif // IVSEL_UTILITY_STATS_GUARD_HPP

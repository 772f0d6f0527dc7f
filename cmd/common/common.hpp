#ifndef COMMON_COMMON_HPP
#define COMMON_COMMON_HPP

#include "ivsel/common.hpp"
#include "ivsel/parser.hpp"

#include <fmt/format.h>

#include <cstdio>

class exit_main {
public:
    int code = 0;

    exit_main(int code = 0): code(code) {}
};

/// Calls the function f and returns its result, which should be an int.
/// Throwing `exit_main` from within `f` ends the program with the given code,
/// input errors are reported on stderr and end the program with code 1.
template<typename Func>
int run_main(Func&& f) {
    try {
        return f();
    } catch (const exit_main& e) {
        return e.code;
    } catch (const ivsel::parse_error& e) {
        fmt::print(stderr, "Error: {}.\n", e.what());
        return 1;
    }
}

#endif // COMMON_COMMON_HPP

#include "ivsel/common.hpp"

#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace ivsel {

void assertion_failed_impl(const char* file, int line,
                           const char* condition, const char* message)
{
    if (message && std::strlen(message) > 0) {
        fmt::print(stderr, "Assertion `{}` failed: {}.\n", condition, message);
    } else {
        fmt::print(stderr, "Assertion `{}` failed.\n", condition);
    }
    fmt::print(stderr, "    (in {}:{})\n", file, line);
    std::fflush(stderr);
    std::abort();
}

} // namespace ivsel

#ifndef IVSEL_COMMON_HPP
#define IVSEL_COMMON_HPP

#include <climits>
#include <cstdint>

#include <gsl/gsl>

namespace ivsel {

static_assert(CHAR_BIT == 8, "Byte width sanity check.");

using u32 = uint32_t;
using u64 = uint64_t;

using i32 = int32_t;
using i64 = int64_t;

/// Marks a set of arguments as unused, suppressing compiler warnings.
template<typename... Args>
void unused(Args&&...) {}

#ifndef NDEBUG

/// Similar to standard assert, but allows for a custom message.
#define ivsel_assert(condition, message)                        \
    do {                                                        \
        if (!(condition)) {                                     \
            ::ivsel::assertion_failed_impl(__FILE__, __LINE__,  \
                #condition, message);                           \
        }                                                       \
    } while (0)

#else

#define ivsel_assert(condition, message) do { } while(0)

#endif

// Do not call directly.
[[noreturn]]
void assertion_failed_impl(const char* file, int line,
                           const char* condition, const char* message);

} // namespace ivsel

#endif // IVSEL_COMMON_HPP

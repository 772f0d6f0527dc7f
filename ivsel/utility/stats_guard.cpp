#include "ivsel/utility/stats_guard.hpp"

#include <algorithm>
#include <iostream>

namespace ivsel {

thread_local int stats_guard::t_indent = 0;

void stats_guard::print_indented(int indent, const std::string& message) {
    const int spaces = indent * 2;

    auto pos = message.begin();
    auto end = message.end();
    if (pos == end)
        return;

    std::string result;
    while (pos != end) {
        auto newline = std::find(pos, end, '\n');
        if (newline != end) {
            ++newline;
        }

        result += "-- ";
        result.append(spaces, ' ');
        result.append(pos, newline);
        pos = newline;
    }
    if (result.back() != '\n') {
        result += '\n';
    }
    print_impl(result);
}

void stats_guard::print_impl(const std::string& str) {
    std::cerr << str << std::flush;
}

} // namespace ivsel

#ifndef IVSEL_PARSER_HPP
#define IVSEL_PARSER_HPP

#include "ivsel/common.hpp"
#include "ivsel/interval.hpp"

#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace ivsel {

class parse_error : public std::runtime_error {
public:
    using runtime_error::runtime_error;
};

/// Column names of the interval table.
static constexpr const char* start_column = "Interval_start";
static constexpr const char* end_column = "Interval_end";
static constexpr const char* cost_column = "Cost";

/// Parses a table of intervals in CSV format.
///
/// The first non-empty line is the header row. It must name the columns
/// `Interval_start`, `Interval_end` and `Cost` (in any order); other columns
/// are ignored. Every following non-empty line describes one interval.
/// Cells are separated by commas, quotes are not interpreted.
///
/// Throws a `parse_error` if a required column is missing or if
/// one of its cells does not contain an integer.
std::vector<interval> read_intervals(std::istream& in);

/// Opens the file at `path` and parses it using `read_intervals`.
std::vector<interval> read_intervals_file(const std::string& path);

/// Parses a single real number, optionally surrounded by whitespace.
/// Values outside of [0, 1] are accepted, but the number must be finite
/// and small enough to be scaled (see `is_valid_trade_off`).
double parse_trade_off(const std::string& input);

/// Asks for the trade-off parameter on `out` and parses the next line from `in`.
double prompt_trade_off(std::istream& in, std::ostream& out);

} // namespace ivsel

#endif // IVSEL_PARSER_HPP

#include "ivsel/parser.hpp"

#include "ivsel/score.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <boost/spirit/home/x3.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <fstream>
#include <iterator>

namespace ivsel {

namespace parser {
    namespace x3 = boost::spirit::x3;
    namespace ascii = x3::ascii;

    using x3::rule;

    using x3::char_;
    using x3::lit;
    using x3::eol;
    using x3::omit;

    // A csv file is a list of lines. Every line contains a number of cells
    // separated by commas. Empty lines produce a row with a single empty cell.
    namespace csv {
        using row_type = std::vector<std::string>;

        rule<class cell_tag, std::string> cell = "csv cell";

        rule<class row_tag, row_type> row = "csv row";

        rule<class file_tag, std::vector<row_type>> file = "csv file";

        const auto cell_def = *(char_ - (lit(',') | eol));

        const auto row_def = cell % ',';

        const auto file_def = row % eol;

        BOOST_SPIRIT_DEFINE(cell, row, file)
    }

    const auto integer = omit[*ascii::blank] >> x3::int_parser<i64>() >> omit[*ascii::blank];

    const auto real = omit[*ascii::space] >> x3::double_ >> omit[*ascii::space];
}

namespace {

using row_type = parser::csv::row_type;

bool is_blank(const row_type& row) {
    return row.size() == 1 && boost::algorithm::trim_copy(row[0]).empty();
}

// Returns the position of the column with the given name in the header row.
size_t column_index(const row_type& header, const char* name, size_t line) {
    auto pos = std::find_if(header.begin(), header.end(), [&](const std::string& cell) {
        return boost::algorithm::trim_copy(cell) == name;
    });
    if (pos == header.end()) {
        throw parse_error(fmt::format("Missing column `{}` in header (line {})", name, line));
    }
    return static_cast<size_t>(pos - header.begin());
}

i64 parse_cell(const row_type& row, size_t index, const char* name, size_t line) {
    if (index >= row.size()) {
        throw parse_error(fmt::format("Expected a value for column `{}` in line {}, but the line "
                                      "only has {} column(s)", name, line, row.size()));
    }

    const std::string& cell = row[index];
    auto first = cell.begin();
    auto last = cell.end();

    i64 value = 0;
    bool ok = parser::x3::parse(first, last, parser::integer, value);
    if (!ok || first != last) {
        throw parse_error(fmt::format("Value `{}` of column `{}` in line {} is not an integer",
                                      cell, name, line));
    }
    return value;
}

} // namespace

std::vector<interval> read_intervals(std::istream& in) {
    const std::string content{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
        throw parse_error("Failed to read interval table");
    }

    std::vector<row_type> rows;
    {
        auto first = content.begin();
        auto last = content.end();
        bool ok = parser::x3::parse(first, last, parser::csv::file, rows);
        if (!ok || first != last) {
            throw parse_error("Failed to parse interval table");
        }
    }

    // Line numbers are 1-based, every line produces exactly one row.
    auto row = std::find_if_not(rows.begin(), rows.end(), is_blank);
    if (row == rows.end()) {
        throw parse_error("Missing header row in interval table");
    }

    const size_t header_line = static_cast<size_t>(row - rows.begin()) + 1;
    const size_t start_index = column_index(*row, start_column, header_line);
    const size_t end_index = column_index(*row, end_column, header_line);
    const size_t cost_index = column_index(*row, cost_column, header_line);

    std::vector<interval> result;
    for (++row; row != rows.end(); ++row) {
        if (is_blank(*row)) {
            continue;
        }

        const size_t line = static_cast<size_t>(row - rows.begin()) + 1;
        const i64 begin = parse_cell(*row, start_index, start_column, line);
        const i64 end = parse_cell(*row, end_index, end_column, line);
        const i64 cost = parse_cell(*row, cost_index, cost_column, line);
        result.emplace_back(begin, end, cost);
    }
    return result;
}

std::vector<interval> read_intervals_file(const std::string& path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        throw parse_error(fmt::format("Failed to open input file {}", path));
    }
    return read_intervals(in);
}

double parse_trade_off(const std::string& input) {
    auto first = input.begin();
    auto last = input.end();

    double value = 0;
    bool ok = parser::x3::parse(first, last, parser::real, value);
    if (!ok || first != last) {
        throw parse_error(fmt::format("Invalid trade-off parameter `{}`", input));
    }
    if (!is_valid_trade_off(value)) {
        throw parse_error(fmt::format("Trade-off parameter `{}` is not finite or too large", input));
    }
    return value;
}

double prompt_trade_off(std::istream& in, std::ostream& out) {
    out << "Enter the trade-off parameter (0 to 1): " << std::flush;

    std::string line;
    if (!std::getline(in, line)) {
        throw parse_error("No trade-off parameter given");
    }
    return parse_trade_off(line);
}

} // namespace ivsel

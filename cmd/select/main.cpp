#include "common/common.hpp"

#include "ivsel/optimizer.hpp"
#include "ivsel/parser.hpp"
#include "ivsel/report.hpp"

#include <boost/optional.hpp>
#include <boost/program_options.hpp>
#include <fmt/format.h>

#include <iostream>
#include <string>

using namespace std;
using namespace ivsel;
namespace po = boost::program_options;

static string input = "intervals.csv";
static boost::optional<double> trade_off;

void parse_options(int argc, char** argv);

int main(int argc, char** argv) {
    return run_main([&]{
        parse_options(argc, argv);

        vector<interval> intervals = read_intervals_file(input);
        const double t = trade_off ? *trade_off : prompt_trade_off(cin, cout);

        selection_result result = optimize(std::move(intervals), t);
        print_result(cout, result);
        return 0;
    });
}

void parse_options(int argc, char** argv) {
    string trade_off_arg;

    po::options_description options;
    options.add_options()
            ("help,h", "Show this message.")
            ("input", po::value(&input)->value_name("PATH"),
             "Path to the interval table (csv with the columns "
             "Interval_start, Interval_end and Cost). Defaults to intervals.csv.")
            ("trade-off", po::value(&trade_off_arg)->value_name("VALUE"),
             "Trade-off between the number of intervals (1) and their total cost (0). "
             "Read from the standard input if omitted.");

    po::variables_map vm;
    try {
        po::command_line_parser p(argc, argv);
        p.options(options);
        po::store(p.run(), vm);

        if (vm.count("help")) {
            fmt::print(stderr, "Usage: {0} OPTION...\n"
                               "\n"
                               "Selects non-overlapping intervals, trading off their number\n"
                               "against their total cost.\n"
                               "\n",
                       argv[0]);
            cerr << options << flush;
            throw exit_main(0);
        }

        po::notify(vm);
    } catch (const po::error& e) {
        fmt::print(stderr, "Failed to parse arguments: {}.\n", e.what());
        throw exit_main(1);
    }

    if (vm.count("trade-off")) {
        trade_off = parse_trade_off(trade_off_arg);
    }
}

#include "cli.hpp"
#include <fmt/format.h>

CliOptions CliParser::parse(const std::vector<std::string>& args, const std::string& default_category) {
    CliOptions opts;
    opts.category = default_category;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (arg == "--category" || arg == "-c") {
            if (i + 1 >= args.size()) {
                opts.error = "Missing value for " + arg;
                return opts;
            }
            opts.category = args[++i];
        } else if (arg == "--json") {
            opts.json_output = true;
        } else if (arg == "--save") {
            opts.save_history = true;
        } else if (arg == "--history") {
            opts.show_history = true;
        } else if (arg == "--clear-history") {
            opts.clear_history = true;
        } else if (!arg.empty() && arg[0] == '-') {
            opts.error = "Unknown option: " + arg;
            return opts;
        } else {
            opts.refs.push_back(arg);
        }
    }

    if (opts.refs.empty() && !opts.show_history && !opts.clear_history) {
        opts.error = "No video given";
    }
    return opts;
}

std::string CliParser::usage(const std::string& program) {
    return fmt::format(
        "Usage: {} [--category <id>] [--json] [--save] [--history] [--clear-history] <video>...\n"
        "  <video>          path to a .json video record, a YouTube URL or a video id\n"
        "  --clear-history  empty the history log before scoring\n",
        program);
}

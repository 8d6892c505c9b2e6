#pragma once

#include <string>
#include <vector>
#include <optional>

struct CliOptions {
    std::string category;
    bool json_output = false;
    bool save_history = false;
    bool show_history = false;
    bool clear_history = false;
    std::vector<std::string> refs;  // .json paths, URLs or video ids
    std::optional<std::string> error;

    bool is_valid() const { return !error.has_value(); }
};

class CliParser {
public:
    static CliOptions parse(const std::vector<std::string>& args, const std::string& default_category);
    static std::string usage(const std::string& program);
};

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace tsuba_gen {

struct options {
    std::string subcommand;
    std::string input;
    std::filesystem::path output = ".";
    std::string include_spelling;         // default: file name of the input header
    std::vector<std::string> async_types; // default: task, awaitable
    std::string request_type = "request";
    std::string routes_type = "routes_builder";
    bool strict = false;
    bool dump_spec = false;
    bool json_output = false;
    bool check_only = false;
};

[[noreturn]] void print_usage();
[[noreturn]] void print_examples();
options parse_args(int argc, char** argv);

} // namespace tsuba_gen

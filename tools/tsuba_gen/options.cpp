#include "options.hpp"

#include <cstdlib>
#include <iostream>
#include <string_view>

namespace tsuba_gen {

[[noreturn]] void print_usage() {
    std::cout << R"(tsuba_gen: route compiler for annotated C++ controllers

Usage:
  tsuba_gen routes -i <header> -o <out_dir> [options]
  tsuba_gen examples

Options:
  -i, --input <file>         Header declaring [[tsuba::controller]] classes
  -o, --output <dir>         Output directory (default: .)
  --include <spelling>       How the generated header includes the input (default: its file name)
  --async-type <name>        Return type template treated as asynchronous (repeatable,
                             default: task, awaitable)
  --request-type <name>      Parameter type of custom endpoints (default: request)
  --routes-type <name>       Parameter type of route builders (default: routes_builder)
  --json                     Print the compiled routes as JSON
  --check                    Report diagnostics only, no files written
  --strict                   Fail on warnings too
  --dump-spec                Save the compiled routes to <stem>_routes.json
  -h, --help                 Show this help
)";
    std::exit(1);
}

[[noreturn]] void print_examples() {
    std::cout << R"(tsuba_gen examples:

  # Check a controller header
  tsuba_gen routes -i src/library_controller.hpp --check --strict

  # Generate gen/library_controller_routes.hpp
  tsuba_gen routes -i src/library_controller.hpp -o gen --include "app/library_controller.hpp"

  # Coroutine handlers returning asio::awaitable<T> or my::lazy<T>
  tsuba_gen routes -i src/api.hpp -o gen --async-type awaitable --async-type lazy

  # Dump the compiled routes for debugging
  tsuba_gen routes -i src/api.hpp -o gen --dump-spec --json
)";
    std::exit(0);
}

options parse_args(int argc, char** argv) {
    options opts;
    if (argc < 2) {
        print_usage();
    }
    opts.subcommand = argv[1];
    if (opts.subcommand == "-h" || opts.subcommand == "--help") {
        print_usage();
    }
    if (opts.subcommand == "examples") {
        print_examples();
    }
    auto value = [&](int& i) -> std::string {
        if (i + 1 >= argc) {
            print_usage();
        }
        return argv[++i];
    };
    for (int i = 2; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage();
        } else if (arg == "-i" || arg == "--input") {
            opts.input = value(i);
        } else if (arg == "-o" || arg == "--output") {
            opts.output = value(i);
        } else if (arg == "--include") {
            opts.include_spelling = value(i);
        } else if (arg == "--async-type") {
            opts.async_types.push_back(value(i));
        } else if (arg == "--request-type") {
            opts.request_type = value(i);
        } else if (arg == "--routes-type") {
            opts.routes_type = value(i);
        } else if (arg == "--strict") {
            opts.strict = true;
        } else if (arg == "--dump-spec") {
            opts.dump_spec = true;
        } else if (arg == "--json") {
            opts.json_output = true;
        } else if (arg == "--check") {
            opts.check_only = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
        }
    }
    return opts;
}

} // namespace tsuba_gen

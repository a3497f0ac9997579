#include "tsuba/core/controller.hpp"
#include "tsuba/core/emitter.hpp"
#include "tsuba/core/header_parser.hpp"
#include "tsuba_gen/generator.hpp"
#include "tsuba_gen/options.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using namespace tsuba_gen;

namespace {

void print_diagnostics(const std::vector<tsuba::diagnostic>& diagnostics, std::string_view file) {
    for (const auto& d : diagnostics) {
        std::cerr << tsuba::format_diagnostic(d, file) << "\n";
    }
}

int run_routes(const options& opts) {
    if (opts.input.empty()) {
        std::cerr << "[routes] input header is required\n";
        return 1;
    }

    tsuba::diagnostic_sink sink;
    auto loaded = tsuba::load_header(opts.input, sink);
    if (!loaded) {
        print_diagnostics(sink.all(), opts.input);
        std::cerr << "[routes] " << loaded.error().message() << "\n";
        return 1;
    }

    tsuba::generation_options gen;
    if (!opts.async_types.empty()) {
        gen.async_types = opts.async_types;
    }
    gen.request_type = opts.request_type;
    gen.routes_type = opts.routes_type;

    auto report = tsuba::compile_routes(*loaded, gen);
    print_diagnostics(report.diagnostics, opts.input);

    size_t endpoints = 0;
    size_t route_builders = 0;
    for (const auto& c : report.controllers) {
        endpoints += c.endpoints.size();
        route_builders += c.route_builders.size();
    }

    bool failed = report.error_count() > 0 || (opts.strict && report.warning_count() > 0);

    if (opts.json_output) {
        std::cout << dump_spec_summary(report, sink.all(), opts.input) << "\n";
    }

    if (opts.check_only) {
        std::cout << "[check] " << (failed ? "FAILED" : "OK")
                  << ": controllers=" << report.controllers.size() << ", endpoints=" << endpoints
                  << ", errors=" << report.error_count()
                  << ", warnings=" << report.warning_count() << "\n";
        return failed ? 1 : 0;
    }

    std::error_code fs_ec;
    fs::create_directories(opts.output, fs_ec);
    if (fs_ec) {
        std::cerr << "[routes] failed to create output dir: " << fs_ec.message() << "\n";
        return 1;
    }

    tsuba::header_context ctx;
    ctx.source_name = fs::path(opts.input).filename().string();
    ctx.include_spelling =
        opts.include_spelling.empty() ? ctx.source_name : opts.include_spelling;

    auto header_path = opts.output / routes_header_name(opts.input);
    auto written = write_file(header_path, tsuba::emit_routes_header(report.controllers, ctx));
    if (!written) {
        std::cerr << "[routes] " << written.error().message() << ": " << header_path << "\n";
        return 1;
    }
    std::cout << "[codegen] Routes written to " << header_path << "\n";

    if (opts.dump_spec) {
        auto json_path = opts.output / routes_json_name(opts.input);
        auto dumped = write_file(json_path, dump_spec_summary(report, sink.all(), opts.input));
        if (!dumped) {
            std::cerr << "[routes] " << dumped.error().message() << ": " << json_path << "\n";
            return 1;
        }
        std::cout << "[routes] Route summary written to " << json_path << "\n";
    }

    if (failed) {
        std::cerr << "[routes] FAILED: errors=" << report.error_count()
                  << ", warnings=" << report.warning_count() << "\n";
        return 1;
    }

    std::cout << "[routes] OK: controllers=" << report.controllers.size()
              << ", endpoints=" << endpoints << ", route_builders=" << route_builders << "\n";
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    options opts = parse_args(argc, argv);
    if (opts.subcommand != "routes") {
        std::cerr << "Unknown subcommand: " << opts.subcommand << "\n";
        print_usage();
    }
    return run_routes(opts);
}

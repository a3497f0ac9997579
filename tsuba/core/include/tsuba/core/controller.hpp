#pragma once

#include "declaration.hpp"
#include "diagnostic.hpp"
#include "endpoint.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tsuba {

struct controller_spec {
    std::string class_path;     // "library" or "outer::library"
    std::string qualified_name; // with namespaces
    std::vector<std::string> namespaces;
    std::vector<std::string> global_path_segments;
    std::vector<std::string> global_middleware;
    std::vector<endpoint_spec> endpoints; // declaration order, custom endpoints included
    std::vector<route_builder_spec> route_builders;
    source_range where{};

    [[nodiscard]] bool has_global_grouping() const noexcept {
        return !global_path_segments.empty() || !global_middleware.empty();
    }
};

struct controller_result {
    std::optional<controller_spec> spec; // empty when the controller itself is unusable
    std::vector<diagnostic> diagnostics;
};

// Builds every annotated member of one `tsuba::controller` class. A failing member only
// drops that member; its siblings still generate.
controller_result assemble_controller(const class_decl& cls,
                                      const generation_options& opts,
                                      adapter_namer& namer);

struct generation_report {
    std::vector<controller_spec> controllers;
    std::vector<diagnostic> diagnostics;

    [[nodiscard]] size_t error_count() const noexcept;
    [[nodiscard]] size_t warning_count() const noexcept;
};

// Runs the assembler over every controller of a header and checks marker placement on
// everything else.
generation_report compile_routes(const translation_unit& unit, const generation_options& opts);

} // namespace tsuba

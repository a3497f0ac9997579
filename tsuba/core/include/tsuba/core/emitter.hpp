#pragma once

#include "controller.hpp"
#include "endpoint.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace tsuba {

// Names used inside every generated boot().
inline constexpr std::string_view routes_binding = "routes";
inline constexpr std::string_view grouped_routes_binding = "grouped_routes";

struct header_context {
    std::string source_name;      // shown in the banner
    std::string include_spelling; // header that declares the controllers; empty to skip
};

// `this->handler(args...)`
std::string emit_handler_call(const endpoint_spec& spec);

// Adapter declaration for ordinary endpoints, inline lambda for custom endpoints.
std::string emit_adapter(const endpoint_spec& spec);

std::string emit_registration(const endpoint_spec& spec, std::string_view surface);
std::string emit_route_builder_call(const route_builder_spec& spec, bool has_global_grouping);

// Empty without global path or middleware.
std::string emit_group_declaration(const controller_spec& spec);

std::string emit_boot_definition(const controller_spec& spec);
std::string emit_routes_header(const std::vector<controller_spec>& controllers,
                               const header_context& ctx);

} // namespace tsuba

#pragma once

#include "argument_matcher.hpp"
#include "declaration.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace tsuba {

// Closed vocabulary of `tsuba::` attributes.
enum class marker_kind : uint8_t {
    controller,
    endpoint,
    custom_endpoint,
    method_shorthand,
    route_builder,
    path_param,
    query_param,
    body,
    query_content,
    auth,
    req,
    request_path,
    unknown,
};

marker_kind classify_marker(std::string_view name) noexcept;
inline marker_kind classify_marker(const attribute& attr) noexcept {
    return attr.is_marker() ? classify_marker(attr.name) : marker_kind::unknown;
}

// Vocabulary constant implied by a shorthand marker: "delete" and "del" -> "del".
std::optional<std::string_view> shorthand_method(std::string_view name) noexcept;

std::string_view marker_kind_name(marker_kind kind) noexcept;

[[nodiscard]] bool is_route_marker(marker_kind kind) noexcept;
[[nodiscard]] bool is_source_marker(marker_kind kind) noexcept;

// Argument rules of each marker. Markers without arguments get an empty table.
std::span<const parsing_rule> rules_for(marker_kind kind);

} // namespace tsuba

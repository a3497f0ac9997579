#include "tsuba/core/markers.hpp"

#include <array>
#include <utility>
#include <vector>

namespace tsuba {

namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 10> shorthand_table{{
    {"get", "get"},
    {"post", "post"},
    {"put", "put"},
    {"del", "del"},
    {"delete", "del"},
    {"patch", "patch"},
    {"head", "head"},
    {"options", "options"},
    {"move", "move"},
    {"copy", "copy"},
}};

const std::vector<parsing_rule>& controller_rules() {
    static const std::vector<parsing_rule> rules{
        parsing_rule::labeled_variadic("path", true),
        parsing_rule::labeled_variadic("middleware", true),
    };
    return rules;
}

const std::vector<parsing_rule>& endpoint_rules() {
    static const std::vector<parsing_rule> rules{
        parsing_rule::labeled("method", true),
        parsing_rule::labeled_variadic("path", true),
        parsing_rule::labeled_variadic("middleware", true),
        parsing_rule::labeled("body", true),
    };
    return rules;
}

const std::vector<parsing_rule>& shorthand_rules() {
    static const std::vector<parsing_rule> rules{
        parsing_rule::labeled_variadic("path", true),
        parsing_rule::labeled_variadic("middleware", true),
    };
    return rules;
}

const std::vector<parsing_rule>& route_builder_rules() {
    static const std::vector<parsing_rule> rules{
        parsing_rule::labeled("use_global_setting", true),
    };
    return rules;
}

const std::vector<parsing_rule>& keyed_rules() {
    static const std::vector<parsing_rule> rules{parsing_rule::labeled("name", true)};
    return rules;
}

const std::vector<parsing_rule>& key_path_rules() {
    static const std::vector<parsing_rule> rules{parsing_rule::positional(true)};
    return rules;
}

} // namespace

marker_kind classify_marker(std::string_view name) noexcept {
    if (name == "controller") {
        return marker_kind::controller;
    }
    if (name == "endpoint") {
        return marker_kind::endpoint;
    }
    if (name == "custom_endpoint") {
        return marker_kind::custom_endpoint;
    }
    if (shorthand_method(name)) {
        return marker_kind::method_shorthand;
    }
    if (name == "route_builder") {
        return marker_kind::route_builder;
    }
    if (name == "path_param") {
        return marker_kind::path_param;
    }
    if (name == "query_param") {
        return marker_kind::query_param;
    }
    if (name == "body" || name == "content") {
        return marker_kind::body;
    }
    if (name == "query_content") {
        return marker_kind::query_content;
    }
    if (name == "auth") {
        return marker_kind::auth;
    }
    if (name == "req") {
        return marker_kind::req;
    }
    if (name == "request_path") {
        return marker_kind::request_path;
    }
    return marker_kind::unknown;
}

std::optional<std::string_view> shorthand_method(std::string_view name) noexcept {
    for (const auto& [marker, method] : shorthand_table) {
        if (marker == name) {
            return method;
        }
    }
    return std::nullopt;
}

std::string_view marker_kind_name(marker_kind kind) noexcept {
    switch (kind) {
    case marker_kind::controller:
        return "controller";
    case marker_kind::endpoint:
        return "endpoint";
    case marker_kind::custom_endpoint:
        return "custom_endpoint";
    case marker_kind::method_shorthand:
        return "method_shorthand";
    case marker_kind::route_builder:
        return "route_builder";
    case marker_kind::path_param:
        return "path_param";
    case marker_kind::query_param:
        return "query_param";
    case marker_kind::body:
        return "body";
    case marker_kind::query_content:
        return "query_content";
    case marker_kind::auth:
        return "auth";
    case marker_kind::req:
        return "req";
    case marker_kind::request_path:
        return "request_path";
    case marker_kind::unknown:
        return "unknown";
    }
    return "unknown";
}

bool is_route_marker(marker_kind kind) noexcept {
    switch (kind) {
    case marker_kind::endpoint:
    case marker_kind::custom_endpoint:
    case marker_kind::method_shorthand:
    case marker_kind::route_builder:
        return true;
    default:
        return false;
    }
}

bool is_source_marker(marker_kind kind) noexcept {
    switch (kind) {
    case marker_kind::path_param:
    case marker_kind::query_param:
    case marker_kind::body:
    case marker_kind::query_content:
    case marker_kind::auth:
    case marker_kind::req:
    case marker_kind::request_path:
        return true;
    default:
        return false;
    }
}

std::span<const parsing_rule> rules_for(marker_kind kind) {
    switch (kind) {
    case marker_kind::controller:
        return controller_rules();
    case marker_kind::endpoint:
    case marker_kind::custom_endpoint:
        return endpoint_rules();
    case marker_kind::method_shorthand:
        return shorthand_rules();
    case marker_kind::route_builder:
        return route_builder_rules();
    case marker_kind::path_param:
    case marker_kind::query_param:
        return keyed_rules();
    case marker_kind::req:
    case marker_kind::request_path:
        return key_path_rules();
    default:
        return {};
    }
}

} // namespace tsuba

#include "tsuba/core/parameter_source.hpp"

#include "tsuba/core/argument_matcher.hpp"
#include "tsuba/core/markers.hpp"

#include <optional>

namespace tsuba {

namespace {

template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};

std::string quoted(std::string_view name) {
    std::string out;
    out.reserve(name.size() + 2);
    out += '"';
    out += name;
    out += '"';
    return out;
}

std::string describe_parameter(const parameter_decl& param) {
    return param.name ? "parameter '" + *param.name + "'" : "unnamed parameter";
}

diagnostic unnamed_key(const parameter_decl& param, std::string_view marker) {
    return make_diagnostic(diagnostic_id::unnamed_parameter_key,
                           param.where,
                           "unnamed parameter of type '" + param.type +
                               "' needs an explicit key; name the parameter or write tsuba::" +
                               std::string(marker) +
                               "(name: \"...\")");
}

} // namespace

std::string_view source_name(const parameter_source& source) noexcept {
    return std::visit(overloaded{
                          [](const path_param_source&) -> std::string_view { return "path_param"; },
                          [](const body_source&) -> std::string_view { return "body"; },
                          [](const query_param_source&) -> std::string_view {
                              return "query_param";
                          },
                          [](const query_content_source&) -> std::string_view {
                              return "query_content";
                          },
                          [](const auth_source&) -> std::string_view { return "auth"; },
                          [](const request_field_source&) -> std::string_view {
                              return "request_field";
                          },
                          [](const raw_request_source&) -> std::string_view {
                              return "raw_request";
                          },
                      },
                      source);
}

bool is_fallible(const parameter_source& source) noexcept {
    return !std::holds_alternative<request_field_source>(source) &&
           !std::holds_alternative<raw_request_source>(source);
}

diagnosed<classified_parameter> classify_parameter(const parameter_decl& param) {
    classified_parameter out;
    std::vector<const attribute*> sources;

    for (const auto& attr : param.attributes) {
        if (!attr.is_marker()) {
            continue;
        }
        auto kind = classify_marker(attr);
        if (is_source_marker(kind)) {
            sources.push_back(&attr);
            continue;
        }
        if (kind == marker_kind::unknown) {
            out.warnings.push_back(make_diagnostic(diagnostic_id::unknown_marker,
                                                   attr.where,
                                                   "unknown marker '" + attr.spelling() +
                                                       "' is ignored"));
            continue;
        }
        return std::unexpected(make_diagnostic(diagnostic_id::attach_target,
                                               attr.where,
                                               "'" + attr.spelling() +
                                                   "' cannot be attached to a parameter"));
    }

    if (sources.size() > 1) {
        std::string names;
        for (const auto* attr : sources) {
            if (!names.empty()) {
                names += ", ";
            }
            names += "'" + attr->spelling() + "'";
        }
        return std::unexpected(make_diagnostic(diagnostic_id::multiple_source_markers,
                                               sources[1]->where,
                                               describe_parameter(param) +
                                                   " should have only one request source, found " +
                                                   names));
    }

    if (sources.empty()) {
        if (!param.name) {
            return std::unexpected(unnamed_key(param, "path_param"));
        }
        out.source = path_param_source{quoted(*param.name)};
        return out;
    }

    const attribute& marker = *sources.front();
    auto kind = classify_marker(marker);
    auto buckets = match_arguments(rules_for(kind), marker.arguments);
    if (!buckets) {
        return std::unexpected(to_diagnostic(buckets.error(), marker));
    }

    auto first_argument = [&]() -> std::optional<std::string> {
        if (buckets->empty() || buckets->front().empty()) {
            return std::nullopt;
        }
        return buckets->front().front().expression;
    };

    auto key = [&]() -> diagnosed<std::string> {
        if (auto explicit_key = first_argument()) {
            return *explicit_key;
        }
        if (!param.name) {
            return std::unexpected(unnamed_key(param, marker.name));
        }
        return quoted(*param.name);
    };

    switch (kind) {
    case marker_kind::path_param: {
        auto k = key();
        if (!k) {
            return std::unexpected(k.error());
        }
        out.source = path_param_source{std::move(*k)};
        break;
    }
    case marker_kind::query_param: {
        auto k = key();
        if (!k) {
            return std::unexpected(k.error());
        }
        out.source = query_param_source{std::move(*k)};
        break;
    }
    case marker_kind::body:
        out.source = body_source{};
        break;
    case marker_kind::query_content:
        out.source = query_content_source{};
        break;
    case marker_kind::auth:
        out.source = auth_source{};
        break;
    case marker_kind::req:
        out.source =
            request_field_source{first_argument().value_or(std::string(identity_key_path))};
        break;
    case marker_kind::request_path: {
        out.source =
            raw_request_source{first_argument().value_or(std::string(identity_key_path))};
        auto warning = make_diagnostic(diagnostic_id::deprecated_marker,
                                       marker.where,
                                       "'" + marker.spelling() + "' is deprecated, use 'req'");
        warning.fixits.push_back({"rename the marker to 'req'", marker.name_where, "req"});
        out.warnings.push_back(std::move(warning));
        break;
    }
    default:
        break;
    }
    return out;
}

} // namespace tsuba

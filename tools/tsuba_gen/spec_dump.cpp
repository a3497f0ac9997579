#include "generator.hpp"

#include <sstream>
#include <string>
#include <variant>

namespace tsuba_gen {

namespace {

template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};

std::string quoted(std::string_view sv) {
    return "\"" + escape_json(sv) + "\"";
}

std::string string_array(const std::vector<std::string>& items) {
    std::string out = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += ",";
        }
        out += tsuba_gen::quoted(items[i]);
    }
    out += "]";
    return out;
}

template <typename T> std::string optional_string(const std::optional<T>& value) {
    return value ? tsuba_gen::quoted(*value) : std::string("null");
}

// Key or key path of a source; empty for body-like sources.
std::string source_argument(const tsuba::parameter_source& source) {
    return std::visit(overloaded{
                          [](const tsuba::path_param_source& s) { return s.key; },
                          [](const tsuba::query_param_source& s) { return s.key; },
                          [](const tsuba::request_field_source& s) { return s.path; },
                          [](const tsuba::raw_request_source& s) { return s.path; },
                          [](const auto&) { return std::string(); },
                      },
                      source);
}

std::string_view kind_name(tsuba::endpoint_kind kind) {
    switch (kind) {
    case tsuba::endpoint_kind::plain:
        return "plain";
    case tsuba::endpoint_kind::method_shorthand:
        return "method_shorthand";
    case tsuba::endpoint_kind::custom_request:
        return "custom_request";
    }
    return "plain";
}

void dump_endpoint(std::ostringstream& os, const tsuba::endpoint_spec& ep) {
    os << "{";
    os << "\"handler\":" << tsuba_gen::quoted(ep.handler_name) << ",";
    os << "\"adapter\":" << tsuba_gen::quoted(ep.adapter_name) << ",";
    os << "\"kind\":" << tsuba_gen::quoted(kind_name(ep.kind)) << ",";
    os << "\"method\":" << tsuba_gen::quoted(ep.http_method) << ",";
    os << "\"path\":" << string_array(ep.path_segments) << ",";
    os << "\"middleware\":" << string_array(ep.middleware) << ",";
    os << "\"body\":" << tsuba_gen::quoted(ep.body_policy) << ",";
    os << "\"return_type\":" << tsuba_gen::quoted(ep.return_type) << ",";
    os << "\"async\":" << (ep.effects.is_async ? "true" : "false") << ",";
    os << "\"throws\":" << (ep.effects.can_throw ? "true" : "false") << ",";
    os << "\"parameters\":[";
    bool first = true;
    for (const auto& plan : ep.parameter_plans) {
        if (!first) {
            os << ",";
        }
        first = false;
        os << "{";
        os << "\"binding\":" << tsuba_gen::quoted(plan.binding_name) << ",";
        os << "\"label\":" << optional_string(plan.call_label) << ",";
        os << "\"source\":" << tsuba_gen::quoted(tsuba::source_name(plan.source)) << ",";
        os << "\"key\":" << tsuba_gen::quoted(source_argument(plan.source)) << ",";
        os << "\"type\":" << tsuba_gen::quoted(plan.declared_type) << ",";
        os << "\"value_type\":" << tsuba_gen::quoted(plan.value_type) << ",";
        os << "\"optional\":" << (plan.is_optional ? "true" : "false") << ",";
        os << "\"default\":" << optional_string(plan.default_value);
        os << "}";
    }
    os << "]";
    os << "}";
}

void dump_route_builder(std::ostringstream& os, const tsuba::route_builder_spec& rb) {
    os << "{";
    os << "\"name\":" << tsuba_gen::quoted(rb.name) << ",";
    os << "\"label\":" << optional_string(rb.param_label) << ",";
    os << "\"grouping\":"
       << std::visit(overloaded{
                         [](const tsuba::known_flag& f) {
                             return std::string(f.value ? "true" : "false");
                         },
                         [](const tsuba::deferred_flag& f) {
                             return "{\"deferred\":" + tsuba_gen::quoted(f.expression) + "}";
                         },
                     },
                     rb.uses_global_grouping)
       << ",";
    os << "\"throws\":" << (rb.can_throw ? "true" : "false");
    os << "}";
}

void dump_diagnostic(std::ostringstream& os, const tsuba::diagnostic& d) {
    os << "{";
    os << "\"severity\":" << tsuba_gen::quoted(tsuba::severity_to_string(d.level)) << ",";
    os << "\"domain\":" << tsuba_gen::quoted(tsuba::diagnostic_domain(d.id)) << ",";
    os << "\"id\":" << tsuba_gen::quoted(tsuba::diagnostic_name(d.id)) << ",";
    os << "\"line\":" << d.where.begin.line << ",";
    os << "\"column\":" << d.where.begin.column << ",";
    os << "\"message\":" << tsuba_gen::quoted(d.message);
    os << "}";
}

} // namespace

std::string dump_spec_summary(const tsuba::generation_report& report,
                              const std::vector<tsuba::diagnostic>& parse_diagnostics,
                              std::string_view source) {
    std::ostringstream os;
    os << "{";
    os << "\"source\":" << tsuba_gen::quoted(source) << ",";
    os << "\"controllers\":[";
    bool first_controller = true;
    for (const auto& c : report.controllers) {
        if (!first_controller) {
            os << ",";
        }
        first_controller = false;
        os << "{";
        os << "\"class\":" << tsuba_gen::quoted(c.qualified_name) << ",";
        os << "\"global_path\":" << string_array(c.global_path_segments) << ",";
        os << "\"global_middleware\":" << string_array(c.global_middleware) << ",";
        os << "\"endpoints\":[";
        for (size_t i = 0; i < c.endpoints.size(); ++i) {
            if (i > 0) {
                os << ",";
            }
            dump_endpoint(os, c.endpoints[i]);
        }
        os << "],";
        os << "\"route_builders\":[";
        for (size_t i = 0; i < c.route_builders.size(); ++i) {
            if (i > 0) {
                os << ",";
            }
            dump_route_builder(os, c.route_builders[i]);
        }
        os << "]";
        os << "}";
    }
    os << "],";
    os << "\"diagnostics\":[";
    bool first_diag = true;
    for (const auto* list : {&parse_diagnostics, &report.diagnostics}) {
        for (const auto& d : *list) {
            if (!first_diag) {
                os << ",";
            }
            first_diag = false;
            dump_diagnostic(os, d);
        }
    }
    os << "]";
    os << "}";
    return os.str();
}

} // namespace tsuba_gen

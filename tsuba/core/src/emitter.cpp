#include "tsuba/core/emitter.hpp"

#include <algorithm>
#include <sstream>

namespace tsuba {

namespace {

template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};

std::string join(const std::vector<std::string>& items, std::string_view sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += sep;
        }
        out += items[i];
    }
    return out;
}

std::string indent(std::string_view text, size_t spaces) {
    std::string pad(spaces, ' ');
    std::string out;
    size_t start = 0;
    while (start <= text.size()) {
        auto end = text.find('\n', start);
        auto line = text.substr(start, end == std::string_view::npos ? end : end - start);
        if (!line.empty()) {
            out += pad;
            out += line;
        }
        if (end == std::string_view::npos) {
            break;
        }
        out += '\n';
        start = end + 1;
    }
    return out;
}

bool adapter_is_noexcept(const endpoint_spec& spec) {
    if (spec.effects.can_throw) {
        return false;
    }
    return std::none_of(spec.parameter_plans.begin(),
                        spec.parameter_plans.end(),
                        [](const parameter_plan& p) { return is_fallible(p.source); });
}

std::string lambda_head(const endpoint_spec& spec) {
    std::string head = "[this](";
    if (!spec.is_custom_request_handler && spec.parameter_plans.empty()) {
        head += "[[maybe_unused]] ";
    }
    head += "auto& ";
    head += request_binding;
    head += ")";
    if (adapter_is_noexcept(spec)) {
        head += " noexcept";
    }
    head += " -> ";
    head += spec.return_type;
    return head;
}

bool route_builder_uses_grouped(const route_builder_spec& rb) {
    return std::visit(overloaded{
                          [](const known_flag& f) { return f.value; },
                          [](const deferred_flag&) { return true; },
                      },
                      rb.uses_global_grouping);
}

} // namespace

std::string emit_handler_call(const endpoint_spec& spec) {
    std::vector<std::string> args;
    args.reserve(spec.parameter_plans.size());
    for (const auto& plan : spec.parameter_plans) {
        args.push_back(forwarding_argument(plan));
    }
    return "this->" + spec.handler_name + "(" + join(args, ", ") + ")";
}

std::string emit_adapter(const endpoint_spec& spec) {
    std::ostringstream out;
    if (spec.is_custom_request_handler) {
        out << lambda_head(spec) << " { return this->" << spec.handler_name << "(";
        if (spec.custom_param_label) {
            out << "/*" << *spec.custom_param_label << "=*/";
        }
        out << request_binding << "); }";
        return out.str();
    }

    out << "auto " << spec.adapter_name << " = " << lambda_head(spec) << " {\n";
    for (const auto& plan : spec.parameter_plans) {
        out << "    " << extraction_statement(plan) << "\n";
    }
    out << "    " << (spec.effects.is_async ? "co_return co_await " : "return ")
        << emit_handler_call(spec) << ";\n";
    out << "};";
    return out.str();
}

std::string emit_registration(const endpoint_spec& spec, std::string_view surface) {
    std::ostringstream out;
    out << surface;
    if (!spec.middleware.empty()) {
        out << ".with_middleware(" << join(spec.middleware, ", ") << ")";
    }
    out << ".on(" << spec.http_method << ", {" << join(spec.path_segments, ", ") << "}, "
        << spec.body_policy << ", "
        << (spec.is_custom_request_handler ? spec.adapter_body : spec.adapter_name) << ");";
    return out.str();
}

std::string emit_route_builder_call(const route_builder_spec& spec, bool has_global_grouping) {
    auto call = [&](std::string_view surface) {
        std::string out = "this->" + spec.name + "(";
        if (spec.param_label) {
            out += "/*" + *spec.param_label + "=*/";
        }
        out += surface;
        out += ");";
        return out;
    };

    if (!has_global_grouping) {
        return call(routes_binding);
    }
    return std::visit(overloaded{
                          [&](const known_flag& f) {
                              return call(f.value ? grouped_routes_binding : routes_binding);
                          },
                          [&](const deferred_flag& f) {
                              std::ostringstream out;
                              out << "if (" << f.expression << ") {\n"
                                  << "    " << call(grouped_routes_binding) << "\n"
                                  << "} else {\n"
                                  << "    " << call(routes_binding) << "\n"
                                  << "}";
                              return out.str();
                          },
                      },
                      spec.uses_global_grouping);
}

std::string emit_group_declaration(const controller_spec& spec) {
    if (!spec.has_global_grouping()) {
        return {};
    }
    std::ostringstream out;
    out << "auto " << grouped_routes_binding << " = " << routes_binding;
    if (!spec.global_path_segments.empty()) {
        out << ".grouped({" << join(spec.global_path_segments, ", ") << "})";
    }
    if (!spec.global_middleware.empty()) {
        out << ".with_middleware(" << join(spec.global_middleware, ", ") << ")";
    }
    out << ";";
    return out.str();
}

std::string emit_boot_definition(const controller_spec& spec) {
    const bool grouped = spec.has_global_grouping();
    std::string_view surface = grouped ? grouped_routes_binding : routes_binding;

    std::ostringstream out;
    out << "template <typename Routes> void " << spec.class_path << "::boot(Routes& "
        << routes_binding << ") {\n";
    out << "    using namespace ::tsuba::vocabulary;\n";
    if (grouped) {
        out << "    " << emit_group_declaration(spec) << "\n";
    }

    for (const auto& ep : spec.endpoints) {
        if (!ep.is_custom_request_handler) {
            out << indent(ep.adapter_body, 4) << "\n";
        }
    }
    for (const auto& ep : spec.endpoints) {
        if (!ep.is_custom_request_handler) {
            out << "    " << emit_registration(ep, surface) << "\n";
        }
    }
    for (const auto& ep : spec.endpoints) {
        if (ep.is_custom_request_handler) {
            out << "    " << emit_registration(ep, surface) << "\n";
        }
    }
    for (const auto& rb : spec.route_builders) {
        out << indent(emit_route_builder_call(rb, grouped), 4) << "\n";
    }

    if (spec.endpoints.empty() && spec.route_builders.empty()) {
        out << "    static_cast<void>(" << surface << ");\n";
    } else if (grouped && spec.endpoints.empty() &&
               std::none_of(spec.route_builders.begin(),
                            spec.route_builders.end(),
                            route_builder_uses_grouped)) {
        out << "    static_cast<void>(" << grouped_routes_binding << ");\n";
    }
    out << "}\n";
    return out.str();
}

std::string emit_routes_header(const std::vector<controller_spec>& controllers,
                               const header_context& ctx) {
    std::ostringstream out;
    out << "// Generated by tsuba_gen";
    if (!ctx.source_name.empty()) {
        out << " from " << ctx.source_name;
    }
    out << ". Do not edit.\n";
    out << "#pragma once\n\n";
    if (!ctx.include_spelling.empty()) {
        const auto& inc = ctx.include_spelling;
        if (inc.front() == '<' || inc.front() == '"') {
            out << "#include " << inc << "\n\n";
        } else {
            out << "#include \"" << inc << "\"\n\n";
        }
    }
    out << "#include \"tsuba/runtime/routing.hpp\"\n\n";
    out << "#include <functional>\n";
    out << "#include <optional>\n";
    out << "#include <utility>\n";

    for (const auto& controller : controllers) {
        out << "\n";
        for (const auto& ns : controller.namespaces) {
            out << (ns.empty() ? std::string("namespace {") : "namespace " + ns + " {") << "\n";
        }
        if (!controller.namespaces.empty()) {
            out << "\n";
        }
        out << emit_boot_definition(controller);
        if (!controller.namespaces.empty()) {
            out << "\n";
        }
        for (auto it = controller.namespaces.rbegin(); it != controller.namespaces.rend(); ++it) {
            out << "} // namespace" << (it->empty() ? std::string() : " " + *it) << "\n";
        }
    }
    return out.str();
}

} // namespace tsuba

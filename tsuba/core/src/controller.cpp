#include "tsuba/core/controller.hpp"

#include "tsuba/core/markers.hpp"

#include <algorithm>

namespace tsuba {

namespace {

std::string_view target_name(member_kind kind) {
    switch (kind) {
    case member_kind::data:
        return "data member";
    case member_kind::type:
        return "type";
    case member_kind::free_function:
        return "free function";
    case member_kind::other:
        return "declaration";
    }
    return "declaration";
}

diagnostic misplaced(const attribute& marker, std::string what) {
    return make_diagnostic(diagnostic_id::attach_target,
                           marker.where,
                           "'" + marker.spelling() + "' cannot be attached to " + what);
}

diagnostic unknown_marker(const attribute& marker) {
    return make_diagnostic(diagnostic_id::unknown_marker,
                           marker.where,
                           "unknown marker '" + marker.spelling() + "' is ignored");
}

std::vector<std::string> expressions(const argument_bucket& bucket) {
    std::vector<std::string> out;
    for (const auto& arg : bucket) {
        out.push_back(arg.expression);
    }
    return out;
}

void check_other(const other_decl& decl, std::vector<diagnostic>& out) {
    for (const auto& attr : decl.attributes) {
        if (!attr.is_marker()) {
            continue;
        }
        if (classify_marker(attr) == marker_kind::unknown) {
            out.push_back(unknown_marker(attr));
            continue;
        }
        std::string what(target_name(decl.kind));
        if (!decl.name.empty()) {
            what += " '" + decl.name + "'";
        }
        out.push_back(misplaced(attr, what));
    }
}

// Classes without a controller marker generate nothing, but markers on their member
// functions are still checked.
void check_unmarked(const class_decl& cls, std::vector<diagnostic>& out) {
    for (const auto& fn : cls.functions) {
        for (const auto& attr : fn.attributes) {
            if (!attr.is_marker()) {
                continue;
            }
            auto kind = classify_marker(attr);
            if (kind == marker_kind::unknown) {
                out.push_back(unknown_marker(attr));
            } else if (is_route_marker(kind) && fn.is_static) {
                out.push_back(make_diagnostic(diagnostic_id::attach_target,
                                              attr.where,
                                              "'" + attr.spelling() +
                                                  "' can only be attached to non-static member "
                                                  "functions, '" + fn.name + "' is static"));
            } else if (is_route_marker(kind)) {
                out.push_back(misplaced(attr,
                                        "member function '" + fn.name + "' of class '" +
                                            cls.name + "', which is not a tsuba::controller"));
            } else {
                out.push_back(misplaced(attr, "member function '" + fn.name + "'"));
            }
        }
    }
}

} // namespace

controller_result assemble_controller(const class_decl& cls,
                                      const generation_options& opts,
                                      adapter_namer& namer) {
    controller_result res;
    auto& diags = res.diagnostics;

    const attribute* controller_marker = nullptr;
    for (const auto& attr : cls.attributes) {
        if (!attr.is_marker()) {
            continue;
        }
        auto kind = classify_marker(attr);
        if (kind == marker_kind::controller) {
            if (controller_marker) {
                diags.push_back(make_diagnostic(diagnostic_id::multiple_route_markers,
                                                attr.where,
                                                "class '" + cls.name +
                                                    "' is marked as a controller more than once"));
                continue;
            }
            controller_marker = &attr;
        } else if (kind == marker_kind::unknown) {
            diags.push_back(unknown_marker(attr));
        } else {
            diags.push_back(misplaced(attr, "class '" + cls.name + "'"));
        }
    }
    if (!controller_marker) {
        check_unmarked(cls, diags);
        for (const auto& other : cls.other_members) {
            check_other(other, diags);
        }
        return res;
    }

    if (cls.is_template) {
        diags.push_back(make_diagnostic(diagnostic_id::controller_template,
                                        controller_marker->where,
                                        "controller '" + cls.name +
                                            "' cannot be a class template"));
        return res;
    }

    auto buckets =
        match_arguments(rules_for(marker_kind::controller), controller_marker->arguments);
    if (!buckets) {
        diags.push_back(to_diagnostic(buckets.error(), *controller_marker));
        return res;
    }

    controller_spec spec;
    spec.class_path = cls.class_path();
    spec.qualified_name = cls.qualified_name();
    spec.namespaces = cls.namespaces;
    spec.global_path_segments = expressions((*buckets)[0]);
    spec.global_middleware = expressions((*buckets)[1]);
    spec.where = cls.where;

    if (!cls.declares_boot) {
        auto d = make_diagnostic(diagnostic_id::missing_boot_declaration,
                                 cls.where,
                                 "controller '" + cls.name +
                                     "' does not declare boot(); the generated definition "
                                     "will not compile");
        d.fixits.push_back({"add 'TSUBA_CONTROLLER();' to the class body",
                            cls.body_start,
                            "TSUBA_CONTROLLER();"});
        diags.push_back(std::move(d));
    }

    for (const auto& fn : cls.functions) {
        std::vector<const attribute*> route_markers;
        for (const auto& attr : fn.attributes) {
            if (!attr.is_marker()) {
                continue;
            }
            auto kind = classify_marker(attr);
            if (is_route_marker(kind)) {
                route_markers.push_back(&attr);
            } else if (kind == marker_kind::unknown) {
                diags.push_back(unknown_marker(attr));
            } else {
                diags.push_back(misplaced(attr, "member function '" + fn.name + "'"));
            }
        }
        if (route_markers.empty()) {
            continue;
        }
        if (route_markers.size() > 1) {
            diags.push_back(make_diagnostic(diagnostic_id::multiple_route_markers,
                                            route_markers[1]->where,
                                            "member function '" + fn.name +
                                                "' carries more than one route marker"));
            continue;
        }

        const attribute& marker = *route_markers.front();
        if (classify_marker(marker) == marker_kind::route_builder) {
            auto builder = build_route_builder(fn, marker, opts);
            if (!builder) {
                diags.push_back(std::move(builder.error()));
                continue;
            }
            spec.route_builders.push_back(std::move(*builder));
            continue;
        }

        endpoint_builder builder(fn, marker, opts, namer);
        auto endpoint = builder.build();
        if (!endpoint) {
            diags.push_back(std::move(endpoint.error()));
            continue;
        }
        for (const auto& w : endpoint->warnings) {
            diags.push_back(w);
        }
        spec.endpoints.push_back(std::move(*endpoint));
    }

    for (const auto& other : cls.other_members) {
        check_other(other, diags);
    }

    res.spec = std::move(spec);
    return res;
}

size_t generation_report::error_count() const noexcept {
    return static_cast<size_t>(std::count_if(
        diagnostics.begin(), diagnostics.end(), [](const diagnostic& d) { return d.is_error(); }));
}

size_t generation_report::warning_count() const noexcept {
    return static_cast<size_t>(
        std::count_if(diagnostics.begin(), diagnostics.end(), [](const diagnostic& d) {
            return d.level == severity::warning;
        }));
}

generation_report compile_routes(const translation_unit& unit, const generation_options& opts) {
    generation_report report;
    adapter_namer namer;

    for (const auto& cls : unit.classes) {
        auto res = assemble_controller(cls, opts, namer);
        for (auto& d : res.diagnostics) {
            report.diagnostics.push_back(std::move(d));
        }
        if (res.spec) {
            report.controllers.push_back(std::move(*res.spec));
        }
    }

    for (const auto& decl : unit.free_declarations) {
        check_other(decl, report.diagnostics);
    }
    return report;
}

} // namespace tsuba

#include "tsuba/core/endpoint.hpp"

#include "tsuba/core/emitter.hpp"
#include "tsuba/core/header_parser.hpp"

#include <algorithm>

namespace tsuba {

namespace {

std::string quoted(std::string_view name) {
    return "\"" + std::string(name) + "\"";
}

// Defaults are spelled fully qualified so controller members named `get` or `collect` cannot
// shadow them inside boot().
std::string vocabulary_name(std::string_view name) {
    return "::tsuba::vocabulary::" + std::string(name);
}

std::vector<std::string> expressions(const argument_bucket& bucket) {
    std::vector<std::string> out;
    out.reserve(bucket.size());
    for (const auto& arg : bucket) {
        out.push_back(arg.expression);
    }
    return out;
}

std::string adapter_return_type(std::string_view declared) {
    std::string type = strip_cv_ref(declared) == "auto" && declared.find('&') == std::string::npos
                           ? std::string("decltype(auto)")
                           : std::string(declared);
    return type.empty() ? std::string("decltype(auto)") : type;
}

diagnostic static_target(const function_decl& fn, const attribute& marker) {
    return make_diagnostic(diagnostic_id::attach_target,
                           marker.where,
                           "'" + marker.spelling() +
                               "' can only be attached to non-static member functions, '" +
                               fn.name + "' is static");
}

} // namespace

grouping_flag resolve_grouping_flag(std::string_view expression) {
    if (expression == "true") {
        return known_flag{true};
    }
    if (expression == "false") {
        return known_flag{false};
    }
    return deferred_flag{std::string(expression)};
}

std::string adapter_namer::allocate(std::string_view handler_name) {
    std::string base = "tsuba_adapter_" + std::string(handler_name);
    std::string candidate = base;
    for (size_t n = 1; used_.contains(candidate); ++n) {
        candidate = base + "_" + std::to_string(n);
    }
    used_.insert(candidate);
    return candidate;
}

bool is_async_return(std::string_view return_type, const generation_options& opts) {
    if (return_type.find('<') == std::string_view::npos) {
        return false;
    }
    auto name = base_type_name(return_type);
    return std::find(opts.async_types.begin(), opts.async_types.end(), name) !=
           opts.async_types.end();
}

std::string_view build_stage_name(build_stage stage) noexcept {
    switch (stage) {
    case build_stage::unparsed:
        return "unparsed";
    case build_stage::rules_matched:
        return "rules_matched";
    case build_stage::parameters_classified:
        return "parameters_classified";
    case build_stage::adapter_synthesized:
        return "adapter_synthesized";
    case build_stage::failed:
        return "failed";
    }
    return "failed";
}

endpoint_builder::endpoint_builder(const function_decl& fn,
                                   const attribute& marker,
                                   const generation_options& opts,
                                   adapter_namer& namer)
    : fn_(fn), marker_(marker), opts_(opts), namer_(namer), kind_(classify_marker(marker)) {}

diagnosed<endpoint_spec> endpoint_builder::build() {
    if (stage_ == build_stage::unparsed) {
        if (match_rules() && classify_parameters()) {
            synthesize_adapter();
        }
    }
    if (stage_ == build_stage::failed) {
        return std::unexpected(*failure_);
    }
    return spec_;
}

bool endpoint_builder::fail(diagnostic d) {
    failure_ = std::move(d);
    stage_ = build_stage::failed;
    return false;
}

bool endpoint_builder::match_rules() {
    if (fn_.is_static) {
        return fail(static_target(fn_, marker_));
    }

    auto buckets = match_arguments(rules_for(kind_), marker_.arguments);
    if (!buckets) {
        return fail(to_diagnostic(buckets.error(), marker_));
    }

    spec_.handler_name = fn_.name;
    spec_.where = fn_.name_range;

    if (kind_ == marker_kind::method_shorthand) {
        spec_.kind = endpoint_kind::method_shorthand;
        spec_.http_method = vocabulary_name(shorthand_method(marker_.name).value_or("get"));
        spec_.path_segments = expressions((*buckets)[0]);
        spec_.middleware = expressions((*buckets)[1]);
        spec_.body_policy = vocabulary_name("collect");
    } else {
        spec_.kind = kind_ == marker_kind::custom_endpoint ? endpoint_kind::custom_request
                                                           : endpoint_kind::plain;
        const auto& method = (*buckets)[0];
        const auto& body = (*buckets)[3];
        spec_.http_method = method.empty() ? vocabulary_name("get") : method.front().expression;
        spec_.path_segments = expressions((*buckets)[1]);
        spec_.middleware = expressions((*buckets)[2]);
        spec_.body_policy = body.empty() ? vocabulary_name("collect") : body.front().expression;
    }

    if (spec_.path_segments.empty()) {
        spec_.path_segments.push_back(tsuba::quoted(fn_.name));
    }
    spec_.is_custom_request_handler = spec_.kind == endpoint_kind::custom_request;
    stage_ = build_stage::rules_matched;
    return true;
}

bool endpoint_builder::classify_parameters() {
    if (spec_.is_custom_request_handler) {
        if (fn_.parameters.size() != 1 ||
            base_type_name(fn_.parameters.front().type) != opts_.request_type) {
            auto d = make_diagnostic(diagnostic_id::custom_endpoint_signature,
                                     fn_.parameters_range,
                                     "a custom endpoint handler should receive one and only one "
                                     "parameter of type '" +
                                         opts_.request_type + "'");
            std::string replacement = "(" + opts_.request_type + "& req)";
            d.fixits.push_back({"replace with " + replacement, fn_.parameters_range, replacement});
            return fail(std::move(d));
        }
        spec_.custom_param_label = fn_.parameters.front().name;
        stage_ = build_stage::parameters_classified;
        return true;
    }

    binding_names names;
    for (size_t i = 0; i < fn_.parameters.size(); ++i) {
        auto plan = plan_parameter(fn_.parameters[i], i, names, spec_.warnings);
        if (!plan) {
            return fail(plan.error());
        }
        spec_.parameter_plans.push_back(std::move(*plan));
    }
    stage_ = build_stage::parameters_classified;
    return true;
}

bool endpoint_builder::synthesize_adapter() {
    spec_.effects.is_async = is_async_return(fn_.return_type, opts_);
    spec_.effects.can_throw = !fn_.is_noexcept;
    spec_.return_type = adapter_return_type(fn_.return_type);

    if (!spec_.is_custom_request_handler) {
        spec_.adapter_name = namer_.allocate(fn_.name);
    }
    spec_.adapter_body = emit_adapter(spec_);
    stage_ = build_stage::adapter_synthesized;
    return true;
}

diagnosed<route_builder_spec> build_route_builder(const function_decl& fn,
                                                  const attribute& marker,
                                                  const generation_options& opts) {
    if (fn.is_static) {
        return std::unexpected(static_target(fn, marker));
    }

    auto buckets = match_arguments(rules_for(marker_kind::route_builder), marker.arguments);
    if (!buckets) {
        return std::unexpected(to_diagnostic(buckets.error(), marker));
    }

    if (fn.parameters.size() != 1 ||
        base_type_name(fn.parameters.front().type) != opts.routes_type) {
        auto d = make_diagnostic(diagnostic_id::route_builder_signature,
                                 fn.parameters_range,
                                 "a custom route builder should receive one and only one "
                                 "parameter of type '" +
                                     opts.routes_type + "'");
        std::string replacement = "(" + opts.routes_type + "& routes)";
        d.fixits.push_back({"replace with " + replacement, fn.parameters_range, replacement});
        return std::unexpected(std::move(d));
    }

    if (is_async_return(fn.return_type, opts)) {
        auto d = make_diagnostic(diagnostic_id::unexpected_async,
                                 fn.return_type_range,
                                 "a custom route builder cannot be asynchronous since boot() "
                                 "registers routes synchronously");
        d.fixits.push_back({"return void instead of '" + fn.return_type + "'",
                            fn.return_type_range,
                            "void"});
        return std::unexpected(std::move(d));
    }

    route_builder_spec spec;
    spec.name = fn.name;
    spec.param_label = fn.parameters.front().name;
    const auto& flag = (*buckets)[0];
    spec.uses_global_grouping =
        flag.empty() ? grouping_flag{known_flag{false}}
                     : resolve_grouping_flag(flag.front().expression);
    spec.can_throw = !fn.is_noexcept;
    spec.where = fn.name_range;
    return spec;
}

} // namespace tsuba

#include "tsuba/core/extraction.hpp"

#include "tsuba/core/header_parser.hpp"

#include <array>

namespace tsuba {

namespace {

template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};

std::string_view trim(std::string_view s) {
    while (!s.empty() && s.front() == ' ') {
        s.remove_prefix(1);
    }
    while (!s.empty() && s.back() == ' ') {
        s.remove_suffix(1);
    }
    return s;
}

bool is_required(const parameter_plan& plan) {
    return !plan.is_optional && !plan.default_value;
}

bool is_braced(std::string_view expr) {
    expr = trim(expr);
    return expr.starts_with("{") && expr.ends_with("}");
}

std::string request_view(std::string_view view) {
    std::string out(request_binding);
    out += '.';
    out += view;
    out += "()";
    return out;
}

// Applies the declared default to a best-effort lookup that yields std::optional<T>.
std::string with_default(const std::string& best_effort, const parameter_plan& plan) {
    const std::string& value = *plan.default_value;
    if (plan.is_optional) {
        std::string fallback = "std::optional<" + plan.value_type + ">";
        fallback += is_braced(value) ? value : "(" + value + ")";
        return best_effort + ".or_else([&] { return " + fallback + "; })";
    }
    std::string fallback = is_braced(value) ? plan.value_type + value : value;
    return best_effort + ".value_or(" + fallback + ")";
}

std::string keyed_lookup(std::string_view view,
                         const std::string& key,
                         const parameter_plan& plan) {
    std::string base = request_view(view) + ".template ";
    if (is_required(plan)) {
        return base + "require<" + plan.value_type + ">(" + key + ")";
    }
    std::string lookup = base + "get<" + plan.value_type + ">(" + key + ")";
    return plan.default_value ? with_default(lookup, plan) : lookup;
}

std::string decoded(std::string_view view, const parameter_plan& plan) {
    std::string decode = request_view(view) + ".template decode<" + plan.value_type + ">()";
    if (is_required(plan)) {
        return decode;
    }
    std::string attempt = "::tsuba::attempt([&] { return " + decode + "; })";
    return plan.default_value ? with_default(attempt, plan) : attempt;
}

std::string principal(const parameter_plan& plan) {
    std::string base = request_view("auth") + ".template ";
    if (is_required(plan)) {
        return base + "require<" + plan.value_type + ">()";
    }
    std::string lookup = base + "get<" + plan.value_type + ">()";
    return plan.default_value ? with_default(lookup, plan) : lookup;
}

// Drops the spaces a declaration may carry around `::`, `<` and `>`, so that
// `std :: optional <int>` reads as `std::optional<int>`.
std::string compact_type(std::string_view type) {
    std::string out;
    for (size_t i = 0; i < type.size(); ++i) {
        char c = type[i];
        if (c != ' ') {
            out += c;
            continue;
        }
        size_t next = type.find_first_not_of(' ', i);
        bool before_punct = next != std::string_view::npos &&
                            std::string_view("<>:,").find(type[next]) != std::string_view::npos;
        bool after_punct = !out.empty() && (out.back() == '<' || out.back() == ':');
        if (!before_punct && !after_punct && !out.empty() && out.back() != ' ') {
            out += ' ';
        }
    }
    return out;
}

std::string projection(const std::string& path) {
    return "std::invoke(" + path + ", " + std::string(request_binding) + ")";
}

} // namespace

type_shape analyze_type(std::string_view declared_type) {
    type_shape shape;
    std::string stripped = strip_cv_ref(declared_type);
    std::string compact = compact_type(stripped);
    std::string_view s = compact;
    constexpr std::array<std::string_view, 3> optional_prefixes{
        "::std::optional<", "std::optional<", "optional<"};
    for (auto prefix : optional_prefixes) {
        if (s.starts_with(prefix) && s.ends_with(">")) {
            auto inner = s.substr(prefix.size(), s.size() - prefix.size() - 1);
            shape.value_type = strip_cv_ref(inner);
            shape.is_optional = true;
            return shape;
        }
    }
    shape.value_type = stripped;
    return shape;
}

std::string binding_names::claim(std::string preferred) {
    while (used_.contains(preferred)) {
        preferred += '_';
    }
    used_.insert(preferred);
    return preferred;
}

diagnosed<parameter_plan> plan_parameter(const parameter_decl& param,
                                         size_t index,
                                         binding_names& names,
                                         std::vector<diagnostic>& warnings) {
    auto classified = classify_parameter(param);
    if (!classified) {
        return std::unexpected(classified.error());
    }
    for (auto& w : classified->warnings) {
        warnings.push_back(std::move(w));
    }

    parameter_plan plan;
    plan.source = std::move(classified->source);
    plan.declared_type = param.type;
    auto shape = analyze_type(param.type);
    plan.value_type = std::move(shape.value_type);
    plan.is_optional = shape.is_optional;
    plan.default_value = param.default_value;
    plan.forward_as_rvalue = trim(param.type).ends_with("&&");

    if (param.name) {
        plan.binding_name = names.claim(*param.name);
        if (plan.binding_name != *param.name) {
            plan.call_label = *param.name;
        }
    } else {
        plan.binding_name = names.claim("arg" + std::to_string(index));
        plan.call_label = std::string(discard_label);
    }
    return plan;
}

std::string extraction_expression(const parameter_plan& plan) {
    return std::visit(
        overloaded{
            [&](const path_param_source& s) { return keyed_lookup("parameters", s.key, plan); },
            [&](const body_source&) { return decoded("content", plan); },
            [&](const query_param_source& s) { return keyed_lookup("query", s.key, plan); },
            [&](const query_content_source&) { return decoded("query", plan); },
            [&](const auth_source&) { return principal(plan); },
            [&](const request_field_source& s) { return projection(s.path); },
            [&](const raw_request_source& s) { return projection(s.path); },
        },
        plan.source);
}

std::string extraction_statement(const parameter_plan& plan) {
    std::string_view declarator = is_fallible(plan.source) ? "auto " : "auto&& ";
    std::string out(declarator);
    out += plan.binding_name;
    out += " = ";
    out += extraction_expression(plan);
    out += ';';
    return out;
}

std::string forwarding_argument(const parameter_plan& plan) {
    std::string value =
        plan.forward_as_rvalue ? "std::move(" + plan.binding_name + ")" : plan.binding_name;
    if (plan.call_label && *plan.call_label == discard_label) {
        return value;
    }
    const std::string& label = plan.call_label ? *plan.call_label : plan.binding_name;
    return "/*" + label + "=*/" + value;
}

} // namespace tsuba

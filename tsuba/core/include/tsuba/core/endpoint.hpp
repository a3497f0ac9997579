#pragma once

#include "argument_matcher.hpp"
#include "declaration.hpp"
#include "diagnostic.hpp"
#include "extraction.hpp"
#include "markers.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <variant>
#include <vector>

namespace tsuba {

struct generation_options {
    // Return type templates that make a handler asynchronous (matched on the unqualified name).
    std::vector<std::string> async_types{"task", "awaitable"};
    // Unqualified type a custom endpoint receives.
    std::string request_type = "request";
    // Unqualified type a route builder receives.
    std::string routes_type = "routes_builder";
};

enum class endpoint_kind : uint8_t { plain, method_shorthand, custom_request };

struct endpoint_effects {
    bool is_async = false;
    bool can_throw = true;
};

struct endpoint_spec {
    endpoint_kind kind{endpoint_kind::plain};
    std::string handler_name;
    std::string adapter_name;
    std::string http_method;
    std::vector<std::string> path_segments;
    std::vector<std::string> middleware;
    std::string body_policy;
    std::vector<parameter_plan> parameter_plans;
    std::string return_type; // as written on the adapter, deduced types become decltype(auto)
    endpoint_effects effects;
    std::string adapter_body;
    bool is_custom_request_handler = false;
    std::optional<std::string> custom_param_label;
    std::vector<diagnostic> warnings;
    source_range where{};
};

struct known_flag {
    bool value = false;
};

struct deferred_flag {
    std::string expression;
};

using grouping_flag = std::variant<known_flag, deferred_flag>;

struct route_builder_spec {
    std::string name;
    std::optional<std::string> param_label;
    grouping_flag uses_global_grouping{known_flag{false}};
    bool can_throw = true;
    source_range where{};
};

// "true"/"false" resolve now, anything else is evaluated by the generated code.
grouping_flag resolve_grouping_flag(std::string_view expression);

// Unique adapter identifiers within one generated header: tsuba_adapter_<handler>, then
// tsuba_adapter_<handler>_1, _2, ... for repeated handler names.
class adapter_namer {
public:
    std::string allocate(std::string_view handler_name);

private:
    std::unordered_set<std::string> used_;
};

[[nodiscard]] bool is_async_return(std::string_view return_type, const generation_options& opts);

enum class build_stage : uint8_t {
    unparsed,
    rules_matched,
    parameters_classified,
    adapter_synthesized,
    failed,
};

std::string_view build_stage_name(build_stage stage) noexcept;

// Resolves one endpoint marker on one member function.
// unparsed -> rules_matched -> parameters_classified -> adapter_synthesized, or failed.
class endpoint_builder {
public:
    endpoint_builder(const function_decl& fn,
                     const attribute& marker,
                     const generation_options& opts,
                     adapter_namer& namer);

    diagnosed<endpoint_spec> build();

    [[nodiscard]] build_stage stage() const noexcept { return stage_; }

private:
    bool match_rules();
    bool classify_parameters();
    bool synthesize_adapter();
    bool fail(diagnostic d);

    const function_decl& fn_;
    const attribute& marker_;
    const generation_options& opts_;
    adapter_namer& namer_;
    marker_kind kind_;
    build_stage stage_ = build_stage::unparsed;
    endpoint_spec spec_;
    std::optional<diagnostic> failure_;
};

diagnosed<route_builder_spec> build_route_builder(const function_decl& fn,
                                                  const attribute& marker,
                                                  const generation_options& opts);

} // namespace tsuba

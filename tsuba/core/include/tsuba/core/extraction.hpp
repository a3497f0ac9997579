#pragma once

#include "declaration.hpp"
#include "diagnostic.hpp"
#include "parameter_source.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace tsuba {

// Name of the request parameter of every generated adapter.
inline constexpr std::string_view request_binding = "req";

// Label that forwards an argument positionally.
inline constexpr std::string_view discard_label = "_";

struct parameter_plan {
    parameter_source source;
    bool is_optional = false;
    std::optional<std::string> default_value;
    std::string declared_type;
    std::string value_type; // declared type without cv/ref and without std::optional<>
    std::string binding_name;
    std::optional<std::string> call_label;
    bool forward_as_rvalue = false;
};

struct type_shape {
    std::string value_type;
    bool is_optional = false;
};

// "const std::optional<book>&" -> {"book", true}
type_shape analyze_type(std::string_view declared_type);

// Hands out adapter-local variable names; "req" is always taken.
class binding_names {
public:
    binding_names() { used_.insert(std::string(request_binding)); }

    // Returns `preferred`, or `preferred` with trailing underscores when it is taken.
    std::string claim(std::string preferred);

private:
    std::unordered_set<std::string> used_;
};

// `index` is the parameter's position, used to name unnamed parameters.
diagnosed<parameter_plan> plan_parameter(const parameter_decl& param,
                                         size_t index,
                                         binding_names& names,
                                         std::vector<diagnostic>& warnings);

// Right-hand side that produces the parameter's value from `req`.
std::string extraction_expression(const parameter_plan& plan);

// One statement binding plan.binding_name, e.g. `auto name = req.parameters()...;`
std::string extraction_statement(const parameter_plan& plan);

// `/*label=*/binding`, or the bare binding for the discard label.
std::string forwarding_argument(const parameter_plan& plan);

} // namespace tsuba

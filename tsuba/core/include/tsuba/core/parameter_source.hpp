#pragma once

#include "declaration.hpp"
#include "diagnostic.hpp"

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tsuba {

// Keys and key paths are C++ expressions as they will appear in generated code.
struct path_param_source {
    std::string key;
};
struct body_source {};
struct query_param_source {
    std::string key;
};
struct query_content_source {};
struct auth_source {};
struct request_field_source {
    std::string path;
};
struct raw_request_source {
    std::string path;
};

using parameter_source = std::variant<path_param_source,
                                      body_source,
                                      query_param_source,
                                      query_content_source,
                                      auth_source,
                                      request_field_source,
                                      raw_request_source>;

inline constexpr std::string_view identity_key_path = "std::identity{}";

std::string_view source_name(const parameter_source& source) noexcept;

// Projections off the request never fail; every other source can.
[[nodiscard]] bool is_fallible(const parameter_source& source) noexcept;

struct classified_parameter {
    parameter_source source;
    std::vector<diagnostic> warnings;
};

// Exactly one source per parameter. No source marker means a path parameter keyed by the
// parameter's own name; two or more source markers of any kinds are rejected.
diagnosed<classified_parameter> classify_parameter(const parameter_decl& param);

} // namespace tsuba

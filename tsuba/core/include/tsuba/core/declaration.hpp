#pragma once

#include "diagnostic.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tsuba {

inline constexpr std::string_view marker_namespace = "tsuba";

// One argument of an attribute argument clause, as written in source.
// `pass: "secret"` has label "pass"; `"books"` has no label.
struct argument {
    std::optional<std::string> label;
    std::string expression;
    source_range where{};
};

struct attribute {
    std::string scope; // "tsuba" for markers, empty for unscoped attributes
    std::string name;
    bool has_argument_clause = false;
    std::vector<argument> arguments;
    source_range where{};
    source_range name_where{}; // the name token alone

    [[nodiscard]] bool is_marker() const noexcept { return scope == marker_namespace; }
    [[nodiscard]] std::string spelling() const {
        return scope.empty() ? name : scope + "::" + name;
    }
};

struct parameter_decl {
    std::vector<attribute> attributes;
    std::string type; // as written, whitespace-normalized
    std::optional<std::string> name;
    std::optional<std::string> default_value;
    source_range where{};
};

struct function_decl {
    std::vector<attribute> attributes;
    std::string name;
    std::string return_type; // trailing return type when one is written
    std::vector<parameter_decl> parameters;
    bool is_static = false;
    bool is_virtual = false;
    bool is_template = false;
    bool is_noexcept = false;
    source_range where{};
    source_range name_range{};
    source_range return_type_range{};
    source_range parameters_range{};
};

enum class member_kind : uint8_t { data, type, free_function, other };

// Declarations that are not member functions; kept only to check marker attachment.
struct other_decl {
    member_kind kind{member_kind::other};
    std::string name;
    std::vector<attribute> attributes;
    source_range where{};
};

struct class_decl {
    std::string name;
    std::vector<std::string> namespaces;      // enclosing namespaces, outermost first
    std::vector<std::string> enclosing_classes; // outermost first
    std::vector<attribute> attributes;
    std::vector<function_decl> functions; // declaration order
    std::vector<other_decl> other_members;
    bool is_template = false;
    bool declares_boot = false;
    source_range where{};
    source_range body_start{}; // empty range just past the opening brace

    [[nodiscard]] std::string qualified_name() const;
    [[nodiscard]] std::string class_path() const; // "outer::inner", without namespaces
};

struct translation_unit {
    std::string path;
    std::vector<class_decl> classes; // nested classes appear after their parents
    std::vector<other_decl> free_declarations;
};

} // namespace tsuba

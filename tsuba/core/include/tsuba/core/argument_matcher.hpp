#pragma once

#include "declaration.hpp"
#include "diagnostic.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace tsuba {

// One expected argument slot of a marker.
struct parsing_rule {
    std::optional<std::string> label;
    bool is_variadic = false;
    bool is_skippable = false;

    static parsing_rule labeled(std::string l, bool skippable = false) {
        return {std::move(l), false, skippable};
    }
    static parsing_rule labeled_variadic(std::string l, bool skippable = false) {
        return {std::move(l), true, skippable};
    }
    static parsing_rule positional(bool skippable = false) {
        return {std::nullopt, false, skippable};
    }
    static parsing_rule variadic(bool skippable = false) { return {std::nullopt, true, skippable}; }
};

using argument_bucket = std::vector<argument>;

enum class match_failure_kind : uint8_t { not_match, extra_arguments };

struct match_failure {
    match_failure_kind kind{match_failure_kind::not_match};
    size_t rule_index = 0;     // not_match only
    size_t argument_index = 0; // first argument that could not be consumed
    parsing_rule rule{};
};

// Single left-to-right pass, no backtracking. A variadic rule keeps consuming unlabeled
// arguments after its first one, so a variadic rule may only be followed by a labeled rule.
// Returns exactly one bucket per rule.
std::expected<std::vector<argument_bucket>, match_failure>
match_arguments(std::span<const parsing_rule> rules, std::span<const argument> args);

std::string describe(const match_failure& failure);

// Points at the offending argument when there is one, otherwise at the marker.
diagnostic to_diagnostic(const match_failure& failure, const attribute& marker);

} // namespace tsuba

#include "tsuba/core/argument_matcher.hpp"

#include <sstream>

namespace tsuba {

std::expected<std::vector<argument_bucket>, match_failure>
match_arguments(std::span<const parsing_rule> rules, std::span<const argument> args) {
    std::vector<argument_bucket> buckets(rules.size());
    size_t cursor = 0;

    for (size_t rule_index = 0; rule_index < rules.size(); ++rule_index) {
        const auto& rule = rules[rule_index];
        auto fail = [&] {
            return std::unexpected(
                match_failure{match_failure_kind::not_match, rule_index, cursor, rule});
        };

        if (cursor >= args.size() || args[cursor].label != rule.label) {
            if (rule.is_skippable) {
                continue;
            }
            return fail();
        }

        buckets[rule_index].push_back(args[cursor]);
        ++cursor;
        if (!rule.is_variadic) {
            continue;
        }
        while (cursor < args.size() && !args[cursor].label) {
            buckets[rule_index].push_back(args[cursor]);
            ++cursor;
        }
    }

    if (cursor != args.size()) {
        return std::unexpected(
            match_failure{match_failure_kind::extra_arguments, rules.size(), cursor, {}});
    }
    return buckets;
}

std::string describe(const match_failure& failure) {
    std::ostringstream os;
    switch (failure.kind) {
    case match_failure_kind::not_match:
        os << "expected ";
        if (failure.rule.label) {
            os << "argument '" << *failure.rule.label << ":'";
        } else {
            os << "unlabeled argument";
        }
        if (failure.rule.is_variadic) {
            os << " (variadic)";
        }
        os << " for rule " << failure.rule_index << " at argument index "
           << failure.argument_index;
        break;
    case match_failure_kind::extra_arguments:
        os << "unexpected extra arguments starting at index " << failure.argument_index;
        break;
    }
    return os.str();
}

diagnostic to_diagnostic(const match_failure& failure, const attribute& marker) {
    auto where = failure.argument_index < marker.arguments.size()
                     ? marker.arguments[failure.argument_index].where
                     : marker.where;
    auto id = failure.kind == match_failure_kind::not_match ? diagnostic_id::argument_mismatch
                                                            : diagnostic_id::extra_arguments;
    return make_diagnostic(id, where, describe(failure) + " of '" + marker.spelling() + "'");
}

} // namespace tsuba

#pragma once

#include "diagnostic.hpp"
#include "result.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace tsuba {

enum class token_kind : uint8_t { identifier, number, string_literal, char_literal, punct, end };

// Tokens view into the source buffer; the buffer must outlive them.
struct token {
    token_kind kind{token_kind::end};
    std::string_view text{};
    source_position begin{};
    source_position end{};

    [[nodiscard]] bool is(token_kind k, std::string_view t) const noexcept {
        return kind == k && text == t;
    }
    [[nodiscard]] bool is_punct(std::string_view t) const noexcept {
        return is(token_kind::punct, t);
    }
    [[nodiscard]] bool is_identifier(std::string_view t) const noexcept {
        return is(token_kind::identifier, t);
    }
};

struct lex_failure {
    error_code code{error_code::ok};
    source_position where{};
};

// Comments and preprocessor lines are dropped. The last token is always token_kind::end.
// Multi-character punctuators are limited to "::", "->", "..." and "&&"; '>' is never
// merged so template argument lists stay balanced.
std::expected<std::vector<token>, lex_failure> tokenize(std::string_view source);

} // namespace tsuba

#include "tsuba/core/lexer.hpp"

#include <cctype>

namespace tsuba {

namespace {

bool is_ident_start(char c) noexcept {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_string_prefix(std::string_view id) noexcept {
    return id == "u8" || id == "u" || id == "U" || id == "L";
}

bool is_raw_string_prefix(std::string_view id) noexcept {
    return id == "R" || id == "u8R" || id == "uR" || id == "UR" || id == "LR";
}

class cursor {
public:
    explicit cursor(std::string_view src) noexcept : src_(src) {}

    [[nodiscard]] bool eof() const noexcept { return pos_.offset >= src_.size(); }

    [[nodiscard]] char peek(size_t ahead = 0) const noexcept {
        size_t idx = pos_.offset + ahead;
        return idx < src_.size() ? src_[idx] : '\0';
    }

    void advance(size_t n = 1) noexcept {
        for (size_t i = 0; i < n && !eof(); ++i) {
            if (src_[pos_.offset] == '\n') {
                ++pos_.line;
                pos_.column = 1;
                at_line_start_ = true;
            } else {
                ++pos_.column;
                if (!std::isspace(static_cast<unsigned char>(src_[pos_.offset]))) {
                    at_line_start_ = false;
                }
            }
            ++pos_.offset;
        }
    }

    [[nodiscard]] source_position position() const noexcept { return pos_; }
    [[nodiscard]] bool at_line_start() const noexcept { return at_line_start_; }

    [[nodiscard]] std::string_view slice(const source_position& from) const noexcept {
        return src_.substr(from.offset, pos_.offset - from.offset);
    }

    [[nodiscard]] std::string_view rest() const noexcept { return src_.substr(pos_.offset); }

private:
    std::string_view src_;
    source_position pos_{};
    bool at_line_start_ = true;
};

void skip_preprocessor_line(cursor& cur) noexcept {
    while (!cur.eof()) {
        char c = cur.peek();
        if (c == '\\' && cur.peek(1) == '\n') {
            cur.advance(2);
            continue;
        }
        if (c == '\n') {
            cur.advance();
            return;
        }
        cur.advance();
    }
}

// Consumes a quoted literal starting at the opening quote.
bool consume_quoted(cursor& cur, char quote) noexcept {
    cur.advance();
    while (!cur.eof()) {
        char c = cur.peek();
        if (c == '\\') {
            cur.advance(2);
            continue;
        }
        if (c == '\n') {
            return false;
        }
        cur.advance();
        if (c == quote) {
            return true;
        }
    }
    return false;
}

// Consumes R"delim( ... )delim" starting at the opening quote.
bool consume_raw_string(cursor& cur) noexcept {
    cur.advance();
    auto rest = cur.rest();
    auto paren = rest.find('(');
    if (paren == std::string_view::npos || paren > 16) {
        return false;
    }
    std::string_view delim = rest.substr(0, paren);
    cur.advance(paren + 1);
    while (!cur.eof()) {
        if (cur.peek() == ')') {
            auto tail = cur.rest().substr(1);
            if (tail.starts_with(delim) && tail.size() > delim.size() &&
                tail[delim.size()] == '"') {
                cur.advance(1 + delim.size() + 1);
                return true;
            }
        }
        cur.advance();
    }
    return false;
}

void consume_number(cursor& cur) noexcept {
    while (!cur.eof()) {
        char c = cur.peek();
        if (is_ident_char(c) || c == '.' || c == '\'') {
            cur.advance();
            if ((c == 'e' || c == 'E' || c == 'p' || c == 'P') &&
                (cur.peek() == '+' || cur.peek() == '-')) {
                cur.advance();
            }
            continue;
        }
        break;
    }
}

} // namespace

std::expected<std::vector<token>, lex_failure> tokenize(std::string_view source) {
    std::vector<token> tokens;
    tokens.reserve(source.size() / 4 + 1);
    cursor cur(source);

    auto push = [&](token_kind kind, const source_position& begin) {
        token t;
        t.kind = kind;
        t.text = cur.slice(begin);
        t.begin = begin;
        t.end = cur.position();
        tokens.push_back(t);
    };

    while (!cur.eof()) {
        char c = cur.peek();

        if (std::isspace(static_cast<unsigned char>(c))) {
            cur.advance();
            continue;
        }

        if (c == '#' && cur.at_line_start()) {
            skip_preprocessor_line(cur);
            continue;
        }

        if (c == '/' && cur.peek(1) == '/') {
            while (!cur.eof() && cur.peek() != '\n') {
                cur.advance();
            }
            continue;
        }

        if (c == '/' && cur.peek(1) == '*') {
            auto start = cur.position();
            cur.advance(2);
            bool closed = false;
            while (!cur.eof()) {
                if (cur.peek() == '*' && cur.peek(1) == '/') {
                    cur.advance(2);
                    closed = true;
                    break;
                }
                cur.advance();
            }
            if (!closed) {
                return std::unexpected(lex_failure{error_code::unterminated_comment, start});
            }
            continue;
        }

        auto begin = cur.position();

        if (is_ident_start(c)) {
            while (!cur.eof() && is_ident_char(cur.peek())) {
                cur.advance();
            }
            auto id = cur.slice(begin);
            if (cur.peek() == '"' && is_raw_string_prefix(id)) {
                if (!consume_raw_string(cur)) {
                    return std::unexpected(lex_failure{error_code::unterminated_literal, begin});
                }
                push(token_kind::string_literal, begin);
                continue;
            }
            if ((cur.peek() == '"' || cur.peek() == '\'') && is_string_prefix(id)) {
                char quote = cur.peek();
                if (!consume_quoted(cur, quote)) {
                    return std::unexpected(lex_failure{error_code::unterminated_literal, begin});
                }
                push(quote == '"' ? token_kind::string_literal : token_kind::char_literal, begin);
                continue;
            }
            push(token_kind::identifier, begin);
            continue;
        }

        if (std::isdigit(static_cast<unsigned char>(c)) ||
            (c == '.' && std::isdigit(static_cast<unsigned char>(cur.peek(1))))) {
            consume_number(cur);
            push(token_kind::number, begin);
            continue;
        }

        if (c == '"' || c == '\'') {
            if (!consume_quoted(cur, c)) {
                return std::unexpected(lex_failure{error_code::unterminated_literal, begin});
            }
            push(c == '"' ? token_kind::string_literal : token_kind::char_literal, begin);
            continue;
        }

        char next = cur.peek(1);
        if ((c == ':' && next == ':') || (c == '-' && next == '>') || (c == '&' && next == '&')) {
            cur.advance(2);
        } else if (c == '.' && next == '.' && cur.peek(2) == '.') {
            cur.advance(3);
        } else {
            cur.advance();
        }
        push(token_kind::punct, begin);
    }

    token eof_token;
    eof_token.kind = token_kind::end;
    eof_token.begin = cur.position();
    eof_token.end = cur.position();
    tokens.push_back(eof_token);
    return tokens;
}

} // namespace tsuba

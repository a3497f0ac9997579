#pragma once

#include <expected>
#include <string>
#include <system_error>

namespace tsuba {

template <typename T> using result = std::expected<T, std::error_code>;

enum class error_code : int {
    ok = 0,
    file_not_found = 1,
    file_read_failed = 2,
    output_write_failed = 3,
    unterminated_comment = 4,
    unterminated_literal = 5,
    unbalanced_brackets = 6,
};

class error_category : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "tsuba"; }

    [[nodiscard]] std::string message(int ev) const override {
        using ec = error_code;
        switch (static_cast<ec>(ev)) {
        case ec::ok:
            return "success";
        case ec::file_not_found:
            return "input file not found";
        case ec::file_read_failed:
            return "failed to read input file";
        case ec::output_write_failed:
            return "failed to write output file";
        case ec::unterminated_comment:
            return "unterminated block comment";
        case ec::unterminated_literal:
            return "unterminated string or character literal";
        case ec::unbalanced_brackets:
            return "unbalanced brackets";
        default:
            return "unknown error";
        }
    }
};

inline const error_category& get_error_category() {
    static error_category const instance;
    return instance;
}

inline std::error_code make_error_code(error_code e) {
    return {static_cast<int>(e), get_error_category()};
}

} // namespace tsuba

namespace std {
template <> struct is_error_code_enum<tsuba::error_code> : true_type {};
} // namespace std

#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tsuba {

struct source_position {
    uint32_t line = 1;
    uint32_t column = 1;
    uint32_t offset = 0;
};

struct source_range {
    source_position begin{};
    source_position end{};
};

enum class severity : uint8_t { note, warning, error };

enum class diagnostic_id : uint8_t {
    parse_error,
    argument_mismatch,
    extra_arguments,
    multiple_source_markers,
    unnamed_parameter_key,
    custom_endpoint_signature,
    route_builder_signature,
    unexpected_async,
    multiple_route_markers,
    attach_target,
    controller_template,
    missing_boot_declaration,
    deprecated_marker,
    unknown_marker,
};

// Suggested source rewrite shown next to a diagnostic.
struct fix_it {
    std::string message;
    source_range range;
    std::string replacement;
};

struct diagnostic {
    diagnostic_id id = diagnostic_id::parse_error;
    severity level = severity::error;
    source_range where{};
    std::string message;
    std::vector<fix_it> fixits;

    [[nodiscard]] bool is_error() const noexcept { return level == severity::error; }
};

// Generation steps that can fail for one declaration return this instead of throwing.
template <typename T> using diagnosed = std::expected<T, diagnostic>;

std::string_view diagnostic_domain(diagnostic_id id) noexcept;
std::string_view diagnostic_name(diagnostic_id id) noexcept;
std::string_view severity_to_string(severity level) noexcept;

diagnostic make_diagnostic(diagnostic_id id, source_range where, std::string message);

// file:line:col: error: message [Domain.Id], then one note line per fix-it.
std::string format_diagnostic(const diagnostic& d, std::string_view file);

class diagnostic_sink {
public:
    void report(diagnostic d) { diagnostics_.push_back(std::move(d)); }

    void report_all(std::vector<diagnostic> ds) {
        for (auto& d : ds) {
            diagnostics_.push_back(std::move(d));
        }
    }

    [[nodiscard]] const std::vector<diagnostic>& all() const noexcept { return diagnostics_; }
    [[nodiscard]] size_t error_count() const noexcept;
    [[nodiscard]] size_t warning_count() const noexcept;
    [[nodiscard]] bool has_errors() const noexcept { return error_count() > 0; }

private:
    std::vector<diagnostic> diagnostics_;
};

} // namespace tsuba

#include "tsuba/core/diagnostic.hpp"

#include <algorithm>
#include <sstream>

namespace tsuba {

std::string_view diagnostic_domain(diagnostic_id id) noexcept {
    switch (id) {
    case diagnostic_id::parse_error:
        return "HeaderParseError";
    case diagnostic_id::argument_mismatch:
    case diagnostic_id::extra_arguments:
        return "ParameterListParsingError";
    case diagnostic_id::multiple_source_markers:
    case diagnostic_id::unnamed_parameter_key:
    case diagnostic_id::multiple_route_markers:
    case diagnostic_id::attach_target:
    case diagnostic_id::deprecated_marker:
    case diagnostic_id::unknown_marker:
        return "EndPointMacroError";
    case diagnostic_id::custom_endpoint_signature:
        return "CustomEndPointMacroError";
    case diagnostic_id::route_builder_signature:
    case diagnostic_id::unexpected_async:
        return "CustomRouteBuilderMacroError";
    case diagnostic_id::controller_template:
    case diagnostic_id::missing_boot_declaration:
        return "ControllerError";
    }
    return "UnknownError";
}

std::string_view diagnostic_name(diagnostic_id id) noexcept {
    switch (id) {
    case diagnostic_id::parse_error:
        return "ParseError";
    case diagnostic_id::argument_mismatch:
        return "NotMatch";
    case diagnostic_id::extra_arguments:
        return "ExtraArguments";
    case diagnostic_id::multiple_source_markers:
        return "MultipleRequestParameterTypeDeclaration";
    case diagnostic_id::unnamed_parameter_key:
        return "UnnamedParameterKey";
    case diagnostic_id::custom_endpoint_signature:
    case diagnostic_id::route_builder_signature:
        return "ParameterError";
    case diagnostic_id::unexpected_async:
        return "UnexpectedAsync";
    case diagnostic_id::multiple_route_markers:
        return "MultipleRouteMarkers";
    case diagnostic_id::attach_target:
        return "AttachTargetError";
    case diagnostic_id::controller_template:
        return "ControllerTemplate";
    case diagnostic_id::missing_boot_declaration:
        return "MissingBootDeclaration";
    case diagnostic_id::deprecated_marker:
        return "DeprecatedMarker";
    case diagnostic_id::unknown_marker:
        return "UnknownMarker";
    }
    return "Unknown";
}

std::string_view severity_to_string(severity level) noexcept {
    switch (level) {
    case severity::note:
        return "note";
    case severity::warning:
        return "warning";
    case severity::error:
        return "error";
    }
    return "error";
}

diagnostic make_diagnostic(diagnostic_id id, source_range where, std::string message) {
    diagnostic d;
    d.id = id;
    d.where = where;
    d.message = std::move(message);
    d.level = (id == diagnostic_id::deprecated_marker || id == diagnostic_id::unknown_marker ||
               id == diagnostic_id::missing_boot_declaration)
                  ? severity::warning
                  : severity::error;
    return d;
}

std::string format_diagnostic(const diagnostic& d, std::string_view file) {
    std::ostringstream os;
    os << file << ":" << d.where.begin.line << ":" << d.where.begin.column << ": "
       << severity_to_string(d.level) << ": " << d.message << " [" << diagnostic_domain(d.id)
       << "." << diagnostic_name(d.id) << "]";
    for (const auto& fix : d.fixits) {
        os << "\n"
           << file << ":" << fix.range.begin.line << ":" << fix.range.begin.column
           << ": note: fix-it: " << fix.message;
        if (fix.replacement.empty()) {
            continue;
        }
        if (fix.range.begin.offset == fix.range.end.offset) {
            os << " (insert '" << fix.replacement << "')";
        } else {
            os << " (replace with '" << fix.replacement << "')";
        }
    }
    return os.str();
}

size_t diagnostic_sink::error_count() const noexcept {
    return static_cast<size_t>(std::count_if(diagnostics_.begin(),
                                             diagnostics_.end(),
                                             [](const diagnostic& d) { return d.is_error(); }));
}

size_t diagnostic_sink::warning_count() const noexcept {
    return static_cast<size_t>(
        std::count_if(diagnostics_.begin(), diagnostics_.end(), [](const diagnostic& d) {
            return d.level == severity::warning;
        }));
}

} // namespace tsuba

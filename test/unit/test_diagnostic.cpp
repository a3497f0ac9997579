#include "tsuba/core/diagnostic.hpp"

#include <gtest/gtest.h>

using namespace tsuba;

namespace {

source_range at(uint32_t line, uint32_t column) {
    source_range r;
    r.begin.line = line;
    r.begin.column = column;
    r.end = r.begin;
    return r;
}

source_range spelled(uint32_t line, uint32_t column, uint32_t length) {
    source_range r = at(line, column);
    r.end.column = column + length;
    r.end.offset = length;
    return r;
}

} // namespace

TEST(Diagnostic, DomainsAndNames) {
    EXPECT_EQ(diagnostic_domain(diagnostic_id::extra_arguments), "ParameterListParsingError");
    EXPECT_EQ(diagnostic_name(diagnostic_id::extra_arguments), "ExtraArguments");
    EXPECT_EQ(diagnostic_domain(diagnostic_id::multiple_source_markers), "EndPointMacroError");
    EXPECT_EQ(diagnostic_name(diagnostic_id::multiple_source_markers),
              "MultipleRequestParameterTypeDeclaration");
    EXPECT_EQ(diagnostic_domain(diagnostic_id::custom_endpoint_signature),
              "CustomEndPointMacroError");
    EXPECT_EQ(diagnostic_name(diagnostic_id::route_builder_signature), "ParameterError");
    EXPECT_EQ(diagnostic_domain(diagnostic_id::unexpected_async),
              "CustomRouteBuilderMacroError");
    EXPECT_EQ(diagnostic_domain(diagnostic_id::parse_error), "HeaderParseError");
}

TEST(Diagnostic, SeverityFollowsId) {
    EXPECT_EQ(make_diagnostic(diagnostic_id::attach_target, {}, "x").level, severity::error);
    EXPECT_EQ(make_diagnostic(diagnostic_id::deprecated_marker, {}, "x").level,
              severity::warning);
    EXPECT_EQ(make_diagnostic(diagnostic_id::unknown_marker, {}, "x").level, severity::warning);
    EXPECT_EQ(make_diagnostic(diagnostic_id::missing_boot_declaration, {}, "x").level,
              severity::warning);
    EXPECT_TRUE(make_diagnostic(diagnostic_id::parse_error, {}, "x").is_error());
    EXPECT_EQ(severity_to_string(severity::note), "note");
}

TEST(Diagnostic, Format) {
    auto d = make_diagnostic(diagnostic_id::unexpected_async, at(4, 12), "bad builder");
    EXPECT_EQ(format_diagnostic(d, "api.hpp"),
              "api.hpp:4:12: error: bad builder [CustomRouteBuilderMacroError.UnexpectedAsync]");
}

TEST(Diagnostic, FormatWithFixIts) {
    auto d = make_diagnostic(diagnostic_id::deprecated_marker, at(2, 5), "old marker");
    d.fixits.push_back({"use tsuba::req", spelled(2, 7, 12), "req"});
    d.fixits.push_back({"read the path instead", at(3, 1), ""});
    d.fixits.push_back({"add the boot macro", at(4, 9), "TSUBA_CONTROLLER();"});
    EXPECT_EQ(format_diagnostic(d, "a.hpp"),
              "a.hpp:2:5: warning: old marker [EndPointMacroError.DeprecatedMarker]\n"
              "a.hpp:2:7: note: fix-it: use tsuba::req (replace with 'req')\n"
              "a.hpp:3:1: note: fix-it: read the path instead\n"
              "a.hpp:4:9: note: fix-it: add the boot macro (insert 'TSUBA_CONTROLLER();')");
}

TEST(Diagnostic, SinkCounts) {
    diagnostic_sink sink;
    EXPECT_FALSE(sink.has_errors());
    sink.report(make_diagnostic(diagnostic_id::unknown_marker, {}, "w"));
    sink.report_all({make_diagnostic(diagnostic_id::attach_target, {}, "e1"),
                     make_diagnostic(diagnostic_id::parse_error, {}, "e2")});
    EXPECT_EQ(sink.all().size(), 3u);
    EXPECT_EQ(sink.error_count(), 2u);
    EXPECT_EQ(sink.warning_count(), 1u);
    EXPECT_TRUE(sink.has_errors());
    EXPECT_EQ(sink.all()[1].message, "e1");
}
